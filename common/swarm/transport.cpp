#include "transport.h"

namespace swarm {

void local_network::attach(const std::string & node_id, receiver_fn receiver) {
    endpoints[node_id] = std::move(receiver);
}

bool local_network::detach(const std::string & node_id) {
    down.erase(node_id);
    return endpoints.erase(node_id) > 0;
}

void local_network::set_link_down(const std::string & node_id, bool is_down) {
    if (is_down) {
        down.insert(node_id);
    } else {
        down.erase(node_id);
    }
}

void local_network::deliver(const std::string & node_id, const swarm_message & msg) {
    auto it = endpoints.find(node_id);
    if (it == endpoints.end() || down.count(node_id) > 0) {
        throw swarm_error(ERROR_TYPE_ROUTING, "no route to node " + node_id);
    }
    // copy: the receiver may attach or detach endpoints while running
    receiver_fn receiver = it->second;
    delivered++;
    receiver(msg);
}

} // namespace swarm
