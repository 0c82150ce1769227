#pragma once

#include "message.h"

#include <functional>
#include <map>
#include <set>
#include <string>

namespace swarm {

// Moves an encoded envelope to a node. Implementations throw
// swarm_error(ERROR_TYPE_ROUTING) when the node cannot be reached.
class transport {
public:
    virtual ~transport() = default;

    virtual void deliver(const std::string & node_id, const swarm_message & msg) = 0;
};

// In-process network: delivery calls the target's receiver synchronously.
class local_network : public transport {
public:
    using receiver_fn = std::function<void(const swarm_message &)>;

private:
    std::map<std::string, receiver_fn> endpoints;
    std::set<std::string> down;
    uint64_t delivered = 0;

public:
    local_network() = default;

    void attach(const std::string & node_id, receiver_fn receiver);
    bool detach(const std::string & node_id);

    // simulate a dead link without detaching
    void set_link_down(const std::string & node_id, bool is_down);

    void deliver(const std::string & node_id, const swarm_message & msg) override;

    uint64_t delivered_count() const { return delivered; }
};

} // namespace swarm
