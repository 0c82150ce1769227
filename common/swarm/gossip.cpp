#include "gossip.h"

#include "codec.h"
#include "log.h"

#include <algorithm>

namespace swarm {

gossip_engine::gossip_engine(int fanout, message_router & router, node_registry & registry,
                             event_bus & bus, clock_fn clock, std::mt19937 & rng)
    : fanout(fanout), router(router), registry(registry), bus(bus), clock(std::move(clock)), rng(rng) {}

std::vector<std::string> gossip_engine::pick_peers() {
    std::vector<std::string> peers = registry.reachable_peer_ids();
    std::shuffle(peers.begin(), peers.end(), rng);
    if (peers.size() > (size_t) fanout) {
        peers.resize(fanout);
    }
    return peers;
}

void gossip_engine::propagate(const std::vector<gossip_state> & batch, const std::vector<std::string> & peers) {
    if (batch.empty() || peers.empty()) {
        return;
    }

    json j_states = json::array();
    for (const auto & s : batch) {
        j_states.push_back(s.to_json());
    }
    router.send(MSG_TYPE_GOSSIP, peers, json{{"states", j_states}}, MSG_PRIORITY_BACKGROUND);
}

gossip_state gossip_engine::start_gossip(const std::string & key, const json & data) {
    if (key.empty()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "gossip key must not be empty");
    }

    const int64_t now = clock();

    gossip_state state;
    state.key       = key;
    state.data      = data;
    state.timestamp = now;
    try {
        state.checksum = crc32_hex(data.dump());
    } catch (const json::type_error & e) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "gossip data for " + key + " is not serializable: " + e.what());
    }

    auto it = states.find(key);
    state.version = it != states.end() ? std::max(it->second.version + 1, now) : now;

    states[key] = state;

    LOG_DBG("gossip started: %s v%lld\n", key.c_str(), (long long) state.version);
    propagate({state}, pick_peers());
    bus.publish(EVENT_GOSSIP_STARTED, now, gossip_event{key, state.version});

    return state;
}

size_t gossip_engine::run_round() {
    size_t sent = 0;
    for (const auto & [key, state] : states) {
        const auto peers = pick_peers();
        if (peers.empty()) {
            break;
        }
        propagate({state}, peers);
        sent++;
    }
    return sent;
}

bool gossip_engine::apply(const gossip_state & incoming) {
    if (incoming.key.empty()) {
        return false;
    }
    std::string checksum;
    try {
        checksum = crc32_hex(incoming.data.dump());
    } catch (const json::type_error & e) {
        LOG_WRN("gossip state %s is not serializable, ignoring: %s\n", incoming.key.c_str(), e.what());
        return false;
    }
    if (incoming.checksum != checksum) {
        LOG_WRN("gossip state %s v%lld failed its checksum, ignoring\n",
                incoming.key.c_str(), (long long) incoming.version);
        return false;
    }

    auto it = states.find(incoming.key);
    if (it != states.end() && incoming.version <= it->second.version) {
        return false;
    }

    states[incoming.key] = incoming;
    LOG_DBG("gossip adopted: %s v%lld\n", incoming.key.c_str(), (long long) incoming.version);
    return true;
}

void gossip_engine::on_message(const swarm_message & msg) {
    const json & data = msg.payload.data;
    if (!data.is_object() || !data.contains("states") || !data["states"].is_array()) {
        LOG_WRN("malformed gossip message %s from %s\n", msg.id.c_str(), msg.sender.c_str());
        return;
    }
    for (const auto & j : data["states"]) {
        apply(gossip_state::from_json(j));
    }
}

bool gossip_engine::get(const std::string & key, gossip_state & state) const {
    auto it = states.find(key);
    if (it == states.end()) {
        return false;
    }
    state = it->second;
    return true;
}

json gossip_engine::to_json() const {
    json j = json::array();
    for (const auto & [_, state] : states) {
        j.push_back(state.to_json());
    }
    return j;
}

} // namespace swarm
