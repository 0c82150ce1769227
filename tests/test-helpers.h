#pragma once

// Shared harness for the swarm test executables

#include "log.h"
#include "event-bus.h"
#include "protocols.h"
#include "transport.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

static inline int report_results(int total, int passed, int failed) {
    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed!" << std::endl;
        return 0;
    }
    std::cout << std::endl << "Some tests failed!" << std::endl;
    return 1;
}

// Deterministic time source shared by every component of a test
struct manual_clock {
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1000000);

    swarm::clock_fn fn() const {
        std::shared_ptr<int64_t> n = now;
        return [n]() { return *n; };
    }

    void advance(int64_t ms) { *now += ms; }
    int64_t get() const { return *now; }
};

// Records every event published on a bus
struct event_recorder {
    swarm::event_bus & bus;
    std::vector<swarm::swarm_event> events;
    int subscription;

    explicit event_recorder(swarm::event_bus & bus) : bus(bus) {
        subscription = bus.subscribe_all([this](const swarm::swarm_event & ev) { events.push_back(ev); });
    }

    ~event_recorder() { bus.unsubscribe(subscription); }

    event_recorder(const event_recorder &) = delete;
    event_recorder & operator=(const event_recorder &) = delete;

    size_t count(swarm::event_type type) const {
        size_t n = 0;
        for (const auto & ev : events) {
            if (ev.type == type) n++;
        }
        return n;
    }

    const swarm::swarm_event * last(swarm::event_type type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) {
                return &*it;
            }
        }
        return nullptr;
    }

    template<typename T>
    const T * last_payload(swarm::event_type type) const {
        const swarm::swarm_event * ev = last(type);
        return ev ? std::get_if<T>(&ev->payload) : nullptr;
    }

    void clear() { events.clear(); }
};

// One node of an in-process swarm: its own bus and protocols, attached to a shared network
struct sim_node {
    swarm::event_bus bus;
    std::unique_ptr<swarm::communication_protocols> protocols;

    sim_node(const std::string & id, swarm::local_network & net, const manual_clock & clock,
             swarm::protocol_config config = swarm::protocol_config()) {
        config.node_id = id;
        protocols = std::make_unique<swarm::communication_protocols>(config, net, bus, clock.fn());
        swarm::communication_protocols * p = protocols.get();
        net.attach(id, [p](const swarm::swarm_message & msg) { p->receive(msg); });
    }

    swarm::communication_protocols * operator->() { return protocols.get(); }
};

// registers every node with every other one
static inline void connect_all(const std::vector<sim_node *> & nodes) {
    for (auto * a : nodes) {
        for (auto * b : nodes) {
            if (a == b) continue;
            swarm::communication_node peer;
            peer.id = b->protocols->node_id();
            (*a)->register_node(peer);
        }
    }
}

// drains every router until the swarm is quiet
static inline void pump(const std::vector<sim_node *> & nodes, int rounds = 8) {
    for (int i = 0; i < rounds; i++) {
        size_t moved = 0;
        for (auto * n : nodes) {
            moved += (*n)->process_messages();
        }
        if (moved == 0) {
            break;
        }
    }
}

// keep test output readable
static inline void quiet_logs() {
    swarm_log_set_level(SWARM_LOG_LEVEL_ERROR);
}
