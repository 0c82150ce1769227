// Configuration parsing and validation tests

#include "test-helpers.h"

#include "config.h"

#include <cstdio>
#include <fstream>

using namespace swarm;

template<typename F>
static bool throws_config_error(F fn) {
    try {
        fn();
    } catch (const swarm_error & e) {
        return e.type() == ERROR_TYPE_CONFIG;
    }
    return false;
}

static bool test_defaults_validate() {
    swarm_config c;
    c.validate();

    TEST_ASSERT(c.protocol.heartbeat_interval_ms == 5000, "heartbeat default");
    TEST_ASSERT(c.protocol.quorum_ratio == 0.67, "quorum ratio default");
    TEST_ASSERT(c.protocol.max_messages_per_priority == 10, "drain budget default");
    TEST_ASSERT(c.protocol.compression_threshold == 1024, "compression threshold default");
    TEST_ASSERT(c.distribution.max_concurrent_tasks == 100, "concurrency default");
    TEST_ASSERT(c.distribution.default_max_retries == 3, "retry default");
    return true;
}

static bool test_from_json_overrides() {
    const json j = {
        {"protocol", {
            {"node_id", "edge-7"},
            {"gossip_fanout", 5},
            {"enable_compression", false}
        }},
        {"distribution", {
            {"max_concurrent_tasks", 8},
            {"weights", {{"trust", 0.5}}}
        }}
    };

    const swarm_config c = swarm_config::from_json(j);
    c.validate();

    TEST_ASSERT(c.protocol.node_id == "edge-7", "node id overridden");
    TEST_ASSERT(c.protocol.gossip_fanout == 5, "fanout overridden");
    TEST_ASSERT(!c.protocol.enable_compression, "compression disabled");
    TEST_ASSERT(c.protocol.heartbeat_interval_ms == 5000, "unset keys keep defaults");
    TEST_ASSERT(c.distribution.max_concurrent_tasks == 8, "concurrency overridden");
    TEST_ASSERT(c.distribution.weight_trust == 0.5, "nested weight overridden");
    TEST_ASSERT(c.distribution.weight_capability == 0.3, "other weights keep defaults");

    const swarm_config back = swarm_config::from_json(c.to_json());
    TEST_ASSERT(back.to_json() == c.to_json(), "to_json feeds from_json");
    return true;
}

static bool test_invalid_values_rejected() {
    TEST_ASSERT(throws_config_error([]() {
        swarm_config c;
        c.protocol.node_id = "";
        c.validate();
    }), "empty node id");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config c;
        c.protocol.quorum_ratio = 1.5;
        c.validate();
    }), "quorum ratio above one");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config c;
        c.protocol.compression_level = 12;
        c.validate();
    }), "compression level out of range");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config c;
        c.distribution.weight_capability  = 0.0;
        c.distribution.weight_performance = 0.0;
        c.distribution.weight_load        = 0.0;
        c.distribution.weight_trust       = 0.0;
        c.validate();
    }), "all-zero weights");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config c;
        c.distribution.stuck_factor = 0.5;
        c.validate();
    }), "stuck factor below one");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config::from_json(json::array());
    }), "top level must be an object");

    TEST_ASSERT(throws_config_error([]() {
        swarm_config::from_json(json{{"protocol", {{"gossip_fanout", "many"}}}});
    }), "wrong value type");
    return true;
}

static bool test_load_from_file() {
    TEST_ASSERT(throws_config_error([]() {
        load_swarm_config("/nonexistent/swarm-config.json");
    }), "missing file");

    const std::string path = "test-config-tmp.json";
    {
        std::ofstream out(path);
        out << R"({"protocol": {"node_id": "file-node", "seed": 7}, "distribution": {"stuck_factor": 3.0}})";
    }
    const swarm_config c = load_swarm_config(path);
    TEST_ASSERT(c.protocol.node_id == "file-node", "node id read from file");
    TEST_ASSERT(c.protocol.seed == 7, "seed read from file");
    TEST_ASSERT(c.distribution.stuck_factor == 3.0, "stuck factor read from file");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    TEST_ASSERT(throws_config_error([&path]() { load_swarm_config(path); }), "malformed file");

    {
        std::ofstream out(path);
        out << R"({"protocol": {"max_hops": 0}})";
    }
    TEST_ASSERT(throws_config_error([&path]() { load_swarm_config(path); }), "invalid values in file");

    std::remove(path.c_str());
    return true;
}

int main() {
    quiet_logs();

    std::cout << "=== Config Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_defaults_validate);
    RUN_TEST(test_from_json_overrides);
    RUN_TEST(test_invalid_values_rejected);
    RUN_TEST(test_load_from_file);

    return report_results(total, passed, failed);
}
