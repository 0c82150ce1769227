#include "balancer.h"
#include "coordinator.h"
#include "config.h"
#include "distribution.h"
#include "log.h"
#include "protocols.h"
#include "transport.h"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Simulated swarm on one process: a hub node runs the distribution engine and
// a set of worker nodes host agents that finish their tasks after a delay.
//
// usage: swarm-sim [config.json] [workers] [tasks]

using namespace swarm;

static const int64_t STEP_MS = 100;

// ============================================================================
// Worker node
// ============================================================================

struct sim_worker {
    struct job {
        std::string task_id;
        int64_t due = 0;
    };

    std::string id;
    std::string hub;
    event_bus bus;
    std::unique_ptr<communication_protocols> protocols;
    std::vector<job> jobs;
    int64_t * now;
    int completed = 0;
    int failed = 0;

    sim_worker(const std::string & id, const std::string & hub, protocol_config config,
               local_network & net, int64_t * now) : id(id), hub(hub), now(now) {
        config.node_id = id;
        protocols = std::make_unique<communication_protocols>(config, net, bus, [now]() { return *now; });
        communication_protocols * p = protocols.get();
        net.attach(id, [p](const swarm_message & msg) { p->receive(msg); });

        protocols->register_handler(MSG_TYPE_UNICAST, [this](const swarm_message & msg) { on_message(msg); });
    }

    void on_message(const swarm_message & msg) {
        const json & data = msg.payload.data;
        const std::string kind = data.value("kind", "");

        if (kind == "task_assignment") {
            const json & task = data["task"];
            // tasks run at a tenth of their estimate
            const int64_t estimate = task.value("estimated_duration_ms", (int64_t) 5000);
            jobs.push_back({task.value("id", ""), *now + estimate / 10});
        } else if (kind == "task_cancel") {
            const std::string task_id = data.value("task_id", "");
            for (auto it = jobs.begin(); it != jobs.end(); ++it) {
                if (it->task_id == task_id) {
                    LOG_INF("%s: dropping cancelled task %s\n", id.c_str(), task_id.c_str());
                    jobs.erase(it);
                    break;
                }
            }
        }
    }

    void step() {
        for (auto it = jobs.begin(); it != jobs.end();) {
            if (it->due > *now) {
                ++it;
                continue;
            }
            // roughly one task in five faults on a given worker
            const bool fail = std::hash<std::string>{}(it->task_id + id) % 5 == 0;
            if (fail) {
                protocols->send(MSG_TYPE_CONTROL, {hub},
                                json{{"kind", "task_failed"}, {"task_id", it->task_id}, {"error", "simulated fault"}},
                                MSG_PRIORITY_HIGH);
                failed++;
            } else {
                protocols->send(MSG_TYPE_CONTROL, {hub},
                                json{{"kind", "task_completed"}, {"task_id", it->task_id},
                                     {"result", {{"worker", id}}}, {"quality", 0.9}},
                                MSG_PRIORITY_HIGH);
                completed++;
            }
            it = jobs.erase(it);
        }
        protocols->advance();
    }
};

static task_definition make_task(int i) {
    static const char * types[] = {"render", "encode", "index"};

    task_definition t;
    t.id   = "task-" + std::to_string(i);
    t.name = t.id;
    t.type = types[i % 3];
    t.requirements.capabilities = {t.type};
    t.estimated_duration_ms = 2000 + 1000 * (i % 4);
    t.priority = i % 7 == 0 ? TASK_PRIORITY_HIGH : TASK_PRIORITY_NORMAL;
    return t;
}

int main(int argc, char ** argv) {
    swarm_config config;
    int n_workers = 4;
    int n_tasks   = 24;

    try {
        if (argc > 1) {
            config = load_swarm_config(argv[1]);
        }
        if (argc > 2) {
            n_workers = std::stoi(argv[2]);
        }
        if (argc > 3) {
            n_tasks = std::stoi(argv[3]);
        }
    } catch (const swarm_error & e) {
        LOG_ERR("%s\n", e.what());
        return 1;
    } catch (const std::exception & e) {
        LOG_ERR("usage: %s [config.json] [workers] [tasks]: %s\n", argv[0], e.what());
        return 1;
    }

    if (n_workers < 1 || n_tasks < 0) {
        LOG_ERR("need at least one worker\n");
        return 1;
    }

    int64_t now = 0;
    const clock_fn clock = [&now]() { return now; };

    local_network net;

    protocol_config hub_config = config.protocol;
    hub_config.node_id = "hub";

    event_bus hub_bus;
    communication_protocols hub(hub_config, net, hub_bus, clock);
    net.attach("hub", [&hub](const swarm_message & msg) { hub.receive(msg); });

    task_distribution_engine engine(config.distribution, hub_bus, clock);
    swarm_coordinator coordinator(hub, engine, hub_bus);

    std::vector<std::unique_ptr<sim_worker>> workers;
    for (int i = 0; i < n_workers; i++) {
        workers.push_back(std::make_unique<sim_worker>("worker-" + std::to_string(i), "hub", config.protocol, net, &now));
    }

    try {
        for (auto & w : workers) {
            communication_node node;
            node.id = w->id;
            hub.register_node(node);

            communication_node hub_node;
            hub_node.id = "hub";
            w->protocols->register_node(hub_node);
        }

        static const char * caps[] = {"render", "encode", "index"};
        for (int i = 0; i < n_workers; i++) {
            agent_capability agent;
            agent.agent_id     = "agent-" + std::to_string(i);
            agent.capabilities = {caps[i % 3], caps[(i + 1) % 3]};
            agent.max_load     = 2;
            coordinator.register_agent(agent, workers[i]->id);
        }

        for (int i = 0; i < n_tasks; i++) {
            coordinator.submit_task(make_task(i));
        }
    } catch (const swarm_error & e) {
        LOG_ERR("setup failed: %s\n", e.what());
        return 1;
    }

    LOG_INF("simulating %d workers, %d tasks\n", n_workers, n_tasks);

    // ten simulated minutes at most
    const int64_t limit = 600000;
    for (; now < limit; now += STEP_MS) {
        coordinator.advance();
        for (auto & w : workers) {
            w->step();
        }

        const distribution_metrics m = engine.get_metrics();
        if (m.completed_tasks + m.failed_tasks + m.cancelled_tasks == m.total_tasks) {
            break;
        }
    }

    LOG_INF("simulation finished after %lld ms\n", (long long) now);

    json status = coordinator.get_status();
    json per_worker = json::object();
    for (const auto & w : workers) {
        per_worker[w->id] = {{"completed", w->completed}, {"failed", w->failed}};
    }
    status["workers"] = per_worker;
    status["balance"] = {
        {"load_balance", load_balance_score(engine.list_agents())},
        {"efficiency", resource_efficiency(engine.list_agents())}
    };

    std::cout << status.dump(2) << std::endl;
    return 0;
}
