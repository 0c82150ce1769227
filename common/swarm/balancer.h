#pragma once

#include "config.h"
#include "task.h"

#include <functional>
#include <string>
#include <vector>

namespace swarm {

struct workload_imbalance {
    std::vector<std::string> overloaded;
    std::vector<std::string> underloaded;
    double mean_utilization = 0.0;
    double severity = 0.0;  // 0 unless both sides are non-empty

    bool detected() const { return !overloaded.empty() && !underloaded.empty(); }

    json to_json() const;
};

// agents further than threshold from the mean utilisation on either side
workload_imbalance detect_imbalance(const std::vector<agent_capability> & agents, double threshold);

// max(0, 1 - stddev(utilisation)); 1.0 for an empty fleet
double load_balance_score(const std::vector<agent_capability> & agents);

// sum(load) / sum(max_load)
double resource_efficiency(const std::vector<agent_capability> & agents);

// ============================================================================
// Workload Balancer
// ============================================================================

class workload_balancer {
public:
    using rebalance_fn = std::function<void(const workload_imbalance &)>;

private:
    bool enabled;
    double threshold;
    double min_severity;
    rebalance_fn on_rebalance;
    uint64_t triggered = 0;

public:
    explicit workload_balancer(const distribution_config & config);

    // Runs the rebalance hook when the severity exceeds the configured
    // minimum. Returns the detected imbalance either way.
    workload_imbalance check(const std::vector<agent_capability> & agents);

    void set_rebalance_callback(rebalance_fn fn);
    void set_enabled(bool e) { enabled = e; }

    uint64_t rebalance_count() const { return triggered; }
};

} // namespace swarm
