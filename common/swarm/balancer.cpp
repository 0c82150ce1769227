#include "balancer.h"

#include "log.h"

#include <algorithm>
#include <cmath>

namespace swarm {

json workload_imbalance::to_json() const {
    return json{
        {"overloaded", overloaded},
        {"underloaded", underloaded},
        {"mean_utilization", mean_utilization},
        {"severity", severity}
    };
}

workload_imbalance detect_imbalance(const std::vector<agent_capability> & agents, double threshold) {
    workload_imbalance result;
    if (agents.empty()) {
        return result;
    }

    double total = 0.0;
    for (const auto & a : agents) {
        total += a.utilization();
    }
    result.mean_utilization = total / (double) agents.size();

    for (const auto & a : agents) {
        const double u = a.utilization();
        if (u > result.mean_utilization + threshold) {
            result.overloaded.push_back(a.agent_id);
        } else if (u < result.mean_utilization - threshold) {
            result.underloaded.push_back(a.agent_id);
        }
    }

    if (result.detected()) {
        const size_t smaller = std::min(result.overloaded.size(), result.underloaded.size());
        result.severity = (double) smaller / (double) agents.size();
    }
    return result;
}

double load_balance_score(const std::vector<agent_capability> & agents) {
    if (agents.empty()) {
        return 1.0;
    }
    double mean = 0.0;
    for (const auto & a : agents) {
        mean += a.utilization();
    }
    mean /= (double) agents.size();

    double variance = 0.0;
    for (const auto & a : agents) {
        const double d = a.utilization() - mean;
        variance += d * d;
    }
    variance /= (double) agents.size();
    return std::max(0.0, 1.0 - std::sqrt(variance));
}

double resource_efficiency(const std::vector<agent_capability> & agents) {
    int used = 0;
    int capacity = 0;
    for (const auto & a : agents) {
        used += a.current_load;
        capacity += a.max_load;
    }
    return capacity > 0 ? (double) used / (double) capacity : 0.0;
}

// ============================================================================
// Workload Balancer Implementation
// ============================================================================

workload_balancer::workload_balancer(const distribution_config & config)
    : enabled(config.enable_dynamic_rebalancing),
      threshold(config.imbalance_threshold),
      min_severity(config.rebalance_severity) {
    set_rebalance_callback(nullptr);
}

void workload_balancer::set_rebalance_callback(rebalance_fn fn) {
    if (fn) {
        on_rebalance = std::move(fn);
        return;
    }
    on_rebalance = [](const workload_imbalance & imbalance) {
        LOG_INF("workload imbalance: overloaded=%zu underloaded=%zu severity=%.2f\n",
                imbalance.overloaded.size(), imbalance.underloaded.size(), imbalance.severity);
    };
}

workload_imbalance workload_balancer::check(const std::vector<agent_capability> & agents) {
    workload_imbalance imbalance = detect_imbalance(agents, threshold);
    if (enabled && imbalance.severity > min_severity) {
        triggered++;
        on_rebalance(imbalance);
    }
    return imbalance;
}

} // namespace swarm
