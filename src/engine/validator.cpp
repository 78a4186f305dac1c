#include "engine/validator.h"
#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace queueforge {

namespace {

bool weight_in_range(double w) {
    return w >= 0.0 && w <= 1.0;
}

}  // namespace

bool has_dependency_cycle(const std::vector<Job>& jobs) {
    std::unordered_map<std::string, int> in_degree;
    std::unordered_map<std::string, std::vector<std::string>> successors;
    for (const auto& job : jobs) in_degree[job.id] = 0;

    for (const auto& job : jobs) {
        for (const auto& dep : job.dependencies) {
            if (!in_degree.count(dep)) continue;
            successors[dep].push_back(job.id);
            in_degree[job.id]++;
        }
    }

    // Kahn's algorithm: anything left unvisited sits on a cycle
    std::deque<std::string> ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) ready.push_back(id);
    }
    size_t visited = 0;
    while (!ready.empty()) {
        std::string id = ready.front();
        ready.pop_front();
        ++visited;
        for (const auto& next : successors[id]) {
            if (--in_degree[next] == 0) ready.push_back(next);
        }
    }
    return visited != in_degree.size();
}

std::optional<std::string> validate_inputs(const InputBundle& bundle, bool check_dependencies) {
    if (bundle.job_queue.empty()) return "Job queue cannot be empty";
    if (bundle.machines.empty()) return "At least one machine must be available";
    if (bundle.resource_constraints.available_operators <= 0) {
        return "At least one operator must be available";
    }

    std::unordered_set<std::string> seen;
    for (const auto& job : bundle.job_queue) {
        if (!seen.insert(job.id).second) return "Duplicate job id: " + job.id;
    }

    for (const auto& job : bundle.job_queue) {
        if (job.estimated_duration <= 0) {
            return "Estimated duration must be positive for job " + job.id;
        }
        if (job.setup_time < 0) return "Setup time cannot be negative for job " + job.id;
        // Negated so NaN fails too
        if (!(job.estimated_duration <= kMaxJobMinutes)) {
            return "Estimated duration must be finite and at most 525600 minutes for job " + job.id;
        }
        if (!(job.setup_time <= kMaxJobMinutes)) {
            return "Setup time must be finite and at most 525600 minutes for job " + job.id;
        }
    }

    double worst_multiplier = 0.0;
    for (const auto& machine : bundle.machines) {
        if (!(machine.setup_time_multiplier >= 0.0 &&
              machine.setup_time_multiplier <= kMaxSetupMultiplier)) {
            return "Setup time multiplier must be between 0 and 10 for machine " + machine.id;
        }
        worst_multiplier = std::max(worst_multiplier, machine.setup_time_multiplier);
    }

    // Every job on one lane with the slowest setup is the longest possible timeline
    double worst_total = 0.0;
    for (const auto& job : bundle.job_queue) {
        worst_total += job.estimated_duration + job.setup_time * std::max(1.0, worst_multiplier);
    }
    if (worst_total > kMaxQueueMinutes) {
        return "Total queue work must be at most 5256000 minutes";
    }

    const auto& g = bundle.optimization_goals;
    if (!weight_in_range(g.customer_satisfaction_weight) || !weight_in_range(g.profitability_weight) ||
        !weight_in_range(g.efficiency_weight) || !weight_in_range(g.urgency_weight)) {
        return "Optimization weights must be between 0 and 1";
    }

    if (check_dependencies && has_dependency_cycle(bundle.job_queue)) {
        return "Job dependencies contain a cycle";
    }

    return std::nullopt;
}

}  // namespace queueforge
