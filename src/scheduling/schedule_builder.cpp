#include "scheduling/schedule_builder.h"
#include "scheduling/machine_matcher.h"
#include "scheduling/priority_scorer.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace queueforge {

ScheduleBuilder::ScheduleBuilder(BuildOptions options)
    : options_(options) {}

double ScheduleBuilder::buffer_for(const Job& job) const {
    return std::max(options_.min_buffer_minutes, job.estimated_duration * options_.buffer_ratio);
}

std::vector<size_t> ScheduleBuilder::sequence(const std::vector<Job>& jobs,
                                              const OptimizationGoals& goals,
                                              TimePoint now) const {
    std::vector<double> scores;
    scores.reserve(jobs.size());
    for (const auto& job : jobs) {
        scores.push_back(PriorityScorer::score(job, goals, now));
    }

    bool has_dependencies = std::any_of(jobs.begin(), jobs.end(),
                                        [](const Job& j) { return !j.dependencies.empty(); });
    if (options_.enforce_dependencies && has_dependencies) {
        return ready_order(jobs, scores);
    }

    std::vector<size_t> order(jobs.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });
    return order;
}

std::vector<size_t> ScheduleBuilder::ready_order(const std::vector<Job>& jobs,
                                                 const std::vector<double>& scores) const {
    std::unordered_set<std::string> known;
    for (const auto& job : jobs) known.insert(job.id);

    std::unordered_set<std::string> placed;
    std::vector<size_t> remaining(jobs.size());
    std::iota(remaining.begin(), remaining.end(), 0);

    std::vector<size_t> order;
    order.reserve(jobs.size());

    while (!remaining.empty()) {
        auto best = remaining.end();
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            const auto& deps = jobs[*it].dependencies;
            bool ready = std::all_of(deps.begin(), deps.end(), [&](const std::string& dep) {
                return !known.count(dep) || placed.count(dep);
            });
            // Strict comparison keeps the earlier queue position on ties
            if (ready && (best == remaining.end() || scores[*it] > scores[*best])) {
                best = it;
            }
        }
        if (best == remaining.end()) {
            throw std::invalid_argument("Job dependencies contain a cycle");
        }
        placed.insert(jobs[*best].id);
        order.push_back(*best);
        remaining.erase(best);
    }
    return order;
}

Schedule ScheduleBuilder::build(const std::vector<Job>& jobs,
                                const std::vector<Machine>& machines,
                                const OptimizationGoals& goals, TimePoint now) const {
    if (machines.empty()) {
        throw std::invalid_argument("no machines available");
    }

    std::unordered_set<std::string> known;
    for (const auto& job : jobs) known.insert(job.id);

    std::vector<TimePoint> next_free(machines.size(), now);
    TimePoint holding_lane = now;
    std::unordered_map<std::string, TimePoint> finished;

    Schedule schedule;
    schedule.reserve(jobs.size());

    int position = 0;
    for (size_t idx : sequence(jobs, goals, now)) {
        const Job& job = jobs[idx];

        TimePoint earliest = now;
        if (options_.enforce_dependencies) {
            for (const auto& dep : job.dependencies) {
                if (!known.count(dep)) {
                    spdlog::warn("Job {} depends on unknown job {}, ignoring", job.id, dep);
                    continue;
                }
                auto it = finished.find(dep);
                if (it != finished.end()) earliest = std::max(earliest, it->second);
            }
        }

        long chosen = -1;
        TimePoint best_key{};
        for (size_t m : MachineMatcher::eligible_machines(job, machines)) {
            TimePoint start = std::max(next_free[m], earliest);
            TimePoint key = start;
            if (options_.selection == MachineSelection::EarliestCompletion) {
                key += to_clock_duration(job.setup_time * machines[m].setup_time_multiplier +
                                         job.estimated_duration);
            }
            if (chosen < 0 || key < best_key) {
                chosen = static_cast<long>(m);
                best_key = key;
            }
        }

        ScheduledJob entry;
        entry.job = job;
        entry.sequence_number = ++position;
        entry.buffer_time = buffer_for(job);

        if (chosen < 0 && options_.unmatched_policy == UnmatchedPolicy::Fallback) {
            spdlog::warn("No eligible machine for job {}, falling back to {}", job.id,
                         machines.front().id);
            chosen = 0;
        }

        TimePoint* lane = &holding_lane;
        double multiplier = 1.0;
        if (chosen >= 0) {
            const Machine& machine = machines[static_cast<size_t>(chosen)];
            lane = &next_free[static_cast<size_t>(chosen)];
            multiplier = machine.setup_time_multiplier;
            entry.assigned_machine = machine.id;
        } else {
            spdlog::warn("No eligible machine for job {} ({} {}mm), marking unassignable",
                         job.id, job.material_type, job.thickness);
            entry.unassignable = true;
        }

        entry.effective_setup_time = job.setup_time * multiplier;
        entry.scheduled_start = std::max(*lane, earliest);
        entry.scheduled_end = entry.scheduled_start + to_clock_duration(entry.processing_minutes());
        *lane = entry.scheduled_end + to_clock_duration(entry.buffer_time);
        // Successors of an unassignable job do not wait on its holding-lane end
        if (!entry.unassignable) finished[job.id] = entry.scheduled_end;

        spdlog::debug("#{} {} -> {} [{} .. {}]", entry.sequence_number, job.id,
                      entry.unassignable ? "<unassigned>" : entry.assigned_machine,
                      format_iso_time(entry.scheduled_start), format_iso_time(entry.scheduled_end));

        schedule.push_back(std::move(entry));
    }

    return schedule;
}

}  // namespace queueforge
