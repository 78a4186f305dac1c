#pragma once
#ifndef QUEUEFORGE_SCHEDULE_BUILDER_H
#define QUEUEFORGE_SCHEDULE_BUILDER_H

#include <cstddef>
#include <vector>
#include "config/config.h"
#include "model/result.h"
#include "model/types.h"

namespace queueforge {

enum class MachineSelection {
    EarliestAvailable,   // eligible machine that frees up first
    EarliestCompletion,  // eligible machine that would finish the job first
};

struct BuildOptions {
    MachineSelection selection = MachineSelection::EarliestAvailable;
    UnmatchedPolicy unmatched_policy = UnmatchedPolicy::Flag;
    bool enforce_dependencies = true;
    double min_buffer_minutes = 5.0;
    double buffer_ratio = 0.1;
};

// Greedy list scheduler over per-machine timelines.
//
// Jobs are taken in descending priority score (ties keep queue order). With
// dependency enforcement on, a job only becomes a candidate once everything
// it depends on has been placed, and it never starts before those finish.
// Each placed job advances only its own machine's next-free time:
//
//   start = max(machine next free, latest dependency end)
//   end   = start + setup * multiplier + duration
//   next free = end + max(min buffer, duration * buffer ratio)
class ScheduleBuilder {
public:
    explicit ScheduleBuilder(BuildOptions options = {});

    // Throws std::invalid_argument when machines is empty, or when
    // dependencies are enforced and form a cycle.
    Schedule build(const std::vector<Job>& jobs, const std::vector<Machine>& machines,
                   const OptimizationGoals& goals, TimePoint now) const;

    // Queue indices in the order build() places them.
    std::vector<size_t> sequence(const std::vector<Job>& jobs, const OptimizationGoals& goals,
                                 TimePoint now) const;

    double buffer_for(const Job& job) const;

    const BuildOptions& options() const { return options_; }

private:
    BuildOptions options_;

    std::vector<size_t> ready_order(const std::vector<Job>& jobs,
                                    const std::vector<double>& scores) const;
};

}  // namespace queueforge

#endif  // QUEUEFORGE_SCHEDULE_BUILDER_H
