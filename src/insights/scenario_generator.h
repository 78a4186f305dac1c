#pragma once
#ifndef QUEUEFORGE_SCENARIO_GENERATOR_H
#define QUEUEFORGE_SCENARIO_GENERATOR_H

#include <vector>
#include "model/result.h"
#include "scheduling/schedule_builder.h"

namespace queueforge {

// Alternative schedules, each a full re-run of the scheduler under its own
// goal weights. "Balanced Approach" re-runs the caller's goals unchanged and
// so reproduces the baseline.
//
// The scorer ignores efficiency_weight, so the efficiency values in the
// scenario goal vectors are descriptive only. The minimum-makespan scenario
// gets its speed from EarliestCompletion machine selection instead.
class ScenarioGenerator {
public:
    explicit ScenarioGenerator(BuildOptions base_options);

    std::vector<Scenario> generate(const InputBundle& bundle, TimePoint now) const;

    static OptimizationGoals minimum_makespan_goals(const OptimizationGoals& base);
    static OptimizationGoals maximum_profit_goals(const OptimizationGoals& base);

private:
    BuildOptions base_options_;

    Scenario run(const InputBundle& bundle, TimePoint now, const OptimizationGoals& goals,
                 const BuildOptions& options) const;
};

}  // namespace queueforge

#endif  // QUEUEFORGE_SCENARIO_GENERATOR_H
