#include "insights/scenario_generator.h"
#include "analysis/cost_model.h"
#include "analysis/performance_analyzer.h"
#include <spdlog/spdlog.h>

namespace queueforge {

ScenarioGenerator::ScenarioGenerator(BuildOptions base_options)
    : base_options_(base_options) {}

OptimizationGoals ScenarioGenerator::minimum_makespan_goals(const OptimizationGoals& base) {
    OptimizationGoals goals = base;
    goals.primary_objective = Objective::MinimizeMakespan;
    goals.urgency_weight = 0.4;
    goals.efficiency_weight = 0.4;
    goals.customer_satisfaction_weight = 0.1;
    goals.profitability_weight = 0.1;
    return goals;
}

OptimizationGoals ScenarioGenerator::maximum_profit_goals(const OptimizationGoals& base) {
    OptimizationGoals goals = base;
    goals.primary_objective = Objective::MaximizeProfit;
    goals.profitability_weight = 0.6;
    goals.customer_satisfaction_weight = 0.2;
    goals.urgency_weight = 0.1;
    goals.efficiency_weight = 0.1;
    return goals;
}

Scenario ScenarioGenerator::run(const InputBundle& bundle, TimePoint now,
                                const OptimizationGoals& goals,
                                const BuildOptions& options) const {
    ScheduleBuilder builder(options);
    Schedule schedule = builder.build(bundle.job_queue, bundle.machines, goals, now);
    PerformanceMetrics metrics = PerformanceAnalyzer::analyze(schedule, bundle.machines, now);

    Scenario s;
    s.goals = goals;
    s.makespan = metrics.total_makespan;
    s.schedule_span = metrics.schedule_span;
    s.on_time_rate = metrics.on_time_delivery_rate;
    s.total_cost = CostModel::analyze(schedule).total_cost();
    return s;
}

std::vector<Scenario> ScenarioGenerator::generate(const InputBundle& bundle, TimePoint now) const {
    std::vector<Scenario> scenarios;

    BuildOptions fastest = base_options_;
    fastest.selection = MachineSelection::EarliestCompletion;
    Scenario makespan = run(bundle, now, minimum_makespan_goals(bundle.optimization_goals), fastest);
    makespan.name = "Minimum Makespan";
    makespan.description = "Optimized for fastest completion";
    makespan.tradeoffs = {"Higher machine utilization", "Less flexibility"};
    scenarios.push_back(std::move(makespan));

    Scenario profit =
        run(bundle, now, maximum_profit_goals(bundle.optimization_goals), base_options_);
    profit.name = "Maximum Profit";
    profit.description = "Optimized for profitability";
    profit.tradeoffs = {"Longer completion time", "Higher profit margins"};
    scenarios.push_back(std::move(profit));

    Scenario balanced = run(bundle, now, bundle.optimization_goals, base_options_);
    balanced.name = "Balanced Approach";
    balanced.description = "Balance of time, cost, and quality";
    balanced.tradeoffs = {"Moderate performance across all metrics"};
    scenarios.push_back(std::move(balanced));

    for (const auto& s : scenarios) {
        spdlog::debug("Scenario '{}': span {:.1f}h, on-time {:.1f}%, cost {:.0f}", s.name,
                      s.schedule_span, s.on_time_rate, s.total_cost);
    }
    return scenarios;
}

}  // namespace queueforge
