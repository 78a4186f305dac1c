#include "engine/optimizer.h"
#include "analysis/cost_model.h"
#include "analysis/performance_analyzer.h"
#include "analysis/resource_analyzer.h"
#include "analysis/risk_assessor.h"
#include "engine/validator.h"
#include "insights/customer_impact.h"
#include "insights/insight_engine.h"
#include "insights/scenario_generator.h"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace queueforge {

BuildOptions build_options_from(const Config& config) {
    BuildOptions options;
    options.unmatched_policy = config.unmatched_policy;
    options.enforce_dependencies = config.enforce_dependencies;
    options.min_buffer_minutes = config.min_buffer_minutes;
    options.buffer_ratio = config.buffer_ratio;
    return options;
}

namespace {

const BuildOptions& checked(const BuildOptions& options) {
    // Negated comparisons so NaN is rejected as well
    if (!(options.min_buffer_minutes >= 0.0 && options.min_buffer_minutes <= kMaxMinBufferMinutes) ||
        !(options.buffer_ratio >= 0.0 && options.buffer_ratio <= kMaxBufferRatio)) {
        throw std::invalid_argument(fmt::format(
            "Buffer settings out of range: min_buffer_minutes={} buffer_ratio={}",
            options.min_buffer_minutes, options.buffer_ratio));
    }
    return options;
}

}  // namespace

JobQueueOptimizer::JobQueueOptimizer(const Config& config)
    : options_(checked(build_options_from(config))) {}

JobQueueOptimizer::JobQueueOptimizer(BuildOptions options)
    : options_(checked(options)) {}

OptimizationResult JobQueueOptimizer::optimize(const InputBundle& bundle, TimePoint now) const {
    if (auto problem = validate_inputs(bundle, options_.enforce_dependencies)) {
        spdlog::error("Rejected input bundle: {}", *problem);
        throw ValidationError(*problem);
    }

    OptimizationResult result;

    ScheduleBuilder builder(options_);
    result.optimized_schedule =
        builder.build(bundle.job_queue, bundle.machines, bundle.optimization_goals, now);
    const Schedule& schedule = result.optimized_schedule;
    for (const auto& entry : schedule) {
        if (entry.unassignable) result.unassignable_jobs.push_back(entry.job.id);
    }

    result.performance_metrics = PerformanceAnalyzer::analyze(schedule, bundle.machines, now);
    result.resource_utilization =
        ResourceAnalyzer::analyze(bundle, schedule, result.performance_metrics);
    result.cost_analysis = CostModel::analyze(schedule);
    result.risk_assessment = RiskAssessor::assess(bundle, schedule);

    InsightContext ctx(bundle, schedule, result.performance_metrics, result.resource_utilization,
                       result.cost_analysis, result.risk_assessment);
    result.optimization_insights = InsightEngine::insights(ctx);
    result.alerts_and_recommendations = InsightEngine::alerts(ctx);
    result.recommendations = InsightEngine::recommendations(ctx);
    result.real_time_adjustments = InsightEngine::real_time_adjustments();

    result.alternative_schedules = ScenarioGenerator(options_).generate(bundle, now);
    result.customer_impact = CustomerImpactAnalyzer::analyze(schedule);

    const auto& perf = result.performance_metrics;
    result.key_metrics = {
        {"Total Makespan", fmt::format("{:.1f} hours", perf.total_makespan)},
        {"On-Time Rate", fmt::format("{:.1f}%", perf.on_time_delivery_rate)},
        {"Avg Utilization", fmt::format("{:.1f}%", perf.average_utilization())},
        {"Schedule Risk", to_string(result.risk_assessment.schedule_risk)},
    };

    spdlog::info("Scheduled {} jobs on {} machines: makespan {:.1f}h, span {:.1f}h, risk {}",
                 schedule.size(), bundle.machines.size(), perf.total_makespan,
                 perf.schedule_span, to_string(result.risk_assessment.schedule_risk));
    if (!result.unassignable_jobs.empty()) {
        spdlog::warn("{} job(s) have no compatible machine", result.unassignable_jobs.size());
    }
    return result;
}

}  // namespace queueforge
