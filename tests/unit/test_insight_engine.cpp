#include <gtest/gtest.h>
#include "analysis/cost_model.h"
#include "analysis/performance_analyzer.h"
#include "analysis/resource_analyzer.h"
#include "analysis/risk_assessor.h"
#include "fixtures.h"
#include "insights/insight_engine.h"
#include "scheduling/schedule_builder.h"
#include <algorithm>
#include <memory>

using namespace queueforge;
using namespace queueforge::fixtures;

namespace {

bool contains(const std::vector<std::string>& list, const std::string& text) {
    return std::find(list.begin(), list.end(), text) != list.end();
}

// Owns everything an InsightContext refers to
class InsightFixture {
public:
    explicit InsightFixture(InputBundle b)
        : bundle(std::move(b)) {
        TimePoint now = reference_now();
        schedule = ScheduleBuilder().build(bundle.job_queue, bundle.machines,
                                           bundle.optimization_goals, now);
        performance = PerformanceAnalyzer::analyze(schedule, bundle.machines, now);
        resources = ResourceAnalyzer::analyze(bundle, schedule, performance);
        cost = CostModel::analyze(schedule);
        risk = RiskAssessor::assess(bundle, schedule);
        ctx = std::make_unique<InsightContext>(bundle, schedule, performance, resources, cost, risk);
    }

    InputBundle bundle;
    Schedule schedule;
    PerformanceMetrics performance;
    ResourceUtilization resources;
    CostAnalysis cost;
    RiskAssessment risk;
    std::unique_ptr<InsightContext> ctx;
};

}  // namespace

TEST(InsightEngineTest, test_context_derived_fields) {
    Job a = make_job("A", PriorityTier::Critical, 200, 60, 20);
    Job b = make_job("B", PriorityTier::Normal, 200, 60, 20);
    b.material_type = "aluminum";
    b.dependencies = {"A"};
    Job odd = make_job("ODD", PriorityTier::Low, 200, 60, 0);
    odd.material_type = "titanium";
    InputBundle bundle = make_bundle({a, b, odd}, {make_machine("M1"), make_machine("DOWN")});
    bundle.machines[1].status = MachineStatus::Maintenance;

    InsightFixture f(bundle);
    const InsightContext& ctx = *f.ctx;
    EXPECT_EQ(ctx.material_changes, 1);
    EXPECT_EQ(ctx.unassignable_jobs, 1);
    EXPECT_EQ(ctx.urgent_jobs, 1);
    EXPECT_EQ(ctx.unavailable_machines, 1);
    EXPECT_TRUE(ctx.has_dependencies);
    EXPECT_NEAR(ctx.setup_share, 40.0 / 220.0, 1e-9);
    EXPECT_DOUBLE_EQ(ctx.utilization_spread, 0.0);
}

TEST(InsightEngineTest, test_rules_fire_on_conditions) {
    Job a = make_job("A", PriorityTier::Urgent, 200, 60, 20);
    Job b = make_job("B", PriorityTier::Normal, 200, 60, 20);
    b.material_type = "aluminum";
    InsightFixture f(make_bundle({a, b}, {make_machine("M1")}));

    OptimizationInsights insights = InsightEngine::insights(*f.ctx);
    EXPECT_TRUE(contains(insights.improvement_areas,
                         "Reduce setup times through better job sequencing"));
    EXPECT_TRUE(contains(insights.bottleneck_identification,
                         "Material handling between jobs causes delays"));
    EXPECT_TRUE(contains(insights.scheduling_strategies, "Group similar jobs to minimize setups"));
    EXPECT_TRUE(contains(insights.scheduling_strategies, "Use dynamic scheduling for urgent jobs"));
    EXPECT_FALSE(contains(insights.capacity_recommendations,
                          "Add capability for materials or thicknesses no machine covers"));
}

TEST(InsightEngineTest, test_quiet_schedule_only_gets_standing_tip) {
    Job a = make_job("A", PriorityTier::Normal, 200, 60, 0);
    InputBundle bundle = make_bundle({a}, {make_machine("M1"), make_machine("M2")});
    bundle.resource_constraints.available_operators = 5;
    InsightFixture f(bundle);

    AlertsAndRecommendations alerts = InsightEngine::alerts(*f.ctx);
    EXPECT_TRUE(alerts.urgent_actions.empty());
    EXPECT_TRUE(alerts.quality_alerts.empty());
    EXPECT_TRUE(alerts.efficiency_improvements.empty());
    ASSERT_EQ(alerts.scheduling_tips.size(), 1u);
    EXPECT_EQ(alerts.scheduling_tips[0], "Monitor real-time progress for dynamic adjustments");
}

TEST(InsightEngineTest, test_late_and_unassignable_alerts) {
    Job late = make_job("LATE", PriorityTier::Critical, 0.5, 120, 0);
    Job odd = make_job("ODD", PriorityTier::Low, 200, 60, 0);
    odd.thickness = 40.0;
    InputBundle bundle = make_bundle({late, odd}, {make_machine("M1")});
    bundle.resource_constraints.available_operators = 2;
    InsightFixture f(bundle);

    AlertsAndRecommendations alerts = InsightEngine::alerts(*f.ctx);
    EXPECT_TRUE(contains(alerts.urgent_actions,
                         "On-time delivery rate below target - review schedule"));
    EXPECT_TRUE(contains(alerts.urgent_actions,
                         "Resolve jobs with no compatible machine before release"));
    EXPECT_TRUE(contains(alerts.urgent_actions, "Review operator shift assignments"));
    EXPECT_TRUE(contains(alerts.capacity_warnings,
                         "High schedule risk - consider additional capacity"));

    auto recs = InsightEngine::recommendations(*f.ctx);
    EXPECT_EQ(recs.front(), "Optimized schedule for 2 jobs");
    EXPECT_TRUE(contains(recs, "1 job(s) could not be matched to a machine"));
    EXPECT_EQ(recs.back(), "Regular schedule optimization recommended for best results");
}

TEST(InsightEngineTest, test_evaluate_keeps_rule_order) {
    InsightFixture f(make_bundle({make_job("A")}, {make_machine("M1")}));
    std::vector<InsightRule> rules = {
        {[](const InsightContext&) { return true; }, "first"},
        {[](const InsightContext&) { return false; }, "skipped"},
        {[](const InsightContext& c) { return c.schedule.size() == 1; }, "second"},
    };
    auto out = InsightEngine::evaluate(rules, *f.ctx);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "first");
    EXPECT_EQ(out[1], "second");
}

TEST(InsightEngineTest, test_real_time_adjustments) {
    RealTimeAdjustments adj = InsightEngine::real_time_adjustments();
    EXPECT_TRUE(adj.dynamic_rescheduling);
    EXPECT_FALSE(adj.trigger_conditions.empty());
    EXPECT_FALSE(adj.adjustment_strategies.empty());
    EXPECT_FALSE(adj.monitoring_parameters.empty());
}
