#include <gtest/gtest.h>
#include "analysis/cost_model.h"
#include "fixtures.h"
#include "scheduling/schedule_builder.h"

using namespace queueforge;
using namespace queueforge::fixtures;

namespace {

Schedule schedule_of(int count, double setup) {
    std::vector<Job> jobs;
    for (int i = 0; i < count; ++i) {
        jobs.push_back(make_job("J" + std::to_string(i), PriorityTier::Normal, 200, 60, setup));
    }
    return ScheduleBuilder().build(jobs, {make_machine("M1", 2.0)}, {}, reference_now());
}

}  // namespace

TEST(CostModelTest, test_small_queue_has_no_overtime) {
    CostAnalysis cost = CostModel::analyze(schedule_of(3, 10));
    EXPECT_DOUBLE_EQ(cost.total_operating_cost, 450.0);
    EXPECT_DOUBLE_EQ(cost.overtime_cost, 0.0);
    EXPECT_DOUBLE_EQ(cost.profit_optimization, 225.0);
    EXPECT_DOUBLE_EQ(cost.tardiness_penalty, 0.0);
    EXPECT_DOUBLE_EQ(cost.opportunity_cost, 0.0);
}

TEST(CostModelTest, test_overtime_beyond_five_jobs) {
    CostAnalysis cost = CostModel::analyze(schedule_of(8, 0));
    EXPECT_DOUBLE_EQ(cost.overtime_cost, 150.0);
    EXPECT_DOUBLE_EQ(cost.total_cost(), 8 * 150.0 + 150.0);
}

TEST(CostModelTest, test_setup_cost_uses_nominal_setup) {
    // Machine multiplier 2.0 does not change the setup charge
    CostAnalysis cost = CostModel::analyze(schedule_of(2, 15));
    EXPECT_DOUBLE_EQ(cost.setup_cost, 2 * 15 * 3.0);
}

TEST(CostModelTest, test_breakdown_split) {
    CostAnalysis cost = CostModel::analyze(schedule_of(6, 10));
    ASSERT_EQ(cost.cost_breakdown.size(), 3u);
    EXPECT_EQ(cost.cost_breakdown[0].category, "Operating Cost");
    EXPECT_DOUBLE_EQ(cost.cost_breakdown[0].percentage, 60.0);
    EXPECT_DOUBLE_EQ(cost.cost_breakdown[0].amount, cost.total_operating_cost);
    EXPECT_EQ(cost.cost_breakdown[1].category, "Setup Cost");
    EXPECT_DOUBLE_EQ(cost.cost_breakdown[1].percentage, 25.0);
    EXPECT_EQ(cost.cost_breakdown[2].category, "Overtime Cost");
    EXPECT_DOUBLE_EQ(cost.cost_breakdown[2].amount, 50.0);
}
