#include "analysis/cost_model.h"
#include <algorithm>

namespace queueforge {

CostAnalysis CostModel::analyze(const Schedule& schedule) {
    const int jobs = static_cast<int>(schedule.size());

    CostAnalysis cost;
    cost.total_operating_cost = jobs * kOperatingCostPerJob;
    cost.overtime_cost = std::max(0, jobs - kOvertimeFreeJobs) * kOvertimeCostPerExtraJob;
    for (const auto& entry : schedule) {
        cost.setup_cost += entry.job.setup_time * kSetupCostPerMinute;
    }
    cost.tardiness_penalty = 0.0;
    cost.opportunity_cost = 0.0;
    cost.profit_optimization = jobs * kOptimizationBenefitPerJob;

    cost.cost_breakdown = {
        {"Operating Cost", cost.total_operating_cost, 60.0},
        {"Setup Cost", cost.setup_cost, 25.0},
        {"Overtime Cost", cost.overtime_cost, 15.0},
    };
    return cost;
}

}  // namespace queueforge
