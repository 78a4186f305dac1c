#pragma once
#ifndef QUEUEFORGE_COST_MODEL_H
#define QUEUEFORGE_COST_MODEL_H

#include "model/result.h"

namespace queueforge {

// Flat per-job cost heuristic. Machine-hour and labour rates are not modelled.
class CostModel {
public:
    static constexpr double kOperatingCostPerJob = 150.0;
    static constexpr double kOvertimeCostPerExtraJob = 50.0;
    static constexpr int kOvertimeFreeJobs = 5;
    static constexpr double kSetupCostPerMinute = 3.0;
    static constexpr double kOptimizationBenefitPerJob = 75.0;

    // Setup cost uses each job's nominal setup time, not the machine-scaled one.
    static CostAnalysis analyze(const Schedule& schedule);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_COST_MODEL_H
