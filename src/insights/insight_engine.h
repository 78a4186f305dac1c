#pragma once
#ifndef QUEUEFORGE_INSIGHT_ENGINE_H
#define QUEUEFORGE_INSIGHT_ENGINE_H

#include <functional>
#include <string>
#include <vector>
#include "model/result.h"

namespace queueforge {

// Everything a recommendation rule may look at, computed once per run.
struct InsightContext {
    const InputBundle& bundle;
    const Schedule& schedule;
    const PerformanceMetrics& performance;
    const ResourceUtilization& resources;
    const CostAnalysis& cost;
    const RiskAssessment& risk;

    double setup_share = 0.0;  // effective setup / total processing minutes
    int material_changes = 0;  // back-to-back jobs on a machine with different material
    int unassignable_jobs = 0;
    int urgent_jobs = 0;
    int unavailable_machines = 0;
    double utilization_spread = 0.0;  // max - min across available machines
    bool material_shortage = false;
    bool has_dependencies = false;

    InsightContext(const InputBundle& bundle, const Schedule& schedule,
                   const PerformanceMetrics& performance, const ResourceUtilization& resources,
                   const CostAnalysis& cost, const RiskAssessment& risk);
};

struct InsightRule {
    std::function<bool(const InsightContext&)> applies;
    std::string message;
};

class InsightEngine {
public:
    static OptimizationInsights insights(const InsightContext& ctx);
    static AlertsAndRecommendations alerts(const InsightContext& ctx);
    static std::vector<std::string> recommendations(const InsightContext& ctx);

    // Rescheduling triggers for the caller's monitoring; not executed here
    static RealTimeAdjustments real_time_adjustments();

    static std::vector<std::string> evaluate(const std::vector<InsightRule>& rules,
                                             const InsightContext& ctx);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_INSIGHT_ENGINE_H
