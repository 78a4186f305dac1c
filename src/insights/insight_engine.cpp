#include "insights/insight_engine.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <map>

namespace queueforge {

namespace {

bool high_risk(const InsightContext& c) {
    return c.risk.schedule_risk == RiskLevel::High || c.risk.schedule_risk == RiskLevel::Critical;
}

double quality_share(const InsightContext& c) {
    double processing = c.performance.total_makespan * 60.0;
    if (processing <= 0) return 0.0;
    double checks = c.bundle.quality_requirements.quality_check_time *
                    static_cast<double>(c.schedule.size());
    return checks / processing;
}

const std::vector<InsightRule> kImprovementAreas = {
    {[](const InsightContext& c) { return c.setup_share > 0.1; },
     "Reduce setup times through better job sequencing"},
    {[](const InsightContext& c) { return c.utilization_spread > 25; },
     "Improve machine utilization balance"},
    {[](const InsightContext& c) { return c.material_shortage; },
     "Optimize material flow and inventory management"},
    {[](const InsightContext& c) {
         return std::any_of(c.bundle.machines.begin(), c.bundle.machines.end(), [](const Machine& m) {
             return m.is_available() && m.operator_skill == SkillLevel::Basic;
         });
     },
     "Enhance operator skill development"},
    {[](const InsightContext& c) { return c.performance.on_time_delivery_rate < 95; },
     "Tighten due-date planning for jobs finishing late"},
};

const std::vector<InsightRule> kBottlenecks = {
    {[](const InsightContext& c) { return c.setup_share > 0.15; },
     "Machine setup time is primary constraint"},
    {[](const InsightContext& c) { return c.material_changes > 0; },
     "Material handling between jobs causes delays"},
    {[](const InsightContext& c) { return quality_share(c) > 0.1; },
     "Quality inspection time impacts throughput"},
    {[](const InsightContext& c) {
         return std::any_of(c.resources.machine_efficiency.begin(),
                            c.resources.machine_efficiency.end(),
                            [](const MachineEfficiency& m) { return m.bottleneck; });
     },
     "A single machine carries the heaviest share of the queue"},
};

const std::vector<InsightRule> kCapacity = {
    {[](const InsightContext& c) {
         return high_risk(c) || c.performance.average_utilization() > 85;
     },
     "Consider adding one more machine for peak periods"},
    {[](const InsightContext& c) { return c.bundle.resource_constraints.available_operators < 3; },
     "Cross-train operators for better flexibility"},
    {[](const InsightContext& c) { return c.schedule.size() > 10; },
     "Implement automated material handling"},
    {[](const InsightContext& c) { return c.unassignable_jobs > 0; },
     "Add capability for materials or thicknesses no machine covers"},
};

const std::vector<InsightRule> kProcess = {
    {[](const InsightContext& c) { return c.setup_share > 0.1; },
     "Standardize setup procedures across machines"},
    {[](const InsightContext& c) { return c.unavailable_machines > 0; },
     "Use predictive maintenance to reduce downtime"},
    {[](const InsightContext& c) { return c.performance.total_tardiness > 0; },
     "Implement lean manufacturing principles"},
};

const std::vector<InsightRule> kStrategies = {
    {[](const InsightContext& c) { return c.material_changes > 0; },
     "Group similar jobs to minimize setups"},
    {[](const InsightContext& c) { return c.urgent_jobs > 0; },
     "Use dynamic scheduling for urgent jobs"},
    {[](const InsightContext& c) { return c.schedule.size() > 5; },
     "Implement real-time monitoring"},
    {[](const InsightContext& c) { return c.has_dependencies; },
     "Release dependent jobs as soon as their predecessors finish"},
};

const std::vector<InsightRule> kUrgentActions = {
    {[](const InsightContext& c) { return c.performance.on_time_delivery_rate < 90; },
     "On-time delivery rate below target - review schedule"},
    {[](const InsightContext& c) { return c.unassignable_jobs > 0; },
     "Resolve jobs with no compatible machine before release"},
    {[](const InsightContext& c) { return c.material_shortage; },
     "Confirm material inventory for all scheduled jobs"},
    {[](const InsightContext& c) { return c.bundle.resource_constraints.available_operators < 3; },
     "Review operator shift assignments"},
};

const std::vector<InsightRule> kCapacityWarnings = {
    {high_risk, "High schedule risk - consider additional capacity"},
    {[](const InsightContext& c) { return c.performance.average_utilization() >= 90; },
     "Machine utilization approaching 90% threshold"},
    {[](const InsightContext& c) { return c.risk.buffer_adequacy < 75; },
     "Limited buffer time for high-priority jobs"},
    {[](const InsightContext& c) { return c.cost.overtime_cost > 0; },
     "Potential overtime required for on-time delivery"},
};

const std::vector<InsightRule> kQualityAlerts = {
    {[](const InsightContext& c) { return quality_share(c) > 0.1; },
     "Quality check time may impact schedule adherence"},
    {[](const InsightContext& c) { return c.setup_share > 0.2; },
     "Monitor setup time accuracy for schedule reliability"},
    {[](const InsightContext& c) {
         return c.bundle.quality_requirements.inspection == InspectionLevel::Full &&
                c.schedule.size() > 5;
     },
     "Full inspection on a long queue - stagger inspections across shifts"},
};

const std::vector<InsightRule> kEfficiency = {
    {[](const InsightContext& c) { return c.material_changes > 0; },
     "Group similar materials to reduce setup time"},
    {[](const InsightContext& c) { return c.unavailable_machines > 0; },
     "Implement predictive maintenance scheduling"},
    {[](const InsightContext& c) { return c.bundle.resource_constraints.available_operators < 3; },
     "Consider cross-training operators for flexibility"},
};

const std::vector<InsightRule> kTips = {
    {[](const InsightContext& c) { return c.urgent_jobs > 0; },
     "Schedule high-priority jobs during peak efficiency hours"},
    {[](const InsightContext& c) {
         return std::any_of(c.schedule.begin(), c.schedule.end(), [](const ScheduledJob& s) {
             return s.job.estimated_duration > 180;
         });
     },
     "Build in buffer time for complex jobs"},
    {[](const InsightContext&) { return true; },
     "Monitor real-time progress for dynamic adjustments"},
};

}  // namespace

InsightContext::InsightContext(const InputBundle& bundle_, const Schedule& schedule_,
                               const PerformanceMetrics& performance_,
                               const ResourceUtilization& resources_, const CostAnalysis& cost_,
                               const RiskAssessment& risk_)
    : bundle(bundle_),
      schedule(schedule_),
      performance(performance_),
      resources(resources_),
      cost(cost_),
      risk(risk_) {
    double setup = 0.0;
    double processing = 0.0;
    std::map<std::string, std::string> last_material;
    for (const auto& entry : schedule) {
        setup += entry.effective_setup_time;
        processing += entry.processing_minutes();
        if (entry.unassignable) {
            ++unassignable_jobs;
        } else {
            auto it = last_material.find(entry.assigned_machine);
            if (it != last_material.end() && it->second != entry.job.material_type) {
                ++material_changes;
            }
            last_material[entry.assigned_machine] = entry.job.material_type;
        }
        if (entry.job.priority == PriorityTier::Urgent ||
            entry.job.priority == PriorityTier::Critical) {
            ++urgent_jobs;
        }
        if (!entry.job.dependencies.empty()) has_dependencies = true;
    }
    setup_share = processing > 0 ? setup / processing : 0.0;

    double lo = 0.0;
    double hi = 0.0;
    bool first = true;
    for (size_t i = 0; i < bundle.machines.size(); ++i) {
        if (!bundle.machines[i].is_available()) {
            ++unavailable_machines;
            continue;
        }
        if (i >= performance.machine_utilization.size()) continue;
        double u = performance.machine_utilization[i].utilization;
        lo = first ? u : std::min(lo, u);
        hi = first ? u : std::max(hi, u);
        first = false;
    }
    utilization_spread = hi - lo;

    material_shortage = std::any_of(resources.material_usage.begin(), resources.material_usage.end(),
                                    [](const MaterialUsage& m) { return m.shortage; });
}

std::vector<std::string> InsightEngine::evaluate(const std::vector<InsightRule>& rules,
                                                 const InsightContext& ctx) {
    std::vector<std::string> out;
    for (const auto& rule : rules) {
        if (rule.applies(ctx)) out.push_back(rule.message);
    }
    return out;
}

OptimizationInsights InsightEngine::insights(const InsightContext& ctx) {
    OptimizationInsights out;
    out.improvement_areas = evaluate(kImprovementAreas, ctx);
    out.bottleneck_identification = evaluate(kBottlenecks, ctx);
    out.capacity_recommendations = evaluate(kCapacity, ctx);
    out.process_improvements = evaluate(kProcess, ctx);
    out.scheduling_strategies = evaluate(kStrategies, ctx);
    return out;
}

AlertsAndRecommendations InsightEngine::alerts(const InsightContext& ctx) {
    AlertsAndRecommendations out;
    out.urgent_actions = evaluate(kUrgentActions, ctx);
    out.capacity_warnings = evaluate(kCapacityWarnings, ctx);
    out.quality_alerts = evaluate(kQualityAlerts, ctx);
    out.efficiency_improvements = evaluate(kEfficiency, ctx);
    out.scheduling_tips = evaluate(kTips, ctx);
    return out;
}

std::vector<std::string> InsightEngine::recommendations(const InsightContext& ctx) {
    std::vector<std::string> out;
    out.push_back(fmt::format("Optimized schedule for {} jobs", ctx.schedule.size()));
    out.push_back(fmt::format("Total makespan: {:.1f} hours", ctx.performance.total_makespan));
    out.push_back(
        fmt::format("On-time delivery rate: {:.1f}%", ctx.performance.on_time_delivery_rate));
    if (ctx.performance.on_time_delivery_rate < 95) {
        out.push_back("Consider adding buffer time to improve delivery performance");
    }
    if (ctx.unassignable_jobs > 0) {
        out.push_back(fmt::format("{} job(s) could not be matched to a machine",
                                  ctx.unassignable_jobs));
    }
    out.push_back("Regular schedule optimization recommended for best results");
    return out;
}

RealTimeAdjustments InsightEngine::real_time_adjustments() {
    RealTimeAdjustments adj;
    adj.dynamic_rescheduling = true;
    adj.trigger_conditions = {
        "Machine breakdown or unexpected downtime",
        "Rush order insertion",
        "Material availability changes",
        "Quality issues requiring rework",
    };
    adj.adjustment_strategies = {
        "Automatic job resequencing",
        "Load balancing across machines",
        "Priority escalation protocols",
        "Resource reallocation",
    };
    adj.monitoring_parameters = {
        "Real-time machine status",
        "Job progress tracking",
        "Quality metrics",
        "Resource availability",
    };
    return adj;
}

}  // namespace queueforge
