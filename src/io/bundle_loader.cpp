#include "io/bundle_loader.h"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace queueforge {

namespace pt = boost::property_tree;

namespace {

std::vector<std::string> string_list(const pt::ptree& node, const std::string& path) {
    std::vector<std::string> out;
    if (auto child = node.get_child_optional(path)) {
        for (const auto& item : *child) {
            out.push_back(item.second.get_value<std::string>());
        }
    }
    return out;
}

// Array children of an optional section; empty when absent
const pt::ptree& array_at(const pt::ptree& node, const std::string& path) {
    static const pt::ptree empty;
    auto child = node.get_child_optional(path);
    return child ? *child : empty;
}

Job read_job(const pt::ptree& node) {
    Job job;
    job.id = node.get<std::string>("jobId");
    job.name = node.get<std::string>("jobName", job.id);
    job.priority = priority_from_string(node.get<std::string>("priority", "normal"));

    auto due = node.get<std::string>("dueDate");
    if (!parse_iso_time(due, job.due_date)) {
        throw BundleError("Invalid dueDate '" + due + "' for job " + job.id);
    }

    job.estimated_duration = node.get<double>("estimatedDuration", 0.0);
    job.material_type = node.get<std::string>("materialType", "");
    job.thickness = node.get<double>("thickness", 0.0);
    job.setup_time = node.get<double>("setupTime", 0.0);
    job.part_count = node.get<int>("partCount", 0);
    job.customer_importance =
        customer_tier_from_string(node.get<std::string>("customerImportance", "standard"));
    job.profit_margin = node.get<double>("profitMargin", 0.0);
    job.dependencies = string_list(node, "dependencies");
    return job;
}

Machine read_machine(const pt::ptree& node) {
    Machine m;
    m.id = node.get<std::string>("machineId");
    m.name = node.get<std::string>("machineName", m.id);
    m.max_power = node.get<double>("maxPower", 0.0);
    m.material_compatibility = string_list(node, "materialCompatibility");
    m.thickness_range.min = node.get<double>("thicknessRange.min", 0.0);
    m.thickness_range.max = node.get<double>("thicknessRange.max", 0.0);
    m.status = machine_status_from_string(node.get<std::string>("currentStatus", "available"));
    m.efficiency = node.get<double>("efficiency", 0.0);
    m.setup_time_multiplier = node.get<double>("setupTimeMultiplier", 1.0);
    m.operator_skill =
        skill_level_from_string(node.get<std::string>("operatorSkillLevel", "intermediate"));
    return m;
}

OperationalConstraints read_operational(const pt::ptree& root) {
    OperationalConstraints oc;
    auto node_opt = root.get_child_optional("operationalConstraints");
    if (!node_opt) return oc;
    const pt::ptree& node = *node_opt;

    oc.working_hours.start = node.get<std::string>("workingHours.start", oc.working_hours.start);
    oc.working_hours.end = node.get<std::string>("workingHours.end", oc.working_hours.end);
    oc.working_days = string_list(node, "workingDays");
    oc.max_overtime_hours = node.get<double>("maxOvertimeHours", 0.0);
    oc.minimum_break_time = node.get<double>("minimumBreakTime", 0.0);
    oc.max_continuous_run_time = node.get<double>("maxContinuousRunTime", 0.0);
    for (const auto& item : array_at(node, "maintenanceWindows")) {
        const auto& w = item.second;
        oc.maintenance_windows.push_back({w.get<std::string>("start", ""),
                                          w.get<std::string>("end", ""),
                                          w.get<std::string>("frequency", "daily")});
    }
    return oc;
}

OptimizationGoals read_goals(const pt::ptree& root) {
    OptimizationGoals g;
    auto node_opt = root.get_child_optional("optimizationGoals");
    if (!node_opt) return g;
    const pt::ptree& node = *node_opt;

    g.primary_objective =
        objective_from_string(node.get<std::string>("primaryObjective", "minimize_makespan"));
    g.secondary_objectives = string_list(node, "secondaryObjectives");
    g.customer_satisfaction_weight =
        node.get<double>("customerSatisfactionWeight", g.customer_satisfaction_weight);
    g.profitability_weight = node.get<double>("profitabilityWeight", g.profitability_weight);
    g.efficiency_weight = node.get<double>("efficiencyWeight", g.efficiency_weight);
    g.urgency_weight = node.get<double>("urgencyWeight", g.urgency_weight);
    return g;
}

ResourceConstraints read_resources(const pt::ptree& root) {
    ResourceConstraints rc;
    auto node_opt = root.get_child_optional("resourceConstraints");
    if (!node_opt) return rc;
    const pt::ptree& node = *node_opt;

    rc.available_operators = node.get<int>("availableOperators", 0);
    for (const auto& item : array_at(node, "operatorShifts")) {
        const auto& s = item.second;
        rc.operator_shifts.push_back({s.get<std::string>("shiftId", ""),
                                      s.get<std::string>("startTime", ""),
                                      s.get<std::string>("endTime", ""),
                                      s.get<int>("operatorCount", 0)});
    }
    for (const auto& item : array_at(node, "materialAvailability")) {
        const auto& m = item.second;
        rc.material_availability.push_back({m.get<std::string>("materialType", ""),
                                            m.get<double>("availableQuantity", 0.0),
                                            m.get<double>("leadTime", 0.0)});
    }
    for (const auto& item : array_at(node, "toolingAvailability")) {
        const auto& t = item.second;
        rc.tooling_availability.push_back({t.get<std::string>("toolType", ""),
                                           t.get<bool>("available", false),
                                           t.get<double>("setupTime", 0.0)});
    }
    return rc;
}

QualityRequirements read_quality(const pt::ptree& root) {
    QualityRequirements q;
    auto node_opt = root.get_child_optional("qualityRequirements");
    if (!node_opt) return q;
    const pt::ptree& node = *node_opt;

    q.allowable_rework = node.get<double>("allowableRework", 0.0);
    q.quality_check_time = node.get<double>("qualityCheckTime", 0.0);
    q.inspection = inspection_from_string(node.get<std::string>("inspectionRequirements", "sampling"));
    q.quality_gate_threshold = node.get<double>("qualityGateThreshold", 0.0);
    return q;
}

}  // namespace

InputBundle parse_bundle(std::istream& in) {
    pt::ptree root;
    try {
        pt::read_json(in, root);
    } catch (const pt::json_parser_error& e) {
        throw BundleError(std::string("Malformed input bundle: ") + e.what());
    }

    InputBundle bundle;
    try {
        for (const auto& item : array_at(root, "jobQueue")) {
            bundle.job_queue.push_back(read_job(item.second));
        }
        for (const auto& item : array_at(root, "machineCapabilities")) {
            bundle.machines.push_back(read_machine(item.second));
        }
        bundle.operational_constraints = read_operational(root);
        bundle.optimization_goals = read_goals(root);
        bundle.resource_constraints = read_resources(root);
        bundle.quality_requirements = read_quality(root);
    } catch (const pt::ptree_error& e) {
        throw BundleError(std::string("Invalid input bundle field: ") + e.what());
    }

    spdlog::debug("Loaded bundle with {} jobs and {} machines", bundle.job_queue.size(),
                  bundle.machines.size());
    return bundle;
}

InputBundle load_bundle(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BundleError("Cannot open input bundle: " + path);
    }
    return parse_bundle(file);
}

}  // namespace queueforge
