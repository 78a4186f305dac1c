#pragma once
#ifndef QUEUEFORGE_RESULT_H
#define QUEUEFORGE_RESULT_H

#include <string>
#include <utility>
#include <vector>
#include "model/types.h"

namespace queueforge {

struct ScheduledJob {
    Job job;
    std::string assigned_machine;  // empty when unassignable
    TimePoint scheduled_start{};
    TimePoint scheduled_end{};
    double effective_setup_time = 0.0;  // minutes, after the machine multiplier
    int sequence_number = 0;
    double buffer_time = 0.0;  // minutes
    bool unassignable = false;

    // effective setup + estimated duration, in minutes
    double processing_minutes() const { return effective_setup_time + job.estimated_duration; }
    bool is_late() const { return scheduled_end > job.due_date; }
};

using Schedule = std::vector<ScheduledJob>;

struct MachineUtilization {
    std::string machine_id;
    double utilization = 0.0;  // percent
};

struct PerformanceMetrics {
    double total_makespan = 0.0;  // hours
    double schedule_span = 0.0;  // hours, now -> last machine-assigned completion
    double average_wait_time = 0.0;  // hours
    std::vector<MachineUtilization> machine_utilization;
    double on_time_delivery_rate = 0.0;  // percent; unassignable jobs count as not on time
    double total_tardiness = 0.0;  // hours
    double throughput_rate = 0.0;  // jobs per day
    double average_flow_time = 0.0;  // hours

    double average_utilization() const;
};

struct MachineEfficiency {
    std::string machine_id;
    double efficiency = 0.0;
    bool bottleneck = false;
};

struct MaterialUsage {
    std::string material_type;
    double utilization = 0.0;
    bool shortage = false;
};

struct ToolingUsage {
    std::string tool_type;
    double utilization = 0.0;
    bool available = false;
};

struct ShiftCoverage {
    std::string shift_id;
    double coverage = 0.0;
    bool overtime = false;
};

struct ResourceUtilization {
    double operator_utilization = 0.0;
    std::vector<MachineEfficiency> machine_efficiency;
    std::vector<MaterialUsage> material_usage;
    std::vector<ToolingUsage> tooling_utilization;
    std::vector<ShiftCoverage> shift_coverage;
};

struct CostLine {
    std::string category;
    double amount = 0.0;
    double percentage = 0.0;
};

struct CostAnalysis {
    double total_operating_cost = 0.0;
    double overtime_cost = 0.0;
    double setup_cost = 0.0;
    double tardiness_penalty = 0.0;
    double opportunity_cost = 0.0;
    double profit_optimization = 0.0;
    std::vector<CostLine> cost_breakdown;

    double total_cost() const {
        return total_operating_cost + setup_cost + overtime_cost + tardiness_penalty +
               opportunity_cost;
    }
};

struct DeliveryRisk {
    std::string job_id;
    RiskLevel risk_level = RiskLevel::Low;
    std::string mitigation;
};

struct RiskAssessment {
    RiskLevel schedule_risk = RiskLevel::Low;
    std::vector<std::string> risk_factors;
    std::vector<std::string> contingency_plans;
    double buffer_adequacy = 0.0;  // percent
    std::vector<DeliveryRisk> delivery_risk;
};

struct OptimizationInsights {
    std::vector<std::string> improvement_areas;
    std::vector<std::string> bottleneck_identification;
    std::vector<std::string> capacity_recommendations;
    std::vector<std::string> process_improvements;
    std::vector<std::string> scheduling_strategies;
};

struct Scenario {
    std::string name;
    std::string description;
    OptimizationGoals goals;
    double makespan = 0.0;  // hours
    double schedule_span = 0.0;  // hours
    double on_time_rate = 0.0;  // percent
    // CostModel::analyze of the scenario's schedule. That model charges per job
    // and per nominal setup minute, so every scenario of one queue costs the same.
    double total_cost = 0.0;
    std::vector<std::string> tradeoffs;
};

struct RealTimeAdjustments {
    bool dynamic_rescheduling = true;
    std::vector<std::string> trigger_conditions;
    std::vector<std::string> adjustment_strategies;
    std::vector<std::string> monitoring_parameters;
};

struct DeliveryPerformance {
    std::string customer_group;
    double on_time_rate = 0.0;
    double satisfaction = 0.0;  // 1-10
};

struct CustomerNotification {
    std::string job_id;
    std::string customer_notification;
    std::string timing;
};

struct CustomerImpact {
    double customer_satisfaction_score = 0.0;  // 1-10
    std::vector<DeliveryPerformance> delivery_performance;
    std::vector<CustomerNotification> communication_plan;
};

struct AlertsAndRecommendations {
    std::vector<std::string> urgent_actions;
    std::vector<std::string> capacity_warnings;
    std::vector<std::string> quality_alerts;
    std::vector<std::string> efficiency_improvements;
    std::vector<std::string> scheduling_tips;
};

struct OptimizationResult {
    Schedule optimized_schedule;
    std::vector<std::string> unassignable_jobs;
    PerformanceMetrics performance_metrics;
    ResourceUtilization resource_utilization;
    CostAnalysis cost_analysis;
    RiskAssessment risk_assessment;
    OptimizationInsights optimization_insights;
    std::vector<Scenario> alternative_schedules;
    RealTimeAdjustments real_time_adjustments;
    CustomerImpact customer_impact;
    AlertsAndRecommendations alerts_and_recommendations;
    std::vector<std::string> recommendations;
    std::vector<std::pair<std::string, std::string>> key_metrics;
};

}  // namespace queueforge

#endif  // QUEUEFORGE_RESULT_H
