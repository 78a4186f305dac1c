#pragma once
#ifndef QUEUEFORGE_TYPES_H
#define QUEUEFORGE_TYPES_H

#include <chrono>
#include <string>
#include <vector>

namespace queueforge {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Minutes = std::chrono::duration<double, std::ratio<60>>;

enum class PriorityTier { Critical, Urgent, High, Normal, Low };
enum class CustomerTier { Standard, Preferred, Vip };
enum class MachineStatus { Available, Busy, Maintenance, Offline };
enum class SkillLevel { Basic, Intermediate, Advanced, Expert };
enum class Objective {
    MinimizeMakespan,
    MaximizeThroughput,
    MinimizeTardiness,
    MaximizeProfit,
    BalanceWorkload,
};
enum class InspectionLevel { None, Sampling, Full, CriticalOnly };
enum class RiskLevel { Low, Medium, High, Critical };

struct Job {
    std::string id;
    std::string name;
    PriorityTier priority = PriorityTier::Normal;
    TimePoint due_date{};
    double estimated_duration = 0.0;  // minutes
    std::string material_type;
    double thickness = 0.0;  // mm
    double setup_time = 0.0;  // minutes
    int part_count = 0;
    CustomerTier customer_importance = CustomerTier::Standard;
    double profit_margin = 0.0;  // percent
    std::vector<std::string> dependencies;
};

struct ThicknessRange {
    double min = 0.0;
    double max = 0.0;

    bool contains(double value) const { return value >= min && value <= max; }
};

struct Machine {
    std::string id;
    std::string name;
    double max_power = 0.0;  // W
    std::vector<std::string> material_compatibility;
    ThicknessRange thickness_range;
    MachineStatus status = MachineStatus::Available;
    double efficiency = 0.0;  // percent
    double setup_time_multiplier = 1.0;
    SkillLevel operator_skill = SkillLevel::Intermediate;

    bool is_available() const { return status == MachineStatus::Available; }
    bool handles_material(const std::string& material) const;
};

struct TimeWindow {
    std::string start;  // HH:MM
    std::string end;
};

struct MaintenanceWindow {
    std::string start;
    std::string end;
    std::string frequency;  // daily | weekly | monthly
};

struct OperationalConstraints {
    TimeWindow working_hours{"08:00", "18:00"};
    std::vector<std::string> working_days;
    double max_overtime_hours = 0.0;  // per week
    double minimum_break_time = 0.0;  // minutes between jobs
    double max_continuous_run_time = 0.0;  // hours
    std::vector<MaintenanceWindow> maintenance_windows;
};

struct OperatorShift {
    std::string shift_id;
    std::string start_time;
    std::string end_time;
    int operator_count = 0;
};

struct MaterialStock {
    std::string material_type;
    double available_quantity = 0.0;
    double lead_time = 0.0;  // days
};

struct ToolingStock {
    std::string tool_type;
    bool available = false;
    double setup_time = 0.0;
};

struct ResourceConstraints {
    int available_operators = 0;
    std::vector<OperatorShift> operator_shifts;
    std::vector<MaterialStock> material_availability;
    std::vector<ToolingStock> tooling_availability;
};

struct OptimizationGoals {
    Objective primary_objective = Objective::MinimizeMakespan;
    std::vector<std::string> secondary_objectives;
    double customer_satisfaction_weight = 0.25;
    double profitability_weight = 0.25;
    double efficiency_weight = 0.25;  // validated and reported; not used in scoring
    double urgency_weight = 0.25;
};

// Carried through for the caller, not used by the scheduler
struct QualityRequirements {
    double allowable_rework = 0.0;  // percent
    double quality_check_time = 0.0;  // minutes per job
    InspectionLevel inspection = InspectionLevel::Sampling;
    double quality_gate_threshold = 0.0;  // 1-10
};

struct InputBundle {
    std::vector<Job> job_queue;
    std::vector<Machine> machines;
    OperationalConstraints operational_constraints;
    OptimizationGoals optimization_goals;
    ResourceConstraints resource_constraints;
    QualityRequirements quality_requirements;
};

// Enum names as they appear in input bundles. Unknown names map to the
// scoring defaults (normal, standard) rather than failing.
PriorityTier priority_from_string(const std::string& name);
CustomerTier customer_tier_from_string(const std::string& name);
MachineStatus machine_status_from_string(const std::string& name);
SkillLevel skill_level_from_string(const std::string& name);
Objective objective_from_string(const std::string& name);
InspectionLevel inspection_from_string(const std::string& name);

const char* to_string(PriorityTier tier);
const char* to_string(CustomerTier tier);
const char* to_string(MachineStatus status);
const char* to_string(SkillLevel level);
const char* to_string(Objective objective);
const char* to_string(InspectionLevel level);
const char* to_string(RiskLevel level);

// Accepts YYYY-MM-DD (midnight UTC) and YYYY-MM-DDTHH:MM[:SS[.fff]][zone],
// where zone is Z, +HH:MM, +HHMM or +HH (or '-'). A time without a zone is
// read as UTC, not local time. Returns false for any other shape.
bool parse_iso_time(const std::string& text, TimePoint& out);
// Whole seconds, always with a Z suffix; fractions are truncated.
std::string format_iso_time(TimePoint tp);

inline Clock::duration to_clock_duration(double minutes) {
    return std::chrono::duration_cast<Clock::duration>(Minutes(minutes));
}

inline double minutes_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Minutes>(to - from).count();
}

}  // namespace queueforge

#endif  // QUEUEFORGE_TYPES_H
