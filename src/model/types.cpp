#include "model/types.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace queueforge {

namespace {

std::string normalize(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

}  // namespace

bool Machine::handles_material(const std::string& material) const {
    return std::find(material_compatibility.begin(), material_compatibility.end(), material) !=
           material_compatibility.end();
}

PriorityTier priority_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "critical") return PriorityTier::Critical;
    if (n == "urgent") return PriorityTier::Urgent;
    if (n == "high") return PriorityTier::High;
    if (n == "low") return PriorityTier::Low;
    return PriorityTier::Normal;
}

CustomerTier customer_tier_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "vip") return CustomerTier::Vip;
    if (n == "preferred") return CustomerTier::Preferred;
    return CustomerTier::Standard;
}

// Anything unrecognised is treated as not schedulable.
MachineStatus machine_status_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "available") return MachineStatus::Available;
    if (n == "busy") return MachineStatus::Busy;
    if (n == "maintenance") return MachineStatus::Maintenance;
    return MachineStatus::Offline;
}

SkillLevel skill_level_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "basic") return SkillLevel::Basic;
    if (n == "advanced") return SkillLevel::Advanced;
    if (n == "expert") return SkillLevel::Expert;
    return SkillLevel::Intermediate;
}

Objective objective_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "maximize_throughput") return Objective::MaximizeThroughput;
    if (n == "minimize_tardiness") return Objective::MinimizeTardiness;
    if (n == "maximize_profit") return Objective::MaximizeProfit;
    if (n == "balance_workload") return Objective::BalanceWorkload;
    return Objective::MinimizeMakespan;
}

InspectionLevel inspection_from_string(const std::string& name) {
    auto n = normalize(name);
    if (n == "none") return InspectionLevel::None;
    if (n == "full") return InspectionLevel::Full;
    if (n == "critical_only") return InspectionLevel::CriticalOnly;
    return InspectionLevel::Sampling;
}

const char* to_string(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Critical: return "critical";
        case PriorityTier::Urgent: return "urgent";
        case PriorityTier::High: return "high";
        case PriorityTier::Normal: return "normal";
        case PriorityTier::Low: return "low";
    }
    return "normal";
}

const char* to_string(CustomerTier tier) {
    switch (tier) {
        case CustomerTier::Standard: return "standard";
        case CustomerTier::Preferred: return "preferred";
        case CustomerTier::Vip: return "vip";
    }
    return "standard";
}

const char* to_string(MachineStatus status) {
    switch (status) {
        case MachineStatus::Available: return "available";
        case MachineStatus::Busy: return "busy";
        case MachineStatus::Maintenance: return "maintenance";
        case MachineStatus::Offline: return "offline";
    }
    return "offline";
}

const char* to_string(SkillLevel level) {
    switch (level) {
        case SkillLevel::Basic: return "basic";
        case SkillLevel::Intermediate: return "intermediate";
        case SkillLevel::Advanced: return "advanced";
        case SkillLevel::Expert: return "expert";
    }
    return "intermediate";
}

const char* to_string(Objective objective) {
    switch (objective) {
        case Objective::MinimizeMakespan: return "minimize_makespan";
        case Objective::MaximizeThroughput: return "maximize_throughput";
        case Objective::MinimizeTardiness: return "minimize_tardiness";
        case Objective::MaximizeProfit: return "maximize_profit";
        case Objective::BalanceWorkload: return "balance_workload";
    }
    return "minimize_makespan";
}

const char* to_string(InspectionLevel level) {
    switch (level) {
        case InspectionLevel::None: return "none";
        case InspectionLevel::Sampling: return "sampling";
        case InspectionLevel::Full: return "full";
        case InspectionLevel::CriticalOnly: return "critical_only";
    }
    return "sampling";
}

const char* to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "low";
}

namespace {

bool two_digits(const std::string& text, size_t pos, int& out) {
    if (pos + 2 > text.size() || !std::isdigit(static_cast<unsigned char>(text[pos])) ||
        !std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
        return false;
    }
    out = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    return true;
}

// "Z", "+HH:MM", "+HHMM" or "+HH" (and the '-' forms) as minutes east of UTC
bool parse_utc_offset(const std::string& zone, int& minutes) {
    if (zone == "Z") {
        minutes = 0;
        return true;
    }
    if (zone.size() < 3 || (zone[0] != '+' && zone[0] != '-')) return false;

    int hh = 0;
    int mm = 0;
    if (!two_digits(zone, 1, hh)) return false;
    if (zone.size() == 6 && zone[3] == ':') {
        if (!two_digits(zone, 4, mm)) return false;
    } else if (zone.size() == 5) {
        if (!two_digits(zone, 3, mm)) return false;
    } else if (zone.size() != 3) {
        return false;
    }
    if (hh > 23 || mm > 59) return false;

    minutes = (hh * 60 + mm) * (zone[0] == '-' ? -1 : 1);
    return true;
}

}  // namespace

bool parse_iso_time(const std::string& text, TimePoint& out) {
    std::tm tm{};
    std::istringstream iss(text);
    bool has_seconds = false;

    if (text.size() == 10) {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    } else if (text.size() >= 16 && text[10] == 'T') {
        has_seconds = text.size() >= 19 && text[16] == ':';
        if (has_seconds) {
            iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M");
        }
    } else {
        return false;
    }
    if (iss.fail()) return false;

    std::string rest;
    std::getline(iss, rest);

    // Fractional seconds, kept to nanosecond precision
    size_t pos = 0;
    std::chrono::nanoseconds fraction{0};
    if (has_seconds && pos < rest.size() && rest[pos] == '.') {
        ++pos;
        const size_t first = pos;
        long long nanos = 0;
        long long scale = 100000000;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            nanos += (rest[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == first) return false;
        fraction = std::chrono::nanoseconds(nanos);
    }

    // No zone means UTC
    int offset_minutes = 0;
    const std::string zone = rest.substr(pos);
    if (!zone.empty() && !parse_utc_offset(zone, offset_minutes)) return false;

    std::time_t seconds = timegm(&tm);
    out = Clock::from_time_t(seconds) +
          std::chrono::duration_cast<Clock::duration>(fraction) -
          std::chrono::minutes(offset_minutes);
    return true;
}

std::string format_iso_time(TimePoint tp) {
    std::time_t seconds = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace queueforge
