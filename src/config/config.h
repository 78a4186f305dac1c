#pragma once
#ifndef QUEUEFORGE_CONFIG_H
#define QUEUEFORGE_CONFIG_H

#include <string>

namespace queueforge {

// What to do with a job no machine can legally run
enum class UnmatchedPolicy {
    Flag,      // keep it in the schedule, mark it unassignable
    Fallback,  // put it on the first machine in the list anyway
};

// Upper limits for the buffer tunables; larger values are rejected
constexpr double kMaxMinBufferMinutes = 1440.0;
constexpr double kMaxBufferRatio = 1.0;

struct Config {
    std::string log_level = "info";
    std::string input_path;
    std::string reference_time;  // ISO-8601, empty = wall clock
    UnmatchedPolicy unmatched_policy = UnmatchedPolicy::Flag;
    bool enforce_dependencies = true;
    double min_buffer_minutes = 5.0;
    double buffer_ratio = 0.1;

    // Malformed values keep their defaults and are logged, never thrown.
    static Config from_env();
};

Config& get_config();

const char* to_string(UnmatchedPolicy policy);

}  // namespace queueforge

#endif  // QUEUEFORGE_CONFIG_H
