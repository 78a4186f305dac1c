#include "config/config.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace queueforge {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// std::stod accepts "12abc"; require the whole string to parse.
bool parse_double(const std::string& text, double& out) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// stod also accepts "inf" and "nan"; those are rejected with the other bad values
void read_bounded(const char* name, double& field, double max) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    double value = 0.0;
    if (parse_double(raw, value) && std::isfinite(value) && value >= 0.0 && value <= max) {
        field = value;
    } else {
        spdlog::warn("Ignoring invalid {}='{}', keeping {}", name, raw, field);
    }
}

}  // namespace

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    if (const char* level = std::getenv("QUEUEFORGE_LOG_LEVEL")) {
        cfg.log_level = level;
    }

    if (const char* input = std::getenv("QUEUEFORGE_INPUT")) {
        cfg.input_path = input;
    }

    if (const char* now = std::getenv("QUEUEFORGE_NOW")) {
        cfg.reference_time = now;
    }

    if (const char* policy = std::getenv("QUEUEFORGE_UNMATCHED_POLICY")) {
        auto value = lowercase(policy);
        if (value == "flag") {
            cfg.unmatched_policy = UnmatchedPolicy::Flag;
        } else if (value == "fallback") {
            cfg.unmatched_policy = UnmatchedPolicy::Fallback;
        } else {
            spdlog::warn("Unknown QUEUEFORGE_UNMATCHED_POLICY '{}', using {}", policy,
                         to_string(cfg.unmatched_policy));
        }
    }

    if (const char* deps = std::getenv("QUEUEFORGE_ENFORCE_DEPENDENCIES")) {
        auto value = lowercase(deps);
        if (value == "true" || value == "1" || value == "yes") {
            cfg.enforce_dependencies = true;
        } else if (value == "false" || value == "0" || value == "no") {
            cfg.enforce_dependencies = false;
        } else {
            spdlog::warn("Unknown QUEUEFORGE_ENFORCE_DEPENDENCIES '{}', keeping {}", deps,
                         cfg.enforce_dependencies);
        }
    }

    read_bounded("QUEUEFORGE_MIN_BUFFER_MINUTES", cfg.min_buffer_minutes, kMaxMinBufferMinutes);
    read_bounded("QUEUEFORGE_BUFFER_RATIO", cfg.buffer_ratio, kMaxBufferRatio);

    return cfg;
}

const char* to_string(UnmatchedPolicy policy) {
    switch (policy) {
        case UnmatchedPolicy::Flag: return "flag";
        case UnmatchedPolicy::Fallback: return "fallback";
    }
    return "flag";
}

}  // namespace queueforge
