#pragma once
#ifndef QUEUEFORGE_VALIDATOR_H
#define QUEUEFORGE_VALIDATOR_H

#include <optional>
#include <stdexcept>
#include <string>
#include "model/types.h"

namespace queueforge {

// Limits that keep every computed time point inside the clock's range
constexpr double kMaxJobMinutes = 525600.0;      // one year
constexpr double kMaxQueueMinutes = 5256000.0;  // ten years
constexpr double kMaxSetupMultiplier = 10.0;

class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Returns the first problem found, or std::nullopt when the bundle can be
// scheduled. Checks run in a fixed order so the caller always sees the same
// message for the same input.
std::optional<std::string> validate_inputs(const InputBundle& bundle,
                                           bool check_dependencies = true);

// True when the known-id dependency edges of the queue contain a cycle.
bool has_dependency_cycle(const std::vector<Job>& jobs);

}  // namespace queueforge

#endif  // QUEUEFORGE_VALIDATOR_H
