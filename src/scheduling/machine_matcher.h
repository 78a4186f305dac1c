#pragma once
#ifndef QUEUEFORGE_MACHINE_MATCHER_H
#define QUEUEFORGE_MACHINE_MATCHER_H

#include <cstddef>
#include <vector>
#include "model/types.h"

namespace queueforge {

// A machine is eligible for a job when it is available, lists the job's
// material, and the job's thickness lies inside its range (inclusive).
class MachineMatcher {
public:
    static bool is_eligible(const Job& job, const Machine& machine);

    // Indices of every eligible machine, in list order.
    // Throws std::invalid_argument("no machines available") on an empty list.
    static std::vector<size_t> eligible_machines(const Job& job,
                                                 const std::vector<Machine>& machines);

    // First eligible machine, or nullptr when none qualifies.
    // Throws std::invalid_argument("no machines available") on an empty list.
    static const Machine* match(const Job& job, const std::vector<Machine>& machines);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_MACHINE_MATCHER_H
