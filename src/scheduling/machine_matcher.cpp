#include "scheduling/machine_matcher.h"
#include <stdexcept>

namespace queueforge {

namespace {

void require_machines(const std::vector<Machine>& machines) {
    if (machines.empty()) {
        throw std::invalid_argument("no machines available");
    }
}

}  // namespace

bool MachineMatcher::is_eligible(const Job& job, const Machine& machine) {
    return machine.is_available() && machine.handles_material(job.material_type) &&
           machine.thickness_range.contains(job.thickness);
}

std::vector<size_t> MachineMatcher::eligible_machines(const Job& job,
                                                      const std::vector<Machine>& machines) {
    require_machines(machines);
    std::vector<size_t> result;
    for (size_t i = 0; i < machines.size(); ++i) {
        if (is_eligible(job, machines[i])) {
            result.push_back(i);
        }
    }
    return result;
}

const Machine* MachineMatcher::match(const Job& job, const std::vector<Machine>& machines) {
    require_machines(machines);
    for (const auto& machine : machines) {
        if (is_eligible(job, machine)) {
            return &machine;
        }
    }
    return nullptr;
}

}  // namespace queueforge
