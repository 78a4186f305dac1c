#pragma once
#ifndef QUEUEFORGE_RISK_ASSESSOR_H
#define QUEUEFORGE_RISK_ASSESSOR_H

#include "model/result.h"

namespace queueforge {

// Queue and resource figures the risk rules look at
struct RiskInputs {
    int job_count = 0;
    int urgent_jobs = 0;  // urgent or critical tier
    int available_machines = 0;
    int available_operators = 0;
    int unassignable_jobs = 0;
    bool high_value_customers = false;  // any vip or preferred job
    bool material_shortage = false;
};

class RiskAssessor {
public:
    static RiskInputs gather(const InputBundle& bundle, const Schedule& schedule);

    // low -> medium -> high -> critical; later rungs override earlier ones
    static RiskLevel classify(int urgent_jobs, int job_count, int available_machines);

    static RiskAssessment assess(const InputBundle& bundle, const Schedule& schedule);
    static RiskAssessment assess(const RiskInputs& inputs, const std::vector<Job>& queue);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_RISK_ASSESSOR_H
