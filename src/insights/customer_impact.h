#pragma once
#ifndef QUEUEFORGE_CUSTOMER_IMPACT_H
#define QUEUEFORGE_CUSTOMER_IMPACT_H

#include "model/result.h"

namespace queueforge {

class CustomerImpactAnalyzer {
public:
    // 1-10 per job: 9 when on time, dropping with tardiness, 3 when unassignable
    static double job_satisfaction(const ScheduledJob& entry);

    // Tier-weighted (vip 1.5, preferred 1.2, standard 1.0) mean of job_satisfaction
    static CustomerImpact analyze(const Schedule& schedule);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_CUSTOMER_IMPACT_H
