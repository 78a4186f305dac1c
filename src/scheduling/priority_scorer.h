#pragma once
#ifndef QUEUEFORGE_PRIORITY_SCORER_H
#define QUEUEFORGE_PRIORITY_SCORER_H

#include "model/types.h"

namespace queueforge {

// Per-job ranking used by the schedule builder. Higher runs first.
// score = tier * urgencyWeight + customer * customerWeight
//       + dueUrgency * 5 + (margin / 100) * profitabilityWeight * 10
// efficiency_weight is not part of the score.
class PriorityScorer {
public:
    static double tier_weight(PriorityTier tier);
    static double customer_weight(CustomerTier tier);

    // Step function over hours remaining until the due date.
    // Already-overdue jobs fall in the most urgent band.
    static double due_date_urgency(TimePoint due_date, TimePoint now);

    static double score(const Job& job, const OptimizationGoals& goals, TimePoint now);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_PRIORITY_SCORER_H
