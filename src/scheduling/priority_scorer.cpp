#include "scheduling/priority_scorer.h"

namespace queueforge {

double PriorityScorer::tier_weight(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::Critical: return 10.0;
        case PriorityTier::Urgent: return 8.0;
        case PriorityTier::High: return 6.0;
        case PriorityTier::Normal: return 4.0;
        case PriorityTier::Low: return 2.0;
    }
    return 4.0;
}

double PriorityScorer::customer_weight(CustomerTier tier) {
    switch (tier) {
        case CustomerTier::Vip: return 1.5;
        case CustomerTier::Preferred: return 1.2;
        case CustomerTier::Standard: return 1.0;
    }
    return 1.0;
}

double PriorityScorer::due_date_urgency(TimePoint due_date, TimePoint now) {
    double hours = minutes_between(now, due_date) / 60.0;
    if (hours < 24) return 10.0;
    if (hours < 48) return 8.0;
    if (hours < 72) return 6.0;
    if (hours < 168) return 4.0;
    return 2.0;
}

double PriorityScorer::score(const Job& job, const OptimizationGoals& goals, TimePoint now) {
    return tier_weight(job.priority) * goals.urgency_weight +
           customer_weight(job.customer_importance) * goals.customer_satisfaction_weight +
           due_date_urgency(job.due_date, now) * 5.0 +
           (job.profit_margin / 100.0) * goals.profitability_weight * 10.0;
}

}  // namespace queueforge
