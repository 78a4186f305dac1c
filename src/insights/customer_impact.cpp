#include "insights/customer_impact.h"
#include "scheduling/priority_scorer.h"
#include <algorithm>
#include <map>

namespace queueforge {

double CustomerImpactAnalyzer::job_satisfaction(const ScheduledJob& entry) {
    if (entry.unassignable) return 3.0;
    if (!entry.is_late()) return 9.0;
    double late_hours = minutes_between(entry.job.due_date, entry.scheduled_end) / 60.0;
    return std::clamp(7.0 - late_hours / 12.0, 1.0, 10.0);
}

CustomerImpact CustomerImpactAnalyzer::analyze(const Schedule& schedule) {
    struct Tally {
        int jobs = 0;
        int on_time = 0;
        double satisfaction = 0.0;
    };
    std::map<CustomerTier, Tally> by_tier;

    CustomerImpact impact;
    double weighted = 0.0;
    double weights = 0.0;
    for (const auto& entry : schedule) {
        double s = job_satisfaction(entry);
        double w = PriorityScorer::customer_weight(entry.job.customer_importance);
        weighted += s * w;
        weights += w;

        auto& tally = by_tier[entry.job.customer_importance];
        ++tally.jobs;
        if (!entry.unassignable && !entry.is_late()) ++tally.on_time;
        tally.satisfaction += s;

        CustomerNotification note;
        note.job_id = entry.job.id;
        if (entry.unassignable) {
            note.customer_notification = "Capability review required before confirmation";
            note.timing = "Immediately";
        } else if (entry.is_late()) {
            note.customer_notification = "Delay notice with revised delivery estimate";
            note.timing = "Immediately";
        } else {
            note.customer_notification = "Scheduled confirmation with delivery estimate";
            note.timing = "24 hours before start";
        }
        impact.communication_plan.push_back(std::move(note));
    }

    impact.customer_satisfaction_score = weights > 0 ? weighted / weights : 0.0;

    // Highest tier first
    for (auto tier : {CustomerTier::Vip, CustomerTier::Preferred, CustomerTier::Standard}) {
        auto it = by_tier.find(tier);
        if (it == by_tier.end()) continue;
        const Tally& t = it->second;
        impact.delivery_performance.push_back(
            {to_string(tier), t.on_time * 100.0 / t.jobs, t.satisfaction / t.jobs});
    }
    return impact;
}

}  // namespace queueforge
