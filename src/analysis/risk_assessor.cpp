#include "analysis/risk_assessor.h"
#include <algorithm>
#include <functional>
#include <string>

namespace queueforge {

namespace {

struct RiskRule {
    std::function<bool(const RiskInputs&)> applies;
    std::string message;
};

const std::vector<RiskRule>& risk_factor_rules() {
    static const std::vector<RiskRule> rules = {
        {[](const RiskInputs& r) { return r.urgent_jobs > 2; },
         "High number of urgent jobs in queue"},
        {[](const RiskInputs& r) { return r.job_count > 10; },
         "Large job queue may cause delays"},
        {[](const RiskInputs& r) { return r.available_machines < 2; },
         "Limited machine availability"},
        {[](const RiskInputs& r) { return r.available_operators < 3; },
         "Insufficient operator coverage"},
        {[](const RiskInputs& r) { return r.unassignable_jobs > 0; },
         "Jobs without a compatible machine"},
    };
    return rules;
}

const std::vector<RiskRule>& contingency_rules() {
    static const std::vector<RiskRule> rules = {
        {[](const RiskInputs& r) { return r.available_machines >= 2; },
         "Activate backup machines if primary machines fail"},
        {[](const RiskInputs& r) { return r.available_machines < 2; },
         "Line up subcontract cutting capacity in case the only machine fails"},
        {[](const RiskInputs& r) { return r.urgent_jobs > 0; },
         "Implement overtime shifts for critical jobs"},
        {[](const RiskInputs& r) { return r.high_value_customers; },
         "Prioritize high-value customers for resource allocation"},
        {[](const RiskInputs& r) { return r.material_shortage; },
         "Maintain emergency material inventory"},
        {[](const RiskInputs& r) { return r.unassignable_jobs > 0; },
         "Review machine capabilities for unassignable jobs"},
    };
    return rules;
}

std::vector<std::string> apply(const std::vector<RiskRule>& rules, const RiskInputs& inputs) {
    std::vector<std::string> out;
    for (const auto& rule : rules) {
        if (rule.applies(inputs)) out.push_back(rule.message);
    }
    return out;
}

}  // namespace

RiskInputs RiskAssessor::gather(const InputBundle& bundle, const Schedule& schedule) {
    RiskInputs r;
    r.job_count = static_cast<int>(bundle.job_queue.size());
    for (const auto& job : bundle.job_queue) {
        if (job.priority == PriorityTier::Urgent || job.priority == PriorityTier::Critical) {
            ++r.urgent_jobs;
        }
        if (job.customer_importance != CustomerTier::Standard) {
            r.high_value_customers = true;
        }
    }
    r.available_machines = static_cast<int>(
        std::count_if(bundle.machines.begin(), bundle.machines.end(),
                      [](const Machine& m) { return m.is_available(); }));
    r.available_operators = bundle.resource_constraints.available_operators;
    r.unassignable_jobs = static_cast<int>(std::count_if(
        schedule.begin(), schedule.end(), [](const ScheduledJob& s) { return s.unassignable; }));
    const auto& stock = bundle.resource_constraints.material_availability;
    r.material_shortage = std::any_of(stock.begin(), stock.end(), [](const MaterialStock& m) {
        return m.available_quantity < 100;
    });
    return r;
}

RiskLevel RiskAssessor::classify(int urgent_jobs, int job_count, int available_machines) {
    RiskLevel level = RiskLevel::Low;
    if (urgent_jobs > 2 || job_count > 8) level = RiskLevel::Medium;
    if (urgent_jobs > 3 || job_count > 12 || available_machines < 2) level = RiskLevel::High;
    if (urgent_jobs > 5 || job_count > 15 || available_machines < 1) level = RiskLevel::Critical;
    return level;
}

RiskAssessment RiskAssessor::assess(const InputBundle& bundle, const Schedule& schedule) {
    return assess(gather(bundle, schedule), bundle.job_queue);
}

RiskAssessment RiskAssessor::assess(const RiskInputs& inputs, const std::vector<Job>& queue) {
    RiskAssessment risk;
    risk.schedule_risk = classify(inputs.urgent_jobs, inputs.job_count, inputs.available_machines);
    risk.risk_factors = apply(risk_factor_rules(), inputs);
    risk.contingency_plans = apply(contingency_rules(), inputs);
    risk.buffer_adequacy = std::max(60.0, 100.0 - inputs.job_count * 3.0);

    // Only the head of the incoming queue is reviewed individually
    for (size_t i = 0; i < queue.size() && i < 3; ++i) {
        const Job& job = queue[i];
        DeliveryRisk d;
        d.job_id = job.id;
        if (job.priority == PriorityTier::Critical) {
            d.risk_level = RiskLevel::High;
            d.mitigation = "Dedicated machine assignment";
        } else {
            d.risk_level = job.priority == PriorityTier::Urgent ? RiskLevel::Medium : RiskLevel::Low;
            d.mitigation = "Standard monitoring";
        }
        risk.delivery_risk.push_back(std::move(d));
    }
    return risk;
}

}  // namespace queueforge
