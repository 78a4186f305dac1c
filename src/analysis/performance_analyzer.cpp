#include "analysis/performance_analyzer.h"
#include <algorithm>

namespace queueforge {

double PerformanceMetrics::average_utilization() const {
    if (machine_utilization.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& m : machine_utilization) sum += m.utilization;
    return sum / static_cast<double>(machine_utilization.size());
}

double PerformanceAnalyzer::busy_minutes(const Schedule& schedule, const std::string& machine_id) {
    double total = 0.0;
    for (const auto& entry : schedule) {
        if (!entry.unassignable && entry.assigned_machine == machine_id) {
            total += entry.processing_minutes();
        }
    }
    return total;
}

double PerformanceAnalyzer::span_hours(const Schedule& schedule, TimePoint now) {
    TimePoint last = now;
    for (const auto& entry : schedule) {
        if (entry.unassignable) continue;
        last = std::max(last, entry.scheduled_end);
    }
    return minutes_between(now, last) / 60.0;
}

PerformanceMetrics PerformanceAnalyzer::analyze(const Schedule& schedule,
                                                const std::vector<Machine>& machines,
                                                TimePoint now) {
    PerformanceMetrics metrics;
    if (schedule.empty()) return metrics;

    const double job_count = static_cast<double>(schedule.size());

    double total_minutes = 0.0;
    double tardy_minutes = 0.0;
    int on_time = 0;
    for (const auto& entry : schedule) {
        total_minutes += entry.processing_minutes();
        // Holding-lane times are not a delivery; such a job is never on time
        if (entry.unassignable) continue;
        if (entry.is_late()) {
            tardy_minutes += minutes_between(entry.job.due_date, entry.scheduled_end);
        } else {
            ++on_time;
        }
    }

    metrics.total_makespan = total_minutes / 60.0;
    metrics.schedule_span = span_hours(schedule, now);
    metrics.average_wait_time = metrics.total_makespan * 0.2 / job_count;
    metrics.on_time_delivery_rate = on_time * 100.0 / job_count;
    metrics.total_tardiness = tardy_minutes / 60.0;
    metrics.throughput_rate =
        metrics.total_makespan > 0 ? job_count / (metrics.total_makespan / 24.0) : 0.0;
    metrics.average_flow_time = metrics.total_makespan / job_count;

    const double horizon = metrics.schedule_span * 60.0;
    for (const auto& machine : machines) {
        double utilization = 0.0;
        if (machine.is_available() && horizon > 0) {
            utilization = std::clamp(busy_minutes(schedule, machine.id) / horizon * 100.0, 0.0, 100.0);
        }
        metrics.machine_utilization.push_back({machine.id, utilization});
    }

    return metrics;
}

}  // namespace queueforge
