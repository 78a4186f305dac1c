#pragma once
#ifndef QUEUEFORGE_PERFORMANCE_ANALYZER_H
#define QUEUEFORGE_PERFORMANCE_ANALYZER_H

#include <vector>
#include "model/result.h"

namespace queueforge {

class PerformanceAnalyzer {
public:
    static PerformanceMetrics analyze(const Schedule& schedule,
                                      const std::vector<Machine>& machines, TimePoint now);

    // Busy minutes (setup + processing) booked on one machine
    static double busy_minutes(const Schedule& schedule, const std::string& machine_id);

    // Hours from now until the last machine-assigned job completes
    static double span_hours(const Schedule& schedule, TimePoint now);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_PERFORMANCE_ANALYZER_H
