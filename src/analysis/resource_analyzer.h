#pragma once
#ifndef QUEUEFORGE_RESOURCE_ANALYZER_H
#define QUEUEFORGE_RESOURCE_ANALYZER_H

#include "model/result.h"

namespace queueforge {

class ResourceAnalyzer {
public:
    // Needs the performance metrics for per-machine utilization figures.
    static ResourceUtilization analyze(const InputBundle& bundle, const Schedule& schedule,
                                       const PerformanceMetrics& metrics);
};

}  // namespace queueforge

#endif  // QUEUEFORGE_RESOURCE_ANALYZER_H
