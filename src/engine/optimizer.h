#pragma once
#ifndef QUEUEFORGE_OPTIMIZER_H
#define QUEUEFORGE_OPTIMIZER_H

#include "config/config.h"
#include "model/result.h"
#include "scheduling/schedule_builder.h"

namespace queueforge {

// One input bundle in, one result bundle out. Holds no state between calls,
// so distinct bundles may be optimized concurrently from separate instances
// or the same one.
class JobQueueOptimizer {
public:
    // Both throw std::invalid_argument when the buffer settings are non-finite
    // or beyond kMaxMinBufferMinutes / kMaxBufferRatio.
    explicit JobQueueOptimizer(const Config& config);
    explicit JobQueueOptimizer(BuildOptions options);

    // Throws ValidationError when validate_inputs() rejects the bundle.
    OptimizationResult optimize(const InputBundle& bundle, TimePoint now) const;

    const BuildOptions& options() const { return options_; }

private:
    BuildOptions options_;
};

BuildOptions build_options_from(const Config& config);

}  // namespace queueforge

#endif  // QUEUEFORGE_OPTIMIZER_H
