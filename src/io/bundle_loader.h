#pragma once
#ifndef QUEUEFORGE_BUNDLE_LOADER_H
#define QUEUEFORGE_BUNDLE_LOADER_H

#include <istream>
#include <stdexcept>
#include <string>
#include "model/types.h"

namespace queueforge {

class BundleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads the JSON input bundle: jobQueue, machineCapabilities,
// operationalConstraints, optimizationGoals, resourceConstraints,
// qualityRequirements. Only jobQueue[].jobId, jobQueue[].dueDate and
// machineCapabilities[].machineId are mandatory; everything else defaults.
// Throws BundleError on unreadable files, malformed JSON or mistyped fields.
InputBundle load_bundle(const std::string& path);
InputBundle parse_bundle(std::istream& in);

}  // namespace queueforge

#endif  // QUEUEFORGE_BUNDLE_LOADER_H
