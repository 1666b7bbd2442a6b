#pragma once

#include <optional>
#include <string>

namespace crisisguard {

// Optional second opinion on a message (for example a hosted language model).
// Runs on CrisisEngine's worker pool under a timeout and may only raise the
// locally computed level. Implementations may block and may throw.
class TextAnalysisService {
public:
    virtual ~TextAnalysisService() = default;

    // Crisis level estimate in [0,10], or std::nullopt when the service has no opinion.
    virtual std::optional<int> EstimateCrisisLevel(const std::string& message) = 0;
};

} // namespace crisisguard
