#pragma once

#include "engine/CrisisTypes.hpp"
#include "engine/RiskLexicon.hpp"
#include <memory>
#include <string>

namespace crisisguard {

class PatternDetector {
public:
    explicit PatternDetector(std::shared_ptr<const RiskLexicon> lexicon);
    virtual ~PatternDetector() = default;

    // Every pattern appears in the result, zero counts included.
    virtual PatternAnalysis Detect(const std::string& text) const;

    static bool IsHighRiskPattern(RiskPattern pattern);

protected:
    std::shared_ptr<const RiskLexicon> lexicon_;
};

} // namespace crisisguard
