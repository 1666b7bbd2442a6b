#pragma once

#include "engine/CrisisTypes.hpp"
#include "engine/RiskLexicon.hpp"
#include <memory>
#include <string>

namespace crisisguard {

// Lexical matcher over the risk categories. A category contributes
// (number of distinct terms present) * weight; the total is clamped to [0,10].
class CategoryMatcher {
public:
    explicit CategoryMatcher(std::shared_ptr<const RiskLexicon> lexicon);
    virtual ~CategoryMatcher() = default;

    virtual CategoryAnalysis Match(const std::string& text) const;

    static bool IsHighRiskCategory(RiskCategory category);

protected:
    std::shared_ptr<const RiskLexicon> lexicon_;
};

} // namespace crisisguard
