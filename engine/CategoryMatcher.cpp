#include "engine/CategoryMatcher.hpp"
#include "engine/TextNormalizer.hpp"
#include <algorithm>
#include <stdexcept>

namespace crisisguard {

CategoryMatcher::CategoryMatcher(std::shared_ptr<const RiskLexicon> lexicon)
    : lexicon_(std::move(lexicon)) {
    if (!lexicon_) {
        throw std::invalid_argument("CategoryMatcher requires a lexicon");
    }
}

bool CategoryMatcher::IsHighRiskCategory(RiskCategory category) {
    return category == RiskCategory::SUICIDE ||
           category == RiskCategory::SELF_HARM ||
           category == RiskCategory::VIOLENCE;
}

CategoryAnalysis CategoryMatcher::Match(const std::string& text) const {
    CategoryAnalysis analysis;
    const std::string normalized = NormalizeText(text);
    if (normalized.empty()) {
        return analysis;
    }

    double total = 0.0;
    for (const auto& rule : lexicon_->Categories()) {
        CategoryMatch match;
        for (const auto& term : rule.terms) {
            if (normalized.find(term) != std::string::npos) {
                match.matched_terms.push_back(term);
            }
        }

        if (match.matched_terms.empty()) {
            continue;
        }

        match.count = static_cast<uint32_t>(match.matched_terms.size());
        match.severity = match.count * rule.weight;
        total += match.severity;

        if (IsHighRiskCategory(rule.category)) {
            analysis.high_risk_categories.push_back(rule.category);
        }
        analysis.matches.emplace(rule.category, std::move(match));
    }

    analysis.total_severity = std::clamp(total, 0.0, 10.0);
    return analysis;
}

} // namespace crisisguard
