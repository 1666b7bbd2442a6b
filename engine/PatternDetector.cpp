#include "engine/PatternDetector.hpp"
#include "engine/TextNormalizer.hpp"
#include <algorithm>
#include <stdexcept>

namespace crisisguard {

PatternDetector::PatternDetector(std::shared_ptr<const RiskLexicon> lexicon)
    : lexicon_(std::move(lexicon)) {
    if (!lexicon_) {
        throw std::invalid_argument("PatternDetector requires a lexicon");
    }
}

bool PatternDetector::IsHighRiskPattern(RiskPattern pattern) {
    return pattern == RiskPattern::FINALITY_STATEMENT ||
           pattern == RiskPattern::GOODBYE_MESSAGE ||
           pattern == RiskPattern::BURDEN_STATEMENT;
}

PatternAnalysis PatternDetector::Detect(const std::string& text) const {
    PatternAnalysis analysis;
    const std::string normalized = NormalizeText(text);

    double severity = 0.0;
    for (const auto& rule : lexicon_->Patterns()) {
        uint32_t count = 0;
        if (!normalized.empty()) {
            count = static_cast<uint32_t>(std::count_if(rule.phrases.begin(), rule.phrases.end(),
                [&normalized](const std::string& phrase) {
                    return normalized.find(phrase) != std::string::npos;
                }));
        }

        analysis.counts[rule.pattern] = count;
        severity += count * rule.weight;

        if (count > 0 && IsHighRiskPattern(rule.pattern)) {
            analysis.high_risk_patterns.push_back(rule.pattern);
        }
    }

    analysis.severity = std::clamp(severity, 0.0, 10.0);
    return analysis;
}

} // namespace crisisguard
