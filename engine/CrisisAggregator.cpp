#include "engine/CrisisAggregator.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace crisisguard {

CrisisAggregator::CrisisAggregator(const AggregationWeights& weights)
    : weights_(weights) {
}

double CrisisAggregator::ContextBonus(const CategoryAnalysis& categories,
                                      const ContextSignals& context) const {
    double bonus = 0.0;
    if (context.escalation_detected) {
        bonus += weights_.escalation_bonus;
    }
    if (context.emotional_deterioration) {
        bonus += weights_.deterioration_bonus;
    }
    if (context.previous_interventions > weights_.prior_intervention_min) {
        bonus += weights_.prior_intervention_bonus;
    }
    bonus += categories.high_risk_categories.size() * weights_.high_risk_category_bonus;
    return bonus;
}

AggregationResult CrisisAggregator::Aggregate(const CategoryAnalysis& categories,
                                              const PatternAnalysis& patterns,
                                              const ContextSignals& context) const {
    AggregationResult result;
    auto& breakdown = result.breakdown;

    breakdown.category_component = weights_.category_weight * categories.total_severity;
    breakdown.pattern_component = weights_.pattern_weight * patterns.severity;
    breakdown.context_bonus = ContextBonus(categories, context);
    breakdown.raw_score = breakdown.category_component + breakdown.pattern_component +
                          breakdown.context_bonus;

    if (!std::isfinite(breakdown.raw_score)) {
        throw DetectionError("crisis score is not finite");
    }

    // std::lround rounds halves away from zero
    long rounded = std::lround(std::clamp(breakdown.raw_score, 0.0, 10.0));
    result.crisis_level = static_cast<int>(std::clamp(rounded, 0L, 10L));
    return result;
}

CrisisType CrisisAggregator::Classify(const CategoryAnalysis& categories,
                                      const PatternAnalysis& patterns) {
    static const std::pair<RiskCategory, CrisisType> kPriority[] = {
        {RiskCategory::SUICIDE,         CrisisType::SUICIDE_RISK},
        {RiskCategory::SELF_HARM,       CrisisType::SELF_HARM_RISK},
        {RiskCategory::VIOLENCE,        CrisisType::VIOLENCE_RISK},
        {RiskCategory::PSYCHOSIS,       CrisisType::MENTAL_HEALTH_EMERGENCY},
        {RiskCategory::SUBSTANCE_ABUSE, CrisisType::SUBSTANCE_ABUSE},
        {RiskCategory::HOPELESSNESS,    CrisisType::SEVERE_DEPRESSION},
        {RiskCategory::ISOLATION,       CrisisType::SOCIAL_CRISIS},
    };

    for (const auto& [category, type] : kPriority) {
        if (categories.HasCategory(category)) {
            return type;
        }
    }

    if (patterns.HasHighRiskPattern(RiskPattern::FINALITY_STATEMENT) ||
        patterns.HasHighRiskPattern(RiskPattern::GOODBYE_MESSAGE)) {
        return CrisisType::SUICIDE_RISK;
    }

    return CrisisType::EMOTIONAL_DISTRESS;
}

} // namespace crisisguard
