#include "engine/CrisisTypes.hpp"
#include <algorithm>

namespace crisisguard {

bool PatternAnalysis::HasHighRiskPattern(RiskPattern pattern) const {
    return std::find(high_risk_patterns.begin(), high_risk_patterns.end(), pattern)
        != high_risk_patterns.end();
}

std::string RiskCategoryToString(RiskCategory category) {
    switch (category) {
        case RiskCategory::SUICIDE:         return "suicide";
        case RiskCategory::SELF_HARM:       return "self_harm";
        case RiskCategory::HOPELESSNESS:    return "hopelessness";
        case RiskCategory::ISOLATION:       return "isolation";
        case RiskCategory::SUBSTANCE_ABUSE: return "substance_abuse";
        case RiskCategory::VIOLENCE:        return "violence";
        case RiskCategory::PSYCHOSIS:       return "psychosis";
        default:                            return "unknown";
    }
}

std::optional<RiskCategory> RiskCategoryFromString(const std::string& name) {
    for (RiskCategory category : kAllRiskCategories) {
        if (RiskCategoryToString(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

std::string RiskPatternToString(RiskPattern pattern) {
    switch (pattern) {
        case RiskPattern::FINALITY_STATEMENT:   return "finality_statement";
        case RiskPattern::GOODBYE_MESSAGE:      return "goodbye_message";
        case RiskPattern::EXTREME_LANGUAGE:     return "extreme_language";
        case RiskPattern::WORTHLESSNESS:        return "worthlessness";
        case RiskPattern::BURDEN_STATEMENT:     return "burden_statement";
        case RiskPattern::ISOLATION_EXPRESSION: return "isolation_expression";
        default:                                return "unknown";
    }
}

std::optional<RiskPattern> RiskPatternFromString(const std::string& name) {
    for (RiskPattern pattern : kAllRiskPatterns) {
        if (RiskPatternToString(pattern) == name) {
            return pattern;
        }
    }
    return std::nullopt;
}

std::string CrisisTypeToString(CrisisType type) {
    switch (type) {
        case CrisisType::SUICIDE_RISK:            return "suicide_risk";
        case CrisisType::SELF_HARM_RISK:          return "self_harm_risk";
        case CrisisType::VIOLENCE_RISK:           return "violence_risk";
        case CrisisType::MENTAL_HEALTH_EMERGENCY: return "mental_health_emergency";
        case CrisisType::SUBSTANCE_ABUSE:         return "substance_abuse";
        case CrisisType::SEVERE_DEPRESSION:       return "severe_depression";
        case CrisisType::SOCIAL_CRISIS:           return "social_crisis";
        case CrisisType::EMOTIONAL_DISTRESS:      return "emotional_distress";
        case CrisisType::UNKNOWN:                 return "unknown";
        default:                                  return "unknown";
    }
}

std::optional<CrisisType> CrisisTypeFromString(const std::string& name) {
    if (name == "suicide_risk") return CrisisType::SUICIDE_RISK;
    if (name == "self_harm_risk") return CrisisType::SELF_HARM_RISK;
    if (name == "violence_risk") return CrisisType::VIOLENCE_RISK;
    if (name == "mental_health_emergency") return CrisisType::MENTAL_HEALTH_EMERGENCY;
    if (name == "substance_abuse") return CrisisType::SUBSTANCE_ABUSE;
    if (name == "severe_depression") return CrisisType::SEVERE_DEPRESSION;
    if (name == "social_crisis") return CrisisType::SOCIAL_CRISIS;
    if (name == "emotional_distress") return CrisisType::EMOTIONAL_DISTRESS;
    if (name == "unknown") return CrisisType::UNKNOWN;
    return std::nullopt;
}

std::string UrgencyToString(Urgency urgency) {
    switch (urgency) {
        case Urgency::NONE:      return "none";
        case Urgency::LOW:       return "low";
        case Urgency::MODERATE:  return "moderate";
        case Urgency::URGENT:    return "urgent";
        case Urgency::IMMEDIATE: return "immediate";
        case Urgency::HIGH:      return "high";
        default:                 return "none";
    }
}

std::string EscalationTierToString(EscalationTier tier) {
    switch (tier) {
        case EscalationTier::NONE:     return "none";
        case EscalationTier::LOW:      return "low";
        case EscalationTier::MEDIUM:   return "medium";
        case EscalationTier::HIGH:     return "high";
        case EscalationTier::CRITICAL: return "critical";
        default:                       return "none";
    }
}

std::string LanguageToString(Language language) {
    return language == Language::ENGLISH ? "en" : "ar";
}

std::optional<Language> LanguageFromString(const std::string& name) {
    if (name == "ar" || name == "arabic") return Language::ARABIC;
    if (name == "en" || name == "english") return Language::ENGLISH;
    return std::nullopt;
}

} // namespace crisisguard
