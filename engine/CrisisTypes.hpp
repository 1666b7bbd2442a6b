#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace crisisguard {

// Raised inside the detection pipeline; CrisisEngine turns it into the fallback verdict.
class DetectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RiskCategory {
    SUICIDE,
    SELF_HARM,
    HOPELESSNESS,
    ISOLATION,
    SUBSTANCE_ABUSE,
    VIOLENCE,
    PSYCHOSIS
};

inline constexpr std::array<RiskCategory, 7> kAllRiskCategories = {
    RiskCategory::SUICIDE, RiskCategory::SELF_HARM, RiskCategory::HOPELESSNESS,
    RiskCategory::ISOLATION, RiskCategory::SUBSTANCE_ABUSE, RiskCategory::VIOLENCE,
    RiskCategory::PSYCHOSIS
};

enum class RiskPattern {
    FINALITY_STATEMENT,
    GOODBYE_MESSAGE,
    EXTREME_LANGUAGE,
    WORTHLESSNESS,
    BURDEN_STATEMENT,
    ISOLATION_EXPRESSION
};

inline constexpr std::array<RiskPattern, 6> kAllRiskPatterns = {
    RiskPattern::FINALITY_STATEMENT, RiskPattern::GOODBYE_MESSAGE,
    RiskPattern::EXTREME_LANGUAGE, RiskPattern::WORTHLESSNESS,
    RiskPattern::BURDEN_STATEMENT, RiskPattern::ISOLATION_EXPRESSION
};

enum class CrisisType {
    SUICIDE_RISK,
    SELF_HARM_RISK,
    VIOLENCE_RISK,
    MENTAL_HEALTH_EMERGENCY,
    SUBSTANCE_ABUSE,
    SEVERE_DEPRESSION,
    SOCIAL_CRISIS,
    EMOTIONAL_DISTRESS,
    UNKNOWN   // failure fallback only
};

enum class Urgency {
    NONE,
    LOW,
    MODERATE,
    URGENT,
    IMMEDIATE,
    HIGH      // failure fallback only
};

enum class EscalationTier {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class Language {
    ARABIC,
    ENGLISH
};

struct CrisisEvent {
    std::string session_id;
    uint64_t timestamp{0};
    int crisis_level{0};
    CrisisType crisis_type{CrisisType::EMOTIONAL_DISTRESS};
    std::vector<RiskCategory> contributing_categories;
};

struct CategoryMatch {
    std::vector<std::string> matched_terms;
    uint32_t count{0};
    double severity{0.0};
};

struct CategoryAnalysis {
    std::map<RiskCategory, CategoryMatch> matches;   // matched categories only
    double total_severity{0.0};                      // clamped to [0,10]
    std::vector<RiskCategory> high_risk_categories;

    bool HasCategory(RiskCategory category) const { return matches.count(category) > 0; }
};

struct PatternAnalysis {
    std::map<RiskPattern, uint32_t> counts;          // every pattern, zero included
    double severity{0.0};                            // clamped to [0,10]
    std::vector<RiskPattern> high_risk_patterns;

    bool HasHighRiskPattern(RiskPattern pattern) const;
};

struct ContextSignals {
    uint32_t repeated_crisis_themes{0};
    bool escalation_detected{false};
    bool emotional_deterioration{false};
    uint32_t previous_interventions{0};
};

struct SeverityBreakdown {
    double category_component{0.0};
    double pattern_component{0.0};
    double context_bonus{0.0};
    double raw_score{0.0};
    std::optional<int> external_estimate;
};

struct SafetyIndicators {
    CategoryAnalysis categories;
    PatternAnalysis patterns;
    ContextSignals context;
};

struct SafetyVerdict {
    std::string session_id;
    int crisis_level{0};
    CrisisType crisis_type{CrisisType::EMOTIONAL_DISTRESS};
    Urgency urgency{Urgency::NONE};
    SafetyIndicators indicators;
    SeverityBreakdown breakdown;
    std::vector<std::string> recommendations;
    bool requires_intervention{false};
    bool requires_escalation{false};

    // Set only when detection failed and the conservative verdict was returned.
    bool fallback{false};
    std::string error;
};

struct EscalationCriteria {
    bool sustained_high_risk{false};
    bool increasing_severity{false};
    bool failed_interventions{false};
    bool immediate_danger{false};
};

struct EscalationAssessment {
    bool escalation_needed{false};
    EscalationCriteria criteria_met;
    EscalationTier tier{EscalationTier::NONE};
    std::string recommended_action;
    Urgency urgency{Urgency::URGENT};
};

std::string RiskCategoryToString(RiskCategory category);
std::optional<RiskCategory> RiskCategoryFromString(const std::string& name);

std::string RiskPatternToString(RiskPattern pattern);
std::optional<RiskPattern> RiskPatternFromString(const std::string& name);

std::string CrisisTypeToString(CrisisType type);
std::optional<CrisisType> CrisisTypeFromString(const std::string& name);

std::string UrgencyToString(Urgency urgency);
std::string EscalationTierToString(EscalationTier tier);

std::string LanguageToString(Language language);
std::optional<Language> LanguageFromString(const std::string& name);

} // namespace crisisguard
