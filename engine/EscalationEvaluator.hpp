#pragma once

#include "core/Config.hpp"
#include "engine/CrisisTypes.hpp"
#include <string>
#include <vector>

namespace crisisguard {

// Urgency and escalation decisions. Nothing is cached: every call recomputes
// from the history it is handed.
class EscalationEvaluator {
public:
    EscalationEvaluator(const CrisisThresholds& thresholds,
                        const EscalationSettings& settings,
                        Language language = Language::ARABIC);

    Urgency AssessUrgency(int crisis_level, CrisisType crisis_type,
                          const ContextSignals& context) const;

    // `history` is the session's event list, oldest first.
    EscalationAssessment Evaluate(const std::vector<CrisisEvent>& history,
                                  int current_crisis_level) const;

    EscalationTier DetermineTier(const EscalationCriteria& criteria,
                                 bool escalation_needed,
                                 int current_crisis_level) const;

    std::string RecommendedAction(const EscalationCriteria& criteria) const;

    // Operator-facing guidance attached to a verdict. HIGH (fallback) gets the
    // immediate tier.
    std::vector<std::string> SafetyRecommendations(Urgency urgency) const;

    Language GetLanguage() const { return language_; }

private:
    CrisisThresholds thresholds_;
    EscalationSettings settings_;
    Language language_;

    static constexpr int kEscalatedUrgentLevel = 6;
};

} // namespace crisisguard
