#include "engine/EscalationEvaluator.hpp"
#include <algorithm>
#include <initializer_list>

namespace crisisguard {

namespace {

struct Phrase {
    const char* ar;
    const char* en;
};

const char* Pick(const Phrase& phrase, Language language) {
    return language == Language::ENGLISH ? phrase.en : phrase.ar;
}

std::vector<std::string> PickAll(std::initializer_list<Phrase> phrases, Language language) {
    std::vector<std::string> out;
    out.reserve(phrases.size());
    for (const auto& phrase : phrases) {
        out.emplace_back(Pick(phrase, language));
    }
    return out;
}

bool IsLifeThreateningType(CrisisType type) {
    return type == CrisisType::SUICIDE_RISK ||
           type == CrisisType::VIOLENCE_RISK ||
           type == CrisisType::MENTAL_HEALTH_EMERGENCY;
}

} // namespace

EscalationEvaluator::EscalationEvaluator(const CrisisThresholds& thresholds,
                                         const EscalationSettings& settings,
                                         Language language)
    : thresholds_(thresholds), settings_(settings), language_(language) {
}

Urgency EscalationEvaluator::AssessUrgency(int crisis_level, CrisisType crisis_type,
                                           const ContextSignals& context) const {
    if (crisis_level >= thresholds_.critical) {
        return Urgency::IMMEDIATE;
    }

    if (IsLifeThreateningType(crisis_type)) {
        if (crisis_level >= thresholds_.high) {
            return Urgency::IMMEDIATE;
        }
        if (crisis_level >= thresholds_.medium) {
            return Urgency::URGENT;
        }
    }

    if (context.escalation_detected && crisis_level >= kEscalatedUrgentLevel) {
        return Urgency::URGENT;
    }

    if (crisis_level >= thresholds_.high) return Urgency::URGENT;
    if (crisis_level >= thresholds_.medium) return Urgency::MODERATE;
    if (crisis_level >= thresholds_.low) return Urgency::LOW;
    return Urgency::NONE;
}

EscalationAssessment EscalationEvaluator::Evaluate(const std::vector<CrisisEvent>& history,
                                                   int current_crisis_level) const {
    EscalationAssessment assessment;
    auto& criteria = assessment.criteria_met;

    size_t sustained_window = std::min(settings_.sustained_window, history.size());
    size_t high_risk = static_cast<size_t>(std::count_if(
        history.end() - static_cast<std::ptrdiff_t>(sustained_window), history.end(),
        [this](const CrisisEvent& event) { return event.crisis_level >= thresholds_.high; }));
    criteria.sustained_high_risk = high_risk >= settings_.sustained_min_count;

    if (settings_.trend_window >= 2 && history.size() >= settings_.trend_window) {
        auto first = history.end() - static_cast<std::ptrdiff_t>(settings_.trend_window);
        bool strictly_increasing = true;
        int sum = first->crisis_level;
        for (auto it = first + 1; it != history.end(); ++it) {
            if (it->crisis_level <= (it - 1)->crisis_level) {
                strictly_increasing = false;
            }
            sum += it->crisis_level;
        }
        criteria.increasing_severity = strictly_increasing && sum > settings_.trend_sum_threshold;
    }

    criteria.immediate_danger = current_crisis_level >= thresholds_.critical;
    criteria.failed_interventions = history.size() > settings_.failed_intervention_min_events;

    assessment.escalation_needed =
        criteria.immediate_danger ||
        (criteria.sustained_high_risk && criteria.increasing_severity) ||
        (criteria.failed_interventions && current_crisis_level >= thresholds_.high);

    assessment.tier = DetermineTier(criteria, assessment.escalation_needed, current_crisis_level);
    assessment.recommended_action = RecommendedAction(criteria);
    assessment.urgency = criteria.immediate_danger ? Urgency::IMMEDIATE : Urgency::URGENT;
    return assessment;
}

EscalationTier EscalationEvaluator::DetermineTier(const EscalationCriteria& criteria,
                                                  bool escalation_needed,
                                                  int current_crisis_level) const {
    if (criteria.immediate_danger) return EscalationTier::CRITICAL;
    if (escalation_needed) return EscalationTier::HIGH;
    if (criteria.sustained_high_risk || criteria.increasing_severity) return EscalationTier::MEDIUM;
    if (criteria.failed_interventions || current_crisis_level >= thresholds_.medium) {
        return EscalationTier::LOW;
    }
    return EscalationTier::NONE;
}

std::string EscalationEvaluator::RecommendedAction(const EscalationCriteria& criteria) const {
    if (criteria.immediate_danger) {
        return Pick({"تدخل طوارئ فوري - اتصل بـ 999",
                     "Immediate emergency intervention - call 999"}, language_);
    }
    if (criteria.sustained_high_risk) {
        return Pick({"تحويل عاجل لطبيب نفسي متخصص",
                     "Urgent referral to a psychiatrist"}, language_);
    }
    if (criteria.increasing_severity) {
        return Pick({"تقييم نفسي شامل مطلوب",
                     "Comprehensive psychological assessment required"}, language_);
    }
    if (criteria.failed_interventions) {
        return Pick({"إشراف طبي مباشر مطلوب",
                     "Direct clinical supervision required"}, language_);
    }
    return Pick({"مواصلة المراقبة والدعم", "Continue monitoring and support"}, language_);
}

std::vector<std::string> EscalationEvaluator::SafetyRecommendations(Urgency urgency) const {
    switch (urgency) {
        case Urgency::IMMEDIATE:
        case Urgency::HIGH:
            return PickAll({
                {"تدخل فوري مطلوب", "Immediate intervention required"},
                {"تحويل للطوارئ النفسية", "Refer to psychiatric emergency services"},
                {"عدم ترك المستخدم وحيداً", "Do not leave the user alone"},
                {"تفعيل بروتوكول الطوارئ", "Activate the emergency protocol"},
            }, language_);
        case Urgency::URGENT:
            return PickAll({
                {"مراقبة مستمرة مطلوبة", "Continuous monitoring required"},
                {"تحويل لمختص في أقرب وقت", "Refer to a specialist as soon as possible"},
                {"إشراك الأسرة إذا أمكن", "Involve family if possible"},
                {"متابعة خلال 24 ساعة", "Follow up within 24 hours"},
            }, language_);
        case Urgency::MODERATE:
            return PickAll({
                {"تقييم دوري للحالة", "Reassess the situation periodically"},
                {"تعزيز شبكة الدعم", "Strengthen the support network"},
                {"جدولة متابعة خلال أسبوع", "Schedule a follow-up within a week"},
                {"توفير موارد المساعدة الذاتية", "Provide self-help resources"},
            }, language_);
        default:
            return PickAll({
                {"مواصلة الدعم العاطفي", "Continue emotional support"},
                {"مراقبة التطور", "Monitor progress"},
                {"تعزيز آليات التأقلم الصحية", "Encourage healthy coping mechanisms"},
            }, language_);
    }
}

} // namespace crisisguard
