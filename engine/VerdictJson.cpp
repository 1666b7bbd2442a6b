#include "engine/VerdictJson.hpp"

namespace crisisguard {

nlohmann::json CategoriesToJson(const std::vector<RiskCategory>& categories) {
    nlohmann::json j = nlohmann::json::array();
    for (RiskCategory category : categories) {
        j.push_back(RiskCategoryToString(category));
    }
    return j;
}

std::vector<RiskCategory> CategoriesFromJson(const nlohmann::json& j) {
    std::vector<RiskCategory> categories;
    if (!j.is_array()) {
        return categories;
    }
    for (const auto& item : j) {
        if (!item.is_string()) continue;
        if (auto category = RiskCategoryFromString(item.get<std::string>())) {
            categories.push_back(*category);
        }
    }
    return categories;
}

nlohmann::json VerdictToJson(const SafetyVerdict& verdict) {
    nlohmann::json j;
    j["session_id"] = verdict.session_id;
    j["crisis_level"] = verdict.crisis_level;
    j["crisis_type"] = CrisisTypeToString(verdict.crisis_type);
    j["urgency"] = UrgencyToString(verdict.urgency);

    nlohmann::json matches = nlohmann::json::object();
    for (const auto& [category, match] : verdict.indicators.categories.matches) {
        matches[RiskCategoryToString(category)] = {
            {"matches", match.matched_terms},
            {"count", match.count},
            {"severity", match.severity}
        };
    }

    nlohmann::json patterns = nlohmann::json::object();
    for (const auto& [pattern, count] : verdict.indicators.patterns.counts) {
        patterns[RiskPatternToString(pattern)] = count;
    }
    nlohmann::json high_risk_patterns = nlohmann::json::array();
    for (RiskPattern pattern : verdict.indicators.patterns.high_risk_patterns) {
        high_risk_patterns.push_back(RiskPatternToString(pattern));
    }

    const auto& context = verdict.indicators.context;
    j["indicators"] = {
        {"categories", {
            {"matches", matches},
            {"total_severity", verdict.indicators.categories.total_severity},
            {"high_risk_categories", CategoriesToJson(verdict.indicators.categories.high_risk_categories)}
        }},
        {"patterns", {
            {"patterns", patterns},
            {"severity", verdict.indicators.patterns.severity},
            {"high_risk_patterns", high_risk_patterns}
        }},
        {"context", {
            {"repeated_crisis_themes", context.repeated_crisis_themes},
            {"escalation_detected", context.escalation_detected},
            {"emotional_deterioration", context.emotional_deterioration},
            {"previous_interventions", context.previous_interventions}
        }}
    };

    nlohmann::json breakdown = {
        {"category_component", verdict.breakdown.category_component},
        {"pattern_component", verdict.breakdown.pattern_component},
        {"context_bonus", verdict.breakdown.context_bonus},
        {"raw_score", verdict.breakdown.raw_score}
    };
    if (verdict.breakdown.external_estimate) {
        breakdown["external_estimate"] = *verdict.breakdown.external_estimate;
    } else {
        breakdown["external_estimate"] = nullptr;
    }
    j["breakdown"] = breakdown;

    j["recommendations"] = verdict.recommendations;
    j["requires_intervention"] = verdict.requires_intervention;
    j["requires_escalation"] = verdict.requires_escalation;
    j["fallback"] = verdict.fallback;
    if (verdict.fallback) {
        j["error"] = verdict.error;
    }
    return j;
}

nlohmann::json AssessmentToJson(const EscalationAssessment& assessment) {
    return {
        {"escalation_needed", assessment.escalation_needed},
        {"criteria_met", {
            {"sustained_high_risk", assessment.criteria_met.sustained_high_risk},
            {"increasing_severity", assessment.criteria_met.increasing_severity},
            {"failed_interventions", assessment.criteria_met.failed_interventions},
            {"immediate_danger", assessment.criteria_met.immediate_danger}
        }},
        {"tier", EscalationTierToString(assessment.tier)},
        {"recommended_action", assessment.recommended_action},
        {"urgency", UrgencyToString(assessment.urgency)}
    };
}

nlohmann::json HealthToJson(const EngineHealth& health) {
    return {
        {"status", health.status},
        {"crisis_categories_loaded", health.categories_loaded},
        {"crisis_patterns_loaded", health.patterns_loaded},
        {"triggers_loaded", health.triggers_loaded},
        {"active_session_tracking", health.active_sessions},
        {"crisis_thresholds", {
            {"low", health.thresholds.low},
            {"medium", health.thresholds.medium},
            {"high", health.thresholds.high},
            {"critical", health.thresholds.critical}
        }},
        {"external_analyzer", {
            {"enabled", health.external_analyzer_enabled},
            {"queued", health.external_analyzer_queue}
        }},
        {"analyses_total", health.analyses_total},
        {"fallback_total", health.fallback_total}
    };
}

nlohmann::json CrisisEventToJson(const CrisisEvent& event) {
    return {
        {"session_id", event.session_id},
        {"timestamp", event.timestamp},
        {"crisis_level", event.crisis_level},
        {"crisis_type", CrisisTypeToString(event.crisis_type)},
        {"contributing_categories", CategoriesToJson(event.contributing_categories)}
    };
}

} // namespace crisisguard
