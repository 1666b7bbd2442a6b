#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crisisguard {

struct CrisisThresholds {
    int low = 3;
    int medium = 5;
    int high = 7;
    int critical = 9;
};

// crisis_level = round(category_weight * category_severity
//                    + pattern_weight * pattern_severity + context bonus)
struct AggregationWeights {
    double category_weight = 0.5;
    double pattern_weight = 0.3;
    double escalation_bonus = 2.0;
    double deterioration_bonus = 1.0;
    double prior_intervention_bonus = 1.0;
    uint32_t prior_intervention_min = 1;     // bonus applies when previous_interventions > this
    double high_risk_category_bonus = 1.5;   // per high-risk category
};

struct SessionSettings {
    size_t max_events = 10;
    size_t context_window = 3;
    size_t emotion_window = 5;
    size_t emotion_history_cap = 20;
    uint32_t repeated_theme_threshold = 2;   // escalation_detected when themes > this
    size_t deterioration_min_negative = 3;
    std::vector<std::string> negative_emotions{
        "sad", "anxious", "hopeless", "angry",
        "حزين", "قلق", "يائس", "غاضب"
    };
};

struct EscalationSettings {
    size_t sustained_window = 5;
    size_t sustained_min_count = 3;
    size_t trend_window = 3;
    int trend_sum_threshold = 18;
    size_t failed_intervention_min_events = 2;   // failed_interventions when events > this
};

struct ExternalAnalyzerSettings {
    bool enabled = false;
    uint32_t timeout_ms = 2000;
    size_t worker_threads = 1;
    size_t max_pending = 16;
};

struct EngineConfig {
    CrisisThresholds thresholds;
    AggregationWeights weights;
    SessionSettings session;
    EscalationSettings escalation;
    ExternalAnalyzerSettings external_analyzer;

    std::string rules_path = "config/crisis_rules.yaml";
    std::string resources_path = "config/resources.yaml";
    std::string database_path = "data/crisisguard.db";
    std::string log_path = "logs/crisisguard.log";
    std::string log_level = "info";

    std::string audit_hmac_key = "crisisguard-default-hmac-key-change-in-production";
    bool audit_enabled = true;

    std::string language = "ar";             // "ar" or "en"
    std::string phrase_selection = "rotate"; // "rotate" or "seeded"
    uint32_t phrase_seed = 0;

    bool redact_messages = true;
};

// Loads config/crisisguard.yaml style files. Missing keys keep their current value.
// Returns false (and leaves `config` untouched) when the file cannot be read or a
// value fails validation.
bool LoadEngineConfig(const std::string& path, EngineConfig& config);

// Checks the cross-field constraints (ascending thresholds, non-negative weights,
// non-zero windows). On failure `reason` names the offending setting.
bool ValidateEngineConfig(const EngineConfig& config, std::string& reason);

} // namespace crisisguard
