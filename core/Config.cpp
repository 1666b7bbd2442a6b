#include "core/Config.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>

namespace crisisguard {

namespace {

bool IsNonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

template<typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) {
        out = node[key].as<T>();
    }
}

} // namespace

bool ValidateEngineConfig(const EngineConfig& config, std::string& reason) {
    const auto& t = config.thresholds;
    if (!(0 <= t.low && t.low < t.medium && t.medium < t.high && t.high < t.critical && t.critical <= 10)) {
        reason = "thresholds must satisfy 0 <= low < medium < high < critical <= 10";
        return false;
    }

    const auto& w = config.weights;
    if (!IsNonNegative(w.category_weight) || !IsNonNegative(w.pattern_weight) ||
        !IsNonNegative(w.escalation_bonus) || !IsNonNegative(w.deterioration_bonus) ||
        !IsNonNegative(w.prior_intervention_bonus) || !IsNonNegative(w.high_risk_category_bonus)) {
        reason = "aggregation weights must be finite and non-negative";
        return false;
    }

    const auto& s = config.session;
    if (s.max_events == 0 || s.context_window == 0 || s.emotion_window == 0 ||
        s.emotion_history_cap < s.emotion_window) {
        reason = "session windows must be non-zero and emotion_history_cap >= emotion_window";
        return false;
    }

    const auto& e = config.escalation;
    if (e.sustained_window == 0 || e.trend_window < 2 ||
        e.sustained_window > s.max_events || e.trend_window > s.max_events) {
        reason = "escalation windows must fit inside session.max_events (trend_window >= 2)";
        return false;
    }

    if (config.external_analyzer.enabled && config.external_analyzer.timeout_ms == 0) {
        reason = "external_analyzer.timeout_ms must be positive when enabled";
        return false;
    }

    if (config.language != "ar" && config.language != "en") {
        reason = "language must be 'ar' or 'en'";
        return false;
    }

    if (config.phrase_selection != "rotate" && config.phrase_selection != "seeded") {
        reason = "phrase_selection must be 'rotate' or 'seeded'";
        return false;
    }

    return true;
}

bool LoadEngineConfig(const std::string& path, EngineConfig& config) {
    EngineConfig loaded = config;

    try {
        const YAML::Node root = YAML::LoadFile(path);

        if (auto node = root["thresholds"]) {
            ReadIfPresent(node, "low", loaded.thresholds.low);
            ReadIfPresent(node, "medium", loaded.thresholds.medium);
            ReadIfPresent(node, "high", loaded.thresholds.high);
            ReadIfPresent(node, "critical", loaded.thresholds.critical);
        }

        if (auto node = root["aggregation"]) {
            ReadIfPresent(node, "category_weight", loaded.weights.category_weight);
            ReadIfPresent(node, "pattern_weight", loaded.weights.pattern_weight);
            ReadIfPresent(node, "escalation_bonus", loaded.weights.escalation_bonus);
            ReadIfPresent(node, "deterioration_bonus", loaded.weights.deterioration_bonus);
            ReadIfPresent(node, "prior_intervention_bonus", loaded.weights.prior_intervention_bonus);
            ReadIfPresent(node, "prior_intervention_min", loaded.weights.prior_intervention_min);
            ReadIfPresent(node, "high_risk_category_bonus", loaded.weights.high_risk_category_bonus);
        }

        if (auto node = root["session"]) {
            ReadIfPresent(node, "max_events", loaded.session.max_events);
            ReadIfPresent(node, "context_window", loaded.session.context_window);
            ReadIfPresent(node, "emotion_window", loaded.session.emotion_window);
            ReadIfPresent(node, "emotion_history_cap", loaded.session.emotion_history_cap);
            ReadIfPresent(node, "repeated_theme_threshold", loaded.session.repeated_theme_threshold);
            ReadIfPresent(node, "deterioration_min_negative", loaded.session.deterioration_min_negative);
            if (node["negative_emotions"]) {
                loaded.session.negative_emotions.clear();
                for (const auto& emotion : node["negative_emotions"]) {
                    loaded.session.negative_emotions.push_back(emotion.as<std::string>());
                }
            }
        }

        if (auto node = root["escalation"]) {
            ReadIfPresent(node, "sustained_window", loaded.escalation.sustained_window);
            ReadIfPresent(node, "sustained_min_count", loaded.escalation.sustained_min_count);
            ReadIfPresent(node, "trend_window", loaded.escalation.trend_window);
            ReadIfPresent(node, "trend_sum_threshold", loaded.escalation.trend_sum_threshold);
            ReadIfPresent(node, "failed_intervention_min_events", loaded.escalation.failed_intervention_min_events);
        }

        if (auto node = root["external_analyzer"]) {
            ReadIfPresent(node, "enabled", loaded.external_analyzer.enabled);
            ReadIfPresent(node, "timeout_ms", loaded.external_analyzer.timeout_ms);
            ReadIfPresent(node, "worker_threads", loaded.external_analyzer.worker_threads);
            ReadIfPresent(node, "max_pending", loaded.external_analyzer.max_pending);
        }

        if (auto node = root["paths"]) {
            ReadIfPresent(node, "rules", loaded.rules_path);
            ReadIfPresent(node, "resources", loaded.resources_path);
            ReadIfPresent(node, "database", loaded.database_path);
            ReadIfPresent(node, "log", loaded.log_path);
        }

        if (auto node = root["logging"]) {
            ReadIfPresent(node, "level", loaded.log_level);
        }

        if (auto node = root["audit_log"]) {
            ReadIfPresent(node, "enabled", loaded.audit_enabled);
            ReadIfPresent(node, "hmac_key", loaded.audit_hmac_key);
        }

        if (auto node = root["response"]) {
            ReadIfPresent(node, "language", loaded.language);
            ReadIfPresent(node, "phrase_selection", loaded.phrase_selection);
            ReadIfPresent(node, "phrase_seed", loaded.phrase_seed);
        }

        if (auto node = root["privacy"]) {
            ReadIfPresent(node, "redact_messages", loaded.redact_messages);
        }
    } catch (const YAML::Exception& ex) {
        LOG_ERROR("Failed to parse config file {}: {}", path, ex.what());
        return false;
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to load config from {}: {}", path, ex.what());
        return false;
    }

    std::string reason;
    if (!ValidateEngineConfig(loaded, reason)) {
        LOG_ERROR("Rejected config file {}: {}", path, reason);
        return false;
    }

    if (!ParseLogLevel(loaded.log_level)) {
        LOG_WARN("Unknown logging.level '{}' in {}, keeping '{}'", loaded.log_level, path, config.log_level);
        loaded.log_level = config.log_level;
    }

    config = std::move(loaded);
    LOG_INFO("Loaded engine configuration from {}", path);
    return true;
}

} // namespace crisisguard
