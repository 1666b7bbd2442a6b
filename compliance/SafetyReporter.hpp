#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crisisguard {

class CrisisEngine;
class DatabaseManager;

struct EmotionalProgression {
    bool has_data{false};
    std::map<std::string, size_t> distribution;
    uint32_t recent_negative{0};   // over the last kRecentEmotionWindow states
    uint32_t recent_positive{0};
    std::string overall_trend{"stable"};   // improving | concerning | stable
    std::string dominant_emotion{"neutral"};
};

struct SessionSafetyReport {
    std::string session_id;
    std::string generated_at;
    size_t total_crisis_events{0};
    int highest_crisis_level{0};
    std::vector<std::string> crisis_types;
    size_t escalated_events{0};
    EmotionalProgression emotional_progression;
    std::vector<std::string> recommendations;
    bool follow_up_required{false};
};

struct SafetyStatistics {
    int period_days{0};
    size_t total_crisis_events{0};
    size_t escalated_events{0};
    double escalation_rate{0.0};
    size_t sessions_with_crisis{0};
    double average_crisis_level{0.0};
    int highest_crisis_level{0};
    std::map<std::string, size_t> crisis_types;
    size_t active_sessions{0};
};

class SafetyReporter {
public:
    // `db` may be null; session reports then draw on the engine's in-memory history.
    SafetyReporter(DatabaseManager* db, const CrisisEngine* engine);

    std::optional<SessionSafetyReport> GenerateSessionReport(const std::string& session_id) const;
    std::optional<SafetyStatistics> GetStatistics(int days) const;

    bool ExportReportJson(const SessionSafetyReport& report, const std::string& output_path) const;

    static nlohmann::json ReportToJson(const SessionSafetyReport& report);
    static nlohmann::json StatisticsToJson(const SafetyStatistics& stats);

    static constexpr size_t kRecentEmotionWindow = 5;

private:
    EmotionalProgression AnalyzeEmotionalProgression(const std::vector<std::string>& emotions) const;
    std::vector<std::string> SessionRecommendations(size_t event_count, int highest_level) const;

    DatabaseManager* database_{nullptr};
    const CrisisEngine* engine_{nullptr};
};

} // namespace crisisguard
