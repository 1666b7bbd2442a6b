#include "compliance/SafetyReporter.hpp"
#include "engine/CrisisEngine.hpp"
#include "persistence/DatabaseManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace crisisguard {

namespace {

const std::set<std::string>& PositiveEmotions() {
    static const std::set<std::string> emotions = {"happy", "grateful", "hopeful", "calm"};
    return emotions;
}

uint64_t GetCurrentTimestamp() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace

SafetyReporter::SafetyReporter(DatabaseManager* db, const CrisisEngine* engine)
    : database_(db), engine_(engine) {
    if (!engine_) {
        throw std::invalid_argument("SafetyReporter requires a crisis engine");
    }
    LOG_INFO("SafetyReporter initialized (database={})", database_ ? "sqlite" : "none");
}

std::optional<SessionSafetyReport> SafetyReporter::GenerateSessionReport(const std::string& session_id) const {
    SessionSafetyReport report;
    report.session_id = session_id;
    report.generated_at = DatabaseManager::TimestampToISO8601(GetCurrentTimestamp());

    std::vector<CrisisEvent> events;
    if (database_) {
        auto rows = database_->LoadSessionEvents(session_id);
        if (!rows) {
            LOG_ERROR("SafetyReporter: Failed to load events for session {}", session_id);
            return std::nullopt;
        }
        for (const auto& row : *rows) {
            if (row.escalated) report.escalated_events++;
            events.push_back(row.event);
        }
    } else {
        const auto& tracker = engine_->GetTracker();
        events = tracker.RecentEvents(session_id, tracker.GetSettings().max_events);
    }

    report.total_crisis_events = events.size();
    std::set<std::string> types;
    for (const auto& event : events) {
        report.highest_crisis_level = std::max(report.highest_crisis_level, event.crisis_level);
        types.insert(CrisisTypeToString(event.crisis_type));
    }
    report.crisis_types.assign(types.begin(), types.end());

    report.emotional_progression =
        AnalyzeEmotionalProgression(engine_->GetTracker().EmotionalHistory(session_id));
    report.recommendations = SessionRecommendations(events.size(), report.highest_crisis_level);
    report.follow_up_required = !events.empty();

    LOG_DEBUG("SafetyReporter: session={} events={} highest={}",
              session_id, report.total_crisis_events, report.highest_crisis_level);
    return report;
}

std::optional<SafetyStatistics> SafetyReporter::GetStatistics(int days) const {
    if (!database_) {
        LOG_WARN("SafetyReporter: Statistics need a database");
        return std::nullopt;
    }

    auto db_stats = database_->GetCrisisStatistics(days);
    if (!db_stats) {
        LOG_ERROR("SafetyReporter: Failed to read crisis statistics");
        return std::nullopt;
    }

    SafetyStatistics stats;
    stats.period_days = days;
    stats.total_crisis_events = db_stats->total_crisis_events;
    stats.escalated_events = db_stats->escalated_events;
    stats.escalation_rate = stats.total_crisis_events == 0
        ? 0.0
        : static_cast<double>(stats.escalated_events) / static_cast<double>(stats.total_crisis_events);
    stats.sessions_with_crisis = db_stats->sessions_with_crisis;
    stats.average_crisis_level = db_stats->average_crisis_level;
    stats.highest_crisis_level = db_stats->highest_crisis_level;
    stats.crisis_types = db_stats->crisis_types;
    stats.active_sessions = engine_->GetTracker().ActiveSessionCount();
    return stats;
}

EmotionalProgression SafetyReporter::AnalyzeEmotionalProgression(
    const std::vector<std::string>& emotions) const {
    EmotionalProgression progression;
    if (emotions.empty()) return progression;

    progression.has_data = true;
    for (const auto& emotion : emotions) {
        progression.distribution[emotion]++;
    }

    const auto& negative = engine_->GetTracker().GetSettings().negative_emotions;
    size_t start = emotions.size() > kRecentEmotionWindow ? emotions.size() - kRecentEmotionWindow : 0;
    for (size_t i = start; i < emotions.size(); ++i) {
        if (std::find(negative.begin(), negative.end(), emotions[i]) != negative.end()) {
            progression.recent_negative++;
        } else if (PositiveEmotions().count(emotions[i])) {
            progression.recent_positive++;
        }
    }

    if (progression.recent_positive > progression.recent_negative) {
        progression.overall_trend = "improving";
    } else if (progression.recent_negative > progression.recent_positive) {
        progression.overall_trend = "concerning";
    }

    // Ties resolve to the alphabetically first emotion
    auto dominant = std::max_element(progression.distribution.begin(), progression.distribution.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    progression.dominant_emotion = dominant->first;
    return progression;
}

std::vector<std::string> SafetyReporter::SessionRecommendations(size_t event_count, int highest_level) const {
    const bool english = engine_->GetLanguage() == Language::ENGLISH;

    if (event_count == 0) {
        if (english) return {"Session completed safely with no crisis events"};
        return {"الجلسة تمت بأمان دون أحداث أزمة"};
    }

    if (highest_level >= 8) {
        if (english) {
            return {"Urgent follow-up within 24 hours",
                    "Confirm the user's safety",
                    "Activate the family support network",
                    "Assess the need for professional intervention"};
        }
        return {"متابعة عاجلة خلال 24 ساعة",
                "تأكيد سلامة المستخدم",
                "تفعيل شبكة الدعم الأسرية",
                "تقييم الحاجة للتدخل المهني"};
    }

    if (highest_level >= 6) {
        if (english) {
            return {"Follow up within 48-72 hours",
                    "Review coping strategies",
                    "Strengthen psychological resources",
                    "Watch for signs of improvement or deterioration"};
        }
        return {"متابعة خلال 48-72 ساعة",
                "مراجعة استراتيجيات التأقلم",
                "تقوية الموارد النفسية",
                "مراقبة علامات التحسن أو التدهور"};
    }

    if (english) {
        return {"Routine follow-up",
                "Reinforce the progress made",
                "Keep building coping skills"};
    }
    return {"متابعة روتينية",
            "تعزيز النجاحات المحققة",
            "الاستمرار في بناء المهارات النفسية"};
}

bool SafetyReporter::ExportReportJson(const SessionSafetyReport& report,
                                      const std::string& output_path) const {
    try {
        std::filesystem::path p(output_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("SafetyReporter: Failed to create export directory: {}", ex.what());
        return false;
    }

    std::ofstream out(output_path);
    if (!out.is_open()) {
        LOG_ERROR("SafetyReporter: Failed to open export file: {}", output_path);
        return false;
    }
    out << ReportToJson(report).dump(2);

    LOG_INFO("SafetyReporter: Exported report for session {} to {}", report.session_id, output_path);
    return true;
}

nlohmann::json SafetyReporter::ReportToJson(const SessionSafetyReport& report) {
    nlohmann::json j;
    j["session_id"] = report.session_id;
    j["generated_at"] = report.generated_at;
    j["total_crisis_events"] = report.total_crisis_events;
    j["highest_crisis_level"] = report.highest_crisis_level;
    j["crisis_types_encountered"] = report.crisis_types;
    j["escalated_events"] = report.escalated_events;

    const auto& progression = report.emotional_progression;
    if (progression.has_data) {
        j["emotional_progression"] = {
            {"emotion_distribution", progression.distribution},
            {"trend_analysis", {
                {"recent_negative", progression.recent_negative},
                {"recent_positive", progression.recent_positive},
                {"overall_trend", progression.overall_trend}
            }},
            {"dominant_emotion", progression.dominant_emotion}
        };
    } else {
        j["emotional_progression"] = {{"status", "no_data"}};
    }

    j["safety_recommendations"] = report.recommendations;
    j["follow_up_required"] = report.follow_up_required;
    return j;
}

nlohmann::json SafetyReporter::StatisticsToJson(const SafetyStatistics& stats) {
    nlohmann::json j;
    j["period_days"] = stats.period_days;
    j["total_crisis_events"] = stats.total_crisis_events;
    j["escalated_events"] = stats.escalated_events;
    j["escalation_rate"] = stats.escalation_rate;
    j["sessions_with_crisis"] = stats.sessions_with_crisis;
    j["average_crisis_level"] = stats.average_crisis_level;
    j["highest_crisis_level"] = stats.highest_crisis_level;
    j["crisis_types"] = stats.crisis_types;
    j["active_sessions"] = stats.active_sessions;
    return j;
}

} // namespace crisisguard
