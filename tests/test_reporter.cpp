#include <gtest/gtest.h>
#include "compliance/SafetyReporter.hpp"
#include "engine/CrisisEngine.hpp"
#include "persistence/DatabaseManager.hpp"
#include "core/EventBus.hpp"
#include <filesystem>
#include <fstream>

using namespace crisisguard;

class SafetyReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();
        ASSERT_TRUE(db_.Initialize(":memory:"));
        config_.language = "en";
        engine_ = std::make_unique<CrisisEngine>(
            config_, std::make_shared<const RiskLexicon>(RiskLexicon::Defaults()), &db_);
        reporter_ = std::make_unique<SafetyReporter>(&db_, engine_.get());
    }

    void TearDown() override {
        reporter_.reset();
        engine_.reset();
        db_.Shutdown();
        EventBus::Instance().Clear();
    }

    EngineConfig config_;
    DatabaseManager db_;
    std::unique_ptr<CrisisEngine> engine_;
    std::unique_ptr<SafetyReporter> reporter_;
};

TEST_F(SafetyReporterTest, RequiresEngine) {
    EXPECT_THROW(SafetyReporter(&db_, nullptr), std::invalid_argument);
}

TEST_F(SafetyReporterTest, ReportSummarizesStoredEvents) {
    engine_->Analyze("s1", "I want to kill myself and I cut myself, this is the end");
    engine_->Analyze("s1", "I want to kill myself");
    engine_->Analyze("s1", "hello");

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->session_id, "s1");
    EXPECT_EQ(report->total_crisis_events, 2u);
    EXPECT_EQ(report->escalated_events, 1u);
    EXPECT_EQ(report->highest_crisis_level, 9);
    ASSERT_EQ(report->crisis_types.size(), 1u);
    EXPECT_EQ(report->crisis_types[0], "suicide_risk");
    EXPECT_TRUE(report->follow_up_required);
    ASSERT_EQ(report->recommendations.size(), 4u);
    EXPECT_EQ(report->recommendations[0], "Urgent follow-up within 24 hours");
}

TEST_F(SafetyReporterTest, ModerateSessionGetsRoutineFollowUp) {
    engine_->Analyze("s1", "I want to kill myself");

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->highest_crisis_level, 6);
    ASSERT_EQ(report->recommendations.size(), 4u);
    EXPECT_EQ(report->recommendations[0], "Follow up within 48-72 hours");
}

TEST_F(SafetyReporterTest, QuietSessionCompletedSafely) {
    engine_->Analyze("s1", "The weather is nice today");

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->total_crisis_events, 0u);
    EXPECT_FALSE(report->follow_up_required);
    ASSERT_EQ(report->recommendations.size(), 1u);
    EXPECT_EQ(report->recommendations[0], "Session completed safely with no crisis events");
    EXPECT_FALSE(report->emotional_progression.has_data);

    auto j = SafetyReporter::ReportToJson(*report);
    EXPECT_EQ(j["emotional_progression"]["status"], "no_data");
}

TEST_F(SafetyReporterTest, ConcerningEmotionalTrend) {
    engine_->Analyze("s1", "hello", std::string("sad"));
    engine_->Analyze("s1", "hello", std::string("anxious"));
    engine_->Analyze("s1", "hello", std::string("happy"));

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    const auto& progression = report->emotional_progression;
    EXPECT_TRUE(progression.has_data);
    EXPECT_EQ(progression.recent_negative, 2u);
    EXPECT_EQ(progression.recent_positive, 1u);
    EXPECT_EQ(progression.overall_trend, "concerning");
    EXPECT_EQ(progression.dominant_emotion, "anxious");
}

TEST_F(SafetyReporterTest, ImprovingEmotionalTrend) {
    for (const char* emotion : {"sad", "sad", "sad", "calm", "happy", "hopeful", "happy"}) {
        engine_->Analyze("s1", "hello", std::string(emotion));
    }

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    const auto& progression = report->emotional_progression;
    // Last five: sad calm happy hopeful happy
    EXPECT_EQ(progression.recent_negative, 1u);
    EXPECT_EQ(progression.recent_positive, 4u);
    EXPECT_EQ(progression.overall_trend, "improving");
    EXPECT_EQ(progression.dominant_emotion, "sad");
    EXPECT_EQ(progression.distribution.at("happy"), 2u);
}

TEST_F(SafetyReporterTest, StatisticsIncludeEscalationRate) {
    engine_->Analyze("a", "I want to kill myself and I cut myself, this is the end");
    engine_->Analyze("b", "I want to kill myself");

    auto stats = reporter_->GetStatistics(7);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->period_days, 7);
    EXPECT_EQ(stats->total_crisis_events, 2u);
    EXPECT_EQ(stats->escalated_events, 1u);
    EXPECT_DOUBLE_EQ(stats->escalation_rate, 0.5);
    EXPECT_EQ(stats->sessions_with_crisis, 2u);
    EXPECT_EQ(stats->highest_crisis_level, 9);
    EXPECT_EQ(stats->crisis_types.at("suicide_risk"), 2u);
    EXPECT_EQ(stats->active_sessions, 2u);

    auto j = SafetyReporter::StatisticsToJson(*stats);
    EXPECT_DOUBLE_EQ(j["escalation_rate"].get<double>(), 0.5);
    EXPECT_EQ(j["crisis_types"]["suicide_risk"], 2);
}

TEST_F(SafetyReporterTest, ReportJsonShape) {
    engine_->Analyze("s1", "I want to kill myself", std::string("hopeless"));

    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    auto j = SafetyReporter::ReportToJson(*report);

    EXPECT_EQ(j["session_id"], "s1");
    EXPECT_EQ(j["total_crisis_events"], 1);
    EXPECT_EQ(j["crisis_types_encountered"][0], "suicide_risk");
    EXPECT_EQ(j["emotional_progression"]["dominant_emotion"], "hopeless");
    EXPECT_EQ(j["emotional_progression"]["trend_analysis"]["overall_trend"], "concerning");
    EXPECT_EQ(j["emotional_progression"]["emotion_distribution"]["hopeless"], 1);
    EXPECT_TRUE(j["safety_recommendations"].is_array());
    EXPECT_TRUE(j["follow_up_required"].get<bool>());
}

TEST_F(SafetyReporterTest, ExportWritesReport) {
    engine_->Analyze("s1", "I want to kill myself");
    auto report = reporter_->GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());

    auto path = std::filesystem::temp_directory_path() / "crisisguard_reports" / "s1.json";
    ASSERT_TRUE(reporter_->ExportReportJson(*report, path.string()));

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["session_id"], "s1");

    in.close();
    std::filesystem::remove_all(path.parent_path());
}

TEST_F(SafetyReporterTest, ClosedDatabaseYieldsNoReport) {
    engine_->Analyze("s1", "I want to kill myself");
    db_.Shutdown();

    EXPECT_FALSE(reporter_->GenerateSessionReport("s1").has_value());
    EXPECT_FALSE(reporter_->GetStatistics(7).has_value());
}

TEST(SafetyReporterMemoryTest, FallsBackToTrackerWithoutDatabase) {
    EventBus::Instance().Clear();
    EngineConfig config;   // Arabic by default
    CrisisEngine engine(config, std::make_shared<const RiskLexicon>(RiskLexicon::Defaults()));
    SafetyReporter reporter(nullptr, &engine);

    engine.Analyze("s1", "I want to kill myself");
    engine.Analyze("s1", "I want to kill myself");

    auto report = reporter.GenerateSessionReport("s1");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->total_crisis_events, 2u);
    EXPECT_EQ(report->escalated_events, 0u);
    EXPECT_EQ(report->recommendations[0], "متابعة خلال 48-72 ساعة");

    EXPECT_FALSE(reporter.GetStatistics(7).has_value());
    EventBus::Instance().Clear();
}
