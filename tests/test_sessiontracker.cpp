#include <gtest/gtest.h>
#include "engine/SessionContextTracker.hpp"
#include "persistence/CrisisEventStore.hpp"
#include "core/EventBus.hpp"
#include <atomic>
#include <stdexcept>

using namespace crisisguard;

namespace {

class FailingStore : public CrisisEventStore {
public:
    explicit FailingStore(bool throw_on_query) : throw_on_query_(throw_on_query) {}

    bool AppendEvent(const std::string&, const CrisisEvent&, const EventAnnotations&) override {
        return false;
    }

    std::optional<std::vector<CrisisEvent>> QueryRecentEvents(const std::string&, size_t) override {
        if (throw_on_query_) {
            throw std::runtime_error("store offline");
        }
        return std::nullopt;
    }

private:
    bool throw_on_query_;
};

CrisisEvent MakeEvent(int level) {
    CrisisEvent event;
    event.crisis_level = level;
    event.crisis_type = CrisisType::SUICIDE_RISK;
    event.contributing_categories = {RiskCategory::SUICIDE};
    return event;
}

} // namespace

class SessionTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();
        tracker_ = std::make_unique<SessionContextTracker>(SessionSettings{});
    }

    void TearDown() override {
        EventBus::Instance().Clear();
    }

    std::unique_ptr<SessionContextTracker> tracker_;
};

TEST_F(SessionTrackerTest, UnknownSessionHasEmptyContext) {
    auto context = tracker_->GetContext("ghost");
    EXPECT_EQ(context.repeated_crisis_themes, 0u);
    EXPECT_FALSE(context.escalation_detected);
    EXPECT_FALSE(context.emotional_deterioration);
    EXPECT_EQ(context.previous_interventions, 0u);
    EXPECT_FALSE(tracker_->HasSession("ghost"));
}

TEST_F(SessionTrackerTest, AcquireCreatesOnce) {
    bool created = false;
    auto first = tracker_->Acquire("s1", &created);
    EXPECT_TRUE(created);

    auto second = tracker_->Acquire("s1", &created);
    EXPECT_FALSE(created);
    EXPECT_EQ(first, second);
    EXPECT_EQ(tracker_->ActiveSessionCount(), 1u);
}

TEST_F(SessionTrackerTest, EventHistoryIsCapped) {
    for (int i = 0; i < 12; ++i) {
        tracker_->RecordEvent("s1", 5 + (i % 5), CrisisType::SUICIDE_RISK, {RiskCategory::SUICIDE});
    }

    auto events = tracker_->RecentEvents("s1", 100);
    EXPECT_EQ(events.size(), 10u);
    EXPECT_EQ(tracker_->GetTotalEventCount("s1"), 12u);
    EXPECT_EQ(tracker_->GetContext("s1").previous_interventions, 12u);
}

TEST_F(SessionTrackerTest, RecordEventClampsLevel) {
    auto event = tracker_->RecordEvent("s1", 14, CrisisType::VIOLENCE_RISK, {RiskCategory::VIOLENCE});
    EXPECT_EQ(event.crisis_level, 10);
    EXPECT_EQ(event.session_id, "s1");
    EXPECT_GT(event.timestamp, 0u);
}

TEST_F(SessionTrackerTest, RepeatedThemesTriggerEscalation) {
    tracker_->RecordEvent("s1", 6, CrisisType::SUICIDE_RISK, {RiskCategory::SUICIDE});
    tracker_->RecordEvent("s1", 6, CrisisType::SUICIDE_RISK, {RiskCategory::SUICIDE});
    auto context = tracker_->GetContext("s1");
    EXPECT_EQ(context.repeated_crisis_themes, 2u);
    EXPECT_FALSE(context.escalation_detected);

    tracker_->RecordEvent("s1", 6, CrisisType::SUICIDE_RISK, {RiskCategory::SUICIDE});
    context = tracker_->GetContext("s1");
    EXPECT_EQ(context.repeated_crisis_themes, 3u);
    EXPECT_TRUE(context.escalation_detected);
}

TEST_F(SessionTrackerTest, ThemesOnlyCountContextWindow) {
    tracker_->RecordEvent("s1", 8, CrisisType::SUICIDE_RISK,
                          {RiskCategory::SUICIDE, RiskCategory::SELF_HARM, RiskCategory::HOPELESSNESS});
    for (int i = 0; i < 3; ++i) {
        tracker_->RecordEvent("s1", 5, CrisisType::SEVERE_DEPRESSION, {});
    }
    EXPECT_EQ(tracker_->GetContext("s1").repeated_crisis_themes, 0u);
}

TEST_F(SessionTrackerTest, EmotionalDeterioration) {
    tracker_->RecordEmotionalState("s1", "happy");
    tracker_->RecordEmotionalState("s1", "SAD");
    tracker_->RecordEmotionalState("s1", "anxious");
    EXPECT_FALSE(tracker_->GetContext("s1").emotional_deterioration);

    tracker_->RecordEmotionalState("s1", "يائس");
    EXPECT_TRUE(tracker_->GetContext("s1").emotional_deterioration);

    auto history = tracker_->EmotionalHistory("s1");
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[1], "sad");
}

TEST_F(SessionTrackerTest, DeteriorationUsesRecentWindowOnly) {
    for (int i = 0; i < 3; ++i) tracker_->RecordEmotionalState("s1", "sad");
    for (int i = 0; i < 5; ++i) tracker_->RecordEmotionalState("s1", "calm");
    EXPECT_FALSE(tracker_->GetContext("s1").emotional_deterioration);
}

TEST_F(SessionTrackerTest, EmotionalHistoryIsCapped) {
    for (int i = 0; i < 30; ++i) {
        tracker_->RecordEmotionalState("s1", "calm");
    }
    EXPECT_EQ(tracker_->EmotionalHistory("s1").size(), 20u);
}

TEST_F(SessionTrackerTest, BlankEmotionIgnored) {
    tracker_->RecordEmotionalState("s1", "   ");
    EXPECT_TRUE(tracker_->EmotionalHistory("s1").empty());
}

TEST_F(SessionTrackerTest, HydratesFromStore) {
    InMemoryCrisisEventStore store;
    for (int i = 0; i < 12; ++i) {
        store.AppendEvent("s1", MakeEvent(i % 11), EventAnnotations{});
    }

    SessionContextTracker tracker(SessionSettings{}, &store);
    tracker.Acquire("s1");

    auto events = tracker.RecentEvents("s1", 100);
    ASSERT_EQ(events.size(), 10u);
    EXPECT_EQ(events.front().crisis_level, 2);
    EXPECT_EQ(events.back().crisis_level, 0);
    EXPECT_EQ(events.back().session_id, "s1");
    EXPECT_EQ(tracker.GetContext("s1").previous_interventions, 10u);
}

TEST_F(SessionTrackerTest, StoreFailureStartsEmptyAndPublishes) {
    std::atomic<int> failures{0};
    EventBus::Instance().Subscribe(EventType::STORE_FAILURE,
        [&failures](const Event& e) {
            EXPECT_EQ(e.metadata.at("operation"), "query_recent_events");
            failures++;
        });

    FailingStore nullopt_store(false);
    SessionContextTracker tracker(SessionSettings{}, &nullopt_store);
    tracker.Acquire("s1");
    EXPECT_TRUE(tracker.RecentEvents("s1", 10).empty());

    FailingStore throwing_store(true);
    SessionContextTracker tracker2(SessionSettings{}, &throwing_store);
    EXPECT_NO_THROW(tracker2.Acquire("s2"));
    EXPECT_TRUE(tracker2.HasSession("s2"));

    EXPECT_EQ(failures, 2);
}

TEST_F(SessionTrackerTest, EndSessionReleasesState) {
    tracker_->RecordEvent("s1", 6, CrisisType::SUICIDE_RISK, {RiskCategory::SUICIDE});
    EXPECT_TRUE(tracker_->EndSession("s1"));
    EXPECT_FALSE(tracker_->HasSession("s1"));
    EXPECT_FALSE(tracker_->EndSession("s1"));
    EXPECT_EQ(tracker_->GetContext("s1").previous_interventions, 0u);
}
