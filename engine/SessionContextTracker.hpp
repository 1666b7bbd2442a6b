#pragma once

#include "core/Config.hpp"
#include "engine/CrisisTypes.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crisisguard {

class CrisisEventStore;

struct SessionCrisisState {
    // Held by CrisisEngine for a whole read-context/append-event cycle.
    std::mutex analysis_mutex;

    mutable std::mutex data_mutex;
    std::deque<CrisisEvent> events;              // oldest first, capped at max_events
    std::deque<std::string> emotional_history;   // capped at emotion_history_cap
    uint32_t total_events{0};
    uint64_t created_at{0};
};

// Owns every live session's crisis history. Sessions are created on first
// Acquire() and live until EndSession(); nothing expires them implicitly.
class SessionContextTracker {
public:
    explicit SessionContextTracker(const SessionSettings& settings,
                                   CrisisEventStore* store = nullptr);

    // Creates the session on first use, seeding its events from the store.
    // `created` reports whether this call created it.
    std::shared_ptr<SessionCrisisState> Acquire(const std::string& session_id,
                                                bool* created = nullptr);

    // Read-only; unknown sessions yield all-false/zero signals and are not created.
    ContextSignals GetContext(const std::string& session_id) const;

    CrisisEvent RecordEvent(const std::string& session_id,
                            int crisis_level,
                            CrisisType crisis_type,
                            const std::vector<RiskCategory>& categories);
    void RecordEmotionalState(const std::string& session_id, const std::string& state);

    std::vector<CrisisEvent> RecentEvents(const std::string& session_id, size_t n) const;
    std::vector<std::string> EmotionalHistory(const std::string& session_id) const;
    uint32_t GetTotalEventCount(const std::string& session_id) const;

    bool HasSession(const std::string& session_id) const;
    bool EndSession(const std::string& session_id);
    size_t ActiveSessionCount() const;

    const SessionSettings& GetSettings() const { return settings_; }

private:
    std::shared_ptr<SessionCrisisState> Find(const std::string& session_id) const;
    bool IsNegativeEmotion(const std::string& state) const;
    static uint64_t GetCurrentTimestamp();

    SessionSettings settings_;
    CrisisEventStore* store_{nullptr};

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionCrisisState>> sessions_;
};

} // namespace crisisguard
