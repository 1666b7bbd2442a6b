#include "engine/SessionContextTracker.hpp"
#include "engine/TextNormalizer.hpp"
#include "persistence/CrisisEventStore.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>

namespace crisisguard {

SessionContextTracker::SessionContextTracker(const SessionSettings& settings,
                                             CrisisEventStore* store)
    : settings_(settings), store_(store) {
    for (auto& emotion : settings_.negative_emotions) {
        emotion = NormalizeText(emotion);
    }
}

std::shared_ptr<SessionCrisisState> SessionContextTracker::Find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionCrisisState> SessionContextTracker::Acquire(const std::string& session_id,
                                                                   bool* created) {
    if (created) {
        *created = false;
    }

    if (auto existing = Find(session_id)) {
        return existing;
    }

    // The store is queried outside the map lock so a slow store only delays
    // this session.
    std::vector<CrisisEvent> seed;
    if (store_) {
        bool failed = false;
        try {
            auto recent = store_->QueryRecentEvents(session_id, settings_.max_events);
            if (recent) {
                seed = std::move(*recent);
            } else {
                failed = true;
                LOG_ERROR("Event store query failed for session {}, starting with empty history",
                         session_id);
            }
        } catch (const std::exception& ex) {
            failed = true;
            LOG_ERROR("Event store query threw for session {}: {}", session_id, ex.what());
        }

        if (failed) {
            Event failure(EventType::STORE_FAILURE, session_id);
            failure.metadata["operation"] = "query_recent_events";
            EventBus::Instance().Publish(failure);
        }
    }

    auto state = std::make_shared<SessionCrisisState>();
    state->created_at = GetCurrentTimestamp();
    if (seed.size() > settings_.max_events) {
        seed.erase(seed.begin(), seed.end() - static_cast<std::ptrdiff_t>(settings_.max_events));
    }
    for (auto& event : seed) {
        event.session_id = session_id;
        event.crisis_level = std::clamp(event.crisis_level, 0, 10);
        state->events.push_back(std::move(event));
    }
    state->total_events = static_cast<uint32_t>(state->events.size());

    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    auto [it, inserted] = sessions_.try_emplace(session_id, state);
    if (inserted) {
        LOG_DEBUG("Session {} created ({} events restored)", session_id, state->total_events);
    }
    if (created) {
        *created = inserted;
    }
    return it->second;
}

ContextSignals SessionContextTracker::GetContext(const std::string& session_id) const {
    ContextSignals signals;
    auto state = Find(session_id);
    if (!state) {
        return signals;
    }

    std::lock_guard<std::mutex> lock(state->data_mutex);

    const auto& events = state->events;
    size_t window = std::min(settings_.context_window, events.size());
    for (auto it = events.end() - static_cast<std::ptrdiff_t>(window); it != events.end(); ++it) {
        signals.repeated_crisis_themes += static_cast<uint32_t>(it->contributing_categories.size());
    }
    signals.escalation_detected = signals.repeated_crisis_themes > settings_.repeated_theme_threshold;

    const auto& emotions = state->emotional_history;
    size_t emotion_window = std::min(settings_.emotion_window, emotions.size());
    size_t negative = static_cast<size_t>(std::count_if(
        emotions.end() - static_cast<std::ptrdiff_t>(emotion_window), emotions.end(),
        [this](const std::string& emotion) { return IsNegativeEmotion(emotion); }));
    signals.emotional_deterioration = negative >= settings_.deterioration_min_negative;

    signals.previous_interventions = state->total_events;
    return signals;
}

CrisisEvent SessionContextTracker::RecordEvent(const std::string& session_id,
                                               int crisis_level,
                                               CrisisType crisis_type,
                                               const std::vector<RiskCategory>& categories) {
    CrisisEvent event;
    event.session_id = session_id;
    event.timestamp = GetCurrentTimestamp();
    event.crisis_level = std::clamp(crisis_level, 0, 10);
    event.crisis_type = crisis_type;
    event.contributing_categories = categories;

    auto state = Acquire(session_id);
    std::lock_guard<std::mutex> lock(state->data_mutex);
    state->events.push_back(event);
    while (state->events.size() > settings_.max_events) {
        state->events.pop_front();
    }
    state->total_events++;

    return event;
}

void SessionContextTracker::RecordEmotionalState(const std::string& session_id,
                                                 const std::string& emotional_state) {
    std::string normalized = NormalizeText(emotional_state);
    if (normalized.empty()) {
        return;
    }

    auto state = Acquire(session_id);
    std::lock_guard<std::mutex> lock(state->data_mutex);
    state->emotional_history.push_back(std::move(normalized));
    while (state->emotional_history.size() > settings_.emotion_history_cap) {
        state->emotional_history.pop_front();
    }
}

std::vector<CrisisEvent> SessionContextTracker::RecentEvents(const std::string& session_id,
                                                             size_t n) const {
    auto state = Find(session_id);
    if (!state) {
        return {};
    }

    std::lock_guard<std::mutex> lock(state->data_mutex);
    size_t count = std::min(n, state->events.size());
    return std::vector<CrisisEvent>(state->events.end() - static_cast<std::ptrdiff_t>(count),
                                    state->events.end());
}

std::vector<std::string> SessionContextTracker::EmotionalHistory(const std::string& session_id) const {
    auto state = Find(session_id);
    if (!state) {
        return {};
    }

    std::lock_guard<std::mutex> lock(state->data_mutex);
    return std::vector<std::string>(state->emotional_history.begin(), state->emotional_history.end());
}

uint32_t SessionContextTracker::GetTotalEventCount(const std::string& session_id) const {
    auto state = Find(session_id);
    if (!state) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(state->data_mutex);
    return state->total_events;
}

bool SessionContextTracker::HasSession(const std::string& session_id) const {
    return Find(session_id) != nullptr;
}

bool SessionContextTracker::EndSession(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    bool erased = sessions_.erase(session_id) > 0;
    if (erased) {
        LOG_DEBUG("Session {} released", session_id);
    }
    return erased;
}

size_t SessionContextTracker::ActiveSessionCount() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool SessionContextTracker::IsNegativeEmotion(const std::string& state) const {
    return std::find(settings_.negative_emotions.begin(), settings_.negative_emotions.end(), state)
        != settings_.negative_emotions.end();
}

uint64_t SessionContextTracker::GetCurrentTimestamp() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace crisisguard
