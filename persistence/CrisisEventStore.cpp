#include "persistence/CrisisEventStore.hpp"

namespace crisisguard {

bool InMemoryCrisisEventStore::AppendEvent(const std::string& session_id,
                                           const CrisisEvent& event,
                                           const EventAnnotations& /*annotations*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_[session_id].push_back(event);
    return true;
}

std::optional<std::vector<CrisisEvent>> InMemoryCrisisEventStore::QueryRecentEvents(
    const std::string& session_id, size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(session_id);
    if (it == events_.end()) {
        return std::vector<CrisisEvent>{};
    }

    const auto& all = it->second;
    size_t start = all.size() > n ? all.size() - n : 0;
    return std::vector<CrisisEvent>(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
}

size_t InMemoryCrisisEventStore::GetEventCount(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(session_id);
    return it == events_.end() ? 0 : it->second.size();
}

} // namespace crisisguard
