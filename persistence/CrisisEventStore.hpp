#pragma once

#include "engine/CrisisTypes.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crisisguard {

struct EventAnnotations {
    bool escalated{false};
    bool follow_up_needed{false};
    std::string user_message;   // already redacted by the caller when required
};

// Append/query contract for crisis events. Implementations report failure through
// the return value; durability and retries are the implementation's business.
class CrisisEventStore {
public:
    virtual ~CrisisEventStore() = default;

    virtual bool AppendEvent(const std::string& session_id,
                             const CrisisEvent& event,
                             const EventAnnotations& annotations) = 0;

    // Oldest first, at most n entries. std::nullopt means the store failed.
    virtual std::optional<std::vector<CrisisEvent>> QueryRecentEvents(const std::string& session_id,
                                                                      size_t n) = 0;
};

class InMemoryCrisisEventStore : public CrisisEventStore {
public:
    bool AppendEvent(const std::string& session_id,
                     const CrisisEvent& event,
                     const EventAnnotations& annotations) override;

    std::optional<std::vector<CrisisEvent>> QueryRecentEvents(const std::string& session_id,
                                                              size_t n) override;

    size_t GetEventCount(const std::string& session_id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<CrisisEvent>> events_;
};

} // namespace crisisguard
