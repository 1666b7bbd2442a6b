#pragma once

#include "core/EventBus.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace crisisguard {

class DatabaseManager;

struct AuditEntry {
    uint64_t sequence_id;
    std::string timestamp;   // ISO8601, as stored
    std::string action;
    std::string actor;
    std::string target;
    std::string details;
    std::string prev_hash;
    std::string entry_hash;

    AuditEntry()
        : sequence_id(0) {}
};

// Tamper-evident record of safety decisions. Every entry carries the
// HMAC-SHA256 of its fields chained to the previous entry's hash.
class AuditLogger {
public:
    AuditLogger();
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    // Resumes the chain from the last stored entry.
    bool Initialize(DatabaseManager* db, const std::string& hmac_key);
    void Start();
    void Stop();

    bool LogAction(const std::string& action,
                   const std::string& actor,
                   const std::string& target,
                   const std::string& details = "");

    // Walks the whole chain from GENESIS.
    bool VerifyIntegrity();

    bool ExportAuditLog(uint64_t start_time, uint64_t end_time,
                        const std::string& output_path);

    std::vector<AuditEntry> QueryEntries(uint64_t start_time = 0,
                                         uint64_t end_time = 0,
                                         int limit = 1000);
    size_t GetEntryCount() const;
    bool IsRunning() const { return running_.load(); }

    static constexpr const char* kGenesisHash = "GENESIS";

private:
    void OnSafetyEvent(const Event& event);

    std::string ComputeHMAC(const std::string& data) const;
    std::string ComputeEntryHash(const std::string& timestamp_iso,
                                 const std::string& action,
                                 const std::string& actor,
                                 const std::string& target,
                                 const std::string& details,
                                 const std::string& prev_hash) const;
    static std::string TimeRangeClause(uint64_t start_time, uint64_t end_time);

    static uint64_t GetCurrentTimestamp();

    DatabaseManager* database_{nullptr};
    std::string hmac_key_;
    std::string last_hash_;

    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::vector<SubscriptionId> subscription_ids_;
    std::atomic<size_t> entry_count_{0};
};

} // namespace crisisguard
