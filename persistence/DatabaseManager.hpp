#pragma once

#include "persistence/CrisisEventStore.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crisisguard {

// SQLite-backed crisis event store plus the audit_log table used by AuditLogger.
class DatabaseManager : public CrisisEventStore {
public:
    DatabaseManager();
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool Initialize(const std::string& db_path = "data/crisisguard.db");
    void Shutdown();
    bool IsOpen() const;

    // CrisisEventStore
    bool AppendEvent(const std::string& session_id,
                     const CrisisEvent& event,
                     const EventAnnotations& annotations) override;
    std::optional<std::vector<CrisisEvent>> QueryRecentEvents(const std::string& session_id,
                                                              size_t n) override;

    struct CrisisEventRow {
        int64_t id{0};
        CrisisEvent event;
        std::string timestamp_iso;
        std::string user_message;
        bool escalated{false};
        bool follow_up_needed{false};
    };

    // Every stored event of a session, oldest first.
    std::optional<std::vector<CrisisEventRow>> LoadSessionEvents(const std::string& session_id);
    size_t GetCrisisEventCount();

    struct CrisisStatistics {
        size_t total_crisis_events{0};
        size_t escalated_events{0};
        size_t sessions_with_crisis{0};
        double average_crisis_level{0.0};
        int highest_crisis_level{0};
        std::map<std::string, size_t> crisis_types;
    };

    // Events newer than `days` days. std::nullopt when the database is unavailable.
    std::optional<CrisisStatistics> GetCrisisStatistics(int days);

    // Audit Log
    struct AuditEntryRow {
        uint64_t sequence_id;
        std::string timestamp;
        std::string action;
        std::string actor;
        std::string target;
        std::string details;
        std::string prev_hash;
        std::string entry_hash;
    };

    bool InsertAuditEntry(uint64_t timestamp,
                          const std::string& action,
                          const std::string& actor,
                          const std::string& target,
                          const std::string& details,
                          const std::string& prev_hash,
                          const std::string& entry_hash);
    std::vector<AuditEntryRow> QueryAuditEntriesRaw(const std::string& where_clause = "",
                                                    int limit = 0, int offset = 0,
                                                    bool desc = false);
    size_t GetAuditEntryCount();

    static std::string TimestampToISO8601(uint64_t ms_epoch);

private:
    bool CreateSchema();
    bool PrepareStatements();
    void FinalizeStatements();

    static CrisisEvent ReadEventColumns(sqlite3_stmt* stmt);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    // Prepared statements
    sqlite3_stmt* stmt_insert_event_{nullptr};
    sqlite3_stmt* stmt_recent_events_{nullptr};
    sqlite3_stmt* stmt_session_events_{nullptr};
    sqlite3_stmt* stmt_event_count_{nullptr};

    // Audit log statements
    sqlite3_stmt* stmt_insert_audit_{nullptr};
    sqlite3_stmt* stmt_audit_count_{nullptr};
};

} // namespace crisisguard
