#include "persistence/DatabaseManager.hpp"
#include "engine/VerdictJson.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

namespace crisisguard {

namespace {

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

uint64_t NowMs() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace

DatabaseManager::DatabaseManager() = default;

DatabaseManager::~DatabaseManager() {
    Shutdown();
}

bool DatabaseManager::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        LOG_WARN("DatabaseManager already initialized");
        return true;
    }

    // Create parent directory if needed (skip for :memory:)
    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("DatabaseManager: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets report queries run alongside appends
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!CreateSchema() || !PrepareStatements()) {
        FinalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("DatabaseManager initialized (db_path={})", db_path);
    return true;
}

void DatabaseManager::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("DatabaseManager shutdown");
    }
}

bool DatabaseManager::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool DatabaseManager::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS crisis_events (
            id                  INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id          TEXT    NOT NULL,
            timestamp_ms        INTEGER NOT NULL,
            timestamp           TEXT    NOT NULL,
            crisis_level        INTEGER NOT NULL,
            crisis_type         TEXT    NOT NULL,
            categories          TEXT,
            user_message        TEXT,
            escalated           INTEGER DEFAULT 0,
            follow_up_needed    INTEGER DEFAULT 0,
            created_at          TEXT    DEFAULT (datetime('now'))
        );

        CREATE INDEX IF NOT EXISTS idx_crisis_session ON crisis_events(session_id);
        CREATE INDEX IF NOT EXISTS idx_crisis_timestamp ON crisis_events(timestamp_ms);
        CREATE INDEX IF NOT EXISTS idx_crisis_level ON crisis_events(crisis_level);

        CREATE TABLE IF NOT EXISTS audit_log (
            sequence_id     INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp       TEXT    NOT NULL,
            action          TEXT    NOT NULL,
            actor           TEXT    NOT NULL,
            target          TEXT    NOT NULL,
            details         TEXT,
            prev_hash       TEXT    NOT NULL,
            entry_hash      TEXT    NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit_log(timestamp);
        CREATE INDEX IF NOT EXISTS idx_audit_action ON audit_log(action);
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool DatabaseManager::PrepareStatements() {
    struct Statement {
        const char* sql;
        sqlite3_stmt** target;
    };

    const Statement statements[] = {
        {"INSERT INTO crisis_events (session_id, timestamp_ms, timestamp, crisis_level, crisis_type, "
         "categories, user_message, escalated, follow_up_needed) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
         &stmt_insert_event_},
        {"SELECT session_id, timestamp_ms, crisis_level, crisis_type, categories FROM crisis_events "
         "WHERE session_id = ? ORDER BY id DESC LIMIT ?",
         &stmt_recent_events_},
        {"SELECT session_id, timestamp_ms, crisis_level, crisis_type, categories, "
         "id, timestamp, user_message, escalated, follow_up_needed FROM crisis_events "
         "WHERE session_id = ? ORDER BY id ASC",
         &stmt_session_events_},
        {"SELECT COUNT(*) FROM crisis_events", &stmt_event_count_},
        {"INSERT INTO audit_log (timestamp, action, actor, target, details, prev_hash, entry_hash) "
         "VALUES (?, ?, ?, ?, ?, ?, ?)",
         &stmt_insert_audit_},
        {"SELECT COUNT(*) FROM audit_log", &stmt_audit_count_},
    };

    for (const auto& statement : statements) {
        if (sqlite3_prepare_v2(db_, statement.sql, -1, statement.target, nullptr) != SQLITE_OK) {
            LOG_ERROR("DatabaseManager: Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return false;
        }
    }
    return true;
}

void DatabaseManager::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_insert_event_);
    finalize(stmt_recent_events_);
    finalize(stmt_session_events_);
    finalize(stmt_event_count_);
    finalize(stmt_insert_audit_);
    finalize(stmt_audit_count_);
}

// --- Crisis events ---

bool DatabaseManager::AppendEvent(const std::string& session_id,
                                  const CrisisEvent& event,
                                  const EventAnnotations& annotations) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_event_) return false;

    std::string ts = TimestampToISO8601(event.timestamp);
    std::string type = CrisisTypeToString(event.crisis_type);
    std::string categories = CategoriesToJson(event.contributing_categories).dump();

    sqlite3_reset(stmt_insert_event_);
    sqlite3_bind_text(stmt_insert_event_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_event_, 2, static_cast<sqlite3_int64>(event.timestamp));
    sqlite3_bind_text(stmt_insert_event_, 3, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_event_, 4, event.crisis_level);
    sqlite3_bind_text(stmt_insert_event_, 5, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_event_, 6, categories.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_event_, 7, annotations.user_message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_event_, 8, annotations.escalated ? 1 : 0);
    sqlite3_bind_int(stmt_insert_event_, 9, annotations.follow_up_needed ? 1 : 0);

    int rc = sqlite3_step(stmt_insert_event_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DatabaseManager: Failed to insert crisis event: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

CrisisEvent DatabaseManager::ReadEventColumns(sqlite3_stmt* stmt) {
    CrisisEvent event;
    event.session_id = ColumnText(stmt, 0);
    event.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
    event.crisis_level = sqlite3_column_int(stmt, 2);

    std::string type = ColumnText(stmt, 3);
    auto parsed_type = CrisisTypeFromString(type);
    if (!parsed_type) {
        LOG_WARN("DatabaseManager: Unknown crisis_type '{}' in stored event", type);
    }
    event.crisis_type = parsed_type.value_or(CrisisType::EMOTIONAL_DISTRESS);

    auto categories = nlohmann::json::parse(ColumnText(stmt, 4), nullptr, false);
    if (!categories.is_discarded()) {
        event.contributing_categories = CategoriesFromJson(categories);
    }
    return event;
}

std::optional<std::vector<CrisisEvent>> DatabaseManager::QueryRecentEvents(const std::string& session_id,
                                                                           size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_recent_events_) return std::nullopt;

    sqlite3_reset(stmt_recent_events_);
    sqlite3_bind_text(stmt_recent_events_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_recent_events_, 2, static_cast<sqlite3_int64>(n));

    std::vector<CrisisEvent> events;
    int rc;
    while ((rc = sqlite3_step(stmt_recent_events_)) == SQLITE_ROW) {
        events.push_back(ReadEventColumns(stmt_recent_events_));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DatabaseManager: Recent events query failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    // Selected newest first
    std::reverse(events.begin(), events.end());
    return events;
}

std::optional<std::vector<DatabaseManager::CrisisEventRow>> DatabaseManager::LoadSessionEvents(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_session_events_) return std::nullopt;

    sqlite3_reset(stmt_session_events_);
    sqlite3_bind_text(stmt_session_events_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<CrisisEventRow> rows;
    int rc;
    while ((rc = sqlite3_step(stmt_session_events_)) == SQLITE_ROW) {
        CrisisEventRow row;
        row.event = ReadEventColumns(stmt_session_events_);
        row.id = sqlite3_column_int64(stmt_session_events_, 5);
        row.timestamp_iso = ColumnText(stmt_session_events_, 6);
        row.user_message = ColumnText(stmt_session_events_, 7);
        row.escalated = sqlite3_column_int(stmt_session_events_, 8) != 0;
        row.follow_up_needed = sqlite3_column_int(stmt_session_events_, 9) != 0;
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DatabaseManager: Session events query failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return rows;
}

size_t DatabaseManager::GetCrisisEventCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_event_count_) return 0;

    sqlite3_reset(stmt_event_count_);
    if (sqlite3_step(stmt_event_count_) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt_event_count_, 0));
    }
    return 0;
}

std::optional<DatabaseManager::CrisisStatistics> DatabaseManager::GetCrisisStatistics(int days) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    uint64_t window_ms = static_cast<uint64_t>(days > 0 ? days : 0) * 24ULL * 60 * 60 * 1000;
    uint64_t now = NowMs();
    sqlite3_int64 cutoff = static_cast<sqlite3_int64>(now > window_ms ? now - window_ms : 0);

    CrisisStatistics stats;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "SELECT COUNT(*), COALESCE(SUM(escalated), 0), COUNT(DISTINCT session_id), "
        "COALESCE(AVG(crisis_level), 0), COALESCE(MAX(crisis_level), 0) "
        "FROM crisis_events WHERE timestamp_ms >= ?",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Statistics prepare failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, cutoff);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.total_crisis_events = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        stats.escalated_events = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        stats.sessions_with_crisis = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
        stats.average_crisis_level = sqlite3_column_double(stmt, 3);
        stats.highest_crisis_level = sqlite3_column_int(stmt, 4);
    }
    sqlite3_finalize(stmt);
    stmt = nullptr;

    rc = sqlite3_prepare_v2(db_,
        "SELECT crisis_type, COUNT(*) FROM crisis_events WHERE timestamp_ms >= ? GROUP BY crisis_type",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Statistics prepare failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, cutoff);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.crisis_types[ColumnText(stmt, 0)] = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
    }
    sqlite3_finalize(stmt);

    return stats;
}

// --- Audit Log ---

bool DatabaseManager::InsertAuditEntry(uint64_t timestamp,
                                       const std::string& action,
                                       const std::string& actor,
                                       const std::string& target,
                                       const std::string& details,
                                       const std::string& prev_hash,
                                       const std::string& entry_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_audit_) return false;

    std::string ts = TimestampToISO8601(timestamp);

    sqlite3_reset(stmt_insert_audit_);
    sqlite3_bind_text(stmt_insert_audit_, 1, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 2, action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 3, actor.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 4, target.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 5, details.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 6, prev_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_audit_, 7, entry_hash.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_audit_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DatabaseManager: Failed to insert audit entry: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<DatabaseManager::AuditEntryRow> DatabaseManager::QueryAuditEntriesRaw(
    const std::string& where_clause, int limit, int offset, bool desc) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEntryRow> results;
    if (!db_) return results;

    std::string sql = "SELECT sequence_id, timestamp, action, actor, target, details, prev_hash, entry_hash FROM audit_log";
    if (!where_clause.empty()) {
        sql += " WHERE " + where_clause;
    }
    sql += desc ? " ORDER BY sequence_id DESC" : " ORDER BY sequence_id ASC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit) + " OFFSET " + std::to_string(offset);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DatabaseManager: Audit query prepare failed: {}", sqlite3_errmsg(db_));
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AuditEntryRow row;
        row.sequence_id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        row.timestamp = ColumnText(stmt, 1);
        row.action = ColumnText(stmt, 2);
        row.actor = ColumnText(stmt, 3);
        row.target = ColumnText(stmt, 4);
        row.details = ColumnText(stmt, 5);
        row.prev_hash = ColumnText(stmt, 6);
        row.entry_hash = ColumnText(stmt, 7);
        results.push_back(row);
    }

    sqlite3_finalize(stmt);
    return results;
}

size_t DatabaseManager::GetAuditEntryCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_audit_count_) return 0;

    sqlite3_reset(stmt_audit_count_);
    if (sqlite3_step(stmt_audit_count_) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt_audit_count_, 0));
    }
    return 0;
}

// --- Helpers ---

std::string DatabaseManager::TimestampToISO8601(uint64_t ms_epoch) {
    auto seconds = static_cast<time_t>(ms_epoch / 1000);
    auto millis = ms_epoch % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(millis));

    return std::string(buf);
}

} // namespace crisisguard
