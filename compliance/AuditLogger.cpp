#include "compliance/AuditLogger.hpp"
#include "persistence/DatabaseManager.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace crisisguard {

AuditLogger::AuditLogger() = default;

AuditLogger::~AuditLogger() {
    Stop();
}

bool AuditLogger::Initialize(DatabaseManager* db, const std::string& hmac_key) {
    if (!db || !db->IsOpen()) {
        LOG_ERROR("AuditLogger: Cannot initialize without an open database");
        return false;
    }
    if (hmac_key.empty()) {
        LOG_ERROR("AuditLogger: HMAC key must not be empty");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    database_ = db;
    hmac_key_ = hmac_key;
    last_hash_ = kGenesisHash;
    entry_count_ = 0;

    auto rows = database_->QueryAuditEntriesRaw("", 1, 0, true);
    if (!rows.empty()) {
        last_hash_ = rows[0].entry_hash;
        entry_count_ = database_->GetAuditEntryCount();
    }

    LOG_INFO("AuditLogger initialized (chain_tip={})", last_hash_.substr(0, 16));
    return true;
}

void AuditLogger::Start() {
    if (running_.exchange(true)) return;

    auto& bus = EventBus::Instance();
    for (EventType type : {EventType::CRISIS_DETECTED,
                           EventType::ESCALATION_REQUIRED,
                           EventType::DETECTOR_FAILURE,
                           EventType::SESSION_ENDED}) {
        subscription_ids_.push_back(
            bus.Subscribe(type, [this](const Event& event) { OnSafetyEvent(event); })
        );
    }

    LogAction("AUDIT_STARTED", "system", "audit_logger", "Audit logging started");
    LOG_INFO("AuditLogger started with {} subscriptions", subscription_ids_.size());
}

void AuditLogger::Stop() {
    if (!running_.exchange(false)) return;

    auto& bus = EventBus::Instance();
    for (auto id : subscription_ids_) {
        bus.Unsubscribe(id);
    }
    subscription_ids_.clear();

    LogAction("AUDIT_STOPPED", "system", "audit_logger", "Audit logging stopped");
    LOG_INFO("AuditLogger stopped");
}

bool AuditLogger::LogAction(const std::string& action,
                            const std::string& actor,
                            const std::string& target,
                            const std::string& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_) {
        LOG_WARN("AuditLogger: Dropping action {} (not initialized)", action);
        return false;
    }

    uint64_t timestamp = GetCurrentTimestamp();
    std::string timestamp_iso = DatabaseManager::TimestampToISO8601(timestamp);
    std::string entry_hash = ComputeEntryHash(timestamp_iso, action, actor, target, details, last_hash_);

    if (!database_->InsertAuditEntry(timestamp, action, actor, target, details,
                                     last_hash_, entry_hash)) {
        LOG_ERROR("AuditLogger: Failed to persist action={} target={}", action, target);
        return false;
    }

    last_hash_ = entry_hash;
    entry_count_++;

    LOG_DEBUG("AuditLogger: action={} actor={} target={}", action, actor, target);
    return true;
}

bool AuditLogger::VerifyIntegrity() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!database_) {
        LOG_ERROR("AuditLogger: Cannot verify integrity without database");
        return false;
    }

    auto rows = database_->QueryAuditEntriesRaw("", 0, 0, false);
    if (rows.empty()) {
        LOG_INFO("AuditLogger: No entries to verify");
        return true;
    }

    std::string expected_prev = kGenesisHash;

    for (const auto& row : rows) {
        if (row.prev_hash != expected_prev) {
            LOG_ERROR("AuditLogger: Chain broken at sequence_id={} "
                      "(expected prev_hash={}, got={})",
                      row.sequence_id,
                      expected_prev.substr(0, 16),
                      row.prev_hash.substr(0, 16));
            return false;
        }

        std::string computed = ComputeEntryHash(row.timestamp, row.action, row.actor,
                                                row.target, row.details, row.prev_hash);
        if (computed != row.entry_hash) {
            LOG_ERROR("AuditLogger: HMAC mismatch at sequence_id={}", row.sequence_id);
            return false;
        }

        expected_prev = row.entry_hash;
    }

    LOG_INFO("AuditLogger: Integrity verified ({} entries)", rows.size());
    return true;
}

bool AuditLogger::ExportAuditLog(uint64_t start_time, uint64_t end_time,
                                 const std::string& output_path) {
    std::vector<DatabaseManager::AuditEntryRow> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!database_) return false;
        rows = database_->QueryAuditEntriesRaw(TimeRangeClause(start_time, end_time), 0, 0, false);
    }

    try {
        std::filesystem::path p(output_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("AuditLogger: Failed to create export directory: {}", ex.what());
        return false;
    }

    nlohmann::json export_json;
    export_json["export_timestamp"] = DatabaseManager::TimestampToISO8601(GetCurrentTimestamp());
    export_json["entry_count"] = rows.size();
    export_json["chain_valid"] = VerifyIntegrity();

    nlohmann::json entries_array = nlohmann::json::array();
    for (const auto& row : rows) {
        entries_array.push_back({
            {"sequence_id", row.sequence_id},
            {"timestamp", row.timestamp},
            {"action", row.action},
            {"actor", row.actor},
            {"target", row.target},
            {"details", row.details},
            {"prev_hash", row.prev_hash},
            {"entry_hash", row.entry_hash}
        });
    }
    export_json["entries"] = entries_array;

    std::ofstream out(output_path);
    if (!out.is_open()) {
        LOG_ERROR("AuditLogger: Failed to open export file: {}", output_path);
        return false;
    }
    out << export_json.dump(2);

    LOG_INFO("AuditLogger: Exported {} entries to {}", rows.size(), output_path);
    return true;
}

std::vector<AuditEntry> AuditLogger::QueryEntries(uint64_t start_time,
                                                  uint64_t end_time,
                                                  int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!database_) return {};

    auto rows = database_->QueryAuditEntriesRaw(TimeRangeClause(start_time, end_time), limit, 0, false);
    std::vector<AuditEntry> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        AuditEntry entry;
        entry.sequence_id = row.sequence_id;
        entry.timestamp = row.timestamp;
        entry.action = row.action;
        entry.actor = row.actor;
        entry.target = row.target;
        entry.details = row.details;
        entry.prev_hash = row.prev_hash;
        entry.entry_hash = row.entry_hash;
        result.push_back(std::move(entry));
    }
    return result;
}

size_t AuditLogger::GetEntryCount() const {
    return entry_count_.load();
}

void AuditLogger::OnSafetyEvent(const Event& event) {
    nlohmann::json details = nlohmann::json::object();
    for (const auto& [key, value] : event.metadata) {
        details[key] = value;
    }
    LogAction(EventTypeToString(event.type), "crisis_engine",
              "session:" + event.session_id, details.dump());
}

std::string AuditLogger::ComputeHMAC(const std::string& data) const {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    HMAC(EVP_sha256(),
         hmac_key_.c_str(), static_cast<int>(hmac_key_.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()),
         data.size(),
         result, &result_len);

    std::ostringstream oss;
    for (unsigned int i = 0; i < result_len; i++) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(result[i]);
    }
    return oss.str();
}

// sequence_id is assigned by AUTOINCREMENT after hashing, so it stays out of the digest.
std::string AuditLogger::ComputeEntryHash(const std::string& timestamp_iso,
                                          const std::string& action,
                                          const std::string& actor,
                                          const std::string& target,
                                          const std::string& details,
                                          const std::string& prev_hash) const {
    std::string data;
    data.reserve(timestamp_iso.size() + action.size() + actor.size() +
                 target.size() + details.size() + prev_hash.size() + 5);
    data += timestamp_iso;
    data += '|';
    data += action;
    data += '|';
    data += actor;
    data += '|';
    data += target;
    data += '|';
    data += details;
    data += '|';
    data += prev_hash;
    return ComputeHMAC(data);
}

std::string AuditLogger::TimeRangeClause(uint64_t start_time, uint64_t end_time) {
    if (start_time == 0 || end_time == 0) return "";
    // ISO8601 strings from TimestampToISO8601 compare chronologically
    return "timestamp >= '" + DatabaseManager::TimestampToISO8601(start_time) +
           "' AND timestamp <= '" + DatabaseManager::TimestampToISO8601(end_time) + "'";
}

uint64_t AuditLogger::GetCurrentTimestamp() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace crisisguard
