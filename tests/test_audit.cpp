#include <gtest/gtest.h>
#include "compliance/AuditLogger.hpp"
#include "persistence/DatabaseManager.hpp"
#include "core/EventBus.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace crisisguard;

class AuditLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        EventBus::Instance().Clear();

        db_ = std::make_unique<DatabaseManager>();
        ASSERT_TRUE(db_->Initialize(":memory:"));

        logger_ = std::make_unique<AuditLogger>();
        ASSERT_TRUE(logger_->Initialize(db_.get(), "test-hmac-key-12345"));
    }

    void TearDown() override {
        logger_.reset();
        db_->Shutdown();
        db_.reset();
        EventBus::Instance().Clear();
    }

    std::unique_ptr<DatabaseManager> db_;
    std::unique_ptr<AuditLogger> logger_;
};

TEST_F(AuditLoggerTest, RejectsMissingDatabaseOrKey) {
    AuditLogger logger;
    EXPECT_FALSE(logger.Initialize(nullptr, "key"));
    EXPECT_FALSE(logger.Initialize(db_.get(), ""));
    EXPECT_FALSE(logger.LogAction("ACTION", "actor", "target"));

    DatabaseManager closed;
    EXPECT_FALSE(logger.Initialize(&closed, "key"));
}

TEST_F(AuditLoggerTest, LogActionChainsEntries) {
    EXPECT_TRUE(logger_->LogAction("ACTION_1", "system", "target1", "details1"));
    EXPECT_TRUE(logger_->LogAction("ACTION_2", "system", "target2", "details2"));
    EXPECT_TRUE(logger_->LogAction("ACTION_3", "system", "target3", "details3"));
    EXPECT_EQ(logger_->GetEntryCount(), 3u);

    auto entries = logger_->QueryEntries(0, 0, 100);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].action, "ACTION_1");
    EXPECT_EQ(entries[0].prev_hash, AuditLogger::kGenesisHash);
    EXPECT_EQ(entries[1].prev_hash, entries[0].entry_hash);
    EXPECT_EQ(entries[2].prev_hash, entries[1].entry_hash);
    EXPECT_EQ(entries[0].entry_hash.size(), 64u);

    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, EmptyChainVerifies) {
    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, WrongKeyFailsVerification) {
    logger_->LogAction("ACTION_1", "system", "target1", "details1");

    AuditLogger other;
    ASSERT_TRUE(other.Initialize(db_.get(), "a-different-key"));
    EXPECT_FALSE(other.VerifyIntegrity());
}

TEST_F(AuditLoggerTest, ResumesChainAfterRestart) {
    logger_->LogAction("ACTION_1", "system", "target1", "");
    logger_->LogAction("ACTION_2", "system", "target2", "");

    AuditLogger resumed;
    ASSERT_TRUE(resumed.Initialize(db_.get(), "test-hmac-key-12345"));
    EXPECT_EQ(resumed.GetEntryCount(), 2u);
    EXPECT_TRUE(resumed.LogAction("ACTION_3", "system", "target3", ""));
    EXPECT_TRUE(resumed.VerifyIntegrity());
    EXPECT_EQ(resumed.GetEntryCount(), 3u);
}

TEST_F(AuditLoggerTest, RecordsSafetyEventsWhileRunning) {
    logger_->Start();
    EXPECT_TRUE(logger_->IsRunning());

    Event detected(EventType::CRISIS_DETECTED, "abc");
    detected.metadata["crisis_level"] = "9";
    EventBus::Instance().Publish(detected);
    EventBus::Instance().Publish(Event(EventType::MESSAGE_ANALYZED, "abc"));
    EventBus::Instance().Publish(Event(EventType::SESSION_ENDED, "abc"));

    logger_->Stop();
    EXPECT_FALSE(logger_->IsRunning());

    // Published after Stop: not recorded
    EventBus::Instance().Publish(Event(EventType::CRISIS_DETECTED, "late"));

    auto entries = logger_->QueryEntries(0, 0, 100);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].action, "AUDIT_STARTED");
    EXPECT_EQ(entries[1].action, "CRISIS_DETECTED");
    EXPECT_EQ(entries[1].actor, "crisis_engine");
    EXPECT_EQ(entries[1].target, "session:abc");
    EXPECT_EQ(nlohmann::json::parse(entries[1].details).at("crisis_level"), "9");
    EXPECT_EQ(entries[2].action, "SESSION_ENDED");
    EXPECT_EQ(entries[3].action, "AUDIT_STOPPED");
    EXPECT_TRUE(logger_->VerifyIntegrity());
}

TEST_F(AuditLoggerTest, ExportAuditLogWritesChain) {
    logger_->LogAction("EXPORT_TEST", "system", "target", "export details");

    auto export_path = std::filesystem::temp_directory_path() / "crisisguard_audit_export.json";
    ASSERT_TRUE(logger_->ExportAuditLog(0, 0, export_path.string()));

    std::ifstream in(export_path);
    ASSERT_TRUE(in.is_open());
    nlohmann::json exported = nlohmann::json::parse(in);
    EXPECT_EQ(exported["entry_count"], 1);
    EXPECT_TRUE(exported["chain_valid"].get<bool>());
    EXPECT_EQ(exported["entries"][0]["action"], "EXPORT_TEST");

    in.close();
    std::filesystem::remove(export_path);
}

class AuditTamperTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "crisisguard_audit_tamper.db";
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        std::filesystem::remove(path_.string() + "-wal");
        std::filesystem::remove(path_.string() + "-shm");
    }

    std::filesystem::path path_;
};

TEST_F(AuditTamperTest, ModifiedEntryBreaksChain) {
    DatabaseManager db;
    ASSERT_TRUE(db.Initialize(path_.string()));

    AuditLogger logger;
    ASSERT_TRUE(logger.Initialize(&db, "tamper-key"));
    logger.LogAction("ESCALATION_REQUIRED", "crisis_engine", "session:s1", "{\"crisis_level\":\"9\"}");
    logger.LogAction("SESSION_ENDED", "crisis_engine", "session:s1", "{}");
    ASSERT_TRUE(logger.VerifyIntegrity());

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(path_.string().c_str(), &raw), SQLITE_OK);
    char* err = nullptr;
    int rc = sqlite3_exec(raw,
        "UPDATE audit_log SET details = '{\"crisis_level\":\"2\"}' "
        "WHERE action = 'ESCALATION_REQUIRED'", nullptr, nullptr, &err);
    sqlite3_free(err);
    sqlite3_close(raw);
    ASSERT_EQ(rc, SQLITE_OK);

    EXPECT_FALSE(logger.VerifyIntegrity());
    db.Shutdown();
}
