#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "engine/CrisisEngine.hpp"
#include "engine/RiskLexicon.hpp"
#include "engine/VerdictJson.hpp"
#include "response/PhraseSelector.hpp"
#include "response/ResourceDirectory.hpp"
#include "response/ResponseComposer.hpp"
#include "persistence/DatabaseManager.hpp"
#include "compliance/AuditLogger.hpp"
#include "compliance/SafetyReporter.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace crisisguard {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

struct CommandLine {
    std::string config_path = "config/crisisguard.yaml";
    int stats_days = 0;
    bool verify_audit = false;
    bool health = false;
};

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--stats <days>] [--verify-audit] [--health]\n"
              << "Reads session<TAB>message[<TAB>emotion] lines from stdin.\n"
              << "  !end <session>     end a session\n"
              << "  !report <session>  print the session safety report\n";
}

bool ParseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cmd.config_path = argv[++i];
        } else if (arg == "--stats" && i + 1 < argc) {
            char* end = nullptr;
            long days = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || days <= 0) {
                std::cerr << "--stats expects a positive number of days\n";
                return false;
            }
            cmd.stats_days = static_cast<int>(days);
        } else if (arg == "--verify-audit") {
            cmd.verify_audit = true;
        } else if (arg == "--health") {
            cmd.health = true;
        } else {
            return false;
        }
    }
    return true;
}

class CrisisGuard {
public:
    bool Initialize(const std::string& config_path) {
        if (!LoadEngineConfig(config_path, config_)) {
            LOG_WARN("Using built-in configuration ({} could not be loaded)", config_path);
        }
        try {
            Logger::Initialize(config_.log_path);
        } catch (const std::exception& ex) {
            LOG_WARN("File logging unavailable ({}), logging to stderr only", ex.what());
        }
        if (auto level = ParseLogLevel(config_.log_level)) {
            Logger::SetLevel(*level);
        }

        auto lexicon = std::make_shared<RiskLexicon>(RiskLexicon::Defaults());
        if (!lexicon->LoadFromYaml(config_.rules_path)) {
            LOG_WARN("Failed to load {}, continuing with built-in lexicon", config_.rules_path);
        }

        auto directory = std::make_shared<ResourceDirectory>(ResourceDirectory::Defaults());
        if (!directory->LoadFromYaml(config_.resources_path)) {
            LOG_WARN("Failed to load {}, continuing with built-in resources", config_.resources_path);
        }

        database_ = std::make_unique<DatabaseManager>();
        if (!database_->Initialize(config_.database_path)) {
            LOG_WARN("Failed to initialize DatabaseManager, continuing without persistence");
            database_.reset();
        }

        EventBus::Instance().InitAsyncPool(1);

        if (database_ && config_.audit_enabled) {
            audit_logger_ = std::make_unique<AuditLogger>();
            if (audit_logger_->Initialize(database_.get(), config_.audit_hmac_key)) {
                audit_logger_->Start();
            } else {
                LOG_WARN("Audit logging disabled");
                audit_logger_.reset();
            }
        }

        Language language = LanguageFromString(config_.language).value_or(Language::ARABIC);

        engine_ = std::make_unique<CrisisEngine>(config_, lexicon, database_.get());
        composer_ = std::make_unique<ResponseComposer>(
            directory, MakePhraseSelector(config_.phrase_selection, config_.phrase_seed),
            language, config_.thresholds);
        reporter_ = std::make_unique<SafetyReporter>(database_.get(), engine_.get());

        LOG_INFO("CrisisGuard initialized (language={}, persistence={})",
                 config_.language, database_ ? "sqlite" : "none");
        return true;
    }

    int PrintHealth() const {
        std::cout << HealthToJson(engine_->GetHealth()).dump() << std::endl;
        return 0;
    }

    int PrintStatistics(int days) const {
        auto stats = reporter_->GetStatistics(days);
        if (!stats) {
            std::cerr << "Statistics unavailable\n";
            return 1;
        }
        std::cout << SafetyReporter::StatisticsToJson(*stats).dump() << std::endl;
        return 0;
    }

    int VerifyAudit() const {
        if (!audit_logger_) {
            std::cerr << "Audit log unavailable\n";
            return 1;
        }
        bool valid = audit_logger_->VerifyIntegrity();
        nlohmann::json j;
        j["audit_chain_valid"] = valid;
        j["entries"] = audit_logger_->GetEntryCount();
        std::cout << j.dump() << std::endl;
        return valid ? 0 : 2;
    }

    void Run() {
        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            if (line[0] == '!') {
                HandleCommand(line);
            } else {
                HandleMessage(line);
            }
        }
    }

    void Stop() {
        // Pending audit deliveries must land before the logger unsubscribes
        EventBus::Instance().ShutdownAsyncPool();
        if (audit_logger_) {
            audit_logger_->Stop();
        }
        reporter_.reset();
        composer_.reset();
        engine_.reset();
        if (database_) {
            database_->Shutdown();
        }
        LOG_INFO("CrisisGuard stopped");
    }

private:
    void HandleMessage(const std::string& line) {
        auto first_tab = line.find('\t');
        if (first_tab == std::string::npos || first_tab == 0) {
            PrintError("expected session<TAB>message[<TAB>emotion]");
            return;
        }

        std::string session_id = line.substr(0, first_tab);
        std::string rest = line.substr(first_tab + 1);
        std::optional<std::string> emotion;
        auto second_tab = rest.find('\t');
        if (second_tab != std::string::npos) {
            std::string state = rest.substr(second_tab + 1);
            if (!state.empty()) emotion = state;
            rest.resize(second_tab);
        }

        SafetyVerdict verdict = engine_->Analyze(session_id, rest, emotion);
        EscalationAssessment escalation = engine_->CheckEscalation(session_id, verdict.crisis_level);
        CrisisResponse response = composer_->Compose(verdict);

        nlohmann::json out;
        out["verdict"] = VerdictToJson(verdict);
        out["escalation"] = AssessmentToJson(escalation);
        out["response"] = CrisisResponseToJson(response);
        std::cout << out.dump() << std::endl;
    }

    void HandleCommand(const std::string& line) {
        auto space = line.find(' ');
        std::string command = line.substr(0, space);
        std::string session_id = space == std::string::npos ? "" : line.substr(space + 1);

        if (session_id.empty()) {
            PrintError("missing session id");
            return;
        }

        if (command == "!end") {
            nlohmann::json out;
            out["session_id"] = session_id;
            out["ended"] = engine_->EndSession(session_id);
            std::cout << out.dump() << std::endl;
        } else if (command == "!report") {
            auto report = reporter_->GenerateSessionReport(session_id);
            if (!report) {
                PrintError("report unavailable for session " + session_id);
                return;
            }
            std::cout << SafetyReporter::ReportToJson(*report).dump() << std::endl;
        } else {
            PrintError("unknown command " + command);
        }
    }

    static void PrintError(const std::string& message) {
        nlohmann::json out;
        out["error"] = message;
        std::cout << out.dump() << std::endl;
    }

    EngineConfig config_;
    std::unique_ptr<DatabaseManager> database_;
    std::unique_ptr<AuditLogger> audit_logger_;
    std::unique_ptr<CrisisEngine> engine_;
    std::unique_ptr<ResponseComposer> composer_;
    std::unique_ptr<SafetyReporter> reporter_;
};

} // namespace crisisguard

int main(int argc, char* argv[]) {
    crisisguard::CommandLine cmd;
    if (!crisisguard::ParseCommandLine(argc, argv, cmd)) {
        crisisguard::PrintUsage(argv[0]);
        return 64;
    }

    // stdout carries JSON; logs go to stderr
    crisisguard::Logger::InitializeConsoleOnly(crisisguard::LogLevel::INFO);

    std::signal(SIGINT, crisisguard::SignalHandler);
    std::signal(SIGTERM, crisisguard::SignalHandler);

    try {
        crisisguard::CrisisGuard app;
        if (!app.Initialize(cmd.config_path)) {
            LOG_CRITICAL("Failed to initialize CrisisGuard");
            return 1;
        }

        int rc = 0;
        if (cmd.health) {
            rc = app.PrintHealth();
        } else if (cmd.stats_days > 0) {
            rc = app.PrintStatistics(cmd.stats_days);
        } else if (cmd.verify_audit) {
            rc = app.VerifyAudit();
        } else {
            app.Run();
        }

        app.Stop();
        crisisguard::Logger::Shutdown();
        return rc;
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
        crisisguard::Logger::Shutdown();
        return 1;
    }
}
