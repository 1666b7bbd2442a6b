#pragma once

#include "core/Config.hpp"
#include "engine/CategoryMatcher.hpp"
#include "engine/CrisisAggregator.hpp"
#include "engine/CrisisTypes.hpp"
#include "engine/EscalationEvaluator.hpp"
#include "engine/PatternDetector.hpp"
#include "engine/RiskLexicon.hpp"
#include "engine/SessionContextTracker.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace crisisguard {

class CrisisEventStore;
class TextAnalysisService;
class ThreadPool;

struct EngineHealth {
    std::string status;
    size_t categories_loaded{0};
    size_t patterns_loaded{0};
    size_t triggers_loaded{0};
    size_t active_sessions{0};
    CrisisThresholds thresholds;
    bool external_analyzer_enabled{false};
    size_t external_analyzer_queue{0};
    uint64_t analyses_total{0};
    uint64_t fallback_total{0};
};

class CrisisEngine {
public:
    CrisisEngine(const EngineConfig& config,
                 std::shared_ptr<const RiskLexicon> lexicon,
                 CrisisEventStore* store = nullptr,
                 std::shared_ptr<TextAnalysisService> analyzer = nullptr);

    // Lets callers substitute the detectors (tests use a throwing matcher).
    CrisisEngine(const EngineConfig& config,
                 std::shared_ptr<const RiskLexicon> lexicon,
                 std::unique_ptr<CategoryMatcher> matcher,
                 std::unique_ptr<PatternDetector> detector,
                 CrisisEventStore* store = nullptr,
                 std::shared_ptr<TextAnalysisService> analyzer = nullptr);

    ~CrisisEngine();

    CrisisEngine(const CrisisEngine&) = delete;
    CrisisEngine& operator=(const CrisisEngine&) = delete;

    // Never throws for detection problems: a failing detector yields the
    // conservative fallback verdict (fallback == true).
    SafetyVerdict Analyze(const std::string& session_id,
                          const std::string& message,
                          const std::optional<std::string>& emotional_state = std::nullopt);

    EscalationAssessment CheckEscalation(const std::string& session_id,
                                         int current_crisis_level) const;

    bool EndSession(const std::string& session_id);

    EngineHealth GetHealth() const;

    const EngineConfig& GetConfig() const { return config_; }
    const SessionContextTracker& GetTracker() const { return tracker_; }
    Language GetLanguage() const { return language_; }

    static constexpr int kFallbackCrisisLevel = 8;

private:
    void StartExternalAnalyzer();
    void ApplyExternalEstimate(const std::string& session_id,
                               const std::string& message,
                               SafetyVerdict& verdict);
    SafetyVerdict MakeFallbackVerdict(const std::string& session_id,
                                      const std::string& error) const;
    void PersistEvent(const CrisisEvent& event,
                      const SafetyVerdict& verdict,
                      const std::string& message);
    void PublishVerdict(const SafetyVerdict& verdict,
                        const EscalationAssessment& assessment,
                        bool event_recorded);

    EngineConfig config_;
    Language language_;
    std::shared_ptr<const RiskLexicon> lexicon_;
    std::unique_ptr<CategoryMatcher> matcher_;
    std::unique_ptr<PatternDetector> detector_;
    CrisisAggregator aggregator_;
    EscalationEvaluator evaluator_;
    SessionContextTracker tracker_;

    CrisisEventStore* store_{nullptr};
    std::shared_ptr<TextAnalysisService> analyzer_;
    std::unique_ptr<ThreadPool> analyzer_pool_;

    std::atomic<uint64_t> analyses_total_{0};
    std::atomic<uint64_t> fallback_total_{0};
};

} // namespace crisisguard
