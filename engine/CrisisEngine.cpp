#include "engine/CrisisEngine.hpp"
#include "engine/TextAnalysisService.hpp"
#include "persistence/CrisisEventStore.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/ThreadPool.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

namespace crisisguard {

namespace {

constexpr const char* kRedactedMessage = "[redacted]";

} // namespace

CrisisEngine::CrisisEngine(const EngineConfig& config,
                           std::shared_ptr<const RiskLexicon> lexicon,
                           CrisisEventStore* store,
                           std::shared_ptr<TextAnalysisService> analyzer)
    : CrisisEngine(config, lexicon,
                   std::make_unique<CategoryMatcher>(lexicon),
                   std::make_unique<PatternDetector>(lexicon),
                   store, std::move(analyzer)) {
}

CrisisEngine::CrisisEngine(const EngineConfig& config,
                           std::shared_ptr<const RiskLexicon> lexicon,
                           std::unique_ptr<CategoryMatcher> matcher,
                           std::unique_ptr<PatternDetector> detector,
                           CrisisEventStore* store,
                           std::shared_ptr<TextAnalysisService> analyzer)
    : config_(config),
      language_(LanguageFromString(config.language).value_or(Language::ARABIC)),
      lexicon_(std::move(lexicon)),
      matcher_(std::move(matcher)),
      detector_(std::move(detector)),
      aggregator_(config.weights),
      evaluator_(config.thresholds, config.escalation, language_),
      tracker_(config.session, store),
      store_(store),
      analyzer_(std::move(analyzer)) {
    if (!lexicon_ || !matcher_ || !detector_) {
        throw std::invalid_argument("CrisisEngine requires a lexicon, a matcher and a detector");
    }

    StartExternalAnalyzer();

    LOG_INFO("CrisisEngine initialized ({} categories, {} patterns, language={}, store={})",
            lexicon_->GetLoadedCategoryCount(), lexicon_->GetLoadedPatternCount(),
            LanguageToString(language_), store_ ? "attached" : "none");
}

CrisisEngine::~CrisisEngine() {
    if (analyzer_pool_) {
        analyzer_pool_->Shutdown();
    }
}

void CrisisEngine::StartExternalAnalyzer() {
    if (!analyzer_) {
        return;
    }
    if (!config_.external_analyzer.enabled) {
        LOG_INFO("External analyzer supplied but disabled in configuration");
        return;
    }

    analyzer_pool_ = std::make_unique<ThreadPool>(config_.external_analyzer.worker_threads,
                                                  config_.external_analyzer.max_pending);
    LOG_INFO("External analyzer enabled (timeout={}ms, workers={}, max_pending={})",
            config_.external_analyzer.timeout_ms,
            analyzer_pool_->GetActiveThreadCount(),
            analyzer_pool_->GetMaxPending());
}

SafetyVerdict CrisisEngine::Analyze(const std::string& session_id,
                                    const std::string& message,
                                    const std::optional<std::string>& emotional_state) {
    bool created = false;
    auto state = tracker_.Acquire(session_id, &created);
    if (created) {
        EventBus::Instance().PublishAsync(Event(EventType::SESSION_STARTED, session_id));
    }

    // One analysis per session at a time: context is read and the resulting
    // event appended under the same lock.
    std::lock_guard<std::mutex> analysis_lock(state->analysis_mutex);
    analyses_total_++;

    SafetyVerdict verdict;
    verdict.session_id = session_id;

    try {
        verdict.indicators.categories = matcher_->Match(message);
        verdict.indicators.patterns = detector_->Detect(message);
        verdict.indicators.context = tracker_.GetContext(session_id);

        AggregationResult result = aggregator_.Aggregate(verdict.indicators.categories,
                                                         verdict.indicators.patterns,
                                                         verdict.indicators.context);
        verdict.crisis_level = result.crisis_level;
        verdict.breakdown = result.breakdown;
        verdict.crisis_type = CrisisAggregator::Classify(verdict.indicators.categories,
                                                         verdict.indicators.patterns);
    } catch (const std::exception& ex) {
        fallback_total_++;
        LOG_ERROR("Crisis detection failed for session {}: {}", session_id, ex.what());

        Event failure(EventType::DETECTOR_FAILURE, session_id);
        failure.metadata["error"] = ex.what();
        EventBus::Instance().PublishAsync(failure);

        if (emotional_state) {
            tracker_.RecordEmotionalState(session_id, *emotional_state);
        }
        return MakeFallbackVerdict(session_id, ex.what());
    }

    ApplyExternalEstimate(session_id, message, verdict);

    verdict.urgency = evaluator_.AssessUrgency(verdict.crisis_level, verdict.crisis_type,
                                               verdict.indicators.context);
    verdict.requires_intervention = verdict.crisis_level >= config_.thresholds.high;

    std::optional<CrisisEvent> recorded;
    if (verdict.crisis_level >= config_.thresholds.medium) {
        std::vector<RiskCategory> categories;
        for (const auto& [category, match] : verdict.indicators.categories.matches) {
            categories.push_back(category);
        }
        recorded = tracker_.RecordEvent(session_id, verdict.crisis_level,
                                        verdict.crisis_type, categories);
    }

    EscalationAssessment assessment = evaluator_.Evaluate(
        tracker_.RecentEvents(session_id, config_.session.max_events), verdict.crisis_level);
    verdict.requires_escalation = assessment.escalation_needed;
    verdict.recommendations = evaluator_.SafetyRecommendations(verdict.urgency);

    if (recorded) {
        PersistEvent(*recorded, verdict, message);
    }

    if (emotional_state) {
        tracker_.RecordEmotionalState(session_id, *emotional_state);
    }

    LOG_DEBUG("Session {}: level={} type={} urgency={} escalate={}",
             session_id, verdict.crisis_level, CrisisTypeToString(verdict.crisis_type),
             UrgencyToString(verdict.urgency), verdict.requires_escalation);

    PublishVerdict(verdict, assessment, recorded.has_value());
    return verdict;
}

void CrisisEngine::ApplyExternalEstimate(const std::string& session_id,
                                         const std::string& message,
                                         SafetyVerdict& verdict) {
    if (!analyzer_pool_) {
        return;
    }

    std::string failure_reason;
    try {
        auto analyzer = analyzer_;
        auto future = analyzer_pool_->Enqueue([analyzer, message]() {
            return analyzer->EstimateCrisisLevel(message);
        });

        auto timeout = std::chrono::milliseconds(config_.external_analyzer.timeout_ms);
        if (future.wait_for(timeout) == std::future_status::ready) {
            std::optional<int> estimate = future.get();
            if (estimate) {
                int level = std::clamp(*estimate, 0, 10);
                verdict.breakdown.external_estimate = level;
                if (level > verdict.crisis_level) {
                    LOG_DEBUG("External analyzer raised session {} from {} to {}",
                             session_id, verdict.crisis_level, level);
                    verdict.crisis_level = level;
                }
            }
            return;
        }
        failure_reason = "timed out after " + std::to_string(config_.external_analyzer.timeout_ms) + "ms";
    } catch (const PoolRejectedError& ex) {
        failure_reason = ex.what();
    } catch (const std::exception& ex) {
        failure_reason = ex.what();
    }

    LOG_WARN("External analyzer unavailable for session {} ({}), using local detectors",
            session_id, failure_reason);
    Event failure(EventType::EXTERNAL_ANALYZER_FAILURE, session_id);
    failure.metadata["error"] = failure_reason;
    EventBus::Instance().PublishAsync(failure);
}

SafetyVerdict CrisisEngine::MakeFallbackVerdict(const std::string& session_id,
                                                const std::string& error) const {
    SafetyVerdict verdict;
    verdict.session_id = session_id;
    verdict.crisis_level = kFallbackCrisisLevel;
    verdict.crisis_type = CrisisType::UNKNOWN;
    verdict.urgency = Urgency::HIGH;
    verdict.requires_intervention = true;
    verdict.requires_escalation = false;
    verdict.fallback = true;
    verdict.error = error;
    verdict.recommendations = evaluator_.SafetyRecommendations(Urgency::HIGH);
    return verdict;
}

void CrisisEngine::PersistEvent(const CrisisEvent& event,
                                const SafetyVerdict& verdict,
                                const std::string& message) {
    if (!store_) {
        return;
    }

    EventAnnotations annotations;
    annotations.escalated = verdict.requires_escalation;
    annotations.follow_up_needed = verdict.requires_intervention;
    annotations.user_message = config_.redact_messages ? kRedactedMessage : message;

    std::string failure_reason;
    try {
        if (store_->AppendEvent(event.session_id, event, annotations)) {
            return;
        }
        failure_reason = "store rejected the event";
    } catch (const std::exception& ex) {
        failure_reason = ex.what();
    }

    LOG_ERROR("Failed to persist crisis event for session {}: {}", event.session_id, failure_reason);
    Event failure(EventType::STORE_FAILURE, event.session_id);
    failure.metadata["operation"] = "append_event";
    failure.metadata["error"] = failure_reason;
    EventBus::Instance().PublishAsync(failure);
}

void CrisisEngine::PublishVerdict(const SafetyVerdict& verdict,
                                  const EscalationAssessment& assessment,
                                  bool event_recorded) {
    auto& bus = EventBus::Instance();

    Event analyzed(EventType::MESSAGE_ANALYZED, verdict.session_id);
    analyzed.metadata["crisis_level"] = std::to_string(verdict.crisis_level);
    analyzed.metadata["crisis_type"] = CrisisTypeToString(verdict.crisis_type);
    analyzed.metadata["urgency"] = UrgencyToString(verdict.urgency);
    bus.PublishAsync(analyzed);

    if (event_recorded) {
        Event detected(EventType::CRISIS_DETECTED, verdict.session_id);
        detected.metadata = analyzed.metadata;
        detected.metadata["requires_intervention"] = verdict.requires_intervention ? "true" : "false";
        bus.PublishAsync(detected);
    }

    if (verdict.requires_escalation) {
        LOG_WARN("Escalation required for session {} (level={}, tier={})",
                verdict.session_id, verdict.crisis_level, EscalationTierToString(assessment.tier));

        Event escalation(EventType::ESCALATION_REQUIRED, verdict.session_id);
        escalation.metadata["crisis_level"] = std::to_string(verdict.crisis_level);
        escalation.metadata["tier"] = EscalationTierToString(assessment.tier);
        escalation.metadata["sustained_high_risk"] = assessment.criteria_met.sustained_high_risk ? "true" : "false";
        escalation.metadata["increasing_severity"] = assessment.criteria_met.increasing_severity ? "true" : "false";
        escalation.metadata["failed_interventions"] = assessment.criteria_met.failed_interventions ? "true" : "false";
        escalation.metadata["immediate_danger"] = assessment.criteria_met.immediate_danger ? "true" : "false";
        bus.PublishAsync(escalation);
    }
}

EscalationAssessment CrisisEngine::CheckEscalation(const std::string& session_id,
                                                   int current_crisis_level) const {
    int level = std::clamp(current_crisis_level, 0, 10);
    return evaluator_.Evaluate(tracker_.RecentEvents(session_id, config_.session.max_events), level);
}

bool CrisisEngine::EndSession(const std::string& session_id) {
    uint32_t total_events = tracker_.GetTotalEventCount(session_id);
    if (!tracker_.EndSession(session_id)) {
        LOG_DEBUG("EndSession for unknown session {}", session_id);
        return false;
    }

    Event ended(EventType::SESSION_ENDED, session_id);
    ended.metadata["crisis_events"] = std::to_string(total_events);
    EventBus::Instance().PublishAsync(ended);

    LOG_INFO("Session {} ended ({} crisis events)", session_id, total_events);
    return true;
}

EngineHealth CrisisEngine::GetHealth() const {
    EngineHealth health;
    health.categories_loaded = lexicon_->GetLoadedCategoryCount();
    health.patterns_loaded = lexicon_->GetLoadedPatternCount();
    health.triggers_loaded = lexicon_->GetTermCount();
    health.active_sessions = tracker_.ActiveSessionCount();
    health.thresholds = config_.thresholds;
    health.external_analyzer_enabled = analyzer_pool_ != nullptr;
    health.external_analyzer_queue = analyzer_pool_ ? analyzer_pool_->GetQueueSize() : 0;
    health.analyses_total = analyses_total_.load();
    health.fallback_total = fallback_total_.load();
    health.status = health.categories_loaded > 0 ? "healthy" : "degraded";
    return health;
}

} // namespace crisisguard
