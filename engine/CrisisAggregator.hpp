#pragma once

#include "core/Config.hpp"
#include "engine/CrisisTypes.hpp"

namespace crisisguard {

struct AggregationResult {
    int crisis_level{0};
    SeverityBreakdown breakdown;
};

// Fuses category, pattern and session-context signals into one crisis level and
// picks the crisis type.
class CrisisAggregator {
public:
    explicit CrisisAggregator(const AggregationWeights& weights = AggregationWeights{});

    // Throws DetectionError when the weighted score is not a finite number.
    AggregationResult Aggregate(const CategoryAnalysis& categories,
                                const PatternAnalysis& patterns,
                                const ContextSignals& context) const;

    // First match wins: suicide, self_harm, violence, psychosis, substance_abuse,
    // hopelessness, isolation, then finality/goodbye patterns, else emotional_distress.
    static CrisisType Classify(const CategoryAnalysis& categories,
                               const PatternAnalysis& patterns);

    const AggregationWeights& GetWeights() const { return weights_; }

private:
    double ContextBonus(const CategoryAnalysis& categories, const ContextSignals& context) const;

    AggregationWeights weights_;
};

} // namespace crisisguard
