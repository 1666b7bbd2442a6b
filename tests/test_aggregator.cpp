#include <gtest/gtest.h>
#include "engine/CrisisAggregator.hpp"
#include <limits>

using namespace crisisguard;

class AggregatorTest : public ::testing::Test {
protected:
    static CategoryAnalysis Categories(double total, std::vector<RiskCategory> present,
                                       std::vector<RiskCategory> high_risk = {}) {
        CategoryAnalysis analysis;
        for (auto category : present) {
            analysis.matches[category] = CategoryMatch{{"term"}, 1, 1.0};
        }
        analysis.total_severity = total;
        analysis.high_risk_categories = std::move(high_risk);
        return analysis;
    }

    static PatternAnalysis Patterns(double severity, std::vector<RiskPattern> high_risk = {}) {
        PatternAnalysis analysis;
        for (auto pattern : kAllRiskPatterns) {
            analysis.counts[pattern] = 0;
        }
        for (auto pattern : high_risk) {
            analysis.counts[pattern] = 1;
        }
        analysis.severity = severity;
        analysis.high_risk_patterns = std::move(high_risk);
        return analysis;
    }

    CrisisAggregator aggregator_;
};

TEST_F(AggregatorTest, NoSignalIsZero) {
    auto result = aggregator_.Aggregate(Categories(0, {}), Patterns(0), ContextSignals{});
    EXPECT_EQ(result.crisis_level, 0);
    EXPECT_DOUBLE_EQ(result.breakdown.raw_score, 0.0);
}

TEST_F(AggregatorTest, SingleSuicideTerm) {
    auto result = aggregator_.Aggregate(
        Categories(8.0, {RiskCategory::SUICIDE}, {RiskCategory::SUICIDE}),
        Patterns(0), ContextSignals{});

    EXPECT_DOUBLE_EQ(result.breakdown.category_component, 4.0);
    EXPECT_DOUBLE_EQ(result.breakdown.context_bonus, 1.5);
    EXPECT_DOUBLE_EQ(result.breakdown.raw_score, 5.5);
    EXPECT_EQ(result.crisis_level, 6);
}

TEST_F(AggregatorTest, HalfRoundsAwayFromZero) {
    auto result = aggregator_.Aggregate(Categories(5.0, {RiskCategory::HOPELESSNESS}),
                                        Patterns(0), ContextSignals{});
    EXPECT_DOUBLE_EQ(result.breakdown.raw_score, 2.5);
    EXPECT_EQ(result.crisis_level, 3);
}

TEST_F(AggregatorTest, ContextBonuses) {
    ContextSignals context;
    context.escalation_detected = true;
    context.emotional_deterioration = true;
    context.previous_interventions = 2;

    auto result = aggregator_.Aggregate(Categories(0, {}), Patterns(0), context);
    EXPECT_DOUBLE_EQ(result.breakdown.context_bonus, 4.0);
    EXPECT_EQ(result.crisis_level, 4);
}

TEST_F(AggregatorTest, SinglePriorInterventionGivesNoBonus) {
    ContextSignals context;
    context.previous_interventions = 1;
    auto result = aggregator_.Aggregate(Categories(0, {}), Patterns(0), context);
    EXPECT_DOUBLE_EQ(result.breakdown.context_bonus, 0.0);
}

TEST_F(AggregatorTest, LevelIsClampedToTen) {
    ContextSignals context;
    context.escalation_detected = true;
    context.emotional_deterioration = true;
    context.previous_interventions = 9;

    auto result = aggregator_.Aggregate(
        Categories(10.0, {RiskCategory::SUICIDE, RiskCategory::SELF_HARM, RiskCategory::VIOLENCE},
                   {RiskCategory::SUICIDE, RiskCategory::SELF_HARM, RiskCategory::VIOLENCE}),
        Patterns(10.0), context);
    EXPECT_GT(result.breakdown.raw_score, 10.0);
    EXPECT_EQ(result.crisis_level, 10);
}

TEST_F(AggregatorTest, NonFiniteScoreThrows) {
    AggregationWeights weights;
    weights.category_weight = std::numeric_limits<double>::quiet_NaN();
    CrisisAggregator aggregator(weights);

    EXPECT_THROW(aggregator.Aggregate(Categories(1.0, {}), Patterns(0), ContextSignals{}),
                 DetectionError);
}

TEST_F(AggregatorTest, ClassifyFollowsPriority) {
    EXPECT_EQ(CrisisAggregator::Classify(
                  Categories(10, {RiskCategory::VIOLENCE, RiskCategory::SUICIDE}), Patterns(0)),
              CrisisType::SUICIDE_RISK);
    EXPECT_EQ(CrisisAggregator::Classify(
                  Categories(10, {RiskCategory::VIOLENCE, RiskCategory::SELF_HARM}), Patterns(0)),
              CrisisType::SELF_HARM_RISK);
    EXPECT_EQ(CrisisAggregator::Classify(
                  Categories(4, {RiskCategory::PSYCHOSIS, RiskCategory::SUBSTANCE_ABUSE}), Patterns(0)),
              CrisisType::MENTAL_HEALTH_EMERGENCY);
    EXPECT_EQ(CrisisAggregator::Classify(Categories(2, {RiskCategory::HOPELESSNESS}), Patterns(0)),
              CrisisType::SEVERE_DEPRESSION);
    EXPECT_EQ(CrisisAggregator::Classify(Categories(1.5, {RiskCategory::ISOLATION}), Patterns(0)),
              CrisisType::SOCIAL_CRISIS);
}

TEST_F(AggregatorTest, ClassifyFallsBackToPatterns) {
    EXPECT_EQ(CrisisAggregator::Classify(Categories(0, {}),
                                         Patterns(3, {RiskPattern::GOODBYE_MESSAGE})),
              CrisisType::SUICIDE_RISK);
    EXPECT_EQ(CrisisAggregator::Classify(Categories(0, {}),
                                         Patterns(2, {RiskPattern::BURDEN_STATEMENT})),
              CrisisType::EMOTIONAL_DISTRESS);
    EXPECT_EQ(CrisisAggregator::Classify(Categories(0, {}), Patterns(0)),
              CrisisType::EMOTIONAL_DISTRESS);
}
