#include "coaching_state_machine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "test_rules.hpp"

namespace interview_coach {
namespace {

using testing::build_rules;
using testing::clause;
using testing::make_state;
using testing::scores;
using testing::vector_with;

class CoachingStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        CoachingPolicy policy;
        policy.override_margin = 10;
        policy.history_capacity = 4;
        rules_ = build_rules({
            make_state("calm", 0, 3000, {}, true),
            make_state("high_confidence", 5, 5000,
                       {clause(ScoreField::CONFIDENCE, Comparator::GREATER_EQUAL, 0.8f)}),
            make_state("anxiety_alert", 50, 1000,
                       {clause(ScoreField::ANXIETY, Comparator::GREATER_EQUAL, 0.6f)}),
            make_state("low_confidence", 3, 5000,
                       {clause(ScoreField::CONFIDENCE, Comparator::LESS_EQUAL, 0.45f)}),
        }, policy);
        ASSERT_NE(rules_, nullptr);
    }

    SessionState session_in(const std::string& state_id, std::optional<int64_t> entered_at) const {
        SessionState session;
        session.session_id = "s1";
        session.current_state_id = state_id;
        session.entered_state_at_ms = entered_at;
        session.metric_history = MetricHistory(rules_->policy().history_capacity);
        return session;
    }

    std::shared_ptr<const RuleConfig> rules_;
    MetricVector vector_ = vector_with({{MetricField::FACIAL_POSITIVITY, 0.9f}});
};

TEST_F(CoachingStateMachineTest, FreshSessionMovesToMatchingState) {
    Evaluation result = evaluate(session_in("calm", std::nullopt), vector_, scores(0.9f, 0.1f), *rules_, 100);

    EXPECT_TRUE(result.transitioned);
    EXPECT_EQ(result.next_state_id(), "high_confidence");
    EXPECT_EQ(result.response().tip, "high_confidence tip");
    EXPECT_EQ(result.session.current_state_id, "high_confidence");
    EXPECT_EQ(result.session.entered_state_at_ms, 100);
    ASSERT_EQ(result.session.metric_history.size(), 1u);
    EXPECT_EQ(result.session.metric_history.back(), vector_);
}

TEST_F(CoachingStateMachineTest, NeutralScoresStayOnDefault) {
    Evaluation result = evaluate(session_in("calm", std::nullopt), MetricVector{}, scores(0.5f, 0.5f), *rules_, 0);

    EXPECT_FALSE(result.transitioned);
    EXPECT_EQ(result.next_state_id(), "calm");
    EXPECT_FALSE(result.session.entered_state_at_ms.has_value());
    EXPECT_TRUE(result.session.metric_history.empty());
}

TEST_F(CoachingStateMachineTest, CooldownBlocksLowerGapCandidate) {
    Evaluation result = evaluate(session_in("calm", 1000), vector_, scores(0.9f, 0.1f), *rules_, 3000);

    EXPECT_FALSE(result.transitioned);
    EXPECT_TRUE(result.blocked_by_cooldown);
    EXPECT_EQ(result.next_state_id(), "calm");
    EXPECT_EQ(result.candidate->id, "high_confidence");
    EXPECT_EQ(result.response().tip, "calm tip");
    EXPECT_EQ(result.session.entered_state_at_ms, 1000);
    EXPECT_TRUE(result.session.metric_history.empty());
}

TEST_F(CoachingStateMachineTest, CooldownElapsesExactlyAtBoundary) {
    Evaluation early = evaluate(session_in("calm", 1000), vector_, scores(0.9f, 0.1f), *rules_, 3999);
    Evaluation boundary = evaluate(session_in("calm", 1000), vector_, scores(0.9f, 0.1f), *rules_, 4000);

    EXPECT_FALSE(early.transitioned);
    EXPECT_TRUE(boundary.transitioned);
    EXPECT_EQ(boundary.next_state_id(), "high_confidence");
    EXPECT_EQ(boundary.session.entered_state_at_ms, 4000);
}

TEST_F(CoachingStateMachineTest, OverrideStatePreemptsCooldown) {
    Evaluation result = evaluate(session_in("calm", 1000), vector_, scores(0.5f, 0.8f), *rules_, 1500);

    EXPECT_TRUE(result.transitioned);
    EXPECT_TRUE(result.override_applied);
    EXPECT_FALSE(result.blocked_by_cooldown);
    EXPECT_EQ(result.next_state_id(), "anxiety_alert");
    EXPECT_EQ(result.response().tip, "anxiety_alert tip");
    EXPECT_EQ(result.session.entered_state_at_ms, 1500);
}

TEST_F(CoachingStateMachineTest, HigherPriorityBelowMarginWaitsForCooldown) {
    // high_confidence (5) over low_confidence (3): gap 2 < margin 10
    Evaluation result = evaluate(session_in("low_confidence", 0), vector_, scores(0.9f, 0.1f), *rules_, 1000);

    EXPECT_FALSE(result.transitioned);
    EXPECT_TRUE(result.blocked_by_cooldown);
    EXPECT_EQ(result.next_state_id(), "low_confidence");
}

TEST_F(CoachingStateMachineTest, OverrideMarginIsInclusive) {
    StateDefinition current = make_state("a", 5, 0);
    StateDefinition exact = make_state("b", 15, 0);
    StateDefinition short_of = make_state("c", 14, 0);

    EXPECT_TRUE(is_override(exact, current, 10));
    EXPECT_FALSE(is_override(short_of, current, 10));
    EXPECT_FALSE(is_override(current, exact, 10));
}

TEST_F(CoachingStateMachineTest, StayingInStateKeepsDwellTimerAndHistory) {
    SessionState session = session_in("high_confidence", 200);
    session.metric_history.push(vector_);

    Evaluation result = evaluate(session, vector_, scores(0.9f, 0.1f), *rules_, 9000);

    EXPECT_FALSE(result.transitioned);
    EXPECT_FALSE(result.blocked_by_cooldown);
    EXPECT_EQ(result.session.entered_state_at_ms, 200);
    EXPECT_EQ(result.session.metric_history.size(), 1u);
    EXPECT_EQ(result.session.last_tick_at_ms, 9000);
    ASSERT_TRUE(result.session.last_vector.has_value());
    EXPECT_EQ(*result.session.last_vector, vector_);
}

TEST_F(CoachingStateMachineTest, UnknownCurrentStateMovesImmediately) {
    Evaluation result = evaluate(session_in("retired_state", 1000), vector_, scores(0.5f, 0.5f), *rules_, 1001);

    EXPECT_TRUE(result.transitioned);
    EXPECT_EQ(result.next_state_id(), "calm");
}

TEST_F(CoachingStateMachineTest, SameInputsGiveSameResult) {
    SessionState session = session_in("calm", 1000);

    Evaluation a = evaluate(session, vector_, scores(0.5f, 0.8f), *rules_, 1500);
    Evaluation b = evaluate(session, vector_, scores(0.5f, 0.8f), *rules_, 1500);

    EXPECT_EQ(a.state, b.state);
    EXPECT_EQ(a.transitioned, b.transitioned);
    EXPECT_EQ(a.session.entered_state_at_ms, b.session.entered_state_at_ms);
    EXPECT_EQ(a.session.current_state_id, b.session.current_state_id);
}

TEST_F(CoachingStateMachineTest, AlwaysSelectsSomeState) {
    const float grid[] = {0.0f, 0.3f, 0.45f, 0.6f, 0.8f, 1.0f};
    for (float confidence : grid) {
        for (float anxiety : grid) {
            Evaluation result = evaluate(session_in("calm", 0), MetricVector{},
                                         scores(confidence, anxiety), *rules_, 100000);
            ASSERT_NE(result.state, nullptr);
            ASSERT_NE(result.candidate, nullptr);
            EXPECT_NE(rules_->find(result.next_state_id()), nullptr);
        }
    }
}

TEST_F(CoachingStateMachineTest, HistoryKeepsOnlyMostRecentTransitions) {
    SessionState session = session_in("calm", std::nullopt);
    session.metric_history = MetricHistory(2);

    MetricVector v1 = vector_with({{MetricField::FACIAL_ANXIETY, 0.1f}});
    MetricVector v2 = vector_with({{MetricField::FACIAL_ANXIETY, 0.2f}});
    MetricVector v3 = vector_with({{MetricField::FACIAL_ANXIETY, 0.3f}});

    // calm → high_confidence → calm → anxiety_alert, each after cooldown
    session = evaluate(std::move(session), v1, scores(0.9f, 0.1f), *rules_, 0).session;
    session = evaluate(std::move(session), v2, scores(0.5f, 0.1f), *rules_, 10000).session;
    session = evaluate(std::move(session), v3, scores(0.5f, 0.9f), *rules_, 20000).session;

    EXPECT_EQ(session.current_state_id, "anxiety_alert");
    ASSERT_EQ(session.metric_history.size(), 2u);
    EXPECT_EQ(session.metric_history[0], v2);
    EXPECT_EQ(session.metric_history[1], v3);
}

} // namespace
} // namespace interview_coach
