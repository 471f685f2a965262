/**
 * coaching_state_machine.hpp — Selects the active coaching state per tick
 *
 * Flat machine, one active state per session:
 *   1. candidates  = states whose guard holds (the default always does)
 *   2. candidate   = highest priority, ties to the earliest declared
 *   3. same state  → stay; dwell timer keeps running
 *   4. other state → move only if the current state's cooldown has
 *                    elapsed, or the candidate outranks the current state
 *                    by at least the override margin
 *   5. on a move   → reset dwell timer, record the vector in history
 *   6. emit the response of whichever state is active afterwards
 *
 * evaluate() is a pure function of its arguments: the session is taken by
 * value and the updated copy is returned in the Evaluation.
 */

#pragma once

#include <cstdint>
#include <string>

#include "metric_vector.hpp"
#include "rule_config.hpp"
#include "score_aggregator.hpp"
#include "session_state.hpp"

namespace interview_coach {

struct Evaluation {
    // Active state after this tick; points into the RuleConfig evaluated against.
    const StateDefinition* state = nullptr;

    // Best candidate this tick, whether or not it became active.
    const StateDefinition* candidate = nullptr;

    bool transitioned = false;
    bool blocked_by_cooldown = false;
    bool override_applied = false;

    SessionState session;

    const std::string& next_state_id() const { return state->id; }
    const StateResponse& response() const { return state->response; }
};

/**
 * True when `candidate` may preempt `current` regardless of cooldown.
 */
bool is_override(const StateDefinition& candidate, const StateDefinition& current, int override_margin);

Evaluation evaluate(
    SessionState session,
    const MetricVector& vector,
    const ScorePair& scores,
    const RuleConfig& config,
    int64_t now_ms
);

} // namespace interview_coach
