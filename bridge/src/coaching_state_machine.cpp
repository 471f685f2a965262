/**
 * coaching_state_machine.cpp — Implementation
 */

#include "coaching_state_machine.hpp"

#include <utility>

#include <glog/logging.h>

namespace interview_coach {

bool is_override(const StateDefinition& candidate, const StateDefinition& current, int override_margin) {
    int64_t gap = static_cast<int64_t>(candidate.priority) - static_cast<int64_t>(current.priority);
    return gap >= static_cast<int64_t>(override_margin);
}

Evaluation evaluate(
    SessionState session,
    const MetricVector& vector,
    const ScorePair& scores,
    const RuleConfig& config,
    int64_t now_ms
) {
    Evaluation result;

    const StateDefinition& candidate = config.select_candidate(vector, scores);
    result.candidate = &candidate;

    // A state id from a table that has since been reloaded away no longer
    // has a cooldown to honour.
    const StateDefinition* current = config.find(session.current_state_id);

    bool permitted = false;
    if (current == nullptr) {
        permitted = true;
    } else if (current == &candidate) {
        permitted = false;
    } else if (!session.entered_state_at_ms) {
        permitted = true;
    } else if (now_ms - *session.entered_state_at_ms >= current->cooldown_ms) {
        permitted = true;
    } else if (is_override(candidate, *current, config.policy().override_margin)) {
        permitted = true;
        result.override_applied = true;
    } else {
        result.blocked_by_cooldown = true;
        VLOG(2) << "session " << session.session_id << ": '" << candidate.id
                << "' blocked by cooldown of '" << current->id << "' ("
                << (now_ms - *session.entered_state_at_ms) << "/" << current->cooldown_ms << " ms)";
    }

    if (permitted) {
        VLOG(1) << "session " << session.session_id << ": "
                << (current ? current->id : session.current_state_id) << " -> " << candidate.id
                << (result.override_applied ? " (override)" : "");
        session.current_state_id = candidate.id;
        session.entered_state_at_ms = now_ms;
        session.metric_history.push(vector);
        result.transitioned = true;
        result.state = &candidate;
    } else {
        result.state = current;
    }

    session.last_vector = vector;
    session.last_tick_at_ms = now_ms;
    result.session = std::move(session);
    return result;
}

} // namespace interview_coach
