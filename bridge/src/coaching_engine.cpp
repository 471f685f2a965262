/**
 * coaching_engine.cpp — Implementation
 */

#include "coaching_engine.hpp"

#include <utility>

#include <glog/logging.h>

#include "coaching_state_machine.hpp"
#include "score_aggregator.hpp"

namespace interview_coach {

namespace {

std::string resolve_initial_state(const RuleConfig& rules) {
    MetricVector neutral;
    ScoreAggregator aggregator(AggregatorConfig{rules.policy().smoothing_alpha});
    ScorePair scores = aggregator.aggregate(neutral, MetricHistory(1), 0);
    return rules.select_candidate(neutral, scores).id;
}

void log_rules(const RuleConfig& rules, const std::string& initial_state) {
    LOG(INFO) << "Rule table: " << rules.states().size() << " states, default '"
              << rules.default_state().id << "', initial '" << initial_state
              << "', alpha=" << rules.policy().smoothing_alpha
              << ", override_margin=" << rules.policy().override_margin
              << ", history_capacity=" << rules.policy().history_capacity;
    for (const StateDefinition& state : rules.states()) {
        VLOG(1) << "  state '" << state.id << "' priority=" << state.priority
                << " cooldown_ms=" << state.cooldown_ms << " guard: " << state.guard.describe();
    }
}

} // namespace

CoachingEngine::CoachingEngine(
    std::shared_ptr<const RuleConfig> rules,
    NormalizerConfig normalizer_config
)
    : normalizer_(std::move(normalizer_config))
    , sessions_([this](const std::string& session_id) { return make_session(session_id); })
{
    swap_rules(std::move(rules));
}

void CoachingEngine::swap_rules(std::shared_ptr<const RuleConfig> rules) {
    CHECK(rules != nullptr) << "rule table must not be null";
    std::string initial = resolve_initial_state(*rules);
    log_rules(*rules, initial);

    absl::MutexLock lock(&rules_mutex_);
    rules_ = std::move(rules);
    initial_state_id_ = std::move(initial);
}

absl::Status CoachingEngine::reload_rules(const std::string& path) {
    absl::StatusOr<std::shared_ptr<const RuleConfig>> loaded = RuleConfig::load_from_file(path);
    if (!loaded.ok()) {
        LOG(WARNING) << "Rule reload rejected, keeping current table: " << loaded.status();
        return loaded.status();
    }
    swap_rules(*std::move(loaded));
    return absl::OkStatus();
}

std::shared_ptr<const RuleConfig> CoachingEngine::rules() const {
    absl::MutexLock lock(&rules_mutex_);
    return rules_;
}

std::string CoachingEngine::initial_state_id() const {
    absl::MutexLock lock(&rules_mutex_);
    return initial_state_id_;
}

SessionState CoachingEngine::make_session(const std::string& session_id) const {
    std::shared_ptr<const RuleConfig> rules;
    SessionState session;
    {
        absl::MutexLock lock(&rules_mutex_);
        rules = rules_;
        session.current_state_id = initial_state_id_;
    }
    session.session_id = session_id;
    session.metric_history = MetricHistory(rules->policy().history_capacity);
    return session;
}

CoachingResponse CoachingEngine::ingest(
    const std::string& session_id,
    const RawSignalSample& sample,
    int64_t now_ms
) {
    std::shared_ptr<const RuleConfig> rules = this->rules();

    return sessions_.with_session(session_id, [&](SessionState& session) {
        if (!session.last_vector) {
            session.created_at_ms = now_ms;
        }
        // A reload may have changed the history capacity; adopt it on this tick.
        if (session.metric_history.capacity() != rules->policy().history_capacity) {
            session.metric_history = session.metric_history.resized(rules->policy().history_capacity);
        }

        // ── Normalize ────────────────────────────────────
        NormalizeResult normalized = normalizer_.normalize(
            sample, session.last_vector ? &*session.last_vector : nullptr);
        if (normalized.warnings > 0) {
            LOG(WARNING) << "session " << session_id << ": " << normalized.warnings
                         << " malformed sample field(s) clamped or ignored";
        }

        // ── Score ────────────────────────────────────────
        ScoreAggregator aggregator(AggregatorConfig{rules->policy().smoothing_alpha});
        ScorePair scores = aggregator.aggregate(normalized.vector, session.metric_history, now_ms);

        // ── Select state ─────────────────────────────────
        Evaluation result = evaluate(std::move(session), normalized.vector, scores, *rules, now_ms);
        session = std::move(result.session);

        CoachingResponse response;
        response.session_id = session_id;
        response.state_id = result.state->id;
        response.state_name = result.state->name;
        response.voice_line = result.state->response.voice_line;
        response.subtitle = result.state->response.subtitle;
        response.tip = result.state->response.tip;
        response.confidence = scores.confidence;
        response.anxiety = scores.anxiety;
        response.transitioned = result.transitioned;
        response.blocked_by_cooldown = result.blocked_by_cooldown;
        response.transcript_highlights = std::move(normalized.transcript_highlights);
        response.sample_warnings = normalized.warnings;
        return response;
    });
}

bool CoachingEngine::close_session(const std::string& session_id) {
    bool removed = sessions_.remove(session_id);
    VLOG(1) << "session " << session_id << (removed ? " closed" : " was not open");
    return removed;
}

std::size_t CoachingEngine::evict_idle_sessions(int64_t now_ms, int64_t idle_timeout_ms) {
    std::size_t evicted = sessions_.remove_idle(now_ms, idle_timeout_ms);
    if (evicted > 0) {
        LOG(INFO) << "Evicted " << evicted << " idle session(s)";
    }
    return evicted;
}

} // namespace interview_coach
