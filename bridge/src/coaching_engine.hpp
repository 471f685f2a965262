/**
 * coaching_engine.hpp — One coaching tick per ingested sample
 *
 * ingest() runs the whole pipeline for a session under that session's lock:
 *
 *   RawSignalSample → MetricNormalizer → ScoreAggregator
 *                   → evaluate() against the current RuleConfig
 *                   → CoachingResponse
 *
 * The rule table is held behind a shared_ptr that reloads replace as a
 * whole; each tick takes one snapshot and uses it throughout.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/synchronization/mutex.h>

#include "metric_normalizer.hpp"
#include "metric_vector.hpp"
#include "rule_config.hpp"
#include "session_store.hpp"

namespace interview_coach {

struct CoachingResponse {
    std::string session_id;
    std::string state_id;
    std::string state_name;
    std::string voice_line;
    std::string subtitle;
    std::string tip;
    float confidence = 0.0f;
    float anxiety = 0.0f;
    bool transitioned = false;
    bool blocked_by_cooldown = false;
    std::vector<std::string> transcript_highlights;
    int sample_warnings = 0;
};

class CoachingEngine {
public:
    explicit CoachingEngine(
        std::shared_ptr<const RuleConfig> rules,
        NormalizerConfig normalizer_config = {}
    );

    CoachingEngine(const CoachingEngine&) = delete;
    CoachingEngine& operator=(const CoachingEngine&) = delete;

    /**
     * Evaluate one sample for a session, creating the session on first use.
     * Any sample, including an empty one, yields a response.
     */
    CoachingResponse ingest(const std::string& session_id, const RawSignalSample& sample, int64_t now_ms);

    /**
     * Swap in a new rule table. Ticks already running finish on the old one.
     */
    void swap_rules(std::shared_ptr<const RuleConfig> rules);

    /**
     * Load a rule table from disk and swap it in. On error the current
     * table stays active.
     */
    absl::Status reload_rules(const std::string& path);

    std::shared_ptr<const RuleConfig> rules() const;

    /**
     * State a brand-new session starts in: whichever state an all-neutral
     * vector selects under the current table.
     */
    std::string initial_state_id() const;

    bool close_session(const std::string& session_id);
    std::size_t evict_idle_sessions(int64_t now_ms, int64_t idle_timeout_ms);

    SessionStore& sessions() { return sessions_; }

private:
    SessionState make_session(const std::string& session_id) const;

    MetricNormalizer normalizer_;

    mutable absl::Mutex rules_mutex_;
    std::shared_ptr<const RuleConfig> rules_ ABSL_GUARDED_BY(rules_mutex_);
    std::string initial_state_id_ ABSL_GUARDED_BY(rules_mutex_);

    SessionStore sessions_;
};

} // namespace interview_coach
