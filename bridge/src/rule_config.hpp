/**
 * rule_config.hpp — Immutable table of coaching states
 *
 * Loaded once from a JSON document:
 *
 *   {
 *     "policy": { "smoothing_alpha": 0.4, "override_margin": 10, "history_capacity": 8 },
 *     "states": [
 *       { "id": "anxious", "name": "Anxiety alert", "priority": 50, "cooldown_ms": 0,
 *         "guard": [ { "metric": "anxiety", "operator": ">=", "value": 0.6 } ],
 *         "response": { "voice_line": "...", "subtitle": "...", "tip": "..." } },
 *       { "id": "steady", "default": true, "guard": [], "response": { ... } }
 *     ]
 *   }
 *
 * Every problem with the document is reported at load time with the
 * offending state id and field; a loaded RuleConfig is always valid and is
 * never mutated. Reloading builds a new instance that callers swap in.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "guard.hpp"
#include "metric_vector.hpp"
#include "score_aggregator.hpp"

namespace interview_coach {

struct StateResponse {
    std::string voice_line;
    std::string subtitle;
    std::string tip;
};

struct StateDefinition {
    std::string id;
    std::string name;
    int priority = 0;
    int64_t cooldown_ms = 0;
    bool is_default = false;
    Guard guard;
    StateResponse response;
};

/**
 * Policy values shared by every session evaluated against this table.
 */
struct CoachingPolicy {
    float smoothing_alpha = 0.4f;

    // A candidate whose priority is at least this much above the current
    // state's preempts the current state's cooldown.
    int override_margin = 10;

    std::size_t history_capacity = 8;
};

class RuleConfig {
    // Only build() can mint one; the constructor stays public for make_shared.
    class Key {
        friend class RuleConfig;
        explicit Key() = default;
    };

public:
    RuleConfig(Key, std::vector<StateDefinition> states, CoachingPolicy policy, std::size_t default_index);

    /**
     * Read and validate a rule document from disk.
     */
    static absl::StatusOr<std::shared_ptr<const RuleConfig>> load_from_file(const std::string& path);

    /**
     * Validate a rule document held in memory.
     */
    static absl::StatusOr<std::shared_ptr<const RuleConfig>> parse(absl::string_view document);

    /**
     * Validate already-typed definitions (duplicate ids, default state,
     * policy ranges). Declaration order is the order of `states`.
     */
    static absl::StatusOr<std::shared_ptr<const RuleConfig>> build(
        std::vector<StateDefinition> states,
        CoachingPolicy policy = {}
    );

    const std::vector<StateDefinition>& states() const { return states_; }
    const CoachingPolicy& policy() const { return policy_; }
    const StateDefinition& default_state() const { return states_[default_index_]; }

    /**
     * Lookup by id; nullptr when the id is not in this table.
     */
    const StateDefinition* find(absl::string_view id) const;

    /**
     * Highest-priority state whose guard holds; ties go to the state
     * declared first. The default state's guard always holds, so this
     * always returns a state.
     */
    const StateDefinition& select_candidate(const MetricVector& vector, const ScorePair& scores) const;

private:
    std::vector<StateDefinition> states_;
    CoachingPolicy policy_;
    std::size_t default_index_ = 0;
};

} // namespace interview_coach
