/**
 * rule_config.cpp — Implementation
 *
 * Parsing happens in two passes:
 *   1. JSON → StateDefinition (types, operand names, operators, literals)
 *   2. build(): table-level checks (ids unique, exactly one default,
 *      policy ranges)
 * Both passes name the offending state id and field in their errors.
 */

#include "rule_config.hpp"

#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

#include <absl/container/flat_hash_set.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <json/json.h>

namespace interview_coach {

namespace {

absl::Status state_error(absl::string_view state, absl::string_view field, absl::string_view problem) {
    return absl::InvalidArgumentError(
        absl::StrCat("state '", state, "': field '", field, "' ", problem));
}

absl::Status policy_error(absl::string_view field, absl::string_view problem) {
    return absl::InvalidArgumentError(
        absl::StrCat("policy: field '", field, "' ", problem));
}

/**
 * Required string member; `alias` is an accepted alternate key.
 */
absl::StatusOr<std::string> required_string(
    const Json::Value& obj,
    absl::string_view state,
    const char* key,
    const char* alias = nullptr
) {
    const Json::Value* value = nullptr;
    if (obj.isMember(key)) {
        value = &obj[key];
    } else if (alias != nullptr && obj.isMember(alias)) {
        value = &obj[alias];
    }
    if (value == nullptr) {
        return state_error(state, key, "is missing");
    }
    if (!value->isString()) {
        return state_error(state, key, "must be a string");
    }
    return value->asString();
}

absl::StatusOr<GuardClause> parse_clause(const Json::Value& json, absl::string_view state, Json::ArrayIndex index) {
    std::string where = absl::StrCat("guard[", index, "]");
    if (!json.isObject()) {
        return state_error(state, where, "must be an object");
    }

    const Json::Value& metric = json["metric"];
    if (!metric.isString()) {
        return state_error(state, absl::StrCat(where, ".metric"), "must be a string");
    }
    absl::StatusOr<GuardOperand> operand = parse_operand(metric.asString());
    if (!operand.ok()) {
        return state_error(state, absl::StrCat(where, ".metric"), operand.status().message());
    }

    const Json::Value& op = json["operator"];
    if (!op.isString()) {
        return state_error(state, absl::StrCat(where, ".operator"), "must be a string");
    }
    absl::StatusOr<Comparator> comparator = parse_comparator(op.asString());
    if (!comparator.ok()) {
        return state_error(state, absl::StrCat(where, ".operator"), comparator.status().message());
    }

    const Json::Value& value = json["value"];
    if (!value.isNumeric() || !std::isfinite(value.asDouble())) {
        return state_error(state, absl::StrCat(where, ".value"), "must be a finite number");
    }

    GuardClause clause;
    clause.operand = *operand;
    clause.comparator = *comparator;
    clause.literal = value.asFloat();
    return clause;
}

absl::StatusOr<StateDefinition> parse_state(const Json::Value& json, Json::ArrayIndex index) {
    std::string label = absl::StrCat("states[", index, "]");
    if (!json.isObject()) {
        return absl::InvalidArgumentError(absl::StrCat(label, " must be an object"));
    }

    StateDefinition state;

    // ── Identity ─────────────────────────────────────────
    const Json::Value& id = json["id"];
    if (!id.isString() || id.asString().empty()) {
        return state_error(label, "id", "must be a non-empty string");
    }
    state.id = id.asString();

    if (json.isMember("name")) {
        if (!json["name"].isString()) return state_error(state.id, "name", "must be a string");
        state.name = json["name"].asString();
    } else {
        state.name = state.id;
    }

    // ── Scheduling ───────────────────────────────────────
    if (json.isMember("priority")) {
        if (!json["priority"].isInt()) return state_error(state.id, "priority", "must be an integer");
        state.priority = json["priority"].asInt();
    }

    if (json.isMember("cooldown_ms")) {
        const Json::Value& cooldown = json["cooldown_ms"];
        if (!cooldown.isInt64() || cooldown.asInt64() < 0) {
            return state_error(state.id, "cooldown_ms", "must be a non-negative integer");
        }
        state.cooldown_ms = cooldown.asInt64();
    }

    if (json.isMember("default")) {
        if (!json["default"].isBool()) return state_error(state.id, "default", "must be a boolean");
        state.is_default = json["default"].asBool();
    }

    // ── Guard ────────────────────────────────────────────
    // Required; an explicit empty list is the only way to spell "always".
    const char* guard_key = json.isMember("guard") ? "guard" : "thresholds";
    if (!json.isMember(guard_key)) {
        return state_error(state.id, "guard", "is missing");
    }
    const Json::Value& clauses_json = json[guard_key];
    if (!clauses_json.isArray()) {
        return state_error(state.id, guard_key, "must be an array");
    }
    std::vector<GuardClause> clauses;
    for (Json::ArrayIndex i = 0; i < clauses_json.size(); ++i) {
        absl::StatusOr<GuardClause> clause = parse_clause(clauses_json[i], state.id, i);
        if (!clause.ok()) return clause.status();
        clauses.push_back(*std::move(clause));
    }
    state.guard = Guard(std::move(clauses));

    // ── Response ─────────────────────────────────────────
    const Json::Value& response = json["response"];
    if (!response.isObject()) {
        return state_error(state.id, "response", "must be an object");
    }
    absl::StatusOr<std::string> voice_line = required_string(response, state.id, "voice_line", "tts_text");
    if (!voice_line.ok()) return voice_line.status();
    absl::StatusOr<std::string> subtitle = required_string(response, state.id, "subtitle");
    if (!subtitle.ok()) return subtitle.status();
    absl::StatusOr<std::string> tip = required_string(response, state.id, "tip");
    if (!tip.ok()) return tip.status();

    state.response.voice_line = *std::move(voice_line);
    state.response.subtitle = *std::move(subtitle);
    state.response.tip = *std::move(tip);
    return state;
}

absl::StatusOr<CoachingPolicy> parse_policy(const Json::Value& json) {
    CoachingPolicy policy;
    if (json.isNull()) return policy;
    if (!json.isObject()) {
        return absl::InvalidArgumentError("policy must be an object");
    }

    if (json.isMember("smoothing_alpha")) {
        if (!json["smoothing_alpha"].isNumeric()) return policy_error("smoothing_alpha", "must be a number");
        policy.smoothing_alpha = json["smoothing_alpha"].asFloat();
    }
    if (json.isMember("override_margin")) {
        if (!json["override_margin"].isInt()) return policy_error("override_margin", "must be an integer");
        policy.override_margin = json["override_margin"].asInt();
    }
    if (json.isMember("history_capacity")) {
        const Json::Value& capacity = json["history_capacity"];
        if (!capacity.isInt() || capacity.asInt() < 1) {
            return policy_error("history_capacity", "must be a positive integer");
        }
        policy.history_capacity = static_cast<std::size_t>(capacity.asInt());
    }
    return policy;
}

} // namespace

RuleConfig::RuleConfig(Key, std::vector<StateDefinition> states, CoachingPolicy policy, std::size_t default_index)
    : states_(std::move(states))
    , policy_(policy)
    , default_index_(default_index)
{
}

absl::StatusOr<std::shared_ptr<const RuleConfig>> RuleConfig::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return absl::NotFoundError(absl::StrCat("cannot open rule config '", path, "'"));
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    absl::StatusOr<std::shared_ptr<const RuleConfig>> config = parse(contents.str());
    if (!config.ok()) {
        return absl::Status(config.status().code(),
                            absl::StrCat(path, ": ", config.status().message()));
    }
    return config;
}

absl::StatusOr<std::shared_ptr<const RuleConfig>> RuleConfig::parse(absl::string_view document) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value parsed;
    std::string errors;
    if (!reader->parse(document.data(), document.data() + document.size(), &parsed, &errors)) {
        return absl::InvalidArgumentError(absl::StrCat("malformed rule config: ", errors));
    }
    const Json::Value& root = parsed;
    if (!root.isObject()) {
        return absl::InvalidArgumentError("rule config must be a JSON object");
    }

    absl::StatusOr<CoachingPolicy> policy = parse_policy(root["policy"]);
    if (!policy.ok()) return policy.status();

    const Json::Value& states_json = root["states"];
    if (!states_json.isArray()) {
        return absl::InvalidArgumentError("rule config: 'states' must be an array");
    }

    std::vector<StateDefinition> states;
    states.reserve(states_json.size());
    for (Json::ArrayIndex i = 0; i < states_json.size(); ++i) {
        absl::StatusOr<StateDefinition> state = parse_state(states_json[i], i);
        if (!state.ok()) return state.status();
        states.push_back(*std::move(state));
    }

    return build(std::move(states), *policy);
}

absl::StatusOr<std::shared_ptr<const RuleConfig>> RuleConfig::build(
    std::vector<StateDefinition> states,
    CoachingPolicy policy
) {
    if (states.empty()) {
        return absl::InvalidArgumentError("rule config defines no states");
    }

    if (!(policy.smoothing_alpha > 0.0f && policy.smoothing_alpha <= 1.0f)) {
        return policy_error("smoothing_alpha", "must be in (0, 1]");
    }
    if (policy.override_margin < 1) {
        return policy_error("override_margin", "must be at least 1");
    }
    if (policy.history_capacity < 1) {
        return policy_error("history_capacity", "must be at least 1");
    }

    absl::flat_hash_set<std::string> seen;
    const StateDefinition* flagged_default = nullptr;
    std::size_t default_index = states.size();

    for (std::size_t i = 0; i < states.size(); ++i) {
        const StateDefinition& state = states[i];
        if (state.id.empty()) {
            return state_error(absl::StrCat("states[", i, "]"), "id", "must be a non-empty string");
        }
        if (!seen.insert(state.id).second) {
            return state_error(state.id, "id", "is a duplicate");
        }
        if (state.cooldown_ms < 0) {
            return state_error(state.id, "cooldown_ms", "must be a non-negative integer");
        }
        if (state.is_default) {
            if (flagged_default != nullptr) {
                return state_error(state.id, "default",
                    absl::StrCat("conflicts with default state '", flagged_default->id, "'"));
            }
            if (!state.guard.always_true()) {
                return state_error(state.id, "guard", "must be empty on the default state");
            }
            flagged_default = &state;
            default_index = i;
        }
    }

    if (flagged_default == nullptr) {
        for (std::size_t i = 0; i < states.size(); ++i) {
            if (states[i].guard.always_true()) {
                default_index = i;
                break;
            }
        }
    }
    if (default_index == states.size()) {
        return absl::InvalidArgumentError(
            "rule config has no default state: at least one state needs an empty (always-true) guard");
    }

    std::shared_ptr<const RuleConfig> table =
        std::make_shared<RuleConfig>(Key{}, std::move(states), policy, default_index);
    return table;
}

const StateDefinition* RuleConfig::find(absl::string_view id) const {
    for (const StateDefinition& state : states_) {
        if (state.id == id) return &state;
    }
    return nullptr;
}

const StateDefinition& RuleConfig::select_candidate(const MetricVector& vector, const ScorePair& scores) const {
    const StateDefinition* best = nullptr;
    for (const StateDefinition& state : states_) {
        if (!state.guard.evaluate(vector, scores)) continue;
        // Strictly greater: an equal priority declared later never displaces.
        if (best == nullptr || state.priority > best->priority) {
            best = &state;
        }
    }
    return best != nullptr ? *best : default_state();
}

} // namespace interview_coach
