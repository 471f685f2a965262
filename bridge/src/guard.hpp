/**
 * guard.hpp — Typed guard expressions for coaching states
 *
 * A guard is a conjunction of clauses `operand <comparator> literal`,
 * where the operand is either a MetricVector field or a score. Guards are
 * parsed once when the rule config loads, so evaluation never touches a
 * field name. An empty guard is always true.
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "metric_vector.hpp"
#include "score_aggregator.hpp"

namespace interview_coach {

enum class ScoreField {
    CONFIDENCE,
    ANXIETY,
};

enum class Comparator {
    GREATER_EQUAL,
    GREATER,
    LESS_EQUAL,
    LESS,
    EQUAL,
    NOT_EQUAL,
};

using GuardOperand = std::variant<MetricField, ScoreField>;

const char* score_field_to_string(ScoreField field);
const char* comparator_to_string(Comparator comparator);

/**
 * Accepts symbolic (">=") and mnemonic ("gte") spellings.
 */
absl::StatusOr<Comparator> parse_comparator(absl::string_view text);

/**
 * Accepts the metric names from metric_vector.hpp plus "confidence" and
 * "anxiety".
 */
absl::StatusOr<GuardOperand> parse_operand(absl::string_view text);

std::string operand_to_string(const GuardOperand& operand);

struct GuardClause {
    GuardOperand operand;
    Comparator comparator = Comparator::GREATER_EQUAL;
    float literal = 0.0f;

    /**
     * A metric operand that has never been sampled in the session does not
     * match, whatever the comparator.
     */
    bool matches(const MetricVector& vector, const ScorePair& scores) const;
};

class Guard {
public:
    Guard() = default;
    explicit Guard(std::vector<GuardClause> clauses);

    bool evaluate(const MetricVector& vector, const ScorePair& scores) const;

    bool always_true() const { return clauses_.empty(); }
    const std::vector<GuardClause>& clauses() const { return clauses_; }

    /**
     * Human-readable form for logs, e.g. "anxiety >= 0.600 && vocal.fillerRatio > 0.200".
     */
    std::string describe() const;

private:
    std::vector<GuardClause> clauses_;
};

} // namespace interview_coach
