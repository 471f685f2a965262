/**
 * guard.cpp — Implementation
 */

#include "guard.hpp"

#include <cmath>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace interview_coach {

namespace {

constexpr float kEqualityTolerance = 1e-6f;

float resolve(const GuardOperand& operand, const MetricVector& vector, const ScorePair& scores) {
    if (const auto* metric = std::get_if<MetricField>(&operand)) {
        return vector.value(*metric);
    }
    switch (std::get<ScoreField>(operand)) {
        case ScoreField::CONFIDENCE: return scores.confidence;
        case ScoreField::ANXIETY:    return scores.anxiety;
    }
    return 0.0f;
}

} // namespace

const char* score_field_to_string(ScoreField field) {
    switch (field) {
        case ScoreField::CONFIDENCE: return "confidence";
        case ScoreField::ANXIETY:    return "anxiety";
        default:                     return "unknown";
    }
}

const char* comparator_to_string(Comparator comparator) {
    switch (comparator) {
        case Comparator::GREATER_EQUAL: return ">=";
        case Comparator::GREATER:       return ">";
        case Comparator::LESS_EQUAL:    return "<=";
        case Comparator::LESS:          return "<";
        case Comparator::EQUAL:         return "==";
        case Comparator::NOT_EQUAL:     return "!=";
        default:                        return "?";
    }
}

absl::StatusOr<Comparator> parse_comparator(absl::string_view text) {
    if (text == ">=" || text == "gte") return Comparator::GREATER_EQUAL;
    if (text == ">"  || text == "gt")  return Comparator::GREATER;
    if (text == "<=" || text == "lte") return Comparator::LESS_EQUAL;
    if (text == "<"  || text == "lt")  return Comparator::LESS;
    if (text == "==" || text == "eq")  return Comparator::EQUAL;
    if (text == "!=" || text == "ne")  return Comparator::NOT_EQUAL;
    return absl::InvalidArgumentError(absl::StrCat("unsupported operator '", text, "'"));
}

absl::StatusOr<GuardOperand> parse_operand(absl::string_view text) {
    if (text == "confidence") return GuardOperand(ScoreField::CONFIDENCE);
    if (text == "anxiety")    return GuardOperand(ScoreField::ANXIETY);
    if (auto metric = metric_field_from_string(text)) {
        return GuardOperand(*metric);
    }
    return absl::InvalidArgumentError(absl::StrCat("unknown metric '", text, "'"));
}

std::string operand_to_string(const GuardOperand& operand) {
    if (const auto* metric = std::get_if<MetricField>(&operand)) {
        return metric_field_to_string(*metric);
    }
    return score_field_to_string(std::get<ScoreField>(operand));
}

bool GuardClause::matches(const MetricVector& vector, const ScorePair& scores) const {
    // A neutral placeholder is not evidence; only scores see it.
    if (const auto* metric = std::get_if<MetricField>(&operand)) {
        if (!vector.has_sample(*metric)) return false;
    }
    float value = resolve(operand, vector, scores);
    switch (comparator) {
        case Comparator::GREATER_EQUAL: return value >= literal;
        case Comparator::GREATER:       return value > literal;
        case Comparator::LESS_EQUAL:    return value <= literal;
        case Comparator::LESS:          return value < literal;
        case Comparator::EQUAL:         return std::fabs(value - literal) <= kEqualityTolerance;
        case Comparator::NOT_EQUAL:     return std::fabs(value - literal) > kEqualityTolerance;
    }
    return false;
}

Guard::Guard(std::vector<GuardClause> clauses)
    : clauses_(std::move(clauses))
{
}

bool Guard::evaluate(const MetricVector& vector, const ScorePair& scores) const {
    for (const GuardClause& clause : clauses_) {
        if (!clause.matches(vector, scores)) {
            return false;
        }
    }
    return true;
}

std::string Guard::describe() const {
    if (clauses_.empty()) return "always";
    return absl::StrJoin(clauses_, " && ", [](std::string* out, const GuardClause& clause) {
        absl::StrAppend(out, operand_to_string(clause.operand), " ",
                        comparator_to_string(clause.comparator), " ",
                        absl::StrFormat("%.3f", clause.literal));
    });
}

} // namespace interview_coach
