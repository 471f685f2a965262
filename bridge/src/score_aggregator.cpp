/**
 * score_aggregator.cpp — Implementation
 */

#include "score_aggregator.hpp"

#include <algorithm>

namespace interview_coach {

namespace {

constexpr float kConfidenceBias        = 0.5f;
constexpr float kConfidencePositivity  = 0.5f;
constexpr float kConfidenceEngagement  = 0.3f;
constexpr float kConfidenceFiller      = 0.4f;
constexpr float kConfidenceMumble      = 0.3f;

// Extremes of the weighted sum over unit-interval inputs.
constexpr float kConfidenceMin = kConfidenceBias - kConfidenceFiller - kConfidenceMumble;
constexpr float kConfidenceMax = kConfidenceBias + kConfidencePositivity + kConfidenceEngagement;

constexpr float kAnxietyFacial = 0.6f;
constexpr float kAnxietyFiller = 0.25f;
constexpr float kAnxietyMumble = 0.15f;

float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

} // namespace

ScoreAggregator::ScoreAggregator(AggregatorConfig config)
    : config_(config)
{
    if (!(config_.smoothing_alpha > 0.0f && config_.smoothing_alpha <= 1.0f)) {
        config_.smoothing_alpha = AggregatorConfig{}.smoothing_alpha;
    }
}

float ScoreAggregator::raw_confidence(const MetricVector& v) {
    float weighted = kConfidenceBias
        + kConfidencePositivity * v.value(MetricField::FACIAL_POSITIVITY)
        + kConfidenceEngagement * v.value(MetricField::FACIAL_ENGAGEMENT)
        - kConfidenceFiller     * v.value(MetricField::VOCAL_FILLER_RATIO)
        - kConfidenceMumble     * v.value(MetricField::VOCAL_MUMBLE_SCORE);
    return clamp01((weighted - kConfidenceMin) / (kConfidenceMax - kConfidenceMin));
}

float ScoreAggregator::raw_anxiety(const MetricVector& v) {
    return clamp01(
        kAnxietyFacial * v.value(MetricField::FACIAL_ANXIETY)
        + kAnxietyFiller * v.value(MetricField::VOCAL_FILLER_RATIO)
        + kAnxietyMumble * v.value(MetricField::VOCAL_MUMBLE_SCORE));
}

ScorePair ScoreAggregator::aggregate(
    const MetricVector& vector,
    const MetricHistory& history,
    int64_t now_ms
) const {
    ScorePair scores;
    scores.computed_at_ms = now_ms;

    float confidence = raw_confidence(vector);
    float anxiety = raw_anxiety(vector);

    if (history.size() >= 2) {
        const float alpha = config_.smoothing_alpha;

        float ema_confidence = raw_confidence(history[0]);
        float ema_anxiety = raw_anxiety(history[0]);
        for (std::size_t i = 1; i < history.size(); ++i) {
            ema_confidence = alpha * raw_confidence(history[i]) + (1.0f - alpha) * ema_confidence;
            ema_anxiety    = alpha * raw_anxiety(history[i])    + (1.0f - alpha) * ema_anxiety;
        }
        confidence = alpha * confidence + (1.0f - alpha) * ema_confidence;
        anxiety    = alpha * anxiety    + (1.0f - alpha) * ema_anxiety;
    }

    scores.confidence = clamp01(confidence);
    scores.anxiety = clamp01(anxiety);
    return scores;
}

} // namespace interview_coach
