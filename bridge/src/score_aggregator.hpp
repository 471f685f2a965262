/**
 * score_aggregator.hpp — Confidence / anxiety scores from a MetricVector
 *
 *   confidence = minmax(0.5 + 0.5*positivity + 0.3*engagement
 *                           - 0.4*fillerRatio - 0.3*mumbleScore)
 *   anxiety    = clamp01(0.6*facialAnxiety + 0.25*fillerRatio + 0.15*mumbleScore)
 *
 * minmax() rescales the weighted sum from its theoretical range [-0.2, 1.3]
 * onto [0,1]. With two or more history entries both scores are smoothed by
 * an exponential moving average that runs oldest → newest and ends on the
 * current vector, so the current tick carries the largest weight.
 */

#pragma once

#include <cstdint>

#include "metric_vector.hpp"
#include "session_state.hpp"

namespace interview_coach {

struct ScorePair {
    float confidence = 0.5f;
    float anxiety = 0.5f;
    int64_t computed_at_ms = 0;
};

struct AggregatorConfig {
    // Weight of the newer sample at each EMA step, in (0,1].
    float smoothing_alpha = 0.4f;
};

class ScoreAggregator {
public:
    explicit ScoreAggregator(AggregatorConfig config = {});

    ScorePair aggregate(
        const MetricVector& vector,
        const MetricHistory& history,
        int64_t now_ms
    ) const;

    /**
     * Unsmoothed scores for a single vector.
     */
    static float raw_confidence(const MetricVector& vector);
    static float raw_anxiety(const MetricVector& vector);

private:
    AggregatorConfig config_;
};

} // namespace interview_coach
