/**
 * metric_normalizer.hpp — Folds raw upstream samples into a MetricVector
 *
 * Field resolution order, per field:
 *   1. explicit value in the sample (clamped into range)
 *   2. value derived from richer payloads (emotion scores, transcript text)
 *   3. the prior tick's value (carry-forward)
 *   4. the neutral value
 *
 * Normalization never fails. Out-of-range or non-finite inputs are counted
 * as warnings; the caller decides whether to log them.
 */

#pragma once

#include <string>
#include <vector>

#include "metric_vector.hpp"

namespace interview_coach {

struct NormalizerConfig {
    std::vector<std::string> filler_words;
    std::size_t max_transcript_highlights = 5;

    NormalizerConfig();
};

struct NormalizeResult {
    MetricVector vector;

    // Malformed sample fields: wrong type, out of range, or non-finite.
    int warnings = 0;

    std::vector<std::string> transcript_highlights;
};

class MetricNormalizer {
public:
    explicit MetricNormalizer(NormalizerConfig config = {});

    /**
     * Build this tick's vector. `prior` is the previous tick's vector for
     * the same session, or nullptr on the first tick.
     */
    NormalizeResult normalize(const RawSignalSample& sample, const MetricVector* prior) const;

    const NormalizerConfig& config() const { return config_; }

private:
    NormalizerConfig config_;
};

} // namespace interview_coach
