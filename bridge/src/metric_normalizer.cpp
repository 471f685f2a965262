/**
 * metric_normalizer.cpp — Implementation
 */

#include "metric_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>

#include "signal_features.hpp"

namespace interview_coach {

namespace {

/**
 * Validate one explicit sample value. Non-finite values are dropped (the
 * field falls through to derived / carried / neutral); finite values are
 * clamped into the field's range.
 */
std::optional<float> sanitize(MetricField field, std::optional<float> raw, int& warnings) {
    if (!raw) return std::nullopt;

    float v = *raw;
    if (!std::isfinite(v)) {
        ++warnings;
        return std::nullopt;
    }

    float lo = 0.0f;
    float hi = is_unit_interval_field(field) ? 1.0f : std::numeric_limits<float>::max();
    if (v < lo || v > hi) {
        ++warnings;
        v = std::clamp(v, lo, hi);
    }
    return v;
}

} // namespace

NormalizerConfig::NormalizerConfig()
    : filler_words(default_filler_words())
{
}

MetricNormalizer::MetricNormalizer(NormalizerConfig config)
    : config_(std::move(config))
{
}

NormalizeResult MetricNormalizer::normalize(
    const RawSignalSample& sample,
    const MetricVector* prior
) const {
    NormalizeResult result;
    result.warnings = sample.malformed_fields;

    // Start from the carried-forward vector; a fresh session starts neutral.
    MetricVector out = prior ? *prior : MetricVector{};

    std::optional<float> explicit_values[kMetricFieldCount] = {
        sanitize(MetricField::FACIAL_ENGAGEMENT,     sample.facial.engagement,     result.warnings),
        sanitize(MetricField::FACIAL_POSITIVITY,     sample.facial.positivity,     result.warnings),
        sanitize(MetricField::FACIAL_ANXIETY,        sample.facial.anxiety,        result.warnings),
        sanitize(MetricField::VOCAL_FILLER_RATIO,    sample.vocal.filler_ratio,    result.warnings),
        sanitize(MetricField::VOCAL_MUMBLE_SCORE,    sample.vocal.mumble_score,    result.warnings),
        sanitize(MetricField::VOCAL_SPEECH_RATE_WPM, sample.vocal.speech_rate_wpm, result.warnings),
    };

    // ── Derived: facial features from emotion scores ─────
    std::optional<float> derived_values[kMetricFieldCount];

    if (!sample.facial.emotions.empty()) {
        std::map<std::string, float> emotions;
        for (const auto& [label, score] : sample.facial.emotions) {
            if (!std::isfinite(score)) {
                ++result.warnings;
                continue;
            }
            if (score < 0.0f || score > 100.0f) {
                ++result.warnings;
            }
            emotions[label] = std::clamp(score, 0.0f, 100.0f);
        }
        FacialFeatures facial = derive_facial_features(emotions);
        derived_values[static_cast<std::size_t>(MetricField::FACIAL_ENGAGEMENT)] = facial.engagement;
        derived_values[static_cast<std::size_t>(MetricField::FACIAL_POSITIVITY)] = facial.positivity;
        derived_values[static_cast<std::size_t>(MetricField::FACIAL_ANXIETY)]    = facial.anxiety;
    }

    // ── Derived: vocal features from transcript text ─────
    if (sample.transcript.text && !sample.transcript.text->empty()) {
        TranscriptFeatures transcript =
            analyze_transcript(*sample.transcript.text, config_.filler_words);
        derived_values[static_cast<std::size_t>(MetricField::VOCAL_FILLER_RATIO)] = transcript.filler_ratio;
        derived_values[static_cast<std::size_t>(MetricField::VOCAL_MUMBLE_SCORE)] = transcript.mumble_score;
    }

    for (MetricField field : kAllMetricFields) {
        auto i = static_cast<std::size_t>(field);
        if (explicit_values[i]) {
            out.set(field, *explicit_values[i]);
            out.observed[i] = true;
        } else if (derived_values[i]) {
            out.set(field, *derived_values[i]);
            out.observed[i] = true;
        }
        // Otherwise keep the carried (or neutral) value.
    }

    // ── Transcript highlights ────────────────────────────
    if (!sample.transcript.segments.empty()) {
        result.transcript_highlights = extract_filler_segments(
            sample.transcript.segments, config_.filler_words, config_.max_transcript_highlights);
    } else if (sample.transcript.text && !sample.transcript.text->empty()) {
        result.transcript_highlights = extract_filler_segments(
            {*sample.transcript.text}, config_.filler_words, config_.max_transcript_highlights);
    }

    result.vector = out;
    return result;
}

} // namespace interview_coach
