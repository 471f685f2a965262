/**
 * metric_vector.hpp — Per-tick multimodal feature snapshot
 *
 * Upstream providers (facial analysis, transcription / vocal analysis)
 * deliver partial, best-effort samples. The normalizer folds each one into
 * a fixed-shape MetricVector whose fields are always populated:
 *
 *   facial.engagement      [0,1]
 *   facial.positivity      [0,1]
 *   facial.anxiety         [0,1]
 *   vocal.fillerRatio      [0,1]
 *   vocal.mumbleScore      [0,1]
 *   vocal.speechRateWpm    [0,inf)
 *
 * A field that has never carried a real sample holds its neutral value;
 * `observed` records which fields have been backed by real data.
 */

#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace interview_coach {

enum class MetricField {
    FACIAL_ENGAGEMENT,
    FACIAL_POSITIVITY,
    FACIAL_ANXIETY,
    VOCAL_FILLER_RATIO,
    VOCAL_MUMBLE_SCORE,
    VOCAL_SPEECH_RATE_WPM,
};

inline constexpr std::size_t kMetricFieldCount = 6;

// Values a field holds before any real sample has been seen for it.
inline constexpr float kNeutralUnitValue = 0.5f;
inline constexpr float kNeutralSpeechRateWpm = 130.0f;

inline constexpr std::array<MetricField, kMetricFieldCount> kAllMetricFields = {
    MetricField::FACIAL_ENGAGEMENT,
    MetricField::FACIAL_POSITIVITY,
    MetricField::FACIAL_ANXIETY,
    MetricField::VOCAL_FILLER_RATIO,
    MetricField::VOCAL_MUMBLE_SCORE,
    MetricField::VOCAL_SPEECH_RATE_WPM,
};

/**
 * Canonical dotted name used by rule guards, e.g. "vocal.fillerRatio".
 */
const char* metric_field_to_string(MetricField field);

/**
 * Resolve a guard operand name to a metric field.
 */
std::optional<MetricField> metric_field_from_string(absl::string_view name);

/**
 * True for fields bounded to [0,1]; speech rate is only bounded below.
 */
bool is_unit_interval_field(MetricField field);

struct MetricVector {
    std::array<float, kMetricFieldCount> values = {
        kNeutralUnitValue, kNeutralUnitValue, kNeutralUnitValue,
        kNeutralUnitValue, kNeutralUnitValue, kNeutralSpeechRateWpm};
    std::array<bool, kMetricFieldCount> observed = {};

    float value(MetricField field) const {
        return values[static_cast<std::size_t>(field)];
    }

    void set(MetricField field, float v) {
        values[static_cast<std::size_t>(field)] = v;
    }

    bool has_sample(MetricField field) const {
        return observed[static_cast<std::size_t>(field)];
    }

    bool operator==(const MetricVector& other) const {
        return values == other.values && observed == other.observed;
    }
    bool operator!=(const MetricVector& other) const { return !(*this == other); }
};

// ── Raw upstream sample ──────────────────────────────────
// Any subset may be present, including nothing at all.

struct FacialSample {
    std::optional<float> engagement;
    std::optional<float> positivity;
    std::optional<float> anxiety;

    // Emotion label (HAPPY, CALM, FEAR, ...) → confidence percentage 0-100
    std::map<std::string, float> emotions;
};

struct VocalSample {
    std::optional<float> filler_ratio;
    std::optional<float> mumble_score;
    std::optional<float> speech_rate_wpm;
};

struct TranscriptSample {
    std::optional<std::string> text;
    std::vector<std::string> segments;
};

struct RawSignalSample {
    FacialSample facial;
    VocalSample vocal;
    TranscriptSample transcript;

    // Fields the wire decoder could not interpret (wrong JSON type).
    int malformed_fields = 0;
};

} // namespace interview_coach
