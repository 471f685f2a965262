/**
 * metric_vector.cpp — Implementation
 */

#include "metric_vector.hpp"

namespace interview_coach {

const char* metric_field_to_string(MetricField field) {
    switch (field) {
        case MetricField::FACIAL_ENGAGEMENT:     return "facial.engagement";
        case MetricField::FACIAL_POSITIVITY:     return "facial.positivity";
        case MetricField::FACIAL_ANXIETY:        return "facial.anxiety";
        case MetricField::VOCAL_FILLER_RATIO:    return "vocal.fillerRatio";
        case MetricField::VOCAL_MUMBLE_SCORE:    return "vocal.mumbleScore";
        case MetricField::VOCAL_SPEECH_RATE_WPM: return "vocal.speechRateWpm";
        default:                                 return "unknown";
    }
}

std::optional<MetricField> metric_field_from_string(absl::string_view name) {
    for (MetricField field : kAllMetricFields) {
        if (name == metric_field_to_string(field)) {
            return field;
        }
    }
    return std::nullopt;
}

bool is_unit_interval_field(MetricField field) {
    return field != MetricField::VOCAL_SPEECH_RATE_WPM;
}

} // namespace interview_coach
