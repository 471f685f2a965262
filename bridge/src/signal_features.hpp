/**
 * signal_features.hpp — Derive metric features from richer upstream payloads
 *
 * Some providers hand us raw material instead of ready-made features:
 *   - facial analysis may return per-label emotion confidences (0-100)
 *   - transcription may return only the transcript text
 *
 * These helpers reduce that material to the same [0,1] features the
 * normalizer would otherwise receive directly.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace interview_coach {

/**
 * Filler words counted by transcript analysis unless configured otherwise.
 */
const std::vector<std::string>& default_filler_words();

struct FacialFeatures {
    float engagement = 0.0f;
    float positivity = 0.0f;
    float anxiety    = 0.0f;
};

/**
 * Reduce emotion confidences to facial features.
 *
 * Labels are upper-case (HAPPY, CALM, FEAR, CONFUSED, SAD, ANGRY,
 * SURPRISED, DISGUSTED); missing labels count as 0.
 */
FacialFeatures derive_facial_features(const std::map<std::string, float>& emotions);

struct TranscriptFeatures {
    int   word_count   = 0;
    int   filler_hits  = 0;
    int   long_pauses  = 0;   // occurrences of "..."
    float filler_ratio = 0.0f;
    float mumble_score = 0.0f;
};

/**
 * Count filler words and pauses in a transcript.
 *
 * Words are split on whitespace, lower-cased and stripped of ",.?!" before
 * being compared against the filler list.
 */
TranscriptFeatures analyze_transcript(
    absl::string_view text,
    const std::vector<std::string>& filler_words
);

/**
 * Segments that contain a filler word (case-insensitive substring match),
 * in transcript order, at most `max_segments` of them.
 */
std::vector<std::string> extract_filler_segments(
    const std::vector<std::string>& segments,
    const std::vector<std::string>& filler_words,
    std::size_t max_segments = 5
);

} // namespace interview_coach
