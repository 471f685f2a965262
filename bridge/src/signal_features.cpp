/**
 * signal_features.cpp — Implementation
 *
 * Emotion weighting:
 *   negative   = SAD + ANGRY + DISGUSTED
 *   engagement = min(1, (HAPPY + CALM + 0.5*SURPRISED) / 200 + 0.3)
 *   positivity = clamp01((HAPPY - 0.5*negative) / 100)
 *   anxiety    = min(1, (FEAR + CONFUSED + 0.3*negative) / 100)
 *
 * Transcript weighting:
 *   filler_ratio = filler_hits / max(word_count, 1)
 *   mumble_score = min(1, 0.5*filler_ratio + 0.05*long_pauses)
 */

#include "signal_features.hpp"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_split.h>

namespace interview_coach {

namespace {

float emotion_score(const std::map<std::string, float>& emotions, const char* label) {
    auto it = emotions.find(label);
    if (it == emotions.end()) return 0.0f;
    return std::clamp(it->second, 0.0f, 100.0f);
}

float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

absl::string_view strip_punctuation(absl::string_view word) {
    auto is_punct = [](char c) { return c == ',' || c == '.' || c == '?' || c == '!'; };
    while (!word.empty() && is_punct(word.front())) word.remove_prefix(1);
    while (!word.empty() && is_punct(word.back())) word.remove_suffix(1);
    return word;
}

int count_occurrences(absl::string_view text, absl::string_view needle) {
    int count = 0;
    std::size_t pos = text.find(needle);
    while (pos != absl::string_view::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

} // namespace

const std::vector<std::string>& default_filler_words() {
    static const std::vector<std::string> kWords = {
        "um", "uh", "like", "you know", "actually", "basically", "literally",
    };
    return kWords;
}

FacialFeatures derive_facial_features(const std::map<std::string, float>& emotions) {
    float happy     = emotion_score(emotions, "HAPPY");
    float calm      = emotion_score(emotions, "CALM");
    float fear      = emotion_score(emotions, "FEAR");
    float confused  = emotion_score(emotions, "CONFUSED");
    float sad       = emotion_score(emotions, "SAD");
    float angry     = emotion_score(emotions, "ANGRY");
    float surprised = emotion_score(emotions, "SURPRISED");
    float disgusted = emotion_score(emotions, "DISGUSTED");

    float negative = sad + angry + disgusted;

    FacialFeatures features;
    features.engagement = std::min(1.0f, (happy + calm + surprised * 0.5f) / 200.0f + 0.3f);
    features.positivity = clamp01((happy - negative * 0.5f) / 100.0f);
    features.anxiety    = std::min(1.0f, (fear + confused + negative * 0.3f) / 100.0f);
    return features;
}

TranscriptFeatures analyze_transcript(
    absl::string_view text,
    const std::vector<std::string>& filler_words
) {
    TranscriptFeatures features;
    std::string lower = absl::AsciiStrToLower(text);

    std::vector<absl::string_view> words =
        absl::StrSplit(lower, absl::ByAnyChar(" \t\r\n"), absl::SkipEmpty());
    features.word_count = static_cast<int>(words.size());

    for (absl::string_view word : words) {
        absl::string_view bare = strip_punctuation(word);
        if (bare.empty()) continue;
        bool is_filler = std::any_of(filler_words.begin(), filler_words.end(),
            [bare](const std::string& filler) { return absl::string_view(filler) == bare; });
        if (is_filler) {
            ++features.filler_hits;
        }
    }

    features.long_pauses = count_occurrences(text, "...");
    features.filler_ratio = static_cast<float>(features.filler_hits) /
                            static_cast<float>(std::max(features.word_count, 1));
    features.mumble_score = std::min(1.0f,
        features.filler_ratio * 0.5f + static_cast<float>(features.long_pauses) * 0.05f);
    return features;
}

std::vector<std::string> extract_filler_segments(
    const std::vector<std::string>& segments,
    const std::vector<std::string>& filler_words,
    std::size_t max_segments
) {
    std::vector<std::string> highlights;
    for (const std::string& segment : segments) {
        if (highlights.size() >= max_segments) break;
        std::string lower = absl::AsciiStrToLower(segment);
        for (const std::string& filler : filler_words) {
            if (absl::StrContains(lower, filler)) {
                highlights.push_back(lower);
                break;
            }
        }
    }
    return highlights;
}

} // namespace interview_coach
