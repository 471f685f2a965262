/**
 * bridge_protocol.hpp — Decodes inbound JSON Lines commands
 *
 * One command per line:
 *   { "type": "ingest", "session_id": "s1", "now_ms": 1200, "sample": { ... } }
 *   { "type": "close",  "session_id": "s1" }
 *   { "type": "reload" }
 *
 * "type" defaults to "ingest". "now_ms" is optional and counts Unix epoch
 * milliseconds; negative values are rejected. An ingest without it is
 * stamped from the wall clock, so both kinds of line share one time domain
 * and idle eviction compares like with like.
 *
 * The sample groups mirror what the upstream providers return; any of them
 * may be missing:
 *
 *   "facial":     { "engagement", "positivity", "anxiety", "emotions": { "HAPPY": 80, ... } }
 *   "vocal":      { "filler_ratio", "mumble_score", "speech_rate_wpm" }
 *   "transcript": { "text": "...", "segments": [ "...", ... ] }
 *
 * A sample field of the wrong JSON type is dropped and counted in
 * RawSignalSample::malformed_fields; only a line that is not a JSON object
 * (or lacks a session id where one is required) is rejected.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <json/json.h>

#include "metric_vector.hpp"

namespace interview_coach {

enum class CommandType {
    INGEST,
    CLOSE,
    RELOAD,
};

struct BridgeCommand {
    CommandType type = CommandType::INGEST;
    std::string session_id;
    std::optional<int64_t> now_ms;  // epoch ms, >= 0
    RawSignalSample sample;
};

/**
 * Decode a sample object. Never fails: anything unusable is counted as
 * malformed and left absent.
 */
RawSignalSample decode_raw_sample(const Json::Value& json);

absl::StatusOr<BridgeCommand> parse_command(absl::string_view line);

} // namespace interview_coach
