/**
 * bridge_protocol.cpp — Implementation
 */

#include "bridge_protocol.hpp"

#include <memory>

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace interview_coach {

namespace {

/**
 * Read an optional numeric member. Present-but-not-a-number counts as
 * malformed; JSON null is treated the same as absent.
 */
std::optional<float> read_number(const Json::Value& group, const char* key, int& malformed) {
    if (!group.isMember(key) || group[key].isNull()) return std::nullopt;
    const Json::Value& value = group[key];
    if (!value.isNumeric()) {
        ++malformed;
        return std::nullopt;
    }
    return value.asFloat();
}

/**
 * Fetch a group object; a non-object group counts as malformed.
 */
const Json::Value* read_group(const Json::Value& json, const char* key, int& malformed) {
    if (!json.isMember(key) || json[key].isNull()) return nullptr;
    const Json::Value& group = json[key];
    if (!group.isObject()) {
        ++malformed;
        return nullptr;
    }
    return &group;
}

} // namespace

RawSignalSample decode_raw_sample(const Json::Value& json) {
    RawSignalSample sample;
    int& malformed = sample.malformed_fields;

    if (json.isNull()) return sample;
    if (!json.isObject()) {
        ++malformed;
        return sample;
    }

    // ── Facial ───────────────────────────────────────────
    if (const Json::Value* facial = read_group(json, "facial", malformed)) {
        sample.facial.engagement = read_number(*facial, "engagement", malformed);
        sample.facial.positivity = read_number(*facial, "positivity", malformed);
        sample.facial.anxiety    = read_number(*facial, "anxiety", malformed);

        if (const Json::Value* emotions = read_group(*facial, "emotions", malformed)) {
            for (const std::string& label : emotions->getMemberNames()) {
                const Json::Value& score = (*emotions)[label];
                if (!score.isNumeric()) {
                    ++malformed;
                    continue;
                }
                sample.facial.emotions[absl::AsciiStrToUpper(label)] = score.asFloat();
            }
        }
    }

    // ── Vocal ────────────────────────────────────────────
    if (const Json::Value* vocal = read_group(json, "vocal", malformed)) {
        sample.vocal.filler_ratio    = read_number(*vocal, "filler_ratio", malformed);
        sample.vocal.mumble_score    = read_number(*vocal, "mumble_score", malformed);
        sample.vocal.speech_rate_wpm = read_number(*vocal, "speech_rate_wpm", malformed);
    }

    // ── Transcript ───────────────────────────────────────
    if (const Json::Value* transcript = read_group(json, "transcript", malformed)) {
        if (transcript->isMember("text")) {
            const Json::Value& text = (*transcript)["text"];
            if (text.isString()) {
                sample.transcript.text = text.asString();
            } else if (!text.isNull()) {
                ++malformed;
            }
        }
        if (transcript->isMember("segments")) {
            const Json::Value& segments = (*transcript)["segments"];
            if (segments.isArray()) {
                for (const Json::Value& segment : segments) {
                    if (segment.isString()) {
                        sample.transcript.segments.push_back(segment.asString());
                    } else {
                        ++malformed;
                    }
                }
            } else if (!segments.isNull()) {
                ++malformed;
            }
        }
    }

    return sample;
}

absl::StatusOr<BridgeCommand> parse_command(absl::string_view line) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value parsed;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &parsed, &errors)) {
        return absl::InvalidArgumentError(absl::StrCat("malformed command: ", errors));
    }
    const Json::Value& root = parsed;
    if (!root.isObject()) {
        return absl::InvalidArgumentError("command must be a JSON object");
    }

    BridgeCommand command;

    const Json::Value& type = root["type"];
    if (type.isNull() || (type.isString() && type.asString() == "ingest")) {
        command.type = CommandType::INGEST;
    } else if (type.isString() && type.asString() == "close") {
        command.type = CommandType::CLOSE;
    } else if (type.isString() && type.asString() == "reload") {
        command.type = CommandType::RELOAD;
        return command;
    } else {
        return absl::InvalidArgumentError(absl::StrCat(
            "unknown command type '", type.isString() ? type.asString() : "<non-string>", "'"));
    }

    const Json::Value& session_id = root["session_id"];
    if (!session_id.isString() || session_id.asString().empty()) {
        return absl::InvalidArgumentError("command requires a non-empty 'session_id'");
    }
    command.session_id = session_id.asString();

    if (command.type == CommandType::INGEST) {
        const Json::Value& now_ms = root["now_ms"];
        if (!now_ms.isNull()) {
            if (!now_ms.isInt64() || now_ms.asInt64() < 0) {
                return absl::InvalidArgumentError("'now_ms' must be a non-negative integer");
            }
            command.now_ms = now_ms.asInt64();
        }
        command.sample = decode_raw_sample(root["sample"]);
    }
    return command;
}

} // namespace interview_coach
