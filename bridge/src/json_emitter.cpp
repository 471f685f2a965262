/**
 * json_emitter.cpp — Implementation
 */

#include "json_emitter.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

#include "coaching_engine.hpp"

namespace interview_coach {

void JsonEmitter::emit(const std::string& type, const std::string& json_data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    // Write a complete JSON line atomically
    out_ << "{\"type\":\"" << type << "\",\"data\":" << json_data << "}" << std::endl;
    // std::endl flushes, which is critical for the pipe to the caller
}

void JsonEmitter::emit_coaching(const CoachingResponse& response) {
    std::ostringstream json;
    // Enough digits that a score just under a guard threshold reads as such.
    json << std::fixed << std::setprecision(6);
    json << "{";
    json << "\"session_id\":\"" << escape_json_string(response.session_id) << "\"";
    json << ",\"state_id\":\"" << escape_json_string(response.state_id) << "\"";
    json << ",\"state_name\":\"" << escape_json_string(response.state_name) << "\"";
    json << ",\"voice_line\":\"" << escape_json_string(response.voice_line) << "\"";
    json << ",\"subtitle\":\"" << escape_json_string(response.subtitle) << "\"";
    json << ",\"tip\":\"" << escape_json_string(response.tip) << "\"";
    json << ",\"confidence\":" << response.confidence;
    json << ",\"anxiety\":" << response.anxiety;
    json << ",\"transitioned\":" << (response.transitioned ? "true" : "false");
    json << ",\"blocked_by_cooldown\":" << (response.blocked_by_cooldown ? "true" : "false");
    json << ",\"transcript_highlights\":[";
    for (std::size_t i = 0; i < response.transcript_highlights.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escape_json_string(response.transcript_highlights[i]) << "\"";
    }
    json << "]";
    json << ",\"sample_warnings\":" << response.sample_warnings;
    json << "}";
    emit("coaching", json.str());
}

void JsonEmitter::emit_closed(const std::string& session_id) {
    emit("closed", "{\"session_id\":\"" + escape_json_string(session_id) + "\"}");
}

void JsonEmitter::emit_status(const std::string& status_text) {
    std::string data = "{\"status\":\"" + escape_json_string(status_text) + "\"}";
    emit("status", data);
}

void JsonEmitter::emit_error(const std::string& error_text) {
    std::string data = "{\"message\":\"" + escape_json_string(error_text) + "\"}";
    emit("error", data);
}

void JsonEmitter::emit_ready() {
    emit("ready", "{}");
}

std::string JsonEmitter::escape_json_string(const std::string& input) {
    std::ostringstream ss;
    for (char c : input) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b";  break;
            case '\f': ss << "\\f";  break;
            case '\n': ss << "\\n";  break;
            case '\r': ss << "\\r";  break;
            case '\t': ss << "\\t";  break;
            default:
                if ('\x00' <= c && c <= '\x1f') {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
    return ss.str();
}

} // namespace interview_coach
