/**
 * json_emitter.hpp — Thread-safe JSON line emitter
 *
 * The protocol is "JSON Lines" (aka NDJSON): one JSON object per line,
 * terminated by \n. The calling service reads these line-by-line.
 *
 * Message types:
 *   { "type": "coaching",   "data": { ... } }
 *   { "type": "closed",     "data": { "session_id": "..." } }
 *   { "type": "status",     "data": { "status": "..." } }
 *   { "type": "error",      "data": { "message": "..." } }
 *   { "type": "ready",      "data": {} }
 */

#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace interview_coach {

struct CoachingResponse;

class JsonEmitter {
public:
    explicit JsonEmitter(std::ostream& out = std::cout) : out_(out) {}

    /**
     * Emit a JSON line. `json_data` must already be a serialized object.
     * Thread-safe: ticks for different sessions may finish concurrently.
     */
    void emit(const std::string& type, const std::string& json_data);

    void emit_coaching(const CoachingResponse& response);
    void emit_closed(const std::string& session_id);
    void emit_status(const std::string& status_text);
    void emit_error(const std::string& error_text);
    void emit_ready();

    /**
     * Escape a string for safe JSON embedding (without surrounding quotes).
     */
    static std::string escape_json_string(const std::string& input);

private:
    std::ostream& out_;
    std::mutex write_mutex_;
};

} // namespace interview_coach
