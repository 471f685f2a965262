/**
 * coach_bridge.cpp — Implementation
 */

#include "coach_bridge.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <glog/logging.h>

#include "bridge_protocol.hpp"

namespace interview_coach {

CoachBridge::CoachBridge(CoachingEngine& engine, JsonEmitter& emitter, BridgeOptions options, Clock clock)
    : engine_(engine)
    , emitter_(emitter)
    , options_(std::move(options))
    , clock_(std::move(clock))
{
}

int64_t CoachBridge::wall_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

void CoachBridge::handle_line(absl::string_view line) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) return;

    absl::StatusOr<BridgeCommand> command = parse_command(line);
    if (!command.ok()) {
        LOG(WARNING) << "Rejected command: " << command.status();
        emitter_.emit_error(std::string(command.status().message()));
        return;
    }

    switch (command->type) {
        case CommandType::INGEST: {
            int64_t now_ms = command->now_ms ? *command->now_ms : clock_();
            CoachingResponse response = engine_.ingest(command->session_id, command->sample, now_ms);
            emitter_.emit_coaching(response);
            maybe_evict(now_ms);
            break;
        }
        case CommandType::CLOSE: {
            engine_.close_session(command->session_id);
            emitter_.emit_closed(command->session_id);
            break;
        }
        case CommandType::RELOAD: {
            if (options_.rules_path.empty()) {
                emitter_.emit_error("Reload requested but no rules path is configured");
                break;
            }
            absl::Status status = engine_.reload_rules(options_.rules_path);
            if (status.ok()) {
                emitter_.emit_status("Rules reloaded from " + options_.rules_path);
            } else {
                emitter_.emit_error("Rule reload failed: " + std::string(status.message()));
            }
            break;
        }
    }
}

void CoachBridge::run(std::istream& in, const volatile std::sig_atomic_t& shutdown_requested) {
    std::string line;
    while (!shutdown_requested && std::getline(in, line)) {
        handle_line(line);
    }
}

void CoachBridge::maybe_evict(int64_t now_ms) {
    if (options_.session_idle_timeout_ms <= 0) return;

    // Sweep at most once per second of tick time.
    if (now_ms - last_eviction_ms_ < 1000) return;
    last_eviction_ms_ = now_ms;
    engine_.evict_idle_sessions(now_ms, options_.session_idle_timeout_ms);
}

} // namespace interview_coach
