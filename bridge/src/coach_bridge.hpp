/**
 * coach_bridge.hpp — Line loop between the HTTP/session layer and the engine
 *
 * Reads JSON Lines commands (see bridge_protocol.hpp), dispatches them to
 * the CoachingEngine and reports every outcome through the JsonEmitter.
 * A bad line produces an "error" message; it never ends the loop.
 */

#pragma once

#include <csignal>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include <absl/strings/string_view.h>

#include "coaching_engine.hpp"
#include "json_emitter.hpp"

namespace interview_coach {

struct BridgeOptions {
    // Rule document re-read on a "reload" command.
    std::string rules_path;

    // Sessions idle this long are dropped; 0 keeps them until closed.
    int64_t session_idle_timeout_ms = 0;
};

class CoachBridge {
public:
    // Unix epoch milliseconds, the same domain callers use for now_ms;
    // consulted when a command has no now_ms.
    using Clock = std::function<int64_t()>;

    CoachBridge(CoachingEngine& engine, JsonEmitter& emitter, BridgeOptions options, Clock clock);

    /**
     * Handle one command line. Blank lines are ignored.
     */
    void handle_line(absl::string_view line);

    /**
     * Process lines until EOF or until `shutdown_requested` becomes non-zero.
     */
    void run(std::istream& in, const volatile std::sig_atomic_t& shutdown_requested);

    /**
     * Milliseconds since the Unix epoch on std::chrono::system_clock.
     */
    static int64_t wall_now_ms();

private:
    void maybe_evict(int64_t now_ms);

    CoachingEngine& engine_;
    JsonEmitter& emitter_;
    BridgeOptions options_;
    Clock clock_;
    int64_t last_eviction_ms_ = 0;
};

} // namespace interview_coach
