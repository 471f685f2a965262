/**
 * main.cpp — Interview Coach Bridge
 *
 * Headless coaching runner. The HTTP/session layer spawns this process and
 * talks to it over pipes:
 *
 *   stdin : JSON Lines commands (ingest / close / reload), one per line
 *   stdout: JSON Lines results (ready / coaching / closed / status / error)
 *   stderr: glog diagnostics
 *
 * Upstream signal acquisition (facial analysis, transcription) happens in
 * the caller; each ingest line carries whatever features it obtained.
 *
 * Usage:
 *   ./coach_bridge --rules_path=data/rules.json
 *   COACHING_RULES_PATH=/etc/coach/rules.json ./coach_bridge
 *
 * The process runs until stdin closes or it receives SIGTERM/SIGINT.
 */

// ── Standard Library ─────────────────────────────────────
#include <cstdint>
#include <cstdlib>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// ── Third-party ──────────────────────────────────────────
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/status/statusor.h>
#include <glog/logging.h>

// ── Interview Coach ──────────────────────────────────────
#include "coach_bridge.hpp"
#include "coaching_engine.hpp"
#include "json_emitter.hpp"
#include "rule_config.hpp"

// ── Command-line Flags ───────────────────────────────────
ABSL_FLAG(std::string, rules_path, "",
    "Path to the coaching rule config (JSON). Can also be set via COACHING_RULES_PATH env var; "
    "defaults to data/rules.json.");
ABSL_FLAG(int64_t, session_idle_timeout_ms, 0,
    "Drop sessions that have not ticked for this many milliseconds. 0 keeps sessions until closed.");

// ── Globals ──────────────────────────────────────────────
static interview_coach::JsonEmitter g_emitter;
static volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int signal) {
    g_shutdown_requested = 1;
}

// ── Resolve Rules Path ───────────────────────────────────
std::string resolve_rules_path() {
    std::string path = absl::GetFlag(FLAGS_rules_path);
    if (!path.empty()) return path;

    const char* env_path = std::getenv("COACHING_RULES_PATH");
    if (env_path && env_path[0] != '\0') return std::string(env_path);

    return "data/rules.json";
}

// ── Main ─────────────────────────────────────────────────
int main(int argc, char** argv) {
    // Setup logging: send to stderr so stdout stays clean for JSON
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;     // All glog output → stderr
    FLAGS_alsologtostderr = false;

    absl::SetProgramUsageMessage(
        "Interview Coach Bridge: turns multimodal signal samples into coaching responses.\n"
        "Reads JSON Lines commands on stdin, writes JSON Lines results on stdout.\n\n"
        "  coach_bridge --rules_path=data/rules.json"
    );
    absl::ParseCommandLine(argc, argv);

    // Handle signals for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // ── Load Rule Table (fatal on error) ─────────────
        std::string rules_path = resolve_rules_path();
        g_emitter.emit_status("Loading coaching rules from " + rules_path + "...");

        absl::StatusOr<std::shared_ptr<const interview_coach::RuleConfig>> rules =
            interview_coach::RuleConfig::load_from_file(rules_path);
        if (!rules.ok()) {
            LOG(ERROR) << "Invalid rule config: " << rules.status();
            g_emitter.emit_error("Invalid rule config: " + std::string(rules.status().message()));
            return 1;
        }

        // ── Setup Coaching Pipeline ──────────────────────
        interview_coach::CoachingEngine engine(*std::move(rules));

        interview_coach::BridgeOptions options;
        options.rules_path = rules_path;
        options.session_idle_timeout_ms = absl::GetFlag(FLAGS_session_idle_timeout_ms);

        interview_coach::CoachBridge bridge(
            engine, g_emitter, options, &interview_coach::CoachBridge::wall_now_ms);

        // ── Signal Ready ────────────────────────────────
        g_emitter.emit_ready();

        // ── Run (blocks until EOF or shutdown) ──────────
        bridge.run(std::cin, g_shutdown_requested);

        g_emitter.emit_status("Shutting down...");
        return 0;

    } catch (const std::exception& e) {
        g_emitter.emit_error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
