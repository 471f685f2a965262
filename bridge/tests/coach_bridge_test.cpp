#include "coach_bridge.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <json/json.h>

namespace interview_coach {
namespace {

const std::string kShippedRules = std::string(COACH_SOURCE_DIR) + "/data/rules.json";

class CoachBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        absl::StatusOr<std::shared_ptr<const RuleConfig>> rules = RuleConfig::load_from_file(kShippedRules);
        ASSERT_TRUE(rules.ok()) << rules.status();
        engine_ = std::make_unique<CoachingEngine>(*rules);
    }

    std::unique_ptr<CoachBridge> make_bridge(BridgeOptions options) {
        return std::make_unique<CoachBridge>(*engine_, emitter_, std::move(options),
                                             [this] { return clock_ms_; });
    }

    /**
     * Every line written so far, parsed.
     */
    std::vector<Json::Value> messages() const {
        std::vector<Json::Value> parsed;
        std::istringstream lines(out_.str());
        std::string line;
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        while (std::getline(lines, line)) {
            Json::Value value;
            std::string errors;
            EXPECT_TRUE(reader->parse(line.data(), line.data() + line.size(), &value, &errors))
                << "unparseable output line: " << line;
            parsed.push_back(value);
        }
        return parsed;
    }

    std::ostringstream out_;
    JsonEmitter emitter_{out_};
    std::unique_ptr<CoachingEngine> engine_;
    int64_t clock_ms_ = 0;
};

TEST_F(CoachBridgeTest, IngestEmitsCoachingLine) {
    auto bridge = make_bridge(BridgeOptions{});

    bridge->handle_line(R"({"session_id": "s1", "now_ms": 0, "sample": {}})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["type"].asString(), "coaching");
    const Json::Value& data = out[0]["data"];
    EXPECT_EQ(data["session_id"].asString(), "s1");
    EXPECT_EQ(data["state_id"].asString(), "steady");
    EXPECT_EQ(data["subtitle"].asString(), "Keep going");
    EXPECT_NEAR(data["confidence"].asDouble(), 0.5, 1e-3);
    EXPECT_NEAR(data["anxiety"].asDouble(), 0.5, 1e-3);
    EXPECT_FALSE(data["transitioned"].asBool());
    EXPECT_TRUE(data["transcript_highlights"].isArray());
}

TEST_F(CoachBridgeTest, MissingTimestampUsesClock) {
    auto bridge = make_bridge(BridgeOptions{});
    clock_ms_ = 777;

    bridge->handle_line(R"({"session_id": "s1", "sample": {"facial": {"anxiety": 0.95}}})");

    EXPECT_EQ(engine_->sessions().get("s1").last_tick_at_ms, 777);
    EXPECT_EQ(messages().at(0)["data"]["state_id"].asString(), "anxiety_alert");
}

TEST_F(CoachBridgeTest, WallClockIsEpochMilliseconds) {
    auto epoch_ms = [] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
    int64_t before = epoch_ms();
    int64_t now = CoachBridge::wall_now_ms();
    int64_t after = epoch_ms();

    EXPECT_GE(now, before);
    EXPECT_LE(now, after);
}

TEST_F(CoachBridgeTest, StampedAndUnstampedLinesShareOneClock) {
    BridgeOptions options;
    options.session_idle_timeout_ms = 60000;
    auto bridge = std::make_unique<CoachBridge>(*engine_, emitter_, options, &CoachBridge::wall_now_ms);

    bridge->handle_line(R"({"session_id": "unstamped"})");
    int64_t stamp = CoachBridge::wall_now_ms() + 2000;
    bridge->handle_line(R"({"session_id": "stamped", "now_ms": )" + std::to_string(stamp) + "}");

    EXPECT_TRUE(engine_->sessions().contains("unstamped"));
    EXPECT_TRUE(engine_->sessions().contains("stamped"));
    EXPECT_EQ(messages().size(), 2u);
}

TEST_F(CoachBridgeTest, TranscriptHighlightsAreEscaped) {
    auto bridge = make_bridge(BridgeOptions{});

    bridge->handle_line(
        R"({"session_id": "s1", "now_ms": 0, "sample": {"transcript": {"segments": ["um \"quote\" here"]}}})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    const Json::Value& highlights = out[0]["data"]["transcript_highlights"];
    ASSERT_EQ(highlights.size(), 1u);
    EXPECT_EQ(highlights[0].asString(), "um \"quote\" here");
}

TEST_F(CoachBridgeTest, ScoresNearAThresholdAreNotRoundedOntoIt) {
    CoachingResponse response;
    response.session_id = "s1";
    response.state_id = "steady";
    response.confidence = 0.7996f;
    response.anxiety = 0.59995f;

    emitter_.emit_coaching(response);

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    double confidence = out[0]["data"]["confidence"].asDouble();
    double anxiety = out[0]["data"]["anxiety"].asDouble();
    EXPECT_NEAR(confidence, 0.7996, 1e-6);
    EXPECT_LT(confidence, 0.8);
    EXPECT_NEAR(anxiety, 0.59995, 1e-6);
    EXPECT_LT(anxiety, 0.6);
}

TEST_F(CoachBridgeTest, BadLinesReportErrorsAndLoopContinues) {
    auto bridge = make_bridge(BridgeOptions{});

    bridge->handle_line("{ not json");
    bridge->handle_line("   ");
    bridge->handle_line(R"({"type": "dance", "session_id": "s1"})");
    bridge->handle_line(R"({"session_id": "s1", "now_ms": 5})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0]["type"].asString(), "error");
    EXPECT_EQ(out[1]["type"].asString(), "error");
    EXPECT_NE(out[1]["data"]["message"].asString().find("dance"), std::string::npos);
    EXPECT_EQ(out[2]["type"].asString(), "coaching");
}

TEST_F(CoachBridgeTest, CloseRemovesSession) {
    auto bridge = make_bridge(BridgeOptions{});

    bridge->handle_line(R"({"session_id": "s1", "now_ms": 0})");
    bridge->handle_line(R"({"type": "close", "session_id": "s1"})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1]["type"].asString(), "closed");
    EXPECT_EQ(out[1]["data"]["session_id"].asString(), "s1");
    EXPECT_FALSE(engine_->sessions().contains("s1"));
}

TEST_F(CoachBridgeTest, ReloadWithoutPathIsAnError) {
    auto bridge = make_bridge(BridgeOptions{});

    bridge->handle_line(R"({"type": "reload"})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["type"].asString(), "error");
}

TEST_F(CoachBridgeTest, ReloadReadsConfiguredPath) {
    BridgeOptions options;
    options.rules_path = kShippedRules;
    auto bridge = make_bridge(options);
    std::shared_ptr<const RuleConfig> before = engine_->rules();

    bridge->handle_line(R"({"type": "reload"})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["type"].asString(), "status");
    EXPECT_NE(engine_->rules(), before);
}

TEST_F(CoachBridgeTest, FailedReloadKeepsTable) {
    BridgeOptions options;
    options.rules_path = "/nonexistent/rules.json";
    auto bridge = make_bridge(options);
    std::shared_ptr<const RuleConfig> before = engine_->rules();

    bridge->handle_line(R"({"type": "reload"})");

    std::vector<Json::Value> out = messages();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["type"].asString(), "error");
    EXPECT_EQ(engine_->rules(), before);
}

TEST_F(CoachBridgeTest, IdleSessionsAreEvicted) {
    BridgeOptions options;
    options.session_idle_timeout_ms = 5000;
    auto bridge = make_bridge(options);

    bridge->handle_line(R"({"session_id": "quiet", "now_ms": 1000})");
    bridge->handle_line(R"({"session_id": "busy", "now_ms": 8000})");

    EXPECT_FALSE(engine_->sessions().contains("quiet"));
    EXPECT_TRUE(engine_->sessions().contains("busy"));
}

TEST_F(CoachBridgeTest, RunStopsAtEndOfInput) {
    auto bridge = make_bridge(BridgeOptions{});
    std::istringstream in(
        "{\"session_id\": \"a\", \"now_ms\": 0}\n"
        "\n"
        "{\"session_id\": \"b\", \"now_ms\": 10}\n");
    volatile std::sig_atomic_t stop = 0;

    bridge->run(in, stop);

    EXPECT_EQ(messages().size(), 2u);
    EXPECT_EQ(engine_->sessions().size(), 2u);
}

TEST_F(CoachBridgeTest, RunHonoursShutdownFlag) {
    auto bridge = make_bridge(BridgeOptions{});
    std::istringstream in("{\"session_id\": \"a\", \"now_ms\": 0}\n");
    volatile std::sig_atomic_t stop = 1;

    bridge->run(in, stop);

    EXPECT_TRUE(messages().empty());
}

} // namespace
} // namespace interview_coach
