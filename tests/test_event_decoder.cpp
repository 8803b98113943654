#include <catch2/catch_test_macros.hpp>
#include "providers/event_decoder.hpp"
#include "providers/sse.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace agnt;
using json = nlohmann::json;

namespace {

// Records log lines so tests can check that something was noted.
class RecordingLog : public LogSink {
public:
    std::vector<std::string> lines;
    void log(const std::string& tag, const std::string& message) override {
        lines.push_back("[" + tag + "] " + message);
    }
};

std::string frame(const json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

std::string text_delta(const std::string& text) {
    return frame({{"type", "content_block_delta"}, {"index", 0},
                  {"delta", {{"type", "text_delta"}, {"text", text}}}});
}

std::string tool_start(const std::string& name = "code_execution") {
    return frame({{"type", "content_block_start"}, {"index", 1},
                  {"content_block", {{"type", "server_tool_use"}, {"id", "srvtoolu_1"},
                                     {"name", name}, {"input", json::object()}}}});
}

std::string json_delta(const std::string& partial) {
    return frame({{"type", "content_block_delta"}, {"index", 1},
                  {"delta", {{"type", "input_json_delta"}, {"partial_json", partial}}}});
}

std::string block_stop() {
    return frame({{"type", "content_block_stop"}, {"index", 1}});
}

// Feed `input` through assembler + decoder in one go.
std::vector<StreamEvent> run(EventDecoder& decoder, const std::string& input) {
    FrameAssembler assembler;
    std::vector<StreamEvent> events;
    for (const auto& f : assembler.feed(input)) {
        if (auto ev = decoder.decode(f)) events.push_back(std::move(*ev));
    }
    return events;
}

std::vector<StreamEvent> run(const std::string& input) {
    EventDecoder decoder;
    return run(decoder, input);
}

} // namespace

// ── Session info ────────────────────────────────────────────────

TEST_CASE("EventDecoder: message_start with container emits session info", "[decoder]") {
    auto events = run("data: {\"type\":\"message_start\",\"message\":{\"container\":"
                      "{\"id\":\"c1\",\"expires_at\":\"t1\"}}}\n\n");
    REQUIRE(events.size() == 1);
    auto* info = std::get_if<SessionInfoEvent>(&events[0]);
    REQUIRE(info != nullptr);
    REQUIRE(info->id == "c1");
    REQUIRE(info->expires_at == "t1");
}

TEST_CASE("EventDecoder: message_start without container emits nothing", "[decoder]") {
    auto events = run(frame({{"type", "message_start"},
                             {"message", {{"id", "msg_1"}, {"role", "assistant"}}}}));
    REQUIRE(events.empty());
}

TEST_CASE("EventDecoder: container missing expires_at emits nothing", "[decoder]") {
    auto events = run(frame({{"type", "message_start"},
                             {"message", {{"container", {{"id", "c1"}}}}}}));
    REQUIRE(events.empty());
}

// ── Text ────────────────────────────────────────────────────────

TEST_CASE("EventDecoder: text deltas emit text events in order", "[decoder]") {
    auto events = run(text_delta("Hel") + text_delta("lo"));
    REQUIRE(events.size() == 2);
    std::string joined;
    for (const auto& ev : events) {
        auto* text = std::get_if<TextEvent>(&ev);
        REQUIRE(text != nullptr);
        joined += text->text;
    }
    REQUIRE(joined == "Hello");
}

TEST_CASE("EventDecoder: text with escapes and unicode", "[decoder]") {
    auto events = run("data: {\"type\":\"content_block_delta\",\"index\":0,"
                      "\"delta\":{\"type\":\"text_delta\",\"text\":\"a\\nb \\u00e9\"}}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<TextEvent>(events[0]).text == "a\nb \xC3\xA9");
}

TEST_CASE("EventDecoder: text delta split across chunks at every offset", "[decoder]") {
    const std::string input = text_delta("caf\xC3\xA9 au lait");
    for (size_t split = 1; split < input.size(); ++split) {
        EventDecoder decoder;
        FrameAssembler assembler;
        std::vector<StreamEvent> events;
        for (const auto& part : {input.substr(0, split), input.substr(split)}) {
            for (const auto& f : assembler.feed(part)) {
                if (auto ev = decoder.decode(f)) events.push_back(*ev);
            }
        }
        REQUIRE(events.size() == 1);
        REQUIRE(std::get<TextEvent>(events[0]).text == "caf\xC3\xA9 au lait");
    }
}

// ── Tool input ──────────────────────────────────────────────────

TEST_CASE("EventDecoder: tool input assembled from fragments", "[decoder]") {
    EventDecoder decoder;
    auto events = run(decoder, tool_start());
    REQUIRE(events.empty());
    REQUIRE(decoder.tool_open());

    REQUIRE(run(decoder, json_delta("{\"co")).empty());
    REQUIRE(run(decoder, json_delta("de\":\"print(1)\"}")).empty());

    events = run(decoder, block_stop());
    REQUIRE(events.size() == 1);
    auto* ready = std::get_if<ToolInputReadyEvent>(&events[0]);
    REQUIRE(ready != nullptr);
    REQUIRE(ready->code == "print(1)");
    REQUIRE_FALSE(decoder.tool_open());
}

TEST_CASE("EventDecoder: tool_use block name also opens the accumulator", "[decoder]") {
    auto events = run(frame({{"type", "content_block_start"},
                             {"content_block", {{"type", "tool_use"}, {"name", "code_execution"}}}}) +
                      json_delta("{\"code\":\"x=1\"}") + block_stop());
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ToolInputReadyEvent>(events[0]).code == "x=1");
}

TEST_CASE("EventDecoder: tool JSON split at every offset", "[decoder]") {
    const std::string input_json = "{\"code\": \"import math\\nprint(math.pi)\"}";
    for (size_t split = 0; split <= input_json.size(); ++split) {
        EventDecoder decoder;
        auto events = run(decoder, tool_start() +
                                   json_delta(input_json.substr(0, split)) +
                                   json_delta(input_json.substr(split)) +
                                   block_stop());
        REQUIRE(events.size() == 1);
        REQUIRE(std::get<ToolInputReadyEvent>(events[0]).code == "import math\nprint(math.pi)");
    }
}

TEST_CASE("EventDecoder: malformed tool JSON is dropped and logged", "[decoder]") {
    RecordingLog log;
    EventDecoder decoder(&log);
    auto events = run(decoder, tool_start() + json_delta("{\"code\": \"unterminated") + block_stop());
    REQUIRE(events.empty());
    REQUIRE_FALSE(decoder.tool_open());
    REQUIRE_FALSE(log.lines.empty());

    // Decoder keeps working afterwards
    events = run(decoder, text_delta("ok"));
    REQUIRE(events.size() == 1);
}

TEST_CASE("EventDecoder: tool JSON without code member is dropped", "[decoder]") {
    auto events = run(tool_start() + json_delta("{\"script\":\"print(1)\"}") + block_stop());
    REQUIRE(events.empty());
}

TEST_CASE("EventDecoder: block stop for a text block emits nothing", "[decoder]") {
    auto events = run(text_delta("hi") + block_stop());
    REQUIRE(events.size() == 1);
    REQUIRE(std::holds_alternative<TextEvent>(events[0]));
}

TEST_CASE("EventDecoder: json delta with no open tool block is ignored", "[decoder]") {
    EventDecoder decoder;
    auto events = run(decoder, json_delta("{\"code\":\"x\"}") + block_stop());
    REQUIRE(events.empty());
}

TEST_CASE("EventDecoder: other tool name discards open accumulator", "[decoder]") {
    EventDecoder decoder;
    auto events = run(decoder, tool_start() + json_delta("{\"code\":\"a\"}") +
                               tool_start("web_search") + json_delta("{\"query\":\"b\"}") +
                               block_stop());
    REQUIRE(events.empty());
    REQUIRE_FALSE(decoder.tool_open());
}

TEST_CASE("EventDecoder: reopening a tool block keeps only the newest input", "[decoder]") {
    RecordingLog log;
    EventDecoder decoder(&log);
    auto events = run(decoder, tool_start() + json_delta("{\"code\":\"old") +
                               tool_start() + json_delta("{\"code\":\"new\"}") +
                               block_stop());
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ToolInputReadyEvent>(events[0]).code == "new");
    REQUIRE_FALSE(log.lines.empty());
}

TEST_CASE("EventDecoder: custom tool name", "[decoder]") {
    EventDecoder decoder(nullptr, "python");
    auto events = run(decoder, tool_start("python") + json_delta("{\"code\":\"1\"}") + block_stop());
    REQUIRE(events.size() == 1);

    events = run(decoder, tool_start("code_execution") + json_delta("{\"code\":\"2\"}") + block_stop());
    REQUIRE(events.empty());
}

// ── Tool results ────────────────────────────────────────────────

TEST_CASE("EventDecoder: code execution result block emits tool output", "[decoder]") {
    json result = {
        {"type", "content_block_start"}, {"index", 2},
        {"content_block", {
            {"type", "code_execution_tool_result"},
            {"tool_use_id", "srvtoolu_1"},
            {"content", {
                {"type", "code_execution_result"},
                {"stdout", ""}, {"stderr", "boom"}, {"return_code", 1},
                {"content", json::array({{{"type", "code_execution_output"}, {"file_id", "f_1"}}})}
            }}
        }}
    };
    auto events = run(frame(result));
    REQUIRE(events.size() == 1);
    auto* out = std::get_if<ToolOutputEvent>(&events[0]);
    REQUIRE(out != nullptr);
    REQUIRE(out->stdout_text.empty());
    REQUIRE(out->stderr_text == "boom");
    REQUIRE(out->exit_code == 1);
    REQUIRE(out->files == std::vector<FileRef>{{"f_1", "f_1"}});
}

TEST_CASE("EventDecoder: code execution error block emits tool error", "[decoder]") {
    json result = {
        {"type", "content_block_start"},
        {"content_block", {
            {"type", "code_execution_tool_result"},
            {"content", {{"type", "code_execution_tool_result_error"},
                         {"error_code", "unavailable"}}}
        }}
    };
    auto events = run(frame(result));
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ToolErrorEvent>(events[0]).error_code == "unavailable");
}

TEST_CASE("EventDecoder: unrecognised tool result shape is skipped", "[decoder]") {
    RecordingLog log;
    EventDecoder decoder(&log);
    json result = {
        {"type", "content_block_start"},
        {"content_block", {{"type", "code_execution_tool_result"},
                           {"content", {{"type", "something_new"}}}}}
    };
    auto events = run(decoder, frame(result) + text_delta("after"));
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<TextEvent>(events[0]).text == "after");
    REQUIRE_FALSE(log.lines.empty());
}

// ── Noise and unknowns ──────────────────────────────────────────

TEST_CASE("EventDecoder: heartbeats and comments produce nothing", "[decoder]") {
    auto events = run(": keepalive\n\nevent: ping\n\n" +
                      frame({{"type", "ping"}}) + text_delta("x"));
    REQUIRE(events.size() == 1);
}

TEST_CASE("EventDecoder: unknown event and delta types are ignored", "[decoder]") {
    auto events = run(frame({{"type", "message_delta"}, {"delta", {{"stop_reason", "end_turn"}}}}) +
                      frame({{"type", "message_stop"}}) +
                      frame({{"type", "brand_new_event"}, {"payload", 42}}) +
                      frame({{"type", "content_block_delta"},
                             {"delta", {{"type", "thinking_delta"}, {"thinking", "hmm"}}}}));
    REQUIRE(events.empty());
}

TEST_CASE("EventDecoder: unknown fields alongside known ones are tolerated", "[decoder]") {
    auto events = run(frame({{"type", "content_block_delta"}, {"extra", {1, 2, 3}},
                             {"delta", {{"type", "text_delta"}, {"text", "t"}, {"new_field", true}}}}));
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<TextEvent>(events[0]).text == "t");
}

TEST_CASE("EventDecoder: malformed JSON payload is skipped", "[decoder]") {
    RecordingLog log;
    EventDecoder decoder(&log);
    auto events = run(decoder, "data: {not json\n\ndata: [1,2]\n\ndata: {\"no_type\":1}\n\n" +
                               text_delta("still here"));
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<TextEvent>(events[0]).text == "still here");
    REQUIRE_FALSE(log.lines.empty());
}

TEST_CASE("EventDecoder: wrong field types produce nothing", "[decoder]") {
    auto events = run(frame({{"type", "content_block_delta"},
                             {"delta", {{"type", "text_delta"}, {"text", 5}}}}) +
                      frame({{"type", "content_block_start"}, {"content_block", "oops"}}));
    REQUIRE(events.empty());
}
