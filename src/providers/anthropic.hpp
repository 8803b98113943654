#pragma once
#include "../http.hpp"
#include "../stream_task.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace agnt {

class LogSink;

struct Message {
    std::string role;
    std::string content;
};

struct ClientOptions {
    std::string base_url;  // empty = https://api.anthropic.com/v1
    std::string model = "claude-sonnet-4-20250514";
    uint32_t max_tokens = 4096;
    bool code_execution = false;
    size_t channel_capacity = 100;
    long timeout_seconds = 300;
};

// Streaming Messages API client. Each send spawns its own stream task; the
// client itself holds no per-request state.
class AnthropicClient {
public:
    AnthropicClient(const std::string& api_key, HttpClient& http, LogSink& log,
                    ClientOptions options = {});

    StreamHandle send_message_stream(const std::vector<Message>& messages);

    nlohmann::json build_request(const std::vector<Message>& messages) const;
    std::vector<Header> build_headers() const;

    void set_code_execution(bool enabled) { options_.code_execution = enabled; }
    bool code_execution_enabled() const { return options_.code_execution; }

    void set_model(const std::string& model) { options_.model = model; }
    const std::string& model() const { return options_.model; }
    const std::string& base_url() const { return base_url_; }

private:
    std::string api_key_;
    HttpClient& http_;
    LogSink& log_;
    ClientOptions options_;
    std::string base_url_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr const char* CODE_EXECUTION_BETA =
        "code-execution-2025-05-22,files-api-2025-04-14";
    static constexpr const char* CODE_EXECUTION_TOOL_TYPE = "code_execution_20250522";
    static constexpr const char* CODE_EXECUTION_TOOL_NAME = "code_execution";
};

} // namespace agnt
