#include "anthropic.hpp"
#include "../log.hpp"

using json = nlohmann::json;

namespace agnt {

AnthropicClient::AnthropicClient(const std::string& api_key, HttpClient& http,
                                 LogSink& log, ClientOptions options)
    : api_key_(api_key), http_(http), log_(log), options_(std::move(options)),
      base_url_(options_.base_url.empty() ? "https://api.anthropic.com/v1"
                                          : options_.base_url) {}

json AnthropicClient::build_request(const std::vector<Message>& messages) const {
    json request;
    request["model"] = options_.model;
    request["max_tokens"] = options_.max_tokens;
    request["stream"] = true;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    if (options_.code_execution) {
        request["tools"] = json::array({
            {{"type", CODE_EXECUTION_TOOL_TYPE}, {"name", CODE_EXECUTION_TOOL_NAME}}
        });
    }
    return request;
}

std::vector<Header> AnthropicClient::build_headers() const {
    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };
    if (options_.code_execution) {
        headers.emplace_back("anthropic-beta", CODE_EXECUTION_BETA);
    }
    return headers;
}

StreamHandle AnthropicClient::send_message_stream(const std::vector<Message>& messages) {
    StreamRequest request;
    request.url = base_url_ + "/messages";
    request.body = build_request(messages).dump();
    request.headers = build_headers();
    request.timeout_seconds = options_.timeout_seconds;

    log_.log("anthropic", "Sending " + std::to_string(messages.size()) +
             " messages to " + options_.model +
             (options_.code_execution ? " with code execution" : ""));
    return StreamHandle(http_, std::move(request), log_, options_.channel_capacity);
}

} // namespace agnt
