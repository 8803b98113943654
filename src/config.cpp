#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace agnt {

nlohmann::json Config::defaults_json() {
    return {
        {"model", "claude-sonnet-4-20250514"},
        {"base_url", "https://api.anthropic.com/v1"},
        {"api_key", ""},
        {"max_tokens", 4096},
        {"code_execution", false},
        {"output_dir", ""},
        {"log_file", "agnt-log.txt"},
        {"stream", {
            {"channel_capacity", 100},
            {"request_timeout_seconds", 300}
        }},
        {"files", {
            {"metadata_retry_delay_ms", 500}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("api_key") && j["api_key"].is_string())
        cfg.api_key = j["api_key"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    if (j.contains("base_url") && j["base_url"].is_string() &&
        !j["base_url"].get<std::string>().empty())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("max_tokens") && j["max_tokens"].is_number_unsigned())
        cfg.max_tokens = j["max_tokens"].get<uint32_t>();
    if (j.contains("code_execution") && j["code_execution"].is_boolean())
        cfg.code_execution = j["code_execution"].get<bool>();
    if (j.contains("output_dir") && j["output_dir"].is_string())
        cfg.output_dir = j["output_dir"].get<std::string>();
    if (j.contains("log_file") && j["log_file"].is_string())
        cfg.log_file = j["log_file"].get<std::string>();

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("channel_capacity") && s["channel_capacity"].is_number_unsigned() &&
            s["channel_capacity"].get<uint32_t>() > 0)
            cfg.channel_capacity = s["channel_capacity"].get<uint32_t>();
        if (s.contains("request_timeout_seconds") && s["request_timeout_seconds"].is_number_unsigned())
            cfg.request_timeout_seconds = s["request_timeout_seconds"].get<uint32_t>();
    }

    if (j.contains("files") && j["files"].is_object()) {
        auto& f = j["files"];
        if (f.contains("metadata_retry_delay_ms") && f["metadata_retry_delay_ms"].is_number_unsigned())
            cfg.metadata_retry_delay_ms = f["metadata_retry_delay_ms"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load_file(const std::string& path) {
    nlohmann::json j;
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            // Malformed config file: fall back to defaults
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
    }
    return from_json(j);
}

Config Config::load() {
    std::string config_path = expand_home("~/.agnt/config.json");
    Config cfg = load_file(config_path);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_MODEL"); v && *v)
        model = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"); v && *v)
        base_url = v;
    if (const char* v = std::getenv("AGNT_OUTPUT_DIR"); v && *v)
        output_dir = v;
}

std::string Config::effective_output_dir() const {
    if (!output_dir.empty()) return output_dir;
    return code_execution ? "output" : "";
}

} // namespace agnt
