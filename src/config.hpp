#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace agnt {

struct Config {
    std::string api_key;
    std::string model = "claude-sonnet-4-20250514";
    std::string base_url = "https://api.anthropic.com/v1";
    uint32_t max_tokens = 4096;
    bool code_execution = false;
    std::string output_dir;   // empty = "output" when code execution is on
    std::string log_file = "agnt-log.txt";
    uint32_t channel_capacity = 100;
    uint32_t metadata_retry_delay_ms = 500;
    uint32_t request_timeout_seconds = 300;

    // Load from ~/.agnt/config.json + env vars
    static Config load();

    // Load from an explicit path; a missing or malformed file yields defaults.
    // Environment overrides are not applied.
    static Config load_file(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from an already merged JSON object.
    static Config from_json(const nlohmann::json& j);

    // Apply ANTHROPIC_API_KEY, ANTHROPIC_MODEL, ANTHROPIC_BASE_URL,
    // AGNT_OUTPUT_DIR.
    void apply_env();

    // Directory for downloaded files given the current code execution flag.
    std::string effective_output_dir() const;
};

// Fill keys missing from `existing` with values from `defaults`, recursively.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace agnt
