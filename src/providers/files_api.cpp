#include "files_api.hpp"
#include "../log.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agnt {

AnthropicFilesApi::AnthropicFilesApi(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url, LogSink& log)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url),
      log_(log) {}

std::vector<Header> AnthropicFilesApi::headers() const {
    return {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"anthropic-beta", FILES_BETA}
    };
}

HttpResponse AnthropicFilesApi::fetch(const std::string& url, const std::string& what) {
    auto response = http_.get(url, headers());
    if (response.transport_failed || response.aborted) {
        log_.log("files", "Failed to " + what + ": " + response.error);
        throw FilesApiError("Failed to " + what + ": " + response.error);
    }
    if (!response.ok()) {
        log_.log("files", what + " failed (HTTP " +
                 std::to_string(response.status_code) + "): " + response.body);
        throw FilesApiError("Failed to " + what + ": " + response.body);
    }
    return response;
}

static FileMetadata metadata_from_json(const json& j) {
    FileMetadata meta;
    meta.id = j.at("id").get<std::string>();
    meta.filename = j.at("filename").get<std::string>();
    meta.size_bytes = j.value("size_bytes", uint64_t{0});
    meta.mime_type = j.value("mime_type", "");
    if (j.contains("created_at") && j["created_at"].is_string())
        meta.created_at = j["created_at"].get<std::string>();
    if (j.contains("downloadable") && j["downloadable"].is_boolean())
        meta.downloadable = j["downloadable"].get<bool>();
    return meta;
}

FileMetadata AnthropicFilesApi::parse_metadata(const std::string& body) {
    try {
        return metadata_from_json(json::parse(body));
    } catch (const json::exception& e) {
        throw FilesApiError(std::string("Failed to parse file metadata: ") + e.what());
    }
}

FileMetadata AnthropicFilesApi::get_metadata(const std::string& file_id) {
    log_.log("files", "Fetching metadata for file: " + file_id);
    auto response = fetch(base_url_ + "/files/" + file_id, "get file metadata");
    try {
        FileMetadata meta = parse_metadata(response.body);
        log_.log("files", "File metadata: " + meta.filename + " (" + meta.mime_type +
                 ", " + std::to_string(meta.size_bytes) + " bytes)");
        return meta;
    } catch (const FilesApiError& e) {
        log_.log("files", std::string(e.what()) + "; raw JSON: " + response.body);
        throw;
    }
}

std::string AnthropicFilesApi::download(const std::string& file_id) {
    log_.log("files", "Downloading file: " + file_id);
    auto response = fetch(base_url_ + "/files/" + file_id + "/content", "download file");
    log_.log("files", "Successfully downloaded " +
             std::to_string(response.body.size()) + " bytes");
    return std::move(response.body);
}

FileList AnthropicFilesApi::list_files() {
    auto response = fetch(base_url_ + "/files", "list files");
    FileList list;
    try {
        auto j = json::parse(response.body);
        for (const auto& item : j.at("data"))
            list.data.push_back(metadata_from_json(item));
        list.has_more = j.value("has_more", false);
        if (j.contains("next_page") && j["next_page"].is_string())
            list.next_page = j["next_page"].get<std::string>();
    } catch (const json::exception& e) {
        throw FilesApiError(std::string("Failed to parse file list: ") + e.what());
    }
    return list;
}

} // namespace agnt
