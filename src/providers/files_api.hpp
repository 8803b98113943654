#pragma once
#include "../http.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace agnt {

class LogSink;

class FilesApiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FileMetadata {
    std::string id;
    std::string filename;
    uint64_t size_bytes = 0;
    std::string mime_type;
    std::optional<std::string> created_at;
    std::optional<bool> downloadable;
};

struct FileList {
    std::vector<FileMetadata> data;
    bool has_more = false;
    std::optional<std::string> next_page;
};

// Access to files created by code execution. All calls throw FilesApiError
// on transport failure, non-success status or an unparseable body.
class FilesApi {
public:
    virtual ~FilesApi() = default;
    virtual FileMetadata get_metadata(const std::string& file_id) = 0;
    virtual std::string download(const std::string& file_id) = 0;
    virtual FileList list_files() = 0;
};

class AnthropicFilesApi : public FilesApi {
public:
    AnthropicFilesApi(const std::string& api_key, HttpClient& http,
                      const std::string& base_url, LogSink& log);

    FileMetadata get_metadata(const std::string& file_id) override;
    std::string download(const std::string& file_id) override;
    FileList list_files() override;

    static FileMetadata parse_metadata(const std::string& body);

private:
    std::vector<Header> headers() const;
    HttpResponse fetch(const std::string& url, const std::string& what);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    LogSink& log_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr const char* FILES_BETA = "files-api-2025-04-14";
};

} // namespace agnt
