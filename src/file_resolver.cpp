#include "file_resolver.hpp"
#include "log.hpp"
#include "providers/files_api.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace agnt {

static bool is_separator(char c) {
    return c == '/' || c == '\\';
}

static bool is_safe_char(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
}

std::string sanitize_filename(const std::string& name) {
    size_t end = name.size();
    while (end > 0 && is_separator(name[end - 1])) end--;
    size_t begin = end;
    while (begin > 0 && !is_separator(name[begin - 1])) begin--;

    std::string segment = name.substr(begin, end - begin);
    if (segment.empty() || segment == "." || segment == "..")
        return "unnamed_file";

    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        auto c = static_cast<unsigned char>(segment[i]);
        if (is_safe_char(c)) {
            out += static_cast<char>(c);
            continue;
        }
        out += '_';
        // One replacement per UTF-8 character, not per byte
        if (c >= 0xC0) {
            while (i + 1 < segment.size() &&
                   (static_cast<unsigned char>(segment[i + 1]) & 0xC0) == 0x80)
                ++i;
        }
    }
    return out;
}

bool is_downloadable_file_id(const std::string& file_id) {
    return file_id.rfind("file_", 0) == 0;
}

static std::string placeholder_text(const std::string& file_id, const std::string& error) {
    return "Failed to download file from Claude's code execution.\n"
           "\n"
           "File ID: " + file_id + "\n"
           "Error: " + error + "\n"
           "\n"
           "This could be due to:\n"
           "- The file API not being available yet\n"
           "- The file having expired\n"
           "- Authentication or permission issues\n"
           "\n"
           "You can try using the Anthropic Files API directly with the file ID above.\n";
}

static bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(out);
}

FileResolver::FileResolver(FilesApi& api, LogSink& log, Sender<FileNameUpdate> updates,
                           std::chrono::milliseconds retry_delay)
    : api_(api), log_(log), updates_(std::move(updates)), retry_delay_(retry_delay) {}

FileResolver::~FileResolver() {
    wait_all();
}

std::string FileResolver::resolve_name(const std::string& file_id, bool& resolved) {
    resolved = false;
    try {
        std::string name = api_.get_metadata(file_id).filename;
        resolved = true;
        return name;
    } catch (const std::exception& e) {
        log_.log("files", "Warning: Could not fetch file metadata for " + file_id +
                 ": " + e.what());
    }

    // The file may not be registered yet; give it one more chance.
    std::this_thread::sleep_for(retry_delay_);
    try {
        std::string name = api_.get_metadata(file_id).filename;
        resolved = true;
        return name;
    } catch (const std::exception& e) {
        log_.log("files", "Metadata retry failed for " + file_id + ": " + e.what());
    }
    return file_id + ".bin";
}

FileResolution FileResolver::resolve(const std::string& file_id, const std::string& output_dir) {
    FileResolution result;
    result.file_id = file_id;
    result.resolved_name = resolve_name(file_id, result.metadata_resolved);

    if (!updates_.try_send({file_id, result.resolved_name}))
        log_.log("files", "Name update for " + file_id + " dropped; no listener or queue full");

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        result.error = "cannot create output directory " + output_dir + ": " + ec.message();
        log_.log("files", result.error);
        return result;
    }

    fs::path path = fs::path(output_dir) / sanitize_filename(result.resolved_name);
    result.path = path.string();

    std::string content;
    try {
        content = api_.download(file_id);
        result.downloaded = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    if (result.downloaded) {
        if (write_file(path, content)) {
            log_.log("files", "Downloaded: " + result.path);
        } else {
            result.downloaded = false;
            result.error = "cannot write " + result.path;
            log_.log("files", result.error);
        }
        return result;
    }

    if (write_file(path, placeholder_text(file_id, result.error))) {
        log_.log("files", "Warning: Could not download file content, created placeholder "
                 "instead: " + result.error);
    } else {
        log_.log("files", "cannot write placeholder " + result.path);
    }
    return result;
}

void FileResolver::reap_finished_locked() {
    auto it = tasks_.begin();
    while (it != tasks_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

bool FileResolver::spawn(const std::string& file_id, const std::string& output_dir) {
    if (!is_downloadable_file_id(file_id)) {
        log_.log("files", "Not downloading '" + file_id + "': not a file id");
        return false;
    }
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    reap_finished_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([this, file_id, output_dir, done] {
        try {
            resolve(file_id, output_dir);
        } catch (const std::exception& e) {
            log_.log("files", "Error saving file " + file_id + ": " + e.what());
        }
        done->store(true);
    });
    tasks_.push_back(Task{std::move(worker), std::move(done)});
    return true;
}

void FileResolver::wait_all() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }
    for (auto& t : tasks) {
        if (t.thread.joinable()) t.thread.join();
    }
}

size_t FileResolver::task_count() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    reap_finished_locked();
    return tasks_.size();
}

} // namespace agnt
