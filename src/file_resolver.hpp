#pragma once
#include "bounded_channel.hpp"
#include "stream_event.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agnt {

class FilesApi;
class LogSink;

// Reduce a server-supplied filename to a safe single path component:
// keep the final segment, map anything outside [A-Za-z0-9._-] to '_'.
// Empty, "." and ".." become "unnamed_file".
std::string sanitize_filename(const std::string& name);

// Only ids of this form refer to downloadable code-execution outputs.
bool is_downloadable_file_id(const std::string& file_id);

struct FileResolution {
    std::string file_id;
    std::string resolved_name;  // metadata filename or "<id>.bin"
    std::string path;           // file written on disk (content or placeholder)
    bool metadata_resolved = false;
    bool downloaded = false;
    std::string error;          // why content could not be fetched
};

// Downloads code-execution outputs into a directory. Each file runs on its
// own thread so slow fetches never hold up the event stream. Resolved names
// go out on `updates` as (file_id, name); failures stay local to the file.
class FileResolver {
public:
    FileResolver(FilesApi& api, LogSink& log, Sender<FileNameUpdate> updates,
                 std::chrono::milliseconds retry_delay = std::chrono::milliseconds(500));
    ~FileResolver();

    FileResolver(const FileResolver&) = delete;
    FileResolver& operator=(const FileResolver&) = delete;

    // Resolve synchronously on the calling thread. Never throws for fetch
    // failures; filesystem errors creating the output directory or writing
    // the artifact are reported in the result's `error`.
    FileResolution resolve(const std::string& file_id, const std::string& output_dir);

    // Start resolve() on a background thread. Returns false (and starts
    // nothing) for ids that are not downloadable. Finished tasks are joined
    // here first.
    bool spawn(const std::string& file_id, const std::string& output_dir);

    // Join every background task started so far.
    void wait_all();

    // Tasks still held after joining the finished ones.
    size_t task_count();

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string resolve_name(const std::string& file_id, bool& resolved);
    void reap_finished_locked();

    FilesApi& api_;
    LogSink& log_;
    Sender<FileNameUpdate> updates_;
    std::chrono::milliseconds retry_delay_;
    std::mutex tasks_mutex_;
    std::vector<Task> tasks_;
};

} // namespace agnt
