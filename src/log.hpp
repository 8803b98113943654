#pragma once
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace agnt {

// Destination for diagnostic lines. Passed explicitly to every component
// that logs; there is no process-wide logger.
class LogSink {
public:
    virtual ~LogSink() = default;
    // `tag` names the component, e.g. "stream" or "files".
    virtual void log(const std::string& tag, const std::string& message) = 0;
};

class NullLogSink : public LogSink {
public:
    void log(const std::string&, const std::string&) override {}
};

class StderrLogSink : public LogSink {
public:
    void log(const std::string& tag, const std::string& message) override;

private:
    std::mutex mutex_;
};

// Timestamped lines appended to a file, flushed per line. Safe to share
// between the stream task and file resolver threads.
class FileLogSink : public LogSink {
public:
    // Truncates the file. Throws std::runtime_error if it cannot be opened.
    explicit FileLogSink(const std::string& path);
    ~FileLogSink() override;

    void log(const std::string& tag, const std::string& message) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

// Open `path` as a FileLogSink, or fall back to a NullLogSink after printing
// a warning when the file cannot be created.
std::unique_ptr<LogSink> open_log_sink(const std::string& path);

} // namespace agnt
