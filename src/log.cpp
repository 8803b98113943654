#include "log.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace agnt {

void StderrLogSink::log(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << tag << "] " << message << "\n";
}

FileLogSink::FileLogSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::trunc) {
    if (!out_.is_open())
        throw std::runtime_error("cannot open log file: " + path);
    out_ << "[" << timestamp_millis() << "] === agnt log started ===\n";
    out_.flush();
}

FileLogSink::~FileLogSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << timestamp_millis() << "] === agnt log closed ===\n";
    out_.flush();
}

void FileLogSink::log(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << timestamp_millis() << "] [" << tag << "] " << message << "\n";
    out_.flush();
}

std::unique_ptr<LogSink> open_log_sink(const std::string& path) {
    if (path.empty()) return std::make_unique<NullLogSink>();
    try {
        return std::make_unique<FileLogSink>(path);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not create log file: " << e.what() << "\n";
        return std::make_unique<NullLogSink>();
    }
}

} // namespace agnt
