#pragma once
#include "bounded_channel.hpp"
#include "cancellation.hpp"
#include "http.hpp"
#include "stream_event.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace agnt {

class LogSink;

// Why a session ended before producing a normal response.
enum class FailureKind {
    Transport,      // DNS, connect, timeout before a status line
    Authentication, // 401
    InvalidModel,   // 400 mentioning the model
    BadRequest,     // other 400
    RateLimit,      // 429
    Server,         // 5xx
    Other
};

struct StreamFailure {
    FailureKind kind = FailureKind::Other;
    std::string message; // human readable, without the "Error:" prefix
};

const char* failure_kind_name(FailureKind kind);

// Classify a response that did not start a stream (transport failure or
// non-2xx status).
StreamFailure classify_failure(const HttpResponse& response);

// The single text event a failed session emits.
std::string failure_text(const StreamFailure& failure);

enum class StreamOutcome {
    Running,
    Finished,     // body ended normally
    Cancelled,    // token tripped
    Failed,       // dispatch failure, error status, or consumer gone before any data
    ConsumerGone  // receiver dropped mid-stream
};

const char* stream_outcome_name(StreamOutcome outcome);

struct StreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 300;
};

// Drive one streamed request to completion on the calling thread, pushing
// decoded events into `events` in arrival order. Cancellation is observed
// after each received chunk has been fully processed and while the
// transport waits for the next one; events already decoded from the current
// chunk are still delivered.
StreamOutcome run_stream(HttpClient& http,
                         const StreamRequest& request,
                         Sender<StreamEvent>& events,
                         const CancellationToken& cancel,
                         LogSink& log);

// A running stream task: the consumer's end of the event channel plus the
// token that stops it. Destroying the handle drops the receiver, trips the
// token and joins the task.
class StreamHandle {
public:
    StreamHandle() = default;
    StreamHandle(HttpClient& http, StreamRequest request, LogSink& log,
                 size_t channel_capacity = 100);
    ~StreamHandle();

    StreamHandle(StreamHandle&& other) noexcept;
    StreamHandle& operator=(StreamHandle&& other) noexcept;
    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    Receiver<StreamEvent>& events() { return events_; }
    CancellationToken token() const { return cancel_; }
    void cancel() { cancel_.cancel(); }

    // Running until the task has exited.
    StreamOutcome outcome() const;

    // Block until the task exits; the receiver stays usable for draining.
    StreamOutcome wait();

    bool valid() const { return worker_.joinable() || outcome_ != nullptr; }

private:
    void shutdown();

    Receiver<StreamEvent> events_;
    CancellationToken cancel_;
    std::shared_ptr<std::atomic<StreamOutcome>> outcome_;
    std::thread worker_;
};

} // namespace agnt
