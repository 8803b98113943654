#include "stream_task.hpp"
#include "log.hpp"
#include "providers/event_decoder.hpp"
#include "providers/sse.hpp"

namespace agnt {

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Transport: return "transport";
        case FailureKind::Authentication: return "authentication";
        case FailureKind::InvalidModel: return "invalid_model";
        case FailureKind::BadRequest: return "bad_request";
        case FailureKind::RateLimit: return "rate_limit";
        case FailureKind::Server: return "server";
        case FailureKind::Other: return "other";
    }
    return "other";
}

const char* stream_outcome_name(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::Running: return "running";
        case StreamOutcome::Finished: return "finished";
        case StreamOutcome::Cancelled: return "cancelled";
        case StreamOutcome::Failed: return "failed";
        case StreamOutcome::ConsumerGone: return "consumer_gone";
    }
    return "running";
}

StreamFailure classify_failure(const HttpResponse& response) {
    if (response.transport_failed || response.status_code == 0) {
        return {FailureKind::Transport,
                "Failed to connect to Anthropic API: " + response.error};
    }

    const long status = response.status_code;
    const std::string& body = response.body;
    if (status == 401)
        return {FailureKind::Authentication, "Invalid or missing API key: " + body};
    if (status == 400) {
        if (body.find("model") != std::string::npos)
            return {FailureKind::InvalidModel, "Invalid model name: " + body};
        return {FailureKind::BadRequest, "Bad request: " + body};
    }
    if (status == 429)
        return {FailureKind::RateLimit, "Rate limit exceeded: " + body};
    if (status >= 500 && status < 600)
        return {FailureKind::Server, "Anthropic server error: " + body};
    return {FailureKind::Other, "API error (" + std::to_string(status) + "): " + body};
}

std::string failure_text(const StreamFailure& failure) {
    return "\n\nError: " + failure.message + "\n";
}

static void log_transport_detail(const std::string& error, LogSink& log) {
    if (error.find("resolve") != std::string::npos ||
        error.find("connect") != std::string::npos) {
        log.log("stream", "Network/connection error detected");
    } else if (error.find("imeout") != std::string::npos ||
               error.find("timed out") != std::string::npos) {
        log.log("stream", "Request timeout error");
    }
}

StreamOutcome run_stream(HttpClient& http,
                         const StreamRequest& request,
                         Sender<StreamEvent>& events,
                         const CancellationToken& cancel,
                         LogSink& log) {
    if (!events.send(ConnectionStatusEvent{"Connecting to Claude API..."})) {
        log.log("stream", "Consumer gone before the request was sent");
        return StreamOutcome::Failed;
    }
    if (!events.send(ConnectionStatusEvent{"Sending request..."})) {
        log.log("stream", "Consumer gone before the request was sent");
        return StreamOutcome::Failed;
    }
    if (cancel.is_cancelled()) return StreamOutcome::Cancelled;

    FrameAssembler frames;
    EventDecoder decoder(&log);
    bool consumer_gone = false;
    bool cancelled = false;
    size_t emitted = 0;

    auto response = http.stream_post_raw(
        request.url, request.body, request.headers,
        [&](const char* data, size_t len) -> bool {
            for (const auto& frame : frames.feed(data, len)) {
                auto event = decoder.decode(frame);
                if (!event) continue;
                if (!events.send(std::move(*event))) {
                    consumer_gone = true;
                    return false;
                }
                emitted++;
            }
            if (cancel.is_cancelled()) {
                cancelled = true;
                return false;
            }
            return true;
        },
        cancel.flag(), request.timeout_seconds);

    if (consumer_gone) {
        log.log("stream", "Consumer dropped the event channel; stopping");
        return StreamOutcome::ConsumerGone;
    }
    if (cancelled || (response.aborted && cancel.is_cancelled())) {
        log.log("stream", "Streaming cancelled after " + std::to_string(emitted) + " events");
        return StreamOutcome::Cancelled;
    }

    if (response.transport_failed || (response.status_code != 0 && !response.ok())) {
        StreamFailure failure = classify_failure(response);
        if (failure.kind == FailureKind::Transport) {
            log.log("stream", "Failed to send request to Messages API: " + response.error);
            log_transport_detail(response.error, log);
        } else {
            log.log("stream", "API error response (status " +
                    std::to_string(response.status_code) + ", " +
                    failure_kind_name(failure.kind) + "): " + response.body);
        }
        if (!events.send(TextEvent{failure_text(failure)}))
            log.log("stream", "Consumer gone; failure message not delivered");
        return StreamOutcome::Failed;
    }

    if (!response.error.empty()) {
        // Body ended early (connection reset, timeout mid-stream); what was
        // received has already been delivered.
        log.log("stream", "Stream ended with transport error: " + response.error);
    }
    if (frames.pending() > 0) {
        log.log("stream", "Discarding " + std::to_string(frames.pending()) +
                " bytes of incomplete trailing frame");
    }
    return StreamOutcome::Finished;
}

// ── StreamHandle ──────────────────────────────────────────────

StreamHandle::StreamHandle(HttpClient& http, StreamRequest request, LogSink& log,
                           size_t channel_capacity)
    : outcome_(std::make_shared<std::atomic<StreamOutcome>>(StreamOutcome::Running)) {
    auto channel = make_channel<StreamEvent>(channel_capacity);
    events_ = std::move(channel.second);

    worker_ = std::thread(
        [&http, &log, request = std::move(request), sender = std::move(channel.first),
         cancel = cancel_, outcome = outcome_]() mutable {
            StreamOutcome result = StreamOutcome::Failed;
            try {
                result = run_stream(http, request, sender, cancel, log);
            } catch (const std::exception& e) {
                log.log("stream", std::string("Stream task failed: ") + e.what());
                StreamFailure failure{FailureKind::Other, e.what()};
                if (!sender.send(TextEvent{failure_text(failure)}))
                    log.log("stream", "Consumer gone; failure message not delivered");
            }
            outcome->store(result);
            sender.close();
        });
}

StreamHandle::~StreamHandle() {
    shutdown();
}

StreamHandle::StreamHandle(StreamHandle&& other) noexcept
    : events_(std::move(other.events_)),
      cancel_(other.cancel_),
      outcome_(std::move(other.outcome_)),
      worker_(std::move(other.worker_)) {}

StreamHandle& StreamHandle::operator=(StreamHandle&& other) noexcept {
    if (this != &other) {
        shutdown();
        events_ = std::move(other.events_);
        cancel_ = other.cancel_;
        outcome_ = std::move(other.outcome_);
        worker_ = std::move(other.worker_);
    }
    return *this;
}

void StreamHandle::shutdown() {
    events_.close();
    if (worker_.joinable()) {
        cancel_.cancel();
        worker_.join();
    }
}

StreamOutcome StreamHandle::outcome() const {
    if (!outcome_) return StreamOutcome::Finished;
    return outcome_->load();
}

StreamOutcome StreamHandle::wait() {
    if (worker_.joinable()) worker_.join();
    return outcome();
}

} // namespace agnt
