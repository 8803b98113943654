#pragma once
#include "stream_event.hpp"
#include <ostream>
#include <string>

namespace agnt {

class FileResolver;

// Consumer of domain events; one handler per event kind.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_text(const TextEvent& ev) = 0;
    virtual void on_tool_input(const ToolInputReadyEvent& ev) = 0;
    virtual void on_tool_output(const ToolOutputEvent& ev) = 0;
    virtual void on_tool_error(const ToolErrorEvent& ev) = 0;
    virtual void on_session_info(const SessionInfoEvent&) {}
    virtual void on_connection_status(const ConnectionStatusEvent&) {}
};

// Route one event to the matching handler.
void dispatch(const StreamEvent& event, EventSink& sink);

// Plain-text rendering for pipe mode: text and code to `out`, stderr and
// errors to `err`. Files listed in tool output are handed to the resolver
// (when one is attached) for download into `output_dir`.
class PipeSink : public EventSink {
public:
    PipeSink(std::ostream& out, std::ostream& err,
             FileResolver* resolver = nullptr, std::string output_dir = "output");

    void on_text(const TextEvent& ev) override;
    void on_tool_input(const ToolInputReadyEvent& ev) override;
    void on_tool_output(const ToolOutputEvent& ev) override;
    void on_tool_error(const ToolErrorEvent& ev) override;

private:
    std::ostream& out_;
    std::ostream& err_;
    FileResolver* resolver_;
    std::string output_dir_;
};

} // namespace agnt
