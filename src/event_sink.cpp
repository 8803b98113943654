#include "event_sink.hpp"
#include "file_resolver.hpp"

#include <type_traits>

namespace agnt {

void dispatch(const StreamEvent& event, EventSink& sink) {
    std::visit([&sink](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, TextEvent>) {
            sink.on_text(ev);
        } else if constexpr (std::is_same_v<T, ToolInputReadyEvent>) {
            sink.on_tool_input(ev);
        } else if constexpr (std::is_same_v<T, ToolOutputEvent>) {
            sink.on_tool_output(ev);
        } else if constexpr (std::is_same_v<T, ToolErrorEvent>) {
            sink.on_tool_error(ev);
        } else if constexpr (std::is_same_v<T, SessionInfoEvent>) {
            sink.on_session_info(ev);
        } else {
            sink.on_connection_status(ev);
        }
    }, event);
}

PipeSink::PipeSink(std::ostream& out, std::ostream& err,
                   FileResolver* resolver, std::string output_dir)
    : out_(out), err_(err), resolver_(resolver), output_dir_(std::move(output_dir)) {}

void PipeSink::on_text(const TextEvent& ev) {
    out_ << ev.text << std::flush;
}

void PipeSink::on_tool_input(const ToolInputReadyEvent& ev) {
    out_ << "\n```python\n" << ev.code << "\n```\n" << std::flush;
}

void PipeSink::on_tool_output(const ToolOutputEvent& ev) {
    if (!ev.stdout_text.empty())
        out_ << "\nOutput:\n" << ev.stdout_text << "\n";
    if (!ev.stderr_text.empty())
        err_ << "\nError:\n" << ev.stderr_text << "\n";
    if (ev.exit_code != 0)
        err_ << "(Exit code: " << ev.exit_code << ")\n";

    if (!ev.files.empty()) {
        out_ << "\nCreated files:\n";
        for (const auto& file : ev.files) {
            out_ << "  - " << file.display_name << " (ID: " << file.id << ")\n";
            if (!resolver_) continue;
            if (!resolver_->spawn(file.id, output_dir_)) {
                err_ << "Note: Cannot download file '" << file.display_name
                     << "' - file ID not available in streaming mode\n";
            }
        }
    }
    out_ << std::flush;
    err_ << std::flush;
}

void PipeSink::on_tool_error(const ToolErrorEvent& ev) {
    err_ << "\nCode execution error: " << ev.error_code << "\n" << std::flush;
}

} // namespace agnt
