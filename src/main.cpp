#include "config.hpp"
#include "event_sink.hpp"
#include "file_resolver.hpp"
#include "http.hpp"
#include "log.hpp"
#include "transcript.hpp"
#include "util.hpp"
#include "providers/anthropic.hpp"
#include "providers/files_api.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>

static std::atomic<bool> g_streaming{false};
static std::atomic<bool> g_interrupt{false};

// Ctrl-C cancels a response in progress; otherwise it exits.
static void signal_handler(int /*sig*/) {
    if (g_streaming.load()) {
        g_interrupt.store(true);
    } else {
        std::_Exit(130);
    }
}

static void print_usage() {
    std::cout << "Usage: agnt [options]\n"
              << "\n"
              << "Options:\n"
              << "  -p, --pipe             Read the prompt from stdin, stream the answer to stdout\n"
              << "  -m, --message MSG      Prompt prepended to piped input\n"
              << "  -x, --code-execution   Enable server-side code execution\n"
              << "  -o, --output-dir DIR   Where files created by code execution are saved\n"
              << "                         (default: ./output when code execution is enabled)\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /code                Toggle code execution\n"
              << "  /status              Show model, container and file info\n"
              << "  /clear               Clear the conversation\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Press Ctrl-C while a response is streaming to cancel it.\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY    API key (required)\n"
              << "  ANTHROPIC_MODEL      Model name (default: claude-sonnet-4-20250514)\n"
              << "  ANTHROPIC_BASE_URL   API base URL\n"
              << "  AGNT_OUTPUT_DIR      Output directory for created files\n";
}

static agnt::ClientOptions client_options(const agnt::Config& config) {
    agnt::ClientOptions options;
    options.base_url = config.base_url;
    options.model = config.model;
    options.max_tokens = config.max_tokens;
    options.code_execution = config.code_execution;
    options.channel_capacity = config.channel_capacity;
    options.timeout_seconds = static_cast<long>(config.request_timeout_seconds);
    return options;
}

static int run_pipe_mode(agnt::AnthropicClient& client,
                         agnt::FilesApi& files,
                         agnt::LogSink& log,
                         const agnt::Config& config,
                         const std::string& prepend) {
    std::string input((std::istreambuf_iterator<char>(std::cin)),
                      std::istreambuf_iterator<char>());
    std::string full_message = prepend.empty() ? input : prepend + " " + input;

    // Nobody displays resolved names in pipe mode.
    auto names = agnt::make_channel<agnt::FileNameUpdate>(1);
    names.second.close();

    std::string output_dir = config.effective_output_dir();
    if (output_dir.empty()) output_dir = "output";
    agnt::FileResolver resolver(files, log, std::move(names.first),
                                std::chrono::milliseconds(config.metadata_retry_delay_ms));
    agnt::PipeSink sink(std::cout, std::cerr, &resolver, output_dir);

    auto handle = client.send_message_stream({agnt::Message{"user", full_message}});
    while (auto event = handle.events().recv()) {
        agnt::dispatch(*event, sink);
    }
    auto outcome = handle.wait();
    resolver.wait_all();
    std::cout << std::endl;

    log.log("main", std::string("Pipe session ") + agnt::stream_outcome_name(outcome));
    return outcome == agnt::StreamOutcome::Failed ? 1 : 0;
}

static void print_status(const agnt::AnthropicClient& client, const agnt::Transcript& transcript) {
    std::cout << "Model: " << client.model() << "\n"
              << "Code execution: " << (client.code_execution_enabled() ? "on" : "off") << "\n"
              << "History: " << transcript.messages().size() << " messages\n";
    if (const auto& info = transcript.container_info()) {
        std::cout << "Container: " << info->id << " (expires " << info->expires_at << ")\n";
    }
    for (const auto& msg : transcript.messages()) {
        for (const auto& content : msg.contents) {
            const auto* output = std::get_if<agnt::CodeOutputContent>(&content);
            if (!output) continue;
            for (const auto& file : output->files) {
                std::cout << "File: " << file.display_name << " (ID: " << file.id << ")\n";
            }
        }
    }
}

static void stream_turn(agnt::AnthropicClient& client,
                        agnt::Transcript& transcript,
                        agnt::FileResolver& resolver,
                        agnt::Receiver<agnt::FileNameUpdate>& names,
                        const std::string& output_dir) {
    agnt::PipeSink printer(std::cout, std::cerr, &resolver,
                           output_dir.empty() ? "output" : output_dir);

    transcript.start_streaming();
    g_interrupt.store(false);
    g_streaming.store(true);
    auto handle = client.send_message_stream(transcript.to_request_messages());

    bool cancelled = false;
    while (true) {
        agnt::FileNameUpdate update;
        while (names.try_recv(update) == agnt::TryRecv::Item) {
            transcript.update_file_metadata(update.first, update.second);
        }

        if (!cancelled && g_interrupt.load()) {
            handle.cancel();
            cancelled = true;
            std::cout << "\n[cancelled]" << std::flush;
        }

        agnt::StreamEvent event;
        auto status = handle.events().try_recv(event);
        if (status == agnt::TryRecv::Item) {
            agnt::dispatch(event, transcript);
            agnt::dispatch(event, printer);
        } else if (status == agnt::TryRecv::Disconnected) {
            break;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    g_streaming.store(false);
    if (handle.wait() == agnt::StreamOutcome::Failed) {
        transcript.fail_streaming();
    } else {
        transcript.finish_streaming();
    }
    std::cout << "\n\n";
}

static int run_interactive(agnt::AnthropicClient& client,
                           agnt::FilesApi& files,
                           agnt::LogSink& log,
                           agnt::Config& config) {
    auto names = agnt::make_channel<agnt::FileNameUpdate>(100);
    agnt::FileResolver resolver(files, log, std::move(names.first),
                                std::chrono::milliseconds(config.metadata_retry_delay_ms));
    agnt::Transcript transcript;

    std::signal(SIGINT, signal_handler);

    std::cout << "agnt\n"
              << "Model: " << client.model()
              << " | Code execution: " << (client.code_execution_enabled() ? "on" : "off") << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "agnt> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        // Apply any name updates that arrived while idle
        agnt::FileNameUpdate update;
        while (names.second.try_recv(update) == agnt::TryRecv::Item) {
            transcript.update_file_metadata(update.first, update.second);
        }

        std::string input = agnt::trim(line);
        if (input.empty()) continue;

        if (input[0] == '/') {
            if (input == "/quit" || input == "/exit") {
                break;
            } else if (input == "/clear") {
                transcript.clear();
                std::cout << "Conversation cleared.\n";
            } else if (input == "/code") {
                client.set_code_execution(!client.code_execution_enabled());
                config.code_execution = client.code_execution_enabled();
                std::cout << "Code execution " << (config.code_execution ? "enabled" : "disabled") << ".\n";
            } else if (input == "/status") {
                print_status(client, transcript);
            } else if (input == "/help") {
                std::cout << "Commands:\n"
                          << "  /code     Toggle code execution\n"
                          << "  /status   Show current status\n"
                          << "  /clear    Clear the conversation\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << input << "\n";
            }
            continue;
        }

        transcript.add_message("user", input);
        std::cout << "\n";
        stream_turn(client, transcript, resolver, names.second, config.effective_output_dir());
    }

    // Nothing reads names from here on
    names.second.close();
    resolver.wait_all();
    return 0;
}

int main(int argc, char* argv[]) try {
    bool pipe = false;
    bool code_execution = false;
    std::string message;
    std::string output_dir;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--pipe") == 0) {
            pipe = true;
        } else if (std::strcmp(argv[i], "-x") == 0 || std::strcmp(argv[i], "--code-execution") == 0) {
            code_execution = true;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if ((std::strcmp(argv[i], "-o") == 0 || std::strcmp(argv[i], "--output-dir") == 0) && i + 1 < argc) {
            output_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = agnt::Config::load();
    if (code_execution) config.code_execution = true;
    if (!output_dir.empty()) config.output_dir = output_dir;

    auto log = agnt::open_log_sink(config.log_file);
    log->log("main", "=== agnt started ===");
    log->log("main", "Model: " + config.model + (pipe ? " (pipe mode)" : ""));

    if (config.api_key.empty()) {
        std::cerr << "Error: ANTHROPIC_API_KEY must be set in the environment or "
                     "~/.agnt/config.json\n";
        return 1;
    }

    agnt::http_init();
    int rc = 0;
    {
        agnt::CurlHttpClient http_client;
        agnt::AnthropicClient client(config.api_key, http_client, *log, client_options(config));
        agnt::AnthropicFilesApi files(config.api_key, http_client, config.base_url, *log);

        rc = pipe ? run_pipe_mode(client, files, *log, config, message)
                  : run_interactive(client, files, *log, config);
    }
    agnt::http_cleanup();

    log->log("main", "=== agnt terminated ===");
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
