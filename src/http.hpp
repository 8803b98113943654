#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace agnt {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    // Set when the request never produced a status line (DNS, connect,
    // timeout, TLS). `error` then carries the transport's description.
    bool transport_failed = false;
    // Set when the caller's abort flag or chunk callback stopped the transfer.
    bool aborted = false;
    std::string error;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing).
// `abort_flag` is polled while the transfer waits on the network; once it
// reads true the transfer stops and the response comes back with `aborted`.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         const std::atomic<bool>* abort_flag = nullptr,
                                         long timeout_seconds = 300) = 0;
};

// libcurl implementation.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const std::atomic<bool>* abort_flag = nullptr,
                                 long timeout_seconds = 300) override;
};

} // namespace agnt
