/**
 * @file http.hpp
 * @brief HTTP/1.1 client over Unix or TCP sockets, built on libcurl.
 * @author Dimitris Kafetzis
 *
 * Used for the container runtime API, the cluster API and workload status
 * queries. Every request uses its own easy handle, so an HttpClient may be
 * shared between threads.
 *
 * Streaming responses (events, logs, stats, watches, image pulls) are handed
 * to a chunk callback as the bytes arrive; a std::stop_token aborts them.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spawner {

// ─────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────

/**
 * @brief Where an HTTP server lives: a Unix socket path or a TCP host/port.
 */
struct Endpoint {
    enum class Kind : uint8_t { Unix, Tcp };

    Kind kind{Kind::Tcp};
    std::string socket_path;    ///< Kind::Unix
    std::string host;           ///< Kind::Tcp
    uint16_t port{80};          ///< Kind::Tcp

    static Endpoint unix_socket(std::string path);
    static Endpoint tcp(std::string host, uint16_t port);

    /// Scheme and authority prepended to request targets.
    [[nodiscard]] std::string base_url() const;
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Parse "unix:///path", "/path", "http://host[:port]" or "tcp://host:port".
 */
Result<Endpoint> parse_endpoint(std::string_view url);

/// Percent-encode a query component (RFC 3986 unreserved set kept as-is).
std::string url_encode(std::string_view value);

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

struct HttpRequest {
    std::string method{"GET"};
    std::string target{"/"};                                   ///< path + query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status{0};
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;  ///< names lower-cased
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/**
 * @brief Build an Error for a non-success response.
 */
Error status_error(const HttpResponse& response, std::string_view context);

/**
 * @brief Splits a byte stream into '\n'-terminated lines (newline-delimited JSON).
 */
class LineBuffer {
public:
    /// Append data and return every complete line (without the terminator).
    std::vector<std::string> feed(std::string_view data);

    /// Whatever is left after the last newline.
    [[nodiscard]] const std::string& remainder() const noexcept { return partial_; }

private:
    std::string partial_;
};

// ─────────────────────────────────────────────
// Client
// ─────────────────────────────────────────────

class HttpClient {
public:
    /// Receives body bytes of a 2xx streaming response. Return false to end the transfer.
    using ChunkCallback = std::function<bool(std::string_view)>;

    explicit HttpClient(Endpoint endpoint,
                        std::chrono::milliseconds timeout = std::chrono::seconds{30});

    /// Perform a request and read the whole response body.
    Result<HttpResponse> send(const HttpRequest& request) const;

    /**
     * @brief Perform a request and hand the body to `on_chunk` as it arrives.
     *
     * The timeout bounds connecting only. Returns success when the body ends,
     * `on_chunk` returns false, or `stop` is requested. A non-2xx response is
     * read fully and returned as an error; `on_chunk` never sees it.
     */
    Result<void> stream(const HttpRequest& request,
                        const ChunkCallback& on_chunk,
                        std::stop_token stop) const;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}  // namespace spawner
