/**
 * @file http.cpp
 * @brief HttpClient implementation on the libcurl easy interface.
 * @author Dimitris Kafetzis
 */

#include "network/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <memory>
#include <new>

namespace spawner {

namespace {

constexpr const char* USER_AGENT = "spawner/1.0";

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

Result<void> ensure_global_init() {
    static const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init != CURLE_OK) {
        return Error{ErrorCode::Connection,
                     std::string{"libcurl initialization failed: "} + curl_easy_strerror(init)};
    }
    return Result<void>{};
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'
                             || text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * @brief Per-transfer state shared with the libcurl callbacks.
 */
struct Transfer {
    CURL* handle{nullptr};
    HttpResponse response;
    const HttpClient::ChunkCallback* on_chunk{nullptr};   ///< null: buffer the body
    std::stop_token stop;
    bool status_known{false};
    bool deliver{false};                                   ///< 2xx body goes to on_chunk
    bool consumer_done{false};
    std::exception_ptr failure;
};

size_t on_header(char* data, size_t size, size_t nmemb, void* user) {
    auto* transfer = static_cast<Transfer*>(user);
    const size_t length = size * nmemb;
    auto line = trim(std::string_view{data, length});

    // A new status line (interim 1xx) starts a fresh header block.
    if (line.starts_with("HTTP/")) {
        transfer->response.headers.clear();
        transfer->response.reason.clear();
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto rest = line.substr(sp + 1);
            if (auto sp2 = rest.find(' '); sp2 != std::string_view::npos) {
                transfer->response.reason = std::string{rest.substr(sp2 + 1)};
            }
        }
        return length;
    }

    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        transfer->response.headers.emplace_back(lower(trim(line.substr(0, colon))),
                                                std::string{trim(line.substr(colon + 1))});
    }
    return length;
}

size_t on_body(char* data, size_t size, size_t nmemb, void* user) {
    auto* transfer = static_cast<Transfer*>(user);
    const size_t length = size * nmemb;

    if (transfer->on_chunk == nullptr) {
        transfer->response.body.append(data, length);
        return length;
    }

    if (!transfer->status_known) {
        long status = 0;
        curl_easy_getinfo(transfer->handle, CURLINFO_RESPONSE_CODE, &status);
        transfer->deliver = status >= 200 && status < 300;
        transfer->status_known = true;
    }
    if (!transfer->deliver) {
        transfer->response.body.append(data, length);
        return length;
    }

    // Returning less than `length` aborts the transfer with CURLE_WRITE_ERROR.
    if (transfer->stop.stop_requested()) return 0;
    try {
        if (!(*transfer->on_chunk)(std::string_view{data, length})) {
            transfer->consumer_done = true;
            return 0;
        }
    } catch (...) {
        transfer->failure = std::current_exception();
        return 0;
    }
    return length;
}

int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(user);
    return transfer->stop.stop_requested() ? 1 : 0;
}

Error transfer_error(CURLcode code, const char* error_buffer,
                     const Endpoint& endpoint, const HttpRequest& request) {
    ErrorCode kind = ErrorCode::Protocol;
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            kind = ErrorCode::Connection;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            kind = ErrorCode::Timeout;
            break;
        default:
            break;
    }
    std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
    return Error{kind, request.method + " " + endpoint.to_string() + request.target + ": " + detail};
}

/**
 * @brief Create an easy handle configured for `request`; callbacks write into `transfer`.
 */
EasyHandle prepare(const Endpoint& endpoint,
                   const HttpRequest& request,
                   std::chrono::milliseconds timeout,
                   HeaderList& headers,
                   Transfer& transfer,
                   char* error_buffer) {
    EasyHandle handle(curl_easy_init());
    if (!handle) return handle;
    CURL* curl = handle.get();
    transfer.handle = curl;

    auto url = endpoint.base_url() + request.target;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (endpoint.kind == Endpoint::Kind::Unix) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, endpoint.socket_path.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
    }

    curl_slist* list = nullptr;
    for (const auto& [name, value] : request.headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    list = curl_slist_append(list, "Expect:");
    headers.reset(list);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    return handle;
}

long response_code(CURL* curl) {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────

Endpoint Endpoint::unix_socket(std::string path) {
    Endpoint ep;
    ep.kind = Kind::Unix;
    ep.socket_path = std::move(path);
    return ep;
}

Endpoint Endpoint::tcp(std::string host, uint16_t port) {
    Endpoint ep;
    ep.kind = Kind::Tcp;
    ep.host = std::move(host);
    ep.port = port;
    return ep;
}

std::string Endpoint::base_url() const {
    // The socket path carries the connection; the authority only fills the Host header.
    if (kind == Kind::Unix) return "http://localhost";
    if (host.find(':') != std::string::npos) {
        return "http://[" + host + "]:" + std::to_string(port);
    }
    return "http://" + host + ":" + std::to_string(port);
}

std::string Endpoint::to_string() const {
    if (kind == Kind::Unix) return "unix://" + socket_path;
    return base_url();
}

Result<Endpoint> parse_endpoint(std::string_view url) {
    if (url.starts_with("unix://")) {
        auto path = url.substr(7);
        if (path.empty()) return Error{"Empty socket path in endpoint"};
        return Endpoint::unix_socket(std::string{path});
    }
    if (url.starts_with("/")) {
        return Endpoint::unix_socket(std::string{url});
    }

    uint16_t default_port = 0;
    if (url.starts_with("http://")) {
        url.remove_prefix(7);
        default_port = 80;
    } else if (url.starts_with("tcp://")) {
        url.remove_prefix(6);
        default_port = 2375;
    } else {
        return Error{"Unsupported endpoint scheme: " + std::string{url}};
    }

    if (auto slash = url.find('/'); slash != std::string_view::npos) {
        url = url.substr(0, slash);
    }
    if (url.empty()) return Error{"Missing host in endpoint"};

    std::string_view host = url;
    std::string_view port_text;
    if (url.front() == '[') {
        auto close = url.find(']');
        if (close == std::string_view::npos) return Error{"Malformed IPv6 host"};
        host = url.substr(1, close - 1);
        if (close + 1 < url.size() && url[close + 1] == ':') port_text = url.substr(close + 2);
    } else if (auto colon = url.rfind(':'); colon != std::string_view::npos) {
        host = url.substr(0, colon);
        port_text = url.substr(colon + 1);
    }

    uint16_t port = default_port;
    if (!port_text.empty()) {
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0) {
            return Error{"Invalid port in endpoint: " + std::string{port_text}};
        }
    }
    return Endpoint::tcp(std::string{host}, port);
}

std::string url_encode(std::string_view value) {
    // curl_easy_escape() treats a zero length as "use strlen()".
    if (value.empty()) return {};
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())), curl_free);
    if (!escaped) throw std::bad_alloc();
    return std::string{escaped.get()};
}

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto key = lower(name);
    for (const auto& [k, v] : headers) {
        if (k == key) return v;
    }
    return std::nullopt;
}

Error status_error(const HttpResponse& response, std::string_view context) {
    std::string message{context};
    message += ": HTTP " + std::to_string(response.status);
    if (!response.reason.empty()) message += " " + response.reason;
    if (!response.body.empty()) {
        message += ": ";
        message.append(response.body, 0, std::min<size_t>(response.body.size(), 512));
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
    }
    return Error{error_code_for_status(response.status), std::move(message), response.status};
}

std::vector<std::string> LineBuffer::feed(std::string_view data) {
    partial_.append(data);
    std::vector<std::string> lines;
    size_t start = 0;
    for (auto nl = partial_.find('\n'); nl != std::string::npos; nl = partial_.find('\n', start)) {
        auto end = nl;
        if (end > start && partial_[end - 1] == '\r') --end;
        if (end > start) lines.emplace_back(partial_, start, end - start);
        start = nl + 1;
    }
    partial_.erase(0, start);
    return lines;
}

// ─────────────────────────────────────────────
// Client
// ─────────────────────────────────────────────

HttpClient::HttpClient(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout) {}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) const {
    if (auto init = ensure_global_init(); !init) return init.error();

    Transfer transfer;
    HeaderList headers;
    char error_buffer[CURL_ERROR_SIZE] = {};
    auto handle = prepare(endpoint_, request, timeout_, headers, transfer, error_buffer);
    if (!handle) return Error{ErrorCode::Connection, "curl_easy_init failed"};

    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));

    auto code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) return transfer_error(code, error_buffer, endpoint_, request);

    transfer.response.status = static_cast<int>(response_code(handle.get()));
    return std::move(transfer.response);
}

Result<void> HttpClient::stream(const HttpRequest& request,
                                const ChunkCallback& on_chunk,
                                std::stop_token stop) const {
    if (stop.stop_requested()) return Result<void>{};
    if (auto init = ensure_global_init(); !init) return init.error();

    Transfer transfer;
    transfer.on_chunk = &on_chunk;
    transfer.stop = stop;
    HeaderList headers;
    char error_buffer[CURL_ERROR_SIZE] = {};
    auto handle = prepare(endpoint_, request, timeout_, headers, transfer, error_buffer);
    if (!handle) return Error{ErrorCode::Connection, "curl_easy_init failed"};

    // Streams have no overall deadline; the progress callback observes `stop` while idle.
    curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &transfer);

    auto code = curl_easy_perform(handle.get());
    if (transfer.failure) std::rethrow_exception(transfer.failure);

    if (code != CURLE_OK) {
        bool ended_here = (code == CURLE_WRITE_ERROR || code == CURLE_ABORTED_BY_CALLBACK)
                       && (transfer.consumer_done || stop.stop_requested());
        if (ended_here) return Result<void>{};
        return transfer_error(code, error_buffer, endpoint_, request);
    }

    transfer.response.status = static_cast<int>(response_code(handle.get()));
    if (!transfer.response.ok()) {
        return status_error(transfer.response, request.method + " " + request.target);
    }
    return Result<void>{};
}

}  // namespace spawner
