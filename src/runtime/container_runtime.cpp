/**
 * @file container_runtime.cpp
 * @brief ContainerRuntime implementation over the Docker Engine HTTP API.
 * @author Dimitris Kafetzis
 */

#include "runtime/container_runtime.hpp"

#include "network/json_codec.hpp"

#include <charconv>
#include <condition_variable>
#include <mutex>

namespace spawner {

namespace {

const std::string PORT_KEY = std::to_string(ContainerRuntime::CONTAINER_PORT) + "/tcp";

/**
 * @brief Base64url without padding, as the runtime expects in X-Registry-Auth.
 */
std::string encode_base64url(std::string_view input) {
    static constexpr char ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16)
                   | (static_cast<uint8_t>(input[i + 1]) << 8)
                   | static_cast<uint8_t>(input[i + 2]);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += ALPHABET[n & 0x3F];
    }
    if (auto rest = input.size() - i; rest > 0) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        if (rest == 2) n |= static_cast<uint8_t>(input[i + 1]) << 8;
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        if (rest == 2) out += ALPHABET[(n >> 6) & 0x3F];
    }
    return out;
}

/**
 * @brief Prefer the runtime's {"message": ...} body over the raw response text.
 */
Error api_error(const HttpResponse& response, std::string_view context) {
    auto error = status_error(response, context);
    if (auto doc = parse_json(response.body); doc && doc->isObject() && (*doc)["message"].isString()) {
        error.message = std::string{context} + ": HTTP " + std::to_string(response.status)
                      + ": " + (*doc)["message"].asString();
    }
    return error;
}

/// Image references without a tag or digest pull ":latest", not every tag.
std::pair<std::string, std::string> split_image_tag(const std::string& image) {
    if (image.find('@') != std::string::npos) return {image, ""};
    auto slash = image.rfind('/');
    auto colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

/**
 * @brief Stream a newline-delimited JSON body, handing each document to `on_doc`.
 *
 * `on_doc` returns false to end the transfer early.
 * @return Success when the body ended, `on_doc` declined more, or `stop` was requested.
 */
template <typename OnDoc, typename OnBadLine>
Result<void> pump_json_lines(const HttpClient& client, const HttpRequest& request,
                             std::stop_token stop, OnDoc on_doc, OnBadLine on_bad) {
    LineBuffer lines;
    return client.stream(request, [&](std::string_view chunk) {
        for (const auto& line : lines.feed(chunk)) {
            auto doc = parse_json(line);
            if (!doc) {
                on_bad(line, doc.error());
                continue;
            }
            if (!on_doc(*doc)) return false;
        }
        return true;
    }, stop);
}

}  // anonymous namespace

/**
 * @brief Read the event stream at `target` until it ends.
 *
 * A close by the runtime, without `stop`, is reported as a Connection error.
 */
Result<void> ContainerRuntime::stream_events(const State& state, const std::string& target,
                                             const EventCallback& on_event, std::stop_token stop) {
    auto& logger = *state.logger;
    auto result = pump_json_lines(state.client, HttpRequest{.method = "GET", .target = target}, stop,
        [&](const Json::Value& doc) {
            if (auto event = classify_event(parse_event_message(doc), logger)) {
                on_event(*event);
            }
            return true;
        },
        [&](const std::string& line, const Error& error) {
            logger.error("Malformed container event", {{"error", error.message}, {"line", line}});
        });

    if (result && !stop.stop_requested()) {
        return Error{ErrorCode::Connection, "Event stream closed by runtime"};
    }
    return result;
}

// ─────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────

Result<ContainerRuntime> ContainerRuntime::connect(RuntimeOptions options, Logger& logger) {
    auto state = std::make_shared<State>(State{
        HttpClient(options.endpoint, options.timeout),
        std::move(options.runtime),
        "/" + options.api_version,
        options.stats_interval,
        &logger,
    });

    auto ping = state->client.send(HttpRequest{.method = "GET", .target = "/_ping"});
    if (!ping) {
        return Error{ErrorCode::Connection,
                     "Cannot reach container runtime at " + options.endpoint.to_string()
                     + ": " + ping.error().message};
    }
    if (!ping->ok()) {
        return api_error(*ping, "Runtime ping");
    }

    logger.info("Connected to container runtime",
                {{"endpoint", options.endpoint.to_string()},
                 {"api_version", options.api_version}});
    return ContainerRuntime{std::move(state)};
}

std::string ContainerRuntime::api(std::string_view path) const {
    return state_->api_prefix + std::string{path};
}

std::string ContainerRuntime::events_target() const {
    return api("/events?filters=" + url_encode(R"({"type":["container"]})"));
}

// ─────────────────────────────────────────────
// Streams
// ─────────────────────────────────────────────

Subscription ContainerRuntime::run_container_events(EventCallback on_event,
                                                    StreamClosedCallback on_closed) const {
    auto state = state_;
    return Subscription::spawn([state, target = events_target(), on_event = std::move(on_event),
                                on_closed = std::move(on_closed)](std::stop_token stop) {
        auto result = stream_events(*state, target, on_event, stop);
        if (!result) state->logger->error("Container event stream failed", {{"error", result.error().message}});
        if (on_closed) on_closed(result);
    });
}

Subscription ContainerRuntime::follow_container_events(EventCallback on_event,
                                                       std::chrono::milliseconds retry) const {
    auto state = state_;
    return Subscription::spawn([state, target = events_target(), on_event = std::move(on_event),
                                retry](std::stop_token stop) {
        std::mutex mutex;
        std::condition_variable_any cv;
        while (!stop.stop_requested()) {
            auto result = stream_events(*state, target, on_event, stop);
            if (stop.stop_requested()) break;
            state->logger->warn("Container event stream failed; re-subscribing",
                                {{"error", result.error().message},
                                 {"retry_ms", std::to_string(retry.count())}});
            std::unique_lock lock(mutex);
            cv.wait_for(lock, stop, retry, [] { return false; });
        }
    });
}

Subscription ContainerRuntime::get_logs(const std::string& name,
                                        LogCallback on_line,
                                        StreamClosedCallback on_closed) const {
    auto state = state_;
    auto target = api("/containers/" + url_encode(name)
                      + "/logs?follow=1&stdout=1&stderr=1&timestamps=1&tail=all");

    return Subscription::spawn([state, target, on_line = std::move(on_line),
                                on_closed = std::move(on_closed)](std::stop_token stop) {
        LogFrameDecoder decoder;
        auto result = state->client.stream(HttpRequest{.method = "GET", .target = target},
            [&](std::string_view chunk) {
                for (auto& output : decoder.feed(chunk)) {
                    on_line(std::move(output));
                }
                return true;
            }, stop);

        if (!result) on_line(result.error());
        if (on_closed) on_closed(result);
    });
}

Subscription ContainerRuntime::get_stats(const std::string& name,
                                         StatsCallback on_stats,
                                         StreamClosedCallback on_closed) const {
    auto state = state_;
    auto target = api("/containers/" + url_encode(name) + "/stats?stream=1");

    return Subscription::spawn([state, target, on_stats = std::move(on_stats),
                                on_closed = std::move(on_closed)](std::stop_token stop) {
        StatsThrottle throttle(state->stats_interval);
        auto result = pump_json_lines(state->client, HttpRequest{.method = "GET", .target = target}, stop,
            [&](const Json::Value& doc) {
                if (throttle.admit(std::chrono::steady_clock::now())) {
                    on_stats(parse_container_stats(doc));
                }
                return true;
            },
            [&](const std::string& /*line*/, const Error& error) {
                if (!throttle.admit(std::chrono::steady_clock::now())) return;
                on_stats(error);
            });

        if (!result) on_stats(result.error());
        if (on_closed) on_closed(result);
    });
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> ContainerRuntime::pull_image(const std::string& image,
                                          const std::optional<RegistryCredentials>& credentials) const {
    auto [repository, tag] = split_image_tag(image);
    HttpRequest request{.method = "POST",
                        .target = api("/images/create?fromImage=" + url_encode(repository))};
    if (!tag.empty()) request.target += "&tag=" + url_encode(tag);

    if (credentials) {
        Json::Value auth(Json::objectValue);
        auth["username"] = credentials->username;
        auth["password"] = credentials->password;
        auth["serveraddress"] = credentials->server_address;
        request.headers.emplace_back("X-Registry-Auth", encode_base64url(to_json_string(auth)));
    }

    std::optional<Error> layer_error;
    auto pumped = pump_json_lines(state_->client, request, std::stop_token{},
        [&](const Json::Value& doc) {
            if (doc.isObject() && doc["error"].isString()) {
                layer_error = Error{ErrorCode::Api, "Pull of " + image + " failed: " + doc["error"].asString()};
                return false;
            }
            return true;
        },
        [&](const std::string& /*line*/, const Error& error) {
            state_->logger->warn("Unparseable pull progress", {{"image", image}, {"error", error.message}});
        });

    if (layer_error) return *layer_error;
    if (!pumped) return pumped.error();

    state_->logger->info("Pulled image", {{"image", image}});
    return Result<void>{};
}

Result<void> ContainerRuntime::run_container(const std::string& name,
                                             const std::string& image,
                                             const std::map<std::string, std::string>& env) const {
    Json::Value config(Json::objectValue);
    config["Image"] = image;

    Json::Value env_list(Json::arrayValue);
    for (const auto& [key, value] : env) {
        env_list.append(key + "=" + value);
    }
    config["Env"] = env_list;

    config["ExposedPorts"][PORT_KEY] = Json::Value(Json::objectValue);
    config["Labels"][std::string{MANAGED_LABEL}] = "true";
    config["Labels"][std::string{BACKEND_LABEL}] = name;

    Json::Value binding(Json::objectValue);
    binding["HostPort"] = "0";
    Json::Value bindings(Json::arrayValue);
    bindings.append(binding);
    config["HostConfig"]["PortBindings"][PORT_KEY] = bindings;
    if (state_->runtime) {
        config["HostConfig"]["Runtime"] = *state_->runtime;
    }

    auto created = state_->client.send(HttpRequest{
        .method = "POST",
        .target = api("/containers/create?name=" + url_encode(name)),
        .headers = {{"Content-Type", "application/json"}},
        .body = to_json_string(config),
    });
    if (!created) return created.error();
    if (!created->ok()) return api_error(*created, "Create container " + name);

    auto doc = parse_json(created->body);
    if (!doc) return doc.error();
    if (!(*doc)["Id"].isString()) {
        return Error{ErrorCode::Parse, "Create container " + name + ": response has no Id"};
    }
    auto container_id = (*doc)["Id"].asString();

    auto started = state_->client.send(HttpRequest{
        .method = "POST",
        .target = api("/containers/" + container_id + "/start"),
    });
    if (!started) return started.error();
    if (!started->ok() && started->status != 304) {
        return api_error(*started, "Start container " + name);
    }

    state_->logger->info("Started container",
                         {{"name", name}, {"image", image}, {"id", container_id}});
    return Result<void>{};
}

Result<void> ContainerRuntime::stop_container(const std::string& name) const {
    auto response = state_->client.send(HttpRequest{
        .method = "POST",
        .target = api("/containers/" + url_encode(name) + "/stop?t="
                      + std::to_string(STOP_GRACE_SECONDS)),
    });
    if (!response) return response.error();

    // 304: already stopped
    if (!response->ok() && response->status != 304) {
        return api_error(*response, "Stop container " + name);
    }
    return Result<void>{};
}

Result<RunningState> ContainerRuntime::is_running(const std::string& name) const {
    auto response = state_->client.send(HttpRequest{
        .method = "GET",
        .target = api("/containers/" + url_encode(name) + "/json"),
    });
    if (!response) return response.error();
    if (response->status == 404) return RunningState{false, std::nullopt};
    if (!response->ok()) return api_error(*response, "Inspect container " + name);

    auto doc = parse_json(response->body);
    if (!doc) return doc.error();
    if (!doc->isObject()) {
        return Error{ErrorCode::Parse, "Inspect container " + name + ": response is not an object"};
    }

    const auto& state = (*doc)["State"];
    if (!state.isObject()) {
        return Error{ErrorCode::Parse, "No state found for container " + name};
    }
    if (!state["Running"].isBool()) {
        return Error{ErrorCode::Parse, "State found but no running field for container " + name};
    }

    RunningState result;
    result.running = state["Running"].asBool();
    if (!result.running && state["ExitCode"].isIntegral()) {
        result.exit_code = state["ExitCode"].asInt64();
    }
    return result;
}

std::optional<uint16_t> ContainerRuntime::get_port(const std::string& name) const {
    auto response = state_->client.send(HttpRequest{
        .method = "GET",
        .target = api("/containers/" + url_encode(name) + "/json"),
    });
    if (!response || !response->ok()) return std::nullopt;

    auto doc = parse_json(response->body);
    if (!doc || !doc->isObject()) return std::nullopt;

    const auto& settings = (*doc)["NetworkSettings"];
    if (!settings.isObject() || !settings["Ports"].isObject()) return std::nullopt;

    const auto& bindings = settings["Ports"][PORT_KEY];
    if (!bindings.isArray() || bindings.empty()) return std::nullopt;

    const auto& first = bindings[0];
    if (!first.isObject() || !first["HostPort"].isString()) return std::nullopt;

    auto text = first["HostPort"].asString();
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        state_->logger->debug("Unparseable host port", {{"name", name}, {"port", text}});
        return std::nullopt;
    }
    return port;
}

}  // namespace spawner
