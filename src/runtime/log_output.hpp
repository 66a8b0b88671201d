/**
 * @file log_output.hpp
 * @brief Demultiplexer for container log streams.
 * @author Dimitris Kafetzis
 *
 * Containers started without a TTY have their stdout/stderr multiplexed on a
 * single connection. Each frame is:
 *
 *   [1B stream id][3B zero][4B big-endian length][payload]
 *
 * with stream id 0 = stdin, 1 = stdout, 2 = stderr. A stream whose first
 * byte is not a valid id is raw TTY output and is passed through as Console.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spawner {

enum class LogStream : uint8_t {
    StdIn,
    StdOut,
    StdErr,
    Console
};

[[nodiscard]] constexpr std::string_view to_string(LogStream stream) noexcept {
    switch (stream) {
        case LogStream::StdIn:   return "stdin";
        case LogStream::StdOut:  return "stdout";
        case LogStream::StdErr:  return "stderr";
        case LogStream::Console: return "console";
    }
    return "unknown";
}

struct LogOutput {
    LogStream stream;
    std::string message;    ///< one line, prefixed by the runtime's RFC 3339 timestamp

    bool operator==(const LogOutput&) const = default;
};

class LogFrameDecoder {
public:
    static constexpr size_t HEADER_SIZE = 8;

    /// Feed raw body bytes and return every complete frame.
    std::vector<LogOutput> feed(std::string_view data);

    [[nodiscard]] bool is_raw() const noexcept { return mode_ == Mode::Raw; }

private:
    enum class Mode : uint8_t { Unknown, Multiplexed, Raw };

    Mode mode_{Mode::Unknown};
    std::string pending_;
};

}  // namespace spawner
