/**
 * @file log_output.cpp
 * @brief LogFrameDecoder implementation.
 * @author Dimitris Kafetzis
 */

#include "runtime/log_output.hpp"

namespace spawner {

namespace {

uint32_t decode_u32(const char* buf) {
    auto byte = [buf](int i) { return static_cast<uint32_t>(static_cast<uint8_t>(buf[i])); };
    return (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
}

}  // anonymous namespace

std::vector<LogOutput> LogFrameDecoder::feed(std::string_view data) {
    pending_.append(data);
    std::vector<LogOutput> out;

    if (mode_ == Mode::Unknown) {
        if (pending_.empty()) return out;
        auto first = static_cast<uint8_t>(pending_[0]);
        mode_ = first <= 2 ? Mode::Multiplexed : Mode::Raw;
    }

    if (mode_ == Mode::Raw) {
        // TTY output has no framing; split on newlines.
        size_t start = 0;
        for (auto nl = pending_.find('\n'); nl != std::string::npos; nl = pending_.find('\n', start)) {
            out.push_back(LogOutput{LogStream::Console, pending_.substr(start, nl - start)});
            start = nl + 1;
        }
        pending_.erase(0, start);
        return out;
    }

    size_t pos = 0;
    while (pending_.size() - pos >= HEADER_SIZE) {
        auto id = static_cast<uint8_t>(pending_[pos]);
        auto length = decode_u32(pending_.data() + pos + 4);
        if (pending_.size() - pos - HEADER_SIZE < length) break;

        LogStream stream = LogStream::StdOut;
        switch (id) {
            case 0: stream = LogStream::StdIn; break;
            case 1: stream = LogStream::StdOut; break;
            case 2: stream = LogStream::StdErr; break;
            default: stream = LogStream::Console; break;
        }

        std::string message = pending_.substr(pos + HEADER_SIZE, length);
        if (!message.empty() && message.back() == '\n') message.pop_back();
        out.push_back(LogOutput{stream, std::move(message)});
        pos += HEADER_SIZE + length;
    }
    pending_.erase(0, pos);
    return out;
}

}  // namespace spawner
