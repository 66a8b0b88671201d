/**
 * @file capture_sink.hpp
 * @brief ILogSink that keeps every line in memory for assertions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace spawner::testing {

class CaptureSink : public ILogSink {
public:
    struct Lines {
        std::mutex mutex;
        std::vector<std::string> lines;
        int flushes{0};
    };

    explicit CaptureSink(std::shared_ptr<Lines> lines) : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(lines_->mutex);
        lines_->lines.emplace_back(json_line);
    }

    void flush() override {
        std::lock_guard lock(lines_->mutex);
        ++lines_->flushes;
    }

private:
    std::shared_ptr<Lines> lines_;
};

/// Logger plus a handle on what it wrote.
struct CapturedLogger {
    std::shared_ptr<CaptureSink::Lines> output = std::make_shared<CaptureSink::Lines>();
    Logger logger{std::make_unique<CaptureSink>(output), LogLevel::Debug};

    std::vector<std::string> lines() {
        std::lock_guard lock(output->mutex);
        return output->lines;
    }

    bool contains(std::string_view needle) {
        for (const auto& line : lines()) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

}  // namespace spawner::testing
