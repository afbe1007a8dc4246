// SPDX-License-Identifier: MIT

// include/sheetload/failure_log.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sheetload/error.hpp"

namespace sheetload {

enum class LogLevel {
    Warning,
    Error,
    Fatal,
};

std::string_view to_string(LogLevel level);

/// One failure log entry.
struct LogEvent {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Error;
    std::string operation_id;
    std::optional<std::size_t> row_index;
    std::string message;
};

/// Render an event as a single line without trailing newline:
/// "2024-02-13 08:30:00,123 - ERROR - [op-1] row 5: message".
/// Timestamps are UTC; newlines in the message are replaced by spaces.
std::string format_log_line(const LogEvent& event);

/// Append-only sink for failures, injected into the executor and importer.
class IFailureLog {
public:
    virtual ~IFailureLog() = default;

    virtual void append(const LogEvent& event) = 0;
};

/// Discards all events.
class NoOpFailureLog : public IFailureLog {
public:
    void append(const LogEvent&) override {}
};

/// Keeps events in memory, for tests and for callers that render them.
class MemoryFailureLog : public IFailureLog {
public:
    void append(const LogEvent& event) override;

    std::vector<LogEvent> events() const;
    std::vector<std::string> lines() const;

private:
    mutable std::mutex mutex_;
    std::vector<LogEvent> events_;
};

/// Appends formatted lines to a file, flushing after each one.
class FileFailureLog : public IFailureLog {
public:
    /// Open @p path for appending, creating it if needed.
    /// @return IoError when the file cannot be opened.
    static std::expected<std::unique_ptr<FileFailureLog>, Error> open(const std::string& path);

    void append(const LogEvent& event) override;

    const std::string& path() const { return path_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const { std::fclose(f); }
    };

    FileFailureLog(std::string path, std::FILE* file)
        : path_(std::move(path)), file_(file) {}

    std::string path_;
    std::mutex mutex_;
    std::unique_ptr<std::FILE, FileCloser> file_;
};

}  // namespace sheetload
