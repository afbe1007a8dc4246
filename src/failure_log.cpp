// SPDX-License-Identifier: MIT

#include "sheetload/failure_log.hpp"

#include <cerrno>
#include <cstring>
#include <iterator>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace sheetload {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "CRITICAL";
    }
    return "ERROR";
}

std::string format_log_line(const LogEvent& event) {
    using namespace std::chrono;
    const auto secs = floor<seconds>(event.timestamp);
    const auto millis = duration_cast<milliseconds>(event.timestamp - secs).count();

    std::string line = fmt::format("{:%Y-%m-%d %H:%M:%S},{:03} - {} - [{}] ",
                                   secs, millis, to_string(event.level), event.operation_id);
    if (event.row_index) {
        fmt::format_to(std::back_inserter(line), "row {}: ", *event.row_index);
    }
    for (char c : event.message) {
        line += (c == '\n' || c == '\r') ? ' ' : c;
    }
    return line;
}

void MemoryFailureLog::append(const LogEvent& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
}

std::vector<LogEvent> MemoryFailureLog::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::vector<std::string> MemoryFailureLog::lines() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> out;
    out.reserve(events_.size());
    for (const auto& e : events_) {
        out.push_back(format_log_line(e));
    }
    return out;
}

std::expected<std::unique_ptr<FileFailureLog>, Error> FileFailureLog::open(
        const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open log file '{}': {}", path, std::strerror(errno))});
    }
    return std::unique_ptr<FileFailureLog>(new FileFailureLog(path, f));
}

void FileFailureLog::append(const LogEvent& event) {
    std::string line = format_log_line(event);
    line += '\n';
    std::lock_guard lock(mutex_);
    if (std::fwrite(line.data(), 1, line.size(), file_.get()) != line.size() ||
        std::fflush(file_.get()) != 0) {
        // The import keeps going; the line still reaches stderr
        fmt::print(stderr, "failure log '{}' write failed: {}\n{}", path_,
                   std::strerror(errno), line);
    }
}

}  // namespace sheetload
