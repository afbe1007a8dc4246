// SPDX-License-Identifier: MIT

#include "sheetload/progress.hpp"

namespace sheetload {

std::string_view to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::Cancelled: return "cancelled";
        case RunOutcome::Aborted: return "aborted";
    }
    return "completed";
}

void ProgressChannel::on_progress(const Progress& progress) {
    std::lock_guard lock(mutex_);
    latest_ = progress;
    if (events_.size() >= capacity_) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(progress);
}

void ProgressChannel::on_finished(const RunSummary& summary) {
    std::lock_guard lock(mutex_);
    summary_ = summary;
    // Make room by dropping the oldest progress event
    if (events_.size() >= capacity_ && !events_.empty()) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(summary);
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
    std::lock_guard lock(mutex_);
    if (events_.empty()) return std::nullopt;
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Progress> ProgressChannel::latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
}

std::optional<RunSummary> ProgressChannel::summary() const {
    std::lock_guard lock(mutex_);
    return summary_;
}

uint64_t ProgressChannel::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

}  // namespace sheetload
