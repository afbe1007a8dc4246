// SPDX-License-Identifier: MIT

// include/sheetload/progress.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <variant>

namespace sheetload {

/// Cumulative row counts. Counts never decrease during a run.
struct Progress {
    uint64_t attempted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    std::optional<uint64_t> total;  ///< Known source row count, if any

    bool operator==(const Progress&) const = default;
};

enum class RunOutcome {
    Completed,
    Cancelled,
    Aborted,
};

std::string_view to_string(RunOutcome outcome);

/// Terminal counts of a run.
struct RunSummary {
    RunOutcome outcome = RunOutcome::Completed;
    uint64_t attempted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;

    bool operator==(const RunSummary&) const = default;
};

/// Receives advisory progress from the executor. Called on the executor's
/// thread after every chunk; implementations must not block.
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void on_progress(const Progress& progress) = 0;

    /// Called once when the run ends.
    virtual void on_finished(const RunSummary&) {}
};

/// Discards everything.
class NullProgressSink : public IProgressSink {
public:
    void on_progress(const Progress&) override {}
};

/// Forwards progress to callables.
class CallbackProgressSink : public IProgressSink {
public:
    using ProgressCallback = std::function<void(const Progress&)>;
    using FinishedCallback = std::function<void(const RunSummary&)>;

    explicit CallbackProgressSink(ProgressCallback on_progress,
                                  FinishedCallback on_finished = {})
        : on_progress_(std::move(on_progress))
        , on_finished_(std::move(on_finished)) {}

    void on_progress(const Progress& progress) override {
        if (on_progress_) on_progress_(progress);
    }

    void on_finished(const RunSummary& summary) override {
        if (on_finished_) on_finished_(summary);
    }

private:
    ProgressCallback on_progress_;
    FinishedCallback on_finished_;
};

using ProgressEvent = std::variant<Progress, RunSummary>;

/// Bounded, thread-safe queue between the executor and another thread.
///
/// When full, the oldest progress event is dropped; the terminal summary is
/// never dropped and is always the last event.
class ProgressChannel : public IProgressSink {
public:
    static constexpr std::size_t kDefaultCapacity = 64;

    explicit ProgressChannel(std::size_t capacity = kDefaultCapacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    void on_progress(const Progress& progress) override;
    void on_finished(const RunSummary& summary) override;

    /// Next queued event, if any.
    std::optional<ProgressEvent> try_pop();

    /// Most recent progress seen, even if its event was dropped.
    std::optional<Progress> latest() const;

    /// Terminal summary once the run has ended.
    std::optional<RunSummary> summary() const;

    /// Events discarded because the queue was full.
    uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::size_t capacity_;
    std::deque<ProgressEvent> events_;
    std::optional<Progress> latest_;
    std::optional<RunSummary> summary_;
    uint64_t dropped_ = 0;
};

/// Read side of a cancellation flag, checked by the executor between chunks.
class CancellationToken {
public:
    /// A token that is never cancelled.
    CancellationToken() = default;

    bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/// Write side of a cancellation flag. Safe to call from any thread or a
/// signal handler coroutine.
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace sheetload
