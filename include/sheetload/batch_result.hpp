// SPDX-License-Identifier: MIT

// include/sheetload/batch_result.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sheetload/error.hpp"
#include "sheetload/progress.hpp"
#include "sheetload/source_reader.hpp"

namespace sheetload {

/// One row that did not make it into the table.
struct FailureRecord {
    std::size_t row_index = 0;   ///< 1-based data row index in the source
    SourceRow raw;               ///< Row as read from the source
    ErrorCode reason = ErrorCode::DatabaseError;
    std::string column;          ///< Target column, when the failure is column-specific
    std::string detail;          ///< Coercion message or database error text
};

/// Authoritative outcome of one run. Immutable once built.
///
/// attempted() is always succeeded() + failed(); rows that were never
/// resolved (pulled after cancellation, or never read) are not counted.
class BatchResult {
public:
    RunOutcome outcome() const { return outcome_; }
    uint64_t attempted() const { return succeeded_ + failed(); }
    uint64_t succeeded() const { return succeeded_; }
    uint64_t failed() const { return failures_.size(); }

    /// Failures in source order.
    const std::vector<FailureRecord>& failures() const { return failures_; }

    /// Error that aborted the run, set only when outcome() is Aborted.
    const std::optional<Error>& fatal_error() const { return fatal_error_; }

    bool has_failures() const { return !failures_.empty(); }

    RunSummary summary() const {
        return RunSummary{outcome_, attempted(), succeeded(), failed()};
    }

    Progress progress(std::optional<uint64_t> total = std::nullopt) const {
        return Progress{attempted(), succeeded(), failed(), total};
    }

    class Builder {
    public:
        void add_succeeded(uint64_t n) { result_.succeeded_ += n; }
        void add_failure(FailureRecord record) { result_.failures_.push_back(std::move(record)); }
        void cancel() { result_.outcome_ = RunOutcome::Cancelled; }
        void abort(Error error) {
            result_.outcome_ = RunOutcome::Aborted;
            result_.fatal_error_ = std::move(error);
        }

        /// Counts so far, for progress events.
        const BatchResult& current() const { return result_; }

        BatchResult build() && { return std::move(result_); }

    private:
        BatchResult result_;
    };

private:
    RunOutcome outcome_ = RunOutcome::Completed;
    uint64_t succeeded_ = 0;
    std::vector<FailureRecord> failures_;
    std::optional<Error> fatal_error_;
};

}  // namespace sheetload
