// SPDX-License-Identifier: MIT

#pragma once

#include <asio/awaitable.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "sheetload/batch_result.hpp"
#include "sheetload/database.hpp"
#include "sheetload/failure_log.hpp"
#include "sheetload/mapping.hpp"
#include "sheetload/progress.hpp"
#include "sheetload/retry_policy.hpp"
#include "sheetload/source_reader.hpp"
#include "sheetload/sql_builder.hpp"

namespace sheetload {

struct ExecutorConfig {
    std::size_t chunk_size = 500;     // Rows per transaction
    RetryConfig retry;                // Transient failures during row isolation
    std::string operation_id;         // Tag for failure log lines
};

// Map a database failure to a per-row reason code.
ErrorCode classify(const DatabaseError& e);

// Drives chunked insert or key-based update of mapped rows.
//
// Each chunk of accepted rows runs in one transaction. When any statement of
// a chunk fails, the chunk is rolled back and its rows are retried one at a
// time in autocommit so that only the faulty rows fail. A lost connection
// aborts the run; committed chunks stay committed. Cancellation is checked
// before each chunk.
//
// IMPORTANT: Thread safety
// BatchExecutor is NOT thread-safe and owns the connection for the duration
// of run(). Run it on one io_context; parallel imports need their own
// connections and executors.
class BatchExecutor {
public:
    BatchExecutor(IDatabase& db, IFailureLog& log, ExecutorConfig config = {})
        : db_(db), log_(log), config_(std::move(config)) {}

    BatchExecutor(const BatchExecutor&) = delete;
    BatchExecutor& operator=(const BatchExecutor&) = delete;

    asio::awaitable<BatchResult> run(const CompiledMapping& mapping,
                                     ISourceReader& source,
                                     IProgressSink& progress,
                                     CancellationToken cancel = {});

private:
    // Accepted rows of one chunk; values[i] belongs to raw[i]
    struct Chunk {
        std::vector<SourceRow> raw;
        std::vector<std::vector<SqlValue>> values;

        std::size_t size() const { return raw.size(); }
        bool empty() const { return raw.empty(); }
    };

    // Run a chunk in one transaction, falling back to row isolation.
    // Returns the fatal error when the run must abort.
    asio::awaitable<std::optional<Error>> write_chunk(
        const CompiledMapping& mapping, const StatementBuilder& builder,
        const Chunk& chunk, BatchResult::Builder& result);

    // Statements of a chunk inside an open transaction. Returns the chunk
    // positions of updates that matched no row.
    asio::awaitable<std::vector<std::size_t>> execute_chunk(
        const CompiledMapping& mapping, const StatementBuilder& builder, const Chunk& chunk);

    // Write one row in autocommit with transient retry. Returns the fatal
    // error when the connection is gone.
    asio::awaitable<std::optional<Error>> write_row(
        const CompiledMapping& mapping, const StatementBuilder& builder,
        const SourceRow& raw, const std::vector<SqlValue>& values,
        BatchResult::Builder& result);

    // Record remaining rows of an aborted chunk as ConnectionLost
    void fail_unresolved(const Chunk& chunk, std::size_t from, const std::string& detail,
                         BatchResult::Builder& result);

    void record_failure(BatchResult::Builder& result, const SourceRow& raw, ErrorCode reason,
                        std::string column, std::string detail);
    void log(LogLevel level, std::optional<std::size_t> row, std::string message);

    IDatabase& db_;
    IFailureLog& log_;
    ExecutorConfig config_;
};

}  // namespace sheetload
