// SPDX-License-Identifier: MIT

#include "sheetload/batch_executor.hpp"

#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <span>

namespace sheetload {

ErrorCode classify(const DatabaseError& e) {
    if (e.connection_lost()) return ErrorCode::ConnectionLost;
    if (e.is_constraint_violation()) return ErrorCode::ConstraintViolation;
    return ErrorCode::DatabaseError;
}

void BatchExecutor::log(LogLevel level, std::optional<std::size_t> row, std::string message) {
    log_.append(LogEvent{std::chrono::system_clock::now(), level, config_.operation_id,
                         row, std::move(message)});
}

void BatchExecutor::record_failure(BatchResult::Builder& result, const SourceRow& raw,
                                   ErrorCode reason, std::string column, std::string detail) {
    std::string message = column.empty()
        ? fmt::format("{}: {} | {}", error_name(reason), detail, raw.to_string())
        : fmt::format("{} in column '{}': {} | {}", error_name(reason), column, detail,
                      raw.to_string());
    log(LogLevel::Error, raw.index(), std::move(message));
    result.add_failure(FailureRecord{raw.index(), raw, reason, std::move(column),
                                     std::move(detail)});
}

void BatchExecutor::fail_unresolved(const Chunk& chunk, std::size_t from,
                                    const std::string& detail, BatchResult::Builder& result) {
    for (std::size_t i = from; i < chunk.size(); ++i) {
        record_failure(result, chunk.raw[i], ErrorCode::ConnectionLost, "", detail);
    }
}

asio::awaitable<BatchResult> BatchExecutor::run(const CompiledMapping& mapping,
                                                ISourceReader& source,
                                                IProgressSink& progress,
                                                CancellationToken cancel) {
    BatchResult::Builder result;
    const StatementBuilder builder(mapping.table(), mapping.columns());
    const auto total = source.total_rows_hint();
    const std::size_t chunk_size = std::max<std::size_t>(1, config_.chunk_size);
    const auto key_index = mapping.key_index();

    bool end_of_source = false;
    while (!end_of_source) {
        // Let other handlers on the loop run, signal handlers included
        co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);

        if (cancel.is_cancelled()) {
            // A source that ended on the previous chunk boundary is complete
            auto next = source.next();
            if (!next || *next) result.cancel();
            break;
        }

        Chunk chunk;
        std::optional<Error> read_error;
        while (chunk.size() < chunk_size) {
            auto next = source.next();
            if (!next) {
                read_error = next.error();
                break;
            }
            if (!*next) {
                end_of_source = true;
                break;
            }
            SourceRow& row = **next;

            auto mapped = mapping.apply(row);
            if (!mapped) {
                const RowRejection& r = mapped.error();
                record_failure(result, row, r.reason, r.column,
                               fmt::format("value '{}': {}", r.value, r.detail));
                continue;
            }
            if (key_index && is_null(mapped->values[*key_index])) {
                record_failure(result, row, ErrorCode::MissingKeyValue,
                               mapping.columns()[*key_index], "key value is empty");
                continue;
            }
            chunk.raw.push_back(std::move(row));
            chunk.values.push_back(std::move(mapped->values));
        }

        if (!chunk.empty()) {
            auto fatal = co_await write_chunk(mapping, builder, chunk, result);
            if (fatal) {
                log(LogLevel::Fatal, std::nullopt, fmt::format(
                    "{}: {}; run aborted", error_name(fatal->code), fatal->message));
                result.abort(std::move(*fatal));
                break;
            }
        }

        progress.on_progress(result.current().progress(total));

        if (read_error) {
            log(LogLevel::Fatal, std::nullopt, fmt::format(
                "{}: {}; run aborted", error_name(read_error->code), read_error->message));
            result.abort(std::move(*read_error));
            break;
        }
    }

    BatchResult final_result = std::move(result).build();
    progress.on_finished(final_result.summary());
    co_return final_result;
}

asio::awaitable<std::vector<std::size_t>> BatchExecutor::execute_chunk(
        const CompiledMapping& mapping, const StatementBuilder& builder, const Chunk& chunk) {
    std::vector<std::size_t> unmatched;

    if (mapping.mode() == ImportMode::Update) {
        const std::size_t key = *mapping.key_index();
        for (std::size_t i = 0; i < chunk.size(); ++i) {
            Statement stmt = builder.update(chunk.values[i], key);
            uint64_t affected = co_await db_.execute(stmt.sql, stmt.params);
            if (affected > 1) {
                throw DatabaseError(fmt::format(
                    "update of row {} matched {} rows", chunk.raw[i].index(), affected),
                    "21000");
            }
            if (affected == 0) unmatched.push_back(i);
        }
        co_return unmatched;
    }

    if (!db_.supports_multi_row_insert()) {
        for (const auto& values : chunk.values) {
            Statement stmt = builder.insert(values);
            co_await db_.execute(stmt.sql, stmt.params);
        }
        co_return unmatched;
    }

    const std::size_t per_statement = builder.rows_per_statement(db_.max_bind_parameters());
    std::span<const std::vector<SqlValue>> rows(chunk.values);
    for (std::size_t offset = 0; offset < rows.size(); offset += per_statement) {
        auto slice = rows.subspan(offset, std::min(per_statement, rows.size() - offset));
        Statement stmt = builder.insert_many(slice);
        co_await db_.execute(stmt.sql, stmt.params);
    }
    co_return unmatched;
}

asio::awaitable<std::optional<Error>> BatchExecutor::write_chunk(
        const CompiledMapping& mapping, const StatementBuilder& builder,
        const Chunk& chunk, BatchResult::Builder& result) {
    // co_await is not allowed in a handler, so failures are carried out of
    // the try blocks
    std::optional<DatabaseError> failure;
    std::vector<std::size_t> unmatched;
    try {
        co_await db_.begin();
        unmatched = co_await execute_chunk(mapping, builder, chunk);
        co_await db_.commit();
    } catch (const DatabaseError& e) {
        failure = e;
    }

    if (!failure) {
        result.add_succeeded(chunk.size() - unmatched.size());
        for (std::size_t i : unmatched) {
            record_failure(result, chunk.raw[i], ErrorCode::KeyNotFound,
                           mapping.columns()[*mapping.key_index()],
                           "no row matches the key value");
        }
        co_return std::nullopt;
    }

    if (failure->connection_lost()) {
        fail_unresolved(chunk, 0, failure->what(), result);
        co_return Error{ErrorCode::ConnectionLost, failure->what()};
    }

    std::optional<DatabaseError> rollback_failure;
    try {
        co_await db_.rollback();
    } catch (const DatabaseError& e) {
        rollback_failure = e;
    }
    if (rollback_failure && (rollback_failure->connection_lost() || !db_.is_connected())) {
        fail_unresolved(chunk, 0, rollback_failure->what(), result);
        co_return Error{ErrorCode::ConnectionLost, rollback_failure->what()};
    }

    log(LogLevel::Warning, std::nullopt, fmt::format(
        "Chunk of {} rows starting at row {} rolled back ({}); retrying rows individually",
        chunk.size(), chunk.raw.front().index(), failure->what()));
    if (rollback_failure) {
        log(LogLevel::Warning, std::nullopt,
            fmt::format("Rollback reported: {}", rollback_failure->what()));
    }

    for (std::size_t i = 0; i < chunk.size(); ++i) {
        auto fatal = co_await write_row(mapping, builder, chunk.raw[i], chunk.values[i], result);
        if (fatal) {
            fail_unresolved(chunk, i, fatal->message, result);
            co_return fatal;
        }
    }
    co_return std::nullopt;
}

asio::awaitable<std::optional<Error>> BatchExecutor::write_row(
        const CompiledMapping& mapping, const StatementBuilder& builder,
        const SourceRow& raw, const std::vector<SqlValue>& values,
        BatchResult::Builder& result) {
    const bool update = mapping.mode() == ImportMode::Update;
    const Statement stmt = update ? builder.update(values, *mapping.key_index())
                                  : builder.insert(values);
    RetryPolicy policy(config_.retry);

    while (true) {
        std::optional<DatabaseError> failure;
        uint64_t affected = 0;
        // Updates run in their own transaction so that one matching several
        // rows can be undone
        try {
            if (update) co_await db_.begin();
            affected = co_await db_.execute(stmt.sql, stmt.params);
            if (update && affected > 1) {
                co_await db_.rollback();
            } else if (update) {
                co_await db_.commit();
            }
        } catch (const DatabaseError& e) {
            failure = e;
        }

        if (!failure) {
            const std::string key = update ? mapping.columns()[*mapping.key_index()]
                                            : std::string();
            if (update && affected == 0) {
                record_failure(result, raw, ErrorCode::KeyNotFound, key,
                               "no row matches the key value");
            } else if (update && affected > 1) {
                record_failure(result, raw, ErrorCode::KeyNotUnique, key,
                               fmt::format("key value matches {} rows; update rolled back",
                                           affected));
            } else {
                result.add_succeeded(1);
            }
            co_return std::nullopt;
        }

        if (failure->connection_lost() || !db_.is_connected()) {
            co_return Error{ErrorCode::ConnectionLost, failure->what()};
        }

        if (update) {
            std::optional<DatabaseError> rollback_failure;
            try {
                co_await db_.rollback();
            } catch (const DatabaseError& e) {
                rollback_failure = e;
            }
            if (rollback_failure && (rollback_failure->connection_lost() ||
                                     !db_.is_connected())) {
                co_return Error{ErrorCode::ConnectionLost, rollback_failure->what()};
            }
        }

        if (policy.should_retry(*failure)) {
            auto delay = policy.next_delay();
            policy.record_attempt();
            asio::steady_timer timer(co_await asio::this_coro::executor, delay);
            co_await timer.async_wait(asio::use_awaitable);
            continue;
        }

        std::string detail = failure->sqlstate().empty()
            ? std::string(failure->what())
            : fmt::format("[{}] {}", failure->sqlstate(), failure->what());
        record_failure(result, raw, classify(*failure), "", std::move(detail));
        co_return std::nullopt;
    }
}

}  // namespace sheetload
