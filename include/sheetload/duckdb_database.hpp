// SPDX-License-Identifier: MIT

// include/sheetload/duckdb_database.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>

#include <duckdb.hpp>

#include "sheetload/database.hpp"

namespace sheetload {

/// Embedded DuckDB backend.
///
/// An empty @p db_path (the default) opens an in-memory database. Statements
/// run synchronously on the calling coroutine. Failures throw DatabaseError;
/// constraint errors carry SQLSTATE class 23 so the executor classifies them
/// the same way as PostgreSQL's.
///
/// **Thread safety:** Not thread-safe.
class DuckDbDatabase : public IDatabase {
public:
    static constexpr std::size_t kMaxBindParameters = 65535;

    /// @param db_path           Database file, or empty for in-memory.
    /// @param multi_row_insert  Report multi-row INSERT support; turning it
    ///                          off makes the executor issue one INSERT per row.
    explicit DuckDbDatabase(const std::string& db_path = "",
                            bool multi_row_insert = true);

    /// Factory method that returns an expected instead of throwing.
    static std::expected<std::unique_ptr<DuckDbDatabase>, std::string>
    create(const std::string& db_path = "", bool multi_row_insert = true);

    asio::awaitable<QueryResult> query(
        std::string_view sql, std::span<const SqlValue> params) override;
    asio::awaitable<uint64_t> execute(
        std::string_view sql, std::span<const SqlValue> params) override;

    asio::awaitable<void> begin() override;
    asio::awaitable<void> commit() override;
    asio::awaitable<void> rollback() override;

    bool supports_multi_row_insert() const override { return multi_row_insert_; }
    std::size_t max_bind_parameters() const override { return kMaxBindParameters; }
    bool is_connected() const override { return conn_ != nullptr; }

    /// Direct access for fixtures (DDL, verification queries).
    duckdb::Connection& connection() { return *conn_; }

private:
    std::unique_ptr<duckdb::QueryResult> run(std::string_view sql,
                                             std::span<const SqlValue> params);

    std::unique_ptr<duckdb::DuckDB> db_;
    std::unique_ptr<duckdb::Connection> conn_;
    bool multi_row_insert_;
};

}  // namespace sheetload
