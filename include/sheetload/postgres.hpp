// SPDX-License-Identifier: MIT

#pragma once

#include "sheetload/database.hpp"
#include "sheetload/libpq_wrapper.hpp"
#include <libpq-fe.h>
#include <asio.hpp>
#include <string>

namespace sheetload {

struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;

    std::string connection_string() const;

    // Read PGHOST, PGPORT, PGDATABASE, PGUSER and PGPASSWORD; unset
    // variables keep the defaults above.
    static PostgresConfig from_env();
};

// PostgreSQL backend driven through libpq's nonblocking API.
//
// Parameters are sent in text format (see to_sql_text). Statement failures
// throw DatabaseError carrying the server's SQLSTATE; when the connection
// status is no longer CONNECTION_OK the error is flagged connection_lost.
class PostgresDatabase : public IDatabase {
public:
    // PostgreSQL caps a statement at 65535 bind parameters
    static constexpr std::size_t kMaxBindParameters = 65535;

    PostgresDatabase(asio::io_context& ctx, const PostgresConfig& config,
                     ILibPq& pq = GetLibPq());
    ~PostgresDatabase();

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;

    asio::awaitable<void> connect();

    asio::awaitable<QueryResult> query(
        std::string_view sql, std::span<const SqlValue> params) override;
    asio::awaitable<uint64_t> execute(
        std::string_view sql, std::span<const SqlValue> params) override;

    asio::awaitable<void> begin() override;
    asio::awaitable<void> commit() override;
    asio::awaitable<void> rollback() override;

    bool supports_multi_row_insert() const override { return true; }
    std::size_t max_bind_parameters() const override { return kMaxBindParameters; }

    bool is_connected() const override;

private:
    // Send the statement and wait for its single result. Caller owns the
    // returned PGresult and must clear it.
    asio::awaitable<PGresult*> run(std::string_view sql,
                                   std::span<const SqlValue> params,
                                   ExecStatusType expected);
    void check_no_operation_in_flight() const;
    [[noreturn]] void throw_connection_error(const std::string& context);

    asio::io_context& ctx_;
    PostgresConfig config_;
    ILibPq& pq_;
    PGconn* conn_ = nullptr;
    bool operation_in_flight_ = false;  // Detects concurrent operation misuse
};

}  // namespace sheetload
