// SPDX-License-Identifier: MIT

#include "sheetload/postgres.hpp"
#include <cstdlib>
#include <functional>
#include <optional>
#include <poll.h>
#include <sstream>

namespace sheetload {

namespace {

bool fd_ready(int fd, short events) {
    struct pollfd pfd = {fd, events, 0};
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) return false;
    return (pfd.revents & (events | POLLERR | POLLHUP)) != 0;
}

bool fd_readable(int fd) {
    return fd_ready(fd, POLLIN);
}

bool fd_writable(int fd) {
    return fd_ready(fd, POLLOUT);
}

asio::awaitable<void> wait_fd_readable(asio::posix::stream_descriptor& socket, int fd) {
    while (!fd_readable(fd)) {
        co_await socket.async_wait(asio::posix::stream_descriptor::wait_read, asio::use_awaitable);
    }
}

asio::awaitable<void> wait_fd_writable(asio::posix::stream_descriptor& socket, int fd) {
    while (!fd_writable(fd)) {
        co_await socket.async_wait(asio::posix::stream_descriptor::wait_write, asio::use_awaitable);
    }
}

// Escape a connection string value (single quotes, backslashes).
// Per libpq docs, values containing spaces/special chars need quoting.
std::string escape_conninfo_value(std::string_view val) {
    bool needs_quoting = val.empty();
    for (char c : val) {
        if (c == ' ' || c == '\'' || c == '\\' || c == '=' || c == '\0') {
            needs_quoting = true;
            break;
        }
    }
    if (!needs_quoting) {
        return std::string(val);
    }

    std::string result;
    result.reserve(val.size() + 2);
    result += '\'';
    for (char c : val) {
        if (c == '\'' || c == '\\') {
            result += '\\';  // Escape with backslash
        }
        result += c;
    }
    result += '\'';
    return result;
}

}  // namespace

std::string PostgresConfig::connection_string() const {
    std::ostringstream ss;
    ss << "host=" << escape_conninfo_value(host)
       << " port=" << port
       << " dbname=" << escape_conninfo_value(database)
       << " user=" << escape_conninfo_value(user);
    if (!password.empty()) {
        ss << " password=" << escape_conninfo_value(password);
    }
    return ss.str();
}

PostgresConfig PostgresConfig::from_env() {
    PostgresConfig config;
    if (const char* v = std::getenv("PGHOST")) config.host = v;
    if (const char* v = std::getenv("PGPORT")) config.port = std::atoi(v);
    if (const char* v = std::getenv("PGDATABASE")) config.database = v;
    if (const char* v = std::getenv("PGUSER")) {
        config.user = v;
    } else if (const char* u = std::getenv("USER")) {
        config.user = u;
    }
    if (const char* v = std::getenv("PGPASSWORD")) config.password = v;
    return config;
}

// PostgresDatabase implementation
//
// IMPORTANT: Concurrency and thread safety
// PostgresDatabase is NOT thread-safe. Only one operation may be in flight
// at a time; concurrent calls on the same connection corrupt libpq protocol
// state. Use it from the io_context thread that runs the import.

PostgresDatabase::PostgresDatabase(asio::io_context& ctx, const PostgresConfig& config,
                                   ILibPq& pq)
    : ctx_(ctx)
    , config_(config)
    , pq_(pq) {}

PostgresDatabase::~PostgresDatabase() {
    if (conn_) {
        pq_.finish(conn_);
        conn_ = nullptr;
    }
}

asio::awaitable<void> PostgresDatabase::connect() {
    PGconn* conn = pq_.connectdb(config_.connection_string().c_str());

    if (pq_.status(conn) != CONNECTION_OK) {
        std::string err = pq_.errorMessage(conn);
        pq_.finish(conn);
        throw DatabaseError("Connection failed: " + err, "08001", true);
    }

    // Set non-blocking mode
    if (pq_.setnonblocking(conn, 1) != 0) {
        std::string err = pq_.errorMessage(conn);
        pq_.finish(conn);
        throw DatabaseError("Failed to set non-blocking mode: " + err, "08001", true);
    }

    conn_ = conn;
    co_return;
}

void PostgresDatabase::throw_connection_error(const std::string& context) {
    std::string err = pq_.errorMessage(conn_);
    bool lost = pq_.status(conn_) != CONNECTION_OK;
    throw DatabaseError(context + err, lost ? "08006" : "", lost);
}

asio::awaitable<PGresult*> PostgresDatabase::run(std::string_view sql,
                                                 std::span<const SqlValue> params,
                                                 ExecStatusType expected) {
    if (!is_connected()) {
        throw DatabaseError("Not connected to database", "08003", true);
    }
    check_no_operation_in_flight();

    // Guard to track operation in flight and clear on exit
    operation_in_flight_ = true;
    struct OperationGuard {
        bool& flag;
        ~OperationGuard() { flag = false; }
    } guard{operation_in_flight_};

    // Text parameters must outlive the send call
    std::vector<std::optional<std::string>> texts;
    texts.reserve(params.size());
    for (const auto& p : params) {
        texts.push_back(to_sql_text(p));
    }
    std::vector<const char*> values;
    values.reserve(texts.size());
    for (const auto& t : texts) {
        values.push_back(t ? t->c_str() : nullptr);
    }

    PGconn* conn = conn_;
    std::string command(sql);
    if (!pq_.sendQueryParams(conn, command.c_str(), static_cast<int>(values.size()),
                             values.empty() ? nullptr : values.data())) {
        throw_connection_error("Send failed: ");
    }

    // Create socket descriptor for async waits
    int fd = pq_.socket(conn);
    if (fd < 0) {
        throw DatabaseError("Invalid socket from libpq connection", "08006", true);
    }
    asio::posix::stream_descriptor socket(ctx_, fd);

    // Scope guard ensures socket.release() and result draining on all exit paths
    ILibPq* pq = &pq_;
    auto cleanup = [&socket, pq, conn]() {
        socket.release();
        // Drain any remaining results to keep connection usable
        PGresult* r;
        while ((r = pq->getResult(conn)) != nullptr) {
            pq->clear(r);
        }
    };
    struct ScopeGuard {
        std::function<void()> fn;
        ~ScopeGuard() { fn(); }
    } scope_guard{cleanup};

    // Flush command to server (required for nonblocking mode)
    while (true) {
        int flush_result = pq_.flush(conn);
        if (flush_result == 0) break;  // All data flushed
        if (flush_result == -1) {
            throw_connection_error("Flush failed: ");
        }
        // flush_result == 1: More to flush, wait for writable
        co_await wait_fd_writable(socket, fd);
    }

    // Wait for result: consume → check busy → wait if needed
    while (pq_.isBusy(conn)) {
        if (!fd_readable(fd)) {
            co_await wait_fd_readable(socket, fd);
        }
        if (!pq_.consumeInput(conn)) {
            throw_connection_error("Read failed: ");
        }
    }

    PGresult* res = pq_.getResult(conn);
    if (!res) {
        throw_connection_error("No result received: ");
    }
    if (pq_.resultStatus(res) != expected) {
        std::string err = pq_.resultErrorMessage(res);
        const char* state = pq_.resultErrorField(res, PG_DIAG_SQLSTATE);
        std::string sqlstate = state ? state : "";
        pq_.clear(res);
        bool lost = pq_.status(conn) != CONNECTION_OK;
        throw DatabaseError(err, sqlstate, lost);
    }

    // Remaining results drained by scope_guard
    co_return res;
}

asio::awaitable<QueryResult> PostgresDatabase::query(
        std::string_view sql, std::span<const SqlValue> params) {
    PGresult* res = co_await run(sql, params, PGRES_TUPLES_OK);

    // Convert PGresult to QueryResult
    int nrows = pq_.ntuples(res);
    int ncols = pq_.nfields(res);

    std::vector<std::unique_ptr<IRow>> rows;
    rows.reserve(static_cast<size_t>(nrows));

    for (int r = 0; r < nrows; ++r) {
        std::vector<std::string> values;
        std::vector<bool> nulls;
        values.reserve(static_cast<size_t>(ncols));
        nulls.reserve(static_cast<size_t>(ncols));

        for (int c = 0; c < ncols; ++c) {
            nulls.push_back(pq_.getisnull(res, r, c) != 0);
            if (nulls.back()) {
                values.emplace_back();
            } else {
                values.emplace_back(pq_.getvalue(res, r, c));
            }
        }
        rows.push_back(std::make_unique<TextRow>(
            std::move(values), std::move(nulls)));
    }

    pq_.clear(res);
    co_return QueryResult{std::move(rows)};
}

asio::awaitable<uint64_t> PostgresDatabase::execute(
        std::string_view sql, std::span<const SqlValue> params) {
    PGresult* res = co_await run(sql, params, PGRES_COMMAND_OK);

    // Empty for utility commands such as BEGIN
    const char* tuples = pq_.cmdTuples(res);
    uint64_t affected = (tuples && *tuples) ? std::strtoull(tuples, nullptr, 10) : 0;
    pq_.clear(res);
    co_return affected;
}

asio::awaitable<void> PostgresDatabase::begin() {
    co_await execute("BEGIN", {});
}

asio::awaitable<void> PostgresDatabase::commit() {
    co_await execute("COMMIT", {});
}

asio::awaitable<void> PostgresDatabase::rollback() {
    co_await execute("ROLLBACK", {});
}

bool PostgresDatabase::is_connected() const {
    return conn_ && pq_.status(conn_) == CONNECTION_OK;
}

void PostgresDatabase::check_no_operation_in_flight() const {
    if (operation_in_flight_) {
        throw std::logic_error(
            "Concurrent database operation detected. PostgresDatabase only "
            "supports one operation at a time. Serialize calls to query(), "
            "execute() and the transaction methods.");
    }
}

}  // namespace sheetload
