// SPDX-License-Identifier: MIT

#include "sheetload/duckdb_database.hpp"

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>
#include <variant>

namespace sheetload {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

duckdb::Value to_duckdb_value(const SqlValue& v) {
    return std::visit(Overloaded{
        [](std::monostate) { return duckdb::Value(); },
        [](const DefaultValue&) -> duckdb::Value {
            throw std::invalid_argument("DEFAULT cannot be bound as a parameter");
        },
        [](const std::string& s) { return duckdb::Value(s); },
        [](int64_t i) { return duckdb::Value::BIGINT(i); },
        // Decimal text is cast by DuckDB to the column's DECIMAL type
        [](const Decimal& d) { return duckdb::Value(d.digits); },
        [](const Date& d) {
            return duckdb::Value::DATE(static_cast<int32_t>(int(d.year())),
                                       static_cast<int32_t>(unsigned(d.month())),
                                       static_cast<int32_t>(unsigned(d.day())));
        },
        [](const Timestamp& ts) {
            return duckdb::Value::TIMESTAMP(
                duckdb::timestamp_t(ts.time_since_epoch().count()));
        },
        [](bool b) { return duckdb::Value::BOOLEAN(b); },
        [](const Bytes& b) {
            return duckdb::Value::BLOB(
                reinterpret_cast<duckdb::const_data_ptr_t>(b.data.data()),
                b.data.size());
        },
    }, v);
}

// DuckDB reports exception types, not SQLSTATE; map the ones the executor
// distinguishes.
std::string sqlstate_for(duckdb::ExceptionType type) {
    switch (type) {
        case duckdb::ExceptionType::CONSTRAINT:
            return "23000";
        case duckdb::ExceptionType::CONVERSION:
        case duckdb::ExceptionType::OUT_OF_RANGE:
            return "22000";
        default:
            return "";
    }
}

}  // namespace

DuckDbDatabase::DuckDbDatabase(const std::string& db_path, bool multi_row_insert)
    : db_(db_path.empty() ? std::make_unique<duckdb::DuckDB>(nullptr)
                          : std::make_unique<duckdb::DuckDB>(db_path))
    , conn_(std::make_unique<duckdb::Connection>(*db_))
    , multi_row_insert_(multi_row_insert) {}

std::expected<std::unique_ptr<DuckDbDatabase>, std::string>
DuckDbDatabase::create(const std::string& db_path, bool multi_row_insert) {
    try {
        return std::make_unique<DuckDbDatabase>(db_path, multi_row_insert);
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

std::unique_ptr<duckdb::QueryResult> DuckDbDatabase::run(
        std::string_view sql, std::span<const SqlValue> params) {
    if (params.empty()) {
        auto result = conn_->Query(std::string(sql));
        if (result->HasError()) {
            throw DatabaseError(result->GetError(), sqlstate_for(result->GetErrorType()));
        }
        return result;
    }

    auto stmt = conn_->Prepare(std::string(sql));
    if (stmt->HasError()) {
        throw DatabaseError("Failed to prepare statement: " + stmt->GetError());
    }

    duckdb::vector<duckdb::Value> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(to_duckdb_value(p));
    }

    std::unique_ptr<duckdb::QueryResult> result = stmt->Execute(values, false);
    if (result->HasError()) {
        throw DatabaseError(result->GetError(), sqlstate_for(result->GetErrorType()));
    }
    return result;
}

asio::awaitable<QueryResult> DuckDbDatabase::query(
        std::string_view sql, std::span<const SqlValue> params) {
    auto result = run(sql, params);

    std::vector<std::unique_ptr<IRow>> rows;
    const auto ncols = result->ColumnCount();
    while (auto chunk = result->Fetch()) {
        if (chunk->size() == 0) break;
        for (duckdb::idx_t r = 0; r < chunk->size(); ++r) {
            std::vector<std::string> values;
            std::vector<bool> nulls;
            values.reserve(ncols);
            nulls.reserve(ncols);
            for (duckdb::idx_t c = 0; c < ncols; ++c) {
                auto value = chunk->GetValue(c, r);
                nulls.push_back(value.IsNull());
                values.push_back(value.IsNull() ? std::string() : value.ToString());
            }
            rows.push_back(std::make_unique<TextRow>(std::move(values), std::move(nulls)));
        }
    }
    co_return QueryResult{std::move(rows)};
}

asio::awaitable<uint64_t> DuckDbDatabase::execute(
        std::string_view sql, std::span<const SqlValue> params) {
    auto result = run(sql, params);

    // DML returns a single "Count" row; other statements return nothing
    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0 || chunk->ColumnCount() == 0) {
        co_return 0;
    }
    auto value = chunk->GetValue(0, 0);
    if (value.IsNull()) {
        co_return 0;
    }
    co_return static_cast<uint64_t>(value.GetValue<int64_t>());
}

asio::awaitable<void> DuckDbDatabase::begin() {
    co_await execute("BEGIN TRANSACTION", {});
}

asio::awaitable<void> DuckDbDatabase::commit() {
    co_await execute("COMMIT", {});
}

asio::awaitable<void> DuckDbDatabase::rollback() {
    co_await execute("ROLLBACK", {});
}

}  // namespace sheetload
