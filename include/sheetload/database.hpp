// SPDX-License-Identifier: MIT

#pragma once

#include <asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sheetload/value.hpp"

namespace sheetload {

// Statement or connection failure reported by a database backend.
//
// sqlstate is the five-character SQLSTATE when the backend provides one.
// connection_lost is set when the connection can no longer be used.
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message,
                           std::string sqlstate = {},
                           bool connection_lost = false)
        : std::runtime_error(message)
        , sqlstate_(std::move(sqlstate))
        , connection_lost_(connection_lost) {}

    const std::string& sqlstate() const { return sqlstate_; }
    bool connection_lost() const { return connection_lost_; }

    // Integrity constraint violation (unique, not null, foreign key, check)
    bool is_constraint_violation() const {
        return sqlstate_.size() == 5 && sqlstate_.starts_with("23");
    }

    // Serialization failure, deadlock or lock timeout: worth retrying
    bool is_transient() const {
        return sqlstate_ == "40001" || sqlstate_ == "40P01" ||
               sqlstate_ == "55P03";
    }

private:
    std::string sqlstate_;
    bool connection_lost_;
};

// Query result row
class IRow {
public:
    virtual ~IRow() = default;

    virtual int64_t get_int64(std::size_t col) const = 0;
    virtual std::string_view get_string(std::size_t col) const = 0;
    virtual bool is_null(std::size_t col) const = 0;
};

// IRow backed by copied text values, shared by the backends
class TextRow : public IRow {
public:
    TextRow(std::vector<std::string> values, std::vector<bool> nulls)
        : values_(std::move(values)), nulls_(std::move(nulls)) {}

    int64_t get_int64(std::size_t col) const override {
        if (col >= values_.size() || nulls_[col]) {
            return 0;
        }
        return std::stoll(values_[col]);
    }

    std::string_view get_string(std::size_t col) const override {
        if (col >= values_.size() || nulls_[col]) {
            return {};
        }
        return values_[col];
    }

    bool is_null(std::size_t col) const override {
        return col >= nulls_.size() || nulls_[col];
    }

private:
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
};

// Query result set
class QueryResult {
public:
    QueryResult() = default;
    explicit QueryResult(std::vector<std::unique_ptr<IRow>> rows)
        : rows_(std::move(rows)) {}

    bool empty() const { return rows_.empty(); }
    std::size_t size() const { return rows_.size(); }

    const IRow& operator[](std::size_t i) const { return *rows_[i]; }

    auto begin() const { return rows_.begin(); }
    auto end() const { return rows_.end(); }

private:
    std::vector<std::unique_ptr<IRow>> rows_;
};

// Connection handle consumed by the import core.
//
// Statements use double-quoted identifiers and $1..$n placeholders.
// Failures are thrown as DatabaseError. One operation at a time: callers
// must serialize calls on the same connection.
class IDatabase {
public:
    virtual ~IDatabase() = default;

    virtual asio::awaitable<QueryResult> query(
        std::string_view sql, std::span<const SqlValue> params) = 0;

    // Returns the number of rows affected
    virtual asio::awaitable<uint64_t> execute(
        std::string_view sql, std::span<const SqlValue> params) = 0;

    virtual asio::awaitable<void> begin() = 0;
    virtual asio::awaitable<void> commit() = 0;
    virtual asio::awaitable<void> rollback() = 0;

    // Whether INSERT ... VALUES (...), (...) is accepted
    virtual bool supports_multi_row_insert() const = 0;

    // Upper bound on bound parameters in a single statement
    virtual std::size_t max_bind_parameters() const = 0;

    virtual bool is_connected() const = 0;
};

}  // namespace sheetload
