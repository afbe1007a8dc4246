// SPDX-License-Identifier: MIT

// include/sheetload/job_config.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sheetload/error.hpp"
#include "sheetload/importer.hpp"
#include "sheetload/postgres.hpp"

namespace sheetload {

/// Log file used when a job does not name one.
inline constexpr std::string_view kDefaultLogFile = "data_integration_errors.log";

/// A complete import job as described by a JSON file.
///
/// Example:
/// @code
/// {
///   "source": {"path": "orders.xlsx", "sheet": "Q1"},
///   "table": "sales.orders",
///   "mode": "insert",
///   "chunk_size": 500,
///   "postgres": {"host": "db", "database": "erp", "user": "loader"},
///   "mappings": [
///     {"target": "CustomerName", "source": "Name"},
///     {"target": "Total", "source": "Amount",
///      "coercion": {"thousands_separator": ","}},
///     {"target": "CreatedOn", "source": "Date",
///      "coercion": {"date_format": "DD/MM/YYYY"}},
///     {"target": "Channel", "constant": "import"}
///   ]
/// }
/// @endcode
struct ImportJob {
    ImportRequest request;
    std::string log_file{kDefaultLogFile};
    std::optional<std::string> duckdb_path;  ///< Selects DuckDB; empty string is in-memory
    PostgresConfig postgres;                 ///< Environment defaults overridden by the job
};

/// Builds an ImportJob from JSON events. Satisfies JsonBuilder.
class JobConfigBuilder {
public:
    using Result = ImportJob;

    /// @param defaults  Connection settings used for keys the job omits.
    explicit JobConfigBuilder(PostgresConfig defaults = {});

    void on_key(std::string_view key);
    void on_string(std::string_view value);
    void on_int(int64_t value);
    void on_uint(uint64_t value);
    void on_double(double value);
    void on_bool(bool value);
    void on_null();
    void on_start_object();
    void on_end_object();
    void on_start_array();
    void on_end_array();

    std::expected<ImportJob, std::string> build();

private:
    using Scalar = std::variant<std::monostate, std::string, int64_t, double, bool>;

    struct Frame {
        bool array = false;
        std::string name;   // Path segment: key in parent, or "[]" for array elements
    };

    // Dotted path of the innermost container, e.g. "mappings[].coercion"
    std::string context() const;
    std::string take_key();

    void on_scalar(const Scalar& value);
    void set_root(const std::string& key, const Scalar& value);
    void set_source(const std::string& key, const Scalar& value);
    void set_postgres(const std::string& key, const Scalar& value);
    void set_retry(const std::string& key, const Scalar& value);
    void set_mapping(const std::string& key, const Scalar& value);
    void set_coercion(const std::string& key, const Scalar& value);
    void finish_mapping();

    void fail(std::string message);

    ImportJob job_;
    std::vector<Frame> stack_;
    std::string key_;
    std::string error_;

    // Mapping entry being built
    FieldMapping mapping_;
    int mapping_sources_ = 0;
    bool has_target_ = false;
    bool has_table_ = false;
    bool has_mappings_ = false;
};

/// Parse a job from JSON text.
/// @return InvalidConfig with the parse or validation message.
std::expected<ImportJob, Error> parse_job(std::string_view json,
                                          PostgresConfig defaults = PostgresConfig::from_env());

/// Read and parse a job file.
/// @return IoError when the file cannot be read, InvalidConfig otherwise.
std::expected<ImportJob, Error> parse_job_file(const std::string& path,
                                               PostgresConfig defaults = PostgresConfig::from_env());

}  // namespace sheetload
