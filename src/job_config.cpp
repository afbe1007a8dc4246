// SPDX-License-Identifier: MIT

#include "sheetload/job_config.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>

#include "sheetload/json_reader.hpp"

namespace sheetload {

namespace {

std::string describe(const std::variant<std::monostate, std::string, int64_t, double, bool>& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "a string";
        case 2: return "an integer";
        case 3: return "a number";
        default: return "a boolean";
    }
}

}  // namespace

JobConfigBuilder::JobConfigBuilder(PostgresConfig defaults) {
    job_.postgres = std::move(defaults);
}

void JobConfigBuilder::fail(std::string message) {
    if (error_.empty()) error_ = std::move(message);
}

std::string JobConfigBuilder::context() const {
    std::string out;
    for (std::size_t i = 1; i < stack_.size(); ++i) {
        if (stack_[i].name == "[]") {
            out += "[]";
        } else {
            if (!out.empty()) out += '.';
            out += stack_[i].name;
        }
    }
    return out;
}

std::string JobConfigBuilder::take_key() {
    std::string key = std::move(key_);
    key_.clear();
    return key;
}

void JobConfigBuilder::on_key(std::string_view key) {
    key_ = key;
}

void JobConfigBuilder::on_string(std::string_view value) {
    on_scalar(Scalar{std::string(value)});
}

void JobConfigBuilder::on_int(int64_t value) {
    on_scalar(Scalar{value});
}

void JobConfigBuilder::on_uint(uint64_t value) {
    if (value > static_cast<uint64_t>(INT64_MAX)) {
        on_scalar(Scalar{static_cast<double>(value)});
    } else {
        on_scalar(Scalar{static_cast<int64_t>(value)});
    }
}

void JobConfigBuilder::on_double(double value) {
    on_scalar(Scalar{value});
}

void JobConfigBuilder::on_bool(bool value) {
    on_scalar(Scalar{value});
}

void JobConfigBuilder::on_null() {
    on_scalar(Scalar{});
}

void JobConfigBuilder::on_start_object() {
    std::string name;
    if (!stack_.empty()) {
        name = stack_.back().array ? "[]" : take_key();
    }
    stack_.push_back({false, std::move(name)});

    const std::string ctx = context();
    if (ctx == "mappings[]") {
        mapping_ = FieldMapping{};
        mapping_sources_ = 0;
        has_target_ = false;
    } else if (ctx == "mappings[].coercion") {
        mapping_.coercion.emplace();
    } else if (ctx != "" && ctx != "source" && ctx != "postgres" && ctx != "retry") {
        fail(fmt::format("unexpected object at '{}'", ctx));
    }
}

void JobConfigBuilder::on_end_object() {
    if (context() == "mappings[]") {
        finish_mapping();
    }
    stack_.pop_back();
}

void JobConfigBuilder::on_start_array() {
    std::string name;
    if (!stack_.empty()) {
        name = stack_.back().array ? "[]" : take_key();
    }
    stack_.push_back({true, std::move(name)});

    const std::string ctx = context();
    if (ctx == "mappings") {
        has_mappings_ = true;
    } else if (ctx != "mappings[].coercion.true_values" &&
               ctx != "mappings[].coercion.false_values") {
        fail(fmt::format("unexpected array at '{}'", ctx));
    }
}

void JobConfigBuilder::on_end_array() {
    stack_.pop_back();
}

void JobConfigBuilder::on_scalar(const Scalar& value) {
    const std::string ctx = context();
    if (stack_.empty()) {
        fail("job must be a JSON object");
        return;
    }
    if (stack_.back().array) {
        const auto* s = std::get_if<std::string>(&value);
        if (!s) {
            fail(fmt::format("'{}' must contain strings, got {}", ctx, describe(value)));
        } else if (ctx == "mappings[].coercion.true_values") {
            mapping_.coercion->true_values.push_back(*s);
        } else if (ctx == "mappings[].coercion.false_values") {
            mapping_.coercion->false_values.push_back(*s);
        } else {
            fail(fmt::format("unexpected value in '{}'", ctx));
        }
        return;
    }

    const std::string key = take_key();
    if (ctx.empty()) {
        set_root(key, value);
    } else if (ctx == "source") {
        set_source(key, value);
    } else if (ctx == "postgres") {
        set_postgres(key, value);
    } else if (ctx == "retry") {
        set_retry(key, value);
    } else if (ctx == "mappings[]") {
        set_mapping(key, value);
    } else if (ctx == "mappings[].coercion") {
        set_coercion(key, value);
    } else {
        fail(fmt::format("unexpected key '{}.{}'", ctx, key));
    }
}

void JobConfigBuilder::set_root(const std::string& key, const Scalar& value) {
    const auto* s = std::get_if<std::string>(&value);
    const auto* i = std::get_if<int64_t>(&value);
    auto& request = job_.request;

    if (key == "table" && s) {
        request.table = TableIdentifier::parse(*s);
        has_table_ = !request.table.name.empty();
    } else if (key == "mode" && s) {
        if (*s == "insert") {
            request.mode = ImportMode::Insert;
        } else if (*s == "update") {
            request.mode = ImportMode::Update;
        } else {
            fail(fmt::format("mode must be 'insert' or 'update', got '{}'", *s));
        }
    } else if (key == "chunk_size" && i) {
        if (*i <= 0) {
            fail("chunk_size must be positive");
        } else {
            request.executor.chunk_size = static_cast<std::size_t>(*i);
        }
    } else if (key == "log_file" && s) {
        job_.log_file = *s;
    } else if (key == "operation_id" && s) {
        request.executor.operation_id = *s;
    } else if (key == "duckdb" && s) {
        job_.duckdb_path = (*s == ":memory:") ? std::string() : *s;
    } else if (key == "duckdb" && std::holds_alternative<std::monostate>(value)) {
        job_.duckdb_path.reset();
    } else if (key == "table" || key == "mode" || key == "chunk_size" || key == "log_file" ||
               key == "operation_id" || key == "duckdb") {
        fail(fmt::format("'{}' cannot be {}", key, describe(value)));
    } else {
        fail(fmt::format("unknown key '{}'", key));
    }
}

void JobConfigBuilder::set_source(const std::string& key, const Scalar& value) {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) {
        fail(fmt::format("'source.{}' cannot be {}", key, describe(value)));
        return;
    }
    auto& request = job_.request;
    if (key == "path") {
        request.source_path = *s;
    } else if (key == "sheet") {
        request.source_options.sheet = *s;
    } else if (key == "delimiter") {
        if (*s == "\\t" || *s == "tab") {
            request.source_options.delimiter = '\t';
        } else if (s->size() == 1) {
            request.source_options.delimiter = (*s)[0];
        } else {
            fail("'source.delimiter' must be a single character");
        }
    } else {
        fail(fmt::format("unknown key 'source.{}'", key));
    }
}

void JobConfigBuilder::set_postgres(const std::string& key, const Scalar& value) {
    const auto* s = std::get_if<std::string>(&value);
    const auto* i = std::get_if<int64_t>(&value);
    auto& pg = job_.postgres;
    if (key == "port" && i) {
        if (*i <= 0 || *i > 65535) {
            fail("'postgres.port' is out of range");
        } else {
            pg.port = static_cast<int>(*i);
        }
    } else if (key == "host" && s) {
        pg.host = *s;
    } else if (key == "database" && s) {
        pg.database = *s;
    } else if (key == "user" && s) {
        pg.user = *s;
    } else if (key == "password" && s) {
        pg.password = *s;
    } else if (key == "port" || key == "host" || key == "database" || key == "user" ||
               key == "password") {
        fail(fmt::format("'postgres.{}' cannot be {}", key, describe(value)));
    } else {
        fail(fmt::format("unknown key 'postgres.{}'", key));
    }
}

void JobConfigBuilder::set_retry(const std::string& key, const Scalar& value) {
    const auto* i = std::get_if<int64_t>(&value);
    if (!i || *i < 0) {
        fail(fmt::format("'retry.{}' must be a non-negative integer", key));
        return;
    }
    auto& retry = job_.request.executor.retry;
    if (key == "max_retries") {
        retry.max_retries = static_cast<uint32_t>(*i);
    } else if (key == "initial_delay_ms") {
        retry.initial_delay = std::chrono::milliseconds{*i};
    } else if (key == "max_delay_ms") {
        retry.max_delay = std::chrono::milliseconds{*i};
    } else {
        fail(fmt::format("unknown key 'retry.{}'", key));
    }
}

void JobConfigBuilder::set_mapping(const std::string& key, const Scalar& value) {
    const auto* s = std::get_if<std::string>(&value);
    const auto* b = std::get_if<bool>(&value);
    if (key == "target" && s) {
        mapping_.target = *s;
        has_target_ = true;
    } else if (key == "source" && s) {
        mapping_.source = SourceField{*s};
        ++mapping_sources_;
    } else if (key == "constant") {
        CellValue constant;
        if (s) {
            constant = *s;
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            constant = static_cast<double>(*i);
        } else if (const auto* d = std::get_if<double>(&value)) {
            constant = *d;
        } else if (b) {
            constant = *b;
        }
        mapping_.source = Constant{std::move(constant)};
        ++mapping_sources_;
    } else if (key == "skip" && b) {
        if (*b) {
            mapping_.source = Skip{};
            ++mapping_sources_;
        }
    } else if (key == "key" && b) {
        mapping_.key = *b;
    } else if (key == "target" || key == "source" || key == "skip" || key == "key") {
        fail(fmt::format("mapping '{}' cannot be {}", key, describe(value)));
    } else {
        fail(fmt::format("unknown mapping key '{}'", key));
    }
}

void JobConfigBuilder::set_coercion(const std::string& key, const Scalar& value) {
    const auto* s = std::get_if<std::string>(&value);
    const auto* b = std::get_if<bool>(&value);
    auto& rule = *mapping_.coercion;
    if (key == "date_format" && s) {
        if (!is_valid_date_format(*s)) {
            fail(fmt::format("date_format '{}' needs YYYY (or YY), MM and DD", *s));
        }
        rule.date_format = *s;
    } else if (key == "decimal_separator" && s && s->size() == 1) {
        rule.decimal_separator = (*s)[0];
    } else if (key == "thousands_separator" && s && s->size() <= 1) {
        if (s->empty()) {
            rule.thousands_separator.reset();
        } else {
            rule.thousands_separator = (*s)[0];
        }
    } else if (key == "thousands_separator" && std::holds_alternative<std::monostate>(value)) {
        rule.thousands_separator.reset();
    } else if (key == "trim" && b) {
        rule.trim = *b;
    } else if (key == "decimal_separator" || key == "thousands_separator") {
        fail(fmt::format("'{}' must be a single character", key));
    } else if (key == "date_format" || key == "trim") {
        fail(fmt::format("coercion '{}' cannot be {}", key, describe(value)));
    } else {
        fail(fmt::format("unknown coercion key '{}'", key));
    }
}

void JobConfigBuilder::finish_mapping() {
    if (!has_target_ || mapping_.target.empty()) {
        fail("mapping entry without 'target'");
        return;
    }
    if (mapping_sources_ != 1) {
        fail(fmt::format("mapping for '{}' needs exactly one of 'source', 'constant' or 'skip'",
                         mapping_.target));
        return;
    }
    if (mapping_.coercion && mapping_.coercion->thousands_separator &&
        *mapping_.coercion->thousands_separator == mapping_.coercion->decimal_separator) {
        fail(fmt::format("mapping for '{}' uses the same decimal and thousands separator",
                         mapping_.target));
        return;
    }
    job_.request.mappings.push_back(std::move(mapping_));
    mapping_ = FieldMapping{};
}

std::expected<ImportJob, std::string> JobConfigBuilder::build() {
    if (!error_.empty()) {
        return std::unexpected(error_);
    }
    if (job_.request.source_path.empty()) {
        return std::unexpected(std::string("'source.path' is required"));
    }
    if (!has_table_) {
        return std::unexpected(std::string("'table' is required"));
    }
    if (!has_mappings_ || job_.request.mappings.empty()) {
        return std::unexpected(std::string("'mappings' must list at least one column"));
    }
    return std::move(job_);
}

std::expected<ImportJob, Error> parse_job(std::string_view json, PostgresConfig defaults) {
    JobConfigBuilder builder(std::move(defaults));
    auto job = parse_json(json, builder);
    if (!job) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, job.error()});
    }
    return std::move(*job);
}

std::expected<ImportJob, Error> parse_job_file(const std::string& path, PostgresConfig defaults) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open job file '{}'", path)});
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    auto job = parse_job(contents.str(), std::move(defaults));
    if (!job) {
        return std::unexpected(Error{job.error().code,
            fmt::format("{}: {}", path, job.error().message)});
    }
    return job;
}

}  // namespace sheetload
