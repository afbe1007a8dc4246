// SPDX-License-Identifier: MIT

// tests/job_config_test.cpp
#include <gtest/gtest.h>
#include "sheetload/job_config.hpp"
#include "support/test_support.hpp"

using namespace sheetload;

namespace {

PostgresConfig env_defaults() {
    PostgresConfig config;
    config.host = "envhost";
    config.database = "envdb";
    config.user = "envuser";
    return config;
}

std::expected<ImportJob, Error> parse(std::string_view json) {
    return parse_job(json, env_defaults());
}

std::string error_of(std::string_view json) {
    auto job = parse(json);
    EXPECT_FALSE(job.has_value());
    if (job) return {};
    EXPECT_EQ(job.error().code, ErrorCode::InvalidConfig);
    return job.error().message;
}

}  // namespace

TEST(JobConfigTest, ParsesCompleteJob) {
    auto job = parse(R"({
        "source": {"path": "orders.xlsx", "sheet": "Q1"},
        "table": "sales.orders",
        "mode": "update",
        "chunk_size": 250,
        "log_file": "/tmp/orders.log",
        "operation_id": "nightly",
        "retry": {"max_retries": 5, "initial_delay_ms": 50, "max_delay_ms": 1000},
        "postgres": {"host": "db", "port": 6543, "database": "erp", "user": "loader",
                     "password": "s3cret"},
        "mappings": [
            {"target": "Id", "source": "OrderId", "key": true},
            {"target": "Total", "source": "Amount",
             "coercion": {"thousands_separator": ",", "trim": false}},
            {"target": "CreatedOn", "source": "Date",
             "coercion": {"date_format": "DD/MM/YYYY"}},
            {"target": "Paid", "source": "Paid",
             "coercion": {"true_values": ["ja"], "false_values": ["nein"]}},
            {"target": "Channel", "constant": "import"},
            {"target": "Rate", "constant": 2},
            {"target": "Notes", "skip": true}
        ]
    })");
    ASSERT_TRUE(job.has_value()) << job.error().message;

    const auto& req = job->request;
    EXPECT_EQ(req.source_path, "orders.xlsx");
    EXPECT_EQ(req.source_options.sheet, "Q1");
    EXPECT_EQ(req.table.schema, "sales");
    EXPECT_EQ(req.table.name, "orders");
    EXPECT_EQ(req.mode, ImportMode::Update);
    EXPECT_EQ(req.executor.chunk_size, 250u);
    EXPECT_EQ(req.executor.operation_id, "nightly");
    EXPECT_EQ(req.executor.retry.max_retries, 5u);
    EXPECT_EQ(req.executor.retry.initial_delay.count(), 50);
    EXPECT_EQ(req.executor.retry.max_delay.count(), 1000);
    EXPECT_EQ(job->log_file, "/tmp/orders.log");
    EXPECT_FALSE(job->duckdb_path.has_value());

    EXPECT_EQ(job->postgres.host, "db");
    EXPECT_EQ(job->postgres.port, 6543);
    EXPECT_EQ(job->postgres.database, "erp");
    EXPECT_EQ(job->postgres.user, "loader");
    EXPECT_EQ(job->postgres.password, "s3cret");

    ASSERT_EQ(req.mappings.size(), 7u);
    EXPECT_TRUE(req.mappings[0].key);
    EXPECT_EQ(std::get<SourceField>(req.mappings[0].source).name, "OrderId");
    EXPECT_FALSE(req.mappings[0].coercion.has_value());

    ASSERT_TRUE(req.mappings[1].coercion.has_value());
    EXPECT_EQ(req.mappings[1].coercion->thousands_separator, std::optional<char>{','});
    EXPECT_FALSE(req.mappings[1].coercion->trim);

    EXPECT_EQ(req.mappings[2].coercion->date_format, std::optional<std::string>{"DD/MM/YYYY"});
    EXPECT_EQ(req.mappings[3].coercion->true_values, std::vector<std::string>{"ja"});
    EXPECT_EQ(req.mappings[3].coercion->false_values, std::vector<std::string>{"nein"});

    EXPECT_EQ(std::get<Constant>(req.mappings[4].source).value, CellValue{std::string("import")});
    EXPECT_EQ(std::get<Constant>(req.mappings[5].source).value, CellValue{2.0});
    EXPECT_TRUE(std::holds_alternative<Skip>(req.mappings[6].source));
}

TEST(JobConfigTest, Defaults) {
    auto job = parse(R"({
        "source": {"path": "a.csv"},
        "table": "orders",
        "mappings": [{"target": "Name", "source": "Name"}]
    })");
    ASSERT_TRUE(job.has_value()) << job.error().message;

    EXPECT_EQ(job->request.mode, ImportMode::Insert);
    EXPECT_EQ(job->request.executor.chunk_size, 500u);
    EXPECT_TRUE(job->request.executor.operation_id.empty());
    EXPECT_TRUE(job->request.table.schema.empty());
    EXPECT_EQ(job->log_file, "data_integration_errors.log");
    EXPECT_EQ(job->postgres.host, "envhost");
    EXPECT_EQ(job->postgres.port, 5432);
    EXPECT_EQ(job->postgres.database, "envdb");
    EXPECT_FALSE(job->request.source_options.delimiter.has_value());
}

TEST(JobConfigTest, DelimiterSpellings) {
    auto tab = parse(R"({"source": {"path": "a.txt", "delimiter": "tab"}, "table": "t",
                         "mappings": [{"target": "a", "source": "a"}]})");
    ASSERT_TRUE(tab.has_value());
    EXPECT_EQ(tab->request.source_options.delimiter, std::optional<char>{'\t'});

    auto semi = parse(R"({"source": {"path": "a.txt", "delimiter": ";"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a"}]})");
    ASSERT_TRUE(semi.has_value());
    EXPECT_EQ(semi->request.source_options.delimiter, std::optional<char>{';'});

    EXPECT_NE(error_of(R"({"source": {"path": "a.txt", "delimiter": ";;"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("single character"),
              std::string::npos);
}

TEST(JobConfigTest, DuckDbTarget) {
    auto file = parse(R"({"source": {"path": "a.csv"}, "table": "t", "duckdb": "/data/x.db",
                          "mappings": [{"target": "a", "source": "a"}]})");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->duckdb_path, std::optional<std::string>{"/data/x.db"});

    auto memory = parse(R"({"source": {"path": "a.csv"}, "table": "t", "duckdb": ":memory:",
                            "mappings": [{"target": "a", "source": "a"}]})");
    ASSERT_TRUE(memory.has_value());
    EXPECT_EQ(memory->duckdb_path, std::optional<std::string>{""});
}

TEST(JobConfigTest, RejectsUnknownKeys) {
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t", "speed": 3,
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("unknown key 'speed'"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv", "encoding": "latin1"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("source.encoding"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a",
                                        "coercion": {"locale": "de"}}]})")
                  .find("locale"),
              std::string::npos);
}

TEST(JobConfigTest, RejectsBadValues) {
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t", "mode": "upsert",
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("upsert"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t", "chunk_size": 0,
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("chunk_size"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t", "chunk_size": "big",
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("'chunk_size' cannot be a string"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "postgres": {"port": 70000},
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("port"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "retry": {"max_retries": -1},
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("retry.max_retries"),
              std::string::npos);
}

TEST(JobConfigTest, RejectsBadMappings) {
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"source": "a"}]})")
                  .find("without 'target'"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a", "constant": 1}]})")
                  .find("exactly one"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"target": "a"}]})")
                  .find("exactly one"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a",
                                        "coercion": {"date_format": "DD.MM"}}]})")
                  .find("date_format"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t",
                          "mappings": [{"target": "a", "source": "a",
                                        "coercion": {"decimal_separator": ",",
                                                     "thousands_separator": ","}}]})")
                  .find("same decimal and thousands separator"),
              std::string::npos);
}

TEST(JobConfigTest, RequiresPathTableAndMappings) {
    EXPECT_NE(error_of(R"({"table": "t", "mappings": [{"target": "a", "source": "a"}]})")
                  .find("source.path"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"},
                          "mappings": [{"target": "a", "source": "a"}]})")
                  .find("'table' is required"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"source": {"path": "a.csv"}, "table": "t", "mappings": []})")
                  .find("mappings"),
              std::string::npos);
}

TEST(JobConfigTest, MalformedJson) {
    EXPECT_NE(error_of(R"({"source": )").find("Parse error"), std::string::npos);
    EXPECT_NE(error_of(R"([1, 2])").find("unexpected array"), std::string::npos);
}

TEST(JobConfigTest, ParseJobFile) {
    sheetload::testing::TempDir dir;
    auto path = dir.write("job.json", R"({"source": {"path": "a.csv"}, "table": "t",
                                           "mappings": [{"target": "a", "source": "a"}]})");
    auto job = parse_job_file(path, env_defaults());
    ASSERT_TRUE(job.has_value()) << job.error().message;
    EXPECT_EQ(job->request.table.name, "t");

    auto bad = dir.write("bad.json", "{");
    auto err = parse_job_file(bad, env_defaults());
    ASSERT_FALSE(err.has_value());
    EXPECT_EQ(err.error().code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(err.error().message.starts_with(bad));
}

TEST(JobConfigTest, MissingJobFileIsIoError) {
    auto job = parse_job_file("/nonexistent/sheetload/job.json", env_defaults());
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().code, ErrorCode::IoError);
}
