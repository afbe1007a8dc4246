// SPDX-License-Identifier: MIT

// tools/sheetload_main.cpp
//
// sheetload <job.json>                 run an import job
// sheetload --sheets <file>            list worksheets
// sheetload --preview <file> [rows]    print the header and first rows

#include <asio.hpp>
#include <fmt/format.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include "sheetload/duckdb_database.hpp"
#include "sheetload/failure_log.hpp"
#include "sheetload/importer.hpp"
#include "sheetload/job_config.hpp"
#include "sheetload/postgres.hpp"
#include "sheetload/source_reader.hpp"

using namespace sheetload;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRowFailures = 1;
constexpr int kExitSetupError = 2;
constexpr int kExitAborted = 3;
constexpr int kExitCancelled = 4;

constexpr std::size_t kMaxPrintedFailures = 20;

void usage(const char* argv0) {
    fmt::print(stderr,
               "Usage: {0} <job.json>\n"
               "       {0} --sheets <file>\n"
               "       {0} --preview <file> [rows]\n",
               argv0);
}

int print_error(const Error& error) {
    fmt::print(stderr, "error: {}: {}\n", error_name(error.code), error.message);
    return kExitSetupError;
}

int list_sheets_command(const std::string& path) {
    auto sheets = list_sheets(path);
    if (!sheets) return print_error(sheets.error());
    for (const auto& name : *sheets) {
        fmt::print("{}\n", name);
    }
    return kExitOk;
}

int preview_command(const std::string& path, std::size_t rows) {
    auto result = preview(path, rows);
    if (!result) return print_error(result.error());

    std::string line;
    for (std::size_t i = 0; i < result->header.size(); ++i) {
        if (i > 0) line += " | ";
        line += result->header[i];
    }
    fmt::print("{}\n", line);
    for (const auto& row : result->rows) {
        line.clear();
        for (std::size_t i = 0; i < row.cells().size(); ++i) {
            if (i > 0) line += " | ";
            line += to_display(row.get(i));
        }
        fmt::print("{}\n", line);
    }
    return kExitOk;
}

int report(const BatchResult& result, const std::string& log_file) {
    fmt::print(stderr, "\n");
    fmt::print("{}: {} attempted, {} succeeded, {} failed\n", to_string(result.outcome()),
               result.attempted(), result.succeeded(), result.failed());

    std::size_t shown = 0;
    for (const auto& f : result.failures()) {
        if (shown++ == kMaxPrintedFailures) {
            fmt::print("  ... {} more, see {}\n", result.failed() - kMaxPrintedFailures, log_file);
            break;
        }
        fmt::print("  row {}: {}: {}\n", f.row_index, error_name(f.reason), f.detail);
    }
    if (const auto& fatal = result.fatal_error()) {
        fmt::print("aborted: {}: {}\n", error_name(fatal->code), fatal->message);
    }

    switch (result.outcome()) {
        case RunOutcome::Aborted: return kExitAborted;
        case RunOutcome::Cancelled: return kExitCancelled;
        case RunOutcome::Completed: break;
    }
    return result.has_failures() ? kExitRowFailures : kExitOk;
}

asio::awaitable<int> run_job(asio::io_context& ctx, const ImportJob& job,
                             IFailureLog& log, CancellationToken cancel) {
    std::unique_ptr<IDatabase> db;
    if (job.duckdb_path) {
        auto duck = DuckDbDatabase::create(*job.duckdb_path);
        if (!duck) {
            co_return print_error(Error{ErrorCode::DatabaseError, duck.error()});
        }
        db = std::move(*duck);
    } else {
        auto pg = std::make_unique<PostgresDatabase>(ctx, job.postgres);
        co_await pg->connect();
        db = std::move(pg);
    }

    CallbackProgressSink progress([](const Progress& p) {
        if (p.total) {
            fmt::print(stderr, "\rprocessed {}/{} rows ({} ok, {} failed)",
                       p.attempted, *p.total, p.succeeded, p.failed);
        } else {
            fmt::print(stderr, "\rprocessed {} rows ({} ok, {} failed)",
                       p.attempted, p.succeeded, p.failed);
        }
    });

    Importer importer(*db, log);
    auto result = co_await importer.run(job.request, progress, cancel);
    if (!result) {
        co_return print_error(result.error());
    }
    co_return report(*result, job.log_file);
}

int import_command(const std::string& job_path) {
    auto job = parse_job_file(job_path);
    if (!job) return print_error(job.error());

    auto log = FileFailureLog::open(job->log_file);
    if (!log) return print_error(log.error());

    asio::io_context ctx;
    CancellationSource cancel;
    asio::signal_set signals(ctx, SIGINT, SIGTERM);
    signals.async_wait([&cancel](const asio::error_code& ec, int) {
        if (ec) return;
        cancel.cancel();
        fmt::print(stderr, "\ncancelling after the current chunk...\n");
    });

    int exit_code = kExitSetupError;
    std::exception_ptr failure;
    asio::co_spawn(ctx, run_job(ctx, *job, **log, cancel.token()),
                   [&](std::exception_ptr ep, int code) {
                       failure = ep;
                       exit_code = code;
                       signals.cancel();
                   });
    ctx.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const DatabaseError& e) {
            fmt::print(stderr, "error: {}\n", e.what());
            return e.connection_lost() ? kExitSetupError : kExitAborted;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return kExitSetupError;
    }
    const std::string_view command = argv[1];

    try {
        if (command == "--sheets") {
            if (argc != 3) {
                usage(argv[0]);
                return kExitSetupError;
            }
            return list_sheets_command(argv[2]);
        }
        if (command == "--preview") {
            if (argc < 3 || argc > 4) {
                usage(argv[0]);
                return kExitSetupError;
            }
            std::size_t rows = 100;
            if (argc == 4) {
                rows = static_cast<std::size_t>(std::strtoul(argv[3], nullptr, 10));
            }
            return preview_command(argv[2], rows);
        }
        if (command == "-h" || command == "--help") {
            usage(argv[0]);
            return kExitOk;
        }
        return import_command(argv[1]);
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return kExitSetupError;
    }
}
