// SPDX-License-Identifier: MIT

#pragma once

#include <asio/awaitable.hpp>
#include <expected>
#include <string>
#include <vector>

#include "sheetload/batch_executor.hpp"
#include "sheetload/batch_result.hpp"
#include "sheetload/database.hpp"
#include "sheetload/failure_log.hpp"
#include "sheetload/mapping.hpp"
#include "sheetload/progress.hpp"
#include "sheetload/schema.hpp"
#include "sheetload/source_reader.hpp"

namespace sheetload {

// Everything needed for one import run.
struct ImportRequest {
    std::string source_path;
    SourceOptions source_options;
    TableIdentifier table;
    std::vector<FieldMapping> mappings;
    ImportMode mode = ImportMode::Insert;
    ExecutorConfig executor;
};

// Wires source, schema, mapping and executor together for one run.
//
// Setup errors (unreadable source, missing table, invalid mapping) are
// returned before any row is written and are appended to the failure log.
class Importer {
public:
    Importer(IDatabase& db, IFailureLog& log) : db_(db), log_(log) {}

    asio::awaitable<std::expected<BatchResult, Error>> run(
        const ImportRequest& request, IProgressSink& progress,
        CancellationToken cancel = {});

private:
    void log_setup_error(const std::string& operation_id, const Error& error);

    IDatabase& db_;
    IFailureLog& log_;
};

}  // namespace sheetload
