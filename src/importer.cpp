// SPDX-License-Identifier: MIT

#include "sheetload/importer.hpp"

#include <fmt/format.h>

#include <chrono>

#include "sheetload/schema_loader.hpp"

namespace sheetload {

namespace {

std::string default_operation_id(const TableIdentifier& table) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("{}-{}", table.display(), ms);
}

}  // namespace

void Importer::log_setup_error(const std::string& operation_id, const Error& error) {
    log_.append(LogEvent{std::chrono::system_clock::now(), LogLevel::Fatal, operation_id,
                         std::nullopt,
                         fmt::format("{}: {}", error_name(error.code), error.message)});
}

asio::awaitable<std::expected<BatchResult, Error>> Importer::run(
        const ImportRequest& request, IProgressSink& progress, CancellationToken cancel) {
    ExecutorConfig config = request.executor;
    if (config.operation_id.empty()) {
        config.operation_id = default_operation_id(request.table);
    }

    auto source = open_source(request.source_path, request.source_options);
    if (!source) {
        log_setup_error(config.operation_id, source.error());
        co_return std::unexpected(source.error());
    }

    auto schema = co_await load_schema(db_, request.table);
    if (!schema) {
        log_setup_error(config.operation_id, schema.error());
        co_return std::unexpected(schema.error());
    }

    auto mapping = CompiledMapping::compile(*schema, (*source)->header(),
                                            request.mappings, request.mode);
    if (!mapping) {
        log_setup_error(config.operation_id, mapping.error());
        co_return std::unexpected(mapping.error());
    }

    BatchExecutor executor(db_, log_, std::move(config));
    co_return co_await executor.run(*mapping, **source, progress, cancel);
}

}  // namespace sheetload
