// SPDX-License-Identifier: MIT

#pragma once

#include <asio/awaitable.hpp>
#include <expected>

#include "sheetload/database.hpp"
#include "sheetload/error.hpp"
#include "sheetload/schema.hpp"

namespace sheetload {

// Load the descriptor of an existing table from information_schema.
//
// A bare table name resolves against current_schema(). Fails with
// SchemaNotFound when the table has no visible columns or the catalog query
// itself fails. Nothing is cached; every call reads the live catalog.
asio::awaitable<std::expected<TableSchema, Error>> load_schema(
    IDatabase& db, const TableIdentifier& table);

}  // namespace sheetload
