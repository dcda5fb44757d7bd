#pragma once

#include <nadeef/core/diagnostics.hpp>
#include <nadeef/core/schema.hpp>
#include <nadeef/store/store.hpp>

#include <expected>
#include <string>

namespace nadeef::store {

/// Whether a table or view named `table` exists (case-insensitive).
[[nodiscard]] auto table_exists(Connection& connection, const std::string& table)
    -> std::expected<bool, std::string>;

/// Declared columns of `table`. Throws LookupError when the table does not exist.
[[nodiscard]] auto schema_of(Connection& connection, const std::string& table)
    -> std::expected<Schema, std::string>;

/// Replace `destination` with a copy of `source`.
///
/// The copy always carries an integer `tid` row identifier: when `source`
/// lacks one, `destination` gets an auto-increment `tid` primary key and the
/// rows are numbered in scan order. Dropping a previous `destination` is
/// best-effort and only logged.
[[nodiscard]] auto copy_table(Connection& connection, const std::string& source,
                              const std::string& destination, DiagnosticsSink& sink)
    -> std::expected<void, std::string>;

}  // namespace nadeef::store
