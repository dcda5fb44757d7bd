#include <nadeef/core/error.hpp>
#include <nadeef/store/metadata.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

namespace nadeef::store {

namespace {

struct ColumnInfo {
    std::string name;
    std::string type;
};

/// PRAGMA table_info rows: (cid, name, type, notnull, dflt_value, pk).
auto column_info(Connection& connection, const std::string& table)
    -> std::expected<std::vector<ColumnInfo>, std::string> {
    auto result = connection.query(fmt::format("PRAGMA table_info({})", table));
    if (!result) {
        return std::unexpected(result.error());
    }
    std::vector<ColumnInfo> columns;
    columns.reserve(result->rows.size());
    for (const auto& row : result->rows) {
        if (row.size() < 3) {
            return std::unexpected(fmt::format("unexpected table_info layout for {}", table));
        }
        const auto* name = std::get_if<std::string>(&row[1]);
        const auto* type = std::get_if<std::string>(&row[2]);
        if (name == nullptr) {
            return std::unexpected(fmt::format("unexpected table_info layout for {}", table));
        }
        columns.push_back(ColumnInfo{.name = *name, .type = type != nullptr ? *type : ""});
    }
    return columns;
}

auto has_tid(const std::vector<ColumnInfo>& columns) -> bool {
    for (const auto& column : columns) {
        if (Column("", column.name).is_tid()) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto table_exists(Connection& connection, const std::string& table)
    -> std::expected<bool, std::string> {
    auto result = connection.query(fmt::format(
        "SELECT name FROM sqlite_master WHERE type IN ('table', 'view') AND name = {} "
        "COLLATE NOCASE",
        to_sql_literal(table)));
    if (!result) {
        return std::unexpected(result.error());
    }
    return !result->empty();
}

auto schema_of(Connection& connection, const std::string& table)
    -> std::expected<Schema, std::string> {
    auto columns = column_info(connection, table);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    if (columns->empty()) {
        throw LookupError(fmt::format("table {} does not exist", table));
    }
    std::vector<Column> schema;
    schema.reserve(columns->size());
    for (const auto& column : *columns) {
        schema.emplace_back(table, column.name);
    }
    return Schema(table, std::move(schema));
}

auto copy_table(Connection& connection, const std::string& source,
                const std::string& destination, DiagnosticsSink& sink)
    -> std::expected<void, std::string> {
    auto columns = column_info(connection, source);
    if (!columns) {
        return std::unexpected(columns.error());
    }
    if (columns->empty()) {
        return std::unexpected(fmt::format("cannot copy {}: table does not exist", source));
    }

    if (auto dropped = connection.execute(fmt::format("DROP TABLE IF EXISTS {}", destination));
        !dropped) {
        sink.warn(fmt::format("could not drop {}: {}", destination, dropped.error()));
    }

    if (has_tid(*columns)) {
        return connection.execute(
            fmt::format("CREATE TABLE {} AS SELECT * FROM {}", destination, source));
    }

    std::vector<std::string> names;
    std::vector<std::string> definitions{
        fmt::format("{} INTEGER PRIMARY KEY AUTOINCREMENT", kTidColumn)};
    for (const auto& column : *columns) {
        names.push_back(column.name);
        definitions.push_back(column.type.empty() ? column.name
                                                  : fmt::format("{} {}", column.name, column.type));
    }
    if (auto created = connection.execute(fmt::format("CREATE TABLE {} ({})", destination,
                                                      fmt::join(definitions, ", ")));
        !created) {
        return std::unexpected(created.error());
    }
    auto copied = connection.execute(fmt::format("INSERT INTO {} ({}) SELECT {} FROM {}",
                                                 destination, fmt::join(names, ", "),
                                                 fmt::join(names, ", "), source));
    if (!copied) {
        return std::unexpected(copied.error());
    }
    sink.info(fmt::format("copied {} into {} with a generated {} column", source, destination,
                          kTidColumn));
    return {};
}

}  // namespace nadeef::store
