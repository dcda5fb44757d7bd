#pragma once

#include <nadeef/core/cell.hpp>
#include <nadeef/core/schema.hpp>
#include <nadeef/core/value.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace nadeef {

/// Tables materialized from flat files are renamed with this prefix.
inline constexpr std::string_view kImportPrefix = "csv_";

/// A schema-bound value vector with a stable row id.
///
/// Copies share the underlying value vector; `select` replaces it.
class Row {
   public:
    /// Throws IntegrityError when `tid < 1`, when either pointer is null,
    /// or when the value count does not match the schema.
    Row(std::int64_t tid, std::shared_ptr<const Schema> schema,
        std::shared_ptr<const std::vector<Value>> values);

    Row(std::int64_t tid, std::shared_ptr<const Schema> schema, std::vector<Value> values);

    [[nodiscard]] auto tid() const noexcept -> std::int64_t { return tid_; }
    [[nodiscard]] auto schema() const noexcept -> const Schema& { return *schema_; }
    [[nodiscard]] auto schema_ptr() const noexcept -> const std::shared_ptr<const Schema>& {
        return schema_;
    }
    [[nodiscard]] auto values() const noexcept -> const std::vector<Value>& { return *values_; }
    [[nodiscard]] auto table_name() const noexcept -> const std::string& {
        return schema_->table_name();
    }

    /// Value at `column`; throws LookupError when the column is absent.
    [[nodiscard]] auto get(const Column& column) const -> const Value&;
    [[nodiscard]] auto get(std::string_view column) const -> const Value&;

    /// Text value at `column`; throws TypeError for non-text values.
    [[nodiscard]] auto get_string(const Column& column) const -> const std::string&;
    [[nodiscard]] auto get_string(std::string_view column) const -> const std::string&;

    [[nodiscard]] auto get_cell(const Column& column) const -> Cell;
    [[nodiscard]] auto get_cell(std::string_view column) const -> Cell;

    /// Every cell except the row-identifier column.
    [[nodiscard]] auto get_cells() const -> std::unordered_set<Cell>;

    /// Value comparison for rows of the same schema. Rows carrying the same
    /// identifier value compare equal without looking at the other values.
    [[nodiscard]] auto has_same_value(const Row& other) const -> bool;

    /// Narrow/reorder to `schema`. Throws LookupError if a target column is
    /// missing from the current schema; the row is left unchanged then.
    void select(std::shared_ptr<const Schema> schema);

    /// Case-insensitive table match, also accepting the import-prefixed name.
    [[nodiscard]] auto is_from_table(std::string_view name) const -> bool;

   private:
    std::int64_t tid_;
    std::shared_ptr<const Schema> schema_;
    std::shared_ptr<const std::vector<Value>> values_;
};

}  // namespace nadeef
