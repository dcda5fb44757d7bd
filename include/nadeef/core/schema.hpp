#pragma once

#include <nadeef/core/column.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nadeef {

/// Ordered, duplicate-free list of columns belonging to one table.
class Schema {
   public:
    Schema() = default;

    /// Throws IntegrityError on duplicate columns.
    Schema(std::string table_name, std::vector<Column> columns);

    [[nodiscard]] auto table_name() const noexcept -> const std::string& { return table_name_; }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<Column>& { return columns_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    /// Position of `column`; throws LookupError when absent.
    [[nodiscard]] auto index_of(const Column& column) const -> std::size_t;

    [[nodiscard]] auto find(const Column& column) const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(const Column& column) const -> bool {
        return index_.contains(column);
    }

    /// Column of this table with the given name; throws LookupError when absent.
    [[nodiscard]] auto column(std::string_view name) const -> const Column&;

    /// Position of the reserved row-identifier column, if the schema has one.
    [[nodiscard]] auto tid_index() const -> std::optional<std::size_t>;

    auto operator==(const Schema& other) const -> bool {
        return table_name_ == other.table_name_ && columns_ == other.columns_;
    }

   private:
    std::string table_name_;
    std::vector<Column> columns_;
    std::unordered_map<Column, std::size_t> index_;
};

}  // namespace nadeef
