#include <nadeef/core/error.hpp>
#include <nadeef/core/row.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace nadeef {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

Row::Row(std::int64_t tid, std::shared_ptr<const Schema> schema,
         std::shared_ptr<const std::vector<Value>> values)
    : tid_(tid), schema_(std::move(schema)), values_(std::move(values)) {
    if (schema_ == nullptr || values_ == nullptr) {
        throw IntegrityError("row schema and values cannot be null");
    }
    if (schema_->size() != values_->size()) {
        throw IntegrityError(fmt::format(
            "row values do not match the schema: schema has {} columns but values has {}",
            schema_->size(), values_->size()));
    }
    if (tid_ < 1) {
        throw IntegrityError(fmt::format("row id cannot be less than 1 (got {})", tid_));
    }
}

Row::Row(std::int64_t tid, std::shared_ptr<const Schema> schema, std::vector<Value> values)
    : Row(tid, std::move(schema), std::make_shared<const std::vector<Value>>(std::move(values))) {}

auto Row::get(const Column& column) const -> const Value& {
    return (*values_)[schema_->index_of(column)];
}

auto Row::get(std::string_view column) const -> const Value& {
    return get(Column{table_name(), std::string(column)});
}

auto Row::get_string(const Column& column) const -> const std::string& {
    const auto& value = get(column);
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    throw TypeError(
        fmt::format("column {} holds {} which is not text", column.full_name(), to_string(value)));
}

auto Row::get_string(std::string_view column) const -> const std::string& {
    return get_string(Column{table_name(), std::string(column)});
}

auto Row::get_cell(const Column& column) const -> Cell {
    return Cell{.column = column, .tid = tid_, .value = get(column)};
}

auto Row::get_cell(std::string_view column) const -> Cell {
    return get_cell(Column{table_name(), std::string(column)});
}

auto Row::get_cells() const -> std::unordered_set<Cell> {
    std::unordered_set<Cell> cells;
    const auto& columns = schema_->columns();
    cells.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].is_tid()) {
            continue;
        }
        cells.insert(Cell{.column = columns[i], .tid = tid_, .value = (*values_)[i]});
    }
    return cells;
}

auto Row::has_same_value(const Row& other) const -> bool {
    if (this == &other || values_ == other.values_) {
        return true;
    }
    const auto& lhs = *values_;
    const auto& rhs = *other.values_;
    if (lhs.size() != rhs.size()) {
        return false;
    }

    // Equal identifiers are taken to mean the same row.
    auto tid_index = schema_->tid_index();
    if (tid_index.has_value() && lhs[*tid_index] == rhs[*tid_index]) {
        return true;
    }

    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (tid_index.has_value() && i == *tid_index) {
            continue;
        }
        if (lhs[i] != rhs[i]) {
            return false;
        }
    }
    return true;
}

void Row::select(std::shared_ptr<const Schema> schema) {
    if (schema == nullptr) {
        throw IntegrityError("row projection schema cannot be null");
    }
    std::vector<Value> projected;
    projected.reserve(schema->size());
    for (const auto& column : schema->columns()) {
        projected.push_back((*values_)[schema_->index_of(column)]);
    }
    values_ = std::make_shared<const std::vector<Value>>(std::move(projected));
    schema_ = std::move(schema);
}

auto Row::is_from_table(std::string_view name) const -> bool {
    std::string_view own = table_name();
    if (iequals(own, name)) {
        return true;
    }
    if (own.size() >= kImportPrefix.size() && own.substr(0, kImportPrefix.size()) == kImportPrefix) {
        return iequals(own.substr(kImportPrefix.size()), name);
    }
    return false;
}

}  // namespace nadeef
