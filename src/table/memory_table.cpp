#include <nadeef/core/error.hpp>
#include <nadeef/table/memory_table.hpp>

#include <algorithm>

namespace nadeef {

MemoryTable::MemoryTable(std::shared_ptr<const Schema> schema, std::vector<Row> rows)
    : Table(schema != nullptr ? schema->table_name() : std::string{}),
      schema_(std::move(schema)),
      rows_(std::move(rows)) {
    if (schema_ == nullptr) {
        throw IntegrityError("memory table schema cannot be null");
    }
}

auto MemoryTable::size() -> std::size_t {
    return rows_.size();
}

auto MemoryTable::schema() -> Schema {
    return *schema_;
}

auto MemoryTable::get(std::size_t index) -> Row {
    return rows_.at(index);
}

auto MemoryTable::rows() -> std::vector<Row> {
    return rows_;
}

auto MemoryTable::project(const std::vector<Column>& columns) -> Table& {
    for (const auto& column : columns) {
        (void)schema_->index_of(column);
    }
    auto projected = std::make_shared<const Schema>(schema_->table_name(), columns);
    for (auto& row : rows_) {
        row.select(projected);
    }
    schema_ = std::move(projected);
    return *this;
}

auto MemoryTable::filter(const std::vector<query::Predicate>& predicates) -> Table& {
    std::vector<std::size_t> positions;
    positions.reserve(predicates.size());
    for (const auto& predicate : predicates) {
        positions.push_back(schema_->index_of(predicate.column));
    }
    std::erase_if(rows_, [&](const Row& row) {
        for (std::size_t i = 0; i < predicates.size(); ++i) {
            if (!predicates[i].matches(row.values()[positions[i]])) {
                return true;
            }
        }
        return false;
    });
    return *this;
}

auto MemoryTable::order_by(const std::vector<Column>& columns) -> Table& {
    std::vector<std::size_t> positions;
    positions.reserve(columns.size());
    for (const auto& column : columns) {
        positions.push_back(schema_->index_of(column));
    }
    std::stable_sort(rows_.begin(), rows_.end(), [&](const Row& lhs, const Row& rhs) {
        for (auto pos : positions) {
            auto order = order_values(lhs.values()[pos], rhs.values()[pos]);
            if (order != 0) {
                return order < 0;
            }
        }
        return false;
    });
    return *this;
}

auto MemoryTable::group_on(const Column& column) -> Grouping {
    return partition_rows(name(), schema_, rows_, column);
}

void MemoryTable::recycle() {
    rows_.clear();
    rows_.shrink_to_fit();
}

}  // namespace nadeef
