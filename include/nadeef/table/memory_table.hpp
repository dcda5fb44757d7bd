#pragma once

#include <nadeef/table/table.hpp>

namespace nadeef {

/// Table over rows already in memory. Shaping calls apply immediately.
class MemoryTable final : public Table {
   public:
    MemoryTable(std::shared_ptr<const Schema> schema, std::vector<Row> rows);

    [[nodiscard]] auto size() -> std::size_t override;
    [[nodiscard]] auto schema() -> Schema override;
    [[nodiscard]] auto get(std::size_t index) -> Row override;
    [[nodiscard]] auto rows() -> std::vector<Row> override;

    auto project(const std::vector<Column>& columns) -> Table& override;
    auto filter(const std::vector<query::Predicate>& predicates) -> Table& override;
    auto order_by(const std::vector<Column>& columns) -> Table& override;

    using Table::group_on;
    [[nodiscard]] auto group_on(const Column& column) -> Grouping override;

    void recycle() override;

   private:
    std::shared_ptr<const Schema> schema_;
    std::vector<Row> rows_;
};

}  // namespace nadeef
