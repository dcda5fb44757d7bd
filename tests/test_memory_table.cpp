#include <nadeef/core/error.hpp>
#include <nadeef/table/memory_table.hpp>
#include <nadeef/table/print.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using nadeef::Column;
using nadeef::MemoryTable;
using nadeef::Row;
using nadeef::Schema;
using nadeef::Value;

auto make_orders() -> std::shared_ptr<MemoryTable> {
    auto schema = std::make_shared<const Schema>(
        "orders", std::vector<Column>{{"orders", "tid"}, {"orders", "region"}, {"orders", "x"}});
    std::vector<Row> rows;
    auto add = [&](std::int64_t tid, Value region, std::int64_t x) {
        rows.emplace_back(tid, schema, std::vector<Value>{tid, std::move(region), x});
    };
    add(1, std::string("EU"), 1);
    add(2, std::string("US"), 3);
    add(3, std::string("EU"), 2);
    add(4, Value{}, 0);
    return std::make_shared<MemoryTable>(schema, std::move(rows));
}

auto tids(nadeef::Table& table) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& row : table.rows()) {
        out.push_back(row.tid());
    }
    return out;
}

/// A table whose materialization throws something outside std::exception.
class ForeignThrowTable final : public nadeef::Table {
   public:
    ForeignThrowTable() : Table("foreign") {}

    auto size() -> std::size_t override { throw 42; }
    auto schema() -> Schema override { return Schema("foreign", {}); }
    auto get(std::size_t) -> Row override { throw 42; }
    auto rows() -> std::vector<Row> override { throw 42; }
    auto project(const std::vector<Column>&) -> Table& override { return *this; }
    auto filter(const std::vector<nadeef::query::Predicate>&) -> Table& override { return *this; }
    auto order_by(const std::vector<Column>&) -> Table& override { return *this; }
    auto group_on(const Column&) -> nadeef::Grouping override { return {}; }
    void recycle() override {}
};

}  // namespace

TEST_CASE("memory table: filter keeps matching rows", "[memory]") {
    auto table = make_orders();
    table->filter({nadeef::query::Predicate{.column = {"orders", "x"},
                                            .op = nadeef::query::CompareOp::Ge,
                                            .value = std::int64_t{2}}});
    CHECK(tids(*table) == std::vector<std::int64_t>{2, 3});

    CHECK_THROWS_AS(table->filter({nadeef::query::Predicate::equal({"orders", "nope"},
                                                                   std::int64_t{1})}),
                    nadeef::LookupError);
}

TEST_CASE("memory table: order_by is stable and puts NULL first", "[memory]") {
    auto table = make_orders();
    table->order_by({Column{"orders", "region"}});
    CHECK(tids(*table) == std::vector<std::int64_t>{4, 1, 3, 2});
}

TEST_CASE("memory table: project narrows every row", "[memory]") {
    auto table = make_orders();
    table->project({Column{"orders", "x"}});
    CHECK(table->schema().size() == 1);
    CHECK(table->get(1).get("x") == Value{std::int64_t{3}});
    CHECK(table->get(1).tid() == 2);
    CHECK_THROWS_AS(table->project({Column{"orders", "region"}}), nadeef::LookupError);
}

TEST_CASE("memory table: group_on partitions by value", "[memory]") {
    auto table = make_orders();
    auto grouping = table->group_on(Column{"orders", "region"});

    REQUIRE(grouping.ok());
    CHECK(grouping.source == nadeef::GroupSource::Fallback);
    REQUIRE(grouping.partitions.size() == 3);
    CHECK(tids(*grouping.partitions[0]) == std::vector<std::int64_t>{4});
    CHECK(tids(*grouping.partitions[1]) == std::vector<std::int64_t>{1, 3});
    CHECK(tids(*grouping.partitions[2]) == std::vector<std::int64_t>{2});

    auto unknown = table->group_on(Column{"orders", "nope"});
    CHECK(unknown.source == nadeef::GroupSource::Failed);
    CHECK_FALSE(unknown.ok());
    CHECK_FALSE(unknown.error.empty());
}

TEST_CASE("memory table: multi-column grouping refines partitions", "[memory]") {
    auto table = make_orders();
    auto grouping = table->group_on(std::vector<Column>{{"orders", "region"}, {"orders", "x"}});
    REQUIRE(grouping.ok());
    CHECK(grouping.partitions.size() == 4);

    std::set<std::int64_t> seen;
    for (const auto& partition : grouping.partitions) {
        CHECK(partition->size() == 1);
        for (auto tid : tids(*partition)) {
            CHECK(seen.insert(tid).second);
        }
    }
    CHECK(seen.size() == 4);
}

TEST_CASE("memory table: multi-column grouping needs shared ownership", "[memory]") {
    auto owned = make_orders();
    MemoryTable unowned(std::make_shared<const Schema>(owned->schema()), owned->rows());
    CHECK_THROWS_AS(unowned.group_on(std::vector<Column>{{"orders", "x"}}), std::logic_error);
}

TEST_CASE("memory table: print aligns columns", "[memory]") {
    auto table = make_orders();
    std::ostringstream out;
    nadeef::print(*table, out, 2);
    auto text = out.str();

    CHECK(text.starts_with("tid  region  x\n---  ------  -\n"));
    CHECK(text.find("1    EU      1") != std::string::npos);
    CHECK(text.find("... 2 more row(s)") != std::string::npos);
}

TEST_CASE("memory table: requires a schema", "[memory]") {
    CHECK_THROWS_AS(MemoryTable(nullptr, {}), nadeef::IntegrityError);
}

TEST_CASE("memory table: materialize_all rethrows any worker exception", "[memory]") {
    std::vector<nadeef::TablePtr> tables{make_orders(), std::make_shared<ForeignThrowTable>(),
                                         make_orders(), make_orders()};
    CHECK_THROWS_AS(nadeef::materialize_all(tables, 2), int);
    CHECK_NOTHROW(nadeef::materialize_all({make_orders(), make_orders()}, 2));
}
