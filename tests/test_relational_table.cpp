#include "store_fixture.hpp"

#include <nadeef/core/error.hpp>
#include <nadeef/table/relational_table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using nadeef::Column;
using nadeef::GroupSource;
using nadeef::RelationalTable;
using nadeef::SyncState;
using nadeef::Value;
using nadeef::query::CompareOp;
using nadeef::query::Predicate;
using nadeef::testing::FaultyFactory;
using nadeef::testing::TempDatabase;

auto tids(nadeef::Table& table) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& row : table.rows()) {
        out.push_back(row.tid());
    }
    std::sort(out.begin(), out.end());
    return out;
}

auto partition_tids(const nadeef::Grouping& grouping) -> std::vector<std::vector<std::int64_t>> {
    std::vector<std::vector<std::int64_t>> out;
    for (const auto& partition : grouping.partitions) {
        out.push_back(tids(*partition));
    }
    return out;
}

struct OrdersFixture {
    OrdersFixture() : db("orders") { nadeef::testing::seed_orders(db); }

    auto open(const std::string& name = "orders") -> std::shared_ptr<RelationalTable> {
        return std::make_shared<RelationalTable>(name, db.config(), factory,
                                                 std::make_shared<nadeef::NullSink>());
    }

    TempDatabase db;
    std::shared_ptr<FaultyFactory> factory = std::make_shared<FaultyFactory>();
};

}  // namespace

TEST_CASE("relational table: filter materializes only matching rows", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    orders->filter({Predicate{.column = {"orders", "quantity"},
                              .op = CompareOp::Gt,
                              .value = std::int64_t{0}}});

    CHECK(orders->size() == 2);
    CHECK(tids(*orders) == std::vector<std::int64_t>{1, 3});
    CHECK(orders->has_row_ids());

    auto schema = orders->schema();
    REQUIRE(schema.size() == 4);
    CHECK(schema.columns()[0] == Column{"orders", "tid"});
    CHECK(schema.contains(Column{"orders", "quantity"}));
    CHECK(orders->get(0).get("region") == Value{std::string("EU")});
    CHECK_THROWS_AS(orders->get(5), std::out_of_range);
}

TEST_CASE("relational table: shaping calls invalidate the cache", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    CHECK(orders->state() == SyncState::Unsynced);

    // Shaping before the first read only extends the query.
    orders->project({Column{"orders", "tid"}, Column{"orders", "region"}});
    CHECK(orders->state() == SyncState::Unsynced);

    CHECK(orders->schema().size() == 2);
    CHECK(orders->state() == SyncState::SchemaSynced);

    CHECK(orders->size() == 3);
    CHECK(orders->state() == SyncState::Synced);
    auto connects = fx.factory->connects.load();
    CHECK(orders->size() == 3);
    CHECK(fx.factory->connects.load() == connects);

    orders->filter({Predicate::equal({"orders", "region"}, std::string("US"))});
    CHECK(orders->state() == SyncState::Dirty);
    CHECK(orders->size() == 1);
    CHECK(orders->state() == SyncState::Synced);
    CHECK(fx.factory->connects.load() == connects + 1);

    orders->order_by({Column{"orders", "region"}});
    CHECK(orders->state() == SyncState::Dirty);
    CHECK(orders->spec().order() == std::vector<std::string>{"region"});
}

TEST_CASE("relational table: store failure serves the previous materialization", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();

    SECTION("nothing materialized yet") {
        fx.factory->failing = true;
        CHECK(orders->size() == 0);
        CHECK(orders->last_error().has_value());
        CHECK(orders->state() == SyncState::Unsynced);

        fx.factory->failing = false;
        CHECK(orders->size() == 3);
        CHECK_FALSE(orders->last_error().has_value());
    }

    SECTION("stale rows after a change") {
        CHECK(orders->size() == 3);
        orders->filter({Predicate::equal({"orders", "region"}, std::string("US"))});
        fx.factory->failing = true;
        CHECK(orders->size() == 3);
        CHECK(orders->state() == SyncState::Dirty);
        CHECK(orders->last_error().has_value());
    }

    SECTION("query errors are reported the same way") {
        orders->filter({Predicate::equal({"orders", "missing"}, std::int64_t{1})});
        CHECK(orders->size() == 0);
        CHECK(orders->last_error().has_value());
    }
}

TEST_CASE("relational table: group_on region", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    auto grouping = orders->group_on(Column{"orders", "region"});

    REQUIRE(grouping.ok());
    CHECK(grouping.source == GroupSource::Store);
    REQUIRE(grouping.partitions.size() == 2);
    CHECK(grouping.partitions[0]->size() == 2);
    CHECK(grouping.partitions[1]->size() == 1);

    // Every partition shares one value; partitions are disjoint and cover the table.
    std::set<std::int64_t> seen;
    for (const auto& partition : grouping.partitions) {
        std::set<Value, nadeef::ValueLess> values;
        for (const auto& row : partition->rows()) {
            values.insert(row.get("region"));
            CHECK(seen.insert(row.tid()).second);
        }
        CHECK(values.size() == 1);
    }
    auto all = tids(*orders);
    CHECK(std::vector<std::int64_t>(seen.begin(), seen.end()) == all);
}

TEST_CASE("relational table: grouping on an infinite value stays in the store", "[relational]") {
    OrdersFixture fx;
    fx.db.exec("CREATE TABLE readings (tid INTEGER PRIMARY KEY, level REAL); "
               "INSERT INTO readings VALUES (1, 9e999), (2, 1.5), (3, 9e999), (4, -9e999)");
    auto readings = fx.open("readings");
    auto grouping = readings->group_on(Column{"readings", "level"});

    REQUIRE(grouping.ok());
    CHECK(grouping.source == GroupSource::Store);
    REQUIRE(grouping.partitions.size() == 3);
    CHECK(grouping.partitions[0]->size() == 1);
    CHECK(grouping.partitions[1]->size() == 1);
    CHECK(grouping.partitions[2]->size() == 2);
}

TEST_CASE("relational table: each statement is logged once through the sink", "[relational]") {
    OrdersFixture fx;
    auto sink = std::make_shared<nadeef::testing::RecordingSink>();
    RelationalTable orders("orders", fx.db.config(), fx.factory, sink);

    CHECK(orders.size() == 3);
    CHECK(sink->count(nadeef::LogLevel::Debug) == 1);
    CHECK(orders.size() == 3);
    CHECK(sink->count(nadeef::LogLevel::Debug) == 1);
}

TEST_CASE("relational table: grouping respects the current predicates", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    orders->filter({Predicate{.column = {"orders", "quantity"},
                              .op = CompareOp::Gt,
                              .value = std::int64_t{0}}});
    auto grouping = orders->group_on(Column{"orders", "region"});

    REQUIRE(grouping.ok());
    CHECK(partition_tids(grouping) ==
          std::vector<std::vector<std::int64_t>>{{1}, {3}});
}

TEST_CASE("relational table: NULL values form their own partition", "[relational]") {
    OrdersFixture fx;
    fx.db.exec("INSERT INTO orders (tid, region, x, quantity) VALUES (4, NULL, 4, 1)");
    auto orders = fx.open();
    auto grouping = orders->group_on(Column{"orders", "region"});

    REQUIRE(grouping.ok());
    CHECK(partition_tids(grouping) ==
          std::vector<std::vector<std::int64_t>>{{4}, {1, 2}, {3}});
}

TEST_CASE("relational table: fallback grouping matches the store path", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    auto stored = orders->group_on(Column{"orders", "region"});
    REQUIRE(stored.source == GroupSource::Store);
    auto expected = partition_tids(stored);

    REQUIRE(orders->size() == 3);
    fx.factory->failing = true;
    auto fallback = orders->group_on(Column{"orders", "region"});

    REQUIRE(fallback.ok());
    CHECK(fallback.source == GroupSource::Fallback);
    CHECK_FALSE(fallback.error.empty());
    CHECK(partition_tids(fallback) == expected);

    auto unknown = orders->group_on(Column{"orders", "nope"});
    CHECK(unknown.source == GroupSource::Failed);
}

TEST_CASE("relational table: multi-column grouping through the store", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    auto grouping = orders->group_on(std::vector<Column>{{"orders", "region"}, {"orders", "x"}});

    REQUIRE(grouping.ok());
    CHECK(grouping.source == GroupSource::Store);
    CHECK(partition_tids(grouping) ==
          std::vector<std::vector<std::int64_t>>{{1}, {2}, {3}});

    nadeef::materialize_all(grouping.partitions, 2);
    for (const auto& partition : grouping.partitions) {
        auto* table = dynamic_cast<RelationalTable*>(partition.get());
        REQUIRE(table != nullptr);
        CHECK(table->state() == SyncState::Synced);
    }
}

TEST_CASE("relational table: concurrent readers share one materialization", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    auto before = fx.factory->connects.load();

    std::vector<std::thread> readers;
    std::vector<std::size_t> sizes(8);
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        readers.emplace_back([&, i] { sizes[i] = orders->size(); });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    CHECK(fx.factory->connects.load() == before + 1);
    CHECK(std::all_of(sizes.begin(), sizes.end(), [](std::size_t n) { return n == 3; }));
}

TEST_CASE("relational table: equality and hash ignore the query state", "[relational]") {
    OrdersFixture fx;
    auto a = fx.open();
    auto b = fx.open();
    b->filter({Predicate::equal({"orders", "region"}, std::string("EU"))});

    CHECK(*a == *b);
    CHECK(a->hash() == b->hash());
    CHECK(std::hash<RelationalTable>{}(*a) == std::hash<RelationalTable>{}(*b));

    fx.db.exec("CREATE TABLE orders_copy AS SELECT * FROM orders");
    fx.db.exec("CREATE TABLE orders_eu AS SELECT * FROM orders WHERE region = 'EU'");
    auto copy = fx.open("orders_copy");
    auto eu = fx.open("orders_eu");
    REQUIRE(a->size() == 3);
    REQUIRE(copy->size() == 3);
    REQUIRE(eu->size() == 2);
    CHECK(*a == *copy);
    CHECK_FALSE(*a == *eu);
}

TEST_CASE("relational table: recycled tables refuse access", "[relational]") {
    OrdersFixture fx;
    auto orders = fx.open();
    REQUIRE(orders->size() == 3);
    orders->recycle();

    CHECK(orders->state() == SyncState::Recycled);
    CHECK_THROWS_AS(orders->size(), std::logic_error);
    CHECK_THROWS_AS(orders->rows(), std::logic_error);
    CHECK_THROWS_AS(orders->filter({}), std::logic_error);
    CHECK_THROWS_AS(orders->group_on(Column{"orders", "region"}), std::logic_error);
}

TEST_CASE("relational table: relations without an identifier get ordinal ids", "[relational]") {
    OrdersFixture fx;
    fx.db.exec("CREATE TABLE plain (name TEXT); INSERT INTO plain VALUES ('a'), ('b')");
    auto plain = fx.open("plain");

    REQUIRE(plain->size() == 2);
    CHECK_FALSE(plain->has_row_ids());
    CHECK(plain->get(0).tid() == 1);
    CHECK(plain->get(1).tid() == 2);
}

TEST_CASE("relational table: a bad identifier keeps the previous materialization", "[relational]") {
    OrdersFixture fx;
    fx.db.exec("CREATE TABLE broken (tid, v INTEGER); INSERT INTO broken VALUES (1, 1)");
    auto broken = fx.open("broken");
    REQUIRE(broken->size() == 1);
    CHECK_FALSE(broken->last_error().has_value());

    fx.db.exec("INSERT INTO broken VALUES ('a', 2)");
    broken->filter({});
    CHECK_NOTHROW(broken->size());
    CHECK(broken->size() == 1);
    CHECK(broken->get(0).tid() == 1);
    REQUIRE(broken->last_error().has_value());
    CHECK(broken->last_error()->find("tid") != std::string::npos);

    fx.db.exec("DELETE FROM broken WHERE v = 2; INSERT INTO broken VALUES (NULL, 3)");
    broken->filter({});
    CHECK(broken->size() == 1);
    CHECK(broken->last_error().has_value());

    fx.db.exec("DELETE FROM broken WHERE v = 3; INSERT INTO broken VALUES (0, 4)");
    broken->filter({});
    CHECK(broken->size() == 1);
    CHECK(broken->last_error().has_value());
}

TEST_CASE("relational table: a bad identifier on first sync yields no rows", "[relational]") {
    OrdersFixture fx;
    fx.db.exec("CREATE TABLE broken (tid TEXT, v INTEGER); INSERT INTO broken VALUES ('a', 1)");
    auto broken = fx.open("broken");
    CHECK(broken->size() == 0);
    CHECK(broken->last_error().has_value());
}

TEST_CASE("relational table: the identifier column is matched case-insensitively",
          "[relational]") {
    OrdersFixture fx;
    fx.db.exec("CREATE TABLE upper (TID INTEGER PRIMARY KEY, v TEXT); "
               "INSERT INTO upper VALUES (7, 'a')");
    auto upper = fx.open("upper");

    REQUIRE(upper->size() == 1);
    CHECK(upper->has_row_ids());
    auto row = upper->get(0);
    CHECK(row.tid() == 7);
    CHECK(row.schema().tid_index() == 0);
    auto cells = row.get_cells();
    REQUIRE(cells.size() == 1);
    CHECK(cells.begin()->column.name == "v");
}

TEST_CASE("relational table: construction checks its collaborators", "[relational]") {
    OrdersFixture fx;
    CHECK_THROWS_AS(RelationalTable("", fx.db.config(), fx.factory), std::invalid_argument);
    CHECK_THROWS_AS(RelationalTable("orders", fx.db.config(), nullptr), std::invalid_argument);
}
