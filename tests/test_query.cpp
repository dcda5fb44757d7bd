#include <nadeef/query/predicate.hpp>
#include <nadeef/query/query_spec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>

using nadeef::Column;
using nadeef::Value;
using nadeef::query::CompareOp;
using nadeef::query::parse_predicate;
using nadeef::query::Predicate;
using nadeef::query::QuerySpec;

TEST_CASE("value: rendering and literals", "[query]") {
    CHECK(nadeef::to_string(Value{}) == "NULL");
    CHECK(nadeef::to_string(Value{std::int64_t{-3}}) == "-3");
    CHECK(nadeef::to_string(Value{2.5}) == "2.5");
    CHECK(nadeef::to_sql_literal(Value{}) == "NULL");
    CHECK(nadeef::to_sql_literal(Value{std::string("O'Hara")}) == "'O''Hara'");
    CHECK(nadeef::to_sql_literal(Value{std::int64_t{7}}) == "7");
}

TEST_CASE("value: non-finite doubles render as valid SQL", "[query]") {
    CHECK(nadeef::to_sql_literal(Value{std::numeric_limits<double>::infinity()}) == "9e999");
    CHECK(nadeef::to_sql_literal(Value{-std::numeric_limits<double>::infinity()}) == "-9e999");
    CHECK(nadeef::to_sql_literal(Value{std::numeric_limits<double>::quiet_NaN()}) == "NULL");
}

TEST_CASE("value: ordering puts NULL first and numbers before text", "[query]") {
    nadeef::ValueLess less;
    CHECK(less(Value{}, Value{std::int64_t{0}}));
    CHECK(less(Value{std::int64_t{1}}, Value{1.5}));
    CHECK(less(Value{2.0}, Value{std::int64_t{3}}));
    CHECK(less(Value{std::int64_t{100}}, Value{std::string("a")}));
    CHECK_FALSE(less(Value{std::string("b")}, Value{std::string("a")}));
    CHECK(nadeef::order_values(Value{std::int64_t{2}}, Value{2.0}) == 0);
}

TEST_CASE("predicate: SQL rendering", "[query]") {
    Column region{"orders", "region"};
    CHECK(Predicate{.column = region, .op = CompareOp::Eq, .value = std::string("EU")}.to_sql() ==
          "region = 'EU'");
    CHECK(Predicate{.column = {"orders", "quantity"}, .op = CompareOp::Gt,
                    .value = std::int64_t{0}}
              .to_sql() == "quantity > 0");
    CHECK(Predicate::equal(region, Value{}).to_sql() == "region IS NULL");
    CHECK(Predicate::equal(region, Value{}).op == CompareOp::IsNull);
}

TEST_CASE("predicate: in-memory matching follows SQL null semantics", "[query]") {
    Column q{"orders", "quantity"};
    Predicate positive{.column = q, .op = CompareOp::Gt, .value = std::int64_t{0}};

    CHECK(positive.matches(Value{std::int64_t{3}}));
    CHECK(positive.matches(Value{0.5}));
    CHECK_FALSE(positive.matches(Value{std::int64_t{0}}));
    CHECK_FALSE(positive.matches(Value{}));
    CHECK_FALSE(positive.matches(Value{std::string("3")}));

    Predicate missing{.column = q, .op = CompareOp::IsNull, .value = {}};
    CHECK(missing.matches(Value{}));
    CHECK_FALSE(missing.matches(Value{std::int64_t{1}}));

    Predicate not_eu{.column = {"orders", "region"}, .op = CompareOp::Ne,
                     .value = std::string("EU")};
    CHECK(not_eu.matches(Value{std::string("US")}));
    CHECK_FALSE(not_eu.matches(Value{std::string("EU")}));
}

TEST_CASE("predicate: parsing textual predicates", "[query]") {
    auto gt = parse_predicate("quantity > 0", "orders");
    REQUIRE(gt.has_value());
    CHECK(gt->column == Column{"orders", "quantity"});
    CHECK(gt->op == CompareOp::Gt);
    CHECK(gt->value == Value{std::int64_t{0}});

    auto text = parse_predicate("  name = 'O''Hara' ", "people");
    REQUIRE(text.has_value());
    CHECK(text->value == Value{std::string("O'Hara")});

    auto le = parse_predicate("price<=2.5", "orders");
    REQUIRE(le.has_value());
    CHECK(le->op == CompareOp::Le);
    CHECK(le->value == Value{2.5});

    auto ne = parse_predicate("region <> 'EU'", "orders");
    REQUIRE(ne.has_value());
    CHECK(ne->op == CompareOp::Ne);

    auto null = parse_predicate("region is null", "orders");
    REQUIRE(null.has_value());
    CHECK(null->op == CompareOp::IsNull);

    CHECK_FALSE(parse_predicate("region = NULL", "orders").has_value());
    CHECK_FALSE(parse_predicate("= 3", "orders").has_value());
    CHECK_FALSE(parse_predicate("region ~ 3", "orders").has_value());
    CHECK_FALSE(parse_predicate("region = 'EU", "orders").has_value());
    CHECK_FALSE(parse_predicate("quantity > abc", "orders").has_value());
}

TEST_CASE("query spec: build serializes every clause", "[query]") {
    QuerySpec base("orders");
    CHECK(base.build() == "SELECT * FROM orders");

    auto spec = base.with_select({"region", "x"})
                    .with_where({Predicate{.column = {"orders", "quantity"},
                                           .op = CompareOp::Gt,
                                           .value = std::int64_t{0}}})
                    .with_where({Predicate::equal({"orders", "region"}, std::string("EU"))})
                    .with_order({"x"})
                    .with_limit(10);
    CHECK(spec.build() ==
          "SELECT region, x FROM orders WHERE quantity > 0 AND region = 'EU' ORDER BY x LIMIT 10");

    auto distinct = QuerySpec("orders").with_select({"region"}).with_distinct();
    CHECK(distinct.build() == "SELECT DISTINCT region FROM orders");
}

TEST_CASE("query spec: with_* never modifies the receiver", "[query]") {
    QuerySpec base("orders");
    auto narrowed = base.with_select({"x"});
    auto filtered = base.with_where({Predicate::equal({"orders", "x"}, std::int64_t{1})});

    CHECK(base.select_list().empty());
    CHECK(base.predicates().empty());
    CHECK(narrowed.select_list().size() == 1);
    CHECK(filtered.predicates().size() == 1);
    CHECK_FALSE(base == narrowed);
    CHECK(base == QuerySpec("orders"));

    // Repeated columns are kept once.
    CHECK(narrowed.with_select({"x", "y"}).select_list().size() == 2);
}
