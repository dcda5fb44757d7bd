#include <nadeef/nadeef.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

/// Flags orders with a non-positive quantity and repairs them to 1.
class PositiveQuantity final : public nadeef::Rule {
   public:
    PositiveQuantity() : Rule("positive-quantity", {"orders"}) {}

    auto detect(nadeef::Table& table) const -> std::vector<nadeef::Violation> override {
        std::vector<nadeef::Violation> found;
        for (const auto& row : table.rows()) {
            const auto& quantity = row.get("quantity");
            const auto* q = std::get_if<std::int64_t>(&quantity);
            if (q != nullptr && *q <= 0) {
                found.push_back(nadeef::Violation{.rule = name(),
                                                  .cells = {row.get_cell("quantity")}});
            }
        }
        return found;
    }

    auto repair(const nadeef::Violation& violation) const -> std::vector<nadeef::Fix> override {
        std::vector<nadeef::Fix> fixes;
        for (const auto& cell : violation.cells) {
            fixes.push_back(nadeef::Fix{.cell = cell, .value = std::int64_t{1}});
        }
        return fixes;
    }
};

/// Two orders from the same customer in different regions.
class OneRegionPerCustomer final : public nadeef::Rule {
   public:
    OneRegionPerCustomer() : Rule("one-region-per-customer", {"orders"}) {}

    auto arity() const -> nadeef::RuleArity override { return nadeef::RuleArity::Pair; }

    auto block_columns() const -> std::vector<nadeef::Column> override {
        return {nadeef::Column("orders", "customer")};
    }

    auto detect(const nadeef::Row& left, const nadeef::Row& right) const
        -> std::vector<nadeef::Violation> override {
        if (left.get("region") == right.get("region")) {
            return {};
        }
        return {nadeef::Violation{.rule = name(),
                                  .cells = {left.get_cell("region"), right.get_cell("region")}}};
    }
};

}  // namespace

auto main() -> int {
    auto path = (std::filesystem::temp_directory_path() / "nadeef_basic.db").string();
    std::filesystem::remove(path);
    nadeef::store::StoreConfig config{.name = "example", .path = path};
    auto connections = std::make_shared<nadeef::store::SqliteConnectionFactory>();

    {
        auto connection = connections->connect(config);
        if (!connection) {
            fmt::print(stderr, "{}\n", connection.error());
            return 1;
        }
        auto seeded = (*connection)->execute(
            "CREATE TABLE orders (tid INTEGER PRIMARY KEY, customer TEXT, region TEXT, "
            "quantity INTEGER);"
            "INSERT INTO orders (customer, region, quantity) VALUES "
            "('ann', 'EU', 2), ('ann', 'US', 0), ('bob', 'EU', 5), ('cid', 'US', -1);");
        if (!seeded) {
            fmt::print(stderr, "{}\n", seeded.error());
            return 1;
        }
    }

    fmt::print("=== Source table ===\n");
    auto orders = std::make_shared<nadeef::RelationalTable>("orders", config, connections);
    nadeef::print(*orders);

    fmt::print("\n=== Grouped on region ===\n");
    auto grouping = orders->group_on(nadeef::Column("orders", "region"));
    for (const auto& partition : grouping.partitions) {
        fmt::print("{} row(s)\n", partition->size());
    }
    orders->recycle();

    auto context = std::make_shared<nadeef::pipeline::CleanContext>();
    context->plan.source = config;
    context->plan.rules = {std::make_shared<PositiveQuantity>(),
                           std::make_shared<OneRegionPerCustomer>()};
    context->connections = connections;

    nadeef::pipeline::CleanExecutor executor(context);
    auto detected = executor.detect();
    fmt::print("\n=== Detection ===\n");
    for (const auto& result : detected.results) {
        const auto* summary = result.output
                                  ? std::get_if<nadeef::pipeline::StageSummary>(&*result.output)
                                  : nullptr;
        fmt::print("{}: {} violation(s)\n", result.key, summary != nullptr ? summary->count : 0);
    }

    auto repaired = executor.repair();
    fmt::print("\n=== Repair ({}) ===\n", repaired.succeeded() ? "ok" : "failed");
    auto cleaned = std::make_shared<nadeef::RelationalTable>("orders", config, connections);
    nadeef::print(*cleaned);

    return detected.succeeded() && repaired.succeeded() ? 0 : 1;
}
