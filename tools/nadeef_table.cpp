#include <nadeef/query/predicate.hpp>
#include <nadeef/store/metadata.hpp>
#include <nadeef/store/sqlite.hpp>
#include <nadeef/table/print.hpp>
#include <nadeef/table/relational_table.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"nadeef_table - inspect a store table through the cleaning core"};

    bool verbose = false;
    std::string db_path;
    std::string table_name;
    std::string copy_to;
    std::vector<std::string> where;
    std::vector<std::string> group;
    std::size_t max_rows = 0;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output (logs every SQL statement)");
    app.add_option("--db", db_path,
                   "SQLite database file. Defaults to the NADEEF_DB environment variable.");
    app.add_option("--table", table_name, "Table to read")->required();
    app.add_option("--where", where, "Predicate such as \"quantity > 0\"; repeatable");
    app.add_option("--group", group, "Column to partition on; repeatable");
    app.add_option("--copy-to", copy_to,
                   "Copy the table (adding a tid column if missing) and read the copy");
    app.add_option("--max-rows", max_rows, "Rows to print per table (0 = all)");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    // --db takes precedence, then NADEEF_DB.
    if (db_path.empty()) {
        const char* env = std::getenv("NADEEF_DB");
        if (env != nullptr) {
            db_path = env;
        }
    }
    if (db_path.empty()) {
        spdlog::error("no database given: pass --db or set NADEEF_DB");
        return 1;
    }

    nadeef::store::StoreConfig config{.name = "main", .path = db_path};
    auto connections = std::make_shared<nadeef::store::SqliteConnectionFactory>();
    auto sink = std::make_shared<nadeef::SpdlogSink>();

    try {
        if (!copy_to.empty()) {
            auto connection = connections->connect(config);
            if (!connection) {
                spdlog::error("{}", connection.error());
                return 1;
            }
            if (auto copied = nadeef::store::copy_table(**connection, table_name, copy_to, *sink);
                !copied) {
                spdlog::error("copy failed: {}", copied.error());
                return 1;
            }
            table_name = copy_to;
        }

        auto table = std::make_shared<nadeef::RelationalTable>(table_name, config, connections,
                                                               sink);
        std::vector<nadeef::query::Predicate> predicates;
        for (const auto& text : where) {
            auto predicate = nadeef::query::parse_predicate(text, table_name);
            if (!predicate) {
                spdlog::error("bad --where '{}': {}", text, predicate.error());
                return 1;
            }
            predicates.push_back(std::move(*predicate));
        }
        if (!predicates.empty()) {
            table->filter(predicates);
        }

        if (group.empty()) {
            nadeef::print(*table, std::cout, max_rows);
            if (auto error = table->last_error()) {
                spdlog::error("{}", *error);
                return 1;
            }
            fmt::print("({} rows)\n", table->size());
            if (verbose) {
                sink->dump_stats();
            }
            return 0;
        }

        std::vector<nadeef::Column> columns;
        for (const auto& name : group) {
            columns.emplace_back(table_name, name);
        }
        auto grouping = table->group_on(columns);
        if (!grouping.ok()) {
            spdlog::error("grouping failed: {}", grouping.error);
            return 1;
        }
        if (grouping.source == nadeef::GroupSource::Fallback) {
            spdlog::warn("partitions computed in memory: {}", grouping.error);
        }
        for (std::size_t i = 0; i < grouping.partitions.size(); ++i) {
            auto& partition = *grouping.partitions[i];
            fmt::print("-- partition {} ({} rows)\n", i + 1, partition.size());
            nadeef::print(partition, std::cout, max_rows);
        }
        table->recycle();
        if (verbose) {
            sink->dump_stats();
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
