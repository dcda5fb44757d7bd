#include <nadeef/pipeline/stages.hpp>
#include <nadeef/table/relational_table.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace nadeef::pipeline {

namespace {

void rollback(store::Connection& connection, DiagnosticsSink& sink) {
    if (auto undone = connection.execute("ROLLBACK"); !undone) {
        sink.error(fmt::format("rollback failed: {}", undone.error()));
    }
}

/// Run `body` inside a write transaction; rolls back when it fails.
template <typename Body>
auto in_transaction(store::Connection& connection, DiagnosticsSink& sink, Body body)
    -> std::expected<std::size_t, std::string> {
    if (auto begun = connection.execute("BEGIN IMMEDIATE"); !begun) {
        return std::unexpected(begun.error());
    }
    auto written = body();
    if (!written) {
        rollback(connection, sink);
        return written;
    }
    if (auto committed = connection.execute("COMMIT"); !committed) {
        rollback(connection, sink);
        return std::unexpected(committed.error());
    }
    return written;
}

auto next_vid(store::Connection& connection, const std::string& table)
    -> std::expected<std::int64_t, std::string> {
    auto result = connection.query(fmt::format("SELECT COALESCE(MAX(vid), 0) FROM {}", table));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->rows.empty() || result->rows.front().empty()) {
        return 1;
    }
    const auto* max = std::get_if<std::int64_t>(&result->rows.front().front());
    return max != nullptr ? *max + 1 : 1;
}

auto write_violations(store::Connection& connection, const std::string& table,
                      const std::string& rule, const std::vector<Violation>& violations)
    -> std::expected<std::size_t, std::string> {
    auto vid = next_vid(connection, table);
    if (!vid) {
        return std::unexpected(vid.error());
    }
    std::size_t written = 0;
    for (const auto& violation : violations) {
        if (violation.cells.empty()) {
            continue;
        }
        std::string sql = fmt::format(
            "INSERT INTO {} (vid, rid, tablename, tupleid, attribute, value) VALUES ", table);
        for (std::size_t i = 0; i < violation.cells.size(); ++i) {
            const auto& cell = violation.cells[i];
            if (i > 0) {
                sql.append(", ");
            }
            sql.append(fmt::format("({}, {}, {}, {}, {}, {})", *vid, to_sql_literal(rule),
                                   to_sql_literal(cell.column.table), cell.tid,
                                   to_sql_literal(cell.column.name), to_sql_literal(cell.value)));
        }
        if (auto inserted = connection.execute(sql); !inserted) {
            return std::unexpected(inserted.error());
        }
        ++*vid;
        ++written;
    }
    return written;
}

template <typename T>
auto field(const std::vector<Value>& row, std::size_t index, std::string_view what)
    -> std::expected<T, std::string> {
    if (const auto* value = std::get_if<T>(&row[index])) {
        return *value;
    }
    // Qualified: pipeline::to_string(DataKind) hides the Value overload here.
    return std::unexpected(fmt::format("malformed violation record: {} is {}", what,
                                       nadeef::to_string(row[index])));
}

}  // namespace

auto violation_table_ddl(const std::string& table) -> std::string {
    // `value` has no declared type so stored values keep their own type.
    return fmt::format(
        "CREATE TABLE IF NOT EXISTS {} (vid INTEGER NOT NULL, rid TEXT NOT NULL, "
        "tablename TEXT NOT NULL, tupleid INTEGER NOT NULL, attribute TEXT NOT NULL, value)",
        table);
}

// ─── Detection flow ───────────────────────────────────────────────────────────

SourceDeserializer::SourceDeserializer(ContextPtr context)
    : Stage("deserializer", DataKind::Key, DataKind::Tables), context_(std::move(context)) {}

auto SourceDeserializer::execute(StageData data) -> std::expected<StageData, std::string> {
    const auto& key = std::get<std::string>(data);
    auto rule = context_->cache->get(key);
    if (rule == nullptr) {
        return std::unexpected(fmt::format("no rule cached under key {}", key));
    }
    RuleTables output{.rule = rule, .tables = {}};
    for (const auto& table : rule->tables()) {
        output.tables.push_back(std::make_shared<RelationalTable>(
            table, context_->plan.source, context_->connections, context_->sink));
    }
    return output;
}

QueryEngine::QueryEngine(ContextPtr context)
    : Stage("query", DataKind::Tables, DataKind::Blocks), context_(std::move(context)) {}

auto QueryEngine::execute(StageData data) -> std::expected<StageData, std::string> {
    auto& input = std::get<RuleTables>(data);
    ScopedTimer timer(*context_->sink, StatType::QueryTime);
    for (const auto& table : input.tables) {
        input.rule->scope(*table);
    }

    RuleBlocks output{.rule = input.rule, .tables = {}};
    auto block_columns = input.rule->block_columns();
    if (input.tables.size() == 1 && !block_columns.empty()) {
        auto& table = input.tables.front();
        auto grouping = table->group_on(block_columns);
        if (!grouping.ok()) {
            return std::unexpected(grouping.error);
        }
        if (grouping.source == GroupSource::Fallback) {
            context_->sink->warn(fmt::format("rule {} blocked from cached rows: {}",
                                             input.rule->name(), grouping.error));
        }
        output.tables = std::move(grouping.partitions);
        table->recycle();
    } else {
        output.tables = std::move(input.tables);
    }

    materialize_all(output.tables);
    context_->sink->debug(fmt::format("rule {} has {} input block(s)", output.rule->name(),
                                      output.tables.size()));
    return output;
}

auto TableDetection::run(const Rule& rule, const std::vector<TablePtr>& tables) const
    -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& table : tables) {
        auto found = rule.detect(*table);
        violations.insert(violations.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
    return violations;
}

auto PairDetection::run(const Rule& rule, const std::vector<TablePtr>& tables) const
    -> std::vector<Violation> {
    std::vector<Violation> violations;
    auto collect = [&](const Row& left, const Row& right) {
        auto found = rule.detect(left, right);
        violations.insert(violations.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    };

    if (rule.tables().size() == 2 && tables.size() == 2) {
        auto left = tables[0]->rows();
        auto right = tables[1]->rows();
        for (const auto& l : left) {
            for (const auto& r : right) {
                collect(l, r);
            }
        }
        return violations;
    }

    for (const auto& table : tables) {
        auto rows = table->rows();
        for (std::size_t i = 0; i < rows.size(); ++i) {
            for (std::size_t j = i + 1; j < rows.size(); ++j) {
                collect(rows[i], rows[j]);
            }
        }
    }
    return violations;
}

ViolationDetector::ViolationDetector(ContextPtr context, Detection detection)
    : Stage("detector", DataKind::Blocks, DataKind::Violations),
      context_(std::move(context)),
      detection_(detection) {}

auto ViolationDetector::for_rule(ContextPtr context, const Rule& rule)
    -> std::unique_ptr<ViolationDetector> {
    Detection detection = TableDetection{};
    if (rule.arity() == RuleArity::Pair) {
        detection = PairDetection{};
    }
    return std::make_unique<ViolationDetector>(std::move(context), detection);
}

auto ViolationDetector::execute(StageData data) -> std::expected<StageData, std::string> {
    auto& input = std::get<RuleBlocks>(data);
    RuleViolations output{.rule = input.rule, .violations = {}};
    {
        ScopedTimer timer(*context_->sink, StatType::DetectTime);
        output.violations = std::visit(
            [&](const auto& detection) { return detection.run(*input.rule, input.tables); },
            detection_);
    }
    for (const auto& table : input.tables) {
        table->recycle();
    }
    for (auto& violation : output.violations) {
        if (violation.rule.empty()) {
            violation.rule = input.rule->name();
        }
    }
    context_->sink->info(fmt::format("rule {} found {} violation(s)", input.rule->name(),
                                     output.violations.size()));
    return output;
}

ViolationExport::ViolationExport(ContextPtr context)
    : Stage("export", DataKind::Violations, DataKind::Summary), context_(std::move(context)) {}

auto ViolationExport::execute(StageData data) -> std::expected<StageData, std::string> {
    const auto& input = std::get<RuleViolations>(data);
    ScopedTimer timer(*context_->sink, StatType::ExportTime);
    const auto& table = context_->plan.violation_table;

    auto connection = context_->connections->connect(context_->plan.source);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    auto& conn = **connection;
    if (auto created = conn.execute(violation_table_ddl(table)); !created) {
        return std::unexpected(created.error());
    }

    auto written = in_transaction(conn, *context_->sink, [&] {
        return write_violations(conn, table, input.rule->name(), input.violations);
    });
    if (!written) {
        return std::unexpected(written.error());
    }
    return StageSummary{.rule = input.rule->name(), .count = *written};
}

// ─── Repair flow ──────────────────────────────────────────────────────────────

ViolationDeserializer::ViolationDeserializer(ContextPtr context)
    : Stage("deserializer", DataKind::Key, DataKind::Violations), context_(std::move(context)) {}

auto ViolationDeserializer::execute(StageData data) -> std::expected<StageData, std::string> {
    const auto& key = std::get<std::string>(data);
    auto rule = context_->cache->get(key);
    if (rule == nullptr) {
        return std::unexpected(fmt::format("no rule cached under key {}", key));
    }

    auto connection = context_->connections->connect(context_->plan.source);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    auto result = (*connection)->query(fmt::format(
        "SELECT vid, tablename, tupleid, attribute, value FROM {} WHERE rid = {} "
        "ORDER BY vid, tupleid, attribute",
        context_->plan.violation_table, to_sql_literal(rule->name())));
    if (!result) {
        return std::unexpected(result.error());
    }

    RuleViolations output{.rule = rule, .violations = {}};
    for (const auto& row : result->rows) {
        if (row.size() != 5) {
            return std::unexpected(
                std::string("malformed violation record: expected 5 columns"));
        }
        auto vid = field<std::int64_t>(row, 0, "vid");
        auto table = field<std::string>(row, 1, "tablename");
        auto tid = field<std::int64_t>(row, 2, "tupleid");
        auto attribute = field<std::string>(row, 3, "attribute");
        if (!vid || !table || !tid || !attribute) {
            return std::unexpected(!vid     ? vid.error()
                                   : !table ? table.error()
                                   : !tid   ? tid.error()
                                            : attribute.error());
        }
        if (output.violations.empty() || output.violations.back().vid != *vid) {
            output.violations.push_back(Violation{.rule = rule->name(), .cells = {}, .vid = *vid});
        }
        output.violations.back().cells.push_back(
            Cell{.column = Column{*table, *attribute}, .tid = *tid, .value = row[4]});
    }
    return output;
}

ViolationRepair::ViolationRepair(ContextPtr context)
    : Stage("repair", DataKind::Violations, DataKind::Summary), context_(std::move(context)) {}

auto ViolationRepair::execute(StageData data) -> std::expected<StageData, std::string> {
    const auto& input = std::get<RuleViolations>(data);
    ScopedTimer timer(*context_->sink, StatType::RepairTime);

    std::vector<Fix> fixes;
    for (const auto& violation : input.violations) {
        auto proposed = input.rule->repair(violation);
        fixes.insert(fixes.end(), std::make_move_iterator(proposed.begin()),
                     std::make_move_iterator(proposed.end()));
    }
    if (fixes.empty()) {
        return StageSummary{.rule = input.rule->name(), .count = 0};
    }

    auto connection = context_->connections->connect(context_->plan.source);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    auto& conn = **connection;
    auto applied = in_transaction(conn, *context_->sink,
                                  [&]() -> std::expected<std::size_t, std::string> {
                                      for (const auto& fix : fixes) {
                                          auto sql = fmt::format(
                                              "UPDATE {} SET {} = {} WHERE {} = {}",
                                              fix.cell.column.table, fix.cell.column.name,
                                              to_sql_literal(fix.value), kTidColumn, fix.cell.tid);
                                          if (auto updated = conn.execute(sql); !updated) {
                                              return std::unexpected(updated.error());
                                          }
                                      }
                                      return fixes.size();
                                  });
    if (!applied) {
        return std::unexpected(applied.error());
    }
    context_->sink->info(
        fmt::format("rule {} applied {} fix(es)", input.rule->name(), *applied));
    return StageSummary{.rule = input.rule->name(), .count = *applied};
}

}  // namespace nadeef::pipeline
