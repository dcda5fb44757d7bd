#include <nadeef/table/relational_table.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace nadeef {

namespace {

auto column_names(const std::vector<Column>& columns) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

}  // namespace

RelationalTable::RelationalTable(std::string table_name, store::StoreConfig config,
                                 std::shared_ptr<store::ConnectionFactory> connections,
                                 std::shared_ptr<DiagnosticsSink> sink)
    : Table(table_name),
      config_(std::move(config)),
      connections_(std::move(connections)),
      sink_(std::move(sink)),
      spec_(std::move(table_name)) {
    if (name().empty()) {
        throw std::invalid_argument("relational table name cannot be empty");
    }
    if (connections_ == nullptr) {
        throw std::invalid_argument("relational table requires a connection factory");
    }
    if (sink_ == nullptr) {
        sink_ = std::make_shared<NullSink>();
    }
}

RelationalTable::RelationalTable(const RelationalTable& parent, query::QuerySpec spec)
    : Table(parent.name()),
      config_(parent.config_),
      connections_(parent.connections_),
      sink_(parent.sink_),
      spec_(std::move(spec)) {}

// ─── Accessors ────────────────────────────────────────────────────────────────

auto RelationalTable::size() -> std::size_t {
    std::lock_guard lock(mutex_);
    check_usable();
    sync_data_if_needed();
    return rows_.size();
}

auto RelationalTable::schema() -> Schema {
    std::lock_guard lock(mutex_);
    check_usable();
    sync_schema_if_needed();
    if (schema_ == nullptr) {
        return Schema(name(), {});
    }
    return *schema_;
}

auto RelationalTable::get(std::size_t index) -> Row {
    std::lock_guard lock(mutex_);
    check_usable();
    sync_data_if_needed();
    return rows_.at(index);
}

auto RelationalTable::rows() -> std::vector<Row> {
    std::lock_guard lock(mutex_);
    check_usable();
    sync_data_if_needed();
    return rows_;
}

auto RelationalTable::state() const -> SyncState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto RelationalTable::spec() const -> query::QuerySpec {
    std::lock_guard lock(mutex_);
    return spec_;
}

auto RelationalTable::last_error() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return last_error_;
}

auto RelationalTable::has_row_ids() const -> bool {
    std::lock_guard lock(mutex_);
    return has_row_ids_;
}

// ─── Query shaping ────────────────────────────────────────────────────────────

auto RelationalTable::project(const std::vector<Column>& columns) -> Table& {
    std::lock_guard lock(mutex_);
    mark_changed(spec_.with_select(column_names(columns)));
    return *this;
}

auto RelationalTable::filter(const std::vector<query::Predicate>& predicates) -> Table& {
    std::lock_guard lock(mutex_);
    mark_changed(spec_.with_where(predicates));
    return *this;
}

auto RelationalTable::order_by(const std::vector<Column>& columns) -> Table& {
    std::lock_guard lock(mutex_);
    mark_changed(spec_.with_order(column_names(columns)));
    return *this;
}

void RelationalTable::check_usable() const {
    if (state_ == SyncState::Recycled) {
        throw std::logic_error(fmt::format("table {} was recycled", name()));
    }
}

void RelationalTable::mark_changed(query::QuerySpec next) {
    check_usable();
    spec_ = std::move(next);
    if (state_ != SyncState::Unsynced) {
        state_ = SyncState::Dirty;
    }
}

// ─── Grouping ─────────────────────────────────────────────────────────────────

auto RelationalTable::group_on(const Column& column) -> Grouping {
    query::QuerySpec base = spec();
    {
        std::lock_guard lock(mutex_);
        check_usable();
    }

    auto connection = connections_->connect(config_);
    if (!connection) {
        return fallback_grouping(column, connection.error());
    }

    // Only an optimization; the grouping does not depend on it.
    auto index_sql = fmt::format("CREATE INDEX IF NOT EXISTS idx_{}_{} ON {} ({})", name(),
                                 column.name, name(), column.name);
    sink_->debug(index_sql);
    if (auto indexed = (*connection)->execute(index_sql); !indexed) {
        sink_->warn(fmt::format("index creation on {} skipped: {}", column.full_name(),
                                indexed.error()));
    }

    auto distinct_sql = query::QuerySpec(name())
                            .with_select({column.name})
                            .with_where(base.predicates())
                            .with_order({column.name})
                            .with_distinct()
                            .build();
    sink_->debug(distinct_sql);
    auto distinct = (*connection)->query(distinct_sql);
    if (!distinct) {
        return fallback_grouping(column, distinct.error());
    }

    Grouping result{.source = GroupSource::Store, .partitions = {}, .error = {}};
    result.partitions.reserve(distinct->rows.size());
    for (const auto& row : distinct->rows) {
        if (row.empty()) {
            continue;
        }
        auto derived = base.with_where({query::Predicate::equal(column, row.front())});
        result.partitions.push_back(
            std::shared_ptr<RelationalTable>(new RelationalTable(*this, std::move(derived))));
    }
    return result;
}

auto RelationalTable::fallback_grouping(const Column& column, std::string error) -> Grouping {
    sink_->error(fmt::format("grouping {} on {} falls back to cached rows: {}", name(),
                             column.name, error));
    std::lock_guard lock(mutex_);
    check_usable();
    auto grouping = partition_rows(name(), schema_, rows_, column);
    if (grouping.error.empty()) {
        grouping.error = std::move(error);
    }
    return grouping;
}

// ─── Synchronization ──────────────────────────────────────────────────────────

void RelationalTable::sync_schema_if_needed() {
    if (state_ != SyncState::Unsynced && state_ != SyncState::Dirty) {
        return;
    }
    if (auto synced = sync_schema(); !synced) {
        last_error_ = synced.error();
        sink_->error(fmt::format("cannot get a valid schema for {}: {}", name(), synced.error()));
        return;
    }
    last_error_.reset();
    state_ = SyncState::SchemaSynced;
}

void RelationalTable::sync_data_if_needed() {
    if (state_ == SyncState::Synced) {
        return;
    }
    if (auto synced = sync_data(); !synced) {
        last_error_ = synced.error();
        sink_->error(fmt::format("synchronization of {} failed: {}", name(), synced.error()));
        return;
    }
    last_error_.reset();
    state_ = SyncState::Synced;
}

auto RelationalTable::discover_schema(const store::ResultSet& result) const
    -> std::shared_ptr<const Schema> {
    std::vector<Column> columns;
    columns.reserve(result.columns.size());
    for (const auto& column_name : result.columns) {
        columns.emplace_back(name(), column_name);
    }
    return std::make_shared<const Schema>(name(), std::move(columns));
}

auto RelationalTable::sync_schema() -> std::expected<void, std::string> {
    auto connection = connections_->connect(config_);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    auto sql = spec_.with_limit(1).build();
    sink_->debug(sql);
    auto result = (*connection)->query(sql);
    if (!result) {
        return std::unexpected(result.error());
    }
    schema_ = discover_schema(*result);
    return {};
}

auto RelationalTable::sync_data() -> std::expected<void, std::string> {
    ScopedTimer timer(*sink_, StatType::DbLoadTime);
    auto connection = connections_->connect(config_);
    if (!connection) {
        return std::unexpected(connection.error());
    }
    auto sql = spec_.build();
    sink_->debug(sql);
    auto result = (*connection)->query(sql);
    if (!result) {
        return std::unexpected(result.error());
    }

    auto schema = discover_schema(*result);
    std::optional<std::size_t> tid_index;
    for (std::size_t i = 0; i < result->columns.size(); ++i) {
        if (is_tid_name(result->columns[i])) {
            tid_index = i;
            break;
        }
    }

    std::vector<Row> rows;
    rows.reserve(result->rows.size());
    std::int64_t ordinal = 0;
    for (auto& values : result->rows) {
        ++ordinal;
        std::int64_t tid = ordinal;
        if (tid_index.has_value()) {
            const auto* id = std::get_if<std::int64_t>(&values[*tid_index]);
            if (id == nullptr || *id < 1) {
                return std::unexpected(fmt::format("row {} of {} has an invalid {} value {}",
                                                   ordinal, name(), kTidColumn,
                                                   to_string(values[*tid_index])));
            }
            tid = *id;
        }
        rows.emplace_back(tid, schema, std::move(values));
    }

    schema_ = std::move(schema);
    rows_ = std::move(rows);
    has_row_ids_ = tid_index.has_value();
    return {};
}

// ─── Lifetime / identity ──────────────────────────────────────────────────────

void RelationalTable::recycle() {
    std::lock_guard lock(mutex_);
    rows_.clear();
    rows_.shrink_to_fit();
    schema_.reset();
    state_ = SyncState::Recycled;
}

auto RelationalTable::equals(const RelationalTable& other) const -> bool {
    if (this == &other) {
        return true;
    }
    if (config_ == other.config_ && name() == other.name()) {
        return true;
    }
    std::scoped_lock lock(mutex_, other.mutex_);
    if (rows_.size() != other.rows_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].tid() != other.rows_[i].tid() ||
            rows_[i].values() != other.rows_[i].values()) {
            return false;
        }
    }
    return true;
}

auto RelationalTable::hash() const noexcept -> std::size_t {
    return hash_combine(std::hash<store::StoreConfig>{}(config_), std::hash<std::string>{}(name()));
}

}  // namespace nadeef
