#pragma once

#include <nadeef/core/diagnostics.hpp>
#include <nadeef/query/query_spec.hpp>
#include <nadeef/store/store.hpp>
#include <nadeef/table/table.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nadeef {

/// Synchronization state of a RelationalTable's cache.
enum class SyncState : std::uint8_t {
    /// Nothing materialized yet.
    Unsynced,
    /// Schema discovered, rows not yet fetched.
    SchemaSynced,
    /// Schema and rows match the current query.
    Synced,
    /// The query changed after a synchronization.
    Dirty,
    /// Cache released; the table is no longer usable.
    Recycled,
};

/// Table backed by a relation in an external store.
///
/// Shaping calls only extend the query; the store is read lazily by the
/// first accessor after a change. Materialization runs under a per-table
/// lock, so concurrent readers trigger it at most once and all observe the
/// same result. Store failures never escape an accessor: the previous
/// materialization (or an empty one) is served and `last_error()` is set.
class RelationalTable final : public Table {
   public:
    RelationalTable(std::string table_name, store::StoreConfig config,
                    std::shared_ptr<store::ConnectionFactory> connections,
                    std::shared_ptr<DiagnosticsSink> sink = default_sink());

    [[nodiscard]] auto size() -> std::size_t override;
    [[nodiscard]] auto schema() -> Schema override;
    [[nodiscard]] auto get(std::size_t index) -> Row override;
    [[nodiscard]] auto rows() -> std::vector<Row> override;

    auto project(const std::vector<Column>& columns) -> Table& override;
    auto filter(const std::vector<query::Predicate>& predicates) -> Table& override;
    auto order_by(const std::vector<Column>& columns) -> Table& override;

    using Table::group_on;

    /// Store path: best-effort index, then one derived table per distinct
    /// value. On store failure the cached rows are partitioned instead.
    [[nodiscard]] auto group_on(const Column& column) -> Grouping override;

    void recycle() override;

    [[nodiscard]] auto state() const -> SyncState;
    [[nodiscard]] auto spec() const -> query::QuerySpec;
    [[nodiscard]] auto last_error() const -> std::optional<std::string>;
    /// False when the relation has no identifier column; rows then carry
    /// their 1-based position as row id.
    [[nodiscard]] auto has_row_ids() const -> bool;
    [[nodiscard]] auto config() const noexcept -> const store::StoreConfig& { return config_; }

    /// Same store and table name, or else equal cached rows.
    [[nodiscard]] auto equals(const RelationalTable& other) const -> bool;
    [[nodiscard]] auto hash() const noexcept -> std::size_t;

   private:
    RelationalTable(const RelationalTable& parent, query::QuerySpec spec);

    void check_usable() const;
    void mark_changed(query::QuerySpec next);
    void sync_schema_if_needed();
    void sync_data_if_needed();
    [[nodiscard]] auto sync_schema() -> std::expected<void, std::string>;
    [[nodiscard]] auto sync_data() -> std::expected<void, std::string>;
    [[nodiscard]] auto fallback_grouping(const Column& column, std::string error) -> Grouping;
    [[nodiscard]] auto discover_schema(const store::ResultSet& result) const
        -> std::shared_ptr<const Schema>;

    store::StoreConfig config_;
    std::shared_ptr<store::ConnectionFactory> connections_;
    std::shared_ptr<DiagnosticsSink> sink_;

    mutable std::mutex mutex_;
    query::QuerySpec spec_;
    SyncState state_ = SyncState::Unsynced;
    std::shared_ptr<const Schema> schema_;
    std::vector<Row> rows_;
    bool has_row_ids_ = false;
    std::optional<std::string> last_error_;
};

[[nodiscard]] inline auto operator==(const RelationalTable& lhs, const RelationalTable& rhs)
    -> bool {
    return lhs.equals(rhs);
}

}  // namespace nadeef

namespace std {

template <>
struct hash<nadeef::RelationalTable> {
    auto operator()(const nadeef::RelationalTable& t) const noexcept -> std::size_t {
        return t.hash();
    }
};

}  // namespace std
