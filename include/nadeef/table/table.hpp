#pragma once

#include <nadeef/core/row.hpp>
#include <nadeef/core/schema.hpp>
#include <nadeef/query/predicate.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nadeef {

class Table;
using TablePtr = std::shared_ptr<Table>;

/// Where the partitions of a grouping came from.
enum class GroupSource : std::uint8_t {
    /// One store-backed table per distinct value.
    Store,
    /// The store failed; partitions were computed from cached rows.
    Fallback,
    /// Neither path produced a partition (e.g. unknown column).
    Failed,
};

struct Grouping {
    GroupSource source = GroupSource::Store;
    std::vector<TablePtr> partitions;
    /// Store or lookup error behind a Fallback or Failed result.
    std::string error;

    [[nodiscard]] auto ok() const noexcept -> bool { return source != GroupSource::Failed; }
};

/// A queryable collection of rows.
///
/// Shaping calls (`project`, `filter`, `order_by`) return the same instance
/// for chaining. Tables are owned through TablePtr.
class Table : public std::enable_shared_from_this<Table> {
   public:
    explicit Table(std::string name) : name_(std::move(name)) {}
    virtual ~Table() = default;

    Table(const Table&) = delete;
    auto operator=(const Table&) -> Table& = delete;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    [[nodiscard]] virtual auto size() -> std::size_t = 0;
    [[nodiscard]] virtual auto schema() -> Schema = 0;
    /// Row at `index`; throws std::out_of_range.
    [[nodiscard]] virtual auto get(std::size_t index) -> Row = 0;
    /// Snapshot of every row.
    [[nodiscard]] virtual auto rows() -> std::vector<Row> = 0;

    virtual auto project(const std::vector<Column>& columns) -> Table& = 0;
    virtual auto filter(const std::vector<query::Predicate>& predicates) -> Table& = 0;
    virtual auto order_by(const std::vector<Column>& columns) -> Table& = 0;

    /// One partition per distinct value of `column`.
    [[nodiscard]] virtual auto group_on(const Column& column) -> Grouping = 0;

    /// Refine partitions column by column; the result is the Cartesian
    /// decomposition over every column's values.
    [[nodiscard]] auto group_on(const std::vector<Column>& columns) -> Grouping;

    /// Release cached content. The table must not be used afterwards.
    virtual void recycle() = 0;

   protected:
    /// Partition `rows` by the value of `column`, ordered by value.
    [[nodiscard]] static auto partition_rows(const std::string& name,
                                             const std::shared_ptr<const Schema>& schema,
                                             const std::vector<Row>& rows, const Column& column)
        -> Grouping;

   private:
    std::string name_;
};

/// Materialize every table, spreading the work over up to `max_threads` threads.
void materialize_all(const std::vector<TablePtr>& tables, std::size_t max_threads = 0);

}  // namespace nadeef
