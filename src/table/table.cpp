#include <nadeef/table/memory_table.hpp>
#include <nadeef/table/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <map>
#include <stdexcept>
#include <thread>

namespace nadeef {

auto Table::group_on(const std::vector<Column>& columns) -> Grouping {
    auto self = weak_from_this().lock();
    if (self == nullptr) {
        throw std::logic_error("group_on requires the table to be owned by a TablePtr");
    }

    Grouping result{.source = GroupSource::Store, .partitions = {std::move(self)}, .error = {}};
    for (const auto& column : columns) {
        std::vector<TablePtr> refined;
        for (const auto& table : result.partitions) {
            auto grouping = table->group_on(column);
            if (!grouping.ok()) {
                return grouping;
            }
            if (grouping.source == GroupSource::Fallback) {
                result.source = GroupSource::Fallback;
                if (result.error.empty()) {
                    result.error = std::move(grouping.error);
                }
            }
            refined.insert(refined.end(), std::make_move_iterator(grouping.partitions.begin()),
                           std::make_move_iterator(grouping.partitions.end()));
        }
        result.partitions = std::move(refined);
    }
    return result;
}

auto Table::partition_rows(const std::string& name, const std::shared_ptr<const Schema>& schema,
                           const std::vector<Row>& rows, const Column& column) -> Grouping {
    if (schema == nullptr) {
        return Grouping{.source = GroupSource::Fallback, .partitions = {}, .error = {}};
    }
    auto index = schema->find(column);
    if (!index.has_value()) {
        return Grouping{.source = GroupSource::Failed,
                        .partitions = {},
                        .error = fmt::format("cannot group {} on unknown column {}", name,
                                             column.full_name())};
    }

    std::map<Value, std::vector<Row>, ValueLess> groups;
    for (const auto& row : rows) {
        groups[row.values()[*index]].push_back(row);
    }

    Grouping result{.source = GroupSource::Fallback, .partitions = {}, .error = {}};
    result.partitions.reserve(groups.size());
    for (auto& [value, members] : groups) {
        result.partitions.push_back(std::make_shared<MemoryTable>(schema, std::move(members)));
    }
    return result;
}

void materialize_all(const std::vector<TablePtr>& tables, std::size_t max_threads) {
    if (tables.empty()) {
        return;
    }
    const std::size_t hw = std::max<unsigned>(1, std::thread::hardware_concurrency());
    const std::size_t threads = std::min(tables.size(), max_threads == 0 ? hw : max_threads);
    if (threads <= 1) {
        for (const auto& table : tables) {
            (void)table->size();
        }
        return;
    }

    const std::size_t chunk = (tables.size() + threads - 1) / threads;
    std::vector<std::exception_ptr> failures(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        std::size_t start = t * chunk;
        if (start >= tables.size()) {
            break;
        }
        std::size_t end = std::min(tables.size(), start + chunk);
        workers.emplace_back([&tables, &failures, t, start, end] {
            try {
                for (std::size_t i = start; i < end; ++i) {
                    (void)tables[i]->size();
                }
            } catch (...) {
                failures[t] = std::current_exception();
            }
        });
    }
    for (auto& th : workers) {
        th.join();
    }
    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
}

}  // namespace nadeef
