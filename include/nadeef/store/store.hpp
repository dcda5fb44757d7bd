#pragma once

#include <nadeef/core/column.hpp>
#include <nadeef/core/value.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nadeef::store {

/// Externally configured store. The core never builds one itself; it is
/// handed in through the clean context.
struct StoreConfig {
    /// Logical name, used in diagnostics.
    std::string name;
    /// Database location (a file path for SQLite).
    std::string path;
    /// Upper bound on waiting for a locked store.
    std::chrono::milliseconds busy_timeout{5000};

    auto operator==(const StoreConfig&) const -> bool = default;
};

/// Column names (in result order) and the rows of one query.
struct ResultSet {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;

    [[nodiscard]] auto empty() const noexcept -> bool { return rows.empty(); }
};

/// An open connection. Closed when destroyed.
class Connection {
   public:
    virtual ~Connection() = default;

    /// Run a statement that returns no rows.
    [[nodiscard]] virtual auto execute(const std::string& sql)
        -> std::expected<void, std::string> = 0;

    /// Run a query and fetch every row.
    [[nodiscard]] virtual auto query(const std::string& sql)
        -> std::expected<ResultSet, std::string> = 0;
};

/// Hands out connections bound to a named store.
class ConnectionFactory {
   public:
    virtual ~ConnectionFactory() = default;

    [[nodiscard]] virtual auto connect(const StoreConfig& config)
        -> std::expected<std::unique_ptr<Connection>, std::string> = 0;
};

}  // namespace nadeef::store

namespace std {

template <>
struct hash<nadeef::store::StoreConfig> {
    auto operator()(const nadeef::store::StoreConfig& c) const noexcept -> std::size_t {
        auto seed = std::hash<std::string>{}(c.name);
        seed = nadeef::hash_combine(seed, std::hash<std::string>{}(c.path));
        return nadeef::hash_combine(seed, std::hash<std::int64_t>{}(c.busy_timeout.count()));
    }
};

}  // namespace std
