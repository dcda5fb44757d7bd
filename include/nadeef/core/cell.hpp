#pragma once

#include <nadeef/core/column.hpp>
#include <nadeef/core/value.hpp>

#include <cstdint>
#include <functional>

namespace nadeef {

/// The addressable unit of a repair: one value of one row.
struct Cell {
    Column column;
    std::int64_t tid = 0;
    Value value;

    auto operator==(const Cell&) const -> bool = default;
};

}  // namespace nadeef

namespace std {

template <>
struct hash<nadeef::Cell> {
    auto operator()(const nadeef::Cell& c) const noexcept -> std::size_t {
        auto seed = std::hash<nadeef::Column>{}(c.column);
        seed = nadeef::hash_combine(seed, std::hash<std::int64_t>{}(c.tid));
        return nadeef::hash_combine(seed, std::hash<nadeef::Value>{}(c.value));
    }
};

}  // namespace std
