#pragma once

#include <nadeef/core/cell.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace nadeef {

/// Cells that together break one rule.
struct Violation {
    std::string rule;
    std::vector<Cell> cells;
    /// Assigned when the violation is exported; 0 until then.
    std::int64_t vid = 0;

    auto operator==(const Violation&) const -> bool = default;
};

/// A proposed new value for one cell.
struct Fix {
    Cell cell;
    Value value;

    auto operator==(const Fix&) const -> bool = default;
};

}  // namespace nadeef
