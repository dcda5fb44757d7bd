#pragma once

#include <nadeef/table/table.hpp>

#include <cstddef>
#include <iostream>

namespace nadeef {

/// Render `table` as left-aligned columns with a header and a separator.
/// At most `max_rows` rows are printed when it is non-zero.
void print(Table& table, std::ostream& out = std::cout, std::size_t max_rows = 0);

}  // namespace nadeef
