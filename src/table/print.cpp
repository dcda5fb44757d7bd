#include <nadeef/table/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

namespace nadeef {

void print(Table& table, std::ostream& out, std::size_t max_rows) {
    auto schema = table.schema();
    if (schema.empty()) {
        out << "(empty table)\n";
        return;
    }
    auto rows = table.rows();
    const std::size_t shown = max_rows == 0 ? rows.size() : std::min(rows.size(), max_rows);
    const auto& columns = schema.columns();

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(columns.size());
    std::vector<std::size_t> widths(columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
        widths[c] = columns[c].name.size();
        cells[c].reserve(shown);
        for (std::size_t r = 0; r < shown; ++r) {
            const auto& values = rows[r].values();
            auto s = c < values.size() ? to_string(values[c]) : std::string{};
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    auto line = [&](auto&& cell) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cell(c), widths[c]);
        }
        out << "\n";
    };

    line([&](std::size_t c) { return columns[c].name; });
    line([&](std::size_t c) { return std::string(widths[c], '-'); });
    for (std::size_t r = 0; r < shown; ++r) {
        line([&](std::size_t c) -> const std::string& { return cells[c][r]; });
    }
    if (shown < rows.size()) {
        out << fmt::format("... {} more row(s)\n", rows.size() - shown);
    }
}

}  // namespace nadeef
