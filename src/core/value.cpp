#include <nadeef/core/value.hpp>

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

namespace nadeef {

namespace {

auto format_double(double v) -> std::string {
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v > 0 ? "inf" : "-inf";
    return fmt::format("{:g}", v);
}

auto rank(const Value& value) -> int {
    if (is_null(value)) {
        return 0;
    }
    return std::holds_alternative<std::string>(value) ? 2 : 1;
}

auto as_double(const Value& value) -> double {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(value);
}

}  // namespace

auto order_values(const Value& lhs, const Value& rhs) -> std::weak_ordering {
    int lr = rank(lhs);
    int rr = rank(rhs);
    if (lr != rr) {
        return lr <=> rr;
    }
    if (lr == 0) {
        return std::weak_ordering::equivalent;
    }
    if (lr == 2) {
        return std::get<std::string>(lhs) <=> std::get<std::string>(rhs);
    }
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
        return *li <=> *ri;
    }
    return std::weak_order(as_double(lhs), as_double(rhs));
}

auto to_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else {
                return std::to_string(v);
            }
        },
        value);
}

auto to_sql_literal(const Value& value) -> std::string {
    if (const auto* text = std::get_if<std::string>(&value)) {
        std::string out;
        out.reserve(text->size() + 2);
        out.push_back('\'');
        for (char ch : *text) {
            if (ch == '\'') {
                out.push_back('\'');
            }
            out.push_back(ch);
        }
        out.push_back('\'');
        return out;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        // SQLite stores NaN as NULL and reads 9e999 as infinity.
        if (std::isnan(*number)) {
            return "NULL";
        }
        if (std::isinf(*number)) {
            return *number > 0 ? "9e999" : "-9e999";
        }
        // Round-trip precision; the display form above drops digits.
        return fmt::format("{}", *number);
    }
    return to_string(value);
}

}  // namespace nadeef
