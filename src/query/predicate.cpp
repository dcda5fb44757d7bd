#include <nadeef/query/predicate.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <compare>
#include <optional>

namespace nadeef::query {

namespace {

auto as_number(const Value& value) -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

/// Three-way comparison of two non-null values; nullopt when the types are
/// not comparable (text against a number).
auto compare(const Value& lhs, const Value& rhs) -> std::optional<std::partial_ordering> {
    const auto* ls = std::get_if<std::string>(&lhs);
    const auto* rs = std::get_if<std::string>(&rhs);
    if (ls != nullptr && rs != nullptr) {
        return ls->compare(*rs) <=> 0;
    }
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
        return *li <=> *ri;
    }
    auto ln = as_number(lhs);
    auto rn = as_number(rhs);
    if (ln.has_value() && rn.has_value()) {
        return *ln <=> *rn;
    }
    return std::nullopt;
}

auto is_ident_start(char ch) -> bool {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto is_ident_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto skip_space(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    return pos;
}

auto upper(std::string_view text) -> std::string {
    std::string out(text);
    for (char& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

auto parse_literal(std::string_view text) -> std::expected<Value, std::string> {
    if (text.empty()) {
        return std::unexpected("missing literal");
    }
    if (text.front() == '\'') {
        if (text.size() < 2 || text.back() != '\'') {
            return std::unexpected(fmt::format("unterminated text literal: {}", text));
        }
        std::string out;
        auto body = text.substr(1, text.size() - 2);
        for (std::size_t i = 0; i < body.size(); ++i) {
            if (body[i] == '\'') {
                if (i + 1 < body.size() && body[i + 1] == '\'') {
                    ++i;
                } else {
                    return std::unexpected(fmt::format("stray quote in literal: {}", text));
                }
            }
            out.push_back(body[i]);
        }
        return Value{std::move(out)};
    }
    if (upper(text) == "NULL") {
        return Value{};
    }
    std::int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), integer);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        return Value{integer};
    }
    double number = 0.0;
    auto [dptr, dec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (dec == std::errc() && dptr == text.data() + text.size()) {
        return Value{number};
    }
    return std::unexpected(fmt::format("invalid literal: {}", text));
}

}  // namespace

auto Predicate::equal(Column column, Value value) -> Predicate {
    CompareOp op = is_null(value) ? CompareOp::IsNull : CompareOp::Eq;
    return Predicate{.column = std::move(column), .op = op, .value = std::move(value)};
}

auto to_sql(CompareOp op) -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "=";
        case CompareOp::Ne:
            return "!=";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
        case CompareOp::IsNull:
            return "IS NULL";
    }
    return "=";
}

auto Predicate::to_sql() const -> std::string {
    if (op == CompareOp::IsNull) {
        return fmt::format("{} IS NULL", column.name);
    }
    return fmt::format("{} {} {}", column.name, query::to_sql(op), to_sql_literal(value));
}

auto Predicate::matches(const Value& candidate) const -> bool {
    if (op == CompareOp::IsNull) {
        return is_null(candidate);
    }
    if (is_null(candidate) || is_null(value)) {
        return false;
    }
    auto order = compare(candidate, value);
    if (!order.has_value()) {
        return false;
    }
    switch (op) {
        case CompareOp::Eq:
            return *order == 0;
        case CompareOp::Ne:
            return *order != 0;
        case CompareOp::Lt:
            return *order < 0;
        case CompareOp::Le:
            return *order <= 0;
        case CompareOp::Gt:
            return *order > 0;
        case CompareOp::Ge:
            return *order >= 0;
        case CompareOp::IsNull:
            break;
    }
    return false;
}

auto parse_predicate(std::string_view text, std::string_view table)
    -> std::expected<Predicate, std::string> {
    std::size_t pos = skip_space(text, 0);
    if (pos >= text.size() || !is_ident_start(text[pos])) {
        return std::unexpected(fmt::format("expected column name in predicate: {}", text));
    }
    std::size_t start = pos;
    while (pos < text.size() && is_ident_char(text[pos])) {
        ++pos;
    }
    Column column{std::string(table), std::string(text.substr(start, pos - start))};

    pos = skip_space(text, pos);
    auto rest = text.substr(pos);
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back())) != 0) {
        rest.remove_suffix(1);
    }

    if (upper(rest) == "IS NULL") {
        return Predicate{.column = std::move(column), .op = CompareOp::IsNull, .value = {}};
    }

    struct OpToken {
        std::string_view text;
        CompareOp op;
    };
    // Longest tokens first so "<=" wins over "<".
    constexpr OpToken kOps[] = {
        {"==", CompareOp::Eq}, {"!=", CompareOp::Ne}, {"<>", CompareOp::Ne},
        {"<=", CompareOp::Le}, {">=", CompareOp::Ge}, {"=", CompareOp::Eq},
        {"<", CompareOp::Lt},  {">", CompareOp::Gt},
    };
    for (const auto& token : kOps) {
        if (rest.starts_with(token.text)) {
            auto literal_text = rest.substr(token.text.size());
            literal_text = literal_text.substr(skip_space(literal_text, 0));
            auto literal = parse_literal(literal_text);
            if (!literal) {
                return std::unexpected(literal.error());
            }
            if (is_null(*literal)) {
                return std::unexpected(
                    fmt::format("comparison with NULL, use IS NULL: {}", text));
            }
            return Predicate{.column = std::move(column), .op = token.op, .value = *literal};
        }
    }
    return std::unexpected(fmt::format("expected comparison operator in predicate: {}", text));
}

}  // namespace nadeef::query
