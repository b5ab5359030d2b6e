#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace tabula {

auto is_null_value(const Scalar& value) noexcept -> bool {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return std::isnan(*d);
    }
    return false;
}

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto scalar_type_name(const Scalar& value) -> std::string_view {
    return std::visit(
        [](const auto& v) -> std::string_view {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return "int64";
            } else if constexpr (std::is_same_v<T, double>) {
                return "float64";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "str";
            } else if constexpr (std::is_same_v<T, Date>) {
                return "date";
            } else {
                return "datetime64[ns]";
            }
        },
        value);
}

auto integral_value(const Scalar& value) -> std::optional<std::int64_t> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    const auto* d = std::get_if<double>(&value);
    // 2^63 is exactly representable; anything at or above it is out of int64 range.
    constexpr double kLimit = 9223372036854775808.0;
    if (d == nullptr || !std::isfinite(*d) || std::trunc(*d) != *d || *d < -kLimit ||
        *d >= kLimit) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*d);
}

auto compare_scalars(const Scalar& lhs, const Scalar& rhs) -> std::optional<std::partial_ordering> {
    auto as_double = [](const Scalar& v) -> std::optional<double> {
        if (const auto* i = std::get_if<std::int64_t>(&v)) {
            return static_cast<double>(*i);
        }
        if (const auto* d = std::get_if<double>(&v)) {
            return *d;
        }
        return std::nullopt;
    };
    if (lhs.index() != rhs.index()) {
        auto l = as_double(lhs);
        auto r = as_double(rhs);
        if (!l || !r) {
            return std::nullopt;
        }
        return *l <=> *r;
    }
    return std::visit(
        [&rhs](const auto& l) -> std::optional<std::partial_ordering> {
            using T = std::decay_t<decltype(l)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::partial_ordering::equivalent;
            } else {
                return std::partial_ordering(l <=> std::get<T>(rhs));
            }
        },
        lhs);
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto scalar_at(const ColumnValue& column, std::size_t row) -> Scalar {
    return std::visit(
        [row](const auto& col) -> Scalar {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, Scalar>) {
                return col[row];
            } else {
                return Scalar{std::in_place_type<T>, col[row]};
            }
        },
        column);
}

void append_scalar(ColumnValue& column, const Scalar& value) {
    std::visit(
        [&value](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, Scalar>) {
                col.push_back(value);
            } else {
                const auto* typed = std::get_if<T>(&value);
                if (typed == nullptr) {
                    const Scalar expected{std::in_place_type<T>};
                    throw std::runtime_error(fmt::format("cannot append {} value to {} column",
                                                         scalar_type_name(value),
                                                         scalar_type_name(expected)));
                }
                col.push_back(*typed);
            }
        },
        column);
}

void append_default(ColumnValue& column) {
    std::visit(
        [](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            col.push_back(T{});
        },
        column);
}

auto take_column(const ColumnValue& column, std::span<const std::size_t> positions)
    -> ColumnValue {
    return std::visit([positions](const auto& col) -> ColumnValue { return col.take(positions); },
                      column);
}

auto ScalarHash::operator()(const Scalar& value) const -> std::size_t {
    if (is_null_value(value)) {
        return 0x9e3779b97f4a7c15ULL;
    }
    // Integral doubles hash like the equal int64.
    if (auto integral = integral_value(value)) {
        return std::hash<std::int64_t>{}(*integral);
    }
    std::size_t h = std::visit(
        [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value);
    return h ^ (value.index() + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

auto ScalarKeyEq::operator()(const Scalar& a, const Scalar& b) const -> bool {
    const bool a_null = is_null_value(a);
    const bool b_null = is_null_value(b);
    if (a_null || b_null) {
        return a_null && b_null;
    }
    if (a.index() != b.index()) {
        auto l = integral_value(a);
        auto r = integral_value(b);
        return l.has_value() && r.has_value() && *l == *r;
    }
    return a == b;
}

auto all_passed(const CheckOutput& output) -> bool {
    if (const auto* verdict = std::get_if<bool>(&output)) {
        return *verdict;
    }
    const auto& mask = std::get<std::vector<bool>>(output);
    return std::ranges::all_of(mask, [](bool passed) { return passed; });
}

}  // namespace tabula
