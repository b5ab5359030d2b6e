#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/time.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula {

/// A single cell value. std::monostate is the null value.
using Scalar =
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Date, Timestamp>;

/// Storage variants a series may hold. Column<Scalar> is the mixed-type
/// ("object") column whose elements carry their own kind.
using ColumnValue = std::variant<Column<bool>, Column<std::int64_t>, Column<double>,
                                 Column<std::string>, Column<Date>, Column<Timestamp>,
                                 Column<Scalar>>;

/// Outcome shape shared by checks and dtype compatibility tests: either one
/// verdict for the whole object or one verdict per row.
using CheckOutput = std::variant<bool, std::vector<bool>>;

/// True for std::monostate and NaN.
[[nodiscard]] auto is_null_value(const Scalar& value) noexcept -> bool;

/// Human-readable rendering used in messages and failure-case tables.
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

/// Short name of the value's kind ("int64", "str", ...), "null" for nulls.
[[nodiscard]] auto scalar_type_name(const Scalar& value) -> std::string_view;

/// Order two values. Integers and doubles compare numerically; any other
/// pair of different kinds is unordered (nullopt).
[[nodiscard]] auto compare_scalars(const Scalar& lhs, const Scalar& rhs)
    -> std::optional<std::partial_ordering>;

/// The value as an int64 when it is one, or a finite double with no
/// fractional part inside the int64 range.
[[nodiscard]] auto integral_value(const Scalar& value) -> std::optional<std::int64_t>;

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// Value at `row`, without consulting any validity bitmap.
[[nodiscard]] auto scalar_at(const ColumnValue& column, std::size_t row) -> Scalar;

/// Append `value` to `column`. Throws std::runtime_error when the value kind
/// does not match the column's element type.
void append_scalar(ColumnValue& column, const Scalar& value);

/// Append the element type's default value (placeholder under a null slot).
void append_default(ColumnValue& column);

[[nodiscard]] auto take_column(const ColumnValue& column, std::span<const std::size_t> positions)
    -> ColumnValue;

/// Hash for Scalar keys; all nulls (including NaN) hash alike, and an
/// integral double hashes like the equal int64.
struct ScalarHash {
    auto operator()(const Scalar& value) const -> std::size_t;
};

/// Equality for Scalar keys; all nulls (including NaN) compare equal, and
/// int64 and double values are equal when they hold the same integer.
struct ScalarKeyEq {
    auto operator()(const Scalar& a, const Scalar& b) const -> bool;
};

/// Evaluate a CheckOutput into a single pass/fail verdict.
[[nodiscard]] auto all_passed(const CheckOutput& output) -> bool;

}  // namespace tabula
