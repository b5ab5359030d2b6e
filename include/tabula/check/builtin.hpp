#pragma once

#include <tabula/check/check.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tabula::checks {

// ─── Comparison checks ────────────────────────────────────────────────────────
//  Element-wise. Integers and floats compare numerically; ordering a value
//  against one of an unrelated kind throws std::invalid_argument.

[[nodiscard]] auto equal_to(Scalar value, CheckOptions options = {}) -> Check;
[[nodiscard]] auto not_equal_to(Scalar value, CheckOptions options = {}) -> Check;
[[nodiscard]] auto greater_than(Scalar min, CheckOptions options = {}) -> Check;
[[nodiscard]] auto greater_than_or_equal_to(Scalar min, CheckOptions options = {}) -> Check;
[[nodiscard]] auto less_than(Scalar max, CheckOptions options = {}) -> Check;
[[nodiscard]] auto less_than_or_equal_to(Scalar max, CheckOptions options = {}) -> Check;

/// Values between `min` and `max`; each bound is inclusive unless disabled.
[[nodiscard]] auto in_range(Scalar min, Scalar max, bool include_min = true,
                            bool include_max = true, CheckOptions options = {}) -> Check;

// ─── Membership checks ────────────────────────────────────────────────────────

[[nodiscard]] auto isin(std::vector<Scalar> allowed, CheckOptions options = {}) -> Check;
[[nodiscard]] auto notin(std::vector<Scalar> forbidden, CheckOptions options = {}) -> Check;

/// Column-wide: the set of distinct non-null values equals `values`.
[[nodiscard]] auto unique_values_eq(std::vector<Scalar> values, CheckOptions options = {})
    -> Check;

// ─── String checks ────────────────────────────────────────────────────────────
//  Applied to anything but a string value they throw std::invalid_argument.

/// The whole value matches the ECMAScript regular expression `pattern`.
[[nodiscard]] auto str_matches(std::string pattern, CheckOptions options = {}) -> Check;
/// Some substring of the value matches `pattern`.
[[nodiscard]] auto str_contains(std::string pattern, CheckOptions options = {}) -> Check;
[[nodiscard]] auto str_startswith(std::string prefix, CheckOptions options = {}) -> Check;
[[nodiscard]] auto str_endswith(std::string suffix, CheckOptions options = {}) -> Check;
/// Length within [min, max]; an absent bound is unbounded.
[[nodiscard]] auto str_length(std::optional<std::size_t> min, std::optional<std::size_t> max,
                              CheckOptions options = {}) -> Check;

}  // namespace tabula::checks
