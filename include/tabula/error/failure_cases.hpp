#pragma once

#include <tabula/core/frame.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabula {

/// One concrete violation: where it happened and the offending value.
struct FailureCase {
    /// Column the value came from (frame-level checks report per cell).
    std::optional<std::string> column;
    /// Row label; absent for scalar failures such as a wrong name.
    std::optional<std::int64_t> index;
    Scalar value;

    auto operator==(const FailureCase&) const -> bool = default;
};

using FailureCases = std::vector<FailureCase>;

/// A single index-less failure case carrying `value`.
[[nodiscard]] auto scalar_failure_case(Scalar value) -> FailureCases;

/// One failure case per row of `data` where `mask` is true.
[[nodiscard]] auto failure_cases_where(const Series& data, const std::vector<bool>& mask,
                                       std::optional<std::size_t> limit = std::nullopt)
    -> FailureCases;

/// Row labels of the failure cases that carry one, in order.
[[nodiscard]] auto failure_indices(const FailureCases& cases) -> std::vector<std::int64_t>;

/// Fixed-width text table (index, column, failure_case).
[[nodiscard]] auto render_failure_cases(const FailureCases& cases) -> std::string;

}  // namespace tabula
