#include <tabula/error/failure_cases.hpp>

#include <tabula/core/print.hpp>

#include <fmt/format.h>

#include <utility>

namespace tabula {

auto scalar_failure_case(Scalar value) -> FailureCases {
    return FailureCases{FailureCase{.column = std::nullopt, .index = std::nullopt,
                                    .value = std::move(value)}};
}

auto failure_cases_where(const Series& data, const std::vector<bool>& mask,
                         std::optional<std::size_t> limit) -> FailureCases {
    FailureCases cases;
    for (std::size_t row = 0; row < mask.size() && row < data.size(); ++row) {
        if (!mask[row]) {
            continue;
        }
        if (limit.has_value() && cases.size() >= *limit) {
            break;
        }
        cases.push_back(FailureCase{.column = data.name,
                                    .index = data.label_at(row),
                                    .value = data.value_at(row)});
    }
    return cases;
}

auto failure_indices(const FailureCases& cases) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    out.reserve(cases.size());
    for (const auto& fc : cases) {
        if (fc.index.has_value()) {
            out.push_back(*fc.index);
        }
    }
    return out;
}

auto render_failure_cases(const FailureCases& cases) -> std::string {
    if (cases.empty()) {
        return "(no failure cases)\n";
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(cases.size());
    for (const auto& fc : cases) {
        rows.push_back({
            fc.index.has_value() ? fmt::format("{}", *fc.index) : std::string{"-"},
            fc.column.value_or("-"),
            format_scalar(fc.value),
        });
    }
    return format_table({"index", "column", "failure_case"}, rows);
}

}  // namespace tabula
