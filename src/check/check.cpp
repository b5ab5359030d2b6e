#include <tabula/check/check.hpp>

#include <fmt/format.h>

#include <utility>

namespace tabula {

namespace {

auto inverted(const std::vector<bool>& mask) -> std::vector<bool> {
    std::vector<bool> out;
    out.reserve(mask.size());
    for (bool passed : mask) {
        out.push_back(!passed);
    }
    return out;
}

auto bool_result(bool passed) -> CheckResult {
    CheckResult result{.passed = passed, .output = passed, .failure_cases = {}};
    if (!passed) {
        result.failure_cases = scalar_failure_case(Scalar{false});
    }
    return result;
}

auto wrong_length(std::string_view check, std::size_t got, std::size_t rows) -> std::string {
    return fmt::format("check '{}' returned a mask of length {} for data with {} rows", check, got,
                       rows);
}

}  // namespace

auto to_string(CheckScope scope) -> std::string_view {
    switch (scope) {
        case CheckScope::Element:
            return "element";
        case CheckScope::Series:
            return "series";
        case CheckScope::Frame:
            return "frame";
    }
    return "series";
}

Check::Check(std::string name, Predicate fn, CheckOptions options)
    : name_(std::move(name)), fn_(std::move(fn)), options_(std::move(options)) {}

auto Check::element(std::string name, ElementPredicate fn, CheckOptions options) -> Check {
    return Check{std::move(name), Predicate{std::in_place_type<ElementPredicate>, std::move(fn)},
                 std::move(options)};
}

auto Check::series(std::string name, SeriesPredicate fn, CheckOptions options) -> Check {
    return Check{std::move(name), Predicate{std::in_place_type<SeriesPredicate>, std::move(fn)},
                 std::move(options)};
}

auto Check::frame(std::string name, FramePredicate fn, CheckOptions options) -> Check {
    return Check{std::move(name), Predicate{std::in_place_type<FramePredicate>, std::move(fn)},
                 std::move(options)};
}

auto Check::scope() const noexcept -> CheckScope {
    switch (fn_.index()) {
        case 0:
            return CheckScope::Element;
        case 1:
            return CheckScope::Series;
        default:
            return CheckScope::Frame;
    }
}

auto Check::with_options(CheckOptions options) const -> Check {
    Check copy = *this;
    copy.options_ = std::move(options);
    return copy;
}

auto Check::operator()(const Series& data) const -> std::expected<CheckResult, std::string> {
    CheckOutput output = true;
    if (const auto* element = std::get_if<ElementPredicate>(&fn_)) {
        std::vector<bool> mask;
        mask.reserve(data.size());
        for (std::size_t row = 0; row < data.size(); ++row) {
            auto value = data.value_at(row);
            if (options_.ignore_na && is_null_value(value)) {
                mask.push_back(true);
                continue;
            }
            mask.push_back((*element)(value));
        }
        output = std::move(mask);
    } else if (const auto* series = std::get_if<SeriesPredicate>(&fn_)) {
        output = (*series)(data);
    } else {
        return std::unexpected(
            fmt::format("frame check '{}' cannot be applied to a single series", name_));
    }

    if (const auto* verdict = std::get_if<bool>(&output)) {
        return bool_result(*verdict);
    }
    auto mask = std::get<std::vector<bool>>(std::move(output));
    if (mask.size() != data.size()) {
        return std::unexpected(wrong_length(name_, mask.size(), data.size()));
    }
    if (options_.ignore_na) {
        for (std::size_t row = 0; row < mask.size(); ++row) {
            if (!mask[row] && data.is_null(row)) {
                mask[row] = true;
            }
        }
    }
    CheckResult result;
    result.failure_cases = failure_cases_where(data, inverted(mask), options_.n_failure_cases);
    result.passed = all_passed(mask);
    result.output = std::move(mask);
    return result;
}

auto Check::operator()(const Frame& data, const std::optional<std::string>& column) const
    -> std::expected<CheckResult, std::string> {
    const auto* fn = std::get_if<FramePredicate>(&fn_);
    if (fn == nullptr && !column.has_value() && scope() == CheckScope::Element) {
        return apply_cells(data);
    }
    if (fn == nullptr) {
        if (!column.has_value()) {
            return std::unexpected(
                fmt::format("{} check '{}' needs a column to run against a frame",
                            to_string(scope()), name_));
        }
        auto series = data.series(*column);
        if (!series.has_value()) {
            return std::unexpected(fmt::format("column '{}' not in frame", *column));
        }
        return (*this)(*series);
    }

    auto output = (*fn)(data);
    if (const auto* verdict = std::get_if<bool>(&output)) {
        return bool_result(*verdict);
    }
    auto mask = std::get<std::vector<bool>>(std::move(output));
    const auto rows = data.rows();
    if (mask.size() != rows) {
        return std::unexpected(wrong_length(name_, mask.size(), rows));
    }

    CheckResult result;
    for (std::size_t row = 0; row < rows; ++row) {
        if (mask[row]) {
            continue;
        }
        if (options_.ignore_na && !data.columns.empty()) {
            bool all_null = true;
            for (const auto& entry : data.columns) {
                all_null = all_null && is_null(entry, row);
            }
            if (all_null) {
                mask[row] = true;
                continue;
            }
        }
        // One failure case per cell of a failing row.
        for (const auto& entry : data.columns) {
            if (options_.n_failure_cases.has_value() &&
                result.failure_cases.size() >= *options_.n_failure_cases) {
                break;
            }
            result.failure_cases.push_back(
                FailureCase{.column = entry.name,
                            .index = data.label_at(row),
                            .value = is_null(entry, row) ? Scalar{}
                                                         : scalar_at(*entry.column, row)});
        }
    }
    result.passed = all_passed(mask);
    result.output = std::move(mask);
    return result;
}

auto Check::apply_cells(const Frame& data) const -> CheckResult {
    const auto& element = std::get<ElementPredicate>(fn_);
    const auto rows = data.rows();
    std::vector<bool> mask(rows, true);
    CheckResult result;
    for (std::size_t row = 0; row < rows; ++row) {
        for (const auto& entry : data.columns) {
            auto value = is_null(entry, row) ? Scalar{} : scalar_at(*entry.column, row);
            if (options_.ignore_na && is_null_value(value)) {
                continue;
            }
            if (element(value)) {
                continue;
            }
            mask[row] = false;
            if (!options_.n_failure_cases.has_value() ||
                result.failure_cases.size() < *options_.n_failure_cases) {
                result.failure_cases.push_back(FailureCase{
                    .column = entry.name, .index = data.label_at(row), .value = std::move(value)});
            }
        }
    }
    result.passed = all_passed(mask);
    result.output = std::move(mask);
    return result;
}

}  // namespace tabula
