#include <tabula/backend/in_memory.hpp>

#include <tabula/backend/check_runner.hpp>
#include <tabula/engine/dtype.hpp>
#include <tabula/schema/array_schema.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace tabula::backend {

namespace {

auto any_of(const std::vector<bool>& mask) -> bool {
    return std::ranges::any_of(mask, [](bool v) { return v; });
}

auto display_name(const std::optional<std::string>& name) -> std::string {
    return name.value_or("None");
}

}  // namespace

auto InMemoryArrayBackend::coerce_dtype(const CheckObject& data, const ArraySchema& schema) const
    -> std::expected<CheckObject, SchemaError> {
    if (!schema.dtype().has_value() || !schema.coerce()) {
        return data;
    }
    const auto& dtype = *schema.dtype();
    auto field = field_of(data, schema);
    auto coerced = dtype.try_coerce(field);
    if (!coerced) {
        auto& failure = coerced.error();
        return std::unexpected(SchemaError{ErrorDetail{
            .schema = schema.context(),
            .message = fmt::format("Error while coercing '{}' to type {}: {}:\n{}",
                                   display_name(schema.name()), dtype.name(), failure.message,
                                   render_failure_cases(failure.failure_cases)),
            .reason_code = ReasonCode::CoerceDtype,
            .failure_cases = std::move(failure.failure_cases),
            .check = fmt::format("coerce_dtype('{}')", dtype.name()),
            .check_index = std::nullopt,
            .column = std::holds_alternative<Frame>(data) ? schema.name() : std::nullopt,
            .data = std::make_shared<const CheckObject>(data),
        }});
    }
    if (std::holds_alternative<Series>(data)) {
        return CheckObject{std::in_place_type<Series>, std::move(*coerced)};
    }
    auto frame = std::get<Frame>(data);
    frame.set_column(*coerced);
    return CheckObject{std::in_place_type<Frame>, std::move(frame)};
}

auto InMemoryArrayBackend::check_name(const Series& field, const ArraySchema& schema) const
    -> CoreCheckResult {
    const auto& expected = schema.name();
    const bool passed = !expected.has_value() || field.name == expected;
    CoreCheckResult result{
        .check = fmt::format("field_name('{}')", display_name(expected)),
        .reason_code = ReasonCode::WrongFieldName,
        .passed = passed,
        .message = fmt::format("Expected series to have name '{}', found '{}'",
                               display_name(expected), display_name(field.name)),
        .failure_cases = {},
    };
    if (!passed) {
        result.failure_cases =
            scalar_failure_case(field.name.has_value() ? Scalar{*field.name} : Scalar{});
    }
    return result;
}

auto InMemoryArrayBackend::check_nullable(const Series& field, const ArraySchema& schema) const
    -> CoreCheckResult {
    CoreCheckResult result{.check = "not_nullable",
                           .reason_code = ReasonCode::SeriesContainsNulls,
                           .passed = true,
                           .message = std::nullopt,
                           .failure_cases = {}};
    if (schema.nullable()) {
        return result;
    }
    auto nulls = field.null_mask();
    if (!any_of(nulls)) {
        return result;
    }
    result.passed = false;
    result.failure_cases = failure_cases_where(field, nulls);
    result.message = fmt::format("non-nullable series '{}' contains null values:\n{}",
                                 display_name(field.name),
                                 render_failure_cases(result.failure_cases));
    return result;
}

auto InMemoryArrayBackend::check_unique(const Series& field, const ArraySchema& schema) const
    -> CoreCheckResult {
    CoreCheckResult result{.check = "field_uniqueness",
                           .reason_code = ReasonCode::SeriesContainsDuplicates,
                           .passed = true,
                           .message = std::nullopt,
                           .failure_cases = {}};
    if (!schema.unique()) {
        return result;
    }
    auto duplicates = duplicated(field, schema.report_duplicates());
    if (!any_of(duplicates)) {
        return result;
    }
    result.passed = false;
    result.failure_cases = failure_cases_where(field, duplicates);
    result.message = fmt::format("series '{}' contains duplicate values:\n{}",
                                 display_name(field.name),
                                 render_failure_cases(result.failure_cases));
    return result;
}

auto InMemoryArrayBackend::check_dtype(const Series& field, const ArraySchema& schema) const
    -> CoreCheckResult {
    CoreCheckResult result{.check = "dtype('None')",
                           .reason_code = ReasonCode::WrongDtype,
                           .passed = true,
                           .message = std::nullopt,
                           .failure_cases = {}};
    if (!schema.dtype().has_value()) {
        return result;
    }
    const auto& expected = *schema.dtype();
    const auto actual = engine::dtype(*field.column);
    result.check = fmt::format("dtype('{}')", expected.name());

    auto output = expected.check(actual, field);
    if (const auto* verdict = std::get_if<bool>(&output)) {
        result.passed = *verdict;
        if (!result.passed) {
            result.failure_cases = scalar_failure_case(Scalar{std::string{actual.name()}});
            result.message = fmt::format("expected series '{}' to have type {}, got {}",
                                         display_name(field.name), expected.name(), actual.name());
        }
        return result;
    }
    const auto& mask = std::get<std::vector<bool>>(output);
    std::vector<bool> mismatched;
    mismatched.reserve(mask.size());
    for (bool conforms : mask) {
        mismatched.push_back(!conforms);
    }
    if (!any_of(mismatched)) {
        return result;
    }
    result.passed = false;
    result.failure_cases = failure_cases_where(field, mismatched);
    result.message = fmt::format("expected series '{}' to have type {}:\nfailure cases:\n{}",
                                 display_name(field.name), expected.name(),
                                 render_failure_cases(result.failure_cases));
    return result;
}

void InMemoryArrayBackend::run_checks(const CheckObject& data, const ArraySchema& schema,
                                      ErrorHandler& handler) const {
    const auto column =
        std::holds_alternative<Frame>(data) ? schema.name() : std::optional<std::string>{};
    run_declared_checks(data, schema.checks(), schema.context(), column, handler);
}

auto default_array_backend() -> std::shared_ptr<const ArraySchemaBackend> {
    static const auto backend = std::make_shared<const InMemoryArrayBackend>();
    return backend;
}

}  // namespace tabula::backend
