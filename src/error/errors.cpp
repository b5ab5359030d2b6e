#include <tabula/error/errors.hpp>

#include <tabula/core/print.hpp>

#include <fmt/format.h>

#include <array>
#include <utility>

namespace tabula {

namespace {

constexpr std::array<std::pair<ReasonCode, std::string_view>, 11> kReasonNames{{
    {ReasonCode::WrongFieldName, "wrong_field_name"},
    {ReasonCode::SeriesContainsNulls, "series_contains_nulls"},
    {ReasonCode::SeriesContainsDuplicates, "series_contains_duplicates"},
    {ReasonCode::WrongDtype, "wrong_dtype"},
    {ReasonCode::CoerceDtype, "coerce_dtype"},
    {ReasonCode::DataframeCheck, "dataframe_check"},
    {ReasonCode::CheckError, "check_error"},
    {ReasonCode::ColumnNotInDataframe, "column_not_in_dataframe"},
    {ReasonCode::ColumnNotInSchema, "column_not_in_schema"},
    {ReasonCode::ColumnNotOrdered, "column_not_ordered"},
    {ReasonCode::Duplicates, "duplicates"},
}};

auto summarize(const SchemaContext& schema, const std::vector<SchemaError>& errors,
               const std::map<ReasonCode, std::size_t>& counts,
               const std::vector<FailureCaseRecord>& records) -> std::string {
    std::string out = fmt::format("{}: a total of {} schema error{} were found.\n\n",
                                  schema.describe(), errors.size(), errors.size() == 1 ? "" : "s");
    out += "Error Counts\n------------\n";
    for (const auto& [code, count] : counts) {
        out += fmt::format("- {}: {}\n", to_string(code), count);
    }
    out += "\nSchema Error Summary\n--------------------\n";
    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        rows.push_back({
            record.schema_context,
            record.column.value_or("-"),
            record.check,
            record.check_number.has_value() ? fmt::format("{}", *record.check_number)
                                            : std::string{"-"},
            format_scalar(record.failure_case),
            record.index.has_value() ? fmt::format("{}", *record.index) : std::string{"-"},
        });
    }
    out += format_table(
        {"schema_context", "column", "check", "check_number", "failure_case", "index"}, rows);
    return out;
}

}  // namespace

auto to_string(ReasonCode code) -> std::string_view {
    for (const auto& [value, name] : kReasonNames) {
        if (value == code) {
            return name;
        }
    }
    return "unknown";
}

auto parse_reason_code(std::string_view text) -> std::optional<ReasonCode> {
    for (const auto& [value, name] : kReasonNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

auto to_string(SchemaKind kind) -> std::string_view {
    switch (kind) {
        case SchemaKind::Series:
            return "SeriesSchema";
        case SchemaKind::Column:
            return "Column";
        case SchemaKind::Index:
            return "Index";
        case SchemaKind::Frame:
            return "DataFrameSchema";
    }
    return "Schema";
}

auto SchemaContext::describe() const -> std::string {
    if (name.has_value()) {
        return fmt::format("{} '{}'", to_string(kind), *name);
    }
    return std::string(to_string(kind));
}

// ─── SchemaError ──────────────────────────────────────────────────────────────

SchemaError::SchemaError(ErrorDetail detail)
    : std::runtime_error(detail.message), detail_(std::move(detail)) {}

auto SchemaError::with_reason_code(ReasonCode code) const -> SchemaError {
    ErrorDetail detail = detail_;
    detail.reason_code = code;
    return SchemaError{std::move(detail)};
}

// ─── SchemaErrors ─────────────────────────────────────────────────────────────

SchemaErrors::SchemaErrors(SchemaContext schema, std::vector<SchemaError> errors,
                           std::shared_ptr<const CheckObject> data)
    : std::runtime_error("schema errors"),
      schema_(std::move(schema)),
      errors_(std::move(errors)),
      data_(std::move(data)) {
    for (const auto& error : errors_) {
        ++error_counts_[error.reason_code()];
        auto context = error.schema().describe();
        for (const auto& fc : error.failure_cases()) {
            failure_cases_.push_back(FailureCaseRecord{
                .schema_context = context,
                .column = fc.column.has_value() ? fc.column : error.column(),
                .check = error.check(),
                .check_number = error.check_index(),
                .reason_code = error.reason_code(),
                .failure_case = fc.value,
                .index = fc.index,
            });
        }
    }
    message_ = summarize(schema_, errors_, error_counts_, failure_cases_);
}

auto SchemaErrors::what() const noexcept -> const char* {
    return message_.c_str();
}

// ─── ValidationError helpers ──────────────────────────────────────────────────

auto errors_of(const ValidationError& error) -> std::span<const SchemaError> {
    if (const auto* single = std::get_if<SchemaError>(&error)) {
        return {single, 1};
    }
    return std::get<SchemaErrors>(error).errors();
}

auto describe(const ValidationError& error) -> std::string {
    return std::visit([](const auto& e) -> std::string { return e.what(); }, error);
}

void raise(const ValidationError& error) {
    std::visit([](const auto& e) { throw e; }, error);
    std::unreachable();
}

}  // namespace tabula
