#pragma once

#include <tabula/core/frame.hpp>
#include <tabula/error/failure_cases.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula {

/// Stable classification of a violation, independent of its message.
enum class ReasonCode : std::uint8_t {
    WrongFieldName,
    SeriesContainsNulls,
    SeriesContainsDuplicates,
    WrongDtype,
    CoerceDtype,
    DataframeCheck,
    CheckError,
    ColumnNotInDataframe,
    ColumnNotInSchema,
    ColumnNotOrdered,
    Duplicates,
};

/// Snake-case name, e.g. "series_contains_nulls".
[[nodiscard]] auto to_string(ReasonCode code) -> std::string_view;
[[nodiscard]] auto parse_reason_code(std::string_view text) -> std::optional<ReasonCode>;

enum class SchemaKind : std::uint8_t {
    Series,
    Column,
    Index,
    Frame,
};

[[nodiscard]] auto to_string(SchemaKind kind) -> std::string_view;

/// Identity of the schema an error was raised against.
struct SchemaContext {
    SchemaKind kind = SchemaKind::Series;
    std::optional<std::string> name;

    /// e.g. "Column 'price'" or "DataFrameSchema".
    [[nodiscard]] auto describe() const -> std::string;

    auto operator==(const SchemaContext&) const -> bool = default;
};

struct ErrorDetail {
    SchemaContext schema;
    std::string message;
    ReasonCode reason_code = ReasonCode::DataframeCheck;
    FailureCases failure_cases;
    /// Identifier of the failing check, e.g. "not_nullable" or "greater_than(0)".
    std::string check;
    /// Position of a declared check within its schema.
    std::optional<std::size_t> check_index;
    /// Column the error refers to, when raised inside a frame.
    std::optional<std::string> column;
    /// Snapshot of the data being validated.
    std::shared_ptr<const CheckObject> data;
};

/// A single violation. Immutable once constructed.
class SchemaError : public std::runtime_error {
   public:
    explicit SchemaError(ErrorDetail detail);

    [[nodiscard]] auto schema() const noexcept -> const SchemaContext& { return detail_.schema; }
    [[nodiscard]] auto message() const noexcept -> const std::string& { return detail_.message; }
    [[nodiscard]] auto reason_code() const noexcept -> ReasonCode { return detail_.reason_code; }
    [[nodiscard]] auto failure_cases() const noexcept -> const FailureCases& {
        return detail_.failure_cases;
    }
    [[nodiscard]] auto check() const noexcept -> const std::string& { return detail_.check; }
    [[nodiscard]] auto check_index() const noexcept -> std::optional<std::size_t> {
        return detail_.check_index;
    }
    [[nodiscard]] auto column() const noexcept -> const std::optional<std::string>& {
        return detail_.column;
    }
    [[nodiscard]] auto data() const noexcept -> const std::shared_ptr<const CheckObject>& {
        return detail_.data;
    }
    [[nodiscard]] auto detail() const noexcept -> const ErrorDetail& { return detail_; }

    /// Copy of this error re-classified under `code`.
    [[nodiscard]] auto with_reason_code(ReasonCode code) const -> SchemaError;

   private:
    ErrorDetail detail_;
};

/// One row of the aggregated failure-case table of a SchemaErrors.
struct FailureCaseRecord {
    std::string schema_context;
    std::optional<std::string> column;
    std::string check;
    std::optional<std::size_t> check_number;
    ReasonCode reason_code = ReasonCode::DataframeCheck;
    Scalar failure_case;
    std::optional<std::int64_t> index;
};

/// Ordered aggregate of every violation found by one lazy validation call.
class SchemaErrors : public std::runtime_error {
   public:
    SchemaErrors(SchemaContext schema, std::vector<SchemaError> errors,
                 std::shared_ptr<const CheckObject> data);

    [[nodiscard]] auto schema() const noexcept -> const SchemaContext& { return schema_; }
    [[nodiscard]] auto errors() const noexcept -> const std::vector<SchemaError>& {
        return errors_;
    }
    [[nodiscard]] auto data() const noexcept -> const std::shared_ptr<const CheckObject>& {
        return data_;
    }
    [[nodiscard]] auto error_counts() const noexcept -> const std::map<ReasonCode, std::size_t>& {
        return error_counts_;
    }
    [[nodiscard]] auto failure_cases() const noexcept -> const std::vector<FailureCaseRecord>& {
        return failure_cases_;
    }

    /// Summary: error counts per reason code followed by the failure-case table.
    [[nodiscard]] auto what() const noexcept -> const char* override;

   private:
    SchemaContext schema_;
    std::vector<SchemaError> errors_;
    std::shared_ptr<const CheckObject> data_;
    std::map<ReasonCode, std::size_t> error_counts_;
    std::vector<FailureCaseRecord> failure_cases_;
    std::string message_;
};

/// A failed validation: one error in eager mode, the aggregate in lazy mode.
using ValidationError = std::variant<SchemaError, SchemaErrors>;

template <typename T>
using ValidationResult = std::expected<T, ValidationError>;

/// Every individual error held by `error`, in execution order.
[[nodiscard]] auto errors_of(const ValidationError& error) -> std::span<const SchemaError>;

/// Message of the held error.
[[nodiscard]] auto describe(const ValidationError& error) -> std::string;

/// Throw the held SchemaError or SchemaErrors.
[[noreturn]] void raise(const ValidationError& error);

}  // namespace tabula
