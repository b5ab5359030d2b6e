#pragma once

#include <tabula/core/config.hpp>
#include <tabula/core/frame.hpp>
#include <tabula/error/error_handler.hpp>
#include <tabula/error/errors.hpp>

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabula {
class ArraySchema;
}  // namespace tabula

namespace tabula::backend {

/// Result of one structural check. Produced fresh per check.
struct CoreCheckResult {
    /// Identifier of the check, e.g. "not_nullable" or "dtype('int64')".
    std::string check;
    ReasonCode reason_code = ReasonCode::DataframeCheck;
    bool passed = true;
    std::optional<std::string> message;
    FailureCases failure_cases;
};

/// Capability interface of a field validation backend.
///
/// validate() is the fixed pipeline: preprocess, coerce, subsample, the
/// structural checks (name, nullable, unique, dtype) and then the declared
/// checks. Backends supply the steps.
class ArraySchemaBackend {
   public:
    virtual ~ArraySchemaBackend() = default;

    /// Validate `data` against `schema`. A Series is validated directly; a
    /// Frame through the column named by the schema, which must be present.
    [[nodiscard]] auto validate(const CheckObject& data, const ArraySchema& schema,
                                const ValidationOptions& options) const
        -> ValidationResult<CheckObject>;

    /// Copy of `data` sharing no storage with it, unless `inplace`.
    [[nodiscard]] virtual auto preprocess(const CheckObject& data, bool inplace) const
        -> CheckObject;

    /// `data` with the schema's field converted to the schema dtype.
    [[nodiscard]] virtual auto coerce_dtype(const CheckObject& data,
                                            const ArraySchema& schema) const
        -> std::expected<CheckObject, SchemaError> = 0;

    [[nodiscard]] virtual auto check_name(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult = 0;
    [[nodiscard]] virtual auto check_nullable(const Series& field,
                                              const ArraySchema& schema) const
        -> CoreCheckResult = 0;
    [[nodiscard]] virtual auto check_unique(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult = 0;
    [[nodiscard]] virtual auto check_dtype(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult = 0;

    /// Run the declared checks in order, feeding every failure to `handler`.
    virtual void run_checks(const CheckObject& data, const ArraySchema& schema,
                            ErrorHandler& handler) const = 0;

    /// Rows selected by the head/tail/sample options, or `data` unchanged
    /// when none is set.
    [[nodiscard]] virtual auto subsample(const CheckObject& data,
                                         const ValidationOptions& options) const
        -> CheckObject;
};

/// Positions selected by head, tail and a seeded random sample, unioned in
/// that order without repeats. nullopt when no option is set.
[[nodiscard]] auto sample_positions(std::size_t rows, const ValidationOptions& options)
    -> std::optional<std::vector<std::size_t>>;

/// The field a schema validates within `data`: the series itself, or the
/// frame column named by the schema. Throws std::out_of_range if absent.
[[nodiscard]] auto field_of(const CheckObject& data, const ArraySchema& schema) -> Series;

/// The process-wide in-memory backend.
[[nodiscard]] auto default_array_backend() -> std::shared_ptr<const ArraySchemaBackend>;

}  // namespace tabula::backend
