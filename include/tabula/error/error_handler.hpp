#pragma once

#include <tabula/error/errors.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tabula {

/// Accumulates the errors of one validation call.
///
/// Eager handlers keep only the first error; callers stop running checks
/// once should_stop() is true. Lazy handlers keep every error in the order
/// it was collected.
class ErrorHandler {
   public:
    explicit ErrorHandler(bool lazy) noexcept : lazy_(lazy) {}

    [[nodiscard]] auto lazy() const noexcept -> bool { return lazy_; }

    /// Collect `error` re-classified under `code`.
    void collect_error(ReasonCode code, const SchemaError& error);
    void collect_error(const SchemaError& error);
    /// Collect every error held by a nested validation result.
    void collect_errors(const ValidationError& error);

    /// True once an eager handler holds an error.
    [[nodiscard]] auto should_stop() const noexcept -> bool { return !lazy_ && !errors_.empty(); }

    [[nodiscard]] auto collected_errors() const noexcept -> const std::vector<SchemaError>& {
        return errors_;
    }

    /// nullopt when nothing was collected; otherwise the first error (eager)
    /// or the aggregate of all errors against `schema` (lazy).
    [[nodiscard]] auto finish(const SchemaContext& schema,
                              std::shared_ptr<const CheckObject> data) const
        -> std::optional<ValidationError>;

   private:
    bool lazy_;
    std::vector<SchemaError> errors_;
};

}  // namespace tabula
