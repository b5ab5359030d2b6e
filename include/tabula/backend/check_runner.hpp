#pragma once

#include <tabula/check/check.hpp>
#include <tabula/error/error_handler.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace tabula::backend {

/// Run `checks` in declaration order against `data`, collecting into
/// `handler`.
///
/// A failed check is a dataframe_check error (or a logged warning for
/// raise_warning checks). A check that throws SchemaError is collected as
/// dataframe_check; any other exception, and a check that cannot be applied
/// to `data`, becomes a check_error naming the innermost cause. Stops early
/// once an eager handler holds an error.
void run_declared_checks(const CheckObject& data, const std::vector<Check>& checks,
                         const SchemaContext& context, const std::optional<std::string>& column,
                         ErrorHandler& handler);

/// The innermost exception nested in `error`, rendered as `kind("message")`,
/// e.g. `invalid_argument("bad value")`.
[[nodiscard]] auto describe_exception(const std::exception& error) -> std::string;

}  // namespace tabula::backend
