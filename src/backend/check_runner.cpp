#include <tabula/backend/check_runner.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tabula::backend {

namespace {

auto failure_summary(const FailureCases& cases) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < cases.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += format_scalar(cases[i].value);
    }
    return out;
}

auto failure_message(const SchemaContext& context, const Check& check, std::size_t index,
                     const FailureCases& cases) -> std::string {
    const auto& shown = check.options().error.has_value() ? *check.options().error : check.name();
    const auto* kind = check.scope() == CheckScope::Element ? "element-wise validator"
                                                            : "series or dataframe validator";
    return fmt::format("{} failed {} number {}: {} failure cases: {}", context.describe(), kind,
                       index, shown, failure_summary(cases));
}

auto apply(const Check& check, const CheckObject& data, const std::optional<std::string>& column)
    -> std::expected<CheckResult, std::string> {
    if (const auto* series = std::get_if<Series>(&data)) {
        return check(*series);
    }
    return check(std::get<Frame>(data), column);
}

// Most derived standard exception type first.
auto exception_kind(const std::exception& error) -> std::string_view {
    if (dynamic_cast<const std::invalid_argument*>(&error) != nullptr) {
        return "invalid_argument";
    }
    if (dynamic_cast<const std::domain_error*>(&error) != nullptr) {
        return "domain_error";
    }
    if (dynamic_cast<const std::length_error*>(&error) != nullptr) {
        return "length_error";
    }
    if (dynamic_cast<const std::out_of_range*>(&error) != nullptr) {
        return "out_of_range";
    }
    if (dynamic_cast<const std::logic_error*>(&error) != nullptr) {
        return "logic_error";
    }
    if (dynamic_cast<const std::range_error*>(&error) != nullptr) {
        return "range_error";
    }
    if (dynamic_cast<const std::overflow_error*>(&error) != nullptr) {
        return "overflow_error";
    }
    if (dynamic_cast<const std::underflow_error*>(&error) != nullptr) {
        return "underflow_error";
    }
    if (dynamic_cast<const std::runtime_error*>(&error) != nullptr) {
        return "runtime_error";
    }
    if (dynamic_cast<const std::bad_alloc*>(&error) != nullptr) {
        return "bad_alloc";
    }
    return "exception";
}

}  // namespace

auto describe_exception(const std::exception& error) -> std::string {
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& nested) {
        return describe_exception(nested);
    }
    return fmt::format("{}(\"{}\")", exception_kind(error), error.what());
}

void run_declared_checks(const CheckObject& data, const std::vector<Check>& checks,
                         const SchemaContext& context, const std::optional<std::string>& column,
                         ErrorHandler& handler) {
    if (checks.empty()) {
        return;
    }
    auto snapshot = std::make_shared<const CheckObject>(data);
    auto check_error = [&](const Check& check, std::size_t index, const std::string& cause) {
        handler.collect_error(
            ReasonCode::CheckError,
            SchemaError{ErrorDetail{
                .schema = context,
                .message = fmt::format("Error while executing check function: {}", cause),
                .reason_code = ReasonCode::CheckError,
                .failure_cases = scalar_failure_case(Scalar{cause}),
                .check = check.name(),
                .check_index = index,
                .column = column,
                .data = snapshot,
            }});
    };

    for (std::size_t index = 0; index < checks.size(); ++index) {
        if (handler.should_stop()) {
            return;
        }
        const auto& check = checks[index];
        try {
            auto result = apply(check, data, column);
            if (!result) {
                check_error(check, index, result.error());
                continue;
            }
            if (result->passed) {
                continue;
            }
            auto message = failure_message(context, check, index, result->failure_cases);
            if (check.options().raise_warning) {
                spdlog::warn("{}", message);
                continue;
            }
            handler.collect_error(ReasonCode::DataframeCheck,
                                  SchemaError{ErrorDetail{
                                      .schema = context,
                                      .message = std::move(message),
                                      .reason_code = ReasonCode::DataframeCheck,
                                      .failure_cases = std::move(result->failure_cases),
                                      .check = check.name(),
                                      .check_index = index,
                                      .column = column,
                                      .data = snapshot,
                                  }});
        } catch (const SchemaError& error) {
            handler.collect_error(ReasonCode::DataframeCheck, error);
        } catch (const std::exception& error) {
            check_error(check, index, describe_exception(error));
        } catch (...) {
            check_error(check, index, "unknown exception");
        }
    }
}

}  // namespace tabula::backend
