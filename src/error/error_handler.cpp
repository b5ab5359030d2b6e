#include <tabula/error/error_handler.hpp>

#include <spdlog/spdlog.h>

namespace tabula {

void ErrorHandler::collect_error(ReasonCode code, const SchemaError& error) {
    if (error.reason_code() == code) {
        collect_error(error);
        return;
    }
    collect_error(error.with_reason_code(code));
}

void ErrorHandler::collect_error(const SchemaError& error) {
    if (should_stop()) {
        return;
    }
    spdlog::debug("{}: collected {} error: {}", error.schema().describe(),
                  to_string(error.reason_code()), error.message());
    errors_.push_back(error);
}

void ErrorHandler::collect_errors(const ValidationError& error) {
    for (const auto& e : errors_of(error)) {
        collect_error(e);
    }
}

auto ErrorHandler::finish(const SchemaContext& schema,
                          std::shared_ptr<const CheckObject> data) const
    -> std::optional<ValidationError> {
    if (errors_.empty()) {
        return std::nullopt;
    }
    if (!lazy_) {
        return ValidationError{std::in_place_type<SchemaError>, errors_.front()};
    }
    return ValidationError{std::in_place_type<SchemaErrors>, schema, errors_, std::move(data)};
}

}  // namespace tabula
