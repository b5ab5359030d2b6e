#include <tabula/backend/frame_backend.hpp>

#include <tabula/backend/array_backend.hpp>
#include <tabula/backend/check_runner.hpp>
#include <tabula/schema/frame_schema.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace tabula::backend {

namespace {

struct FrameFailure {
    ReasonCode reason_code;
    std::string check;
    std::string message;
    FailureCases failure_cases;
    std::optional<std::string> column;
};

auto make_error(const SchemaContext& context, const Frame& data, FrameFailure failure)
    -> SchemaError {
    return SchemaError{ErrorDetail{
        .schema = context,
        .message = std::move(failure.message),
        .reason_code = failure.reason_code,
        .failure_cases = std::move(failure.failure_cases),
        .check = std::move(failure.check),
        .check_index = std::nullopt,
        .column = std::move(failure.column),
        .data = std::make_shared<const CheckObject>(std::in_place_type<Frame>, data),
    }};
}

auto column_options(const ValidationOptions& options) -> ValidationOptions {
    return ValidationOptions{
        .lazy = options.lazy, .inplace = true, .config = options.effective_config()};
}

}  // namespace

auto FrameSchemaBackend::validate(const Frame& data, const FrameSchema& schema,
                                  const ValidationOptions& options) const
    -> ValidationResult<Frame> {
    const auto& config = options.effective_config();
    const auto context = schema.context();
    if (!config.validation_enabled) {
        spdlog::debug("{}: validation disabled", context.describe());
        return data;
    }
    spdlog::debug("{}: validating {} rows x {} columns (lazy={}, depth={})", context.describe(),
                  data.rows(), data.columns.size(), options.lazy,
                  to_string(config.validation_depth));

    ErrorHandler handler{options.lazy};
    Frame frame = options.inplace ? data : data.copy();

    if (config.schema_level()) {
        check_column_presence(frame, schema, handler);
        if (!handler.should_stop()) {
            check_strict(frame, schema, handler);
        }
        if (!handler.should_stop()) {
            check_column_order(frame, schema, handler);
        }
        if (!handler.should_stop()) {
            coerce_columns(frame, schema, handler);
        }
    }

    if (!handler.should_stop()) {
        auto positions = sample_positions(frame.rows(), options);
        const Frame sample = positions.has_value() ? frame.take(*positions) : frame;
        run_column_schemas(sample, schema, options, handler);
        if (!handler.should_stop()) {
            run_index_schema(sample, schema, options, handler);
        }
        if (config.data_level() && !handler.should_stop()) {
            check_unique_subset(sample, schema, handler);
        }
        if (config.data_level() && !handler.should_stop()) {
            run_checks(sample, schema, handler);
        }
    }

    if (auto error = handler.finish(
            context, std::make_shared<const CheckObject>(std::in_place_type<Frame>, frame))) {
        return std::unexpected(std::move(*error));
    }
    frame.schema = std::make_shared<const FrameSchema>(schema);
    return frame;
}

void FrameSchemaBackend::check_column_presence(const Frame& data, const FrameSchema& schema,
                                               ErrorHandler& handler) const {
    for (const auto& column : schema.columns()) {
        const auto& name = *column.name();
        if (!column.required() || data.contains(name)) {
            continue;
        }
        handler.collect_error(make_error(
            schema.context(), data,
            FrameFailure{
                .reason_code = ReasonCode::ColumnNotInDataframe,
                .check = "column_in_dataframe",
                .message = fmt::format("column '{}' not in dataframe. Columns in dataframe: [{}]",
                                       name, fmt::join(data.column_names(), ", ")),
                .failure_cases = scalar_failure_case(Scalar{name}),
                .column = name,
            }));
        if (handler.should_stop()) {
            return;
        }
    }
}

void FrameSchemaBackend::check_strict(Frame& data, const FrameSchema& schema,
                                      ErrorHandler& handler) const {
    if (schema.strict() == StrictMode::Off) {
        return;
    }
    for (const auto& name : data.column_names()) {
        if (schema.find_column(name) != nullptr) {
            continue;
        }
        if (schema.strict() == StrictMode::Filter) {
            spdlog::debug("{}: dropping undeclared column '{}'", schema.context().describe(),
                          name);
            data.drop_column(name);
            continue;
        }
        handler.collect_error(make_error(
            schema.context(), data,
            FrameFailure{
                .reason_code = ReasonCode::ColumnNotInSchema,
                .check = "column_in_schema",
                .message = fmt::format("column '{}' not in {} {}", name,
                                       schema.context().describe(), schema.column_names()),
                .failure_cases = scalar_failure_case(Scalar{name}),
                .column = name,
            }));
        if (handler.should_stop()) {
            return;
        }
    }
}

void FrameSchemaBackend::check_column_order(const Frame& data, const FrameSchema& schema,
                                            ErrorHandler& handler) const {
    if (!schema.ordered()) {
        return;
    }
    const auto declared = schema.column_names();
    std::optional<std::size_t> last;
    for (const auto& name : data.column_names()) {
        auto it = std::ranges::find(declared, name);
        if (it == declared.end()) {
            continue;
        }
        auto position = static_cast<std::size_t>(it - declared.begin());
        if (last.has_value() && position < *last) {
            handler.collect_error(make_error(
                schema.context(), data,
                FrameFailure{
                    .reason_code = ReasonCode::ColumnNotOrdered,
                    .check = "column_ordered",
                    .message = fmt::format("column '{}' out-of-order", name),
                    .failure_cases = scalar_failure_case(Scalar{name}),
                    .column = name,
                }));
            if (handler.should_stop()) {
                return;
            }
            continue;
        }
        last = position;
    }
}

void FrameSchemaBackend::coerce_columns(Frame& data, const FrameSchema& schema,
                                        ErrorHandler& handler) const {
    for (const auto& column : schema.columns()) {
        const auto& name = *column.name();
        if (!(column.coerce() || schema.coerce()) || !column.dtype().has_value()) {
            continue;
        }
        auto series = data.series(name);
        if (!series.has_value()) {
            continue;
        }
        const auto& dtype = *column.dtype();
        auto coerced = dtype.try_coerce(*series);
        if (coerced) {
            data.set_column(*coerced);
            continue;
        }
        auto& failure = coerced.error();
        handler.collect_error(make_error(
            column.context(), data,
            FrameFailure{
                .reason_code = ReasonCode::CoerceDtype,
                .check = fmt::format("coerce_dtype('{}')", dtype.name()),
                .message = fmt::format("Error while coercing '{}' to type {}: {}:\n{}", name,
                                       dtype.name(), failure.message,
                                       render_failure_cases(failure.failure_cases)),
                .failure_cases = std::move(failure.failure_cases),
                .column = name,
            }));
        if (handler.should_stop()) {
            return;
        }
    }
}

void FrameSchemaBackend::run_column_schemas(const Frame& sample, const FrameSchema& schema,
                                            const ValidationOptions& options,
                                            ErrorHandler& handler) const {
    const auto nested = column_options(options);
    for (const auto& column : schema.columns()) {
        if (!sample.contains(*column.name())) {
            continue;
        }
        // Columns were already coerced on the full frame.
        auto result = column.with_coerce(false).validate(sample, nested);
        if (!result) {
            handler.collect_errors(result.error());
        }
        if (handler.should_stop()) {
            return;
        }
    }
}

void FrameSchemaBackend::run_index_schema(const Frame& sample, const FrameSchema& schema,
                                          const ValidationOptions& options,
                                          ErrorHandler& handler) const {
    if (!schema.index().has_value()) {
        return;
    }
    auto result = schema.index()->validate(sample, column_options(options));
    if (!result) {
        handler.collect_errors(result.error());
    }
}

void FrameSchemaBackend::check_unique_subset(const Frame& sample, const FrameSchema& schema,
                                             ErrorHandler& handler) const {
    const auto& subset = schema.unique();
    if (subset.empty()) {
        return;
    }
    for (const auto& name : subset) {
        if (!sample.contains(name)) {
            spdlog::debug("{}: skipping uniqueness over missing column '{}'",
                          schema.context().describe(), name);
            return;
        }
    }
    auto duplicates = duplicated(sample, subset, schema.report_duplicates());
    FailureCases cases;
    for (std::size_t row = 0; row < duplicates.size(); ++row) {
        if (!duplicates[row]) {
            continue;
        }
        for (const auto& name : subset) {
            const auto* entry = sample.find_entry(name);
            cases.push_back(FailureCase{
                .column = name,
                .index = sample.label_at(row),
                .value = is_null(*entry, row) ? Scalar{} : scalar_at(*entry->column, row),
            });
        }
    }
    if (cases.empty()) {
        return;
    }
    auto message = fmt::format("columns '({})' not unique:\n{}", fmt::join(subset, ", "),
                               render_failure_cases(cases));
    handler.collect_error(make_error(schema.context(), sample,
                                     FrameFailure{
                                         .reason_code = ReasonCode::Duplicates,
                                         .check = "multiple_fields_uniqueness",
                                         .message = std::move(message),
                                         .failure_cases = std::move(cases),
                                         .column = std::nullopt,
                                     }));
}

void FrameSchemaBackend::run_checks(const Frame& sample, const FrameSchema& schema,
                                    ErrorHandler& handler) const {
    run_declared_checks(CheckObject{std::in_place_type<Frame>, sample}, schema.checks(),
                        schema.context(), std::nullopt, handler);
}

auto default_frame_backend() -> std::shared_ptr<const FrameSchemaBackend> {
    static const auto backend = std::make_shared<const FrameSchemaBackend>();
    return backend;
}

}  // namespace tabula::backend
