#include <tabula/schema/array_schema.hpp>

#include <tabula/backend/array_backend.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>
#include <utility>

namespace tabula {

namespace {

auto unwrap_series(ValidationResult<CheckObject> result) -> ValidationResult<Series> {
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return std::get<Series>(std::move(*result));
}

auto unwrap_frame(ValidationResult<CheckObject> result) -> ValidationResult<Frame> {
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return std::get<Frame>(std::move(*result));
}

}  // namespace

ArraySchema::ArraySchema(SchemaKind kind, ArraySchemaConfig config,
                         std::shared_ptr<const backend::ArraySchemaBackend> backend)
    : kind_(kind),
      config_(std::make_shared<const ArraySchemaConfig>(std::move(config))),
      backend_(backend != nullptr ? std::move(backend) : backend::default_array_backend()) {}

auto ArraySchema::run(const CheckObject& data, const ValidationOptions& options) const
    -> ValidationResult<CheckObject> {
    return backend_->validate(data, *this, options);
}

// ─── SeriesSchema ─────────────────────────────────────────────────────────────

SeriesSchema::SeriesSchema(ArraySchemaConfig config,
                           std::shared_ptr<const backend::ArraySchemaBackend> backend)
    : ArraySchema(SchemaKind::Series, std::move(config), std::move(backend)) {}

auto SeriesSchema::validate(const Series& data, const ValidationOptions& options) const
    -> ValidationResult<Series> {
    auto result = unwrap_series(run(CheckObject{std::in_place_type<Series>, data}, options));
    if (result && options.effective_config().validation_enabled) {
        result->schema = std::make_shared<const SeriesSchema>(*this);
    }
    return result;
}

auto SeriesSchema::validate_or_throw(const Series& data, const ValidationOptions& options) const
    -> Series {
    auto result = validate(data, options);
    if (!result) {
        raise(result.error());
    }
    return std::move(*result);
}

// ─── ColumnSchema ─────────────────────────────────────────────────────────────

ColumnSchema::ColumnSchema(ArraySchemaConfig config,
                           std::shared_ptr<const backend::ArraySchemaBackend> backend)
    : ArraySchema(SchemaKind::Column, std::move(config), std::move(backend)) {
    if (!name().has_value()) {
        throw std::invalid_argument("a column schema needs a name");
    }
}

auto ColumnSchema::with_coerce(bool coerce) const -> ColumnSchema {
    auto copy = config();
    copy.coerce = coerce;
    return ColumnSchema{std::move(copy), backend_handle()};
}

auto ColumnSchema::validate(const Frame& data, const ValidationOptions& options) const
    -> ValidationResult<Frame> {
    if (!data.contains(*name())) {
        const auto& config = options.effective_config();
        if (!required() || !config.validation_enabled || !config.schema_level()) {
            return data;
        }
        auto snapshot = std::make_shared<const CheckObject>(std::in_place_type<Frame>, data);
        SchemaError error{ErrorDetail{
            .schema = context(),
            .message = fmt::format("column '{}' not in dataframe. Columns in dataframe: [{}]",
                                   *name(), fmt::join(data.column_names(), ", ")),
            .reason_code = ReasonCode::ColumnNotInDataframe,
            .failure_cases = scalar_failure_case(Scalar{*name()}),
            .check = "column_in_dataframe",
            .check_index = std::nullopt,
            .column = name(),
            .data = snapshot,
        }};
        if (options.lazy) {
            return std::unexpected(ValidationError{std::in_place_type<SchemaErrors>, context(),
                                                   std::vector<SchemaError>{std::move(error)},
                                                   std::move(snapshot)});
        }
        return std::unexpected(ValidationError{std::in_place_type<SchemaError>, std::move(error)});
    }
    return unwrap_frame(run(CheckObject{std::in_place_type<Frame>, data}, options));
}

auto ColumnSchema::validate(const Series& data, const ValidationOptions& options) const
    -> ValidationResult<Series> {
    auto result = unwrap_series(run(CheckObject{std::in_place_type<Series>, data}, options));
    if (result && options.effective_config().validation_enabled) {
        result->schema = std::make_shared<const ColumnSchema>(*this);
    }
    return result;
}

// ─── IndexSchema ──────────────────────────────────────────────────────────────

IndexSchema::IndexSchema(ArraySchemaConfig config,
                         std::shared_ptr<const backend::ArraySchemaBackend> backend)
    : ArraySchema(SchemaKind::Index, std::move(config), std::move(backend)) {}

auto IndexSchema::labels_of(const Frame& data) const -> Series {
    std::vector<std::int64_t> labels;
    labels.reserve(data.rows());
    for (std::size_t row = 0; row < data.rows(); ++row) {
        labels.push_back(data.label_at(row));
    }
    Series out{name(), Column<std::int64_t>{std::move(labels)}};
    out.labels = data.labels;
    return out;
}

auto IndexSchema::validate(const Frame& data, const ValidationOptions& options) const
    -> ValidationResult<Frame> {
    auto result = run(CheckObject{std::in_place_type<Series>, labels_of(data)}, options);
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return data;
}

}  // namespace tabula
