#include <tabula/backend/array_backend.hpp>

#include <tabula/schema/array_schema.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

namespace tabula::backend {

auto ArraySchemaBackend::validate(const CheckObject& data, const ArraySchema& schema,
                                  const ValidationOptions& options) const
    -> ValidationResult<CheckObject> {
    const auto& config = options.effective_config();
    const auto context = schema.context();
    if (!config.validation_enabled) {
        spdlog::debug("{}: validation disabled", context.describe());
        return data;
    }
    spdlog::debug("{}: validating {} rows (lazy={}, depth={})", context.describe(),
                  rows_of(data), options.lazy, to_string(config.validation_depth));

    ErrorHandler handler{options.lazy};
    auto check_obj = preprocess(data, options.inplace);

    if (schema.coerce() && config.schema_level()) {
        auto coerced = coerce_dtype(check_obj, schema);
        if (coerced) {
            check_obj = std::move(*coerced);
        } else {
            handler.collect_error(coerced.error().reason_code(), coerced.error());
        }
    }

    auto snapshot = std::make_shared<const CheckObject>(check_obj);
    const auto column =
        std::holds_alternative<Frame>(check_obj) ? schema.name() : std::optional<std::string>{};

    if (!handler.should_stop()) {
        auto check_obj_subsample = subsample(check_obj, options);
        auto field = field_of(check_obj_subsample, schema);

        using CoreCheck = CoreCheckResult (ArraySchemaBackend::*)(const Series&,
                                                                  const ArraySchema&) const;
        struct CoreStep {
            CoreCheck run;
            bool enabled;
        };
        const std::array<CoreStep, 4> core_checks{{
            {&ArraySchemaBackend::check_name, config.schema_level()},
            {&ArraySchemaBackend::check_nullable, config.data_level()},
            {&ArraySchemaBackend::check_unique, config.data_level()},
            {&ArraySchemaBackend::check_dtype, config.schema_level()},
        }};
        for (const auto& step : core_checks) {
            if (!step.enabled || handler.should_stop()) {
                continue;
            }
            auto result = (this->*step.run)(field, schema);
            if (result.passed) {
                continue;
            }
            handler.collect_error(result.reason_code,
                                  SchemaError{ErrorDetail{
                                      .schema = context,
                                      .message = result.message.value_or(result.check),
                                      .reason_code = result.reason_code,
                                      .failure_cases = std::move(result.failure_cases),
                                      .check = result.check,
                                      .check_index = std::nullopt,
                                      .column = column,
                                      .data = snapshot,
                                  }});
        }

        if (config.data_level() && !handler.should_stop()) {
            run_checks(check_obj_subsample, schema, handler);
        }
    }

    if (auto error = handler.finish(context, snapshot)) {
        return std::unexpected(std::move(*error));
    }
    return check_obj;
}

auto ArraySchemaBackend::preprocess(const CheckObject& data, bool inplace) const -> CheckObject {
    return inplace ? data : deep_copy(data);
}

auto ArraySchemaBackend::subsample(const CheckObject& data,
                                   const ValidationOptions& options) const -> CheckObject {
    auto positions = sample_positions(rows_of(data), options);
    if (!positions.has_value()) {
        return data;
    }
    return take_rows(data, *positions);
}

auto sample_positions(std::size_t rows, const ValidationOptions& options)
    -> std::optional<std::vector<std::size_t>> {
    if (!options.head.has_value() && !options.tail.has_value() && !options.sample.has_value()) {
        return std::nullopt;
    }
    std::vector<std::size_t> out;
    std::vector<bool> seen(rows, false);
    auto add = [&](std::size_t pos) {
        if (!seen[pos]) {
            seen[pos] = true;
            out.push_back(pos);
        }
    };
    if (options.head.has_value()) {
        for (std::size_t pos = 0; pos < std::min(*options.head, rows); ++pos) {
            add(pos);
        }
    }
    if (options.tail.has_value()) {
        for (std::size_t pos = rows - std::min(*options.tail, rows); pos < rows; ++pos) {
            add(pos);
        }
    }
    if (options.sample.has_value()) {
        std::mt19937_64 engine{options.random_state.has_value()
                                   ? *options.random_state
                                   : static_cast<std::uint64_t>(std::random_device{}())};
        std::vector<std::size_t> population(rows);
        std::iota(population.begin(), population.end(), std::size_t{0});
        std::vector<std::size_t> picked;
        picked.reserve(std::min(*options.sample, rows));
        std::sample(population.begin(), population.end(), std::back_inserter(picked),
                    std::min(*options.sample, rows), engine);
        for (auto pos : picked) {
            add(pos);
        }
    }
    return out;
}

auto field_of(const CheckObject& data, const ArraySchema& schema) -> Series {
    if (const auto* series = std::get_if<Series>(&data)) {
        return *series;
    }
    const auto& frame = std::get<Frame>(data);
    const auto& name = schema.name();
    auto column = name.has_value() ? frame.series(*name) : std::nullopt;
    if (!column.has_value()) {
        throw std::out_of_range("column not found: " + name.value_or("<unnamed>"));
    }
    return std::move(*column);
}

}  // namespace tabula::backend
