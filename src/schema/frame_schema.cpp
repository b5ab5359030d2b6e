#include <tabula/schema/frame_schema.hpp>

#include <tabula/backend/frame_backend.hpp>

#include <utility>

namespace tabula {

auto to_string(StrictMode mode) -> std::string_view {
    switch (mode) {
        case StrictMode::Off:
            return "off";
        case StrictMode::On:
            return "on";
        case StrictMode::Filter:
            return "filter";
    }
    return "off";
}

auto parse_strict_mode(std::string_view text) -> std::optional<StrictMode> {
    if (text == "off" || text == "false") {
        return StrictMode::Off;
    }
    if (text == "on" || text == "true") {
        return StrictMode::On;
    }
    if (text == "filter") {
        return StrictMode::Filter;
    }
    return std::nullopt;
}

FrameSchema::FrameSchema(FrameSchemaConfig config,
                         std::shared_ptr<const backend::FrameSchemaBackend> backend)
    : config_(std::make_shared<const FrameSchemaConfig>(std::move(config))),
      backend_(backend != nullptr ? std::move(backend) : backend::default_frame_backend()) {}

auto FrameSchema::find_column(std::string_view name) const -> const ColumnSchema* {
    for (const auto& column : config_->columns) {
        if (*column.name() == name) {
            return &column;
        }
    }
    return nullptr;
}

auto FrameSchema::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(config_->columns.size());
    for (const auto& column : config_->columns) {
        names.push_back(*column.name());
    }
    return names;
}

auto FrameSchema::validate(const Frame& data, const ValidationOptions& options) const
    -> ValidationResult<Frame> {
    return backend_->validate(data, *this, options);
}

auto FrameSchema::validate_or_throw(const Frame& data, const ValidationOptions& options) const
    -> Frame {
    auto result = validate(data, options);
    if (!result) {
        raise(result.error());
    }
    return std::move(*result);
}

}  // namespace tabula
