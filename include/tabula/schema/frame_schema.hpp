#pragma once

#include <tabula/schema/array_schema.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

namespace backend {
class FrameSchemaBackend;
}  // namespace backend

/// Treatment of frame columns the schema does not declare.
enum class StrictMode : std::uint8_t {
    Off,     ///< allowed
    On,      ///< column_not_in_schema error
    Filter,  ///< dropped from the validated frame
};

[[nodiscard]] auto to_string(StrictMode mode) -> std::string_view;
/// Accepts "off"/"false", "on"/"true" and "filter".
[[nodiscard]] auto parse_strict_mode(std::string_view text) -> std::optional<StrictMode>;

struct FrameSchemaConfig {
    std::vector<ColumnSchema> columns;
    /// Frame-wide checks, run after every column has been validated.
    std::vector<Check> checks;
    std::optional<IndexSchema> index;
    StrictMode strict = StrictMode::Off;
    /// Declared columns present in the frame must appear in declaration order.
    bool ordered = false;
    /// Coerce every column, whatever its own setting.
    bool coerce = false;
    /// Rows must be unique across the combination of these columns.
    std::vector<std::string> unique;
    ReportDuplicates report_duplicates = ReportDuplicates::All;
    std::optional<std::string> name;
    std::optional<std::string> title;
    std::optional<std::string> description;
};

/// Immutable schema for a whole frame.
class FrameSchema {
   public:
    explicit FrameSchema(FrameSchemaConfig config = {},
                         std::shared_ptr<const backend::FrameSchemaBackend> backend = nullptr);

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnSchema>& {
        return config_->columns;
    }
    [[nodiscard]] auto checks() const noexcept -> const std::vector<Check>& {
        return config_->checks;
    }
    [[nodiscard]] auto index() const noexcept -> const std::optional<IndexSchema>& {
        return config_->index;
    }
    [[nodiscard]] auto strict() const noexcept -> StrictMode { return config_->strict; }
    [[nodiscard]] auto ordered() const noexcept -> bool { return config_->ordered; }
    [[nodiscard]] auto coerce() const noexcept -> bool { return config_->coerce; }
    [[nodiscard]] auto unique() const noexcept -> const std::vector<std::string>& {
        return config_->unique;
    }
    [[nodiscard]] auto report_duplicates() const noexcept -> ReportDuplicates {
        return config_->report_duplicates;
    }
    [[nodiscard]] auto name() const noexcept -> const std::optional<std::string>& {
        return config_->name;
    }
    [[nodiscard]] auto config() const noexcept -> const FrameSchemaConfig& { return *config_; }

    [[nodiscard]] auto context() const -> SchemaContext {
        return SchemaContext{.kind = SchemaKind::Frame, .name = config_->name};
    }

    /// Declared column named `name`, or nullptr.
    [[nodiscard]] auto find_column(std::string_view name) const -> const ColumnSchema*;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// The validated (and possibly coerced) frame, with this schema
    /// attached, or the error(s) found.
    [[nodiscard]] auto validate(const Frame& data, const ValidationOptions& options = {}) const
        -> ValidationResult<Frame>;

    /// Like validate(), but throws SchemaError (eager) or SchemaErrors (lazy).
    [[nodiscard]] auto validate_or_throw(const Frame& data,
                                         const ValidationOptions& options = {}) const -> Frame;

   private:
    std::shared_ptr<const FrameSchemaConfig> config_;
    std::shared_ptr<const backend::FrameSchemaBackend> backend_;
};

}  // namespace tabula
