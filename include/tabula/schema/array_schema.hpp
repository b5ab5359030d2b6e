#pragma once

#include <tabula/check/check.hpp>
#include <tabula/core/config.hpp>
#include <tabula/core/frame.hpp>
#include <tabula/engine/dtype.hpp>
#include <tabula/error/errors.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabula {

namespace backend {
class ArraySchemaBackend;
}  // namespace backend

/// Declarative description of a single field.
struct ArraySchemaConfig {
    std::optional<std::string> name;
    /// Expected dtype; unset accepts any dtype.
    std::optional<engine::DataType> dtype;
    /// Declared checks, run in this order after the structural ones.
    std::vector<Check> checks;
    bool nullable = false;
    bool unique = false;
    ReportDuplicates report_duplicates = ReportDuplicates::All;
    /// Convert the data to `dtype` before checking it.
    bool coerce = false;
    /// Columns only: a frame without this column is an error.
    bool required = true;
    std::optional<std::string> title;
    std::optional<std::string> description;
};

/// Immutable field schema shared by series, column and index schemas.
///
/// Copies share their configuration. A schema may be validated against from
/// any number of threads at once.
class ArraySchema {
   public:
    virtual ~ArraySchema() = default;

    [[nodiscard]] auto kind() const noexcept -> SchemaKind { return kind_; }
    [[nodiscard]] auto name() const noexcept -> const std::optional<std::string>& {
        return config_->name;
    }
    [[nodiscard]] auto dtype() const noexcept -> const std::optional<engine::DataType>& {
        return config_->dtype;
    }
    [[nodiscard]] auto checks() const noexcept -> const std::vector<Check>& {
        return config_->checks;
    }
    [[nodiscard]] auto nullable() const noexcept -> bool { return config_->nullable; }
    [[nodiscard]] auto unique() const noexcept -> bool { return config_->unique; }
    [[nodiscard]] auto report_duplicates() const noexcept -> ReportDuplicates {
        return config_->report_duplicates;
    }
    [[nodiscard]] auto coerce() const noexcept -> bool { return config_->coerce; }
    [[nodiscard]] auto title() const noexcept -> const std::optional<std::string>& {
        return config_->title;
    }
    [[nodiscard]] auto description() const noexcept -> const std::optional<std::string>& {
        return config_->description;
    }
    [[nodiscard]] auto config() const noexcept -> const ArraySchemaConfig& { return *config_; }
    [[nodiscard]] auto backend() const noexcept -> const backend::ArraySchemaBackend& {
        return *backend_;
    }

    /// Identity used in error reports, e.g. "Column 'price'".
    [[nodiscard]] auto context() const -> SchemaContext {
        return SchemaContext{.kind = kind_, .name = config_->name};
    }

   protected:
    ArraySchema(SchemaKind kind, ArraySchemaConfig config,
                std::shared_ptr<const backend::ArraySchemaBackend> backend);

    [[nodiscard]] auto run(const CheckObject& data, const ValidationOptions& options) const
        -> ValidationResult<CheckObject>;

    [[nodiscard]] auto backend_handle() const noexcept
        -> const std::shared_ptr<const backend::ArraySchemaBackend>& {
        return backend_;
    }

   private:
    SchemaKind kind_;
    std::shared_ptr<const ArraySchemaConfig> config_;
    std::shared_ptr<const backend::ArraySchemaBackend> backend_;
};

/// Schema for a standalone series.
class SeriesSchema : public ArraySchema {
   public:
    explicit SeriesSchema(ArraySchemaConfig config = {},
                          std::shared_ptr<const backend::ArraySchemaBackend> backend = nullptr);

    /// The validated (and possibly coerced) series, with this schema
    /// attached, or the error(s) found.
    [[nodiscard]] auto validate(const Series& data, const ValidationOptions& options = {}) const
        -> ValidationResult<Series>;

    /// Like validate(), but throws SchemaError (eager) or SchemaErrors (lazy).
    [[nodiscard]] auto validate_or_throw(const Series& data,
                                         const ValidationOptions& options = {}) const -> Series;
};

/// Schema for one named column of a frame.
class ColumnSchema : public ArraySchema {
   public:
    /// Throws std::invalid_argument when `config.name` is unset.
    explicit ColumnSchema(ArraySchemaConfig config,
                          std::shared_ptr<const backend::ArraySchemaBackend> backend = nullptr);

    [[nodiscard]] auto required() const noexcept -> bool { return config().required; }

    /// Copy of this schema with `coerce` replaced.
    [[nodiscard]] auto with_coerce(bool coerce) const -> ColumnSchema;

    /// Validate the column named by this schema. A missing required column
    /// is a column_not_in_dataframe error; a missing optional one passes.
    [[nodiscard]] auto validate(const Frame& data, const ValidationOptions& options = {}) const
        -> ValidationResult<Frame>;

    /// Validate a column already extracted from its frame.
    [[nodiscard]] auto validate(const Series& data, const ValidationOptions& options = {}) const
        -> ValidationResult<Series>;
};

/// Schema for the row labels of a frame. Labels are validated as an int64
/// series named after the schema.
class IndexSchema : public ArraySchema {
   public:
    explicit IndexSchema(ArraySchemaConfig config = {},
                         std::shared_ptr<const backend::ArraySchemaBackend> backend = nullptr);

    [[nodiscard]] auto validate(const Frame& data, const ValidationOptions& options = {}) const
        -> ValidationResult<Frame>;

    /// The labels of `data` as a series.
    [[nodiscard]] auto labels_of(const Frame& data) const -> Series;
};

}  // namespace tabula
