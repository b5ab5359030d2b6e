#pragma once

#include <tabula/core/config.hpp>
#include <tabula/core/frame.hpp>
#include <tabula/error/error_handler.hpp>
#include <tabula/error/errors.hpp>

#include <memory>

namespace tabula {
class FrameSchema;
}  // namespace tabula

namespace tabula::backend {

/// Frame validation pipeline.
///
/// Structure first (column presence, strictness, order), then coercion of
/// the declared columns, then per-column validation through each column's
/// array backend on the subsample, the index, multi-column uniqueness and
/// finally the frame-wide checks.
class FrameSchemaBackend {
   public:
    virtual ~FrameSchemaBackend() = default;

    [[nodiscard]] auto validate(const Frame& data, const FrameSchema& schema,
                                const ValidationOptions& options) const
        -> ValidationResult<Frame>;

   protected:
    /// Missing required columns.
    virtual void check_column_presence(const Frame& data, const FrameSchema& schema,
                                       ErrorHandler& handler) const;
    /// Undeclared columns: reported under StrictMode::On, dropped under Filter.
    virtual void check_strict(Frame& data, const FrameSchema& schema,
                              ErrorHandler& handler) const;
    virtual void check_column_order(const Frame& data, const FrameSchema& schema,
                                    ErrorHandler& handler) const;
    /// Coerce each column whose own or the frame's coerce flag is set.
    /// Columns that fail to coerce are left unchanged.
    virtual void coerce_columns(Frame& data, const FrameSchema& schema,
                                ErrorHandler& handler) const;
    virtual void run_column_schemas(const Frame& sample, const FrameSchema& schema,
                                    const ValidationOptions& options,
                                    ErrorHandler& handler) const;
    virtual void run_index_schema(const Frame& sample, const FrameSchema& schema,
                                  const ValidationOptions& options, ErrorHandler& handler) const;
    virtual void check_unique_subset(const Frame& sample, const FrameSchema& schema,
                                     ErrorHandler& handler) const;
    virtual void run_checks(const Frame& sample, const FrameSchema& schema,
                            ErrorHandler& handler) const;
};

[[nodiscard]] auto default_frame_backend() -> std::shared_ptr<const FrameSchemaBackend>;

}  // namespace tabula::backend
