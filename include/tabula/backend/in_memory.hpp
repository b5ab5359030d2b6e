#pragma once

#include <tabula/backend/array_backend.hpp>

namespace tabula::backend {

/// Reference backend over the in-memory Series and Frame types.
class InMemoryArrayBackend final : public ArraySchemaBackend {
   public:
    [[nodiscard]] auto coerce_dtype(const CheckObject& data, const ArraySchema& schema) const
        -> std::expected<CheckObject, SchemaError> override;

    [[nodiscard]] auto check_name(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult override;
    [[nodiscard]] auto check_nullable(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult override;
    [[nodiscard]] auto check_unique(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult override;
    [[nodiscard]] auto check_dtype(const Series& field, const ArraySchema& schema) const
        -> CoreCheckResult override;

    void run_checks(const CheckObject& data, const ArraySchema& schema,
                    ErrorHandler& handler) const override;
};

}  // namespace tabula::backend
