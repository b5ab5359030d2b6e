#pragma once

#include <tabula/core/frame.hpp>
#include <tabula/error/failure_cases.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace tabula::engine {

enum class DataTypeKind : std::uint8_t {
    Bool,
    Int64,
    Float64,
    String,
    Date,
    Timestamp,
    Object,  ///< mixed values; each element carries its own kind
};

/// Coercion failure: every row that could not be converted.
struct ParserError {
    std::string message;
    FailureCases failure_cases;
};

/// A logical dtype descriptor.
///
/// A DataType is a small value object. It answers two questions about a
/// series: does it already conform (check), and can it be converted
/// (try_coerce).
class DataType {
   public:
    constexpr explicit DataType(DataTypeKind kind) noexcept : kind_(kind) {}

    [[nodiscard]] static constexpr auto boolean() noexcept -> DataType {
        return DataType{DataTypeKind::Bool};
    }
    [[nodiscard]] static constexpr auto int64() noexcept -> DataType {
        return DataType{DataTypeKind::Int64};
    }
    [[nodiscard]] static constexpr auto float64() noexcept -> DataType {
        return DataType{DataTypeKind::Float64};
    }
    [[nodiscard]] static constexpr auto string() noexcept -> DataType {
        return DataType{DataTypeKind::String};
    }
    [[nodiscard]] static constexpr auto date() noexcept -> DataType {
        return DataType{DataTypeKind::Date};
    }
    [[nodiscard]] static constexpr auto timestamp() noexcept -> DataType {
        return DataType{DataTypeKind::Timestamp};
    }
    [[nodiscard]] static constexpr auto object() noexcept -> DataType {
        return DataType{DataTypeKind::Object};
    }

    [[nodiscard]] constexpr auto kind() const noexcept -> DataTypeKind { return kind_; }

    /// Canonical name: "bool", "int64", "float64", "str", "date",
    /// "datetime64[ns]" or "object".
    [[nodiscard]] auto name() const -> std::string_view;

    /// Whether data of dtype `actual` conforms to this dtype.
    ///
    /// Returns a single verdict, except when `actual` is object and this
    /// dtype is concrete: then one verdict per row (element kind matches, or
    /// the element is null).
    [[nodiscard]] auto check(const DataType& actual, const Series& data) const -> CheckOutput;

    /// Convert `data` to this dtype. Nulls stay null; the name, labels and
    /// attached schema carry over. `data` itself is never modified.
    [[nodiscard]] auto try_coerce(const Series& data) const -> std::expected<Series, ParserError>;

    auto operator==(const DataType&) const -> bool = default;

   private:
    DataTypeKind kind_;
};

/// Runtime dtype of a column.
[[nodiscard]] auto dtype(const ColumnValue& column) -> DataType;

/// Resolve a dtype name or alias (e.g. "int", "float64", "string", "datetime").
[[nodiscard]] auto parse_dtype(std::string_view name) -> std::expected<DataType, std::string>;

/// Convert one value to `kind`. Nulls convert to null; nullopt when the
/// value has no representation in `kind`.
[[nodiscard]] auto convert_scalar(const Scalar& value, DataTypeKind kind) -> std::optional<Scalar>;

/// An empty column with the storage type of `kind`.
[[nodiscard]] auto make_column(DataTypeKind kind) -> ColumnValue;

}  // namespace tabula::engine
