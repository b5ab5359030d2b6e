#pragma once

#include <tabula/core/value.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tabula {

class ArraySchema;
class FrameSchema;

/// Row labels. nullopt means positional labels 0..n-1.
using RowLabels = std::optional<std::vector<std::int64_t>>;

/// Which occurrence of a repeated value is treated as canonical (not reported).
enum class ReportDuplicates : std::uint8_t {
    ExcludeFirst,  ///< keep the first occurrence, report the rest
    ExcludeLast,   ///< keep the last occurrence, report the rest
    All,           ///< keep none, report every occurrence
};

[[nodiscard]] auto to_string(ReportDuplicates keep) -> std::string_view;

/// Accepts "first"/"exclude_first", "last"/"exclude_last" and "all".
[[nodiscard]] auto parse_report_duplicates(std::string_view text)
    -> std::optional<ReportDuplicates>;

/// A single field: one named column, its validity bitmap and row labels.
///
/// The column is shared between copies; writers reseat the pointer rather
/// than mutating shared data (copy-on-write). copy() clones the storage.
struct Series {
    std::optional<std::string> name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
    RowLabels labels;
    // Schema this series was last validated with, if any.
    std::shared_ptr<const ArraySchema> schema;

    Series();
    Series(std::optional<std::string> name, ColumnValue column);
    Series(std::optional<std::string> name, ColumnValue column, std::vector<bool> validity);

    [[nodiscard]] auto size() const -> std::size_t;

    /// True if the row is marked invalid or holds a null value (NaN, null object).
    [[nodiscard]] auto is_null(std::size_t row) const -> bool;

    /// Row value; std::monostate for rows marked invalid.
    [[nodiscard]] auto value_at(std::size_t row) const -> Scalar;

    [[nodiscard]] auto label_at(std::size_t row) const -> std::int64_t;

    /// One entry per row, true where the row is null.
    [[nodiscard]] auto null_mask() const -> std::vector<bool>;

    /// Rows at `positions`, keeping their labels.
    [[nodiscard]] auto take(std::span<const std::size_t> positions) const -> Series;

    /// Deep copy: the result shares no storage with this series.
    [[nodiscard]] auto copy() const -> Series;
};

/// Compares name, values, validity and labels. The attached schema is not
/// part of a series' value.
[[nodiscard]] auto operator==(const Series& lhs, const Series& rhs) -> bool;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    std::optional<std::vector<bool>> validity;
};

/// A collection of equally long named columns sharing one set of row labels.
struct Frame {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;
    RowLabels labels;
    // Schema this frame was last validated with, if any.
    std::shared_ptr<const FrameSchema> schema;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Insert or replace the column named after `series` (which must be named).
    void set_column(const Series& series);
    /// Remove a column; returns false if it was not present.
    auto drop_column(const std::string& name) -> bool;

    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto label_at(std::size_t row) const -> std::int64_t;

    /// View of one column as a series sharing this frame's storage and labels.
    [[nodiscard]] auto series(const std::string& name) const -> std::optional<Series>;

    [[nodiscard]] auto take(std::span<const std::size_t> positions) const -> Frame;
    [[nodiscard]] auto copy() const -> Frame;
};

[[nodiscard]] auto operator==(const Frame& lhs, const Frame& rhs) -> bool;

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] auto is_null(const ColumnEntry& entry, std::size_t row) -> bool;

/// The object a validation call runs against: a lone field or a whole frame.
/// The alternative is fixed when the call is made, never inferred.
using CheckObject = std::variant<Series, Frame>;

[[nodiscard]] auto rows_of(const CheckObject& obj) -> std::size_t;
[[nodiscard]] auto take_rows(const CheckObject& obj, std::span<const std::size_t> positions)
    -> CheckObject;
[[nodiscard]] auto deep_copy(const CheckObject& obj) -> CheckObject;

/// Duplicate mask over one series: true for every row reported as a
/// duplicate under `keep`. Nulls are equal to each other.
[[nodiscard]] auto duplicated(const Series& data, ReportDuplicates keep) -> std::vector<bool>;

/// Duplicate mask over the combination of `subset` columns of a frame.
/// Throws std::out_of_range if a subset column is missing.
[[nodiscard]] auto duplicated(const Frame& data, const std::vector<std::string>& subset,
                              ReportDuplicates keep) -> std::vector<bool>;

}  // namespace tabula
