#include <tabula/core/frame.hpp>

#include <robin_hood.h>

#include <stdexcept>
#include <type_traits>

namespace tabula {

namespace {

auto take_validity(const std::optional<std::vector<bool>>& validity,
                   std::span<const std::size_t> positions) -> std::optional<std::vector<bool>> {
    if (!validity.has_value()) {
        return std::nullopt;
    }
    std::vector<bool> out;
    out.reserve(positions.size());
    for (auto pos : positions) {
        out.push_back((*validity).at(pos));
    }
    return out;
}

auto take_labels(const RowLabels& labels, std::span<const std::size_t> positions) -> RowLabels {
    std::vector<std::int64_t> out;
    out.reserve(positions.size());
    for (auto pos : positions) {
        out.push_back(labels.has_value() ? labels->at(pos) : static_cast<std::int64_t>(pos));
    }
    return out;
}

auto clone_column(const std::shared_ptr<ColumnValue>& column) -> std::shared_ptr<ColumnValue> {
    if (column == nullptr) {
        return std::make_shared<ColumnValue>();
    }
    return std::make_shared<ColumnValue>(*column);
}

auto labels_equal(std::size_t rows, const RowLabels& lhs, const RowLabels& rhs) -> bool {
    for (std::size_t row = 0; row < rows; ++row) {
        auto l = lhs.has_value() ? (*lhs)[row] : static_cast<std::int64_t>(row);
        auto r = rhs.has_value() ? (*rhs)[row] : static_cast<std::int64_t>(row);
        if (l != r) {
            return false;
        }
    }
    return true;
}

// Positions of a value's first and last occurrence plus its multiplicity.
struct Occurrence {
    std::size_t first = 0;
    std::size_t last = 0;
    std::size_t count = 0;
};

// Group rows by key, then mark every row that is not the canonical occurrence
// of its group. The mask depends only on the keys and their order.
template <typename KeyT, typename Hash, typename Eq, typename KeyAt>
auto duplicated_impl(std::size_t rows, KeyAt key_at, ReportDuplicates keep) -> std::vector<bool> {
    robin_hood::unordered_flat_map<KeyT, std::size_t, Hash, Eq> group_ids;
    group_ids.reserve(rows);
    std::vector<Occurrence> groups;
    std::vector<std::size_t> group_of(rows);

    for (std::size_t row = 0; row < rows; ++row) {
        auto [it, inserted] = group_ids.try_emplace(key_at(row), groups.size());
        if (inserted) {
            groups.push_back(Occurrence{.first = row, .last = row, .count = 0});
        }
        auto& group = groups[it->second];
        group.last = row;
        ++group.count;
        group_of[row] = it->second;
    }

    std::vector<bool> mask(rows, false);
    for (std::size_t row = 0; row < rows; ++row) {
        const auto& group = groups[group_of[row]];
        switch (keep) {
            case ReportDuplicates::ExcludeFirst:
                mask[row] = row != group.first;
                break;
            case ReportDuplicates::ExcludeLast:
                mask[row] = row != group.last;
                break;
            case ReportDuplicates::All:
                mask[row] = group.count > 1;
                break;
        }
    }
    return mask;
}

struct RowKey {
    std::vector<Scalar> values;
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const -> std::size_t {
        std::size_t seed = 0;
        for (const auto& value : key.values) {
            seed ^= ScalarHash{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const -> bool {
        if (a.values.size() != b.values.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.values.size(); ++i) {
            if (!ScalarKeyEq{}(a.values[i], b.values[i])) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace

auto to_string(ReportDuplicates keep) -> std::string_view {
    switch (keep) {
        case ReportDuplicates::ExcludeFirst:
            return "exclude_first";
        case ReportDuplicates::ExcludeLast:
            return "exclude_last";
        case ReportDuplicates::All:
            return "all";
    }
    return "all";
}

auto parse_report_duplicates(std::string_view text) -> std::optional<ReportDuplicates> {
    if (text == "first" || text == "exclude_first") {
        return ReportDuplicates::ExcludeFirst;
    }
    if (text == "last" || text == "exclude_last") {
        return ReportDuplicates::ExcludeLast;
    }
    if (text == "all") {
        return ReportDuplicates::All;
    }
    return std::nullopt;
}

// ─── Series ───────────────────────────────────────────────────────────────────

Series::Series() : column(std::make_shared<ColumnValue>()) {}

Series::Series(std::optional<std::string> name, ColumnValue column)
    : name(std::move(name)), column(std::make_shared<ColumnValue>(std::move(column))) {}

Series::Series(std::optional<std::string> name, ColumnValue column, std::vector<bool> validity)
    : name(std::move(name)),
      column(std::make_shared<ColumnValue>(std::move(column))),
      validity(std::move(validity)) {}

auto Series::size() const -> std::size_t {
    return column == nullptr ? 0 : column_size(*column);
}

auto Series::is_null(std::size_t row) const -> bool {
    if (validity.has_value() && !(*validity)[row]) {
        return true;
    }
    return is_null_value(scalar_at(*column, row));
}

auto Series::value_at(std::size_t row) const -> Scalar {
    if (validity.has_value() && !(*validity)[row]) {
        return std::monostate{};
    }
    return scalar_at(*column, row);
}

auto Series::label_at(std::size_t row) const -> std::int64_t {
    return labels.has_value() ? labels->at(row) : static_cast<std::int64_t>(row);
}

auto Series::null_mask() const -> std::vector<bool> {
    std::vector<bool> mask;
    const auto n = size();
    mask.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        mask.push_back(is_null(row));
    }
    return mask;
}

auto Series::take(std::span<const std::size_t> positions) const -> Series {
    Series out;
    out.name = name;
    out.column = std::make_shared<ColumnValue>(take_column(*column, positions));
    out.validity = take_validity(validity, positions);
    out.labels = take_labels(labels, positions);
    out.schema = schema;
    return out;
}

auto Series::copy() const -> Series {
    Series out = *this;
    out.column = clone_column(column);
    return out;
}

auto operator==(const Series& lhs, const Series& rhs) -> bool {
    if (lhs.name != rhs.name || lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.column->index() != rhs.column->index()) {
        return false;
    }
    for (std::size_t row = 0; row < lhs.size(); ++row) {
        auto l = lhs.value_at(row);
        auto r = rhs.value_at(row);
        // Object columns: 1 and 1.0 are different values.
        if (!ScalarKeyEq{}(l, r) || (!is_null_value(l) && l.index() != r.index())) {
            return false;
        }
    }
    return labels_equal(lhs.size(), lhs.labels, rhs.labels);
}

// ─── Frame ────────────────────────────────────────────────────────────────────

void Frame::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

void Frame::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    std::string key = name;
    add_column(std::move(name), std::move(column));
    columns[index.at(key)].validity = std::move(validity);
}

void Frame::set_column(const Series& series) {
    if (!series.name.has_value()) {
        throw std::invalid_argument("cannot insert an unnamed series into a frame");
    }
    if (columns.empty() && !labels.has_value()) {
        labels = series.labels;
    }
    if (auto it = index.find(*series.name); it != index.end()) {
        columns[it->second].column = series.column;
        columns[it->second].validity = series.validity;
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(
        ColumnEntry{.name = *series.name, .column = series.column, .validity = series.validity});
    index[columns.back().name] = pos;
}

auto Frame::drop_column(const std::string& name) -> bool {
    auto it = index.find(name);
    if (it == index.end()) {
        return false;
    }
    columns.erase(columns.begin() + static_cast<std::ptrdiff_t>(it->second));
    index.clear();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        index[columns[i].name] = i;
    }
    return true;
}

auto Frame::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Frame::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Frame::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Frame::contains(const std::string& name) const -> bool {
    return index.contains(name);
}

auto Frame::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return labels.has_value() ? labels->size() : 0;
    }
    return column_size(*columns.front().column);
}

auto Frame::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto Frame::label_at(std::size_t row) const -> std::int64_t {
    return labels.has_value() ? labels->at(row) : static_cast<std::int64_t>(row);
}

auto Frame::series(const std::string& name) const -> std::optional<Series> {
    const auto* entry = find_entry(name);
    if (entry == nullptr) {
        return std::nullopt;
    }
    Series out;
    out.name = entry->name;
    out.column = entry->column;
    out.validity = entry->validity;
    out.labels = labels;
    return out;
}

auto Frame::take(std::span<const std::size_t> positions) const -> Frame {
    Frame out;
    out.columns.reserve(columns.size());
    for (const auto& entry : columns) {
        out.columns.push_back(
            ColumnEntry{
                .name = entry.name,
                .column = std::make_shared<ColumnValue>(take_column(*entry.column, positions)),
                .validity = take_validity(entry.validity, positions)});
    }
    out.index = index;
    out.labels = take_labels(labels, positions);
    out.schema = schema;
    return out;
}

auto Frame::copy() const -> Frame {
    Frame out = *this;
    for (auto& entry : out.columns) {
        entry.column = clone_column(entry.column);
    }
    return out;
}

auto operator==(const Frame& lhs, const Frame& rhs) -> bool {
    if (lhs.columns.size() != rhs.columns.size() || lhs.rows() != rhs.rows()) {
        return false;
    }
    for (const auto& entry : lhs.columns) {
        auto l = lhs.series(entry.name);
        auto r = rhs.series(entry.name);
        if (!r.has_value() || rhs.index.at(entry.name) != lhs.index.at(entry.name) || !(*l == *r)) {
            return false;
        }
    }
    return labels_equal(lhs.rows(), lhs.labels, rhs.labels);
}

auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    if (entry.validity.has_value() && !(*entry.validity)[row]) {
        return true;
    }
    return is_null_value(scalar_at(*entry.column, row));
}

// ─── CheckObject helpers ──────────────────────────────────────────────────────

auto rows_of(const CheckObject& obj) -> std::size_t {
    return std::visit(
        [](const auto& data) -> std::size_t {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, Series>) {
                return data.size();
            } else {
                return data.rows();
            }
        },
        obj);
}

auto take_rows(const CheckObject& obj, std::span<const std::size_t> positions) -> CheckObject {
    return std::visit([positions](const auto& data) -> CheckObject { return data.take(positions); },
                      obj);
}

auto deep_copy(const CheckObject& obj) -> CheckObject {
    return std::visit([](const auto& data) -> CheckObject { return data.copy(); }, obj);
}

// ─── Duplicate detection ──────────────────────────────────────────────────────

auto duplicated(const Series& data, ReportDuplicates keep) -> std::vector<bool> {
    return duplicated_impl<Scalar, ScalarHash, ScalarKeyEq>(
        data.size(), [&data](std::size_t row) { return data.value_at(row); }, keep);
}

auto duplicated(const Frame& data, const std::vector<std::string>& subset, ReportDuplicates keep)
    -> std::vector<bool> {
    std::vector<Series> keys;
    keys.reserve(subset.size());
    for (const auto& name : subset) {
        auto column = data.series(name);
        if (!column.has_value()) {
            throw std::out_of_range("column not found: " + name);
        }
        keys.push_back(std::move(*column));
    }
    return duplicated_impl<RowKey, RowKeyHash, RowKeyEq>(
        data.rows(),
        [&keys](std::size_t row) {
            RowKey key;
            key.values.reserve(keys.size());
            for (const auto& column : keys) {
                key.values.push_back(column.value_at(row));
            }
            return key;
        },
        keep);
}

}  // namespace tabula
