#include <tabula/engine/dtype.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>
#include <utility>

namespace tabula::engine {

namespace {

constexpr std::array<std::pair<std::string_view, DataTypeKind>, 15> kAliases{{
    {"bool", DataTypeKind::Bool},
    {"boolean", DataTypeKind::Bool},
    {"int", DataTypeKind::Int64},
    {"int64", DataTypeKind::Int64},
    {"float", DataTypeKind::Float64},
    {"float64", DataTypeKind::Float64},
    {"double", DataTypeKind::Float64},
    {"str", DataTypeKind::String},
    {"string", DataTypeKind::String},
    {"date", DataTypeKind::Date},
    {"datetime", DataTypeKind::Timestamp},
    {"timestamp", DataTypeKind::Timestamp},
    {"datetime64[ns]", DataTypeKind::Timestamp},
    {"object", DataTypeKind::Object},
    {"mixed", DataTypeKind::Object},
}};

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    text = trim(text);
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (begin != end && *begin == '+') {
        ++begin;
    }
    auto result = std::from_chars(begin, end, out);
    return begin != end && result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    std::string owned{trim(text)};
    if (owned.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(owned.c_str(), &end);
    return end != owned.c_str() && *end == '\0';
}

auto try_parse_bool(std::string_view text, bool& out) -> bool {
    text = trim(text);
    if (text == "true" || text == "True" || text == "TRUE" || text == "1") {
        out = true;
        return true;
    }
    if (text == "false" || text == "False" || text == "FALSE" || text == "0") {
        out = false;
        return true;
    }
    return false;
}

auto to_bool(const Scalar& value) -> std::optional<Scalar> {
    if (const auto* b = std::get_if<bool>(&value)) {
        return Scalar{*b};
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (*i == 0 || *i == 1) {
            return Scalar{*i == 1};
        }
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (*d == 0.0 || *d == 1.0) {
            return Scalar{*d == 1.0};
        }
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        bool parsed = false;
        if (try_parse_bool(*s, parsed)) {
            return Scalar{parsed};
        }
    }
    return std::nullopt;
}

auto to_int(const Scalar& value) -> std::optional<Scalar> {
    if (const auto* b = std::get_if<bool>(&value)) {
        return Scalar{std::int64_t{*b ? 1 : 0}};
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return Scalar{*i};
    }
    if (std::holds_alternative<double>(value)) {
        if (auto converted = integral_value(value)) {
            return Scalar{*converted};
        }
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        std::int64_t parsed = 0;
        if (try_parse_int(*s, parsed)) {
            return Scalar{parsed};
        }
        return std::nullopt;
    }
    if (const auto* date = std::get_if<Date>(&value)) {
        return Scalar{std::int64_t{date->days}};
    }
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return Scalar{ts->nanos};
    }
    return std::nullopt;
}

auto to_double(const Scalar& value) -> std::optional<Scalar> {
    if (const auto* b = std::get_if<bool>(&value)) {
        return Scalar{*b ? 1.0 : 0.0};
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return Scalar{static_cast<double>(*i)};
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return Scalar{*d};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        double parsed = 0.0;
        if (try_parse_double(*s, parsed)) {
            return Scalar{parsed};
        }
    }
    return std::nullopt;
}

auto to_date(const Scalar& value) -> std::optional<Scalar> {
    if (const auto* date = std::get_if<Date>(&value)) {
        return Scalar{*date};
    }
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return Scalar{date_of(*ts)};
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (*i < std::numeric_limits<std::int32_t>::min() ||
            *i > std::numeric_limits<std::int32_t>::max()) {
            return std::nullopt;
        }
        return Scalar{Date{static_cast<std::int32_t>(*i)}};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        auto text = trim(*s);
        if (auto date = parse_date(text)) {
            return Scalar{*date};
        }
        if (auto ts = parse_timestamp(text)) {
            return Scalar{date_of(*ts)};
        }
    }
    return std::nullopt;
}

auto to_timestamp(const Scalar& value) -> std::optional<Scalar> {
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return Scalar{*ts};
    }
    if (const auto* date = std::get_if<Date>(&value)) {
        if (auto ts = timestamp_of(*date)) {
            return Scalar{*ts};
        }
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return Scalar{Timestamp{*i}};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto ts = parse_timestamp(trim(*s))) {
            return Scalar{*ts};
        }
    }
    return std::nullopt;
}

// Kind of a single non-null element of an object column.
auto element_kind(const Scalar& value) -> DataTypeKind {
    return std::visit(
        [](const auto& v) -> DataTypeKind {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return DataTypeKind::Bool;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return DataTypeKind::Int64;
            } else if constexpr (std::is_same_v<T, double>) {
                return DataTypeKind::Float64;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return DataTypeKind::String;
            } else if constexpr (std::is_same_v<T, Date>) {
                return DataTypeKind::Date;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return DataTypeKind::Timestamp;
            } else {
                return DataTypeKind::Object;
            }
        },
        value);
}

}  // namespace

auto DataType::name() const -> std::string_view {
    switch (kind_) {
        case DataTypeKind::Bool:
            return "bool";
        case DataTypeKind::Int64:
            return "int64";
        case DataTypeKind::Float64:
            return "float64";
        case DataTypeKind::String:
            return "str";
        case DataTypeKind::Date:
            return "date";
        case DataTypeKind::Timestamp:
            return "datetime64[ns]";
        case DataTypeKind::Object:
            return "object";
    }
    return "object";
}

auto DataType::check(const DataType& actual, const Series& data) const -> CheckOutput {
    if (actual == *this) {
        return true;
    }
    if (actual.kind() != DataTypeKind::Object || kind_ == DataTypeKind::Object) {
        return false;
    }
    const auto* objects = std::get_if<Column<Scalar>>(data.column.get());
    if (objects == nullptr) {
        return dtype(*data.column) == *this;
    }
    auto mask = objects->mask([this](const Scalar& value) {
        return is_null_value(value) || element_kind(value) == kind_;
    });
    if (data.validity.has_value()) {
        for (std::size_t row = 0; row < mask.size(); ++row) {
            if (!(*data.validity)[row]) {
                mask[row] = true;
            }
        }
    }
    return mask;
}

auto DataType::try_coerce(const Series& data) const -> std::expected<Series, ParserError> {
    if (dtype(*data.column) == *this) {
        return data;
    }
    spdlog::debug("coercing series '{}' from {} to {}", data.name.value_or(""),
                  dtype(*data.column).name(), name());

    auto column = make_column(kind_);
    std::visit([n = data.size()](auto& col) { col.reserve(n); }, column);
    std::vector<bool> validity;
    validity.reserve(data.size());
    bool has_nulls = false;
    FailureCases failures;

    for (std::size_t row = 0; row < data.size(); ++row) {
        auto raw = data.value_at(row);
        if (is_null_value(raw)) {
            if (kind_ == DataTypeKind::Object) {
                append_scalar(column, Scalar{});
            } else {
                append_default(column);
            }
            validity.push_back(false);
            has_nulls = true;
            continue;
        }
        auto converted = convert_scalar(raw, kind_);
        if (!converted.has_value()) {
            failures.push_back(FailureCase{
                .column = data.name, .index = data.label_at(row), .value = std::move(raw)});
            append_default(column);
            validity.push_back(false);
            continue;
        }
        append_scalar(column, *converted);
        validity.push_back(true);
    }

    if (!failures.empty()) {
        return std::unexpected(ParserError{
            .message = fmt::format("Could not coerce {} value{} of series '{}' into type {}",
                                   failures.size(), failures.size() == 1 ? "" : "s",
                                   data.name.value_or(""), name()),
            .failure_cases = std::move(failures),
        });
    }

    Series out = has_nulls ? Series(data.name, std::move(column), std::move(validity))
                           : Series(data.name, std::move(column));
    out.labels = data.labels;
    out.schema = data.schema;
    return out;
}

auto dtype(const ColumnValue& column) -> DataType {
    return std::visit(
        [](const auto& col) -> DataType {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, bool>) {
                return DataType::boolean();
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return DataType::int64();
            } else if constexpr (std::is_same_v<T, double>) {
                return DataType::float64();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return DataType::string();
            } else if constexpr (std::is_same_v<T, Date>) {
                return DataType::date();
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return DataType::timestamp();
            } else {
                return DataType::object();
            }
        },
        column);
}

auto parse_dtype(std::string_view name) -> std::expected<DataType, std::string> {
    for (const auto& [alias, kind] : kAliases) {
        if (alias == name) {
            return DataType{kind};
        }
    }
    return std::unexpected(fmt::format("unknown dtype '{}'", name));
}

auto convert_scalar(const Scalar& value, DataTypeKind kind) -> std::optional<Scalar> {
    if (is_null_value(value)) {
        return Scalar{};
    }
    switch (kind) {
        case DataTypeKind::Bool:
            return to_bool(value);
        case DataTypeKind::Int64:
            return to_int(value);
        case DataTypeKind::Float64:
            return to_double(value);
        case DataTypeKind::String:
            return Scalar{format_scalar(value)};
        case DataTypeKind::Date:
            return to_date(value);
        case DataTypeKind::Timestamp:
            return to_timestamp(value);
        case DataTypeKind::Object:
            return value;
    }
    return std::nullopt;
}

auto make_column(DataTypeKind kind) -> ColumnValue {
    switch (kind) {
        case DataTypeKind::Bool:
            return Column<bool>{};
        case DataTypeKind::Int64:
            return Column<std::int64_t>{};
        case DataTypeKind::Float64:
            return Column<double>{};
        case DataTypeKind::String:
            return Column<std::string>{};
        case DataTypeKind::Date:
            return Column<Date>{};
        case DataTypeKind::Timestamp:
            return Column<Timestamp>{};
        case DataTypeKind::Object:
            return Column<Scalar>{};
    }
    return Column<Scalar>{};
}

}  // namespace tabula::engine
