#include <tabula/io/csv.hpp>

#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tabula::io {

namespace {

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto csv_try_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return begin != end && result.ec == std::errc() && result.ptr == end;
}

auto csv_try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

// Parse every valid cell as T; nullopt if any valid cell does not parse or
// no cell is valid.
template <typename T, typename Parse>
auto try_column(const std::vector<std::string>& vals, const std::vector<bool>& validity,
                Parse parse) -> std::optional<Column<T>> {
    Column<T> col;
    col.reserve(vals.size());
    bool any_valid = false;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        if (!validity[i]) {
            col.push_back(T{});
            continue;
        }
        T value{};
        if (!parse(vals[i], value)) {
            return std::nullopt;
        }
        col.push_back(value);
        any_valid = true;
    }
    if (!any_valid) {
        return std::nullopt;
    }
    return col;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = csv_trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options)
    -> std::expected<Frame, std::string> {
    Frame frame;
    try {
        // Row 0 is the header; there is no row-index column.
        rapidcsv::Document doc(std::string(path), rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(','));

        for (const auto& name : doc.GetColumnNames()) {
            std::vector<std::string> vals = doc.GetColumn<std::string>(name);
            std::vector<bool> validity(vals.size(), true);
            bool has_nulls = false;
            for (std::size_t i = 0; i < vals.size(); ++i) {
                const bool is_null = (options.null_if_empty && vals[i].empty()) ||
                                     options.null_tokens.contains(vals[i]);
                validity[i] = !is_null;
                has_nulls = has_nulls || is_null;
            }

            auto add = [&](ColumnValue column) {
                if (has_nulls) {
                    frame.add_column(name, std::move(column), validity);
                } else {
                    frame.add_column(name, std::move(column));
                }
            };

            if (options.infer_types) {
                if (auto ints = try_column<std::int64_t>(vals, validity, csv_try_int)) {
                    add(std::move(*ints));
                    continue;
                }
                if (auto doubles = try_column<double>(vals, validity, csv_try_double)) {
                    add(std::move(*doubles));
                    continue;
                }
            }

            // String fallback. Null slots hold an empty placeholder.
            for (std::size_t i = 0; i < vals.size(); ++i) {
                if (!validity[i]) {
                    vals[i].clear();
                }
            }
            add(Column<std::string>(std::move(vals)));
        }
    } catch (const std::exception& e) {
        return std::unexpected("failed to read csv '" + std::string(path) + "': " + e.what());
    }

    spdlog::debug("read {} rows x {} columns from {}", frame.rows(), frame.columns.size(), path);
    return frame;
}

}  // namespace tabula::io
