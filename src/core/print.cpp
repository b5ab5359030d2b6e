#include <tabula/core/print.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tabula {

auto format_table(const std::vector<std::string>& headers,
                  const std::vector<std::vector<std::string>>& rows) -> std::string {
    std::vector<std::size_t> widths(headers.size());
    for (std::size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::string out;
    // Header row.
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0)
            out += "  ";
        out += fmt::format("{:<{}}", headers[c], widths[c]);
    }
    out += "\n";
    // Separator.
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0)
            out += "  ";
        out += std::string(widths[c], '-');
    }
    out += "\n";
    // Data rows.
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) {
            if (c > 0)
                out += "  ";
            out += fmt::format("{:<{}}", row[c], widths[c]);
        }
        out += "\n";
    }
    return out;
}

void print(const Frame& frame, std::ostream& out, std::size_t max_rows) {
    if (frame.columns.empty()) {
        out << "(empty frame)\n";
        return;
    }

    const std::size_t rows = frame.rows();
    const std::size_t shown = std::min(rows, max_rows);

    std::vector<std::string> headers{""};
    for (const auto& entry : frame.columns) {
        headers.push_back(entry.name);
    }
    std::vector<std::vector<std::string>> cells;
    cells.reserve(shown);
    for (std::size_t r = 0; r < shown; ++r) {
        std::vector<std::string> row{fmt::format("{}", frame.label_at(r))};
        for (const auto& entry : frame.columns) {
            row.push_back(is_null(entry, r) ? std::string{"null"}
                                            : format_scalar(scalar_at(*entry.column, r)));
        }
        cells.push_back(std::move(row));
    }
    out << format_table(headers, cells);
    if (shown < rows) {
        out << fmt::format("... ({} more rows)\n", rows - shown);
    }
    out << fmt::format("[{} rows x {} columns]\n", rows, frame.columns.size());
}

}  // namespace tabula
