#pragma once

#include <tabula/core/frame.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace tabula::io {

struct CsvReadOptions {
    /// Treat empty cells as null.
    bool null_if_empty = false;
    /// Cell texts read as null, e.g. "NA".
    std::unordered_set<std::string> null_tokens;
    /// Infer int64, then float64, before falling back to str. When false
    /// every column is read as str.
    bool infer_types = true;
};

/// Parse a comma-separated null specification such as "<empty>,NA,null".
/// The token "<empty>" enables null_if_empty.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read an RFC 4180 CSV file with a header row into a frame.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Frame, std::string>;

}  // namespace tabula::io
