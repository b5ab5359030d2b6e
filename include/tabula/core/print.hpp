#pragma once

#include <tabula/core/frame.hpp>

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace tabula {

/// Left-aligned fixed-width text table with a dashed rule under the header.
[[nodiscard]] auto format_table(const std::vector<std::string>& headers,
                                const std::vector<std::vector<std::string>>& rows)
    -> std::string;

/// Print `frame` as a text table led by its row labels. At most `max_rows`
/// rows are shown.
void print(const Frame& frame, std::ostream& out = std::cout, std::size_t max_rows = 50);

}  // namespace tabula
