#include <tabula/tabula.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <iostream>
#include <string>

auto main() -> int {
    // A series of prices with one bad value and one missing value.
    tabula::Series prices{"price", tabula::Column<double>{100.5, -3.0, 50.0, 0.0, 320.1},
                          {true, true, true, false, true}};

    fmt::print("=== Series validation ===\n");

    const tabula::SeriesSchema schema{{
        .name = "price",
        .dtype = tabula::engine::DataType::float64(),
        .checks = {tabula::checks::greater_than_or_equal_to(0.0)},
        .nullable = false,
    }};

    auto result = schema.validate(prices, {.lazy = true});
    if (!result) {
        fmt::print("{}\n", tabula::describe(result.error()));
    }

    // Coerce text columns while validating a frame.
    fmt::print("\n=== Frame validation ===\n");

    tabula::Frame trades;
    trades.add_column("symbol", tabula::Column<std::string>{"AAPL", "MSFT", "AAPL"});
    trades.add_column("qty", tabula::Column<std::string>{"10", "25", "5"});

    const tabula::FrameSchema trades_schema{{
        .columns = {
            tabula::ColumnSchema{{.name = "symbol", .dtype = tabula::engine::DataType::string()}},
            tabula::ColumnSchema{{.name = "qty",
                                  .dtype = tabula::engine::DataType::int64(),
                                  .checks = {tabula::checks::greater_than(std::int64_t{0})}}},
        },
        .strict = tabula::StrictMode::On,
        .coerce = true,
    }};

    auto validated = trades_schema.validate(trades);
    if (!validated) {
        fmt::print("{}\n", tabula::describe(validated.error()));
        return 1;
    }
    tabula::print(*validated, std::cout);
    return 0;
}
