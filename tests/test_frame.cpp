#include <tabula/core/frame.hpp>
#include <tabula/core/print.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace tabula;

auto ints(std::initializer_list<std::int64_t> values) -> Series {
    return Series{"x", Column<std::int64_t>{values}};
}

}  // namespace

TEST_CASE("Series null handling", "[core][series]") {
    Series s{"price", Column<double>{1.0, std::numeric_limits<double>::quiet_NaN(), 3.0},
             {true, true, false}};

    REQUIRE(s.size() == 3);
    REQUIRE_FALSE(s.is_null(0));
    REQUIRE(s.is_null(1));
    REQUIRE(s.is_null(2));
    REQUIRE(std::holds_alternative<std::monostate>(s.value_at(2)));
    REQUIRE(s.null_mask() == std::vector<bool>{false, true, true});
}

TEST_CASE("Series take keeps row labels", "[core][series]") {
    auto s = ints({10, 20, 30, 40});
    const std::array<std::size_t, 2> positions{1, 3};

    auto taken = s.take(positions);

    REQUIRE(taken.size() == 2);
    REQUIRE(taken.label_at(0) == 1);
    REQUIRE(taken.label_at(1) == 3);
    REQUIRE(std::get<std::int64_t>(taken.value_at(1)) == 40);
}

TEST_CASE("Series copy shares no storage", "[core][series]") {
    auto s = ints({1, 2});
    auto copy = s.copy();

    REQUIRE(copy == s);
    REQUIRE(copy.column.get() != s.column.get());

    auto shallow = s;
    REQUIRE(shallow.column.get() == s.column.get());
}

TEST_CASE("Series equality ignores NaN placement under nulls", "[core][series]") {
    Series a{"v", Column<double>{std::numeric_limits<double>::quiet_NaN(), 1.0}};
    Series b{"v", Column<double>{0.0, 1.0}, {false, true}};

    REQUIRE(a == b);
    b.name = "w";
    REQUIRE_FALSE(a == b);
}

TEST_CASE("Frame column management", "[core][frame]") {
    Frame f;
    f.add_column("a", Column<std::int64_t>{1, 2, 3});
    f.add_column("b", Column<std::string>{"x", "y", "z"});

    REQUIRE(f.rows() == 3);
    REQUIRE(f.column_names() == std::vector<std::string>{"a", "b"});
    REQUIRE(f.contains("b"));

    SECTION("series views share storage") {
        auto a = f.series("a");
        REQUIRE(a.has_value());
        REQUIRE(a->column.get() == f.find("a"));
        REQUIRE_FALSE(f.series("missing").has_value());
    }

    SECTION("drop_column reindexes") {
        REQUIRE(f.drop_column("a"));
        REQUIRE_FALSE(f.drop_column("a"));
        REQUIRE(f.column_names() == std::vector<std::string>{"b"});
        REQUIRE(f.find("b") != nullptr);
    }

    SECTION("set_column replaces in place") {
        Series replacement{"a", Column<double>{1.5, 2.5, 3.5}};
        f.set_column(replacement);
        REQUIRE(f.column_names() == std::vector<std::string>{"a", "b"});
        REQUIRE(std::holds_alternative<Column<double>>(*f.find("a")));
    }

    SECTION("set_column needs a name") {
        Series unnamed{std::nullopt, Column<std::int64_t>{1, 2, 3}};
        REQUIRE_THROWS_AS(f.set_column(unnamed), std::invalid_argument);
    }
}

TEST_CASE("Duplicate masks follow the keep policy", "[core][duplicates]") {
    auto s = ints({1, 1, 2, 1});

    REQUIRE(duplicated(s, ReportDuplicates::ExcludeFirst) ==
            std::vector<bool>{false, true, false, true});
    REQUIRE(duplicated(s, ReportDuplicates::ExcludeLast) ==
            std::vector<bool>{true, true, false, false});
    REQUIRE(duplicated(s, ReportDuplicates::All) == std::vector<bool>{true, true, false, true});
}

TEST_CASE("Duplicate masks are stable across calls", "[core][duplicates]") {
    auto s = ints({5, 3, 5, 3, 9});

    auto first = duplicated(s, ReportDuplicates::All);
    auto second = duplicated(s, ReportDuplicates::All);

    REQUIRE(first == second);
}

TEST_CASE("Nulls are duplicates of each other", "[core][duplicates]") {
    Series s{"v", Column<double>{1.0, 0.0, std::numeric_limits<double>::quiet_NaN()},
             {true, false, true}};

    REQUIRE(duplicated(s, ReportDuplicates::ExcludeFirst) ==
            std::vector<bool>{false, false, true});
}

TEST_CASE("Object columns treat 1 and 1.0 as duplicates", "[core][duplicates]") {
    Series s{"v", Column<Scalar>{Scalar{std::int64_t{1}}, Scalar{1.0}, Scalar{2.5}}};

    REQUIRE(duplicated(s, ReportDuplicates::ExcludeFirst) == std::vector<bool>{false, true, false});
}

TEST_CASE("Series equality keeps element kinds apart", "[core][series]") {
    Series ints{"v", Column<Scalar>{Scalar{std::int64_t{1}}}};
    Series doubles{"v", Column<Scalar>{Scalar{1.0}}};

    REQUIRE_FALSE(ints == doubles);
    REQUIRE(ints == ints.copy());
}

TEST_CASE("Frame duplicates over a column subset", "[core][duplicates]") {
    Frame f;
    f.add_column("a", Column<std::int64_t>{1, 1, 1, 2});
    f.add_column("b", Column<std::string>{"x", "y", "x", "x"});

    REQUIRE(duplicated(f, {"a", "b"}, ReportDuplicates::ExcludeFirst) ==
            std::vector<bool>{false, false, true, false});
    REQUIRE(duplicated(f, {"a"}, ReportDuplicates::ExcludeLast) ==
            std::vector<bool>{true, true, false, false});
    REQUIRE_THROWS_AS(duplicated(f, {"missing"}, ReportDuplicates::All), std::out_of_range);
}

TEST_CASE("Keep policy names", "[core][duplicates]") {
    REQUIRE(parse_report_duplicates("first") == ReportDuplicates::ExcludeFirst);
    REQUIRE(parse_report_duplicates("exclude_last") == ReportDuplicates::ExcludeLast);
    REQUIRE(parse_report_duplicates("all") == ReportDuplicates::All);
    REQUIRE_FALSE(parse_report_duplicates("none").has_value());
    REQUIRE(to_string(ReportDuplicates::ExcludeFirst) == "exclude_first");
}

TEST_CASE("Frame printing", "[core][print]") {
    Frame f;
    f.add_column("sym", Column<std::string>{"A", "B"});
    f.add_column("qty", Column<std::int64_t>{10, 0}, {true, false});

    std::ostringstream out;
    print(f, out);

    const auto text = out.str();
    REQUIRE(text.find("sym") != std::string::npos);
    REQUIRE(text.find("null") != std::string::npos);
    REQUIRE(text.find("[2 rows x 2 columns]") != std::string::npos);
}
