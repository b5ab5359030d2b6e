#include <tabula/check/builtin.hpp>
#include <tabula/schema/frame_schema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using namespace tabula;
using engine::DataType;

auto column(std::string name, std::optional<DataType> dtype = std::nullopt) -> ColumnSchema {
    return ColumnSchema{ArraySchemaConfig{.name = std::move(name), .dtype = dtype}};
}

auto orders() -> Frame {
    Frame f;
    f.add_column("id", Column<std::int64_t>{1, 2, 3});
    f.add_column("price", Column<std::string>{"9.5", "10", "0.25"});
    f.add_column("note", Column<std::string>{"a", "b", "c"});
    return f;
}

auto reasons(const ValidationError& error) -> std::vector<ReasonCode> {
    std::vector<ReasonCode> out;
    for (const auto& e : errors_of(error)) {
        out.push_back(e.reason_code());
    }
    return out;
}

}  // namespace

TEST_CASE("Strict mode names", "[frame][schema]") {
    REQUIRE(parse_strict_mode("filter") == StrictMode::Filter);
    REQUIRE(parse_strict_mode("true") == StrictMode::On);
    REQUIRE(parse_strict_mode("off") == StrictMode::Off);
    REQUIRE_FALSE(parse_strict_mode("sometimes").has_value());
    REQUIRE(to_string(StrictMode::Filter) == "filter");
}

TEST_CASE("Valid frame gets the schema attached", "[frame][backend]") {
    FrameSchema schema{FrameSchemaConfig{
        .columns = {column("id", DataType::int64()), column("note", DataType::string())}}};
    auto f = orders();

    auto result = schema.validate(f);

    REQUIRE(result.has_value());
    REQUIRE(*result == f);
    REQUIRE(result->schema != nullptr);
    REQUIRE(result->schema->column_names() == std::vector<std::string>{"id", "note"});
    REQUIRE(schema.find_column("note") != nullptr);
    REQUIRE(schema.find_column("price") == nullptr);
}

TEST_CASE("Missing columns", "[frame][backend]") {
    FrameSchema schema{FrameSchemaConfig{
        .columns = {column("id"), column("qty"), column("sku"),
                    ColumnSchema{ArraySchemaConfig{.name = "extra", .required = false}}}}};

    auto result = schema.validate(orders(), ValidationOptions{.lazy = true});

    REQUIRE_FALSE(result.has_value());
    REQUIRE(reasons(result.error()) == std::vector<ReasonCode>{ReasonCode::ColumnNotInDataframe,
                                                               ReasonCode::ColumnNotInDataframe});
    const auto& errors = std::get<SchemaErrors>(result.error()).errors();
    REQUIRE(errors[0].column() == std::optional<std::string>{"qty"});
    REQUIRE(errors[1].column() == std::optional<std::string>{"sku"});
}

TEST_CASE("Strict modes", "[frame][backend]") {
    auto config = FrameSchemaConfig{.columns = {column("id"), column("price")}};

    SECTION("on reports undeclared columns") {
        config.strict = StrictMode::On;
        auto result = FrameSchema{config}.validate(orders());
        REQUIRE_FALSE(result.has_value());
        const auto& error = std::get<SchemaError>(result.error());
        REQUIRE(error.reason_code() == ReasonCode::ColumnNotInSchema);
        REQUIRE(error.column() == std::optional<std::string>{"note"});
    }

    SECTION("filter drops undeclared columns") {
        config.strict = StrictMode::Filter;
        auto f = orders();
        auto result = FrameSchema{config}.validate(f);
        REQUIRE(result.has_value());
        REQUIRE(result->column_names() == std::vector<std::string>{"id", "price"});
        REQUIRE(f.contains("note"));
    }
}

TEST_CASE("Ordered columns", "[frame][backend]") {
    FrameSchema schema{FrameSchemaConfig{
        .columns = {column("price"), column("id")}, .ordered = true}};

    auto result = schema.validate(orders());

    REQUIRE_FALSE(result.has_value());
    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.reason_code() == ReasonCode::ColumnNotOrdered);
    REQUIRE(error.column() == std::optional<std::string>{"price"});
}

TEST_CASE("Frame-level coercion", "[frame][backend][coerce]") {
    FrameSchema schema{FrameSchemaConfig{
        .columns = {column("price", DataType::float64())}, .coerce = true}};
    auto f = orders();

    auto result = schema.validate(f);

    REQUIRE(result.has_value());
    REQUIRE(engine::dtype(*result->find("price")) == DataType::float64());
    REQUIRE(engine::dtype(*f.find("price")) == DataType::string());
}

TEST_CASE("Column coercion failures are collected per column", "[frame][backend][coerce]") {
    FrameSchema schema{FrameSchemaConfig{
        .columns = {column("id", DataType::int64()), column("note", DataType::float64())},
        .coerce = true}};

    auto result = schema.validate(orders(), ValidationOptions{.lazy = true});

    REQUIRE_FALSE(result.has_value());
    const auto& errors = errors_of(result.error());
    REQUIRE(errors.front().reason_code() == ReasonCode::CoerceDtype);
    REQUIRE(errors.front().column() == std::optional<std::string>{"note"});
    REQUIRE(errors.front().failure_cases().size() == 3);
}

TEST_CASE("Without coercion a dtype mismatch is reported by the column", "[frame][backend]") {
    FrameSchema schema{FrameSchemaConfig{.columns = {column("price", DataType::float64())}}};

    auto result = schema.validate(orders());

    REQUIRE_FALSE(result.has_value());
    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.reason_code() == ReasonCode::WrongDtype);
    REQUIRE(error.schema().kind == SchemaKind::Column);
    REQUIRE(error.column() == std::optional<std::string>{"price"});
}

TEST_CASE("Unique subset", "[frame][backend][unique]") {
    Frame f;
    f.add_column("a", Column<std::int64_t>{1, 1, 1});
    f.add_column("b", Column<std::string>{"x", "x", "y"});

    SECTION("duplicates over the combination") {
        FrameSchema schema{FrameSchemaConfig{.unique = {"a", "b"}}};
        auto result = schema.validate(f);
        REQUIRE_FALSE(result.has_value());
        const auto& error = std::get<SchemaError>(result.error());
        REQUIRE(error.reason_code() == ReasonCode::Duplicates);
        REQUIRE(error.check() == "multiple_fields_uniqueness");
        // Two duplicate rows, one failure case per subset cell.
        REQUIRE(error.failure_cases().size() == 4);
        REQUIRE(failure_indices(error.failure_cases()) ==
                std::vector<std::int64_t>{0, 0, 1, 1});
    }

    SECTION("keep policy") {
        FrameSchema schema{FrameSchemaConfig{
            .unique = {"a", "b"}, .report_duplicates = ReportDuplicates::ExcludeFirst}};
        auto result = schema.validate(f);
        const auto& error = std::get<SchemaError>(result.error());
        REQUIRE(failure_indices(error.failure_cases()) == std::vector<std::int64_t>{1, 1});
    }

    SECTION("unique rows pass") {
        FrameSchema schema{FrameSchemaConfig{.unique = {"a"}, .report_duplicates =
                                                                   ReportDuplicates::All}};
        Frame g;
        g.add_column("a", Column<std::int64_t>{1, 2, 3});
        REQUIRE(schema.validate(g).has_value());
    }
}

TEST_CASE("Index schema validates row labels", "[frame][backend][index]") {
    FrameSchema schema{FrameSchemaConfig{
        .index = IndexSchema{ArraySchemaConfig{
            .name = "row", .checks = {checks::greater_than_or_equal_to(Scalar{std::int64_t{10}})},
            .unique = true}}}};
    auto f = orders();

    SECTION("positional labels fail the check") {
        auto result = schema.validate(f);
        REQUIRE_FALSE(result.has_value());
        const auto& error = std::get<SchemaError>(result.error());
        REQUIRE(error.schema().kind == SchemaKind::Index);
        REQUIRE(error.reason_code() == ReasonCode::DataframeCheck);
    }

    SECTION("explicit labels") {
        f.labels = std::vector<std::int64_t>{10, 11, 12};
        REQUIRE(schema.validate(f).has_value());
        f.labels = std::vector<std::int64_t>{10, 10, 12};
        auto result = schema.validate(f);
        REQUIRE(std::get<SchemaError>(result.error()).reason_code() ==
                ReasonCode::SeriesContainsDuplicates);
    }
}

TEST_CASE("Frame-wide checks run after the columns", "[frame][backend][checks]") {
    Frame f;
    f.add_column("lo", Column<std::int64_t>{1, 5, 2});
    f.add_column("hi", Column<std::int64_t>{2, 4, 3});
    auto lo_le_hi = Check::frame("lo_le_hi", [](const Frame& frame) -> CheckOutput {
        const auto lo = frame.series("lo").value();
        const auto hi = frame.series("hi").value();
        std::vector<bool> mask;
        for (std::size_t row = 0; row < frame.rows(); ++row) {
            mask.push_back(std::get<std::int64_t>(lo.value_at(row)) <=
                           std::get<std::int64_t>(hi.value_at(row)));
        }
        return mask;
    });
    FrameSchema schema{FrameSchemaConfig{
        .columns = {ColumnSchema{ArraySchemaConfig{
            .name = "lo", .checks = {checks::less_than(Scalar{std::int64_t{5}})}}}},
        .checks = {lo_le_hi}}};

    auto result = schema.validate(f, ValidationOptions{.lazy = true});

    REQUIRE_FALSE(result.has_value());
    REQUIRE(reasons(result.error()) ==
            std::vector<ReasonCode>{ReasonCode::DataframeCheck, ReasonCode::DataframeCheck});
    const auto& errors = errors_of(result.error());
    REQUIRE(errors[0].schema().kind == SchemaKind::Column);
    REQUIRE(errors[1].schema().kind == SchemaKind::Frame);
    REQUIRE(errors[1].check() == "lo_le_hi");
    REQUIRE(errors[1].failure_cases().size() == 2);
}

TEST_CASE("Element checks on a frame schema run over every cell", "[frame][backend][checks]") {
    Frame f;
    f.add_column("a", Column<std::int64_t>{1, 2});
    f.add_column("b", Column<std::int64_t>{3, -4});
    FrameSchema schema{FrameSchemaConfig{
        .checks = {checks::greater_than(Scalar{std::int64_t{0}})}}};

    auto result = schema.validate(f);

    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.failure_cases().size() == 1);
    REQUIRE(error.failure_cases()[0].column == std::optional<std::string>{"b"});
    REQUIRE(error.failure_cases()[0].index == 1);
}

TEST_CASE("Frame subsampling checks only selected rows", "[frame][backend][sample]") {
    Frame f;
    f.add_column("a", Column<std::int64_t>{1, 2, -3});
    FrameSchema schema{FrameSchemaConfig{.columns = {ColumnSchema{ArraySchemaConfig{
        .name = "a", .checks = {checks::greater_than(Scalar{std::int64_t{0}})}}}}}};

    auto head = schema.validate(f, ValidationOptions{.head = 2});
    REQUIRE(head.has_value());
    REQUIRE(head->rows() == 3);
    REQUIRE_FALSE(schema.validate(f, ValidationOptions{.tail = 1}).has_value());
}

TEST_CASE("validate_or_throw on frames", "[frame][backend]") {
    FrameSchema schema{FrameSchemaConfig{.columns = {column("qty")}}};

    REQUIRE_THROWS_AS(schema.validate_or_throw(orders()), SchemaError);
    REQUIRE_THROWS_AS(schema.validate_or_throw(orders(), ValidationOptions{.lazy = true}),
                      SchemaErrors);
}
