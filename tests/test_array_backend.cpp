#include <tabula/backend/array_backend.hpp>
#include <tabula/backend/check_runner.hpp>
#include <tabula/check/builtin.hpp>
#include <tabula/schema/array_schema.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace tabula;
using engine::DataType;

auto reasons(const ValidationError& error) -> std::vector<ReasonCode> {
    std::vector<ReasonCode> out;
    for (const auto& e : errors_of(error)) {
        out.push_back(e.reason_code());
    }
    return out;
}

auto lazy() -> ValidationOptions {
    return ValidationOptions{.lazy = true};
}

}  // namespace

TEST_CASE("Valid series passes and gets the schema attached", "[backend][series]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "qty",
        .dtype = DataType::int64(),
        .checks = {checks::greater_than_or_equal_to(Scalar{std::int64_t{0}})},
    }};
    Series s{"qty", Column<std::int64_t>{0, 3, 7}};

    auto result = schema.validate(s);

    REQUIRE(result.has_value());
    REQUIRE(*result == s);
    REQUIRE(result->schema != nullptr);
    REQUIRE(result->schema->name() == std::optional<std::string>{"qty"});
    REQUIRE(s.schema == nullptr);
}

TEST_CASE("Validation is idempotent", "[backend][series]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v", .dtype = DataType::float64(), .coerce = true}};
    Series s{"v", Column<std::string>{"1.5", "2"}};

    auto once = schema.validate(s);
    REQUIRE(once.has_value());
    auto twice = schema.validate(*once);
    REQUIRE(twice.has_value());
    REQUIRE(*twice == *once);
}

TEST_CASE("Dtype mismatch without coercion is one wrong_dtype error", "[backend][dtype]") {
    SeriesSchema schema{ArraySchemaConfig{.name = "v", .dtype = DataType::int64()}};
    Series s{"v", Column<std::string>{"1", "2"}};

    auto result = schema.validate(s, lazy());

    REQUIRE_FALSE(result.has_value());
    REQUIRE(reasons(result.error()) == std::vector<ReasonCode>{ReasonCode::WrongDtype});
    const auto& error = errors_of(result.error()).front();
    REQUIRE(error.check() == "dtype('int64')");
    REQUIRE(std::get<std::string>(error.failure_cases().front().value) == "str");
}

TEST_CASE("Object column dtype check reports offending elements", "[backend][dtype]") {
    SeriesSchema schema{ArraySchemaConfig{.name = "v", .dtype = DataType::int64()}};
    Series s{"v", Column<Scalar>{Scalar{std::int64_t{1}}, Scalar{std::string{"x"}}}};

    auto result = schema.validate(s);

    REQUIRE_FALSE(result.has_value());
    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.reason_code() == ReasonCode::WrongDtype);
    REQUIRE(failure_indices(error.failure_cases()) == std::vector<std::int64_t>{1});
}

TEST_CASE("Coercion failure is a coerce_dtype error", "[backend][coerce]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v", .dtype = DataType::int64(), .coerce = true}};
    Series s{"v", Column<std::string>{"1", "x", "3"}};

    auto result = schema.validate(s);

    REQUIRE_FALSE(result.has_value());
    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.reason_code() == ReasonCode::CoerceDtype);
    REQUIRE(error.check() == "coerce_dtype('int64')");
    REQUIRE(failure_indices(error.failure_cases()) == std::vector<std::int64_t>{1});
}

TEST_CASE("Coercion never mutates the caller's series", "[backend][coerce]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v", .dtype = DataType::int64(), .coerce = true}};
    Series s{"v", Column<std::string>{"1", "2"}};
    auto before = s.copy();

    SECTION("copying validation") {
        auto result = schema.validate(s);
        REQUIRE(result.has_value());
        REQUIRE(engine::dtype(*result->column) == DataType::int64());
    }

    SECTION("inplace validation") {
        auto result = schema.validate(s, ValidationOptions{.inplace = true});
        REQUIRE(result.has_value());
        REQUIRE(engine::dtype(*result->column) == DataType::int64());
    }

    REQUIRE(s == before);
    REQUIRE(std::holds_alternative<Column<std::string>>(*s.column));
}

TEST_CASE("Lazy validation reports every violation", "[backend][lazy]") {
    SeriesSchema schema{ArraySchemaConfig{.name = "v", .nullable = false, .unique = true}};
    Series s{"v", Column<std::int64_t>{1, 1, 0}, {true, true, false}};

    auto result = schema.validate(s, lazy());

    REQUIRE_FALSE(result.has_value());
    const auto& aggregate = std::get<SchemaErrors>(result.error());
    REQUIRE(reasons(result.error()) ==
            std::vector<ReasonCode>{ReasonCode::SeriesContainsNulls,
                                    ReasonCode::SeriesContainsDuplicates});
    REQUIRE(failure_indices(aggregate.errors()[0].failure_cases()) ==
            std::vector<std::int64_t>{2});
    REQUIRE(failure_indices(aggregate.errors()[1].failure_cases()) ==
            std::vector<std::int64_t>{0, 1});
}

TEST_CASE("Eager validation stops at the first failing step", "[backend][eager]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v",
        .dtype = DataType::float64(),
        .checks = {checks::greater_than(Scalar{std::int64_t{100}})},
        .nullable = false,
        .unique = true,
    }};

    SECTION("name comes first") {
        Series s{"w", Column<std::int64_t>{1, 1}, {true, false}};
        auto result = schema.validate(s);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(std::get<SchemaError>(result.error()).reason_code() ==
                ReasonCode::WrongFieldName);
    }

    SECTION("nulls before duplicates and dtype") {
        Series s{"v", Column<std::int64_t>{1, 1, 0}, {true, true, false}};
        auto result = schema.validate(s);
        REQUIRE(std::get<SchemaError>(result.error()).reason_code() ==
                ReasonCode::SeriesContainsNulls);
    }

    SECTION("dtype before declared checks") {
        Series s{"v", Column<std::int64_t>{1, 2}};
        auto result = schema.validate(s);
        REQUIRE(std::get<SchemaError>(result.error()).reason_code() == ReasonCode::WrongDtype);
    }

    SECTION("declared checks last") {
        Series s{"v", Column<double>{1.0, 2.0}};
        auto result = schema.validate(s);
        const auto& error = std::get<SchemaError>(result.error());
        REQUIRE(error.reason_code() == ReasonCode::DataframeCheck);
        REQUIRE(error.check() == "greater_than(100)");
        REQUIRE(error.check_index() == 0);
        REQUIRE(failure_indices(error.failure_cases()) == std::vector<std::int64_t>{0, 1});
    }
}

TEST_CASE("Duplicate reporting follows the keep policy", "[backend][unique]") {
    Series s{"v", Column<std::int64_t>{1, 1, 2, 1}};
    auto indices_for = [&](ReportDuplicates keep) {
        SeriesSchema schema{ArraySchemaConfig{
            .name = "v", .unique = true, .report_duplicates = keep}};
        auto result = schema.validate(s);
        REQUIRE_FALSE(result.has_value());
        return failure_indices(std::get<SchemaError>(result.error()).failure_cases());
    };

    REQUIRE(indices_for(ReportDuplicates::ExcludeFirst) == std::vector<std::int64_t>{1, 3});
    REQUIRE(indices_for(ReportDuplicates::ExcludeLast) == std::vector<std::int64_t>{0, 1});
    REQUIRE(indices_for(ReportDuplicates::All) == std::vector<std::int64_t>{0, 1, 3});
}

TEST_CASE("Throwing checks become check_error and lazy runs continue", "[backend][checks]") {
    auto boom = Check::element("boom", [](const Scalar&) -> bool {
        throw std::runtime_error("kaboom");
    });
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v",
        .checks = {boom, checks::less_than(Scalar{std::int64_t{0}})},
    }};
    Series s{"v", Column<std::int64_t>{1}};

    auto result = schema.validate(s, lazy());

    REQUIRE_FALSE(result.has_value());
    REQUIRE(reasons(result.error()) ==
            std::vector<ReasonCode>{ReasonCode::CheckError, ReasonCode::DataframeCheck});
    const auto& first = errors_of(result.error()).front();
    REQUIRE(first.message() ==
            "Error while executing check function: runtime_error(\"kaboom\")");
    REQUIRE(first.check_index() == 0);
}

TEST_CASE("Nested check exceptions report the root cause", "[backend][checks]") {
    auto layered = Check::element("layered", [](const Scalar&) -> bool {
        try {
            throw std::invalid_argument("root cause");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("dispatch"));
        }
    });
    SeriesSchema schema{ArraySchemaConfig{.name = "v", .checks = {layered}}};

    auto result = schema.validate(Series{"v", Column<std::int64_t>{1}});

    REQUIRE_FALSE(result.has_value());
    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.reason_code() == ReasonCode::CheckError);
    REQUIRE(error.message().find("invalid_argument(\"root cause\")") != std::string::npos);
    REQUIRE(error.message().find("dispatch") == std::string::npos);
    REQUIRE(error.failure_cases().size() == 1);
    const auto& cause = std::get<std::string>(error.failure_cases()[0].value);
    REQUIRE(cause == "invalid_argument(\"root cause\")");
}

TEST_CASE("Exception descriptions name the exception kind", "[backend][checks]") {
    REQUIRE(backend::describe_exception(std::out_of_range("row 9")) == "out_of_range(\"row 9\")");
    REQUIRE(backend::describe_exception(std::logic_error("x")) == "logic_error(\"x\")");
    REQUIRE(backend::describe_exception(std::bad_alloc{}).starts_with("bad_alloc(\""));
}

TEST_CASE("Comparing incomparable kinds is a check_error", "[backend][checks]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v", .checks = {checks::greater_than(Scalar{std::int64_t{0}})}}};
    Series s{"v", Column<std::string>{"a"}};

    auto result = schema.validate(s);

    REQUIRE(std::get<SchemaError>(result.error()).reason_code() == ReasonCode::CheckError);
}

TEST_CASE("Frame checks on a series schema are check errors", "[backend][checks]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v",
        .checks = {Check::frame("wide", [](const Frame&) -> CheckOutput { return true; })},
    }};

    auto result = schema.validate(Series{"v", Column<std::int64_t>{1}});

    REQUIRE(std::get<SchemaError>(result.error()).reason_code() == ReasonCode::CheckError);
}

TEST_CASE("Warning checks never fail validation", "[backend][checks]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v",
        .checks = {checks::less_than(Scalar{std::int64_t{0}},
                                     CheckOptions{.raise_warning = true})},
    }};

    REQUIRE(schema.validate(Series{"v", Column<std::int64_t>{5}}).has_value());
}

TEST_CASE("Custom error text replaces the check name", "[backend][checks]") {
    SeriesSchema schema{ArraySchemaConfig{
        .name = "v",
        .checks = {checks::less_than(Scalar{std::int64_t{0}},
                                     CheckOptions{.error = "must be negative"})},
    }};

    auto result = schema.validate(Series{"v", Column<std::int64_t>{5}});

    const auto& error = std::get<SchemaError>(result.error());
    REQUIRE(error.message().find("must be negative") != std::string::npos);
}

TEST_CASE("Subsampling", "[backend][sample]") {
    SECTION("head, tail and sample are unioned in order") {
        auto positions = backend::sample_positions(
            10, ValidationOptions{.head = 2, .tail = 3, .sample = std::nullopt});
        REQUIRE(positions.has_value());
        REQUIRE(*positions == std::vector<std::size_t>{0, 1, 7, 8, 9});
    }

    SECTION("overlapping head and tail do not repeat rows") {
        auto positions = backend::sample_positions(3, ValidationOptions{.head = 2, .tail = 2});
        REQUIRE(*positions == std::vector<std::size_t>{0, 1, 2});
    }

    SECTION("no option means every row") {
        REQUIRE_FALSE(backend::sample_positions(5, ValidationOptions{}).has_value());
    }

    SECTION("the same seed selects the same rows") {
        ValidationOptions options{.sample = 4, .random_state = 42};
        auto a = backend::sample_positions(100, options);
        auto b = backend::sample_positions(100, options);
        REQUIRE(a == b);
        REQUIRE(a->size() == 4);
    }

    SECTION("only sampled rows are checked") {
        SeriesSchema schema{ArraySchemaConfig{
            .name = "v", .checks = {checks::greater_than(Scalar{std::int64_t{0}})}}};
        Series s{"v", Column<std::int64_t>{1, 2, -3, 4}};

        REQUIRE(schema.validate(s, ValidationOptions{.head = 2}).has_value());
        REQUIRE_FALSE(schema.validate(s, ValidationOptions{.tail = 2}).has_value());
    }

    SECTION("the full series is returned") {
        SeriesSchema schema{ArraySchemaConfig{.name = "v"}};
        Series s{"v", Column<std::int64_t>{1, 2, 3}};
        auto result = schema.validate(s, ValidationOptions{.head = 1});
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 3);
    }
}

TEST_CASE("Column schema against a frame", "[backend][column]") {
    Frame f;
    f.add_column("price", Column<std::string>{"1.5", "2.5"});

    SECTION("coerces the named column") {
        ColumnSchema schema{ArraySchemaConfig{
            .name = "price", .dtype = DataType::float64(), .coerce = true}};
        auto result = schema.validate(f);
        REQUIRE(result.has_value());
        REQUIRE(engine::dtype(*result->find("price")) == DataType::float64());
        REQUIRE(engine::dtype(*f.find("price")) == DataType::string());
    }

    SECTION("missing required column") {
        ColumnSchema schema{ArraySchemaConfig{.name = "qty"}};
        auto result = schema.validate(f);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(std::get<SchemaError>(result.error()).reason_code() ==
                ReasonCode::ColumnNotInDataframe);
    }

    SECTION("missing optional column") {
        ColumnSchema schema{ArraySchemaConfig{.name = "qty", .required = false}};
        REQUIRE(schema.validate(f).has_value());
    }

    SECTION("a column schema needs a name") {
        REQUIRE_THROWS_AS(ColumnSchema{ArraySchemaConfig{}}, std::invalid_argument);
    }

    SECTION("with_coerce shares everything else") {
        ColumnSchema schema{ArraySchemaConfig{.name = "price", .dtype = DataType::float64()}};
        auto coercing = schema.with_coerce(true);
        REQUIRE(coercing.coerce());
        REQUIRE_FALSE(schema.coerce());
        REQUIRE(coercing.dtype() == schema.dtype());
    }
}

TEST_CASE("Throwing helpers", "[backend][series]") {
    SeriesSchema schema{ArraySchemaConfig{.name = "v", .nullable = false}};
    Series s{"v", Column<double>{1.0, 0.0}, {true, false}};

    REQUIRE_THROWS_AS(schema.validate_or_throw(s), SchemaError);
    REQUIRE_THROWS_AS(schema.validate_or_throw(s, lazy()), SchemaErrors);
}
