#include <tabula/error/error_handler.hpp>
#include <tabula/error/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace tabula;

const SchemaContext kColumn{.kind = SchemaKind::Column, .name = "price"};

auto make_error(ReasonCode code, std::string check, FailureCases cases = {}) -> SchemaError {
    return SchemaError{ErrorDetail{
        .schema = kColumn,
        .message = "failed " + check,
        .reason_code = code,
        .failure_cases = std::move(cases),
        .check = std::move(check),
        .check_index = std::nullopt,
        .column = "price",
        .data = nullptr,
    }};
}

auto data() -> std::shared_ptr<const CheckObject> {
    return std::make_shared<const CheckObject>(Series{"price", Column<std::int64_t>{1}});
}

}  // namespace

TEST_CASE("Reason codes round-trip through their names", "[error]") {
    REQUIRE(to_string(ReasonCode::SeriesContainsNulls) == "series_contains_nulls");
    REQUIRE(parse_reason_code("column_not_ordered") == ReasonCode::ColumnNotOrdered);
    REQUIRE_FALSE(parse_reason_code("nope").has_value());
}

TEST_CASE("Schema context descriptions", "[error]") {
    REQUIRE(kColumn.describe() == "Column 'price'");
    REQUIRE(SchemaContext{.kind = SchemaKind::Frame}.describe() == "DataFrameSchema");
}

TEST_CASE("Eager handler keeps only the first error", "[error][handler]") {
    ErrorHandler handler{false};
    REQUIRE_FALSE(handler.should_stop());

    handler.collect_error(make_error(ReasonCode::SeriesContainsNulls, "not_nullable"));
    REQUIRE(handler.should_stop());
    handler.collect_error(make_error(ReasonCode::SeriesContainsDuplicates, "field_uniqueness"));

    REQUIRE(handler.collected_errors().size() == 1);
    auto result = handler.finish(kColumn, data());
    REQUIRE(result.has_value());
    const auto* single = std::get_if<SchemaError>(&*result);
    REQUIRE(single != nullptr);
    REQUIRE(single->reason_code() == ReasonCode::SeriesContainsNulls);
}

TEST_CASE("Lazy handler aggregates in collection order", "[error][handler]") {
    ErrorHandler handler{true};
    handler.collect_error(make_error(ReasonCode::SeriesContainsNulls, "not_nullable",
                                     {FailureCase{.column = "price", .index = 3, .value = {}}}));
    handler.collect_error(
        make_error(ReasonCode::SeriesContainsDuplicates, "field_uniqueness",
                   {FailureCase{.column = "price", .index = 1, .value = std::int64_t{7}},
                    FailureCase{.column = "price", .index = 2, .value = std::int64_t{7}}}));
    handler.collect_error(make_error(ReasonCode::SeriesContainsNulls, "not_nullable"));
    REQUIRE_FALSE(handler.should_stop());

    auto result = handler.finish(kColumn, data());

    REQUIRE(result.has_value());
    const auto& aggregate = std::get<SchemaErrors>(*result);
    REQUIRE(aggregate.errors().size() == 3);
    REQUIRE(aggregate.errors()[1].check() == "field_uniqueness");
    REQUIRE(aggregate.error_counts().at(ReasonCode::SeriesContainsNulls) == 2);
    REQUIRE(aggregate.error_counts().at(ReasonCode::SeriesContainsDuplicates) == 1);
    REQUIRE(aggregate.failure_cases().size() == 3);
    REQUIRE(aggregate.failure_cases()[2].index == 2);
    REQUIRE(errors_of(*result).size() == 3);

    std::string summary = aggregate.what();
    REQUIRE(summary.find("a total of 3 schema errors") != std::string::npos);
    REQUIRE(summary.find("series_contains_duplicates: 1") != std::string::npos);
    REQUIRE(summary.find("field_uniqueness") != std::string::npos);
}

TEST_CASE("Nothing collected means success", "[error][handler]") {
    ErrorHandler handler{true};
    REQUIRE_FALSE(handler.finish(kColumn, data()).has_value());
}

TEST_CASE("Collected errors can be re-classified", "[error][handler]") {
    ErrorHandler handler{true};
    auto original = make_error(ReasonCode::DataframeCheck, "boom");

    handler.collect_error(ReasonCode::CheckError, original);

    REQUIRE(handler.collected_errors().front().reason_code() == ReasonCode::CheckError);
    REQUIRE(original.reason_code() == ReasonCode::DataframeCheck);
}

TEST_CASE("Nested validation errors are flattened", "[error][handler]") {
    ErrorHandler inner{true};
    inner.collect_error(make_error(ReasonCode::WrongDtype, "dtype('int64')"));
    inner.collect_error(make_error(ReasonCode::SeriesContainsNulls, "not_nullable"));
    auto nested = inner.finish(kColumn, data());
    REQUIRE(nested.has_value());

    ErrorHandler outer{true};
    outer.collect_errors(*nested);

    REQUIRE(outer.collected_errors().size() == 2);
}

TEST_CASE("raise throws the held error type", "[error]") {
    ValidationError single{std::in_place_type<SchemaError>,
                           make_error(ReasonCode::WrongDtype, "dtype('int64')")};
    REQUIRE_THROWS_AS(raise(single), SchemaError);
    REQUIRE(describe(single) == "failed dtype('int64')");

    ValidationError many{std::in_place_type<SchemaErrors>, kColumn,
                         std::vector<SchemaError>{make_error(ReasonCode::WrongDtype, "x")},
                         data()};
    REQUIRE_THROWS_AS(raise(many), SchemaErrors);
}
