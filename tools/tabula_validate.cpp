#include <tabula/core/print.hpp>
#include <tabula/engine/dtype.hpp>
#include <tabula/io/csv.hpp>
#include <tabula/schema/frame_schema.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitInvalid = 1;
constexpr int kExitInputError = 2;

auto contains(const std::vector<std::string>& names, const std::string& name) -> bool {
    return std::ranges::find(names, name) != names.end();
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tabula_validate: validate a CSV file against a column schema"};
    app.set_version_flag("--version", "tabula_validate 0.1.0");

    std::string input_path;
    std::vector<std::string> column_specs;
    std::vector<std::string> nullable;
    std::vector<std::string> unique;
    std::vector<std::string> frame_unique;
    std::string keep = "all";
    std::string strict = "off";
    std::string null_spec = "<empty>";
    bool coerce = false;
    bool ordered = false;
    bool lazy = false;
    bool verbose = false;
    std::size_t head = 0;
    std::size_t tail = 0;
    std::size_t sample = 0;
    std::uint64_t seed = 0;

    app.add_option("input", input_path, "CSV file with a header row")->required();
    app.add_option("-c,--column", column_specs,
                   "Declare a column as NAME or NAME:DTYPE (e.g. price:float64)");
    app.add_option("--nullable", nullable, "Declared column allowed to hold nulls");
    app.add_option("--unique", unique, "Declared column whose values must be unique");
    app.add_option("--frame-unique", frame_unique,
                   "Column in the subset whose combined values must be unique per row");
    app.add_option("--keep", keep, "Occurrence of a duplicate not reported: first, last or all")
        ->check(CLI::IsMember({"first", "last", "all"}));
    app.add_flag("--coerce", coerce, "Coerce declared columns to their dtype");
    app.add_option("--strict", strict, "Undeclared columns: off, on (error) or filter (drop)")
        ->check(CLI::IsMember({"off", "on", "filter"}));
    app.add_flag("--ordered", ordered, "Declared columns must appear in declaration order");
    app.add_flag("--lazy", lazy, "Report every error instead of stopping at the first");
    auto* head_opt = app.add_option("--head", head, "Validate the first N rows");
    auto* tail_opt = app.add_option("--tail", tail, "Validate the last N rows");
    auto* sample_opt = app.add_option("--sample", sample, "Validate a random sample of N rows");
    auto* seed_opt = app.add_option("--seed", seed, "Seed for --sample")->needs(sample_opt);
    app.add_option("--nulls", null_spec,
                   "Comma-separated null tokens; <empty> marks empty cells as null");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto frame = tabula::io::read_csv(input_path, tabula::io::parse_null_spec(null_spec));
    if (!frame) {
        std::cerr << "tabula_validate: " << frame.error() << "\n";
        return kExitInputError;
    }

    tabula::FrameSchemaConfig config;
    for (const auto& spec : column_specs) {
        tabula::ArraySchemaConfig column;
        auto colon = spec.find(':');
        column.name = spec.substr(0, colon);
        if (colon != std::string::npos) {
            auto dtype = tabula::engine::parse_dtype(spec.substr(colon + 1));
            if (!dtype) {
                std::cerr << "tabula_validate: --column " << spec << ": " << dtype.error() << "\n";
                return kExitInputError;
            }
            column.dtype = *dtype;
        }
        column.nullable = contains(nullable, *column.name);
        column.unique = contains(unique, *column.name);
        column.report_duplicates = *tabula::parse_report_duplicates(keep);
        config.columns.emplace_back(std::move(column));
    }
    config.strict = *tabula::parse_strict_mode(strict);
    config.ordered = ordered;
    config.coerce = coerce;
    config.unique = frame_unique;
    config.report_duplicates = *tabula::parse_report_duplicates(keep);
    const tabula::FrameSchema schema{std::move(config)};

    tabula::ValidationOptions options;
    options.lazy = lazy;
    if (*head_opt) {
        options.head = head;
    }
    if (*tail_opt) {
        options.tail = tail;
    }
    if (*sample_opt) {
        options.sample = sample;
    }
    if (*seed_opt) {
        options.random_state = seed;
    }

    spdlog::info("validating {} ({} rows, {} columns)", input_path, frame->rows(),
                 frame->columns.size());
    auto validated = schema.validate(*frame, options);
    if (!validated) {
        std::cerr << tabula::describe(validated.error()) << "\n";
        return kExitInvalid;
    }
    spdlog::info("validation passed");
    tabula::print(*validated, std::cout);
    return 0;
}
