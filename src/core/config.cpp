#include <tabula/core/config.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace tabula {

namespace {

auto upper(std::string_view text) -> std::string {
    std::string out{text};
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto parse_enabled(std::string_view text) -> std::optional<bool> {
    auto value = upper(text);
    if (value == "0" || value == "FALSE" || value == "NO" || value == "OFF") {
        return false;
    }
    if (value == "1" || value == "TRUE" || value == "YES" || value == "ON") {
        return true;
    }
    return std::nullopt;
}

}  // namespace

auto to_string(ValidationDepth depth) -> std::string_view {
    switch (depth) {
        case ValidationDepth::SchemaOnly:
            return "SCHEMA_ONLY";
        case ValidationDepth::DataOnly:
            return "DATA_ONLY";
        case ValidationDepth::SchemaAndData:
            return "SCHEMA_AND_DATA";
    }
    return "SCHEMA_AND_DATA";
}

auto parse_validation_depth(std::string_view text) -> std::optional<ValidationDepth> {
    auto value = upper(text);
    if (value == "SCHEMA_ONLY") {
        return ValidationDepth::SchemaOnly;
    }
    if (value == "DATA_ONLY") {
        return ValidationDepth::DataOnly;
    }
    if (value == "SCHEMA_AND_DATA") {
        return ValidationDepth::SchemaAndData;
    }
    return std::nullopt;
}

auto config_from_env() -> Config {
    Config config;
    if (const char* enabled = std::getenv("TABULA_VALIDATION_ENABLED")) {
        if (auto parsed = parse_enabled(enabled)) {
            config.validation_enabled = *parsed;
        } else {
            spdlog::warn("ignoring TABULA_VALIDATION_ENABLED='{}'", enabled);
        }
    }
    if (const char* depth = std::getenv("TABULA_VALIDATION_DEPTH")) {
        if (auto parsed = parse_validation_depth(depth)) {
            config.validation_depth = *parsed;
        } else {
            spdlog::warn("ignoring TABULA_VALIDATION_DEPTH='{}'", depth);
        }
    }
    return config;
}

auto get_config() -> const Config& {
    static const Config config = config_from_env();
    return config;
}

}  // namespace tabula
