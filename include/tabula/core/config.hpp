#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tabula {

/// Which validation steps run.
enum class ValidationDepth : std::uint8_t {
    SchemaOnly,     ///< coercion and structure: names, dtypes, column presence
    DataOnly,       ///< value-level: nulls, uniqueness, declared checks
    SchemaAndData,  ///< everything
};

[[nodiscard]] auto to_string(ValidationDepth depth) -> std::string_view;

/// Accepts "SCHEMA_ONLY", "DATA_ONLY" and "SCHEMA_AND_DATA" (any case).
[[nodiscard]] auto parse_validation_depth(std::string_view text) -> std::optional<ValidationDepth>;

/// Process-wide validation switches.
struct Config {
    bool validation_enabled = true;
    ValidationDepth validation_depth = ValidationDepth::SchemaAndData;

    [[nodiscard]] auto schema_level() const noexcept -> bool {
        return validation_depth != ValidationDepth::DataOnly;
    }
    [[nodiscard]] auto data_level() const noexcept -> bool {
        return validation_depth != ValidationDepth::SchemaOnly;
    }

    auto operator==(const Config&) const -> bool = default;
};

/// Read TABULA_VALIDATION_ENABLED and TABULA_VALIDATION_DEPTH. Unset or
/// unrecognised values leave the defaults in place.
[[nodiscard]] auto config_from_env() -> Config;

/// The process configuration, read from the environment on first use.
[[nodiscard]] auto get_config() -> const Config&;

/// Per-call validation options.
struct ValidationOptions {
    /// Validate only the first `head` rows (unioned with tail and sample).
    std::optional<std::size_t> head;
    std::optional<std::size_t> tail;
    /// Validate a random sample of `sample` rows.
    std::optional<std::size_t> sample;
    /// Seed for `sample`; the same seed always selects the same rows.
    std::optional<std::uint64_t> random_state;
    /// Collect every error instead of stopping at the first.
    bool lazy = false;
    /// Validate (and coerce) the caller's object instead of a copy.
    bool inplace = false;
    /// Overrides the process configuration for this call.
    std::optional<Config> config;

    [[nodiscard]] auto effective_config() const -> const Config& {
        return config.has_value() ? *config : get_config();
    }
};

}  // namespace tabula
