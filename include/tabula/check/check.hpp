#pragma once

#include <tabula/core/frame.hpp>
#include <tabula/error/failure_cases.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tabula {

/// What a check's predicate is evaluated over.
enum class CheckScope : std::uint8_t {
    Element,  ///< one value at a time
    Series,   ///< a whole column
    Frame,    ///< a whole frame
};

[[nodiscard]] auto to_string(CheckScope scope) -> std::string_view;

struct CheckOptions {
    /// Message reported on failure instead of the generated one.
    std::optional<std::string> error;
    /// Treat null rows as passing.
    bool ignore_na = true;
    /// Cap on the number of failure cases kept.
    std::optional<std::size_t> n_failure_cases;
    /// Log a warning on failure instead of reporting an error.
    bool raise_warning = false;
    std::optional<std::string> title;
    std::optional<std::string> description;
};

/// Outcome of applying a check to data.
struct CheckResult {
    bool passed = true;
    CheckOutput output = true;
    FailureCases failure_cases;
};

using ElementPredicate = std::function<bool(const Scalar&)>;
using SeriesPredicate = std::function<CheckOutput(const Series&)>;
using FramePredicate = std::function<CheckOutput(const Frame&)>;

/// A named predicate over an element, a column or a frame.
///
/// Checks never throw on a failed predicate; failures are reported through
/// CheckResult. An exception thrown by the predicate itself propagates to
/// the caller. Applying a check to data its scope cannot accept, or a
/// predicate returning a mask of the wrong length, is reported as an
/// unexpected result.
class Check {
   public:
    [[nodiscard]] static auto element(std::string name, ElementPredicate fn,
                                      CheckOptions options = {}) -> Check;
    [[nodiscard]] static auto series(std::string name, SeriesPredicate fn,
                                     CheckOptions options = {}) -> Check;
    [[nodiscard]] static auto frame(std::string name, FramePredicate fn,
                                    CheckOptions options = {}) -> Check;

    /// Identifier, e.g. "greater_than(0)".
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto scope() const noexcept -> CheckScope;
    [[nodiscard]] auto options() const noexcept -> const CheckOptions& { return options_; }

    /// Copy of this check with different options.
    [[nodiscard]] auto with_options(CheckOptions options) const -> Check;

    [[nodiscard]] auto operator()(const Series& data) const
        -> std::expected<CheckResult, std::string>;

    /// Apply to `data`. Element and series checks run against `column`,
    /// which must then name a column of the frame. Without a column an
    /// element check runs over every cell; a row passes when all its cells do.
    [[nodiscard]] auto operator()(const Frame& data,
                                  const std::optional<std::string>& column = std::nullopt) const
        -> std::expected<CheckResult, std::string>;

   private:
    using Predicate = std::variant<ElementPredicate, SeriesPredicate, FramePredicate>;

    Check(std::string name, Predicate fn, CheckOptions options);

    [[nodiscard]] auto apply_cells(const Frame& data) const -> CheckResult;

    std::string name_;
    Predicate fn_;
    CheckOptions options_;
};

}  // namespace tabula
