#include <tabula/check/builtin.hpp>

#include <robin_hood.h>
#include <fmt/format.h>

#include <memory>
#include <regex>
#include <stdexcept>
#include <utility>

namespace tabula::checks {

namespace {

auto ordering(const Scalar& value, const Scalar& bound, std::string_view check)
    -> std::partial_ordering {
    auto result = compare_scalars(value, bound);
    if (!result.has_value()) {
        throw std::invalid_argument(fmt::format("{}: comparison not supported between {} and {}",
                                                check, scalar_type_name(value),
                                                scalar_type_name(bound)));
    }
    return *result;
}

auto equivalent(const Scalar& lhs, const Scalar& rhs) -> bool {
    auto result = compare_scalars(lhs, rhs);
    return result.has_value() && *result == std::partial_ordering::equivalent;
}

auto as_string(const Scalar& value, std::string_view check) -> const std::string& {
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
        throw std::invalid_argument(fmt::format("{} can only be used with string values, got {}",
                                                check, scalar_type_name(value)));
    }
    return *text;
}

auto join(const std::vector<Scalar>& values) -> std::string {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += format_scalar(values[i]);
    }
    out += "]";
    return out;
}

using ScalarSet = robin_hood::unordered_flat_set<Scalar, ScalarHash, ScalarKeyEq>;

auto make_set(const std::vector<Scalar>& values) -> std::shared_ptr<const ScalarSet> {
    auto set = std::make_shared<ScalarSet>();
    for (const auto& value : values) {
        set->insert(value);
    }
    return set;
}

// Ordering comparison against a fixed bound; nulls reaching the predicate fail.
template <typename Accept>
auto compare_check(std::string name, Scalar bound, Accept accept, CheckOptions options) -> Check {
    auto label = name;
    return Check::element(
        std::move(name),
        [bound = std::move(bound), accept, label = std::move(label)](const Scalar& value) {
            if (is_null_value(value)) {
                return false;
            }
            return accept(ordering(value, bound, label));
        },
        std::move(options));
}

}  // namespace

auto equal_to(Scalar value, CheckOptions options) -> Check {
    auto name = fmt::format("equal_to({})", format_scalar(value));
    return Check::element(
        std::move(name),
        [value = std::move(value)](const Scalar& v) { return equivalent(v, value); },
        std::move(options));
}

auto not_equal_to(Scalar value, CheckOptions options) -> Check {
    auto name = fmt::format("not_equal_to({})", format_scalar(value));
    return Check::element(
        std::move(name),
        [value = std::move(value)](const Scalar& v) { return !equivalent(v, value); },
        std::move(options));
}

auto greater_than(Scalar min, CheckOptions options) -> Check {
    auto name = fmt::format("greater_than({})", format_scalar(min));
    return compare_check(
        std::move(name), std::move(min), [](std::partial_ordering o) { return o > 0; },
        std::move(options));
}

auto greater_than_or_equal_to(Scalar min, CheckOptions options) -> Check {
    auto name = fmt::format("greater_than_or_equal_to({})", format_scalar(min));
    return compare_check(
        std::move(name), std::move(min), [](std::partial_ordering o) { return o >= 0; },
        std::move(options));
}

auto less_than(Scalar max, CheckOptions options) -> Check {
    auto name = fmt::format("less_than({})", format_scalar(max));
    return compare_check(
        std::move(name), std::move(max), [](std::partial_ordering o) { return o < 0; },
        std::move(options));
}

auto less_than_or_equal_to(Scalar max, CheckOptions options) -> Check {
    auto name = fmt::format("less_than_or_equal_to({})", format_scalar(max));
    return compare_check(
        std::move(name), std::move(max), [](std::partial_ordering o) { return o <= 0; },
        std::move(options));
}

auto in_range(Scalar min, Scalar max, bool include_min, bool include_max, CheckOptions options)
    -> Check {
    auto name = fmt::format("in_range({}, {})", format_scalar(min), format_scalar(max));
    auto label = name;
    return Check::element(
        std::move(name),
        [min = std::move(min), max = std::move(max), include_min, include_max,
         label = std::move(label)](const Scalar& value) {
            if (is_null_value(value)) {
                return false;
            }
            auto lo = ordering(value, min, label);
            auto hi = ordering(value, max, label);
            bool above = include_min ? lo >= 0 : lo > 0;
            bool below = include_max ? hi <= 0 : hi < 0;
            return above && below;
        },
        std::move(options));
}

auto isin(std::vector<Scalar> allowed, CheckOptions options) -> Check {
    auto name = fmt::format("isin({})", join(allowed));
    return Check::element(
        std::move(name),
        [set = make_set(allowed)](const Scalar& value) { return set->count(value) > 0; },
        std::move(options));
}

auto notin(std::vector<Scalar> forbidden, CheckOptions options) -> Check {
    auto name = fmt::format("notin({})", join(forbidden));
    return Check::element(
        std::move(name),
        [set = make_set(forbidden)](const Scalar& value) { return set->count(value) == 0; },
        std::move(options));
}

auto unique_values_eq(std::vector<Scalar> values, CheckOptions options) -> Check {
    auto name = fmt::format("unique_values_eq({})", join(values));
    return Check::series(
        std::move(name),
        [expected = make_set(values)](const Series& data) -> CheckOutput {
            ScalarSet seen;
            for (std::size_t row = 0; row < data.size(); ++row) {
                auto value = data.value_at(row);
                if (!is_null_value(value)) {
                    seen.insert(std::move(value));
                }
            }
            if (seen.size() != expected->size()) {
                return false;
            }
            for (const auto& value : seen) {
                if (expected->count(value) == 0) {
                    return false;
                }
            }
            return true;
        },
        std::move(options));
}

auto str_matches(std::string pattern, CheckOptions options) -> Check {
    auto name = fmt::format("str_matches('{}')", pattern);
    auto regex = std::make_shared<const std::regex>(pattern);
    return Check::element(
        std::move(name),
        [regex](const Scalar& value) {
            return std::regex_match(as_string(value, "str_matches"), *regex);
        },
        std::move(options));
}

auto str_contains(std::string pattern, CheckOptions options) -> Check {
    auto name = fmt::format("str_contains('{}')", pattern);
    auto regex = std::make_shared<const std::regex>(pattern);
    return Check::element(
        std::move(name),
        [regex](const Scalar& value) {
            return std::regex_search(as_string(value, "str_contains"), *regex);
        },
        std::move(options));
}

auto str_startswith(std::string prefix, CheckOptions options) -> Check {
    auto name = fmt::format("str_startswith('{}')", prefix);
    return Check::element(
        std::move(name),
        [prefix = std::move(prefix)](const Scalar& value) {
            return as_string(value, "str_startswith").starts_with(prefix);
        },
        std::move(options));
}

auto str_endswith(std::string suffix, CheckOptions options) -> Check {
    auto name = fmt::format("str_endswith('{}')", suffix);
    return Check::element(
        std::move(name),
        [suffix = std::move(suffix)](const Scalar& value) {
            return as_string(value, "str_endswith").ends_with(suffix);
        },
        std::move(options));
}

auto str_length(std::optional<std::size_t> min, std::optional<std::size_t> max,
                CheckOptions options) -> Check {
    if (!min.has_value() && !max.has_value()) {
        throw std::invalid_argument("str_length needs at least one of min and max");
    }
    auto bound = [](std::optional<std::size_t> b) {
        return b.has_value() ? fmt::format("{}", *b) : std::string{"None"};
    };
    auto name = fmt::format("str_length({}, {})", bound(min), bound(max));
    return Check::element(
        std::move(name),
        [min, max](const Scalar& value) {
            auto length = as_string(value, "str_length").size();
            return (!min.has_value() || length >= *min) && (!max.has_value() || length <= *max);
        },
        std::move(options));
}

}  // namespace tabula::checks
