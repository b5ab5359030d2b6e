#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace tabula {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

inline constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
inline constexpr std::int64_t kNanosPerDay = 86'400 * kNanosPerSecond;

/// Parse `YYYY-MM-DD`. Returns nullopt for malformed text or impossible dates.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse `YYYY-MM-DD`, optionally followed by `[ T]HH:MM:SS[.fffffffff][Z]`.
/// Returns nullopt for instants outside the nanosecond range.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

[[nodiscard]] auto format_date(Date date) -> std::string;
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Midnight of the day containing `ts` (floor division, also before the epoch).
[[nodiscard]] auto date_of(Timestamp ts) noexcept -> Date;

/// Days on either side of the epoch that a nanosecond Timestamp can reach.
inline constexpr std::int64_t kMaxTimestampDays =
    std::numeric_limits<std::int64_t>::max() / kNanosPerDay;

/// Midnight of `date`; nullopt outside the nanosecond range
/// (about 1677-09-22 to 2262-04-11).
[[nodiscard]] constexpr auto timestamp_of(Date date) noexcept -> std::optional<Timestamp> {
    if (date.days > kMaxTimestampDays || date.days < -kMaxTimestampDays) {
        return std::nullopt;
    }
    return Timestamp{static_cast<std::int64_t>(date.days) * kNanosPerDay};
}

}  // namespace tabula

namespace std {

template <>
struct hash<tabula::Date> {
    auto operator()(const tabula::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<tabula::Timestamp> {
    auto operator()(const tabula::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
