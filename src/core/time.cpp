#include <tabula/core/time.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

namespace tabula {

namespace {

auto parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int& out) -> bool {
    if (pos + len > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    const char* last = first + len;
    if (*first == '-' || *first == '+') {
        return false;
    }
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

auto days_from_ymd(int y, int m, int d) -> std::optional<std::int32_t> {
    using namespace std::chrono;
    if (m < 1 || d < 1) {
        return std::nullopt;
    }
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(sys_days{ymd}.time_since_epoch().count());
}

// a + b for b >= 0; nullopt on overflow.
auto add_nanos(std::int64_t a, std::int64_t b) -> std::optional<std::int64_t> {
    if (a > std::numeric_limits<std::int64_t>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

}  // namespace

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    int m = 0;
    int d = 0;
    if (!parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, m) || !parse_fixed(text, 8, 2, d)) {
        return std::nullopt;
    }
    auto days = days_from_ymd(y, m, d);
    if (!days) {
        return std::nullopt;
    }
    return Date{*days};
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (!text.empty() && text.back() == 'Z') {
        text.remove_suffix(1);
    }
    auto date = parse_date(text.substr(0, std::min<std::size_t>(text.size(), 10)));
    if (!date) {
        return std::nullopt;
    }
    auto midnight = timestamp_of(*date);
    if (!midnight) {
        return std::nullopt;
    }
    if (text.size() == 10) {
        return midnight;
    }
    // `YYYY-MM-DD HH:MM:SS` is 19 characters.
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!parse_fixed(text, 11, 2, hh) || !parse_fixed(text, 14, 2, mm) ||
        !parse_fixed(text, 17, 2, ss)) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    auto nanos = add_nanos(midnight->nanos,
                           (static_cast<std::int64_t>(hh) * 3600 + mm * 60 + ss) * kNanosPerSecond);
    if (!nanos) {
        return std::nullopt;
    }
    if (text.size() == 19) {
        return Timestamp{*nanos};
    }
    if (text[19] != '.') {
        return std::nullopt;
    }
    auto fraction = text.substr(20);
    if (fraction.empty() || fraction.size() > 9) {
        return std::nullopt;
    }
    std::int64_t frac_nanos = 0;
    for (char ch : fraction) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        frac_nanos = frac_nanos * 10 + (ch - '0');
    }
    for (std::size_t i = fraction.size(); i < 9; ++i) {
        frac_nanos *= 10;
    }
    auto total = add_nanos(*nanos, frac_nanos);
    if (!total) {
        return std::nullopt;
    }
    return Timestamp{*total};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto date_of(Timestamp ts) noexcept -> Date {
    std::int64_t days = ts.nanos / kNanosPerDay;
    if (ts.nanos % kNanosPerDay < 0) {
        --days;
    }
    return Date{static_cast<std::int32_t>(days)};
}

}  // namespace tabula
