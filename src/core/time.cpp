#include <recsql/core/time.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>

namespace recsql {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

auto parse_int(std::string_view part) -> std::optional<int> {
    int value = 0;
    auto result = std::from_chars(part.data(), part.data() + part.size(), value);
    if (result.ec != std::errc() || result.ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

// seconds * 1e9 + frac, or nullopt outside the int64 range. frac is in [0, 1e9).
auto checked_nanos(std::int64_t seconds, std::int64_t frac) -> std::optional<std::int64_t> {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (seconds > kMax / kNanosPerSecond || seconds < kMin / kNanosPerSecond) {
        return std::nullopt;
    }
    std::int64_t nanos = seconds * kNanosPerSecond;
    if (nanos > kMax - frac) {
        return std::nullopt;
    }
    return nanos + frac;
}

}  // namespace

auto timestamp_from_seconds(std::int64_t seconds) -> std::optional<Timestamp> {
    auto nanos = checked_nanos(seconds, 0);
    if (!nanos) {
        return std::nullopt;
    }
    return Timestamp{*nanos};
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    auto year = parse_int(text.substr(0, 4));
    auto month = parse_int(text.substr(5, 2));
    auto day = parse_int(text.substr(8, 2));
    auto hour = parse_int(text.substr(11, 2));
    auto minute = parse_int(text.substr(14, 2));
    auto second = parse_int(text.substr(17, 2));
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }
    if (*hour < 0 || *hour > 23 || *minute < 0 || *minute > 59 || *second < 0 || *second > 59) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t frac = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos += 1;
        std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            pos += 1;
        }
        std::size_t digits = pos - start;
        if (digits == 0 || digits > 9) {
            return std::nullopt;
        }
        auto result = std::from_chars(text.data() + start, text.data() + pos, frac);
        if (result.ec != std::errc()) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 9; ++i) {
            frac *= 10;
        }
    }
    std::int64_t offset_seconds = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        pos += 1;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        // ±HH:MM
        if (text.size() - pos != 6 || text[pos + 3] != ':') {
            return std::nullopt;
        }
        auto off_hour = parse_int(text.substr(pos + 1, 2));
        auto off_minute = parse_int(text.substr(pos + 4, 2));
        if (!off_hour || !off_minute || *off_hour < 0 || *off_hour > 23 || *off_minute < 0 ||
            *off_minute > 59) {
            return std::nullopt;
        }
        offset_seconds = static_cast<std::int64_t>(*off_hour) * 3'600 + *off_minute * 60;
        if (text[pos] == '-') {
            offset_seconds = -offset_seconds;
        }
        pos += 6;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
                       std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    std::int64_t days_since = sys_days{ymd}.time_since_epoch().count();
    std::int64_t seconds =
        days_since * 86'400 + *hour * 3'600 + *minute * 60 + *second - offset_seconds;
    auto nanos = checked_nanos(seconds, frac);
    if (!nanos) {
        return std::nullopt;
    }
    return Timestamp{*nanos};
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

}  // namespace recsql
