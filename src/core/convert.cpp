#include <recsql/core/convert.hpp>
#include <recsql/core/format.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>

namespace recsql {

namespace {

auto try_parse_int(std::string_view text) -> std::optional<std::int64_t> {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t out = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

// Decimal or exponent notation, plus inf/infinity/nan in any case. Whitespace,
// hex and out-of-range magnitudes are rejected.
auto try_parse_double(std::string_view text) -> std::optional<double> {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }
    double out = 0.0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out, std::chars_format::general);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

}  // namespace

auto convert_int(const Value& value) -> std::optional<std::int64_t> {
    switch (value.kind()) {
        case ValueKind::Int:
            return std::get<std::int64_t>(value);
        case ValueKind::Double: {
            double v = std::get<double>(value);
            // Truncate toward zero; values with no int64 representation are rejected.
            constexpr auto kMin = static_cast<double>(std::numeric_limits<std::int64_t>::min());
            constexpr auto kMax = static_cast<double>(std::numeric_limits<std::int64_t>::max());
            if (!std::isfinite(v) || v < kMin || v >= kMax) {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(v);
        }
        case ValueKind::String:
            return try_parse_int(std::get<std::string>(value));
        case ValueKind::Bool:
            return std::get<bool>(value) ? 1 : 0;
        default:
            return std::nullopt;
    }
}

auto convert_double(const Value& value) -> std::optional<double> {
    switch (value.kind()) {
        case ValueKind::Double:
            return std::get<double>(value);
        case ValueKind::Int:
            return static_cast<double>(std::get<std::int64_t>(value));
        case ValueKind::String:
            return try_parse_double(std::get<std::string>(value));
        default:
            return std::nullopt;
    }
}

auto convert_string(const Value& value) -> std::optional<std::string> {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return format_value(value);
}

auto convert_bool(const Value& value) -> std::optional<bool> {
    switch (value.kind()) {
        case ValueKind::Bool:
            return std::get<bool>(value);
        case ValueKind::Int:
            return std::get<std::int64_t>(value) != 0;
        case ValueKind::Double:
            return std::get<double>(value) != 0.0;
        case ValueKind::String:
            return !std::get<std::string>(value).empty();
        default:
            return std::nullopt;
    }
}

auto convert_timestamp(const Value& value) -> std::optional<Timestamp> {
    switch (value.kind()) {
        case ValueKind::Timestamp:
            return std::get<Timestamp>(value);
        case ValueKind::String:
            return parse_timestamp(std::get<std::string>(value));
        case ValueKind::Int:
            return timestamp_from_seconds(std::get<std::int64_t>(value));
        default:
            return std::nullopt;
    }
}

}  // namespace recsql
