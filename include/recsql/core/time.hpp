#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recsql {

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    constexpr Timestamp() = default;
    constexpr explicit Timestamp(std::int64_t n) : nanos(n) {}

    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Parse `YYYY-MM-DD HH:MM:SS[.fffffffff][Z|±HH:MM]` (a `T` separator is also
/// accepted). An offset is normalized to UTC. Instants outside the int64
/// nanosecond range yield nullopt.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

/// Format as `YYYY-MM-DD HH:MM:SS.fffffffff`.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Unix seconds as a Timestamp, or nullopt when the nanosecond count overflows.
[[nodiscard]] auto timestamp_from_seconds(std::int64_t seconds) -> std::optional<Timestamp>;

}  // namespace recsql

namespace std {

template <>
struct hash<recsql::Timestamp> {
    auto operator()(const recsql::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
