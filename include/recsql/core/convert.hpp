#pragma once

#include <recsql/core/time.hpp>
#include <recsql/core/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace recsql {

// ─── Value coercion ───────────────────────────────────────────────────────────
//  Null and non-convertible values yield nullopt; none of these throw.

[[nodiscard]] auto convert_int(const Value& value) -> std::optional<std::int64_t>;
[[nodiscard]] auto convert_double(const Value& value) -> std::optional<double>;
[[nodiscard]] auto convert_string(const Value& value) -> std::optional<std::string>;
[[nodiscard]] auto convert_bool(const Value& value) -> std::optional<bool>;
[[nodiscard]] auto convert_timestamp(const Value& value) -> std::optional<Timestamp>;

template <typename T>
inline constexpr bool is_convertible_target_v =
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, double> ||
    std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_same_v<T, Timestamp> ||
    std::is_same_v<T, Record> || std::is_same_v<T, RecordSeq>;

template <typename T>
concept ConvertibleTarget = is_convertible_target_v<T>;

template <ConvertibleTarget T>
[[nodiscard]] auto convert(const Value& value) -> std::optional<T> {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return convert_int(value);
    } else if constexpr (std::is_same_v<T, double>) {
        return convert_double(value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return convert_string(value);
    } else if constexpr (std::is_same_v<T, bool>) {
        return convert_bool(value);
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return convert_timestamp(value);
    } else {
        if (const auto* typed = std::get_if<T>(&value)) {
            return *typed;
        }
        return std::nullopt;
    }
}

// ─── Record accessor ──────────────────────────────────────────────────────────

/// Field `name` converted to T; nullopt when absent or not convertible.
template <ConvertibleTarget T>
[[nodiscard]] auto get(const Record& record, const std::string& name) -> std::optional<T> {
    const auto* value = record.find(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return convert<T>(*value);
}

template <ConvertibleTarget T>
[[nodiscard]] auto get_or(const Record& record, const std::string& name, T fallback) -> T {
    if (auto value = get<T>(record, name)) {
        return std::move(*value);
    }
    return fallback;
}

}  // namespace recsql
