#pragma once
// log_level: RECSQL_LOG_LEVEL parsing for the command-line tools.

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <string_view>

/// Level named by `text`, or nullopt when spdlog does not know the name.
///
/// spdlog::level::from_str maps unknown names to `off`, so `off` is only
/// accepted when spelled out.
inline auto parse_log_level(std::string_view text) -> std::optional<spdlog::level::level_enum> {
    auto level = spdlog::level::from_str(std::string(text));
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}
