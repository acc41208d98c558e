#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <optional>
#include <string>
#include <string_view>

namespace corvid {

namespace log = spdlog;

// Level named by a config string ("trace" ... "critical", "off"), std::nullopt for an unknown name.
inline std::optional<log::level::level_enum> LogLevelFromName(std::string_view name) {
  const auto level = log::level::from_str(std::string(name));
  if (level == log::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace corvid
