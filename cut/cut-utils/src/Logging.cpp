#include "cut-utils/src/Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace cut_utils
{

std::shared_ptr<spdlog::logger> getLogger(const std::string& name)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }
  return spdlog::stdout_color_mt(name);
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  return std::make_shared<spdlog::logger>(
    name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

spdlog::level::level_enum parseLogLevel(const std::string& levelName)
{
  using spdlog::level::level_enum;
  constexpr std::array<std::pair<std::string_view, level_enum>, 8> kLevels{{
    {"trace", level_enum::trace},
    {"debug", level_enum::debug},
    {"info", level_enum::info},
    {"warn", level_enum::warn},
    {"warning", level_enum::warn},
    {"error", level_enum::err},
    {"critical", level_enum::critical},
    {"off", level_enum::off},
  }};

  for (const auto& [name, level] : kLevels)
  {
    if (name == levelName)
    {
      return level;
    }
  }
  throw std::invalid_argument("Unknown log level '" + levelName + "'");
}

}  // namespace cut_utils
