#pragma once

#include <cstdio>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace jobwatch::log {

enum class Level {
  Error,
  Warn,
  Info,
  Debug,
};

void  set_level(Level level) noexcept;
Level level() noexcept;

auto parse_level(std::string_view name) -> std::optional<Level>;
// Applies JOBWATCH_LOG_LEVEL if it is set to a known level name.
void init_from_env();

[[nodiscard]] inline bool enabled(Level l) noexcept {
  return static_cast<int>(l) <= static_cast<int>(level());
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Error)) {
    fmt::print(stderr, "jobwatch: error: {}\n", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Warn)) {
    fmt::print(stderr, "jobwatch: warning: {}\n", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Info)) {
    fmt::print(stderr, "jobwatch: {}\n", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (enabled(Level::Debug)) {
    fmt::print(stderr, "jobwatch: debug: {}\n", fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace jobwatch::log
