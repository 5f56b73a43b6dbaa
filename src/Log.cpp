#include "jobwatch/Log.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

namespace jobwatch::log {

namespace {

std::atomic<Level> current_level{Level::Warn};

} // namespace

void set_level(Level level) noexcept {
  current_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
  return current_level.load(std::memory_order_relaxed);
}

auto parse_level(std::string_view name) -> std::optional<Level> {
  if (name == "error") {
    return Level::Error;
  }
  if (name == "warn" || name == "warning") {
    return Level::Warn;
  }
  if (name == "info") {
    return Level::Info;
  }
  if (name == "debug") {
    return Level::Debug;
  }
  return std::nullopt;
}

void init_from_env() {
  char const* value = std::getenv("JOBWATCH_LOG_LEVEL");
  if (value == nullptr) {
    return;
  }
  if (auto parsed = parse_level(value)) {
    set_level(*parsed);
  } else {
    warn("ignoring unknown JOBWATCH_LOG_LEVEL '{}'", value);
  }
}

} // namespace jobwatch::log
