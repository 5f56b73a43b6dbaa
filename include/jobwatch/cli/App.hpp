#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "jobwatch/Constants.hpp"
#include "jobwatch/Error.hpp"
#include "jobwatch/Job.hpp"
#include "jobwatch/cli/ArgumentParser.hpp"

namespace jobwatch::cli {

static constexpr inline std::chrono::milliseconds DEFAULT_CLI_POLL{50};
// Exit status when the command's own status could not be collected.
static constexpr inline int EXIT_STATUS_UNKNOWN = 125;

struct Config {
  std::vector<std::string>                 command_;
  std::optional<std::string>               working_dir_;
  JobOptions                               job_;
  std::optional<std::chrono::milliseconds> timeout_;
  Signal                                   signal_  = Signal::Term;
  bool                                     verbose_ = false;
};

ArgumentParser create_parser(std::string program_name);

auto make_config(ParseResult const& args) -> Result<Config>;

// KEY=VALUE overrides applied on top of `base` (usually our own environment).
std::vector<std::string> merge_environment(char const* const* base, std::vector<std::string> const& overrides);

// Shell-style status: the exit code itself, 128 + signal number, or
// EXIT_STATUS_UNKNOWN for UNKNOWN_EXIT_CODE.
int exit_status_for(int exit_code) noexcept;

// Runs the configured command to completion, relaying its output. Returns the
// status jobwatch itself should exit with. A command still alive one more
// timeout period (or one more interrupt) after being signalled is killed.
int run(Config const& config);

void print_version();

} // namespace jobwatch::cli
