#include "jobwatch/cli/App.hpp"

#include <atomic>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <unordered_map>

#include <fmt/format.h>

#include "jobwatch/HostContext.hpp"
#include "jobwatch/Log.hpp"

namespace jobwatch::cli {

extern "C" {
  extern char** environ; // NOLINT
}

namespace {

std::atomic<int> pending_signal{0};

void handle_interrupt(int sig) {
  pending_signal = sig;
}

// SIGINT/SIGTERM are turned into a terminate() of the job from the loop.
auto install_interrupt_handlers() -> bool {
  struct sigaction sa = {};
  sa.sa_handler       = handle_interrupt;
  sa.sa_flags         = SA_RESTART;
  sigemptyset(&sa.sa_mask);

  for (int sig : {SIGINT, SIGTERM}) {
    if (sigaction(sig, &sa, nullptr) == -1) {
      return false;
    }
  }
  return true;
}

auto parse_millis(std::string const& text) -> std::optional<std::chrono::milliseconds> {
  long long value = 0;
  auto [end, ec]  = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size() || value <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds{value};
}

auto parse_signal(std::string const& name) -> std::optional<Signal> {
  if (name == "term" || name == "TERM" || name == "SIGTERM") {
    return Signal::Term;
  }
  if (name == "kill" || name == "KILL" || name == "SIGKILL") {
    return Signal::Kill;
  }
  if (name == "int" || name == "INT" || name == "SIGINT") {
    return Signal::Int;
  }
  return std::nullopt;
}

bool is_millis(std::string const& text) {
  return parse_millis(text).has_value();
}

bool is_env_entry(std::string const& text) {
  auto eq = text.find('=');
  return eq != std::string::npos && eq > 0;
}

} // namespace

ArgumentParser create_parser(std::string program_name) {
  ArgumentParser parser(std::move(program_name), std::string{EXE_DESC});
  parser.positional_name("program [args...]");

  parser.add_option("C", "cwd", "Working directory for the command", Option::Type::Value);
  parser.add_option("e", "env", "Set KEY=VALUE in the command's environment", Option::Type::MultiValue)
      .validator(is_env_entry);
  parser.add_option("poll-ms", "Milliseconds between polls of the command", Option::Type::Value)
      .validator(is_millis)
      .default_value(std::to_string(DEFAULT_CLI_POLL.count()));
  parser.add_option("reader-ms", "Milliseconds between pipe reads", Option::Type::Value)
      .validator(is_millis)
      .default_value(std::to_string(DEFAULT_READER_INTERVAL.count()));
  parser.add_option("grace-ms", "How long to wait for the command to die after a signal", Option::Type::Value)
      .validator(is_millis)
      .default_value(std::to_string(DEFAULT_TERMINATE_GRACE.count()));
  parser.add_option("t", "timeout-ms", "Terminate the command after this many milliseconds", Option::Type::Value)
      .validator(is_millis);
  parser.add_option("s", "signal", "Signal used to terminate: term, kill or int", Option::Type::Value)
      .validator([](std::string const& s) { return parse_signal(s).has_value(); })
      .default_value("term");
  parser.add_option("g", "group", "Run the command as a process group leader and signal the whole group")
      .help_text("Children of the command are terminated together with it.");

  parser.add_option("h", "help", "Show this help message and exit");
  parser.add_option("version", "Show version information and exit");
  parser.add_option("v", "verbose", "Enable verbose output");

  return parser;
}

auto make_config(ParseResult const& args) -> Result<Config> {
  if (args.has_error()) {
    return fail(ErrorKind::InvalidState, args.error_message());
  }

  Config config;
  config.command_ = args.positional_args();
  if (config.command_.empty()) {
    return fail(ErrorKind::InvalidState, "no command given");
  }

  config.working_dir_ = args.get("cwd");
  config.verbose_     = args.has("verbose");

  // values below went through the option validators already
  config.job_.poll_interval_   = parse_millis(args.get("poll-ms").value_or(""));
  config.job_.reader_interval_ = parse_millis(args.get("reader-ms").value_or("")).value_or(DEFAULT_READER_INTERVAL);
  config.job_.terminate_grace_ = parse_millis(args.get("grace-ms").value_or("")).value_or(DEFAULT_TERMINATE_GRACE);
  if (!config.job_.poll_interval_) {
    config.job_.poll_interval_ = DEFAULT_CLI_POLL;
  }

  if (auto timeout = args.get("timeout-ms")) {
    config.timeout_ = parse_millis(*timeout);
  }
  config.signal_ = parse_signal(args.get("signal").value_or("term")).value_or(Signal::Term);

  if (args.has("group")) {
    config.job_.flags_ |= ExecFlags::MakeGroupLeader;
  }

  if (auto overrides = args.get_all("env"); !overrides.empty()) {
    config.job_.environment_ = merge_environment(environ, overrides);
  }

  return config;
}

std::vector<std::string> merge_environment(char const* const* base, std::vector<std::string> const& overrides) {
  std::vector<std::string>                entries;
  std::unordered_map<std::string, size_t> index;

  auto put = [&](std::string entry) {
    auto key = entry.substr(0, entry.find('='));
    if (auto it = index.find(key); it != index.end()) {
      entries[it->second] = std::move(entry);
    } else {
      index.emplace(std::move(key), entries.size());
      entries.push_back(std::move(entry));
    }
  };

  for (char const* const* it = base; it != nullptr && *it != nullptr; ++it) {
    put(*it);
  }
  for (auto const& entry : overrides) {
    put(entry);
  }
  return entries;
}

int exit_status_for(int exit_code) noexcept {
  if (exit_code == UNKNOWN_EXIT_CODE) {
    return EXIT_STATUS_UNKNOWN;
  }
  return exit_code < 0 ? 128 - exit_code : exit_code;
}

int run(Config const& config) {
  if (!install_interrupt_handlers()) {
    log::warn("cannot install signal handlers, interrupts will not reach the command");
  }

  EventLoop loop;
  Job       job(loop, config.command_, config.job_);

  std::optional<int> exit_code;
  job.set_on_data([](std::string const& text) {
    fmt::print(stdout, "{}", text);
    std::fflush(stdout);
  });
  job.set_on_error([](std::string const& text) {
    fmt::print(stderr, "{}", text);
    std::fflush(stderr);
  });
  job.set_on_exit([&](pid_t pid, int code) {
    log::info("pid {} exited with {}", pid, code);
    exit_code = code;
    loop.stop();
  });

  auto const scope = has_flag(config.job_.flags_, ExecFlags::MakeGroupLeader) ? KillScope::Children
                                                                                : KillScope::NoChildren;
  auto stop_job = [&](Signal signal) {
    if (job.state() == JobState::Terminated) {
      // signalled before and still not gone
      log::info("command outlived {}, killing it", to_string(signal));
      job.shutdown();
      return;
    }
    if (auto r = job.terminate(signal, scope); !r) {
      log::warn("{}", r.error().message());
    }
  };

  auto pid = job.start(config.working_dir_);
  if (!pid) {
    log::error("{}", pid.error().message());
    return pid.error().code() == ENOENT ? 127 : 126;
  }

  std::optional<TimerId> deadline;
  if (config.timeout_) {
    deadline = loop.schedule_every(*config.timeout_, [&] {
      log::info("timeout of {}ms reached, sending {}", config.timeout_->count(), to_string(config.signal_));
      stop_job(config.signal_);
    });
  }

  auto const watchdog = loop.schedule_every(DEFAULT_CLI_POLL, [&] {
    if (int sig = pending_signal.exchange(0); sig != 0) {
      log::info("received signal {}, stopping pid {}", sig, *pid);
      stop_job(sig == SIGINT ? Signal::Int : config.signal_);
    }
  });

  loop.run();
  loop.cancel(watchdog);
  if (deadline) {
    loop.cancel(*deadline);
  }

  return exit_status_for(exit_code.value_or(UNKNOWN_EXIT_CODE));
}

void print_version() {
  fmt::print("{} version {}\n", EXE_NAME, VERSION);
}

} // namespace jobwatch::cli
