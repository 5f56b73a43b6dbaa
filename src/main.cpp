#include <fmt/core.h>

#include "jobwatch/Log.hpp"
#include "jobwatch/cli/App.hpp"

int main(int argc, char* argv[]) {
  jobwatch::log::init_from_env();

  auto parser = jobwatch::cli::create_parser(argv[0]);
  auto args   = parser.parse(argc, argv);

  if (args.has_error()) {
    fmt::print("Error: {}\n\n", args.error_message());
    fmt::print("{}", parser.generate_help());
    return 2;
  }

  if (args.has("help")) {
    fmt::print("{}", parser.generate_help());
    return 0;
  }
  if (args.has("version")) {
    jobwatch::cli::print_version();
    return 0;
  }

  auto config = jobwatch::cli::make_config(args);
  if (!config) {
    fmt::print("Error: {}\n\n", config.error().message());
    fmt::print("{}", parser.generate_usage());
    fmt::print("\n");
    return 2;
  }

  if (config->verbose_) {
    jobwatch::log::set_level(jobwatch::log::Level::Info);
  }

  return jobwatch::cli::run(*config);
}
