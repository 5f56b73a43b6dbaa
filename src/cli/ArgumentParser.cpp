#include "jobwatch/cli/ArgumentParser.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace jobwatch::cli {

namespace {

constexpr std::string_view END_OF_OPTIONS = "--";

} // namespace

Option::Option(std::string short_name, std::string long_name, std::string description, Type type)
    : short_name_(std::move(short_name))
    , long_name_(std::move(long_name))
    , description_(std::move(description))
    , type_(type) {}

Option& Option::default_value(std::string value) {
  default_value_ = std::move(value);
  return *this;
}

Option& Option::validator(std::function<bool(std::string const&)> validate_func) {
  validator_ = std::move(validate_func);
  return *this;
}

Option& Option::help_text(std::string help) {
  help_text_ = std::move(help);
  return *this;
}

ParseResult::ParseResult(bool success, std::string error_message)
    : success_(success), error_message_(std::move(error_message)) {}

std::vector<std::string> const* ParseResult::values_of(std::string const& option_name) const {
  auto it = option_values_.find(option_name);
  if (it == option_values_.end() || it->second.empty()) {
    return nullptr;
  }
  return &it->second;
}

bool ParseResult::has(std::string const& option_name) const {
  return values_of(option_name) != nullptr;
}

std::optional<std::string> ParseResult::get(std::string const& option_name) const {
  auto const* values = values_of(option_name);
  return values ? std::optional{values->front()} : std::nullopt;
}

std::vector<std::string> ParseResult::get_all(std::string const& option_name) const {
  auto const* values = values_of(option_name);
  return values ? *values : std::vector<std::string>{};
}

ArgumentParser::ArgumentParser(std::string program_name, std::string description)
    : program_name_(std::move(program_name)), description_(std::move(description)) {}

Option&
ArgumentParser::add_option(std::string short_name, std::string long_name, std::string description, Option::Type type) {
  auto const index = options_.size();
  for (auto const* name : {&short_name, &long_name}) {
    if (!name->empty()) {
      option_map_[*name] = index;
    }
  }
  return options_.emplace_back(std::move(short_name), std::move(long_name), std::move(description), type);
}

Option& ArgumentParser::add_option(std::string long_name, std::string description, Option::Type type) {
  return add_option("", std::move(long_name), std::move(description), type);
}

ArgumentParser& ArgumentParser::positional_name(std::string name) {
  positional_name_ = std::move(name);
  return *this;
}

ParseResult ArgumentParser::parse(int argc, char const* const* argv) const {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? argc - 1 : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::span<std::string const>(args));
}

ParseResult ArgumentParser::parse(std::span<std::string const> args) const {
  ParseResult result(true);

  std::vector<bool> option_seen(options_.size(), false);

  for (size_t i = 0; i < args.size(); ++i) {
    std::string const& arg = args[i];

    if (arg == END_OF_OPTIONS) {
      result.positional_args_.insert(result.positional_args_.end(), args.begin() + i + 1, args.end());
      break;
    }

    if (!is_short_option(arg) && !is_long_option(arg)) {
      // the first positional starts the command line, options included
      result.positional_args_.insert(result.positional_args_.end(), args.begin() + i, args.end());
      break;
    }

    auto option_index = find_option(extract_option_name(arg));
    if (!option_index) {
      return create_error(fmt::format("Unknown option: {}", arg));
    }

    Option const& option       = options_[*option_index];
    option_seen[*option_index] = true;

    if (option.type() == Option::Type::Flag) {
      result.option_values_[option.long_name()].emplace_back("true");
      continue;
    }

    if (i + 1 >= args.size() || args[i + 1] == END_OF_OPTIONS) {
      return create_error(fmt::format("Option {} requires a value", arg));
    }

    ++i;
    if (option.validator_ && !option.validator_(args[i])) {
      return create_error(fmt::format("Invalid value for option {}: {}", arg, args[i]));
    }
    result.option_values_[option.long_name()].push_back(args[i]);

    if (option.type() == Option::Type::MultiValue) {
      while (i + 1 < args.size() && args[i + 1] != END_OF_OPTIONS && !is_short_option(args[i + 1]) &&
             !is_long_option(args[i + 1])) {
        ++i;
        if (option.validator_ && !option.validator_(args[i])) {
          return create_error(fmt::format("Invalid value for option {}: {}", arg, args[i]));
        }
        result.option_values_[option.long_name()].push_back(args[i]);
      }
    }
  }

  for (size_t i = 0; i < options_.size(); ++i) {
    Option const& option = options_[i];
    if (!option_seen[i] && option.default_value_) {
      result.option_values_[option.long_name()].push_back(*option.default_value_);
    }
  }

  return result;
}

std::string ArgumentParser::generate_help() const {
  std::ostringstream oss;

  if (!description_.empty()) {
    oss << description_ << "\n\n";
  }

  oss << generate_usage() << "\n\n";

  if (options_.empty()) {
    return oss.str();
  }

  auto label = [](Option const& option) {
    std::string text;
    if (!option.short_name().empty()) {
      text += "-" + option.short_name();
    }
    if (!option.long_name().empty()) {
      if (!text.empty()) {
        text += ", ";
      }
      text += "--" + option.long_name();
    }
    if (option.type() == Option::Type::Value) {
      text += " <val>";
    } else if (option.type() == Option::Type::MultiValue) {
      text += " <val...>";
    }
    return text;
  };

  size_t max_width = 0;
  for (Option const& option : options_) {
    max_width = std::max(max_width, label(option).size());
  }

  oss << "Options:\n";
  for (Option const& option : options_) {
    oss << "  " << std::left << std::setw(static_cast<int>(max_width) + 2) << label(option);
    oss << option.description();

    if (option.default_value_) {
      oss << " (default: " << *option.default_value_ << ")";
    }
    oss << "\n";

    if (!option.help_text_.empty()) {
      oss << std::string(max_width + 4, ' ') << option.help_text_ << "\n";
    }
  }

  return oss.str();
}

std::string ArgumentParser::generate_usage() const {
  std::ostringstream oss;
  oss << "Usage: " << program_name_;

  if (!options_.empty()) {
    oss << " [options]";
  }
  oss << " [--] " << positional_name_;

  return oss.str();
}

std::optional<size_t> ArgumentParser::find_option(std::string const& name) const {
  auto it = option_map_.find(name);
  return it != option_map_.end() ? std::optional{it->second} : std::nullopt;
}

bool ArgumentParser::is_short_option(std::string const& arg) noexcept {
  return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' && std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool ArgumentParser::is_long_option(std::string const& arg) noexcept {
  return arg.length() >= 3 && arg[0] == '-' && arg[1] == '-' && std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string ArgumentParser::extract_option_name(std::string const& arg) {
  if (is_long_option(arg)) {
    return arg.substr(2);
  }
  if (is_short_option(arg)) {
    return arg.substr(1);
  }
  return arg;
}

ParseResult ArgumentParser::create_error(std::string message) {
  return ParseResult{false, std::move(message)};
}

} // namespace jobwatch::cli
