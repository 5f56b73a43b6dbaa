#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jobwatch::cli {

struct Option {
  enum class Type {
    Flag,      // Boolean flag (--verbose, -v)
    Value,     // Single value (--cwd dir)
    MultiValue // Multiple values (--env A=1 B=2)
  };

  std::string                             short_name_;
  std::string                             long_name_;
  std::string                             description_;
  std::string                             help_text_;
  Type                                    type_;
  std::optional<std::string>              default_value_;
  std::function<bool(std::string const&)> validator_;

  Option(std::string short_name, std::string long_name, std::string description, Type type = Type::Flag);

  Option& default_value(std::string value);
  Option& validator(std::function<bool(std::string const&)> validate_func);
  Option& help_text(std::string help);

  [[nodiscard]] std::string const& short_name() const noexcept {
    return short_name_;
  }
  [[nodiscard]] std::string const& long_name() const noexcept {
    return long_name_;
  }
  [[nodiscard]] std::string const& description() const noexcept {
    return description_;
  }
  [[nodiscard]] Type type() const noexcept {
    return type_;
  }
};

struct ParseResult {
  bool                                                      success_;
  std::string                                               error_message_;
  std::unordered_map<std::string, std::vector<std::string>> option_values_;
  std::vector<std::string>                                  positional_args_;

  explicit ParseResult(bool success, std::string error_message = "");

  bool has_error() const noexcept {
    return !success_;
  }
  std::string_view error_message() const noexcept {
    return error_message_;
  }

  // Values are keyed by long name, whichever spelling was used.
  bool                       has(std::string const& option_name) const;
  std::optional<std::string> get(std::string const& option_name) const;
  std::vector<std::string>   get_all(std::string const& option_name) const;

  std::vector<std::string> const& positional_args() const noexcept {
    return positional_args_;
  }

private:
  // Null when the option was neither given nor defaulted.
  std::vector<std::string> const* values_of(std::string const& option_name) const;
};

// Option parsing stops at the first positional argument or at a bare "--";
// everything from there on is positional, so the supervised command can carry
// options of its own.
class ArgumentParser {
  std::string                             program_name_;
  std::string                             description_;
  std::vector<Option>                     options_;
  std::unordered_map<std::string, size_t> option_map_;
  std::string                             positional_name_ = "args...";

public:
  explicit ArgumentParser(std::string program_name, std::string description = "");

  Option& add_option(
      std::string  short_name,
      std::string  long_name,
      std::string  description,
      Option::Type type = Option::Type::Flag
  );
  Option& add_option(std::string long_name, std::string description, Option::Type type = Option::Type::Flag);

  ArgumentParser& positional_name(std::string name);

  ParseResult parse(int argc, char const* const* argv) const;
  ParseResult parse(std::span<std::string const> args) const;

  std::string generate_help() const;
  std::string generate_usage() const;

private:
  std::optional<size_t> find_option(std::string const& name) const;
  static bool           is_short_option(std::string const& arg) noexcept;
  static bool           is_long_option(std::string const& arg) noexcept;
  static std::string    extract_option_name(std::string const& arg);
  static ParseResult    create_error(std::string message);
};

} // namespace jobwatch::cli
