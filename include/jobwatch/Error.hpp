#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace jobwatch {

enum class ErrorKind {
  Spawn,        // the child could not be created
  InvalidState, // operation not allowed in the current job state
  Termination,  // kill request failed
  Io,           // pipe or wait failure
};

class Error {
  ErrorKind   kind_;
  std::string message_;
  int         code_;

public:
  Error(ErrorKind kind, std::string_view msg, int code = 0);

  Error(Error const&)                = default;
  Error& operator=(Error const&)     = default;
  Error(Error&&) noexcept            = default;
  Error& operator=(Error&&) noexcept = default;
  ~Error()                           = default;

  [[nodiscard]] ErrorKind          kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;
  [[nodiscard]] int                code() const noexcept;
};

template<typename T, typename E = Error>
using Result = std::expected<T, E>;

// Shorthand for returning a failed Result from any function.
[[nodiscard]] inline auto fail(ErrorKind kind, std::string_view msg, int code = 0) -> std::unexpected<Error> {
  return std::unexpected(Error{kind, msg, code});
}

std::string_view to_string(ErrorKind kind) noexcept;

} // namespace jobwatch
