#include "jobwatch/Error.hpp"

namespace jobwatch {

Error::Error(ErrorKind kind, std::string_view msg, int code)
    : kind_(kind), message_(msg), code_(code) {}

ErrorKind Error::kind() const noexcept {
  return kind_;
}

std::string const& Error::message() const noexcept {
  return message_;
}

int Error::code() const noexcept {
  return code_;
}

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Spawn: return "spawn error";
    case ErrorKind::InvalidState: return "invalid state";
    case ErrorKind::Termination: return "termination error";
    case ErrorKind::Io: return "i/o error";
  }
  return "error";
}

} // namespace jobwatch
