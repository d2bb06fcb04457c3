#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  FormatError,
  NotFound,
  Unreachable,
  Timeout,
  ProtocolError,
  Internal
};

const char* error_kind_name(ErrorKind kind);
int error_kind_http_status(ErrorKind kind);

// Every failure that crosses a component boundary is reported as a PeerError
// so the gateway can map it to a fixed HTTP status.
class PeerError : public std::runtime_error {
public:
  PeerError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }
  const char* kind_name() const noexcept { return error_kind_name(kind_); }

private:
  ErrorKind kind_;
};

[[noreturn]] void throw_peer_error(ErrorKind kind, const std::string& message);
