#include "peer_error.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::FormatError: return "FormatError";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::Unreachable: return "Unreachable";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::ProtocolError: return "ProtocolError";
    case ErrorKind::Internal: return "Internal";
  }
  return "Internal";
}

int error_kind_http_status(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::FormatError: return 400;
    case ErrorKind::NotFound: return 404;
    case ErrorKind::Unreachable: return 502;
    case ErrorKind::Timeout: return 504;
    case ErrorKind::ProtocolError: return 502;
    case ErrorKind::Internal: return 500;
  }
  return 500;
}

void throw_peer_error(ErrorKind kind, const std::string& message) {
  throw PeerError(kind, message);
}
