#include "connection_descriptor.hpp"

#include <algorithm>
#include <cctype>

#include "peer_error.hpp"
#include "utils.hpp"

namespace {

std::uint16_t parse_port(const std::string& text) {
  if(text.empty() || text.size() > 5 ||
     !std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isdigit(c); })) {
    throw_peer_error(ErrorKind::FormatError, "port must be a decimal number, got '" + text + "'");
  }
  const unsigned long value = std::stoul(text);
  if(value == 0 || value > 65535) {
    throw_peer_error(ErrorKind::FormatError, "port out of range: " + text);
  }
  return static_cast<std::uint16_t>(value);
}

void require_field(const std::string& value, const char* what) {
  if(value.empty()) {
    throw_peer_error(ErrorKind::FormatError, std::string(what) + " is empty");
  }
  if(value.find(':') != std::string::npos) {
    throw_peer_error(ErrorKind::FormatError, std::string(what) + " contains ':'");
  }
}

} // namespace

ConnectionDescriptor parse_connection_string(const std::string& text) {
  if(!is_ascii(text)) {
    throw_peer_error(ErrorKind::FormatError, "connection string must be ASCII");
  }
  const auto fields = split(text, ':');
  if(fields.size() != 3) {
    throw_peer_error(ErrorKind::FormatError,
                     "expected host:port:peerID, got " + std::to_string(fields.size()) + " field(s)");
  }
  std::string host = trim_ascii(fields[0]);
  std::string port_text = trim_ascii(fields[1]);
  std::string peer_id = trim_ascii(fields[2]);
  require_field(host, "host");
  require_field(port_text, "port");
  require_field(peer_id, "peerID");
  const auto port = parse_port(port_text);
  return ConnectionDescriptor(std::move(host), port, std::move(peer_id));
}

ConnectionDescriptor make_connection_descriptor(const std::string& host,
                                                std::uint16_t port,
                                                const std::string& peer_id) {
  if(!is_ascii(host) || !is_ascii(peer_id)) {
    throw_peer_error(ErrorKind::FormatError, "host and peerID must be ASCII");
  }
  std::string h = trim_ascii(host);
  std::string id = trim_ascii(peer_id);
  require_field(h, "host");
  require_field(id, "peerID");
  if(port == 0) {
    throw_peer_error(ErrorKind::FormatError, "port out of range: 0");
  }
  return ConnectionDescriptor(std::move(h), port, std::move(id));
}

std::string ConnectionDescriptor::to_string() const {
  return host_ + ":" + std::to_string(port_) + ":" + peer_id_;
}

std::string format_connection_string(const ConnectionDescriptor& descriptor) {
  return descriptor.to_string();
}
