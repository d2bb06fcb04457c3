#pragma once

#include <cstdint>
#include <string>
#include <utility>

// Address of a remote node as exchanged between users: "<host>:<port>:<peerID>".
// Only parse_connection_string() produces one, so every instance is well-formed.
class ConnectionDescriptor {
public:
  const std::string& host() const { return host_; }
  std::uint16_t port() const { return port_; }
  const std::string& peer_id() const { return peer_id_; }

  std::string to_string() const;

  bool operator==(const ConnectionDescriptor& other) const {
    return host_ == other.host_ && port_ == other.port_ && peer_id_ == other.peer_id_;
  }
  bool operator!=(const ConnectionDescriptor& other) const { return !(*this == other); }

private:
  ConnectionDescriptor(std::string host, std::uint16_t port, std::string peer_id)
    : host_(std::move(host)), port_(port), peer_id_(std::move(peer_id)) {}

  friend ConnectionDescriptor parse_connection_string(const std::string& text);
  friend ConnectionDescriptor make_connection_descriptor(const std::string& host,
                                                         std::uint16_t port,
                                                         const std::string& peer_id);

  std::string host_;
  std::uint16_t port_ = 0;
  std::string peer_id_;
};

// Throws PeerError(FormatError) unless the text has exactly three non-empty
// colon-separated fields and a decimal port in 1..65535.
ConnectionDescriptor parse_connection_string(const std::string& text);

// Same validation applied to already-split fields (registry records, API bodies).
ConnectionDescriptor make_connection_descriptor(const std::string& host,
                                                std::uint16_t port,
                                                const std::string& peer_id);

std::string format_connection_string(const ConnectionDescriptor& descriptor);
