#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "connection_descriptor.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct PeerAddress {
  std::string host;
  std::uint16_t port = 0;
};

using SteadyDeadline = std::optional<std::chrono::steady_clock::time_point>;

// One HTTP GET against a peer. Throws PeerError (Unreachable, Timeout,
// ProtocolError); status codes are left to the caller.
using PeerTransport = std::function<HttpResponse(const PeerAddress& address,
                                                 const std::string& target,
                                                 std::chrono::milliseconds timeout)>;

HttpResponse http_get(const PeerAddress& address,
                      const std::string& target,
                      std::chrono::milliseconds timeout,
                      std::size_t max_response_bytes);

// Outbound calls to other nodes' /peer endpoints. Each call is independent:
// fresh connection, bounded timeout, no retries. Calls addressed by peer id
// resolve through the AddressResolver (the friend registry) and report
// success through the SeenCallback.
class PeerClient {
public:
  using AddressResolver = std::function<std::optional<PeerAddress>(const std::string& peer_id)>;
  using SeenCallback = std::function<void(const std::string& peer_id)>;

  struct Options {
    std::chrono::milliseconds timeout{5000};
    std::size_t max_response_bytes = 64 * 1024 * 1024;
  };

  explicit PeerClient(Options options, std::shared_ptr<Logger> logger = nullptr);

  void set_address_resolver(AddressResolver resolver);
  void set_seen_callback(SeenCallback callback);
  // Replaces the network transport (tests).
  void set_transport(PeerTransport transport);

  NodeInfo fetch_info(const ConnectionDescriptor& descriptor, SteadyDeadline deadline = std::nullopt);
  NodeInfo fetch_info(const std::string& host, std::uint16_t port, SteadyDeadline deadline = std::nullopt);

  std::vector<GalleryDescriptor> fetch_galleries(const std::string& peer_id, MediaKind kind,
                                                 SteadyDeadline deadline = std::nullopt);
  GalleryDescriptor fetch_gallery(const std::string& peer_id, MediaKind kind, const std::string& gallery,
                                  SteadyDeadline deadline = std::nullopt);
  std::string fetch_file(const std::string& peer_id, MediaKind kind, const std::string& gallery,
                         const std::string& filename, SteadyDeadline deadline = std::nullopt);
  std::vector<DocSummary> fetch_docs(const std::string& peer_id, SteadyDeadline deadline = std::nullopt);
  DocContent fetch_doc(const std::string& peer_id, const std::string& filename,
                       SteadyDeadline deadline = std::nullopt);
  std::vector<Friend> fetch_friends_of(const std::string& peer_id, SteadyDeadline deadline = std::nullopt);

  const Options& options() const { return options_; }

private:
  PeerAddress resolve(const std::string& peer_id) const;
  std::chrono::milliseconds effective_timeout(const SteadyDeadline& deadline) const;
  // GET + status mapping. 4xx is NotFound, anything else non-2xx is ProtocolError.
  HttpResponse get(const PeerAddress& address, const std::vector<std::string>& segments,
                   const SteadyDeadline& deadline);
  HttpResponse get_peer(const std::string& peer_id, const std::vector<std::string>& segments,
                        const SteadyDeadline& deadline);
  void mark_seen(const std::string& peer_id);

  Options options_;
  std::shared_ptr<Logger> logger_;
  AddressResolver resolver_;
  SeenCallback seen_;
  PeerTransport transport_;
};
