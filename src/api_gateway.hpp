#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "content_store.hpp"
#include "content_sync_engine.hpp"
#include "friend_registry.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "peer_client.hpp"

inline constexpr std::uint16_t kDefaultPeerPort = 9000;

// User-facing REST surface (/api/...). Each request is independent; every
// PeerError thrown below maps to its fixed status in HttpServer.
class ApiGateway {
public:
  struct Dependencies {
    ContentStore& store;
    FriendRegistry& registry;
    PeerClient& client;
    ContentSyncEngine& sync;
    std::function<NodeInfo()> local_info;
  };

  explicit ApiGateway(Dependencies deps, std::shared_ptr<Logger> logger = nullptr);

  std::optional<HttpResponse> handle(const HttpRequest& request);

private:
  HttpResponse discover(const HttpRequest& request);
  HttpResponse friends(const HttpRequest& request);
  HttpResponse friend_entry(const HttpRequest& request, const std::string& peer_id);
  HttpResponse peer_galleries(const HttpRequest& request);
  HttpResponse downloaded(const HttpRequest& request);
  HttpResponse friend_galleries(const HttpRequest& request, const std::string& peer_id);
  HttpResponse peer_docs(const HttpRequest& request);
  HttpResponse peer_friends(const std::string& peer_id);

  Friend require_friend(const std::string& peer_id) const;

  Dependencies deps_;
  std::shared_ptr<Logger> logger_;
};

// Parses a request body as a JSON object; anything else is FormatError.
// An empty body yields an empty object when `allow_empty`.
json parse_request_json(const HttpRequest& request, bool allow_empty = false);
