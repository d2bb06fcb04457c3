#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "content_store.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Read-only catalog endpoints other nodes call (/peer/...).
class PeerService {
public:
  using InfoProvider = std::function<NodeInfo()>;
  using FriendLister = std::function<std::vector<Friend>()>;

  PeerService(const ContentStore& store, InfoProvider info, FriendLister friends,
              std::shared_ptr<Logger> logger = nullptr);

  // nullopt when the path is not under /peer. Throws PeerError for
  // bad input or missing content.
  std::optional<HttpResponse> handle(const HttpRequest& request) const;

private:
  const ContentStore& store_;
  InfoProvider info_;
  FriendLister friends_;
  std::shared_ptr<Logger> logger_;
};

HttpResponse method_not_allowed(const HttpRequest& request);
HttpResponse route_not_found(const HttpRequest& request);
MediaKind require_media_kind(const std::string& name);
