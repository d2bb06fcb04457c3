#include "peer_service.hpp"

#include "peer_error.hpp"

HttpResponse method_not_allowed(const HttpRequest& request) {
  return HttpResponse::json_body(405, make_error_body("MethodNotAllowed",
                                                      request.method + " not allowed on " + request.target));
}

HttpResponse route_not_found(const HttpRequest& request) {
  return HttpResponse::json_body(404, make_error_body("NotFound", "no route for " + request.target));
}

MediaKind require_media_kind(const std::string& name) {
  auto kind = parse_media_kind(name);
  if(!kind) {
    throw_peer_error(ErrorKind::FormatError, "unknown media kind '" + name + "'");
  }
  return *kind;
}

PeerService::PeerService(const ContentStore& store, InfoProvider info, FriendLister friends,
                         std::shared_ptr<Logger> logger)
  : store_(store), info_(std::move(info)), friends_(std::move(friends)), logger_(std::move(logger)) {}

std::optional<HttpResponse> PeerService::handle(const HttpRequest& request) const {
  const auto& seg = request.segments;
  if(seg.empty() || seg[0] != "peer") return std::nullopt;
  if(seg.size() < 2) return route_not_found(request);
  if(request.method != "GET") return method_not_allowed(request);

  const auto& resource = seg[1];
  if(resource == "info" && seg.size() == 2) {
    return HttpResponse::json_body(200, to_json(info_()));
  }
  if(resource == "galleries" && (seg.size() == 3 || seg.size() == 4)) {
    const auto kind = require_media_kind(seg[2]);
    if(seg.size() == 3) {
      return HttpResponse::json_body(200, make_list_body("galleries", store_.galleries(kind)));
    }
    return HttpResponse::json_body(200, to_json(store_.gallery(kind, seg[3])));
  }
  if(resource == "files" && seg.size() == 5) {
    const auto kind = require_media_kind(seg[2]);
    log_debug(logger_.get(), "Serving {}/{}/{}", seg[2], seg[3], seg[4]);
    return HttpResponse::bytes(store_.read_file(kind, seg[3], seg[4]), guess_content_type(seg[4]));
  }
  if(resource == "docs") {
    if(seg.size() == 2) {
      return HttpResponse::json_body(200, make_list_body("docs", store_.docs()));
    }
    if(seg.size() <= 4) {
      std::string path = seg[2];
      if(seg.size() == 4) path += "/" + seg[3];
      if(request.query_param("raw") == "1") {
        return HttpResponse::bytes(store_.read_doc_bytes(path), guess_content_type(seg.back()));
      }
      return HttpResponse::json_body(200, to_json(store_.doc(path)));
    }
  }
  if(resource == "friends" && seg.size() == 2) {
    std::vector<Friend> friends = friends_ ? friends_() : std::vector<Friend>{};
    return HttpResponse::json_body(200, make_list_body("friends", friends));
  }
  return route_not_found(request);
}
