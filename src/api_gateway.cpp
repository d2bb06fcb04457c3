#include "api_gateway.hpp"

#include "gallery_merger.hpp"
#include "peer_error.hpp"
#include "peer_service.hpp"
#include "utils.hpp"

json parse_request_json(const HttpRequest& request, bool allow_empty) {
  if(trim_ascii(request.body).empty()) {
    if(allow_empty) return json::object();
    throw_peer_error(ErrorKind::FormatError, "request body is required");
  }
  json body = json::parse(request.body, nullptr, false);
  if(body.is_discarded() || !body.is_object()) {
    throw_peer_error(ErrorKind::FormatError, "request body must be a JSON object");
  }
  return body;
}

namespace {

// Same upper bound as the sync_deadline_seconds setting.
constexpr double kMaxDeadlineSeconds = 86400;

std::string required_string(const json& body, const char* key) {
  if(!body.contains(key) || !body[key].is_string() || trim_ascii(body[key].get<std::string>()).empty()) {
    throw_peer_error(ErrorKind::FormatError, std::string("'") + key + "' is required");
  }
  return trim_ascii(body[key].get<std::string>());
}

MediaKind kind_from_query(const HttpRequest& request) {
  return require_media_kind(request.query_param("kind", "images"));
}

} // namespace

ApiGateway::ApiGateway(Dependencies deps, std::shared_ptr<Logger> logger)
  : deps_(std::move(deps)), logger_(std::move(logger)) {}

Friend ApiGateway::require_friend(const std::string& peer_id) const {
  auto f = deps_.registry.get(peer_id);
  if(!f) {
    throw_peer_error(ErrorKind::NotFound, "'" + peer_id + "' is not a friend");
  }
  return *f;
}

std::optional<HttpResponse> ApiGateway::handle(const HttpRequest& request) {
  const auto& seg = request.segments;
  if(seg.empty() || seg[0] != "api") return std::nullopt;
  if(seg.size() < 2) return route_not_found(request);

  const auto& resource = seg[1];
  if(resource == "info" && seg.size() == 2) {
    if(request.method != "GET") return method_not_allowed(request);
    return HttpResponse::json_body(200, to_json(deps_.local_info()));
  }
  if(resource == "discover" && seg.size() == 2) {
    if(request.method != "POST") return method_not_allowed(request);
    return discover(request);
  }
  if(resource == "friends") {
    if(seg.size() == 2) return friends(request);
    if(seg.size() == 3) return friend_entry(request, seg[2]);
  }
  if(resource == "peer-galleries" && seg.size() >= 3 && seg.size() <= 5) {
    if(request.method != "GET") return method_not_allowed(request);
    return peer_galleries(request);
  }
  if(resource == "downloaded" && seg.size() >= 4 && seg.size() <= 6) {
    if(request.method != "GET") return method_not_allowed(request);
    return downloaded(request);
  }
  if(resource == "friend-galleries" && seg.size() == 3) {
    if(request.method != "GET") return method_not_allowed(request);
    return friend_galleries(request, seg[2]);
  }
  if(resource == "peer-docs" && seg.size() >= 3) {
    return peer_docs(request);
  }
  if(resource == "peer-friends" && seg.size() == 3) {
    if(request.method != "GET") return method_not_allowed(request);
    return peer_friends(seg[2]);
  }
  return route_not_found(request);
}

HttpResponse ApiGateway::discover(const HttpRequest& request) {
  const auto body = parse_request_json(request);
  const auto ip = required_string(body, "ip");
  std::uint16_t port = kDefaultPeerPort;
  if(body.contains("port")) {
    const auto& p = body["port"];
    if(!p.is_number_integer() || p.get<long long>() <= 0 || p.get<long long>() > 65535) {
      throw_peer_error(ErrorKind::FormatError, "'port' must be an integer in 1..65535");
    }
    port = static_cast<std::uint16_t>(p.get<long long>());
  }

  json out;
  try {
    const auto info = deps_.client.fetch_info(ip, port);
    out["reachable"] = true;
    out["node"] = to_json(info)["node"];
    out["connection_string"] = ip + ":" + std::to_string(port) + ":" + info.id;
  } catch(const PeerError& e) {
    if(e.kind() == ErrorKind::FormatError) throw;
    log_info(logger_.get(), "Discover {}:{} failed: {}", ip, port, e.what());
    out["reachable"] = false;
    out["node"] = nullptr;
    out["error"] = e.kind_name();
    out["message"] = e.what();
  }
  return HttpResponse::json_body(200, out);
}

HttpResponse ApiGateway::friends(const HttpRequest& request) {
  if(request.method == "GET") {
    return HttpResponse::json_body(200, make_list_body("friends", deps_.registry.list()));
  }
  if(request.method != "POST") return method_not_allowed(request);

  const auto body = parse_request_json(request);
  const auto descriptor = parse_connection_string(required_string(body, "connection_string"));
  std::string peer_name;
  if(body.contains("peer_name") && body["peer_name"].is_string()) {
    peer_name = body["peer_name"].get<std::string>();
  }
  const auto added = deps_.registry.add(descriptor, peer_name);
  json out;
  out["status"] = "success";
  out["friend"] = to_json(added);
  return HttpResponse::json_body(201, out);
}

HttpResponse ApiGateway::friend_entry(const HttpRequest& request, const std::string& peer_id) {
  if(request.method == "GET") {
    return HttpResponse::json_body(200, to_json(require_friend(peer_id)));
  }
  if(request.method == "DELETE") {
    if(!deps_.registry.remove(peer_id)) {
      throw_peer_error(ErrorKind::NotFound, "'" + peer_id + "' is not a friend");
    }
    return HttpResponse::json_body(200, make_status_body("success", "removed " + peer_id));
  }
  return method_not_allowed(request);
}

HttpResponse ApiGateway::peer_galleries(const HttpRequest& request) {
  const auto& seg = request.segments;
  const auto& peer_id = seg[2];
  const auto kind = kind_from_query(request);

  if(seg.size() == 3) {
    return HttpResponse::json_body(200, make_list_body("galleries", deps_.client.fetch_galleries(peer_id, kind)));
  }
  if(seg.size() == 4) {
    return HttpResponse::json_body(200, to_json(deps_.client.fetch_gallery(peer_id, kind, seg[3])));
  }
  auto bytes = deps_.client.fetch_file(peer_id, kind, seg[3], seg[4]);
  try {
    deps_.store.write_cached_file(peer_id, kind, seg[3], seg[4], bytes);
  } catch(const PeerError& e) {
    log_warn(logger_.get(), "Could not cache {}/{} from {}: {}", seg[3], seg[4], peer_id, e.what());
  }
  return HttpResponse::bytes(std::move(bytes), guess_content_type(seg[4]));
}

HttpResponse ApiGateway::downloaded(const HttpRequest& request) {
  const auto& seg = request.segments;
  const auto& peer_id = seg[2];
  const auto kind = require_media_kind(seg[3]);
  if(seg.size() == 4) {
    return HttpResponse::json_body(200, make_list_body("galleries", deps_.store.cached_galleries(peer_id, kind)));
  }
  if(seg.size() == 5) {
    return HttpResponse::json_body(200, to_json(deps_.store.cached_gallery(peer_id, kind, seg[4])));
  }
  return HttpResponse::bytes(deps_.store.read_cached_file(peer_id, kind, seg[4], seg[5]),
                             guess_content_type(seg[5]));
}

HttpResponse ApiGateway::friend_galleries(const HttpRequest& request, const std::string& peer_id) {
  require_friend(peer_id);
  const auto kind = kind_from_query(request);

  std::vector<GalleryDescriptor> live;
  json live_error;
  try {
    live = deps_.client.fetch_galleries(peer_id, kind);
  } catch(const PeerError& e) {
    log_info(logger_.get(), "Live galleries of {} unavailable: {}", peer_id, e.what());
    live_error = make_error_body(e.kind_name(), e.what());
  }
  const auto merged = merge_galleries(live, deps_.store.cached_galleries(peer_id, kind));
  json out = make_list_body("galleries", merged);
  if(!live_error.is_null()) out["live_error"] = live_error;
  return HttpResponse::json_body(200, out);
}

HttpResponse ApiGateway::peer_docs(const HttpRequest& request) {
  const auto& seg = request.segments;
  const auto& peer_id = seg[2];

  if(seg.size() == 4 && seg[3] == "download" && request.method == "POST") {
    const auto body = parse_request_json(request, true);
    std::optional<std::chrono::milliseconds> deadline;
    if(body.contains("deadline_seconds") && !body["deadline_seconds"].is_null()) {
      const auto& d = body["deadline_seconds"];
      if(!d.is_number() || !(d.get<double>() >= 0) || d.get<double>() > kMaxDeadlineSeconds) {
        throw_peer_error(ErrorKind::FormatError,
                         fmt::format("'deadline_seconds' must be a number between 0 and {}", kMaxDeadlineSeconds));
      }
      if(d.get<double>() > 0) {
        deadline = std::chrono::milliseconds(static_cast<long long>(d.get<double>() * 1000.0));
      }
    }
    return HttpResponse::json_body(200, to_json(deps_.sync.download_all(peer_id, deadline)));
  }
  if(request.method != "GET") return method_not_allowed(request);

  if(seg.size() == 3) {
    return HttpResponse::json_body(200, make_list_body("docs", deps_.client.fetch_docs(peer_id)));
  }
  if(seg.size() > 5) return route_not_found(request);
  std::string path = seg[3];
  if(seg.size() == 5) path += "/" + seg[4];
  return HttpResponse::json_body(200, to_json(deps_.client.fetch_doc(peer_id, path)));
}

HttpResponse ApiGateway::peer_friends(const std::string& peer_id) {
  return HttpResponse::json_body(200, make_list_body("friends", deps_.client.fetch_friends_of(peer_id)));
}
