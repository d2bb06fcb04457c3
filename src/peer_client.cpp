#include "peer_client.hpp"

#include <algorithm>
#include <array>

#include <asio.hpp>

#include "peer_error.hpp"
#include "utils.hpp"

using asio::ip::tcp;

HttpResponse http_get(const PeerAddress& address,
                      const std::string& target,
                      std::chrono::milliseconds timeout,
                      std::size_t max_response_bytes) {
  asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);

  const std::string request = build_get_request(address.host, address.port, target);
  const std::string where = address.host + ":" + std::to_string(address.port);
  std::string raw;
  std::array<char, 16 * 1024> chunk;
  std::error_code failure;
  const char* failed_stage = nullptr;
  bool too_large = false;
  bool complete = false;

  std::function<void()> read_more = [&](){
    socket.async_read_some(asio::buffer(chunk), [&](std::error_code ec, std::size_t n){
      raw.append(chunk.data(), n);
      if(raw.size() > max_response_bytes) {
        too_large = true;
        std::error_code ignored;
        socket.close(ignored);
        return;
      }
      if(ec == asio::error::eof) {
        complete = true;
        return;
      }
      if(ec) {
        failure = ec;
        failed_stage = "read";
        return;
      }
      read_more();
    });
  };

  resolver.async_resolve(address.host, std::to_string(address.port),
    [&](std::error_code ec, tcp::resolver::results_type results){
      if(ec) {
        failure = ec;
        failed_stage = "resolve";
        return;
      }
      asio::async_connect(socket, results, [&](std::error_code ec, const tcp::endpoint&){
        if(ec) {
          failure = ec;
          failed_stage = "connect";
          return;
        }
        asio::async_write(socket, asio::buffer(request), [&](std::error_code ec, std::size_t){
          if(ec) {
            failure = ec;
            failed_stage = "write";
            return;
          }
          read_more();
        });
      });
    });

  io.run_for(timeout);
  if(!io.stopped()) {
    std::error_code ignored;
    socket.close(ignored);
    resolver.cancel();
    throw_peer_error(ErrorKind::Timeout,
                     fmt::format("{} did not answer GET {} within {} ms", where, target, timeout.count()));
  }
  if(too_large) {
    throw_peer_error(ErrorKind::ProtocolError,
                     fmt::format("response from {} exceeds {} bytes", where, max_response_bytes));
  }
  if(failure) {
    throw_peer_error(ErrorKind::Unreachable,
                     fmt::format("{} failed for {}: {}", failed_stage, where, failure.message()));
  }
  if(!complete) {
    throw_peer_error(ErrorKind::Unreachable, "connection to " + where + " ended unexpectedly");
  }
  return parse_response(raw);
}

PeerClient::PeerClient(Options options, std::shared_ptr<Logger> logger)
  : options_(options), logger_(std::move(logger)) {
  const auto max_bytes = options_.max_response_bytes;
  transport_ = [max_bytes](const PeerAddress& address, const std::string& target,
                           std::chrono::milliseconds timeout) {
    return http_get(address, target, timeout, max_bytes);
  };
}

void PeerClient::set_address_resolver(AddressResolver resolver) {
  resolver_ = std::move(resolver);
}

void PeerClient::set_seen_callback(SeenCallback callback) {
  seen_ = std::move(callback);
}

void PeerClient::set_transport(PeerTransport transport) {
  if(transport) transport_ = std::move(transport);
}

PeerAddress PeerClient::resolve(const std::string& peer_id) const {
  std::optional<PeerAddress> address;
  if(resolver_) address = resolver_(peer_id);
  if(!address) {
    throw_peer_error(ErrorKind::NotFound, "unknown peer '" + peer_id + "'");
  }
  return *address;
}

std::chrono::milliseconds PeerClient::effective_timeout(const SteadyDeadline& deadline) const {
  auto timeout = options_.timeout;
  if(deadline) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline - std::chrono::steady_clock::now());
    if(remaining.count() <= 0) {
      throw_peer_error(ErrorKind::Timeout, kDeadlineExceededReason);
    }
    timeout = std::min(timeout, remaining);
  }
  return timeout;
}

HttpResponse PeerClient::get(const PeerAddress& address,
                             const std::vector<std::string>& segments,
                             const SteadyDeadline& deadline) {
  const auto target = build_target(segments);
  const auto timeout = effective_timeout(deadline);
  log_debug(logger_.get(), "GET {}:{}{} (timeout {} ms)", address.host, address.port, target, timeout.count());

  auto response = transport_(address, target, timeout);
  if(response.status >= 200 && response.status < 300) {
    if(response.body.size() > options_.max_response_bytes) {
      throw_peer_error(ErrorKind::ProtocolError, "response exceeds max_response_bytes");
    }
    return response;
  }

  std::string detail = http_status_text(response.status);
  const auto body = json::parse(response.body, nullptr, false);
  if(!body.is_discarded() && body.is_object() && body.contains("message") && body["message"].is_string()) {
    detail = body["message"].get<std::string>();
  }
  const auto message = fmt::format("{}:{}{} returned {}: {}", address.host, address.port, target,
                                   response.status, detail);
  if(response.status >= 400 && response.status < 500) {
    throw_peer_error(ErrorKind::NotFound, message);
  }
  throw_peer_error(ErrorKind::ProtocolError, message);
}

HttpResponse PeerClient::get_peer(const std::string& peer_id,
                                  const std::vector<std::string>& segments,
                                  const SteadyDeadline& deadline) {
  const auto address = resolve(peer_id);
  auto response = get(address, segments, deadline);
  mark_seen(peer_id);
  return response;
}

void PeerClient::mark_seen(const std::string& peer_id) {
  if(seen_) seen_(peer_id);
}

NodeInfo PeerClient::fetch_info(const ConnectionDescriptor& descriptor, SteadyDeadline deadline) {
  return fetch_info(descriptor.host(), descriptor.port(), deadline);
}

NodeInfo PeerClient::fetch_info(const std::string& host, std::uint16_t port, SteadyDeadline deadline) {
  auto response = get(PeerAddress{host, port}, {"peer", "info"}, deadline);
  auto info = node_info_from_json(parse_json_body(response.body, "node info"));
  mark_seen(info.id);
  return info;
}

std::vector<GalleryDescriptor> PeerClient::fetch_galleries(const std::string& peer_id, MediaKind kind,
                                                           SteadyDeadline deadline) {
  auto response = get_peer(peer_id, {"peer", "galleries", media_kind_name(kind)}, deadline);
  return gallery_list_from_json(parse_json_body(response.body, "gallery list"), kind);
}

GalleryDescriptor PeerClient::fetch_gallery(const std::string& peer_id, MediaKind kind,
                                            const std::string& gallery, SteadyDeadline deadline) {
  auto response = get_peer(peer_id, {"peer", "galleries", media_kind_name(kind), gallery}, deadline);
  return gallery_from_json(parse_json_body(response.body, "gallery"), kind);
}

std::string PeerClient::fetch_file(const std::string& peer_id, MediaKind kind, const std::string& gallery,
                                   const std::string& filename, SteadyDeadline deadline) {
  auto response = get_peer(peer_id, {"peer", "files", media_kind_name(kind), gallery, filename}, deadline);
  return std::move(response.body);
}

std::vector<DocSummary> PeerClient::fetch_docs(const std::string& peer_id, SteadyDeadline deadline) {
  auto response = get_peer(peer_id, {"peer", "docs"}, deadline);
  return doc_list_from_json(parse_json_body(response.body, "doc list"));
}

DocContent PeerClient::fetch_doc(const std::string& peer_id, const std::string& filename,
                                 SteadyDeadline deadline) {
  std::vector<std::string> segments{"peer", "docs"};
  for(const auto& part : split(filename, '/')) {
    if(!part.empty()) segments.push_back(part);
  }
  if(segments.size() == 2) {
    throw_peer_error(ErrorKind::FormatError, "empty document name");
  }
  auto response = get_peer(peer_id, segments, deadline);
  return doc_content_from_json(parse_json_body(response.body, "doc"));
}

std::vector<Friend> PeerClient::fetch_friends_of(const std::string& peer_id, SteadyDeadline deadline) {
  auto response = get_peer(peer_id, {"peer", "friends"}, deadline);
  return friend_list_from_json(parse_json_body(response.body, "friend list"));
}
