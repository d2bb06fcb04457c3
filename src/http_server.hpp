#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "log.hpp"

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// Runs `handler`; a PeerError becomes its fixed status, anything else a 500.
HttpResponse invoke_handler(const HttpHandler& handler, const HttpRequest& request, Logger* logger);

// Accepts on the caller's io_context; request handlers run on an internal
// thread pool so a slow handler (one that calls out to a peer) never blocks
// the accept loop or other connections. One request per connection.
class HttpServer {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    std::uint16_t port = 0;          // 0 = ephemeral
    std::size_t threads = 4;
    std::size_t max_request_bytes = 1024 * 1024;
  };

  HttpServer(asio::io_context& io, Options options, HttpHandler handler,
             std::shared_ptr<Logger> logger = nullptr);
  ~HttpServer();

  // Bind and listen. Throws std::system_error when the address is taken.
  void start();
  void stop();

  std::uint16_t port() const { return bound_port_; }

private:
  friend class HttpSession;

  void do_accept();
  HttpResponse invoke(const HttpRequest& request) const;

  asio::io_context& io_;
  Options options_;
  HttpHandler handler_;
  std::shared_ptr<Logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  asio::thread_pool pool_;
  std::atomic<bool> running_{false};
  std::uint16_t bound_port_ = 0;
};
