#include "http_server.hpp"

#include <algorithm>
#include <istream>

#include "peer_error.hpp"
#include "protocol.hpp"

using asio::ip::tcp;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    static std::shared_ptr<HttpSession> create(tcp::socket sock, HttpServer& server) {
        return std::shared_ptr<HttpSession>(new HttpSession(std::move(sock), server));
    }

    void start() { do_read_head(); }

private:
    HttpSession(tcp::socket sock, HttpServer& server)
    : socket_(std::move(sock)), server_(server), head_buf_(kMaxHeadBytes) {}

    void do_read_head();
    void on_head(std::size_t head_bytes);
    void do_read_body(std::size_t remaining);
    void dispatch();
    void respond(HttpResponse response);
    void close();

    Logger* logger() const { return server_.logger_.get(); }

    tcp::socket socket_;
    HttpServer& server_;
    asio::streambuf head_buf_;
    HttpRequest request_;
};

void HttpSession::do_read_head(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, head_buf_, "\r\n\r\n",
        [this, self](std::error_code ec, std::size_t bytes){
            if(ec == asio::error::not_found){
                respond(HttpResponse::json_body(431, make_error_body("FormatError", "request head too large")));
                return;
            }
            if(ec){
                if(ec != asio::error::eof) log_debug(logger(), "HTTP read error: {}", ec.message());
                close();
                return;
            }
            on_head(bytes);
        });
}

void HttpSession::on_head(std::size_t head_bytes){
    std::string head(asio::buffers_begin(head_buf_.data()),
                     asio::buffers_begin(head_buf_.data()) + static_cast<std::ptrdiff_t>(head_bytes - 4));
    head_buf_.consume(head_bytes);

    std::size_t length = 0;
    try{
        request_ = parse_request_head(head);
        length = request_content_length(request_);
    } catch(const PeerError& e){
        respond(HttpResponse::json_body(400, make_error_body(e.kind_name(), e.what())));
        return;
    }
    if(length > server_.options_.max_request_bytes){
        respond(HttpResponse::json_body(413, make_error_body("FormatError", "request body too large")));
        return;
    }

    // Whatever arrived after the head already belongs to the body.
    const std::size_t buffered = std::min(length, head_buf_.size());
    request_.body.assign(asio::buffers_begin(head_buf_.data()),
                         asio::buffers_begin(head_buf_.data()) + static_cast<std::ptrdiff_t>(buffered));
    head_buf_.consume(buffered);
    if(buffered < length){
        do_read_body(length - buffered);
    } else {
        dispatch();
    }
}

void HttpSession::do_read_body(std::size_t remaining){
    const auto offset = request_.body.size();
    request_.body.resize(offset + remaining);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(&request_.body[offset], remaining),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_debug(logger(), "HTTP body read error: {}", ec.message());
                close();
                return;
            }
            dispatch();
        });
}

void HttpSession::dispatch(){
    auto self = shared_from_this();
    asio::post(server_.pool_, [this, self](){
        HttpResponse response = server_.invoke(request_);
        asio::post(socket_.get_executor(), [this, self, response = std::move(response)]() mutable {
            respond(std::move(response));
        });
    });
}

void HttpSession::respond(HttpResponse response){
    auto self = shared_from_this();
    auto payload = std::make_shared<std::string>(serialize_response(response));
    log_debug(logger(), "{} {} -> {}", request_.method, request_.target, response.status);
    asio::async_write(socket_, asio::buffer(*payload),
        [this, self, payload](std::error_code ec, std::size_t){
            if(ec) log_debug(logger(), "HTTP write error: {}", ec.message());
            close();
        });
}

void HttpSession::close(){
    std::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

HttpServer::HttpServer(asio::io_context& io, Options options, HttpHandler handler,
                       std::shared_ptr<Logger> logger)
: io_(io),
  options_(std::move(options)),
  handler_(std::move(handler)),
  logger_(std::move(logger)),
  acceptor_(io),
  pool_(std::max<std::size_t>(1, options_.threads))
{
}

HttpServer::~HttpServer(){
    stop();
}

void HttpServer::start(){
    if(running_) return;
    tcp::endpoint endpoint(asio::ip::make_address(options_.listen_ip), options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;
    log_info(logger_.get(), "HTTP listening on {}:{}", options_.listen_ip, bound_port_);
    do_accept();
}

void HttpServer::stop(){
    if(running_.exchange(false)){
        std::error_code ec;
        acceptor_.close(ec);
    }
    pool_.join();
}

void HttpServer::do_accept(){
    acceptor_.async_accept([this](std::error_code ec, tcp::socket sock){
        if(!running_) return;
        if(!ec){
            HttpSession::create(std::move(sock), *this)->start();
        } else {
            log_warn(logger_.get(), "accept failed: {}", ec.message());
        }
        do_accept();
    });
}

namespace {

// Last resort when even the error body cannot be built.
HttpResponse fixed_internal_error(){
    HttpResponse r;
    r.status = 500;
    r.content_type = "application/json";
    r.body = R"({"error":"Internal","message":"internal error"})";
    return r;
}

}

HttpResponse invoke_handler(const HttpHandler& handler, const HttpRequest& request, Logger* logger){
    try{
        try{
            return handler(request);
        } catch(const PeerError& e){
            return HttpResponse::json_body(error_kind_http_status(e.kind()),
                                           make_error_body(e.kind_name(), e.what()));
        } catch(const std::exception& e){
            log_error(logger, "Handler for {} {} threw: {}", request.method, request.target, e.what());
            return HttpResponse::json_body(500, make_error_body("Internal", e.what()));
        }
    } catch(const std::exception& e){
        log_error(logger, "Unable to build error response for {}: {}", request.target, e.what());
        return fixed_internal_error();
    }
}

HttpResponse HttpServer::invoke(const HttpRequest& request) const{
    return invoke_handler(handler_, request, logger_.get());
}
