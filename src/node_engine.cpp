#include "node_engine.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "api_gateway.hpp"
#include "content_store.hpp"
#include "content_sync_engine.hpp"
#include "friend_registry.hpp"
#include "http_server.hpp"
#include "peer_client.hpp"
#include "peer_error.hpp"
#include "peer_service.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

NodeEngine::NodeEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("node")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

NodeEngine::~NodeEngine() {
  stop();
}

void NodeEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw std::runtime_error("Cannot create workspace " + options_.workspace_root.string() + ": " + ec.message());
  }
}

void NodeEngine::resolve_identity() {
  peer_id_ = trim_ascii(settings_->get<std::string>("peer_id"));
  if(peer_id_.empty()) {
    peer_id_ = generate_node_id();
    std::string error;
    if(!settings_->set_from_json("peer_id", peer_id_, error)) {
      throw std::runtime_error("Cannot store generated peer_id: " + error);
    }
    if(options_.persist_generated_id && !settings_->save()) {
      logger_->warn("Generated peer id {} could not be persisted to {}",
                    peer_id_, settings_->settings_path().string());
    }
  }
  ContentStore::validate_component(peer_id_, "peer_id");

  node_name_ = trim_ascii(settings_->get<std::string>("node_name"));
  if(node_name_.empty()) node_name_ = peer_id_;
  logger_->set_name(peer_id_);
}

void NodeEngine::start() {
  if(started_) return;

  ensure_workspace();
  if(!settings_->has_settings_path()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  init(settings_->get<bool>("verbose"));
  resolve_identity();

  listen_ip_ = settings_->get<std::string>("listen_ip");
  resolve_advertised_host();
  int listen_port_value = settings_->get<int>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::runtime_error("Invalid listen_port");
  }

  store_ = std::make_unique<ContentStore>(options_.workspace_root, logger_);
  store_->ensure_layout();

  PeerClient::Options client_options;
  client_options.timeout = std::chrono::milliseconds(settings_->get<int>("peer_timeout_ms"));
  client_options.max_response_bytes = settings_->get<std::size_t>("max_response_bytes");
  client_ = std::make_unique<PeerClient>(client_options, logger_);

  FriendRegistry::Options registry_options;
  registry_options.online_threshold = std::chrono::seconds(settings_->get<int>("online_threshold_seconds"));
  registry_options.storage_path = store_->config_dir() / "friends.json";
  auto* client = client_.get();
  registry_ = std::make_unique<FriendRegistry>(registry_options,
    [client](const ConnectionDescriptor& descriptor){ return client->fetch_info(descriptor); },
    logger_);
  registry_->load();

  auto* registry = registry_.get();
  client_->set_address_resolver([registry](const std::string& id){ return registry->resolve(id); });
  client_->set_seen_callback([registry](const std::string& id){ registry->mark_seen(id); });

  SyncConfig sync_config;
  sync_config.workers = settings_->get<std::size_t>("sync_workers");
  sync_config.default_deadline = std::chrono::seconds(settings_->get<int>("sync_deadline_seconds"));
  auto* store = store_.get();
  sync_ = std::make_unique<ContentSyncEngine>(sync_config,
    [registry](const std::string& id){ return registry->get(id).has_value(); },
    [client](const std::string& id, MediaKind kind, SteadyDeadline deadline){
      return client->fetch_galleries(id, kind, deadline);
    },
    [client](const std::string& id, MediaKind kind, const std::string& gallery,
             const std::string& file, SteadyDeadline deadline){
      return client->fetch_file(id, kind, gallery, file, deadline);
    },
    [store](const std::string& id, MediaKind kind, const std::string& gallery,
            const std::string& file, const std::string& bytes){
      store->write_cached_file(id, kind, gallery, file, bytes);
    },
    logger_);

  peer_service_ = std::make_unique<PeerService>(*store_,
    [this]{ return local_info(); },
    [registry]{ return registry->list(); },
    logger_);
  gateway_ = std::make_unique<ApiGateway>(ApiGateway::Dependencies{
      *store_, *registry_, *client_, *sync_, [this]{ return local_info(); }},
    logger_);

  HttpServer::Options server_options;
  server_options.listen_ip = listen_ip_;
  server_options.port = static_cast<std::uint16_t>(listen_port_value);
  server_options.threads = settings_->get<std::size_t>("http_threads");
  server_options.max_request_bytes = settings_->get<std::size_t>("max_request_bytes");
  server_ = std::make_unique<HttpServer>(io_, server_options,
    [this](const HttpRequest& request){ return route(request); },
    logger_);
  try {
    server_->start();
  } catch(const std::exception& e) {
    logger_->error("Cannot listen on {}:{}: {}", listen_ip_, listen_port_value, e.what());
    throw;
  }
  listen_port_ = server_->port();
  started_ = true;
  logger_->info("Node {} ({}) ready: {}", peer_id_, node_name_, connection_string());
}

HttpResponse NodeEngine::handle(const HttpRequest& request) {
  return invoke_handler([this](const HttpRequest& r){ return route(r); }, request, logger_.get());
}

HttpResponse NodeEngine::route(const HttpRequest& request) {
  if(!started_) throw_peer_error(ErrorKind::Internal, "node is not running");
  if(auto response = peer_service_->handle(request)) return std::move(*response);
  if(auto response = gateway_->handle(request)) return std::move(*response);
  return route_not_found(request);
}

NodeInfo NodeEngine::local_info() const {
  NodeInfo info;
  info.id = peer_id_;
  info.name = node_name_;
  info.ip = advertised_host_;
  info.port = listen_port_;
  info.last_seen = format_iso8601(std::chrono::system_clock::now());
  if(store_) info.folder = store_->scan();
  return info;
}

std::string NodeEngine::connection_string() const {
  return advertised_host_ + ":" + std::to_string(listen_port_) + ":" + peer_id_;
}

void NodeEngine::resolve_advertised_host() {
  advertised_host_ = trim_ascii(settings_->get<std::string>("advertise_host"));
  if(!advertised_host_.empty()) return;
  advertised_host_ = listen_ip_;

  std::error_code ec;
  auto address = asio::ip::make_address(listen_ip_, ec);
  if(ec || !address.is_unspecified()) return;
  auto host = asio::ip::host_name(ec);
  advertised_host_ = (ec || host.empty()) ? std::string("127.0.0.1") : host;
  logger_->warn("listen_ip {} cannot be dialed by peers; advertising '{}' (set advertise_host to override)",
                listen_ip_, advertised_host_);
}

void NodeEngine::run() {
  if(!started_) start();
  io_.run();
}

void NodeEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void NodeEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(server_) server_->stop();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
  if(registry_) registry_->flush();
  logger_->info("Node {} stopped", peer_id_);
}

LogListenerHandle NodeEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void NodeEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void NodeEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

NodeEngine::Stats NodeEngine::stats() const {
  Stats s;
  if(registry_) {
    for(const auto& f : registry_->list()) {
      ++s.friends;
      if(f.is_online) ++s.online_friends;
    }
  }
  return s;
}
