#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "http_message.hpp"
#include "log.hpp"
#include "protocol.hpp"

class ApiGateway;
class ContentStore;
class ContentSyncEngine;
class FriendRegistry;
class HttpServer;
class PeerClient;
class PeerService;
class SettingsManager;

// One friendsync node: workspace, friend registry, peer client, sync engine
// and the HTTP server carrying both /api and /peer routes.
class NodeEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Write a generated peer_id back to the settings file.
    bool persist_generated_id = true;
  };

  NodeEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~NodeEngine();

  void start();
  void run();
  void start_background();
  void stop();

  // Route a request in-process, exactly as the server would.
  HttpResponse handle(const HttpRequest& request);
  NodeInfo local_info() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  struct Stats {
    std::size_t friends = 0;
    std::size_t online_friends = 0;
  };

  Stats stats() const;

  std::uint16_t listen_port() const { return listen_port_; }
  const std::string& peer_id() const { return peer_id_; }
  const std::string& node_name() const { return node_name_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  // Dialable "host:port:id"; the host is the advertised host, not a wildcard bind address.
  std::string connection_string() const;
  const std::string& advertised_host() const { return advertised_host_; }

  ContentStore& store() { return *store_; }
  FriendRegistry& registry() { return *registry_; }
  PeerClient& client() { return *client_; }
  ContentSyncEngine& sync() { return *sync_; }

private:
  void resolve_advertised_host();
  void ensure_workspace() const;
  void resolve_identity();
  HttpResponse route(const HttpRequest& request);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<ContentStore> store_;
  std::unique_ptr<PeerClient> client_;
  std::unique_ptr<FriendRegistry> registry_;
  std::unique_ptr<ContentSyncEngine> sync_;
  std::unique_ptr<PeerService> peer_service_;
  std::unique_ptr<ApiGateway> gateway_;
  std::unique_ptr<HttpServer> server_;
  std::atomic<bool> started_{false};
  std::string peer_id_;
  std::string node_name_;
  std::string listen_ip_;
  std::string advertised_host_;
  std::uint16_t listen_port_ = 0;
};
