#include "settings_manager.hpp"
#include "node_engine.hpp"
#include "http_message.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "node_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "peerA", ec);
  fs::create_directories(base / "peerB" / "images" / "holiday", ec);
  std::ofstream(base / "peerB" / "images" / "holiday" / "beach.jpg", std::ios::binary) << "not really a jpeg";

  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };

  auto settings_a = std::make_shared<SettingsManager>();
  settings_a->set_settings_path(base / "peerA" / ".config" / "settings.json");
  configure(settings_a, "listen_ip", "127.0.0.1");
  configure(settings_a, "listen_port", 0);
  configure(settings_a, "peer_id", "sample-peerA");
  configure(settings_a, "node_name", "Sample Peer A");
  NodeEngine::Options peer_a;
  peer_a.workspace_root = base / "peerA";

  NodeEngine engine_a(settings_a, peer_a);
  engine_a.add_log_listener([](void*, const std::string& channel, spdlog::level::level_enum, const std::string& message){
    std::cout << "[A " << channel << "] " << message << "\n";
    return true;
  });
  engine_a.start();
  engine_a.start_background();

  auto settings_b = std::make_shared<SettingsManager>();
  settings_b->set_settings_path(base / "peerB" / ".config" / "settings.json");
  configure(settings_b, "listen_ip", "127.0.0.1");
  configure(settings_b, "listen_port", 0);
  configure(settings_b, "peer_id", "sample-peerB");
  configure(settings_b, "node_name", "Sample Peer B");
  NodeEngine::Options peer_b;
  peer_b.workspace_root = base / "peerB";

  NodeEngine engine_b(settings_b, peer_b);
  engine_b.start();
  engine_b.start_background();

  nlohmann::json add_body{{"connection_string", engine_b.connection_string()}};
  auto add_head = "POST /api/friends HTTP/1.1\r\nContent-Length: " + std::to_string(add_body.dump().size());
  auto add = parse_request_head(add_head);
  add.body = add_body.dump();
  auto added = engine_a.handle(add);
  std::cout << "add friend -> " << added.status << " " << added.body << "\n";

  auto galleries = engine_a.handle(parse_request_head("GET /api/friend-galleries/sample-peerB?kind=images HTTP/1.1"));
  std::cout << "friend galleries -> " << galleries.status << " " << galleries.body << "\n";

  auto stats = engine_a.stats();
  std::cout << "A knows " << stats.friends << " friend(s), " << stats.online_friends << " online\n";

  engine_b.stop();
  engine_a.stop();
  engine_a.clear_log_listeners();

  fs::remove_all(base, ec);
  return 0;
}
