#include "connection_descriptor.hpp"
#include "content_store.hpp"
#include "friend_registry.hpp"
#include "log.hpp"
#include "node_engine.hpp"
#include "peer_client.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace friendsync::test;
using nlohmann::json;

namespace {

namespace fs = std::filesystem;

struct RunnerConfig {
  fs::path root;
  fs::path alice_root;
  fs::path bob_root;
};

RunnerConfig prepare_workspace() {
  RunnerConfig cfg;
  cfg.root = fresh_directory("friendsync_node_test_runner");
  cfg.alice_root = cfg.root / "alice";
  cfg.bob_root = cfg.root / "bob";
  std::error_code ec;
  fs::create_directories(cfg.alice_root, ec);
  fs::create_directories(cfg.bob_root, ec);

  write_file(cfg.bob_root / "images" / "trip" / "1.jpg", "JPEG-1");
  write_file(cfg.bob_root / "images" / "trip" / "2.jpg", "JPEG-2");
  write_file(cfg.bob_root / "docs" / "readme.md", "# Bob's notes");
  write_file(cfg.bob_root / "docs" / "notes" / "a.md", "alpha");
  write_file(cfg.bob_root / "docs" / "notes" / "b.txt", "beta");
  return cfg;
}

std::unique_ptr<NodeEngine> start_node(TestContext& ctx,
                                       const fs::path& workspace,
                                       const std::string& peer_id,
                                       const std::string& node_name) {
  NodeEngine::Options options;
  options.workspace_root = workspace;
  auto engine = std::make_unique<NodeEngine>(loopback_settings(workspace, peer_id, node_name), options);
  ctx.logs.attach(*engine, peer_id);
  engine->start();
  engine->start_background();
  if(ctx.verbose) {
    std::cout << "    " << peer_id << " listening on " << engine->listen_port() << "\n";
  }
  return engine;
}

HttpResponse call(NodeEngine& engine, const std::string& method, const std::string& target,
                  const json& body = nullptr) {
  return engine.handle(make_request(method, target, body.is_null() ? std::string() : body.dump()));
}

bool befriend(NodeEngine& from, NodeEngine& to) {
  auto response = call(from, "POST", "/api/friends", {{"connection_string", to.connection_string()}});
  if(response.status != 201) {
    std::cout << "\n    add friend returned " << response.status << ": " << response.body << "\n";
    return false;
  }
  return true;
}

void cleanup(const RunnerConfig& cfg) {
  std::error_code ec;
  fs::remove_all(cfg.root, ec);
}

bool test_add_friend_and_browse(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");

  auto added = call(*alice, "POST", "/api/friends",
                    {{"connection_string", bob->connection_string()}, {"peer_name", "ignored"}});
  FRIENDSYNC_CHECK(added.status == 201);
  auto added_json = response_json(added);
  FRIENDSYNC_CHECK(added_json["status"] == "success");
  FRIENDSYNC_CHECK(added_json["friend"]["peerID"] == "bob");
  FRIENDSYNC_CHECK(added_json["friend"]["peerName"] == "Bob");
  FRIENDSYNC_CHECK(added_json["friend"]["isOnline"] == true);

  // Adding the same friend again keeps a single entry.
  FRIENDSYNC_CHECK(befriend(*alice, *bob));
  auto friends = response_json(call(*alice, "GET", "/api/friends"));
  FRIENDSYNC_CHECK(friends["count"] == 1);

  auto galleries = call(*alice, "GET", "/api/peer-galleries/bob?kind=images");
  FRIENDSYNC_CHECK(galleries.status == 200);
  auto galleries_json = response_json(galleries);
  FRIENDSYNC_CHECK(galleries_json["count"] == 1);
  FRIENDSYNC_CHECK(galleries_json["galleries"][0]["name"] == "trip");
  FRIENDSYNC_CHECK(galleries_json["galleries"][0]["fileCount"] == 2);

  auto gallery = response_json(call(*alice, "GET", "/api/peer-galleries/bob/trip?kind=images"));
  FRIENDSYNC_CHECK(gallery["files"].size() == 2);

  auto file = call(*alice, "GET", "/api/peer-galleries/bob/trip/1.jpg?kind=images");
  FRIENDSYNC_CHECK(file.status == 200);
  FRIENDSYNC_CHECK(file.body == "JPEG-1");
  FRIENDSYNC_CHECK(file.content_type == "image/jpeg");
  FRIENDSYNC_CHECK(fs::is_regular_file(cfg.alice_root / "downloaded" / "bob" / "images" / "trip" / "1.jpg"));

  auto missing = call(*alice, "GET", "/api/peer-galleries/bob/trip/9.jpg?kind=images");
  FRIENDSYNC_CHECK(missing.status == 404);
  auto bad_kind = call(*alice, "GET", "/api/peer-galleries/bob?kind=sculpture");
  FRIENDSYNC_CHECK(bad_kind.status == 400);

  auto docs = response_json(call(*alice, "GET", "/api/peer-docs/bob"));
  FRIENDSYNC_CHECK(docs["count"] == 3);
  auto doc = response_json(call(*alice, "GET", "/api/peer-docs/bob/notes/a.md"));
  FRIENDSYNC_CHECK(doc["content"] == "alpha");
  FRIENDSYNC_CHECK(doc["contentType"] == "markdown");
  auto loose = response_json(call(*alice, "GET", "/api/peer-docs/bob/readme.md"));
  FRIENDSYNC_CHECK(loose["title"] == "readme");

  auto stranger = call(*alice, "GET", "/api/peer-galleries/carol?kind=images");
  FRIENDSYNC_CHECK(stranger.status == 404);

  FRIENDSYNC_CHECK(alice->stats().friends == 1);
  FRIENDSYNC_CHECK(alice->stats().online_friends == 1);

  alice->stop();
  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_unreachable_friend_is_rejected(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");

  auto unreachable = call(*alice, "POST", "/api/friends", {{"connection_string", "127.0.0.1:1:ghost"}});
  FRIENDSYNC_CHECK(unreachable.status == 502);
  FRIENDSYNC_CHECK(response_json(unreachable)["error"] == "Unreachable");
  FRIENDSYNC_CHECK(alice->registry().size() == 0);

  auto malformed = call(*alice, "POST", "/api/friends", {{"connection_string", "no-port-here"}});
  FRIENDSYNC_CHECK(malformed.status == 400);
  FRIENDSYNC_CHECK(response_json(malformed)["error"] == "FormatError");

  auto not_json = alice->handle(make_request("POST", "/api/friends", "{oops"));
  FRIENDSYNC_CHECK(not_json.status == 400);

  auto unknown = call(*alice, "GET", "/api/friends/ghost");
  FRIENDSYNC_CHECK(unknown.status == 404);
  auto remove_unknown = call(*alice, "DELETE", "/api/friends/ghost");
  FRIENDSYNC_CHECK(remove_unknown.status == 404);
  auto download_unknown = call(*alice, "POST", "/api/peer-docs/ghost/download", json::object());
  FRIENDSYNC_CHECK(download_unknown.status == 404);

  auto discover = response_json(call(*alice, "POST", "/api/discover", {{"ip", "127.0.0.1"}, {"port", 1}}));
  FRIENDSYNC_CHECK(discover["reachable"] == false);
  FRIENDSYNC_CHECK(discover["error"] == "Unreachable");

  alice->stop();
  cleanup(cfg);
  return true;
}

bool test_discover_and_remove(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");

  auto discover = call(*alice, "POST", "/api/discover", {{"ip", "127.0.0.1"}, {"port", bob->listen_port()}});
  FRIENDSYNC_CHECK(discover.status == 200);
  auto discover_json = response_json(discover);
  FRIENDSYNC_CHECK(discover_json["reachable"] == true);
  FRIENDSYNC_CHECK(discover_json["node"]["id"] == "bob");
  FRIENDSYNC_CHECK(discover_json["connection_string"] == bob->connection_string());
  // Discovery alone does not make a friend.
  FRIENDSYNC_CHECK(alice->registry().size() == 0);

  FRIENDSYNC_CHECK(befriend(*alice, *bob));
  auto removed = call(*alice, "DELETE", "/api/friends/bob");
  FRIENDSYNC_CHECK(removed.status == 200);
  FRIENDSYNC_CHECK(response_json(removed)["status"] == "success");
  auto removed_again = call(*alice, "DELETE", "/api/friends/bob");
  FRIENDSYNC_CHECK(removed_again.status == 404);
  FRIENDSYNC_CHECK(call(*alice, "GET", "/api/friend-galleries/bob").status == 404);

  alice->stop();
  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_friends_of_friend(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");

  FRIENDSYNC_CHECK(befriend(*alice, *bob));
  auto none = response_json(call(*alice, "GET", "/api/peer-friends/bob"));
  FRIENDSYNC_CHECK(none["count"] == 0);

  FRIENDSYNC_CHECK(befriend(*bob, *alice));
  auto one = response_json(call(*alice, "GET", "/api/peer-friends/bob"));
  FRIENDSYNC_CHECK(one["count"] == 1);
  FRIENDSYNC_CHECK(one["friends"][0]["peerID"] == "alice");
  FRIENDSYNC_CHECK(one["friends"][0]["peerName"] == "Alice");

  alice->stop();
  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_bulk_download_and_merged_view(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");
  FRIENDSYNC_CHECK(befriend(*alice, *bob));

  auto download = call(*alice, "POST", "/api/peer-docs/bob/download", json::object());
  FRIENDSYNC_CHECK(download.status == 200);
  auto outcome = response_json(download);
  FRIENDSYNC_CHECK(outcome["peer_id"] == "bob");
  FRIENDSYNC_CHECK(outcome["docs_downloaded"] == 2);
  FRIENDSYNC_CHECK(outcome["images_downloaded"] == 2);
  FRIENDSYNC_CHECK(outcome["errors"].empty());
  FRIENDSYNC_CHECK(outcome["cancelled"] == false);
  FRIENDSYNC_CHECK(ctx.logs.contains("Download from bob finished"));

  auto cached = response_json(call(*alice, "GET", "/api/downloaded/bob/images"));
  FRIENDSYNC_CHECK(cached["count"] == 1);
  FRIENDSYNC_CHECK(cached["galleries"][0]["source"] == "downloaded");
  auto cached_file = call(*alice, "GET", "/api/downloaded/bob/images/trip/2.jpg");
  FRIENDSYNC_CHECK(cached_file.status == 200);
  FRIENDSYNC_CHECK(cached_file.body == "JPEG-2");
  auto cached_docs = response_json(call(*alice, "GET", "/api/downloaded/bob/docs/notes"));
  FRIENDSYNC_CHECK(cached_docs["files"].size() == 2);

  auto merged = response_json(call(*alice, "GET", "/api/friend-galleries/bob?kind=images"));
  FRIENDSYNC_CHECK(merged["count"] == 1);
  FRIENDSYNC_CHECK(merged["galleries"][0]["source"] == "live");
  FRIENDSYNC_CHECK(merged["galleries"][0]["isDownloaded"] == true);
  FRIENDSYNC_CHECK(!merged.contains("live_error"));

  // Once the friend is gone the cached copy is still listed.
  bob->stop();
  auto offline = response_json(call(*alice, "GET", "/api/friend-galleries/bob?kind=images"));
  FRIENDSYNC_CHECK(offline["count"] == 1);
  FRIENDSYNC_CHECK(offline["galleries"][0]["source"] == "downloaded");
  FRIENDSYNC_CHECK(offline.contains("live_error"));
  auto offline_live = call(*alice, "GET", "/api/peer-galleries/bob?kind=images");
  FRIENDSYNC_CHECK(offline_live.status == 502 || offline_live.status == 504);

  alice->stop();
  cleanup(cfg);
  return true;
}

bool test_served_over_http(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  const PeerAddress address{"127.0.0.1", bob->listen_port()};
  const auto timeout = std::chrono::milliseconds(2000);
  const std::size_t max_bytes = 1024 * 1024;

  auto info = http_get(address, "/peer/info", timeout, max_bytes);
  FRIENDSYNC_CHECK(info.status == 200);
  auto info_json = response_json(info);
  FRIENDSYNC_CHECK(info_json["node"]["id"] == "bob");
  FRIENDSYNC_CHECK(info_json["node"]["name"] == "Bob");
  FRIENDSYNC_CHECK(info_json["node"]["port"] == bob->listen_port());
  FRIENDSYNC_CHECK(info_json["folderInfo"]["files"].size() == 5);

  auto raw = http_get(address, "/peer/docs/notes/b.txt?raw=1", timeout, max_bytes);
  FRIENDSYNC_CHECK(raw.status == 200);
  FRIENDSYNC_CHECK(raw.body == "beta");

  auto spaced = http_get(address, "/peer/galleries/images/no%20such", timeout, max_bytes);
  FRIENDSYNC_CHECK(spaced.status == 404);
  auto escape = http_get(address, "/peer/files/images/trip/..", timeout, max_bytes);
  FRIENDSYNC_CHECK(escape.status == 400);
  auto wrong_method = http_get(address, "/api/discover", timeout, max_bytes);
  FRIENDSYNC_CHECK(wrong_method.status == 405);
  auto nowhere = http_get(address, "/nowhere", timeout, max_bytes);
  FRIENDSYNC_CHECK(nowhere.status == 404);
  FRIENDSYNC_CHECK(response_json(nowhere)["error"] == "NotFound");

  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_restart_keeps_friends(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");
  {
    auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");
    FRIENDSYNC_CHECK(befriend(*alice, *bob));
    alice->stop();
  }
  FRIENDSYNC_CHECK(fs::is_regular_file(cfg.alice_root / ".config" / "friends.json"));

  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");
  auto friends = response_json(call(*alice, "GET", "/api/friends"));
  FRIENDSYNC_CHECK(friends["count"] == 1);
  FRIENDSYNC_CHECK(friends["friends"][0]["peerID"] == "bob");
  // The stored address is used without a new handshake.
  auto galleries = call(*alice, "GET", "/api/peer-galleries/bob?kind=images");
  FRIENDSYNC_CHECK(galleries.status == 200);

  alice->stop();
  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_generated_identity_persists(TestContext& ctx) {
  auto cfg = prepare_workspace();
  std::string first_id;
  {
    auto settings = loopback_settings(cfg.alice_root, "", "");
    NodeEngine::Options options;
    options.workspace_root = cfg.alice_root;
    NodeEngine engine(settings, options);
    ctx.logs.attach(engine, "anon");
    engine.start();
    first_id = engine.peer_id();
    FRIENDSYNC_CHECK(first_id.rfind("node-", 0) == 0);
    FRIENDSYNC_CHECK(engine.node_name() == first_id);
    engine.stop();
  }

  auto reloaded = std::make_shared<SettingsManager>();
  reloaded->set_settings_path(cfg.alice_root / ".config" / "settings.json");
  FRIENDSYNC_CHECK(reloaded->load());
  FRIENDSYNC_CHECK(reloaded->get<std::string>("peer_id") == first_id);

  cleanup(cfg);
  return true;
}

bool test_undecodable_requests_get_client_errors(TestContext& ctx) {
  auto cfg = prepare_workspace();
  auto bob = start_node(ctx, cfg.bob_root, "bob", "Bob");

  // %FF decodes to a byte that is not UTF-8; the error body must still be JSON.
  auto in_process = call(*bob, "GET", "/peer/galleries/images/%FF");
  FRIENDSYNC_CHECK(in_process.status >= 400 && in_process.status < 500);
  FRIENDSYNC_CHECK(response_json(in_process).contains("error"));

  const PeerAddress address{"127.0.0.1", bob->listen_port()};
  const auto timeout = std::chrono::milliseconds(2000);
  auto served = http_get(address, "/peer/galleries/images/%FF", timeout, 1024 * 1024);
  FRIENDSYNC_CHECK(served.status >= 400 && served.status < 500);
  auto docs = http_get(address, "/peer/docs/%C3%28.md", timeout, 1024 * 1024);
  FRIENDSYNC_CHECK(docs.status >= 400 && docs.status < 500);
  // Still serving.
  FRIENDSYNC_CHECK(http_get(address, "/peer/info", timeout, 1024 * 1024).status == 200);

  auto huge_deadline = call(*bob, "POST", "/api/peer-docs/carol/download", {{"deadline_seconds", 1e10}});
  FRIENDSYNC_CHECK(huge_deadline.status == 400);
  auto negative_deadline = call(*bob, "POST", "/api/peer-docs/carol/download", {{"deadline_seconds", -1}});
  FRIENDSYNC_CHECK(negative_deadline.status == 400);

  bob->stop();
  cleanup(cfg);
  return true;
}

bool test_wildcard_bind_advertises_dialable_host(TestContext& ctx) {
  auto cfg = prepare_workspace();
  NodeEngine::Options options;
  options.workspace_root = cfg.bob_root;

  auto settings = loopback_settings(cfg.bob_root, "bob", "Bob");
  configure(settings, "listen_ip", "0.0.0.0");
  NodeEngine wildcard(settings, options);
  ctx.logs.attach(wildcard, "bob");
  wildcard.start();
  FRIENDSYNC_CHECK(wildcard.connection_string().rfind("0.0.0.0:", 0) == std::string::npos);
  FRIENDSYNC_CHECK(wildcard.advertised_host() != "0.0.0.0");
  FRIENDSYNC_CHECK(ctx.logs.contains("cannot be dialed"));
  parse_connection_string(wildcard.connection_string());
  wildcard.stop();

  auto pinned_settings = loopback_settings(cfg.bob_root, "bob", "Bob");
  configure(pinned_settings, "listen_ip", "0.0.0.0");
  configure(pinned_settings, "advertise_host", "127.0.0.1");
  NodeEngine pinned(pinned_settings, options);
  pinned.start();
  pinned.start_background();
  FRIENDSYNC_CHECK(pinned.connection_string() ==
                   "127.0.0.1:" + std::to_string(pinned.listen_port()) + ":bob");
  auto info = response_json(call(pinned, "GET", "/peer/info"));
  FRIENDSYNC_CHECK(info["node"]["ip"] == "127.0.0.1");

  // A friend can be added from the advertised string.
  auto alice = start_node(ctx, cfg.alice_root, "alice", "Alice");
  auto added = call(*alice, "POST", "/api/friends", {{"connection_string", pinned.connection_string()}});
  FRIENDSYNC_CHECK(added.status == 201);

  alice->stop();
  pinned.stop();
  cleanup(cfg);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"add_friend_and_browse", test_add_friend_and_browse},
    {"unreachable_friend_is_rejected", test_unreachable_friend_is_rejected},
    {"discover_and_remove", test_discover_and_remove},
    {"friends_of_friend", test_friends_of_friend},
    {"bulk_download_and_merged_view", test_bulk_download_and_merged_view},
    {"served_over_http", test_served_over_http},
    {"restart_keeps_friends", test_restart_keeps_friends},
    {"generated_identity_persists", test_generated_identity_persists},
    {"undecodable_requests_get_client_errors", test_undecodable_requests_get_client_errors},
    {"wildcard_bind_advertises_dialable_host", test_wildcard_bind_advertises_dialable_host}
  };
  return run_tests("node", std::move(tests), argc, argv);
}
