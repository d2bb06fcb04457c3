#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "connection_descriptor.hpp"
#include "log.hpp"
#include "peer_client.hpp"
#include "protocol.hpp"

// Durable set of friends keyed by peer id. One mutex guards the records;
// the handshake in add() and all file writes happen outside it.
class FriendRegistry {
public:
  using InfoFetcher = std::function<NodeInfo(const ConnectionDescriptor&)>;
  using Clock = std::function<SystemTime()>;

  struct Options {
    std::chrono::seconds online_threshold{300};
    std::filesystem::path storage_path;  // empty = in-memory only
  };

  FriendRegistry(Options options, InfoFetcher fetch_info, std::shared_ptr<Logger> logger = nullptr);

  void set_clock(Clock clock);

  // Handshake with the peer, then insert or update. Errors from the
  // handshake propagate and leave the registry untouched.
  Friend add(const ConnectionDescriptor& descriptor, const std::string& peer_name = "");
  // False when the peer is not a friend.
  bool remove(const std::string& peer_id);
  std::vector<Friend> list() const;
  std::optional<Friend> get(const std::string& peer_id) const;
  std::optional<PeerAddress> resolve(const std::string& peer_id) const;
  void mark_seen(const std::string& peer_id, SystemTime when);
  void mark_seen(const std::string& peer_id);
  std::size_t size() const;

  // Replaces the in-memory set with the stored one. Missing file is not an error.
  bool load();
  bool save() const;
  // Saves only when lastSeen changed since the last save.
  void flush();

private:
  struct Record {
    std::string peer_id;
    std::string peer_name;
    std::string host;
    std::uint16_t port = 0;
    SystemTime added_at{};
    std::optional<SystemTime> last_seen;
  };

  Friend to_friend(const Record& record, SystemTime now) const;
  SystemTime now() const;
  // Skips a snapshot older than the last one written.
  bool write_records(const std::vector<Record>& records, std::uint64_t generation) const;

  Options options_;
  InfoFetcher fetch_info_;
  std::shared_ptr<Logger> logger_;
  Clock clock_;

  mutable std::mutex m_;
  std::vector<Record> records_;  // insertion order
  bool dirty_ = false;
  std::uint64_t generation_ = 0;  // bumped on every change to records_

  mutable std::mutex save_mutex_;
  mutable std::uint64_t written_generation_ = 0;
};
