#include "friend_registry.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "peer_error.hpp"
#include "utils.hpp"

FriendRegistry::FriendRegistry(Options options, InfoFetcher fetch_info, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    fetch_info_(std::move(fetch_info)),
    logger_(std::move(logger)),
    clock_([]{ return std::chrono::system_clock::now(); }) {}

void FriendRegistry::set_clock(Clock clock) {
  if(clock) clock_ = std::move(clock);
}

SystemTime FriendRegistry::now() const {
  return clock_();
}

Friend FriendRegistry::to_friend(const Record& record, SystemTime now) const {
  Friend f;
  f.peer_id = record.peer_id;
  f.peer_name = record.peer_name;
  f.host = record.host;
  f.port = record.port;
  f.added_at = record.added_at;
  f.last_seen = record.last_seen;
  if(!record.last_seen) {
    f.status = FriendStatus::Unknown;
  } else if(now - *record.last_seen < options_.online_threshold) {
    f.status = FriendStatus::Online;
  } else {
    f.status = FriendStatus::Offline;
  }
  f.is_online = f.status == FriendStatus::Online;
  return f;
}

Friend FriendRegistry::add(const ConnectionDescriptor& descriptor, const std::string& peer_name) {
  if(!fetch_info_) {
    throw_peer_error(ErrorKind::Internal, "friend registry has no info fetcher");
  }
  // Network handshake, no lock held.
  const NodeInfo info = fetch_info_(descriptor);

  std::string peer_id = info.id;
  if(peer_id != descriptor.peer_id()) {
    log_warn(logger_.get(), "peer at {}:{} claims id '{}' but connection string said '{}'; using '{}'",
             descriptor.host(), descriptor.port(), info.id, descriptor.peer_id(), info.id);
  }
  std::string name = info.name;
  if(name.empty()) name = trim_ascii(peer_name);
  if(name.empty()) name = peer_id;

  const auto seen_at = now();
  Friend result;
  std::vector<Record> snapshot;
  std::uint64_t generation = 0;
  bool inserted = false;
  {
    std::lock_guard lg(m_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r){ return r.peer_id == peer_id; });
    if(it == records_.end()) {
      Record record;
      record.peer_id = peer_id;
      record.added_at = seen_at;
      records_.push_back(std::move(record));
      it = std::prev(records_.end());
      inserted = true;
    }
    it->peer_name = name;
    it->host = descriptor.host();
    it->port = descriptor.port();
    it->last_seen = seen_at;
    result = to_friend(*it, seen_at);
    snapshot = records_;
    generation = ++generation_;
    dirty_ = false;
  }
  log_info(logger_.get(), "{} friend {} ({}) at {}:{}", inserted ? "Added" : "Updated",
           result.peer_id, result.peer_name, result.host, result.port);
  write_records(snapshot, generation);
  return result;
}

bool FriendRegistry::remove(const std::string& peer_id) {
  std::vector<Record> snapshot;
  std::uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r){ return r.peer_id == peer_id; });
    if(it == records_.end()) return false;
    records_.erase(it);
    snapshot = records_;
    generation = ++generation_;
    dirty_ = false;
  }
  log_info(logger_.get(), "Removed friend {}", peer_id);
  write_records(snapshot, generation);
  return true;
}

std::vector<Friend> FriendRegistry::list() const {
  const auto t = now();
  std::lock_guard lg(m_);
  std::vector<Friend> out;
  out.reserve(records_.size());
  for(const auto& r : records_) out.push_back(to_friend(r, t));
  return out;
}

std::optional<Friend> FriendRegistry::get(const std::string& peer_id) const {
  const auto t = now();
  std::lock_guard lg(m_);
  for(const auto& r : records_) {
    if(r.peer_id == peer_id) return to_friend(r, t);
  }
  return std::nullopt;
}

std::optional<PeerAddress> FriendRegistry::resolve(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  for(const auto& r : records_) {
    if(r.peer_id == peer_id) return PeerAddress{r.host, r.port};
  }
  return std::nullopt;
}

void FriendRegistry::mark_seen(const std::string& peer_id, SystemTime when) {
  std::lock_guard lg(m_);
  for(auto& r : records_) {
    if(r.peer_id != peer_id) continue;
    if(!r.last_seen || *r.last_seen < when) {
      r.last_seen = when;
      ++generation_;
      dirty_ = true;
    }
    return;
  }
}

void FriendRegistry::mark_seen(const std::string& peer_id) {
  mark_seen(peer_id, now());
}

std::size_t FriendRegistry::size() const {
  std::lock_guard lg(m_);
  return records_.size();
}

bool FriendRegistry::load() {
  if(options_.storage_path.empty()) return false;
  std::ifstream in(options_.storage_path);
  if(!in) return false;

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object() || !doc.contains("friends") || !doc["friends"].is_array()) {
    log_error(logger_.get(), "Ignoring unreadable friend list {}", options_.storage_path.string());
    return false;
  }

  std::vector<Record> loaded;
  for(const auto& entry : doc["friends"]) {
    try {
      auto descriptor = make_connection_descriptor(entry.at("host").get<std::string>(),
                                                   entry.at("port").get<std::uint16_t>(),
                                                   entry.at("peerID").get<std::string>());
      Record r;
      r.peer_id = descriptor.peer_id();
      r.host = descriptor.host();
      r.port = descriptor.port();
      r.peer_name = entry.value("peerName", r.peer_id);
      r.added_at = from_epoch_ms(entry.value("addedAt", std::int64_t{0}));
      if(entry.contains("lastSeen") && entry["lastSeen"].is_number_integer()) {
        r.last_seen = from_epoch_ms(entry["lastSeen"].get<std::int64_t>());
      }
      auto dup = std::find_if(loaded.begin(), loaded.end(),
                              [&](const Record& x){ return x.peer_id == r.peer_id; });
      if(dup != loaded.end()) {
        *dup = std::move(r);
      } else {
        loaded.push_back(std::move(r));
      }
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Skipping bad friend entry {}: {}", entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), e.what());
    }
  }

  std::lock_guard lg(m_);
  records_ = std::move(loaded);
  ++generation_;
  dirty_ = false;
  log_info(logger_.get(), "Loaded {} friend(s) from {}", records_.size(), options_.storage_path.string());
  return true;
}

bool FriendRegistry::save() const {
  std::vector<Record> snapshot;
  std::uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    snapshot = records_;
    generation = generation_;
  }
  return write_records(snapshot, generation);
}

void FriendRegistry::flush() {
  std::vector<Record> snapshot;
  std::uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    if(!dirty_) return;
    snapshot = records_;
    generation = generation_;
    dirty_ = false;
  }
  write_records(snapshot, generation);
}

bool FriendRegistry::write_records(const std::vector<Record>& records, std::uint64_t generation) const {
  if(options_.storage_path.empty()) return true;

  nlohmann::json arr = nlohmann::json::array();
  for(const auto& r : records) {
    nlohmann::json j;
    j["peerID"] = r.peer_id;
    j["peerName"] = r.peer_name;
    j["host"] = r.host;
    j["port"] = r.port;
    j["addedAt"] = to_epoch_ms(r.added_at);
    j["lastSeen"] = r.last_seen ? nlohmann::json(to_epoch_ms(*r.last_seen)) : nlohmann::json(nullptr);
    arr.push_back(std::move(j));
  }
  nlohmann::json doc;
  doc["friends"] = arr;

  std::lock_guard lg(save_mutex_);
  if(generation < written_generation_) return true;
  const auto& path = options_.storage_path;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if(!out) {
      log_error(logger_.get(), "Unable to write {}", temp.string());
      return false;
    }
    out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if(!out) {
      log_error(logger_.get(), "Short write to {}", temp.string());
      return false;
    }
  }
  std::filesystem::rename(temp, path, ec);
  if(ec) {
    log_error(logger_.get(), "Unable to replace {}: {}", path.string(), ec.message());
    return false;
  }
  written_generation_ = generation;
  return true;
}
