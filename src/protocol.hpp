#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils.hpp"

using json = nlohmann::json;

// protocol.hpp
// Wire types shared by the peer endpoints, the REST gateway and PeerClient.
// Encoders always emit every field; decoders validate required fields
// (PeerError ProtocolError) and ignore anything they do not know.

enum class MediaKind { Docs, Images, Audio, Video };

const char* media_kind_name(MediaKind kind);
std::optional<MediaKind> parse_media_kind(const std::string& name);
const std::vector<MediaKind>& all_media_kinds();
// Lower-case extensions without the dot.
const std::vector<std::string>& media_kind_extensions(MediaKind kind);
bool media_kind_accepts(MediaKind kind, const std::string& filename);

struct FolderInfo {
  std::string path;
  std::vector<std::string> files;
  std::string last_scan;  // ISO-8601
};

struct NodeInfo {
  std::string id;
  std::string name;
  std::string ip;
  std::uint16_t port = 0;
  std::string last_seen;  // ISO-8601
  std::optional<FolderInfo> folder;
};

enum class GallerySource { Live, Downloaded };

struct GalleryDescriptor {
  std::string name;
  MediaKind kind = MediaKind::Images;
  std::vector<std::string> files;
  GallerySource source = GallerySource::Live;
  bool is_downloaded = false;

  std::size_t file_count() const { return files.size(); }
};

struct DocSummary {
  std::string path;          // "file" or "gallery/file"
  std::string title;         // filename without extension
  std::string content_type;  // markdown | text | html | binary
  std::uint64_t size = 0;
  std::string modified;      // ISO-8601
};

struct DocContent {
  DocSummary summary;
  std::string content;
};

enum class FriendStatus { Unknown, Online, Offline };
const char* friend_status_name(FriendStatus status);

struct Friend {
  std::string peer_id;
  std::string peer_name;
  std::string host;
  std::uint16_t port = 0;
  SystemTime added_at{};
  std::optional<SystemTime> last_seen;
  // Derived at read time from last_seen and the online threshold.
  bool is_online = false;
  FriendStatus status = FriendStatus::Unknown;
};

struct ItemError {
  std::string item;
  std::string reason;
};

inline constexpr const char* kDeadlineExceededReason = "cancelled: deadline exceeded";

struct DownloadOutcome {
  std::string peer_id;
  std::size_t docs_downloaded = 0;
  std::size_t images_downloaded = 0;
  std::vector<ItemError> errors;           // completion order
  std::vector<std::string> successful_files;
  std::vector<ItemError> listing_errors;
  std::size_t files_total = 0;
  bool cancelled = false;
};

// ---- encoders ------------------------------------------------------------
json to_json(const FolderInfo& info);
json to_json(const NodeInfo& info);
json to_json(const GalleryDescriptor& gallery);
json to_json(const DocSummary& doc);
json to_json(const DocContent& doc);
json to_json(const Friend& f);
json to_json(const ItemError& e);
json to_json(const DownloadOutcome& outcome);

// {"<key>": [...], "count": N}
template<typename T>
json make_list_body(const char* key, const std::vector<T>& items) {
  json arr = json::array();
  for(const auto& item : items) arr.push_back(to_json(item));
  json j;
  j[key] = arr;
  j["count"] = items.size();
  return j;
}

json make_error_body(const std::string& kind, const std::string& message);
json make_status_body(const std::string& status, const std::string& message);

// ---- decoders ------------------------------------------------------------
// Parse JSON text; invalid text is a ProtocolError.
json parse_json_body(const std::string& body, const char* context);

NodeInfo node_info_from_json(const json& j);
GalleryDescriptor gallery_from_json(const json& j, MediaKind kind);
std::vector<GalleryDescriptor> gallery_list_from_json(const json& j, MediaKind kind);
DocSummary doc_summary_from_json(const json& j);
DocContent doc_content_from_json(const json& j);
std::vector<DocSummary> doc_list_from_json(const json& j);
Friend friend_from_json(const json& j);
std::vector<Friend> friend_list_from_json(const json& j);
