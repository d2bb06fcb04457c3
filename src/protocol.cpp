#include "protocol.hpp"

#include <algorithm>

#include "peer_error.hpp"

namespace {

const json& require(const json& j, const char* key, const char* context) {
    if(!j.is_object() || !j.contains(key)) {
        throw_peer_error(ErrorKind::ProtocolError,
                         std::string(context) + ": missing field '" + key + "'");
    }
    return j.at(key);
}

std::string require_string(const json& j, const char* key, const char* context) {
    const auto& v = require(j, key, context);
    if(!v.is_string()) {
        throw_peer_error(ErrorKind::ProtocolError,
                         std::string(context) + ": field '" + key + "' is not a string");
    }
    return v.get<std::string>();
}

const json& require_array(const json& j, const char* key, const char* context) {
    const auto& v = require(j, key, context);
    if(!v.is_array()) {
        throw_peer_error(ErrorKind::ProtocolError,
                         std::string(context) + ": field '" + key + "' is not an array");
    }
    return v;
}

std::string optional_string(const json& j, const char* key) {
    if(j.is_object() && j.contains(key) && j.at(key).is_string()) return j.at(key).get<std::string>();
    return {};
}

std::uint16_t optional_port(const json& j, const char* key) {
    if(!j.is_object() || !j.contains(key)) return 0;
    const auto& v = j.at(key);
    if(v.is_number_unsigned() || v.is_number_integer()) {
        auto p = v.get<long long>();
        if(p > 0 && p <= 65535) return static_cast<std::uint16_t>(p);
    }
    return 0;
}

std::string extension_of(const std::string& filename) {
    auto dot = filename.rfind('.');
    if(dot == std::string::npos || dot + 1 >= filename.size()) return {};
    return to_lower_ascii(filename.substr(dot + 1));
}

} // namespace

const char* media_kind_name(MediaKind kind) {
    switch(kind) {
        case MediaKind::Docs: return "docs";
        case MediaKind::Images: return "images";
        case MediaKind::Audio: return "audio";
        case MediaKind::Video: return "video";
    }
    return "images";
}

std::optional<MediaKind> parse_media_kind(const std::string& name) {
    const auto lowered = to_lower_ascii(trim_ascii(name));
    for(auto kind : all_media_kinds()) {
        if(lowered == media_kind_name(kind)) return kind;
    }
    return std::nullopt;
}

const std::vector<MediaKind>& all_media_kinds() {
    static const std::vector<MediaKind> kinds{MediaKind::Docs, MediaKind::Images,
                                              MediaKind::Audio, MediaKind::Video};
    return kinds;
}

const std::vector<std::string>& media_kind_extensions(MediaKind kind) {
    static const std::vector<std::string> images{"jpg", "jpeg", "png", "gif", "bmp", "tiff", "webp"};
    static const std::vector<std::string> docs{"md", "txt", "rst", "html", "pdf", "djvu", "doc", "docx"};
    static const std::vector<std::string> audio{"mp3", "wav", "flac", "aac", "ogg", "m4a", "wma", "opus"};
    static const std::vector<std::string> video{"mp4", "avi", "mkv", "mov", "wmv", "flv", "webm", "m4v",
                                                "3gp", "mpg", "mpeg"};
    switch(kind) {
        case MediaKind::Docs: return docs;
        case MediaKind::Images: return images;
        case MediaKind::Audio: return audio;
        case MediaKind::Video: return video;
    }
    return images;
}

bool media_kind_accepts(MediaKind kind, const std::string& filename) {
    const auto ext = extension_of(filename);
    if(ext.empty()) return false;
    const auto& allowed = media_kind_extensions(kind);
    return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

const char* friend_status_name(FriendStatus status) {
    switch(status) {
        case FriendStatus::Unknown: return "unknown";
        case FriendStatus::Online: return "online";
        case FriendStatus::Offline: return "offline";
    }
    return "unknown";
}

json to_json(const FolderInfo& info) {
    json j;
    j["path"] = info.path;
    j["files"] = info.files;
    j["lastScan"] = info.last_scan;
    return j;
}

json to_json(const NodeInfo& info) {
    json node;
    node["id"] = info.id;
    node["name"] = info.name;
    node["ip"] = info.ip;
    node["port"] = info.port;
    node["lastSeen"] = info.last_seen;
    json j;
    j["node"] = node;
    j["folderInfo"] = info.folder ? to_json(*info.folder) : json(nullptr);
    return j;
}

json to_json(const GalleryDescriptor& gallery) {
    json j;
    j["name"] = gallery.name;
    j["mediaKind"] = media_kind_name(gallery.kind);
    j["fileCount"] = gallery.file_count();
    j["files"] = gallery.files;
    j["source"] = gallery.source == GallerySource::Live ? "live" : "downloaded";
    j["isDownloaded"] = gallery.is_downloaded;
    return j;
}

json to_json(const DocSummary& doc) {
    json j;
    j["path"] = doc.path;
    j["title"] = doc.title;
    j["contentType"] = doc.content_type;
    j["size"] = doc.size;
    j["modified"] = doc.modified;
    return j;
}

json to_json(const DocContent& doc) {
    json j = to_json(doc.summary);
    j["content"] = doc.content;
    return j;
}

json to_json(const Friend& f) {
    json j;
    j["peerID"] = f.peer_id;
    j["peerName"] = f.peer_name;
    j["host"] = f.host;
    j["port"] = f.port;
    j["addedAt"] = format_iso8601(f.added_at);
    j["lastSeen"] = f.last_seen ? json(format_iso8601(*f.last_seen)) : json(nullptr);
    j["isOnline"] = f.is_online;
    j["status"] = friend_status_name(f.status);
    return j;
}

json to_json(const ItemError& e) {
    return json{{"item", e.item}, {"reason", e.reason}};
}

json to_json(const DownloadOutcome& outcome) {
    json errors = json::array();
    for(const auto& e : outcome.errors) errors.push_back(to_json(e));
    json listing = json::array();
    for(const auto& e : outcome.listing_errors) listing.push_back(to_json(e));
    json j;
    j["peer_id"] = outcome.peer_id;
    j["docs_downloaded"] = outcome.docs_downloaded;
    j["images_downloaded"] = outcome.images_downloaded;
    j["errors"] = errors;
    j["successful_files"] = outcome.successful_files;
    j["listing_errors"] = listing;
    j["files_total"] = outcome.files_total;
    j["cancelled"] = outcome.cancelled;
    return j;
}

json make_error_body(const std::string& kind, const std::string& message) {
    json j;
    j["error"] = kind;
    j["message"] = message;
    return j;
}

json make_status_body(const std::string& status, const std::string& message) {
    json j;
    j["status"] = status;
    j["message"] = message;
    return j;
}

json parse_json_body(const std::string& body, const char* context) {
    json j = json::parse(body, nullptr, false);
    if(j.is_discarded()) {
        throw_peer_error(ErrorKind::ProtocolError, std::string(context) + ": invalid JSON");
    }
    return j;
}

NodeInfo node_info_from_json(const json& j) {
    const auto& node = require(j, "node", "node info");
    NodeInfo info;
    info.id = require_string(node, "id", "node info");
    if(info.id.empty()) {
        throw_peer_error(ErrorKind::ProtocolError, "node info: empty id");
    }
    info.name = optional_string(node, "name");
    info.ip = optional_string(node, "ip");
    info.port = optional_port(node, "port");
    info.last_seen = optional_string(node, "lastSeen");
    if(j.contains("folderInfo") && j.at("folderInfo").is_object()) {
        const auto& fj = j.at("folderInfo");
        FolderInfo folder;
        folder.path = optional_string(fj, "path");
        folder.last_scan = optional_string(fj, "lastScan");
        if(fj.contains("files") && fj.at("files").is_array()) {
            for(const auto& f : fj.at("files")) {
                if(f.is_string()) folder.files.push_back(f.get<std::string>());
            }
        }
        info.folder = std::move(folder);
    }
    return info;
}

GalleryDescriptor gallery_from_json(const json& j, MediaKind kind) {
    GalleryDescriptor g;
    g.name = require_string(j, "name", "gallery");
    g.kind = kind;
    for(const auto& f : require_array(j, "files", "gallery")) {
        if(!f.is_string()) {
            throw_peer_error(ErrorKind::ProtocolError, "gallery '" + g.name + "': non-string file entry");
        }
        g.files.push_back(f.get<std::string>());
    }
    g.source = GallerySource::Live;
    return g;
}

std::vector<GalleryDescriptor> gallery_list_from_json(const json& j, MediaKind kind) {
    std::vector<GalleryDescriptor> out;
    for(const auto& g : require_array(j, "galleries", "gallery list")) {
        out.push_back(gallery_from_json(g, kind));
    }
    return out;
}

DocSummary doc_summary_from_json(const json& j) {
    DocSummary d;
    d.path = require_string(j, "path", "doc");
    d.title = optional_string(j, "title");
    d.content_type = optional_string(j, "contentType");
    if(d.content_type.empty()) d.content_type = "binary";
    if(j.contains("size") && j.at("size").is_number_unsigned()) d.size = j.at("size").get<std::uint64_t>();
    d.modified = optional_string(j, "modified");
    return d;
}

DocContent doc_content_from_json(const json& j) {
    DocContent d;
    d.summary = doc_summary_from_json(j);
    d.content = optional_string(j, "content");
    return d;
}

std::vector<DocSummary> doc_list_from_json(const json& j) {
    std::vector<DocSummary> out;
    for(const auto& d : require_array(j, "docs", "doc list")) {
        out.push_back(doc_summary_from_json(d));
    }
    return out;
}

Friend friend_from_json(const json& j) {
    Friend f;
    f.peer_id = require_string(j, "peerID", "friend");
    f.peer_name = optional_string(j, "peerName");
    f.host = optional_string(j, "host");
    f.port = optional_port(j, "port");
    if(auto added = parse_iso8601(optional_string(j, "addedAt"))) f.added_at = *added;
    f.last_seen = parse_iso8601(optional_string(j, "lastSeen"));
    if(j.contains("isOnline") && j.at("isOnline").is_boolean()) f.is_online = j.at("isOnline").get<bool>();
    const auto status = optional_string(j, "status");
    if(status == "online") f.status = FriendStatus::Online;
    else if(status == "offline") f.status = FriendStatus::Offline;
    return f;
}

std::vector<Friend> friend_list_from_json(const json& j) {
    std::vector<Friend> out;
    for(const auto& f : require_array(j, "friends", "friend list")) {
        out.push_back(friend_from_json(f));
    }
    return out;
}
