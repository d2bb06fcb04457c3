#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

// Local content tree rooted at the node workspace:
//   <root>/<kind>/<gallery>/<file>     shared content
//   <root>/docs/<file>                 loose documents
//   <root>/downloaded/<peer>/<kind>/<gallery>/<file>   cache of friends' content
//   <root>/.config/                    settings and registry (never shared)
//
// Every name that comes from outside (URL segment, peer listing) passes
// validate_component() before it touches the filesystem.
class ContentStore {
public:
  static constexpr const char* kDownloadedDir = "downloaded";
  static constexpr const char* kConfigDir = ".config";

  explicit ContentStore(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path config_dir() const { return root_ / kConfigDir; }

  // Creates the per-kind directories and the cache root.
  void ensure_layout() const;

  FolderInfo scan() const;

  std::vector<GalleryDescriptor> galleries(MediaKind kind) const;
  GalleryDescriptor gallery(MediaKind kind, const std::string& name) const;
  std::string read_file(MediaKind kind, const std::string& gallery, const std::string& file) const;

  std::vector<DocSummary> docs() const;
  DocContent doc(const std::string& path) const;
  // Raw bytes of a doc addressed as "file" or "gallery/file".
  std::string read_doc_bytes(const std::string& path) const;

  std::vector<GalleryDescriptor> cached_galleries(const std::string& peer_id, MediaKind kind) const;
  GalleryDescriptor cached_gallery(const std::string& peer_id, MediaKind kind, const std::string& name) const;
  std::filesystem::path cached_file_path(const std::string& peer_id, MediaKind kind,
                                         const std::string& gallery, const std::string& file) const;
  std::string read_cached_file(const std::string& peer_id, MediaKind kind,
                               const std::string& gallery, const std::string& file) const;
  // Write-then-rename; returns the final path. Internal on I/O failure.
  std::filesystem::path write_cached_file(const std::string& peer_id, MediaKind kind,
                                          const std::string& gallery, const std::string& file,
                                          const std::string& bytes) const;

  // FormatError unless `value` is a single safe path component.
  static void validate_component(const std::string& value, const char* what);

private:
  std::filesystem::path kind_dir(MediaKind kind) const;
  std::filesystem::path cache_kind_dir(const std::string& peer_id, MediaKind kind) const;
  std::vector<std::string> list_files(const std::filesystem::path& dir, MediaKind kind) const;
  std::vector<GalleryDescriptor> list_galleries(const std::filesystem::path& dir, MediaKind kind,
                                                GallerySource source) const;
  std::filesystem::path resolve_doc(const std::string& path) const;
  DocSummary summarize_doc(const std::filesystem::path& full, const std::string& rel) const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
};

std::string read_file_bytes(const std::filesystem::path& path);
