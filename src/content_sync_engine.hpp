#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_client.hpp"
#include "protocol.hpp"

struct SyncConfig {
  std::size_t workers = 4;                    // clamped to 1..16
  std::chrono::seconds default_deadline{0};   // 0 = none
};

using SyncFriendLookup = std::function<bool(const std::string& peer_id)>;

using SyncListingFetcher = std::function<std::vector<GalleryDescriptor>(
  const std::string& peer_id,
  MediaKind kind,
  SteadyDeadline deadline)>;

using SyncFileFetcher = std::function<std::string(
  const std::string& peer_id,
  MediaKind kind,
  const std::string& gallery,
  const std::string& filename,
  SteadyDeadline deadline)>;

using SyncFileWriter = std::function<void(
  const std::string& peer_id,
  MediaKind kind,
  const std::string& gallery,
  const std::string& filename,
  const std::string& bytes)>;

// Best-effort bulk copy of a friend's docs and images into the local cache.
// Every file found in the listings ends up either in successful_files or in
// errors, exactly once.
class ContentSyncEngine {
public:
  static constexpr std::size_t kMaxWorkers = 16;
  // Longer deadlines are clamped to this.
  static constexpr std::chrono::hours kMaxDeadline{24};

  ContentSyncEngine(SyncConfig config,
                    SyncFriendLookup is_friend,
                    SyncListingFetcher fetch_listing,
                    SyncFileFetcher fetch_file,
                    SyncFileWriter write_file,
                    std::shared_ptr<Logger> logger = nullptr);

  // Throws PeerError(NotFound) when peer_id is not a friend; everything
  // after that is reported inside the outcome.
  DownloadOutcome download_all(const std::string& peer_id,
                               std::optional<std::chrono::milliseconds> deadline = std::nullopt);

  std::size_t worker_count() const { return config_.workers; }

private:
  struct Job {
    MediaKind kind;
    std::string gallery;
    std::string filename;
  };

  SyncConfig config_;
  SyncFriendLookup is_friend_;
  SyncListingFetcher fetch_listing_;
  SyncFileFetcher fetch_file_;
  SyncFileWriter write_file_;
  std::shared_ptr<Logger> logger_;
};
