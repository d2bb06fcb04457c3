#include "content_sync_engine.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

#include "peer_error.hpp"

namespace {

using SteadyClock = std::chrono::steady_clock;

bool deadline_passed(const SteadyDeadline& deadline) {
  return deadline && SteadyClock::now() >= *deadline;
}

} // namespace

ContentSyncEngine::ContentSyncEngine(SyncConfig config,
                                     SyncFriendLookup is_friend,
                                     SyncListingFetcher fetch_listing,
                                     SyncFileFetcher fetch_file,
                                     SyncFileWriter write_file,
                                     std::shared_ptr<Logger> logger)
  : config_(config),
    is_friend_(std::move(is_friend)),
    fetch_listing_(std::move(fetch_listing)),
    fetch_file_(std::move(fetch_file)),
    write_file_(std::move(write_file)),
    logger_(std::move(logger)) {
  config_.workers = std::clamp<std::size_t>(config_.workers, 1, kMaxWorkers);
  config_.default_deadline = std::clamp<std::chrono::seconds>(config_.default_deadline, std::chrono::seconds(0), kMaxDeadline);
}

DownloadOutcome ContentSyncEngine::download_all(const std::string& peer_id,
                                                std::optional<std::chrono::milliseconds> deadline) {
  if(!is_friend_ || !is_friend_(peer_id)) {
    throw_peer_error(ErrorKind::NotFound, "'" + peer_id + "' is not a friend");
  }

  SteadyDeadline until;
  if(deadline) {
    until = SteadyClock::now() + std::clamp<std::chrono::milliseconds>(*deadline, std::chrono::milliseconds(0), kMaxDeadline);
  } else if(config_.default_deadline.count() > 0) {
    until = SteadyClock::now() + config_.default_deadline;
  }

  DownloadOutcome outcome;
  outcome.peer_id = peer_id;

  // Both listings in flight at once.
  const MediaKind kinds[] = {MediaKind::Docs, MediaKind::Images};
  std::vector<std::future<std::vector<GalleryDescriptor>>> listings;
  for(auto kind : kinds) {
    listings.push_back(std::async(std::launch::async, [this, &peer_id, kind, until](){
      return fetch_listing_(peer_id, kind, until);
    }));
  }

  std::deque<Job> job_queue;
  for(std::size_t i = 0; i < listings.size(); ++i) {
    const auto kind = kinds[i];
    try {
      for(const auto& gallery : listings[i].get()) {
        for(const auto& file : gallery.files) {
          job_queue.push_back(Job{kind, gallery.name, file});
        }
      }
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Listing {} of {} failed: {}", media_kind_name(kind), peer_id, e.what());
      outcome.listing_errors.push_back(ItemError{media_kind_name(kind), e.what()});
    }
  }
  outcome.files_total = job_queue.size();
  log_info(logger_.get(), "Downloading {} file(s) from {} with {} worker(s)",
           outcome.files_total, peer_id, std::min(config_.workers, outcome.files_total));

  std::mutex job_mutex;
  std::mutex result_mutex;

  auto take_job = [&]() -> std::optional<Job> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(job_queue.empty()) return std::nullopt;
    Job job = std::move(job_queue.front());
    job_queue.pop_front();
    return job;
  };

  auto record_failure = [&](const Job& job, const std::string& reason, bool cancelled){
    std::lock_guard<std::mutex> lock(result_mutex);
    outcome.errors.push_back(ItemError{job.gallery + "/" + job.filename, reason});
    if(cancelled) outcome.cancelled = true;
  };

  auto record_success = [&](const Job& job){
    std::lock_guard<std::mutex> lock(result_mutex);
    outcome.successful_files.push_back(job.gallery + "/" + job.filename);
    if(job.kind == MediaKind::Docs) {
      ++outcome.docs_downloaded;
    } else {
      ++outcome.images_downloaded;
    }
  };

  auto worker_fn = [&](){
    while(auto job_opt = take_job()) {
      const Job& job = *job_opt;
      if(deadline_passed(until)) {
        record_failure(job, kDeadlineExceededReason, true);
        continue;
      }
      try {
        std::string bytes = fetch_file_(peer_id, job.kind, job.gallery, job.filename, until);
        if(deadline_passed(until)) {
          // Too late; the result is dropped.
          record_failure(job, kDeadlineExceededReason, true);
          continue;
        }
        write_file_(peer_id, job.kind, job.gallery, job.filename, bytes);
        record_success(job);
      } catch(const PeerError& e) {
        if(e.kind() == ErrorKind::Timeout && deadline_passed(until)) {
          record_failure(job, kDeadlineExceededReason, true);
        } else {
          log_debug(logger_.get(), "{}/{} from {} failed: {}", job.gallery, job.filename, peer_id, e.what());
          record_failure(job, fmt::format("{}: {}", e.kind_name(), e.what()), false);
        }
      } catch(const std::exception& e) {
        record_failure(job, e.what(), false);
      }
    }
  };

  const std::size_t worker_total = std::min(config_.workers, outcome.files_total);
  std::vector<std::thread> workers;
  workers.reserve(worker_total);
  for(std::size_t i = 0; i < worker_total; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }

  log_info(logger_.get(), "Download from {} finished: {} doc(s), {} image(s), {} error(s){}",
           peer_id, outcome.docs_downloaded, outcome.images_downloaded, outcome.errors.size(),
           outcome.cancelled ? " (deadline exceeded)" : "");
  return outcome;
}
