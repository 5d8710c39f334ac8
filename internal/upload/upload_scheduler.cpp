#include "upload_scheduler.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "recsync/uploader/v1.hpp"

namespace recsync::upload {

using observability::IntField;
using observability::StringField;

namespace {

transfer::TransferOptions ToTransferOptions(const config::TransferSettings& settings) {
  transfer::TransferOptions options;
  options.multipart_threshold_bytes = settings.multipart_threshold_bytes;
  options.part_size_bytes           = settings.part_size_bytes;
  return options;
}

} // namespace

UploadScheduler::UploadScheduler(std::shared_ptr<manifest::ManifestStore> store, std::shared_ptr<storage::ObjectStoreProvider> stores,
                                 catalog::CatalogNotifierPtr notifier, config::UploadSettings upload, config::TransferSettings transfer)
    : store_(std::move(store)),
      stores_(std::move(stores)),
      notifier_(std::move(notifier)),
      upload_(upload),
      transfer_settings_(std::move(transfer)),
      transfer_(ToTransferOptions(transfer_settings_)),
      backoff_(upload_.base_backoff, upload_.max_backoff, upload_.jitter_ratio) {
  if (upload_.max_concurrent_uploads == 0) {
    throw std::invalid_argument("max_concurrent_uploads must be at least 1");
  }
}

UploadScheduler::~UploadScheduler() {
  Stop();
}

void UploadScheduler::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (running_) return;

  store_->ReconcileInFlight();
  AbortStaleUploads();

  queue_ = std::make_shared<UploadQueue>();
  for (uint32_t i = 0; i < upload_.max_concurrent_uploads; ++i) {
    auto worker = std::make_unique<UploadWorker>(queue_, [this](const UploadTask& task) { Execute(task); });
    worker->Start();
    workers_.push_back(std::move(worker));
  }

  running_ = true;
  scanner_ = std::thread(&UploadScheduler::ScanLoop, this);

  RECSYNC_LOG_INFO("upload scheduler started", {IntField("workers", upload_.max_concurrent_uploads),
                                                IntField("poll_interval_ms", upload_.poll_interval.count())});
}

/*
  No transfer runs before the workers start, so every multipart session
  still staged in the store belongs to an earlier run.
*/
void UploadScheduler::AbortStaleUploads() {
  try {
    if (const auto aborted = stores_->Acquire()->AbortStaleUploads(); aborted > 0) {
      RECSYNC_LOG_INFO("aborted stale multipart uploads", {IntField("count", static_cast<int64_t>(aborted))});
    }
  } catch (const std::exception& e) {
    RECSYNC_LOG_WARN("stale multipart sweep failed", {StringField("error", e.what())});
  }
}

void UploadScheduler::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (!running_) return;

  {
    std::lock_guard scan_lock(scan_mutex_);
    running_ = false;
  }
  scan_cv_.notify_all();
  if (scanner_.joinable()) scanner_.join();

  for (const auto& task : queue_->Drain()) {
    ReleaseToPending(task);
    ReleaseClaim(task);
    RemoveInFlight();
  }

  // in-flight transfers finish before the workers exit
  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();
  queue_.reset();

  RECSYNC_LOG_INFO("upload scheduler stopped", {IntField("completed", static_cast<int64_t>(completed_.load())),
                                                IntField("failed", static_cast<int64_t>(failed_.load()))});
}

void UploadScheduler::Pause() {
  paused_ = true;
  RECSYNC_LOG_INFO("uploads paused");
}

void UploadScheduler::Resume() {
  paused_ = false;
  RECSYNC_LOG_INFO("uploads resumed");
  Wake();
}

void UploadScheduler::Wake() {
  {
    std::lock_guard lock(scan_mutex_);
    wake_requested_ = true;
  }
  scan_cv_.notify_all();
}

SchedulerStats UploadScheduler::Stats() const {
  SchedulerStats stats;
  stats.running        = running_;
  stats.paused         = paused_;
  stats.in_flight      = in_flight_;
  stats.peak_in_flight = peak_in_flight_;
  stats.attempts       = attempts_;
  stats.completed      = completed_;
  stats.failed         = failed_;
  stats.retried        = retried_;
  return stats;
}

void UploadScheduler::ScanLoop() {
  std::unique_lock lock(scan_mutex_);
  while (running_) {
    wake_requested_ = false;
    lock.unlock();

    if (!paused_) {
      try {
        ScanOnce();
      } catch (const std::exception& e) {
        RECSYNC_LOG_ERROR("manifest scan failed", {StringField("error", e.what())});
      }
    }

    lock.lock();
    scan_cv_.wait_for(lock, upload_.poll_interval, [&] { return !running_ || wake_requested_; });
  }
}

/*
  First eligible, first served: manifests in recording order, entries in
  manifest order.
*/
size_t UploadScheduler::ScanOnce() {
  const uint32_t limit = upload_.max_concurrent_uploads;
  if (in_flight_ >= limit) return 0;

  size_t     dispatched = 0;
  const auto now        = util::Now();

  for (const auto& manifest : store_->LoadAll()) {
    for (const auto& entry : manifest.chunks) {
      if (!running_ || paused_ || in_flight_ >= limit) return dispatched;
      if (entry.status == model::ChunkStatus::kUploading && !IsClaimed(manifest.recording_id, entry.index)) {
        ReleaseUnclaimed(manifest.recording_id, entry.index);
        continue;
      }
      if (!backoff_.IsEligible(manifest.recording_id, entry, now)) continue;

      if (Claim(manifest.recording_id, entry, now)) ++dispatched;
    }
  }
  return dispatched;
}

bool UploadScheduler::Claim(const std::string& recording_id, const model::ChunkEntry& entry, util::TimePoint now) {
  UploadTask task;
  task.recording_id = recording_id;
  task.index        = entry.index;
  task.remote_key   = storage::common::RemoteChunkKey(transfer_settings_.key_prefix, recording_id, entry.index, transfer_settings_.file_extension);

  model::ChunkEntry claimed;
  try {
    claimed = store_->Update(recording_id, entry.index, [&](model::ChunkEntry& current) {
      if (!backoff_.IsEligible(recording_id, current, now)) {
        throw util::InvalidState("chunk no longer eligible");
      }
      current.status     = model::ChunkStatus::kUploading;
      current.remote_key = task.remote_key;
    });
  } catch (const util::InvalidState&) {
    // claimed or cancelled since the scan read it
    return false;
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("claim failed",
                      {StringField("recording_id", recording_id), IntField("chunk_index", entry.index), StringField("error", e.what())});
    return false;
  }

  task.file_path        = claimed.file_path;
  task.checksum         = claimed.checksum;
  task.duration_seconds = claimed.duration_seconds;
  task.claim_id         = RegisterClaim(recording_id, entry.index);

  AddInFlight();
  queue_->Enqueue(std::move(task));
  return true;
}

void UploadScheduler::Execute(const UploadTask& task) {
  ++attempts_;

  observability::SpanScope span("recsync.upload.chunk");
  span.SetAttribute("recsync.recording_id", task.recording_id);
  span.SetAttribute("recsync.chunk_index", static_cast<int64_t>(task.index));

  try {
    auto store = stores_->Acquire();

    transfer::TransferMetadata metadata;
    if (!task.checksum.empty()) metadata.checksum_sha256 = task.checksum;
    metadata.recording_id     = task.recording_id;
    metadata.chunk_index      = task.index;
    metadata.duration_seconds = task.duration_seconds;

    const auto deadline = std::chrono::steady_clock::now() + upload_.transfer_timeout;
    auto       receipt  = transfer_.Transfer(*store, task.file_path, task.remote_key, metadata, deadline);
    OnSuccess(task, receipt);
  } catch (const util::UploadError& e) {
    span.RecordException(e.what());
    OnFailure(task, e.kind(), e.what());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    OnFailure(task, util::UploadErrorKind::kNetworkFailure, e.what());
  }

  ReleaseClaim(task);
  RemoveInFlight();
}

void UploadScheduler::OnSuccess(const UploadTask& task, const transfer::TransferReceipt& receipt) {
  model::ChunkEntry entry;
  try {
    entry = store_->Update(task.recording_id, task.index, [&](model::ChunkEntry& current) {
      CheckClaim(task, current);
      const auto now          = util::Now();
      current.status          = model::ChunkStatus::kCompleted;
      current.remote_key      = receipt.remote_key;
      current.integrity_tag   = receipt.integrity_tag;
      current.last_attempt_at = now;
      current.completed_at    = now;
      current.last_error.reset();
    });
  } catch (const util::InvalidState& e) {
    RECSYNC_LOG_WARN("stale upload outcome dropped", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                                      StringField("outcome", "completed"), StringField("error", e.what())});
    return;
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("recording upload outcome failed", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                                          StringField("outcome", "completed"), StringField("error", e.what())});
    return;
  }

  ++completed_;
  observability::Metrics::Instance().RecordChunkOutcome("completed");
  RECSYNC_LOG_INFO("chunk uploaded", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                      StringField("remote_key", receipt.remote_key), IntField("size_bytes", receipt.size_bytes),
                                      IntField("parts", receipt.part_count)});
  Notify(task.recording_id, entry);

  if (upload_.delete_local_after_upload) {
    std::error_code ec;
    std::filesystem::remove(task.file_path, ec);
    if (ec) {
      RECSYNC_LOG_WARN("local chunk removal failed", {StringField("path", task.file_path), StringField("error", ec.message())});
    }
  }
}

/*
  retryable, retry_count < max_retries  → pending, retry_count + 1
  otherwise                             → failed

  An integrity mismatch earns one extra attempt per chunk at most.
*/
void UploadScheduler::OnFailure(const UploadTask& task, util::UploadErrorKind kind, const std::string& message) {
  if (kind == util::UploadErrorKind::kAuthorizationExpired) {
    stores_->InvalidateCredentials();
  }
  if (kind == util::UploadErrorKind::kIntegrityMismatch) {
    RECSYNC_LOG_ERROR("integrity mismatch", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                             StringField("error", message)});
  }

  bool              retry = false;
  model::ChunkEntry entry;
  try {
    entry = store_->Update(task.recording_id, task.index, [&](model::ChunkEntry& current) {
      CheckClaim(task, current);
      current.last_attempt_at = util::Now();
      current.last_error      = message;

      bool retryable = util::IsRetryable(kind);
      if (kind == util::UploadErrorKind::kIntegrityMismatch) {
        ++current.integrity_failures;
        retryable = current.integrity_failures <= 1;
      }

      retry = retryable && current.retry_count < upload_.max_retries;
      if (retry) {
        current.status = model::ChunkStatus::kPending;
        ++current.retry_count;
      } else {
        current.status = model::ChunkStatus::kFailed;
      }
    });
  } catch (const util::InvalidState& e) {
    RECSYNC_LOG_WARN("stale upload outcome dropped", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                                      StringField("outcome", "failure"), StringField("error", e.what())});
    return;
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("recording upload outcome failed", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                                          StringField("outcome", "failure"), StringField("error", e.what())});
    return;
  }

  if (retry) {
    ++retried_;
    RECSYNC_LOG_WARN("chunk upload will be retried",
                     {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index), StringField("kind", util::ToString(kind)),
                      IntField("retry_count", entry.retry_count),
                      IntField("backoff_ms", backoff_.Delay(task.recording_id, task.index, entry.retry_count).count()),
                      StringField("error", message)});
    return;
  }

  ++failed_;
  observability::Metrics::Instance().RecordChunkOutcome("failed");
  RECSYNC_LOG_ERROR("chunk upload failed", {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index),
                                            StringField("kind", util::ToString(kind)), IntField("retry_count", entry.retry_count),
                                            StringField("error", message)});
  Notify(task.recording_id, entry);
}

void UploadScheduler::ReleaseToPending(const UploadTask& task) {
  try {
    store_->Update(task.recording_id, task.index, [&](model::ChunkEntry& current) {
      if (current.status == model::ChunkStatus::kUploading && OwnsClaim(task)) {
        current.status = model::ChunkStatus::kPending;
      }
    });
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("release of queued chunk failed",
                      {StringField("recording_id", task.recording_id), IntField("chunk_index", task.index), StringField("error", e.what())});
  }
}

void UploadScheduler::ReleaseUnclaimed(const std::string& recording_id, uint32_t index) {
  bool released = false;
  try {
    store_->Update(recording_id, index, [&](model::ChunkEntry& current) {
      if (current.status == model::ChunkStatus::kUploading && !IsClaimed(recording_id, index)) {
        current.status = model::ChunkStatus::kPending;
        released       = true;
      }
    });
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("release of unclaimed chunk failed",
                      {StringField("recording_id", recording_id), IntField("chunk_index", index), StringField("error", e.what())});
    return;
  }

  if (released) {
    RECSYNC_LOG_WARN("unclaimed uploading chunk put back to pending", {StringField("recording_id", recording_id), IntField("chunk_index", index)});
  }
}

uint64_t UploadScheduler::RegisterClaim(const std::string& recording_id, uint32_t index) {
  std::lock_guard lock(claims_mutex_);
  const auto      claim_id = ++next_claim_id_;
  claims_[{recording_id, index}] = claim_id;
  return claim_id;
}

bool UploadScheduler::OwnsClaim(const UploadTask& task) {
  std::lock_guard lock(claims_mutex_);
  auto            it = claims_.find({task.recording_id, task.index});
  return it != claims_.end() && it->second == task.claim_id;
}

bool UploadScheduler::IsClaimed(const std::string& recording_id, uint32_t index) {
  std::lock_guard lock(claims_mutex_);
  return claims_.count({recording_id, index}) > 0;
}

void UploadScheduler::ReleaseClaim(const UploadTask& task) {
  std::lock_guard lock(claims_mutex_);
  auto            it = claims_.find({task.recording_id, task.index});
  if (it != claims_.end() && it->second == task.claim_id) {
    claims_.erase(it);
  }
}

void UploadScheduler::CheckClaim(const UploadTask& task, const model::ChunkEntry& current) {
  if (current.status != model::ChunkStatus::kUploading) {
    throw util::InvalidState("chunk is " + std::string(model::ToString(current.status)) + ", not uploading");
  }
  if (current.checksum != task.checksum) {
    throw util::InvalidState("chunk was replaced during upload");
  }
  if (!OwnsClaim(task)) {
    throw util::InvalidState("claim " + std::to_string(task.claim_id) + " was superseded");
  }
}

void UploadScheduler::Notify(const std::string& recording_id, const model::ChunkEntry& entry) {
  if (!notifier_) return;

  recsync::uploader::v1::ChunkEvent event;
  event.set_recording_id(recording_id);
  event.set_chunk_index(entry.index);
  event.set_status(std::string(model::ToString(entry.status)));
  if (entry.remote_key) event.set_remote_key(*entry.remote_key);
  if (entry.integrity_tag) event.set_integrity_tag(*entry.integrity_tag);
  if (entry.status == model::ChunkStatus::kFailed && entry.last_error) event.set_error(*entry.last_error);
  *event.mutable_emitted_at() = util::ToProto(util::Now());

  try {
    notifier_->Notify(event);
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("catalog notification failed",
                      {StringField("recording_id", recording_id), IntField("chunk_index", entry.index), StringField("error", e.what())});
  }
}

void UploadScheduler::AddInFlight() {
  const auto now_in_flight = ++in_flight_;
  auto       peak          = peak_in_flight_.load();
  while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
  }
  observability::Metrics::Instance().SetInFlight(now_in_flight);
}

void UploadScheduler::RemoveInFlight() {
  observability::Metrics::Instance().SetInFlight(--in_flight_);
}

} // namespace recsync::upload
