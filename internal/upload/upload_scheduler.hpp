#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "backoff_policy.hpp"
#include "internal/catalog/catalog_notifier.hpp"
#include "internal/config/settings.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/storage/object_store_provider.hpp"
#include "internal/transfer/transfer_client.hpp"
#include "internal/util/errors.hpp"
#include "upload_queue.hpp"
#include "upload_worker.hpp"

namespace recsync::upload {

struct SchedulerStats {
  bool     running        = false;
  bool     paused         = false;
  uint32_t in_flight      = 0;
  uint32_t peak_in_flight = 0;
  uint64_t attempts       = 0;
  uint64_t completed      = 0;
  uint64_t failed         = 0;
  uint64_t retried        = 0;
};

/*
  Moves pending manifest entries to the object store.

      scanner ──claim (pending → uploading)──▶ queue ──▶ N workers
         ▲                                                  │
         └──────── manifest outcome (completed / pending / failed)

  The scanner runs every poll_interval or on Wake(). It dispatches at
  most N - in_flight eligible entries; an entry counts as in flight from
  its claim until its outcome is persisted, so at most N entries are
  `uploading` at once.

  Each claim carries an id. A worker writes its outcome only if the entry
  is still `uploading` with the checksum it claimed and the claim is still
  the current one; anything else is a stale outcome and is dropped. An
  `uploading` entry that no claim owns, such as one whose outcome failed
  to persist, is put back to `pending` by the next scan.

  Stop() ends scanning, puts queued entries back to `pending` without
  touching retry_count, lets running transfers finish and joins all
  threads. Start() reconciles leftover `uploading` entries and aborts
  staged multipart uploads from earlier runs first, as on crash recovery.
*/
class UploadScheduler {
 public:
  UploadScheduler(std::shared_ptr<manifest::ManifestStore> store, std::shared_ptr<storage::ObjectStoreProvider> stores,
                  catalog::CatalogNotifierPtr notifier, config::UploadSettings upload, config::TransferSettings transfer);
  ~UploadScheduler();

  UploadScheduler(const UploadScheduler&)            = delete;
  UploadScheduler& operator=(const UploadScheduler&) = delete;

  void Start();
  void Stop();

  // Paused: no new claims; in-flight uploads continue.
  void Pause();
  void Resume();

  // Triggers a scan now instead of at the next poll tick.
  void Wake();

  SchedulerStats Stats() const;

  const BackoffPolicy& backoff() const {
    return backoff_;
  }

 private:
  void   AbortStaleUploads();
  void   ScanLoop();
  size_t ScanOnce();
  bool   Claim(const std::string& recording_id, const model::ChunkEntry& entry, util::TimePoint now);

  void Execute(const UploadTask& task);
  void OnSuccess(const UploadTask& task, const transfer::TransferReceipt& receipt);
  void OnFailure(const UploadTask& task, util::UploadErrorKind kind, const std::string& message);
  void ReleaseToPending(const UploadTask& task);
  void ReleaseUnclaimed(const std::string& recording_id, uint32_t index);
  void Notify(const std::string& recording_id, const model::ChunkEntry& entry);

  using ClaimKey = std::pair<std::string, uint32_t>;

  uint64_t RegisterClaim(const std::string& recording_id, uint32_t index);
  bool     OwnsClaim(const UploadTask& task);
  bool     IsClaimed(const std::string& recording_id, uint32_t index);
  void     ReleaseClaim(const UploadTask& task);

  // Throws util::InvalidState when `current` no longer belongs to `task`.
  void CheckClaim(const UploadTask& task, const model::ChunkEntry& current);

  void AddInFlight();
  void RemoveInFlight();

  std::shared_ptr<manifest::ManifestStore>      store_;
  std::shared_ptr<storage::ObjectStoreProvider> stores_;
  catalog::CatalogNotifierPtr                   notifier_;
  config::UploadSettings                        upload_;
  config::TransferSettings                      transfer_settings_;
  transfer::TransferClient                      transfer_;
  BackoffPolicy                                 backoff_;

  std::mutex                                 lifecycle_mutex_;
  std::shared_ptr<UploadQueue>               queue_;
  std::vector<std::unique_ptr<UploadWorker>> workers_;
  std::thread                                scanner_;

  std::mutex                   claims_mutex_;
  std::map<ClaimKey, uint64_t> claims_;
  uint64_t                     next_claim_id_ = 0;

  std::mutex              scan_mutex_;
  std::condition_variable scan_cv_;
  bool                    wake_requested_ = false;

  std::atomic<bool>     running_{false};
  std::atomic<bool>     paused_{false};
  std::atomic<uint32_t> in_flight_{0};
  std::atomic<uint32_t> peak_in_flight_{0};
  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> retried_{0};
};

} // namespace recsync::upload
