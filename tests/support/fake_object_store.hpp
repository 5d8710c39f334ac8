#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace recsync::testing {

/*
  In-memory ObjectStore for tests.

  Failures are scripted per operation name ("PutObject",
  "CreateMultipartUpload", "UploadPart", "UploadPart#<n>",
  "CompleteMultipartUpload", "AbortMultipartUpload"); each scripted
  failure is consumed by one call. Every call sleeps `latency` while
  counted as active, so overlapping transfers show up in PeakActive().
*/
class FakeObjectStore final : public storage::ObjectStore {
 public:
  struct StoredObject {
    std::string             data;
    storage::ObjectMetadata metadata;
  };

  // kind unset: throws a plain std::runtime_error
  void FailNext(const std::string& operation, int times, std::optional<util::UploadErrorKind> kind) {
    std::lock_guard lock(mutex_);
    for (int i = 0; i < times; ++i) failures_[operation].push_back(kind);
  }

  void SetLatency(std::chrono::milliseconds latency) {
    latency_ = latency;
  }

  // Reported sizes are off by one, as a store that lost bytes would do.
  void MisreportSizes(bool enabled) {
    misreport_sizes_ = enabled;
  }

  storage::ObjectReceipt PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data,
                                   const storage::ObjectMetadata& metadata) override {
    ActiveScope active(*this);
    Call("PutObject");

    std::lock_guard lock(mutex_);
    ++put_calls_;
    objects_[key] = StoredObject{data->ToString(), metadata};
    return Receipt(objects_[key].data);
  }

  std::string CreateMultipartUpload(const std::string& key, const storage::ObjectMetadata& metadata) override {
    ActiveScope active(*this);
    Call("CreateMultipartUpload");

    std::lock_guard lock(mutex_);
    ++create_calls_;
    const auto upload_id = "upload-" + std::to_string(next_upload_id_++);
    sessions_[upload_id] = Session{key, metadata, {}};
    return upload_id;
  }

  storage::PartReceipt UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                  const std::shared_ptr<arrow::Buffer>& data) override {
    ActiveScope active(*this);
    Call("UploadPart");
    Call("UploadPart#" + std::to_string(part_number));

    std::lock_guard lock(mutex_);
    ++part_calls_;
    auto& session = SessionLocked(key, upload_id);
    session.parts[part_number] = data->ToString();

    storage::PartReceipt receipt;
    receipt.part_number = part_number;
    receipt.etag        = util::Sha256Hex(session.parts[part_number]);
    receipt.size_bytes  = data->size();
    return receipt;
  }

  storage::ObjectReceipt CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                                 const std::vector<storage::PartReceipt>& parts) override {
    ActiveScope active(*this);
    Call("CompleteMultipartUpload");

    std::lock_guard lock(mutex_);
    ++complete_calls_;
    auto&       session = SessionLocked(key, upload_id);
    std::string assembled;
    for (const auto& part : parts) {
      auto it = session.parts.find(part.part_number);
      if (it == session.parts.end()) throw util::StoreRejected("InvalidPart: missing part " + std::to_string(part.part_number));
      assembled += it->second;
    }
    objects_[key] = StoredObject{assembled, session.metadata};
    sessions_.erase(upload_id);
    completed_part_counts_.push_back(parts.size());

    auto receipt = Receipt(assembled);
    receipt.etag += "-" + std::to_string(parts.size());
    return receipt;
  }

  void AbortMultipartUpload(const std::string& key, const std::string& upload_id) override {
    Call("AbortMultipartUpload");

    std::lock_guard lock(mutex_);
    ++abort_calls_;
    SessionLocked(key, upload_id);
    sessions_.erase(upload_id);
  }

  bool HasObject(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.count(key) > 0;
  }

  StoredObject Object(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.at(key);
  }

  size_t ObjectCount() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
  }

  size_t OpenSessions() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
  }

  std::vector<size_t> CompletedPartCounts() const {
    std::lock_guard lock(mutex_);
    return completed_part_counts_;
  }

  int PutCalls() const { std::lock_guard lock(mutex_); return put_calls_; }
  int CreateCalls() const { std::lock_guard lock(mutex_); return create_calls_; }
  int PartCalls() const { std::lock_guard lock(mutex_); return part_calls_; }
  int CompleteCalls() const { std::lock_guard lock(mutex_); return complete_calls_; }
  int AbortCalls() const { std::lock_guard lock(mutex_); return abort_calls_; }

  // Transfers started, single shot or multipart.
  int TransferCalls() const { std::lock_guard lock(mutex_); return put_calls_ + create_calls_; }

  int PeakActive() const { return peak_active_; }

 private:
  struct Session {
    std::string                       key;
    storage::ObjectMetadata           metadata;
    std::map<uint32_t, std::string>   parts;
  };

  class ActiveScope {
   public:
    explicit ActiveScope(FakeObjectStore& store) : store_(store) {
      const int now = ++store_.active_;
      int       peak = store_.peak_active_.load();
      while (now > peak && !store_.peak_active_.compare_exchange_weak(peak, now)) {
      }
      if (store_.latency_.count() > 0) std::this_thread::sleep_for(store_.latency_);
    }
    ~ActiveScope() { --store_.active_; }

   private:
    FakeObjectStore& store_;
  };

  void Call(const std::string& operation) {
    std::optional<util::UploadErrorKind> kind;
    {
      std::lock_guard lock(mutex_);
      auto it = failures_.find(operation);
      if (it == failures_.end() || it->second.empty()) return;
      kind = it->second.front();
      it->second.erase(it->second.begin());
    }

    const std::string message = "injected failure in " + operation;
    if (!kind) throw std::runtime_error(message);
    switch (*kind) {
      case util::UploadErrorKind::kAuthorizationExpired: throw util::AuthorizationExpired(message);
      case util::UploadErrorKind::kStoreRejected: throw util::StoreRejected(message);
      case util::UploadErrorKind::kIntegrityMismatch: throw util::IntegrityMismatch(message);
      case util::UploadErrorKind::kSourceFileMissing: throw util::SourceFileMissing(message);
      case util::UploadErrorKind::kInsufficientStorage: throw util::InsufficientStorage(message);
      case util::UploadErrorKind::kNetworkFailure: throw util::NetworkFailure(message);
    }
  }

  Session& SessionLocked(const std::string& key, const std::string& upload_id) {
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end() || it->second.key != key) throw util::StoreRejected("NoSuchUpload: " + upload_id);
    return it->second;
  }

  storage::ObjectReceipt Receipt(const std::string& data) const {
    storage::ObjectReceipt receipt;
    receipt.etag       = util::Sha256Hex(data);
    receipt.size_bytes = static_cast<int64_t>(data.size()) + (misreport_sizes_ ? 1 : 0);
    return receipt;
  }

  mutable std::mutex                                                  mutex_;
  std::map<std::string, std::vector<std::optional<util::UploadErrorKind>>> failures_;
  std::map<std::string, StoredObject>                                 objects_;
  std::map<std::string, Session>                                      sessions_;
  std::vector<size_t>                                                 completed_part_counts_;
  int                                                                 next_upload_id_ = 1;

  int put_calls_      = 0;
  int create_calls_   = 0;
  int part_calls_     = 0;
  int complete_calls_ = 0;
  int abort_calls_    = 0;

  std::chrono::milliseconds                   latency_{0};
  std::atomic<bool>                           misreport_sizes_{false};
  std::atomic<int>                            active_{0};
  std::atomic<int>                            peak_active_{0};
};

} // namespace recsync::testing
