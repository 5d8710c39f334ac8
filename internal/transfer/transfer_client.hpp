#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/storage/object_store.hpp"

namespace recsync::transfer {

struct TransferOptions {
  uint64_t multipart_threshold_bytes = 32ull * 1024 * 1024;
  uint64_t part_size_bytes           = 8ull * 1024 * 1024;
};

struct TransferMetadata {
  std::optional<std::string> checksum_sha256;
  std::string                recording_id;
  uint32_t                   chunk_index      = 0;
  double                     duration_seconds = 0.0;
};

struct TransferReceipt {
  std::string remote_key;
  std::string integrity_tag;
  bool        multipart  = false;
  uint32_t    part_count = 1;
  int64_t     size_bytes = 0;
};

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

/*
  Moves one local file to the object store.

    size <  multipart_threshold → PutObject
    size >= multipart_threshold → Create → UploadPart × n → Complete

  A multipart session that fails for any reason is aborted before the
  error propagates; an abort failure is logged and the original error
  is rethrown.

  Errors (util::UploadError):
    SourceFileMissing     file absent
    IntegrityMismatch     sent bytes hash != checksum_sha256, or the store
                          reports a different size
    NetworkFailure        transport errors, deadline exceeded, anything
                          unclassified thrown by the store
    AuthorizationExpired  / StoreRejected as reported by the store
*/
class TransferClient {
 public:
  explicit TransferClient(TransferOptions options);

  TransferReceipt Transfer(storage::ObjectStore& store, const std::string& file_path, const std::string& destination_key,
                           const TransferMetadata& metadata, Deadline deadline = std::nullopt) const;

  static storage::ObjectMetadata BuildObjectMetadata(const TransferMetadata& metadata);

  const TransferOptions& options() const {
    return options_;
  }

 private:
  TransferReceipt PutSingle(storage::ObjectStore& store, const std::string& file_path, int64_t size, const std::string& key,
                            const TransferMetadata& metadata, const Deadline& deadline) const;

  TransferReceipt PutMultipart(storage::ObjectStore& store, const std::string& file_path, int64_t size, const std::string& key,
                               const TransferMetadata& metadata, const Deadline& deadline) const;

  TransferOptions options_;
};

} // namespace recsync::transfer
