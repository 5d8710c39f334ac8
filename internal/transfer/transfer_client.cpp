#include "transfer_client.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace recsync::transfer {

namespace {

using observability::IntField;
using observability::StringField;

/*
  Runs one store call; anything that is not already an UploadError is
  reported as a retryable network failure.
*/
template <typename Fn>
auto CallStore(std::string_view operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::UploadError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::NetworkFailure(std::string(operation) + ": " + e.what());
  }
}

void CheckDeadline(const Deadline& deadline, std::string_view stage) {
  if (deadline && std::chrono::steady_clock::now() >= *deadline) {
    throw util::NetworkFailure("transfer timed out " + std::string(stage));
  }
}

std::shared_ptr<arrow::io::ReadableFile> OpenSource(const std::string& file_path) {
  auto file = arrow::io::ReadableFile::Open(file_path);
  if (!file.ok()) {
    if (!std::filesystem::exists(file_path)) {
      throw util::SourceFileMissing("source file missing: " + file_path);
    }
    throw util::NetworkFailure("open " + file_path + ": " + file.status().ToString());
  }
  return *file;
}

std::shared_ptr<arrow::Buffer> ReadRange(arrow::io::ReadableFile& file, const std::string& file_path, int64_t offset, int64_t length) {
  auto buffer = file.ReadAt(offset, length);
  if (!buffer.ok()) {
    throw util::NetworkFailure("read " + file_path + ": " + buffer.status().ToString());
  }
  if ((*buffer)->size() != length) {
    throw util::IntegrityMismatch("short read from " + file_path + ": expected " + std::to_string(length) + " bytes at offset " +
                                  std::to_string(offset) + ", got " + std::to_string((*buffer)->size()));
  }
  return *buffer;
}

void VerifyChecksum(const TransferMetadata& metadata, const std::string& actual, const std::string& file_path) {
  if (metadata.checksum_sha256 && !metadata.checksum_sha256->empty() && *metadata.checksum_sha256 != actual) {
    throw util::IntegrityMismatch("checksum mismatch for " + file_path + ": expected " + *metadata.checksum_sha256 + ", sent " + actual);
  }
}

void VerifySize(int64_t expected, int64_t reported, const std::string& key) {
  if (expected != reported) {
    throw util::IntegrityMismatch("size mismatch for " + key + ": sent " + std::to_string(expected) + " bytes, store reports " +
                                  std::to_string(reported));
  }
}

std::string_view OutcomeOf(const std::exception& e) {
  if (const auto* upload_error = dynamic_cast<const util::UploadError*>(&e)) {
    return util::ToString(upload_error->kind());
  }
  return "unknown";
}

} // namespace

TransferClient::TransferClient(TransferOptions options) : options_(options) {
  if (options_.part_size_bytes == 0) {
    throw std::invalid_argument("part_size_bytes must be positive");
  }
}

storage::ObjectMetadata TransferClient::BuildObjectMetadata(const TransferMetadata& metadata) {
  char duration[32];
  std::snprintf(duration, sizeof(duration), "%.2f", metadata.duration_seconds);

  storage::ObjectMetadata object_metadata;
  if (metadata.checksum_sha256 && !metadata.checksum_sha256->empty()) {
    object_metadata["checksum-sha256"] = *metadata.checksum_sha256;
  }
  object_metadata["recording-id"]     = metadata.recording_id;
  object_metadata["chunk-index"]      = std::to_string(metadata.chunk_index);
  object_metadata["duration-seconds"] = duration;
  return object_metadata;
}

TransferReceipt TransferClient::Transfer(storage::ObjectStore& store, const std::string& file_path, const std::string& destination_key,
                                         const TransferMetadata& metadata, Deadline deadline) const {
  std::error_code ec;
  const auto      file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    if (!std::filesystem::exists(file_path)) {
      throw util::SourceFileMissing("source file missing: " + file_path);
    }
    throw util::NetworkFailure("stat " + file_path + ": " + ec.message());
  }

  const auto size      = static_cast<int64_t>(file_size);
  const bool multipart = file_size >= options_.multipart_threshold_bytes;
  const auto path      = multipart ? "multipart" : "single";

  observability::SpanScope span("recsync.transfer");
  span.SetAttribute("recsync.key", destination_key);
  span.SetAttribute("recsync.size_bytes", size);
  span.SetAttribute("recsync.path", path);

  const auto started = std::chrono::steady_clock::now();
  try {
    auto receipt = multipart ? PutMultipart(store, file_path, size, destination_key, metadata, deadline)
                             : PutSingle(store, file_path, size, destination_key, metadata, deadline);

    const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    observability::Metrics::Instance().RecordTransfer(path, "success");
    observability::Metrics::Instance().ObserveTransferDurationMs(path, elapsed_ms);
    return receipt;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordTransfer(path, OutcomeOf(e));
    throw;
  }
}

TransferReceipt TransferClient::PutSingle(storage::ObjectStore& store, const std::string& file_path, int64_t size, const std::string& key,
                                          const TransferMetadata& metadata, const Deadline& deadline) const {
  auto file = OpenSource(file_path);
  auto data = ReadRange(*file, file_path, 0, size);

  VerifyChecksum(metadata, util::Sha256Hex(std::string_view(reinterpret_cast<const char*>(data->data()), data->size())), file_path);
  CheckDeadline(deadline, "before upload");

  const auto object_metadata = BuildObjectMetadata(metadata);
  auto       object          = CallStore("put object", [&] { return store.PutObject(key, data, object_metadata); });
  VerifySize(size, object.size_bytes, key);

  TransferReceipt receipt;
  receipt.remote_key    = key;
  receipt.integrity_tag = object.etag;
  receipt.multipart     = false;
  receipt.part_count    = 1;
  receipt.size_bytes    = object.size_bytes;
  return receipt;
}

TransferReceipt TransferClient::PutMultipart(storage::ObjectStore& store, const std::string& file_path, int64_t size, const std::string& key,
                                             const TransferMetadata& metadata, const Deadline& deadline) const {
  auto file = OpenSource(file_path);
  CheckDeadline(deadline, "before multipart upload");

  const auto object_metadata = BuildObjectMetadata(metadata);
  const auto upload_id       = CallStore("create multipart upload", [&] { return store.CreateMultipartUpload(key, object_metadata); });

  bool completed = false;
  try {
    const auto                        part_size = static_cast<int64_t>(options_.part_size_bytes);
    std::vector<storage::PartReceipt> parts;
    parts.reserve(static_cast<size_t>((size + part_size - 1) / part_size));

    util::Sha256 hasher;
    uint32_t     part_number = 1;
    for (int64_t offset = 0; offset < size; offset += part_size, ++part_number) {
      CheckDeadline(deadline, "before part " + std::to_string(part_number));

      const auto length = std::min(part_size, size - offset);
      auto       data   = ReadRange(*file, file_path, offset, length);
      hasher.Update(data->data(), static_cast<size_t>(data->size()));

      parts.push_back(CallStore("upload part", [&] { return store.UploadPart(key, upload_id, part_number, data); }));
    }

    VerifyChecksum(metadata, hasher.HexDigest(), file_path);
    CheckDeadline(deadline, "before completing multipart upload");

    auto object = CallStore("complete multipart upload", [&] { return store.CompleteMultipartUpload(key, upload_id, parts); });
    completed   = true;
    VerifySize(size, object.size_bytes, key);

    RECSYNC_LOG_INFO("multipart upload complete",
                     {StringField("key", key), IntField("parts", static_cast<int64_t>(parts.size())), IntField("size_bytes", size)});

    TransferReceipt receipt;
    receipt.remote_key    = key;
    receipt.integrity_tag = object.etag;
    receipt.multipart     = true;
    receipt.part_count    = static_cast<uint32_t>(parts.size());
    receipt.size_bytes    = object.size_bytes;
    return receipt;
  } catch (const std::exception& e) {
    if (completed) {
      throw;
    }
    RECSYNC_LOG_WARN("aborting multipart upload", {StringField("key", key), StringField("upload_id", upload_id), StringField("error", e.what())});
    try {
      store.AbortMultipartUpload(key, upload_id);
    } catch (const std::exception& abort_error) {
      RECSYNC_LOG_ERROR("multipart abort failed", {StringField("key", key), StringField("upload_id", upload_id), StringField("error", abort_error.what())});
    }
    throw;
  }
}

} // namespace recsync::transfer
