#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "config/config.pb.h"
#include "internal/credentials/credential_provider.hpp"
#include "internal/util/errors.hpp"

namespace recsync::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Maps a failed Arrow status onto the upload error taxonomy:

    access denied / expired token / bad signature → AuthorizationExpired
    invalid request / unknown bucket / 4xx         → StoreRejected
    everything else                                → NetworkFailure
*/
util::UploadErrorKind ClassifyStatus(const arrow::Status& status);

[[noreturn]] void ThrowUploadError(const arrow::Status& status, std::string_view context);

/*
  Upload-path variants of Unwrap: failures become util::UploadError.
*/
template <typename T>
T UnwrapUpload(arrow::Result<T> result, std::string_view context) {
  if (!result.ok()) ThrowUploadError(result.status(), context);
  return std::move(result).ValueOrDie();
}

inline void UnwrapUpload(const arrow::Status& status, std::string_view context) {
  if (!status.ok()) ThrowUploadError(status, context);
}

/*
  Read entire stream into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

// True when the root resolves to S3 (explicit kind, or auto with an s3:// root).
bool UsesS3(const recsync::runtime::config::ObjectStoreConfig& config);

/*
  Resolves the object store root to a filesystem and the path inside it.

    s3://bucket/prefix   → S3FileSystem with `credentials`
    file:///abs/dir      → LocalFileSystem
    /abs/dir, rel/dir    → LocalFileSystem
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const recsync::runtime::config::ObjectStoreConfig& config, const credentials::Credentials& credentials);

} // namespace recsync::storage::common
