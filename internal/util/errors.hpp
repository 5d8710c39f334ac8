#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace recsync::util {

/*
  Central error types.

  Admin/usage errors get translated to gRPC status codes.
  Upload errors carry a kind so the scheduler can decide retry vs. fail.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// I/O failure while producing a chunk file. Fatal to that chunk.
class ChunkWriteFailed : public std::runtime_error {
 public:
  explicit ChunkWriteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class UploadErrorKind {
  kInsufficientStorage,
  kSourceFileMissing,
  kNetworkFailure,
  kAuthorizationExpired,
  kStoreRejected,
  kIntegrityMismatch,
};

std::string_view ToString(UploadErrorKind kind);

/*
  Retry classification.

  IntegrityMismatch is retryable here; the scheduler limits it to a
  single extra attempt per chunk.
*/
constexpr bool IsRetryable(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::kNetworkFailure:
    case UploadErrorKind::kAuthorizationExpired:
    case UploadErrorKind::kIntegrityMismatch:
      return true;
    case UploadErrorKind::kInsufficientStorage:
    case UploadErrorKind::kSourceFileMissing:
    case UploadErrorKind::kStoreRejected:
      return false;
  }
  return false;
}

class UploadError : public std::runtime_error {
 public:
  UploadError(UploadErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  UploadErrorKind kind() const {
    return kind_;
  }

  bool IsRetryable() const {
    return util::IsRetryable(kind_);
  }

 private:
  UploadErrorKind kind_;
};

class InsufficientStorage : public UploadError {
 public:
  explicit InsufficientStorage(const std::string& msg) : UploadError(UploadErrorKind::kInsufficientStorage, msg) {
  }
};

class SourceFileMissing : public UploadError {
 public:
  explicit SourceFileMissing(const std::string& msg) : UploadError(UploadErrorKind::kSourceFileMissing, msg) {
  }
};

class NetworkFailure : public UploadError {
 public:
  explicit NetworkFailure(const std::string& msg) : UploadError(UploadErrorKind::kNetworkFailure, msg) {
  }
};

class AuthorizationExpired : public UploadError {
 public:
  explicit AuthorizationExpired(const std::string& msg) : UploadError(UploadErrorKind::kAuthorizationExpired, msg) {
  }
};

class StoreRejected : public UploadError {
 public:
  explicit StoreRejected(const std::string& msg) : UploadError(UploadErrorKind::kStoreRejected, msg) {
  }
};

class IntegrityMismatch : public UploadError {
 public:
  explicit IntegrityMismatch(const std::string& msg) : UploadError(UploadErrorKind::kIntegrityMismatch, msg) {
  }
};

} // namespace recsync::util
