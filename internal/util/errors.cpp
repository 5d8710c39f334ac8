#include "errors.hpp"

namespace recsync::util {

std::string_view ToString(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::kInsufficientStorage:
      return "insufficient_storage";
    case UploadErrorKind::kSourceFileMissing:
      return "source_file_missing";
    case UploadErrorKind::kNetworkFailure:
      return "network_failure";
    case UploadErrorKind::kAuthorizationExpired:
      return "authorization_expired";
    case UploadErrorKind::kStoreRejected:
      return "store_rejected";
    case UploadErrorKind::kIntegrityMismatch:
      return "integrity_mismatch";
  }
  return "unknown";
}

} // namespace recsync::util
