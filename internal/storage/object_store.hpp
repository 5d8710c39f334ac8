#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace recsync::storage {

using ObjectMetadata = std::map<std::string, std::string>;

struct ObjectReceipt {
  std::string etag;
  int64_t     size_bytes = 0;
};

struct PartReceipt {
  uint32_t    part_number = 0;
  std::string etag;
  int64_t     size_bytes = 0;
};

/*
  Remote object store abstraction.

  Every payload is handed over as an Arrow Buffer. Implementations report
  failures as util::UploadError subclasses:

    NetworkFailure        transport, timeouts, 5xx
    AuthorizationExpired  credential rejected / expired
    StoreRejected         malformed request, unknown session

  Anything else escaping an implementation is treated as a network failure.

  Implementations:
    ArrowObjectStore → Arrow S3 / local filesystem
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Single shot
  // ------------------------------------------------------------------
  virtual ObjectReceipt PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata) = 0;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------
  /*
    Opens a session and returns its upload id. Parts are numbered from 1
    and completed in ascending order.
  */
  virtual std::string CreateMultipartUpload(const std::string& key, const ObjectMetadata& metadata) = 0;

  virtual PartReceipt UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                                 const std::shared_ptr<arrow::Buffer>& data) = 0;

  virtual ObjectReceipt CompleteMultipartUpload(const std::string& key, const std::string& upload_id, const std::vector<PartReceipt>& parts) = 0;

  virtual void AbortMultipartUpload(const std::string& key, const std::string& upload_id) = 0;

  /*
    Aborts multipart sessions this instance does not own, such as those
    left behind by a killed process. Only safe while no other writer
    shares the store. Returns the number aborted.
  */
  virtual size_t AbortStaleUploads() {
    return 0;
  }
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace recsync::storage
