#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store.hpp"

namespace recsync::storage {

/*
  Object store over an Arrow filesystem (S3 / MinIO / local directory).

  Arrow does not expose native multipart sessions, so a session is
  emulated by staging each part as its own object:

      <root>/.multipart/<upload_id>/part-00001
      <root>/.multipart/<upload_id>/part-00002
      ...

  Complete concatenates the parts into <root>/<key> in one output
  stream and removes the staging area; Abort only removes it. Staging
  areas without a session in this instance are swept by
  AbortStaleUploads().

  A write that fails midway aborts its output stream, so no truncated
  object is committed under the key.

  ETags are SHA-256 hex digests of the bytes written; a completed
  multipart object gets sha256(part etags) + "-<part count>".
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  ObjectReceipt PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data, const ObjectMetadata& metadata) override;

  std::string CreateMultipartUpload(const std::string& key, const ObjectMetadata& metadata) override;

  PartReceipt UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                         const std::shared_ptr<arrow::Buffer>& data) override;

  ObjectReceipt CompleteMultipartUpload(const std::string& key, const std::string& upload_id, const std::vector<PartReceipt>& parts) override;

  void AbortMultipartUpload(const std::string& key, const std::string& upload_id) override;

  size_t AbortStaleUploads() override;

  // Number of sessions created and neither completed nor aborted.
  size_t OpenSessionCount() const;

 private:
  struct Session {
    std::string    key;
    ObjectMetadata metadata;
  };

  std::string ObjectPath(const std::string& key) const;
  std::string StagingRoot() const;
  std::string StagingDir(const std::string& upload_id) const;
  std::string PartPath(const std::string& upload_id, uint32_t part_number) const;

  void    EnsureParentDir(const std::string& path);
  void    AbortPartial(arrow::io::OutputStream& out, const std::string& path);
  Session FindSession(const std::string& key, const std::string& upload_id) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   local_;

  mutable std::mutex                       sessions_mutex_;
  std::unordered_map<std::string, Session> sessions_;
};

} // namespace recsync::storage
