#pragma once

#include <cstdint>
#include <string>

namespace recsync::upload {

/*
  A claimed manifest entry waiting for a worker.

  The entry is already persisted as `uploading` with `remote_key` set.
*/
struct UploadTask {
  std::string recording_id;
  uint32_t    index = 0;

  std::string file_path;
  std::string remote_key;
  std::string checksum;
  double      duration_seconds = 0.0;

  // outcomes are written only while the scheduler still holds this claim
  uint64_t claim_id = 0;
};

} // namespace recsync::upload
