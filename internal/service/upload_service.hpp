#pragma once

#include "internal/chunk/chunk_writer.hpp"
#include "recsync/uploader/v1.hpp"
#include "service_context.hpp"

namespace recsync::service {

/*
  Entry point of the capture side and of the admin surface.

  SubmitChunk commits the buffer, registers the chunk as `pending` in its
  recording's manifest (creating the manifest on the first chunk) and wakes
  the scheduler.
*/
class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  model::ChunkMetadata SubmitChunk(const chunk::ChunkBuffer& buffer);

  recsync::uploader::v1::SubmitChunkResponse SubmitChunk(const recsync::uploader::v1::SubmitChunkRequest& req);

  recsync::uploader::v1::ListRecordingsResponse ListRecordings(const recsync::uploader::v1::ListRecordingsRequest& req);

  recsync::uploader::v1::GetManifestResponse GetManifest(const recsync::uploader::v1::GetManifestRequest& req);

  recsync::uploader::v1::ResubmitChunkResponse ResubmitChunk(const recsync::uploader::v1::ResubmitChunkRequest& req);

  recsync::uploader::v1::CancelChunkResponse CancelChunk(const recsync::uploader::v1::CancelChunkRequest& req);

  recsync::uploader::v1::PauseUploadsResponse PauseUploads(const recsync::uploader::v1::PauseUploadsRequest& req);

  recsync::uploader::v1::ResumeUploadsResponse ResumeUploads(const recsync::uploader::v1::ResumeUploadsRequest& req);

  recsync::uploader::v1::StatsResponse Stats(const recsync::uploader::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace recsync::service
