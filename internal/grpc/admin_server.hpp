#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "recsync/uploader/v1/admin_service.grpc.pb.h"
#include "internal/service/upload_service.hpp"

namespace recsync::grpc {

class AdminServer final : public recsync::uploader::v1::UploadAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<recsync::service::UploadService> svc);

  ::grpc::Status SubmitChunk(::grpc::ServerContext*,
                             const recsync::uploader::v1::SubmitChunkRequest*,
                             recsync::uploader::v1::SubmitChunkResponse*) override;

  ::grpc::Status ListRecordings(::grpc::ServerContext*,
                                const recsync::uploader::v1::ListRecordingsRequest*,
                                recsync::uploader::v1::ListRecordingsResponse*) override;

  ::grpc::Status GetManifest(::grpc::ServerContext*,
                             const recsync::uploader::v1::GetManifestRequest*,
                             recsync::uploader::v1::GetManifestResponse*) override;

  ::grpc::Status ResubmitChunk(::grpc::ServerContext*,
                               const recsync::uploader::v1::ResubmitChunkRequest*,
                               recsync::uploader::v1::ResubmitChunkResponse*) override;

  ::grpc::Status CancelChunk(::grpc::ServerContext*,
                             const recsync::uploader::v1::CancelChunkRequest*,
                             recsync::uploader::v1::CancelChunkResponse*) override;

  ::grpc::Status PauseUploads(::grpc::ServerContext*,
                              const recsync::uploader::v1::PauseUploadsRequest*,
                              recsync::uploader::v1::PauseUploadsResponse*) override;

  ::grpc::Status ResumeUploads(::grpc::ServerContext*,
                               const recsync::uploader::v1::ResumeUploadsRequest*,
                               recsync::uploader::v1::ResumeUploadsResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const recsync::uploader::v1::StatsRequest*,
                       recsync::uploader::v1::StatsResponse*) override;

private:
  std::shared_ptr<recsync::service::UploadService> service_;
};

}
