#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "recsync/uploader/v1.hpp"

namespace recsync::grpc {

using namespace recsync::uploader::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<recsync::service::UploadService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::SubmitChunk(::grpc::ServerContext*, const SubmitChunkRequest* req, SubmitChunkResponse* resp) {
  return Handle([&] { *resp = service_->SubmitChunk(*req); });
}

::grpc::Status AdminServer::ListRecordings(::grpc::ServerContext*, const ListRecordingsRequest* req, ListRecordingsResponse* resp) {
  return Handle([&] { *resp = service_->ListRecordings(*req); });
}

::grpc::Status AdminServer::GetManifest(::grpc::ServerContext*, const GetManifestRequest* req, GetManifestResponse* resp) {
  return Handle([&] { *resp = service_->GetManifest(*req); });
}

::grpc::Status AdminServer::ResubmitChunk(::grpc::ServerContext*, const ResubmitChunkRequest* req, ResubmitChunkResponse* resp) {
  return Handle([&] { *resp = service_->ResubmitChunk(*req); });
}

::grpc::Status AdminServer::CancelChunk(::grpc::ServerContext*, const CancelChunkRequest* req, CancelChunkResponse* resp) {
  return Handle([&] { *resp = service_->CancelChunk(*req); });
}

::grpc::Status AdminServer::PauseUploads(::grpc::ServerContext*, const PauseUploadsRequest* req, PauseUploadsResponse* resp) {
  return Handle([&] { *resp = service_->PauseUploads(*req); });
}

::grpc::Status AdminServer::ResumeUploads(::grpc::ServerContext*, const ResumeUploadsRequest* req, ResumeUploadsResponse* resp) {
  return Handle([&] { *resp = service_->ResumeUploads(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Handle([&] { *resp = service_->Stats(*req); });
}

} // namespace recsync::grpc
