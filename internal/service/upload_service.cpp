#include "upload_service.hpp"

#include <chrono>

#include "internal/catalog/catalog_notifier.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/upload/upload_scheduler.hpp"
#include "internal/util/errors.hpp"

namespace recsync::service {

using namespace recsync::uploader::v1;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Span, request metrics and error log around one admin operation.
*/
template <typename Fn>
auto Instrumented(std::string_view route, Fn&& fn) -> decltype(fn()) {
  observability::SpanScope span(route);
  const auto               started_at = std::chrono::steady_clock::now();
  const auto               elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RECSYNC_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

RecordingSummary ToSummary(const model::ManifestSummary& summary) {
  RecordingSummary out;
  out.set_recording_id(summary.recording_id);
  out.set_overall_status(std::string(model::ToString(summary.overall_status)));
  out.set_chunks_total(summary.total);
  out.set_chunks_pending(summary.pending);
  out.set_chunks_uploading(summary.uploading);
  out.set_chunks_completed(summary.completed);
  out.set_chunks_failed(summary.failed);
  out.set_chunks_cancelled(summary.cancelled);
  out.set_total_bytes(summary.total_bytes);
  out.set_uploaded_bytes(summary.uploaded_bytes);
  out.set_progress(summary.Progress());
  return out;
}

} // namespace

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::ChunkMetadata UploadService::SubmitChunk(const chunk::ChunkBuffer& buffer) {
  storage::common::ValidateRecordingId(buffer.recording_id);
  if (!ctx_.manifests->Exists(buffer.recording_id)) {
    try {
      ctx_.manifests->Create(buffer.recording_id);
    } catch (const util::AlreadyExists&) {
      // created by a concurrent submit
    }
  }

  // written under the recording lock, so no claim lands between check and replace
  model::ChunkMetadata metadata;
  ctx_.manifests->AppendOrUpdate(buffer.recording_id, buffer.index, [&] {
    metadata = ctx_.writer->Finalize(buffer);
    return model::ChunkEntry::FromMetadata(metadata);
  });

  RECSYNC_LOG_INFO("chunk submitted", {StringField("recording_id", metadata.recording_id), IntField("chunk_index", metadata.index),
                                       IntField("size_bytes", metadata.size_bytes), StringField("checksum", metadata.checksum)});

  if (ctx_.scheduler) ctx_.scheduler->Wake();
  return metadata;
}

SubmitChunkResponse UploadService::SubmitChunk(const SubmitChunkRequest& req) {
  return Instrumented("UploadService.SubmitChunk", [&] {
    chunk::ChunkBuffer buffer;
    buffer.recording_id     = req.recording_id();
    buffer.index            = req.index();
    buffer.data             = arrow::Buffer::FromString(req.data());
    buffer.duration_seconds = req.duration_seconds();

    const auto metadata = SubmitChunk(buffer);

    SubmitChunkResponse resp;
    resp.set_file_path(metadata.file_path);
    resp.set_size_bytes(metadata.size_bytes);
    resp.set_checksum(metadata.checksum);
    return resp;
  });
}

ListRecordingsResponse UploadService::ListRecordings(const ListRecordingsRequest&) {
  return Instrumented("UploadService.ListRecordings", [&] {
    ListRecordingsResponse resp;
    for (const auto& manifest : ctx_.manifests->LoadAll()) {
      *resp.add_recordings() = ToSummary(model::Summarize(manifest));
    }
    return resp;
  });
}

GetManifestResponse UploadService::GetManifest(const GetManifestRequest& req) {
  return Instrumented("UploadService.GetManifest", [&] {
    const auto manifest = ctx_.manifests->Load(req.recording_id());

    GetManifestResponse resp;
    *resp.mutable_manifest() = manifest::ToRecord(manifest);
    *resp.mutable_summary()  = ToSummary(model::Summarize(manifest));
    return resp;
  });
}

ResubmitChunkResponse UploadService::ResubmitChunk(const ResubmitChunkRequest& req) {
  return Instrumented("UploadService.ResubmitChunk", [&] {
    uint32_t resubmitted = 0;
    if (req.has_index()) {
      ctx_.manifests->Resubmit(req.recording_id(), req.index());
      resubmitted = 1;
    } else {
      resubmitted = ctx_.manifests->ResubmitFailed(req.recording_id());
    }

    RECSYNC_LOG_INFO("chunks resubmitted", {StringField("recording_id", req.recording_id()), IntField("count", resubmitted)});
    if (resubmitted > 0 && ctx_.scheduler) ctx_.scheduler->Wake();

    ResubmitChunkResponse resp;
    resp.set_resubmitted(resubmitted);
    return resp;
  });
}

CancelChunkResponse UploadService::CancelChunk(const CancelChunkRequest& req) {
  return Instrumented("UploadService.CancelChunk", [&] {
    const auto entry = ctx_.manifests->Cancel(req.recording_id(), req.index());
    RECSYNC_LOG_INFO("chunk cancelled", {StringField("recording_id", req.recording_id()), IntField("chunk_index", entry.index)});
    observability::Metrics::Instance().RecordChunkOutcome("cancelled");

    if (ctx_.notifier) {
      ChunkEvent event;
      event.set_recording_id(req.recording_id());
      event.set_chunk_index(entry.index);
      event.set_status(std::string(model::ToString(entry.status)));
      *event.mutable_emitted_at() = util::ToProto(util::Now());
      try {
        ctx_.notifier->Notify(event);
      } catch (const std::exception& e) {
        RECSYNC_LOG_ERROR("catalog notification failed", {StringField("recording_id", req.recording_id()),
                                                          IntField("chunk_index", entry.index), StringField("error", e.what())});
      }
    }
    return CancelChunkResponse{};
  });
}

PauseUploadsResponse UploadService::PauseUploads(const PauseUploadsRequest&) {
  return Instrumented("UploadService.PauseUploads", [&] {
    ctx_.scheduler->Pause();
    return PauseUploadsResponse{};
  });
}

ResumeUploadsResponse UploadService::ResumeUploads(const ResumeUploadsRequest&) {
  return Instrumented("UploadService.ResumeUploads", [&] {
    ctx_.scheduler->Resume();
    return ResumeUploadsResponse{};
  });
}

StatsResponse UploadService::Stats(const StatsRequest&) {
  return Instrumented("UploadService.Stats", [&] {
    const auto stats = ctx_.scheduler->Stats();

    StatsResponse resp;
    resp.set_running(stats.running);
    resp.set_paused(stats.paused);
    resp.set_in_flight(stats.in_flight);
    resp.set_peak_in_flight(stats.peak_in_flight);
    resp.set_attempts(stats.attempts);
    resp.set_completed(stats.completed);
    resp.set_failed(stats.failed);
    resp.set_retried(stats.retried);
    resp.set_recordings(static_cast<uint32_t>(ctx_.manifests->LoadAll().size()));
    return resp;
  });
}

} // namespace recsync::service
