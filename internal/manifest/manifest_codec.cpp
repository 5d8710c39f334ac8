#include "manifest_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace recsync::manifest {

using recsync::uploader::v1::ChunkRecord;
using recsync::uploader::v1::ManifestRecord;

ChunkRecord ToRecord(const model::ChunkEntry& entry) {
  ChunkRecord record;
  record.set_index(entry.index);
  record.set_file_path(entry.file_path);
  record.set_status(std::string(model::ToString(entry.status)));
  if (entry.remote_key) record.set_remote_key(*entry.remote_key);
  if (entry.integrity_tag) record.set_integrity_tag(*entry.integrity_tag);
  record.set_retry_count(entry.retry_count);
  if (entry.last_attempt_at) *record.mutable_last_attempt_at() = util::ToProto(*entry.last_attempt_at);
  record.set_checksum(entry.checksum);
  record.set_size_bytes(entry.size_bytes);
  record.set_duration_seconds(entry.duration_seconds);
  if (entry.last_error) record.set_last_error(*entry.last_error);
  record.set_integrity_failures(entry.integrity_failures);
  if (entry.completed_at) *record.mutable_completed_at() = util::ToProto(*entry.completed_at);
  return record;
}

model::ChunkEntry FromRecord(const ChunkRecord& record) {
  model::ChunkEntry entry;
  entry.index     = record.index();
  entry.file_path = record.file_path();
  entry.status    = model::ParseChunkStatus(record.status());
  if (record.has_remote_key()) entry.remote_key = record.remote_key();
  if (record.has_integrity_tag()) entry.integrity_tag = record.integrity_tag();
  entry.retry_count = record.retry_count();
  if (record.has_last_attempt_at()) entry.last_attempt_at = util::FromProto(record.last_attempt_at());
  entry.checksum         = record.checksum();
  entry.size_bytes       = record.size_bytes();
  entry.duration_seconds = record.duration_seconds();
  if (record.has_last_error()) entry.last_error = record.last_error();
  entry.integrity_failures = record.integrity_failures();
  if (record.has_completed_at()) entry.completed_at = util::FromProto(record.completed_at());
  return entry;
}

ManifestRecord ToRecord(const model::Manifest& manifest) {
  ManifestRecord record;
  record.set_format_version(kManifestFormatVersion);
  record.set_recording_id(manifest.recording_id);
  *record.mutable_created_at() = util::ToProto(manifest.created_at);
  *record.mutable_updated_at() = util::ToProto(manifest.updated_at);
  for (const auto& chunk : manifest.chunks) {
    *record.add_chunks() = ToRecord(chunk);
  }
  return record;
}

model::Manifest FromRecord(const ManifestRecord& record) {
  if (record.format_version() > kManifestFormatVersion) {
    throw std::runtime_error("unsupported manifest format version " + std::to_string(record.format_version()));
  }

  model::Manifest manifest;
  manifest.recording_id = record.recording_id();
  manifest.created_at   = util::FromProto(record.created_at());
  manifest.updated_at   = util::FromProto(record.updated_at());
  manifest.chunks.reserve(static_cast<size_t>(record.chunks_size()));
  for (const auto& chunk : record.chunks()) {
    manifest.chunks.push_back(FromRecord(chunk));
  }
  return manifest;
}

std::string EncodeJson(const model::Manifest& manifest) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToRecord(manifest), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("manifest encode failed: " + std::string(status.message()));
  }
  return json;
}

model::Manifest DecodeJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  ManifestRecord record;
  auto           status = google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok()) {
    throw std::runtime_error("manifest decode failed: " + std::string(status.message()));
  }
  return FromRecord(record);
}

} // namespace recsync::manifest
