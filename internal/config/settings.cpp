#include "settings.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace recsync::config {

namespace {

void Require(bool condition, const char* message) {
  if (!condition) {
    throw std::invalid_argument(std::string("invalid configuration: ") + message);
  }
}

} // namespace

Settings ResolveSettings(const recsync::runtime::config::RuntimeConfig& config) {
  Settings settings;

  const auto& server = config.server();
  if (!server.bind_address().empty()) settings.server.bind_address = server.bind_address();
  if (server.max_message_bytes() > 0) settings.server.max_message_bytes = server.max_message_bytes();

  const auto& capture = config.capture();
  if (!capture.chunk_dir().empty()) settings.capture.chunk_dir = capture.chunk_dir();
  if (capture.min_free_bytes() > 0) settings.capture.min_free_bytes = capture.min_free_bytes();
  if (!capture.file_extension().empty()) settings.capture.file_extension = capture.file_extension();
  Require(settings.capture.file_extension.front() == '.', "capture.file_extension must start with '.'");

  if (!config.manifest().dir().empty()) settings.manifest_dir = config.manifest().dir();

  const auto& upload = config.upload();
  if (upload.max_concurrent_uploads() > 0) settings.upload.max_concurrent_uploads = upload.max_concurrent_uploads();
  if (upload.max_retries() > 0) settings.upload.max_retries = upload.max_retries();
  settings.upload.base_backoff              = util::ToMillis(upload.base_backoff(), settings.upload.base_backoff);
  settings.upload.max_backoff               = util::ToMillis(upload.max_backoff(), settings.upload.max_backoff);
  settings.upload.jitter_ratio              = upload.jitter_ratio();
  settings.upload.poll_interval             = util::ToMillis(upload.poll_interval(), settings.upload.poll_interval);
  settings.upload.transfer_timeout          = util::ToMillis(upload.transfer_timeout(), settings.upload.transfer_timeout);
  settings.upload.delete_local_after_upload = upload.delete_local_after_upload();

  Require(settings.upload.base_backoff.count() > 0, "upload.base_backoff must be positive");
  Require(settings.upload.max_backoff >= settings.upload.base_backoff, "upload.max_backoff must be >= base_backoff");
  Require(settings.upload.jitter_ratio >= 0.0 && settings.upload.jitter_ratio <= 1.0, "upload.jitter_ratio must be within [0, 1]");
  Require(settings.upload.poll_interval.count() > 0, "upload.poll_interval must be positive");
  Require(settings.upload.transfer_timeout.count() > 0, "upload.transfer_timeout must be positive");

  const auto& transfer = config.transfer();
  if (transfer.multipart_threshold_bytes() > 0) settings.transfer.multipart_threshold_bytes = transfer.multipart_threshold_bytes();
  if (transfer.part_size_bytes() > 0) settings.transfer.part_size_bytes = transfer.part_size_bytes();
  settings.transfer.key_prefix     = transfer.key_prefix();
  settings.transfer.file_extension = settings.capture.file_extension;

  Require(settings.transfer.part_size_bytes <= settings.transfer.multipart_threshold_bytes,
          "transfer.part_size_bytes must not exceed multipart_threshold_bytes");

  settings.refresh_before_expiry = util::ToMillis(config.credentials().refresh_before_expiry(), settings.refresh_before_expiry);
  settings.outbox_path           = config.catalog().outbox_path();

  Require(!config.object_store().root().empty(), "object_store.root is required");

  const auto& s3 = config.object_store().s3();
  if (s3.has_request_timeout()) {
    const auto request_timeout = util::ToMillis(s3.request_timeout(), std::chrono::milliseconds(0));
    Require(request_timeout.count() > 0, "object_store.s3.request_timeout must be positive");
    Require(request_timeout <= settings.upload.transfer_timeout, "object_store.s3.request_timeout must not exceed upload.transfer_timeout");
  }

  return settings;
}

} // namespace recsync::config
