#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace recsync::config {

inline constexpr uint64_t kMiB = 1024ull * 1024ull;

struct ServerSettings {
  std::string bind_address      = "0.0.0.0:50061";
  uint64_t    max_message_bytes = 256 * kMiB;
};

struct CaptureSettings {
  std::filesystem::path chunk_dir      = "recsync/chunks";
  uint64_t              min_free_bytes = 512 * kMiB;
  std::string           file_extension = ".mp4";
};

struct UploadSettings {
  uint32_t                  max_concurrent_uploads    = 3;
  uint32_t                  max_retries               = 3;
  std::chrono::milliseconds base_backoff              = std::chrono::seconds(1);
  std::chrono::milliseconds max_backoff               = std::chrono::seconds(60);
  double                    jitter_ratio              = 0.0;
  std::chrono::milliseconds poll_interval             = std::chrono::milliseconds(250);
  std::chrono::milliseconds transfer_timeout          = std::chrono::seconds(300);
  bool                      delete_local_after_upload = false;
};

struct TransferSettings {
  uint64_t    multipart_threshold_bytes = 32 * kMiB;
  uint64_t    part_size_bytes           = 8 * kMiB;
  std::string key_prefix;
  std::string file_extension = ".mp4";
};

/*
  Typed view of RuntimeConfig with every default applied.
*/
struct Settings {
  ServerSettings            server;
  CaptureSettings           capture;
  std::filesystem::path     manifest_dir = "recsync/manifests";
  UploadSettings            upload;
  TransferSettings          transfer;
  std::chrono::milliseconds refresh_before_expiry = std::chrono::minutes(10);
  std::string               outbox_path;
};

// Applies defaults and validates. Throws std::invalid_argument.
Settings ResolveSettings(const recsync::runtime::config::RuntimeConfig& config);

} // namespace recsync::config
