#include <arrow/filesystem/s3fs.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/upload/upload_scheduler.hpp"

using recsync::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  recsync::observability::ShutdownLogging();
  recsync::observability::ShutdownMetrics();
  recsync::observability::ShutdownTracing();
}

static void FinalizeS3IfUsed(bool uses_s3) {
  if (!uses_s3) return;
  if (auto status = arrow::fs::FinalizeS3(); !status.ok()) {
    RECSYNC_LOG_WARN("S3 finalization failed", {recsync::observability::StringField("error", status.ToString())});
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: recsync-agent <config.yaml> OR recsync-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  bool uses_s3 = false;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = recsync::config::ConfigLoader::LoadFromYaml(config_path);
    uses_s3     = recsync::storage::common::UsesS3(config.object_store());

    recsync::observability::InitializeTracing(config);
    recsync::observability::InitializeMetrics(config);
    recsync::observability::InitializeLogging(config);

    // S3 clients must be gone before FinalizeS3
    {
      // ------------------------------------------------------------
      // Build application (dependency graph)
      // ------------------------------------------------------------
      auto app = recsync::factory::Build(config);

      // ------------------------------------------------------------
      // Start uploads and server
      // ------------------------------------------------------------
      Server server(app.settings.server.bind_address, std::move(app.grpc_services), app.settings.server.max_message_bytes);

      // Register signal handlers before starting to avoid race window.
      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);

      app.scheduler->Start();
      server.Start();
      RECSYNC_LOG_INFO("recsync agent started", {recsync::observability::StringField("bind_address", app.settings.server.bind_address),
                                                 recsync::observability::StringField("chunk_dir", app.settings.capture.chunk_dir.string()),
                                                 recsync::observability::StringField("manifest_dir", app.settings.manifest_dir.string())});

      while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

      RECSYNC_LOG_INFO("shutting down recsync agent");

      server.Stop();
      app.scheduler->Stop();
    }

    FinalizeS3IfUsed(uses_s3);
    ShutdownObservability();
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("fatal error", {recsync::observability::StringField("error", e.what())});
    FinalizeS3IfUsed(uses_s3);
    ShutdownObservability();
    return 2;
  }

  return 0;
}
