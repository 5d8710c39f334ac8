#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

using namespace std::chrono_literals;
using recsync::config::ConfigLoader;
using recsync::config::ResolveSettings;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "recsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:50061"
logging:
  level: debug
capture:
  chunk_dir: /data/chunks
  min_free_bytes: 1048576
  file_extension: .ts
manifest:
  dir: /data/manifests
upload:
  max_concurrent_uploads: 5
  max_retries: 4
  base_backoff: "0.500s"
  max_backoff: 30s
  jitter_ratio: 0.2
  poll_interval: "0.100s"
transfer:
  multipart_threshold_bytes: 16777216
  part_size_bytes: 8388608
  key_prefix: fleet/vehicle-7
object_store:
  root: s3://recordings/raw
  kind: OBJECT_STORE_KIND_S3
  s3:
    region: eu-west-1
    endpoint_override: "minio:9000"
    scheme: http
credentials:
  static_credentials:
    access_key_id: AKIA
    secret_access_key: secret
  refresh_before_expiry: 120s
catalog:
  outbox_path: /data/outbox.jsonl
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.object_store().kind() == recsync::runtime::config::OBJECT_STORE_KIND_S3);
  assert(config.object_store().s3().endpoint_override() == "minio:9000");
  assert(config.credentials().has_static_credentials());
  assert(config.credentials().static_credentials().access_key_id() == "AKIA");

  const auto settings = ResolveSettings(config);
  assert(settings.capture.chunk_dir == "/data/chunks");
  assert(settings.capture.min_free_bytes == 1048576);
  assert(settings.capture.file_extension == ".ts");
  assert(settings.transfer.file_extension == ".ts");
  assert(settings.manifest_dir == "/data/manifests");
  assert(settings.upload.max_concurrent_uploads == 5);
  assert(settings.upload.max_retries == 4);
  assert(settings.upload.base_backoff == 500ms);
  assert(settings.upload.max_backoff == 30s);
  assert(settings.upload.poll_interval == 100ms);
  assert(settings.upload.jitter_ratio == 0.2);
  assert(settings.transfer.multipart_threshold_bytes == 16 * recsync::config::kMiB);
  assert(settings.transfer.key_prefix == "fleet/vehicle-7");
  assert(settings.refresh_before_expiry == 120s);
  assert(settings.outbox_path == "/data/outbox.jsonl");
}

void TestDefaultsApply() {
  const auto config   = ConfigLoader::LoadFromYamlString("object_store:\n  root: /var/lib/recsync/store\n");
  const auto settings = ResolveSettings(config);

  assert(settings.server.bind_address == "0.0.0.0:50061");
  assert(settings.upload.max_concurrent_uploads == 3);
  assert(settings.upload.max_retries == 3);
  assert(settings.upload.base_backoff == 1s);
  assert(settings.upload.max_backoff == 60s);
  assert(settings.upload.poll_interval == 250ms);
  assert(settings.transfer.multipart_threshold_bytes == 32 * recsync::config::kMiB);
  assert(settings.transfer.part_size_bytes == 8 * recsync::config::kMiB);
  assert(settings.capture.file_extension == ".mp4");
  assert(settings.outbox_path.empty());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(object_store:
  root: "C:\\recsync\\\"quoted\"\\store"
)");
  assert(config.object_store().root() == "C:\\recsync\\\"quoted\"\\store");
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(transfer:
  key_prefix: "0042"
object_store:
  root: /store
)");
  assert(config.transfer().key_prefix() == "0042");
}

template <typename Error>
bool Throws(const std::string& yaml, bool resolve) {
  try {
    const auto config = ConfigLoader::LoadFromYamlString(yaml);
    if (resolve) ResolveSettings(config);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestUnknownFieldsAreRejected() {
  assert(Throws<std::runtime_error>("upload:\n  max_parallel: 4\nobject_store:\n  root: /store\n", false));
  assert(Throws<std::runtime_error>("- not\n- a\n- mapping\n", false));
  assert(Throws<std::runtime_error>("upload: [unclosed\n", false));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/recsync.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestInvalidSettingsAreRejected() {
  assert(Throws<std::invalid_argument>("upload:\n  jitter_ratio: 1.5\nobject_store:\n  root: /store\n", true));
  assert(Throws<std::invalid_argument>("upload:\n  base_backoff: 10s\n  max_backoff: 1s\nobject_store:\n  root: /store\n", true));
  assert(Throws<std::invalid_argument>(
      "transfer:\n  multipart_threshold_bytes: 1024\n  part_size_bytes: 4096\nobject_store:\n  root: /store\n", true));
  assert(Throws<std::invalid_argument>("capture:\n  file_extension: mp4\nobject_store:\n  root: /store\n", true));
  assert(Throws<std::invalid_argument>("upload:\n  max_retries: 2\n", true));
}

void TestRequestTimeoutIsBoundedByTransferTimeout() {
  const std::string too_long = R"(upload:
  transfer_timeout: 10s
object_store:
  root: s3://recordings/raw
  s3:
    request_timeout: 60s
)";
  assert(Throws<std::invalid_argument>(too_long, true));

  const auto settings = ResolveSettings(ConfigLoader::LoadFromYamlString(R"(upload:
  transfer_timeout: 60s
object_store:
  root: s3://recordings/raw
  s3:
    request_timeout: 10s
)"));
  assert(settings.upload.transfer_timeout == 60s);
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsApply();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestInvalidSettingsAreRejected();
  TestRequestTimeoutIsBoundedByTransferTimeout();

  std::cout << "recsync_unit_config_loader: pass\n";
  return 0;
}
