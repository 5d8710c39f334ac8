#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>

#include <arrow/buffer.h>

#include "internal/chunk/chunk_writer.hpp"
#include "internal/factory.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/upload/upload_scheduler.hpp"
#include "internal/util/sha256.hpp"
#include "tests/support/temp_dir.hpp"
#include "tests/support/upload_harness.hpp"

namespace {

using recsync::model::ChunkStatus;
using recsync::testing::TempDir;
using recsync::testing::WaitUntil;

constexpr size_t kMiB = 1024 * 1024;

/*
  Agent configuration over a local directory standing in for the bucket,
  with the production multipart thresholds.
*/
recsync::runtime::config::RuntimeConfig AgentConfig(const TempDir& dir) {
  recsync::runtime::config::RuntimeConfig config;
  config.mutable_capture()->set_chunk_dir((dir.path() / "chunks").string());
  config.mutable_capture()->set_min_free_bytes(1);
  config.mutable_manifest()->set_dir((dir.path() / "manifests").string());
  config.mutable_object_store()->set_root((dir.path() / "bucket").string());
  config.mutable_object_store()->set_kind(recsync::runtime::config::OBJECT_STORE_KIND_LOCAL);
  config.mutable_catalog()->set_outbox_path((dir.path() / "outbox.jsonl").string());

  auto* upload = config.mutable_upload();
  upload->mutable_poll_interval()->set_nanos(20'000'000);
  upload->mutable_base_backoff()->set_nanos(10'000'000);
  upload->mutable_max_backoff()->set_nanos(50'000'000);
  return config;
}

std::string Payload(size_t size, char seed) {
  std::string data(size, '\0');
  for (size_t i = 0; i < size; ++i) data[i] = static_cast<char>(seed + (i % 97));
  return data;
}

recsync::chunk::ChunkBuffer Buffer(const std::string& recording_id, uint32_t index, const std::string& data) {
  recsync::chunk::ChunkBuffer buffer;
  buffer.recording_id     = recording_id;
  buffer.index            = index;
  buffer.data             = arrow::Buffer::FromString(data);
  buffer.duration_seconds = 5.0;
  return buffer;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t CountLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  size_t        lines = 0;
  for (std::string line; std::getline(in, line);) ++lines;
  return lines;
}

bool AllCompleted(recsync::manifest::ManifestStore& manifests, const std::string& recording_id) {
  for (const auto& chunk : manifests.Load(recording_id).chunks) {
    if (chunk.status != ChunkStatus::kCompleted) return false;
  }
  return true;
}

/*
  Process 1 captures three chunks and dies while chunk 1 is marked
  uploading and a multipart upload is staged. Process 2 starts over the same directories and finishes
  the recording.
*/
void TestResumeAfterCrash() {
  TempDir    dir("pipeline_resume");
  const auto config = AgentConfig(dir);

  {
    auto app = recsync::factory::Build(config);
    for (uint32_t i = 0; i < 3; ++i) {
      app.upload_service->SubmitChunk(Buffer("rec-1", i, Payload(64 * 1024, static_cast<char>('a' + i))));
    }
    app.manifests->Update("rec-1", 1, [](recsync::model::ChunkEntry& e) { e.status = ChunkStatus::kUploading; });
    // no scheduler: the process goes away with chunk 1 in flight
  }

  // a multipart transfer it had started, staged but never completed
  const auto stale_staging = dir.path() / "bucket" / ".multipart" / "stale-upload";
  std::filesystem::create_directories(stale_staging);
  {
    std::ofstream part(stale_staging / "part-00001", std::ios::binary);
    part << Payload(1024, 'z');
  }

  auto app = recsync::factory::Build(config);
  assert(app.manifests->Load("rec-1").Find(1)->status == ChunkStatus::kPending);

  app.scheduler->Start();
  assert(WaitUntil([&] { return AllCompleted(*app.manifests, "rec-1"); }));
  app.scheduler->Stop();

  for (uint32_t i = 0; i < 3; ++i) {
    const auto entry  = *app.manifests->Load("rec-1").Find(i);
    const auto object = dir.path() / "bucket" / *entry.remote_key;
    assert(ReadFile(object) == Payload(64 * 1024, static_cast<char>('a' + i)));
    assert(recsync::util::Sha256Hex(ReadFile(object)) == entry.checksum);
    assert(entry.retry_count == 0);
  }
  assert(CountLines(dir.path() / "outbox.jsonl") == 3);
  assert(!std::filesystem::exists(stale_staging));

  const auto summary = recsync::model::Summarize(app.manifests->Load("rec-1"));
  assert(summary.overall_status == ChunkStatus::kCompleted);
  assert(summary.Progress() == 1.0);
}

/*
  Restarting over a finished recording uploads nothing.
*/
void TestRestartAfterCompletionIsIdle() {
  TempDir    dir("pipeline_idle");
  const auto config = AgentConfig(dir);

  {
    auto app = recsync::factory::Build(config);
    app.upload_service->SubmitChunk(Buffer("rec-1", 0, Payload(1024, 'x')));
    app.scheduler->Start();
    assert(WaitUntil([&] { return AllCompleted(*app.manifests, "rec-1"); }));
    app.scheduler->Stop();
  }

  auto app = recsync::factory::Build(config);
  app.scheduler->Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  app.scheduler->Stop();

  assert(app.scheduler->Stats().attempts == 0);
  assert(CountLines(dir.path() / "outbox.jsonl") == 1);
}

/*
  10 MiB goes up in one request, 60 MiB in 8 MiB parts; both arrive
  byte-identical and no staging area is left behind.
*/
void TestSingleShotAndMultipartSizes() {
  TempDir    dir("pipeline_sizes");
  const auto config = AgentConfig(dir);
  auto       app    = recsync::factory::Build(config);

  const auto small = Payload(10 * kMiB, 'k');
  const auto large = Payload(60 * kMiB, 'm');
  app.upload_service->SubmitChunk(Buffer("rec-big", 0, small));
  app.upload_service->SubmitChunk(Buffer("rec-big", 1, large));

  app.scheduler->Start();
  assert(WaitUntil([&] { return AllCompleted(*app.manifests, "rec-big"); }, std::chrono::seconds(60)));
  app.scheduler->Stop();

  const auto manifest = app.manifests->Load("rec-big");
  const auto first    = *manifest.Find(0);
  const auto second   = *manifest.Find(1);

  assert(ReadFile(dir.path() / "bucket" / *first.remote_key) == small);
  assert(ReadFile(dir.path() / "bucket" / *second.remote_key) == large);
  assert(first.integrity_tag->find('-') == std::string::npos);
  assert(second.integrity_tag->substr(second.integrity_tag->size() - 2) == "-8");

  const auto staging = dir.path() / "bucket" / ".multipart";
  assert(!std::filesystem::exists(staging) || std::filesystem::is_empty(staging));
}

} // namespace

int main() {
  TestResumeAfterCrash();
  TestRestartAfterCompletionIsIdle();
  TestSingleShotAndMultipartSizes();

  std::cout << "recsync_integration_pipeline_resume: pass\n";
  return 0;
}
