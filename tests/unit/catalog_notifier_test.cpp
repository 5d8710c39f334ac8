#include "internal/catalog/outbox_catalog_notifier.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "internal/util/time.hpp"
#include "tests/support/temp_dir.hpp"

namespace {

using recsync::uploader::v1::ChunkEvent;

ChunkEvent Event(uint32_t index, const std::string& status) {
  ChunkEvent event;
  event.set_recording_id("rec-1");
  event.set_chunk_index(index);
  event.set_status(status);
  if (status == "completed") {
    event.set_remote_key("raw-chunks/rec-1/chunk-" + std::to_string(index) + ".mp4");
    event.set_integrity_tag("abc");
  }
  if (status == "failed") event.set_error("network failure");
  *event.mutable_emitted_at() = recsync::util::ToProto(recsync::util::Now());
  return event;
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream            in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

void TestEventsAppendAsJsonLines() {
  recsync::testing::TempDir dir("outbox_lines");
  const auto                path = dir.path() / "nested" / "outbox.jsonl";

  recsync::catalog::OutboxCatalogNotifier notifier(path);
  notifier.Notify(Event(0, "completed"));
  notifier.Notify(Event(1, "failed"));

  const auto lines = ReadLines(path);
  assert(lines.size() == 2);
  assert(lines[0].find("\"recording_id\"") != std::string::npos);
  assert(lines[1].find("\"error\":\"network failure\"") != std::string::npos);

  ChunkEvent parsed;
  assert(google::protobuf::util::JsonStringToMessage(lines[0], &parsed).ok());
  assert(parsed.chunk_index() == 0);
  assert(parsed.status() == "completed");
  assert(parsed.has_remote_key());
  assert(!parsed.has_error());
}

void TestReopenAppends() {
  recsync::testing::TempDir dir("outbox_reopen");
  const auto                path = dir.path() / "outbox.jsonl";

  recsync::catalog::OutboxCatalogNotifier(path).Notify(Event(0, "cancelled"));
  recsync::catalog::OutboxCatalogNotifier(path).Notify(Event(1, "cancelled"));
  assert(ReadLines(path).size() == 2);
}

void TestConcurrentNotifyKeepsLinesWhole() {
  recsync::testing::TempDir               dir("outbox_concurrent");
  const auto                              path = dir.path() / "outbox.jsonl";
  recsync::catalog::OutboxCatalogNotifier notifier(path);

  std::vector<std::thread> threads;
  for (uint32_t t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (uint32_t i = 0; i < 25; ++i) notifier.Notify(Event(t * 100 + i, "completed"));
    });
  }
  for (auto& thread : threads) thread.join();

  const auto lines = ReadLines(path);
  assert(lines.size() == 100);
  for (const auto& line : lines) {
    ChunkEvent parsed;
    assert(google::protobuf::util::JsonStringToMessage(line, &parsed).ok());
  }
}

void TestUnwritablePathThrows() {
  recsync::testing::TempDir dir("outbox_unwritable");
  // a directory where the file should be
  std::filesystem::create_directories(dir.path() / "outbox.jsonl");

  bool threw = false;
  try {
    recsync::catalog::OutboxCatalogNotifier notifier(dir.path() / "outbox.jsonl");
    notifier.Notify(Event(0, "completed"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEventsAppendAsJsonLines();
  TestReopenAppends();
  TestConcurrentNotifyKeepsLinesWhole();
  TestUnwritablePathThrows();

  std::cout << "recsync_unit_catalog_notifier: pass\n";
  return 0;
}
