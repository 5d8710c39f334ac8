#include "internal/model/chunk.hpp"
#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using recsync::model::CanTransition;
using recsync::model::ChunkEntry;
using recsync::model::ChunkStatus;
using recsync::model::IsTerminal;
using recsync::model::Manifest;
using recsync::model::Summarize;

ChunkEntry Entry(uint32_t index, ChunkStatus status, int64_t size_bytes = 100) {
  ChunkEntry entry;
  entry.index      = index;
  entry.status     = status;
  entry.size_bytes = size_bytes;
  return entry;
}

void TestTransitions() {
  static_assert(CanTransition(ChunkStatus::kPending, ChunkStatus::kUploading));
  static_assert(CanTransition(ChunkStatus::kUploading, ChunkStatus::kCompleted));
  static_assert(CanTransition(ChunkStatus::kUploading, ChunkStatus::kFailed));
  static_assert(CanTransition(ChunkStatus::kUploading, ChunkStatus::kPending));
  static_assert(CanTransition(ChunkStatus::kFailed, ChunkStatus::kPending));
  static_assert(CanTransition(ChunkStatus::kFailed, ChunkStatus::kCancelled));
  static_assert(CanTransition(ChunkStatus::kPending, ChunkStatus::kCancelled));

  static_assert(!CanTransition(ChunkStatus::kPending, ChunkStatus::kCompleted));
  static_assert(!CanTransition(ChunkStatus::kCompleted, ChunkStatus::kPending));
  static_assert(!CanTransition(ChunkStatus::kCancelled, ChunkStatus::kPending));
  static_assert(!CanTransition(ChunkStatus::kUploading, ChunkStatus::kCancelled));

  static_assert(IsTerminal(ChunkStatus::kCompleted));
  static_assert(IsTerminal(ChunkStatus::kFailed));
  static_assert(IsTerminal(ChunkStatus::kCancelled));
  static_assert(!IsTerminal(ChunkStatus::kPending));
  static_assert(!IsTerminal(ChunkStatus::kUploading));
}

void TestStatusSpelling() {
  for (auto status : {ChunkStatus::kPending, ChunkStatus::kUploading, ChunkStatus::kCompleted, ChunkStatus::kFailed, ChunkStatus::kCancelled}) {
    assert(recsync::model::ParseChunkStatus(recsync::model::ToString(status)) == status);
  }
  assert(recsync::model::ToString(ChunkStatus::kCancelled) == "cancelled");

  bool threw = false;
  try {
    recsync::model::ParseChunkStatus("done");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSummaryOverallStatus() {
  Manifest manifest;
  manifest.recording_id = "rec";
  assert(Summarize(manifest).overall_status == ChunkStatus::kPending);
  assert(Summarize(manifest).Progress() == 0.0);

  manifest.chunks = {Entry(0, ChunkStatus::kCompleted), Entry(1, ChunkStatus::kCompleted, 50), Entry(2, ChunkStatus::kCancelled)};
  auto summary    = Summarize(manifest);
  assert(summary.overall_status == ChunkStatus::kCompleted);
  assert(summary.Progress() == 1.0);
  assert(summary.uploaded_bytes == 150);
  assert(summary.total_bytes == 250);

  manifest.chunks = {Entry(0, ChunkStatus::kCompleted), Entry(1, ChunkStatus::kFailed)};
  assert(Summarize(manifest).overall_status == ChunkStatus::kFailed);

  manifest.chunks = {Entry(0, ChunkStatus::kFailed), Entry(1, ChunkStatus::kUploading)};
  assert(Summarize(manifest).overall_status == ChunkStatus::kUploading);

  manifest.chunks = {Entry(0, ChunkStatus::kCompleted), Entry(1, ChunkStatus::kPending), Entry(2, ChunkStatus::kPending),
                     Entry(3, ChunkStatus::kPending)};
  summary = Summarize(manifest);
  assert(summary.overall_status == ChunkStatus::kPending);
  assert(summary.pending == 3);
  assert(summary.Progress() == 0.25);
}

void TestEntryFromMetadata() {
  recsync::model::ChunkMetadata metadata;
  metadata.recording_id     = "rec";
  metadata.index            = 4;
  metadata.file_path        = "/chunks/rec/rec_chunk_004.mp4";
  metadata.size_bytes       = 1234;
  metadata.checksum         = "abc";
  metadata.duration_seconds = 5.0;

  const auto entry = ChunkEntry::FromMetadata(metadata);
  assert(entry.index == 4);
  assert(entry.status == ChunkStatus::kPending);
  assert(entry.retry_count == 0);
  assert(!entry.remote_key);
  assert(!entry.last_attempt_at);
  assert(entry.checksum == "abc");
  assert(entry.size_bytes == 1234);
}

} // namespace

int main() {
  TestTransitions();
  TestStatusSpelling();
  TestSummaryOverallStatus();
  TestEntryFromMetadata();

  std::cout << "recsync_unit_chunk_model: pass\n";
  return 0;
}
