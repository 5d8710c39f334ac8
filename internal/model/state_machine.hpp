#pragma once

#include "chunk.hpp"

namespace recsync::model {

constexpr bool IsTerminal(ChunkStatus status) {
  return status == ChunkStatus::kCompleted || status == ChunkStatus::kFailed || status == ChunkStatus::kCancelled;
}

/*
  Allowed chunk transitions:

    pending   → uploading            (claimed by scheduler)
    pending   → cancelled            (operator)
    uploading → completed | failed   (transfer outcome)
    uploading → pending              (retry, stop before transfer, crash reconcile)
    failed    → pending              (explicit resubmit)
    failed    → cancelled            (operator)
*/
constexpr bool CanTransition(ChunkStatus from, ChunkStatus to) {
  if (from == to) {
    return true;
  }

  switch (from) {
    case ChunkStatus::kPending:
      return to == ChunkStatus::kUploading || to == ChunkStatus::kCancelled;
    case ChunkStatus::kUploading:
      return to == ChunkStatus::kCompleted || to == ChunkStatus::kFailed || to == ChunkStatus::kPending;
    case ChunkStatus::kFailed:
      return to == ChunkStatus::kPending || to == ChunkStatus::kCancelled;
    case ChunkStatus::kCompleted:
    case ChunkStatus::kCancelled:
      return false;
  }
  return false;
}

} // namespace recsync::model
