#include "upload_queue.hpp"

namespace recsync::upload {

void UploadQueue::Enqueue(UploadTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::optional<UploadTask> UploadQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  UploadTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

std::vector<UploadTask> UploadQueue::Drain() {
  std::lock_guard         lock(mutex_);
  std::vector<UploadTask> drained(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return drained;
}

void UploadQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace recsync::upload
