#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "upload_task.hpp"

namespace recsync::upload {

/*
  Thread-safe blocking queue between the scanner and the upload workers.
*/
class UploadQueue {
 public:
  void Enqueue(UploadTask task);

  // blocking wait; nullopt once shut down and empty
  std::optional<UploadTask> Dequeue();

  // Removes every task no worker picked up yet.
  std::vector<UploadTask> Drain();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<UploadTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace recsync::upload
