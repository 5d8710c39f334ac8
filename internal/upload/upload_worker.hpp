#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "upload_queue.hpp"

namespace recsync::upload {

/*
  Background worker that performs uploads.

  Executes:
      claimed entry → transfer → manifest outcome
*/
class UploadWorker {
 public:
  using Handler = std::function<void(const UploadTask&)>;

  UploadWorker(std::shared_ptr<UploadQueue> queue, Handler handler);
  ~UploadWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<UploadQueue> queue_;
  Handler                      handler_;

  std::thread thread_;
};

} // namespace recsync::upload
