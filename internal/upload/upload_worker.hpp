#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace vigil::upload {

class BatchUploader;

/*
  Background worker that runs one upload pass per interval.

  One per spool directory. Stop() returns once the current pass (if any)
  finishes; files it did not reach stay spooled for the next start.
*/
class UploadWorker {
 public:
  UploadWorker(std::shared_ptr<BatchUploader> uploader, std::chrono::milliseconds interval);
  ~UploadWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<BatchUploader> uploader_;
  std::chrono::milliseconds      interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       running_{false};
};

} // namespace vigil::upload
