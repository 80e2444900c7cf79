#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/capture/capture_service.hpp"

namespace vigil::spool {
class DurableSpool;
}

namespace vigil::capture {

/*
  Dedicated thread: drain queue -> spool.

  One per capture process. Stop() shuts the queue down, writes whatever
  is left as a final batch and joins; a spool write is never interrupted.
*/
class BatchAssembler {
 public:
  struct Options {
    std::string               source_id;
    std::string               session_id;
    std::size_t               max_batch_size = 500;
    std::chrono::milliseconds flush_interval{1000};
  };

  static Options OptionsFromConfig(const vigil::runtime::config::AgentConfig& config);

  BatchAssembler(std::shared_ptr<RecordQueue> queue, std::shared_ptr<spool::DurableSpool> spool, Options options);
  ~BatchAssembler();

  void Start();
  void Stop();

  // One drain + write cycle on the caller's thread; returns records written.
  std::size_t FlushOnce();

  uint64_t BatchesWritten() const {
    return batches_written_.load();
  }
  uint64_t BatchesFailed() const {
    return batches_failed_.load();
  }

 private:
  void        Run();
  std::size_t Write(std::vector<model::PacketRecord> records);

  std::shared_ptr<RecordQueue>         queue_;
  std::shared_ptr<spool::DurableSpool> spool_;
  Options                              options_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> batches_written_{0};
  std::atomic<uint64_t> batches_failed_{0};
};

} // namespace vigil::capture
