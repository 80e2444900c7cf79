#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "config/config.pb.h"
#include "internal/capture/batch_assembler.hpp"
#include "internal/capture/capture_service.hpp"
#include "internal/capture/dev_session_manager.hpp"
#include "internal/capture/exemption_tracker.hpp"
#include "internal/spool/durable_spool.hpp"
#include "internal/upload/batch_uploader.hpp"
#include "internal/upload/ingest_client.hpp"
#include "internal/upload/upload_worker.hpp"

namespace vigil::agent {

/*
  Capture agent composition root.

      capture -> queue -> BatchAssembler -> spool -> UploadWorker -> backend

  A housekeeping thread ticks dev sessions and sweeps idle exemption
  state once per second. Stop() flushes the last batch before the
  uploader goes away.
*/
class Agent {
 public:
  // client defaults to a gRPC client built from config.upload()
  explicit Agent(const vigil::runtime::config::AgentConfig& config, std::shared_ptr<upload::IngestClient> client = nullptr);
  ~Agent();

  Agent(const Agent&)            = delete;
  Agent& operator=(const Agent&) = delete;

  void Start();
  void Stop();

  // Swaps filter, sampling and exemption policy. Spool, upload and
  // queue settings only take effect on restart.
  void Reload(const vigil::runtime::config::AgentConfig& config);

  // One housekeeping step; normally driven by the internal thread.
  void Tick(int64_t now_ms);

  capture::CaptureService& Capture() {
    return *capture_;
  }
  capture::ExemptionTracker& Exemptions() {
    return *exemptions_;
  }
  capture::DevSessionManager& Dev() {
    return *dev_;
  }
  capture::BatchAssembler& Assembler() {
    return *assembler_;
  }
  spool::DurableSpool& Spool() {
    return *spool_;
  }
  upload::BatchUploader& Uploader() {
    return *uploader_;
  }

 private:
  void Housekeeping();

  std::shared_ptr<capture::RecordQueue>         queue_;
  std::shared_ptr<capture::ExemptionTracker>    exemptions_;
  std::shared_ptr<capture::CaptureService>      capture_;
  std::shared_ptr<spool::DurableSpool>          spool_;
  std::unique_ptr<capture::BatchAssembler>      assembler_;
  std::shared_ptr<capture::DevSessionManager>   dev_;
  std::shared_ptr<upload::BatchUploader>        uploader_;
  std::unique_ptr<upload::UploadWorker>         upload_worker_;

  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             housekeeping_;
};

} // namespace vigil::agent
