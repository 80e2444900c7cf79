#include "agent.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace vigil::agent {

using vigil::observability::IntField;
using vigil::observability::StringField;

namespace {

constexpr std::size_t               kDefaultQueueCapacity = 10000;
constexpr std::chrono::milliseconds kDefaultUploadTimeout{10000};
constexpr std::chrono::milliseconds kDefaultUploadInterval{5000};
constexpr std::chrono::seconds      kHousekeepingInterval{1};

} // namespace

Agent::Agent(const vigil::runtime::config::AgentConfig& config, std::shared_ptr<upload::IngestClient> client) {
  const auto& cap = config.capture();

  queue_ = std::make_shared<capture::RecordQueue>(cap.queue_capacity() > 0 ? cap.queue_capacity() : kDefaultQueueCapacity,
                                                  capture::ToOverflowPolicy(cap.drop_policy()));
  exemptions_ = std::make_shared<capture::ExemptionTracker>(capture::ExemptionPolicy::FromConfig(config.exemptions()));
  capture_    = std::make_shared<capture::CaptureService>(queue_, exemptions_, cap);
  spool_      = std::make_shared<spool::DurableSpool>(spool::DurableSpool::OptionsFromConfig(config.spool()));
  assembler_  = std::make_unique<capture::BatchAssembler>(queue_, spool_, capture::BatchAssembler::OptionsFromConfig(config));
  dev_        = std::make_shared<capture::DevSessionManager>(capture_, config.dev());

  if (!client) {
    client = upload::GrpcIngestClient::FromConfig(config.upload());
  }
  const auto timeout =
      config.upload().timeout_ms() > 0 ? std::chrono::milliseconds(config.upload().timeout_ms()) : kDefaultUploadTimeout;
  const auto interval =
      config.upload().interval_ms() > 0 ? std::chrono::milliseconds(config.upload().interval_ms()) : kDefaultUploadInterval;

  uploader_      = std::make_shared<upload::BatchUploader>(spool_, std::move(client), timeout,
                                                           config.upload().max_transient_attempts());
  upload_worker_ = std::make_unique<upload::UploadWorker>(uploader_, interval);

  VIGIL_LOG_INFO("capture agent configured",
                 {StringField("source_id", config.source_id()), StringField("session_id", config.session_id()),
                  StringField("spool_dir", spool_->Dir().string()),
                  IntField("queue_capacity", static_cast<int64_t>(queue_->Capacity()))});
}

Agent::~Agent() {
  Stop();
}

void Agent::Start() {
  if (running_.exchange(true)) return;
  assembler_->Start();
  upload_worker_->Start();
  housekeeping_ = std::thread(&Agent::Housekeeping, this);
}

void Agent::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (housekeeping_.joinable()) {
    housekeeping_.join();
  }

  assembler_->Stop();
  upload_worker_->Stop();

  const auto stats = capture_->Stats();
  VIGIL_LOG_INFO("capture agent stopped",
                 {IntField("enqueued", static_cast<int64_t>(stats.enqueued)),
                  IntField("overflow", static_cast<int64_t>(stats.overflow)),
                  IntField("malformed", static_cast<int64_t>(stats.malformed)),
                  IntField("batches_written", static_cast<int64_t>(assembler_->BatchesWritten())),
                  IntField("pending_files", static_cast<int64_t>(spool_->ListPublished().size()))});
}

void Agent::Reload(const vigil::runtime::config::AgentConfig& config) {
  capture_->Reload(config.capture(), config.exemptions());
  VIGIL_LOG_INFO("capture configuration reloaded",
                 {IntField("enabled_packets", config.capture().enabled_packets_size()),
                  IntField("disabled_packets", config.capture().disabled_packets_size())});
}

void Agent::Tick(int64_t now_ms) {
  dev_->Tick(now_ms);
  const auto swept = exemptions_->Sweep(now_ms);
  if (swept > 0) {
    VIGIL_LOG_DEBUG("idle entities swept", {IntField("count", static_cast<int64_t>(swept))});
  }
}

void Agent::Housekeeping() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, kHousekeepingInterval, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      Tick(util::NowUnixMillis());
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("agent housekeeping failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace vigil::agent
