#include "batch_assembler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/spool/durable_spool.hpp"
#include "internal/util/time.hpp"

namespace vigil::capture {

BatchAssembler::Options BatchAssembler::OptionsFromConfig(const vigil::runtime::config::AgentConfig& config) {
  Options options;
  options.source_id  = config.source_id();
  options.session_id = config.session_id();
  if (config.capture().max_batch_size() > 0) options.max_batch_size = config.capture().max_batch_size();
  if (config.capture().flush_interval_ms() > 0) options.flush_interval = std::chrono::milliseconds(config.capture().flush_interval_ms());
  return options;
}

BatchAssembler::BatchAssembler(std::shared_ptr<RecordQueue> queue, std::shared_ptr<spool::DurableSpool> spool, Options options)
    : queue_(std::move(queue)), spool_(std::move(spool)), options_(std::move(options)) {
}

BatchAssembler::~BatchAssembler() {
  Stop();
}

void BatchAssembler::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&BatchAssembler::Run, this);
}

void BatchAssembler::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

std::size_t BatchAssembler::FlushOnce() {
  return Write(queue_->DrainBatch(options_.max_batch_size, std::chrono::milliseconds(0)));
}

void BatchAssembler::Run() {
  for (;;) {
    auto records = queue_->DrainBatch(options_.max_batch_size, options_.flush_interval);
    if (!records.empty()) {
      Write(std::move(records));
      continue;
    }
    if (queue_->IsShutdown()) {
      break;
    }
  }
}

std::size_t BatchAssembler::Write(std::vector<model::PacketRecord> records) {
  if (records.empty()) return 0;

  model::PacketBatch batch;
  batch.source_id     = options_.source_id;
  batch.session_id    = options_.session_id;
  batch.created_at_ms = util::NowUnixMillis();
  batch.records       = std::move(records);

  const auto count  = batch.records.size();
  auto       handle = spool_->WriteBatch(batch);
  if (!handle) {
    ++batches_failed_;
    VIGIL_LOG_ERROR("Dropped batch after spool failure", {observability::IntField("records", static_cast<int64_t>(count))});
    return 0;
  }

  ++batches_written_;
  return count;
}

} // namespace vigil::capture
