#include "module_lane.hpp"

#include "internal/observability/logging.hpp"

namespace vigil::dispatch {

namespace {

constexpr std::chrono::milliseconds kPollInterval{200};

} // namespace

ModuleLane::ModuleLane(ModuleSpec spec, std::shared_ptr<ModuleClient> client, std::size_t capacity,
                       LaneCompletion on_done)
    : spec_(std::move(spec)),
      client_(std::move(client)),
      queue_(capacity, capture::OverflowPolicy::kDropNewest),
      on_done_(std::move(on_done)) {
}

ModuleLane::~ModuleLane() {
  Stop();
}

void ModuleLane::Start() {
  if (started_.exchange(true)) return;
  thread_ = std::thread(&ModuleLane::Run, this);
}

void ModuleLane::Stop() {
  queue_.Shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ModuleLane::TrySubmit(DispatchJob job) {
  return queue_.TryEnqueue(std::move(job));
}

void ModuleLane::Run() {
  for (;;) {
    auto jobs = queue_.DrainBatch(1, kPollInterval);
    if (jobs.empty()) {
      if (queue_.IsShutdown()) break;
      continue;
    }

    for (const auto& job : jobs) {
      vigil::pipeline::v1::AnalyzeResponse resp;
      ::grpc::Status                       status;
      try {
        status = client_->Analyze(job.request, &resp, spec_.timeout);
      } catch (const std::exception& e) {
        status = ::grpc::Status(::grpc::StatusCode::INTERNAL, e.what());
      }

      if (status.ok()) {
        VIGIL_LOG_DEBUG("module analyzed batch",
                        {observability::StringField("module", spec_.name),
                         observability::StringField("storage_key", job.storage_key),
                         observability::IntField("findings_emitted", resp.findings_emitted())});
      }
      on_done_(spec_, job, status);
    }
  }
}

} // namespace vigil::dispatch
