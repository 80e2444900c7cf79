#include "capture_service.hpp"

#include <algorithm>
#include <random>

#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace vigil::capture {

std::string_view ToString(CaptureOutcome outcome) {
  switch (outcome) {
    case CaptureOutcome::kEnqueued:
      return "enqueued";
    case CaptureOutcome::kDroppedUnresolved:
      return "unresolved";
    case CaptureOutcome::kDroppedMalformed:
      return "malformed";
    case CaptureOutcome::kDroppedExempt:
      return "exempt";
    case CaptureOutcome::kDroppedSampled:
      return "sampled";
    case CaptureOutcome::kDroppedFiltered:
      return "filtered";
    case CaptureOutcome::kDroppedOverflow:
      return "overflow";
  }
  return "unknown";
}

OverflowPolicy ToOverflowPolicy(vigil::runtime::config::DropPolicy policy) {
  return policy == vigil::runtime::config::DROP_POLICY_DROP_OLDEST ? OverflowPolicy::kDropOldest : OverflowPolicy::kDropNewest;
}

CaptureService::CaptureService(std::shared_ptr<RecordQueue> queue, std::shared_ptr<ExemptionTracker> exemptions,
                               const vigil::runtime::config::CaptureConfig& config)
    : queue_(std::move(queue)), exemptions_(std::move(exemptions)), snapshot_(BuildSnapshot(config)) {
}

std::shared_ptr<const CaptureService::Snapshot> CaptureService::BuildSnapshot(const vigil::runtime::config::CaptureConfig& config) {
  auto snapshot    = std::make_shared<Snapshot>();
  snapshot->filter = EventFilter::FromConfig(config);
  if (config.has_sample_rate()) {
    snapshot->sample_rate = std::clamp(config.sample_rate(), 0.0, 1.0);
  }
  return snapshot;
}

bool CaptureService::KeepSample(double sample_rate) {
  if (sample_rate >= 1.0) return true;
  if (sample_rate <= 0.0) return false;

  thread_local std::minstd_rand                       rng{std::random_device{}()};
  thread_local std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng) < sample_rate;
}

CaptureOutcome CaptureService::Count(CaptureOutcome outcome) {
  switch (outcome) {
    case CaptureOutcome::kEnqueued:
      enqueued_.fetch_add(1, std::memory_order_relaxed);
      return outcome;
    case CaptureOutcome::kDroppedUnresolved:
      unresolved_.fetch_add(1, std::memory_order_relaxed);
      break;
    case CaptureOutcome::kDroppedMalformed:
      malformed_.fetch_add(1, std::memory_order_relaxed);
      break;
    case CaptureOutcome::kDroppedExempt:
      exempt_.fetch_add(1, std::memory_order_relaxed);
      break;
    case CaptureOutcome::kDroppedSampled:
      sampled_.fetch_add(1, std::memory_order_relaxed);
      break;
    case CaptureOutcome::kDroppedFiltered:
      filtered_.fetch_add(1, std::memory_order_relaxed);
      break;
    case CaptureOutcome::kDroppedOverflow:
      overflow_.fetch_add(1, std::memory_order_relaxed);
      break;
  }
  observability::Metrics::Instance().RecordCaptureOutcome(ToString(outcome));
  return outcome;
}

CaptureOutcome CaptureService::Capture(model::PacketRecord&& record) {
  if (!record.HasIdentity()) {
    return Count(CaptureOutcome::kDroppedUnresolved);
  }
  if (!record.HasFiniteFields()) {
    return Count(CaptureOutcome::kDroppedMalformed);
  }

  const bool dev_marker = record.direction == model::Direction::kDev || model::IsDevMarker(record.event_type);
  if (!dev_marker) {
    const auto snapshot = snapshot_.load(std::memory_order_acquire);
    const auto now_ms   = record.timestamp_ms > 0 ? record.timestamp_ms : util::NowUnixMillis();

    if (exemptions_ && exemptions_->IsExempt(*record.entity_id, now_ms)) {
      return Count(CaptureOutcome::kDroppedExempt);
    }
    if (!KeepSample(snapshot->sample_rate)) {
      return Count(CaptureOutcome::kDroppedSampled);
    }
    if (!snapshot->filter->ShouldCapture(record.event_type)) {
      return Count(CaptureOutcome::kDroppedFiltered);
    }
  }

  if (!queue_->TryEnqueue(std::move(record))) {
    return Count(CaptureOutcome::kDroppedOverflow);
  }
  return Count(CaptureOutcome::kEnqueued);
}

CaptureStats CaptureService::Stats() const {
  CaptureStats stats;
  stats.enqueued   = enqueued_.load(std::memory_order_relaxed);
  stats.unresolved = unresolved_.load(std::memory_order_relaxed);
  stats.malformed  = malformed_.load(std::memory_order_relaxed);
  stats.exempt     = exempt_.load(std::memory_order_relaxed);
  stats.sampled    = sampled_.load(std::memory_order_relaxed);
  stats.filtered   = filtered_.load(std::memory_order_relaxed);
  // kDropOldest evictions never surface as a failed TryEnqueue
  stats.overflow = std::max<uint64_t>(overflow_.load(std::memory_order_relaxed), queue_->Dropped());
  return stats;
}

void CaptureService::Reload(const vigil::runtime::config::CaptureConfig& capture, const vigil::runtime::config::ExemptionConfig& exemptions) {
  snapshot_.store(BuildSnapshot(capture), std::memory_order_release);
  if (exemptions_) {
    exemptions_->UpdatePolicy(ExemptionPolicy::FromConfig(exemptions));
  }
}

std::shared_ptr<const EventFilter> CaptureService::Filter() const {
  return snapshot_.load(std::memory_order_acquire)->filter;
}

double CaptureService::SampleRate() const {
  return snapshot_.load(std::memory_order_acquire)->sample_rate;
}

} // namespace vigil::capture
