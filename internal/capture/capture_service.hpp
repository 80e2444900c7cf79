#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include "config/config.pb.h"
#include "internal/capture/bounded_event_queue.hpp"
#include "internal/capture/event_filter.hpp"
#include "internal/capture/exemption_tracker.hpp"
#include "internal/model/packet_record.hpp"

namespace vigil::capture {

using RecordQueue = BoundedEventQueue<model::PacketRecord>;

enum class CaptureOutcome {
  kEnqueued,
  kDroppedUnresolved,
  kDroppedMalformed,
  kDroppedExempt,
  kDroppedSampled,
  kDroppedFiltered,
  kDroppedOverflow,
};

std::string_view ToString(CaptureOutcome outcome);

struct CaptureStats {
  uint64_t enqueued   = 0;
  uint64_t unresolved = 0;
  uint64_t malformed  = 0;
  uint64_t exempt     = 0;
  uint64_t sampled    = 0;
  uint64_t filtered   = 0;
  uint64_t overflow   = 0;
};

OverflowPolicy ToOverflowPolicy(vigil::runtime::config::DropPolicy policy);

/*
  Capture hook entry point.

  Checks run in a fixed order and the first failing one decides the
  outcome:

      identity -> finite fields -> dev marker bypass -> exemption -> sampling -> filter -> enqueue

  Called from arbitrary capture threads. Nothing here blocks on I/O and
  no outcome is logged; callers read Stats() instead.
*/

class CaptureService {
 public:
  CaptureService(std::shared_ptr<RecordQueue> queue, std::shared_ptr<ExemptionTracker> exemptions,
                 const vigil::runtime::config::CaptureConfig& config);

  CaptureOutcome Capture(model::PacketRecord&& record);

  CaptureStats Stats() const;

  // Swaps filter, sample rate and exemption policy; in-flight captures finish on the old snapshot.
  void Reload(const vigil::runtime::config::CaptureConfig& capture, const vigil::runtime::config::ExemptionConfig& exemptions);

  std::shared_ptr<const EventFilter> Filter() const;

  double SampleRate() const;

  const std::shared_ptr<RecordQueue>& Queue() const {
    return queue_;
  }

 private:
  struct Snapshot {
    std::shared_ptr<const EventFilter> filter;
    double                             sample_rate = 1.0;
  };

  static std::shared_ptr<const Snapshot> BuildSnapshot(const vigil::runtime::config::CaptureConfig& config);

  static bool KeepSample(double sample_rate);

  CaptureOutcome Count(CaptureOutcome outcome);

  std::shared_ptr<RecordQueue>                 queue_;
  std::shared_ptr<ExemptionTracker>            exemptions_;
  std::atomic<std::shared_ptr<const Snapshot>> snapshot_;

  std::atomic<uint64_t> enqueued_{0};
  std::atomic<uint64_t> unresolved_{0};
  std::atomic<uint64_t> malformed_{0};
  std::atomic<uint64_t> exempt_{0};
  std::atomic<uint64_t> sampled_{0};
  std::atomic<uint64_t> filtered_{0};
  std::atomic<uint64_t> overflow_{0};
};

} // namespace vigil::capture
