#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/capture/bounded_event_queue.hpp"
#include "internal/db/model/finding_record.hpp"
#include "vigil/pipeline/v1/findings_subscriber.grpc.pb.h"

namespace vigil::runtime::config {
class FindingsConfig;
}

namespace vigil::findings {

struct SubscriberSpec {
  std::string name;
  std::string endpoint;
  std::string token;
  // empty forwards every severity
  std::set<vigil::pipeline::v1::Severity> severities;
  std::chrono::milliseconds               timeout{3000};

  bool Wants(vigil::pipeline::v1::Severity severity) const {
    return severities.empty() || severities.count(severity) > 0;
  }
};

// Throws util::InvalidArgument on duplicate names, missing endpoints or
// unknown severity names.
std::vector<SubscriberSpec> SubscribersFromConfig(const vigil::runtime::config::FindingsConfig& config);

class FindingsNotifier {
 public:
  virtual ~FindingsNotifier() = default;

  virtual ::grpc::Status Notify(const vigil::pipeline::v1::NotifyFindingRequest& req,
                                std::chrono::milliseconds timeout) = 0;
};

using NotifierFactory = std::function<std::shared_ptr<FindingsNotifier>(const SubscriberSpec&)>;

class GrpcFindingsNotifier final : public FindingsNotifier {
 public:
  GrpcFindingsNotifier(std::shared_ptr<::grpc::Channel> channel, std::string token);

  ::grpc::Status Notify(const vigil::pipeline::v1::NotifyFindingRequest& req,
                        std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<vigil::pipeline::v1::FindingsSubscriberService::Stub> stub_;
  std::string                                                          token_;
};

// Insecure channel per subscriber endpoint, authenticated with its token.
NotifierFactory GrpcNotifierFactory();

vigil::pipeline::v1::Finding ToProto(const db::model::FindingRecord& record);

struct ForwarderStats {
  uint64_t queued    = 0;
  uint64_t delivered = 0;
  uint64_t failed    = 0;
  uint64_t dropped   = 0;
};

/*
  Pushes newly stored findings to external subscribers.

  Each subscriber has its own bounded queue and worker, so a slow or dead
  subscriber only loses its own notifications. Forward() never blocks;
  when a queue is full the notification is dropped and counted. Delivery
  is attempted once.
*/
class FindingsForwarder {
 public:
  struct Options {
    std::size_t queue_capacity = 256;
  };

  FindingsForwarder(std::vector<SubscriberSpec> subscribers, NotifierFactory factory, Options options);
  ~FindingsForwarder();

  FindingsForwarder(const FindingsForwarder&)            = delete;
  FindingsForwarder& operator=(const FindingsForwarder&) = delete;

  void Start();
  // Delivers what is already queued, then joins.
  void Stop();

  void Forward(const db::model::FindingRecord& finding);

  ForwarderStats Stats() const;

 private:
  struct Subscriber {
    SubscriberSpec                                                   spec;
    std::shared_ptr<FindingsNotifier>                                notifier;
    capture::BoundedEventQueue<vigil::pipeline::v1::NotifyFindingRequest> queue;
    std::thread                                                      thread;

    Subscriber(SubscriberSpec s, std::shared_ptr<FindingsNotifier> n, std::size_t capacity)
        : spec(std::move(s)), notifier(std::move(n)), queue(capacity, capture::OverflowPolicy::kDropNewest) {
    }
  };

  void Run(Subscriber& subscriber);

  std::vector<std::unique_ptr<Subscriber>> subscribers_;
  std::atomic<bool>                        started_{false};
  std::atomic<uint64_t>                    queued_{0};
  std::atomic<uint64_t>                    delivered_{0};
  std::atomic<uint64_t>                    failed_{0};
  std::atomic<uint64_t>                    dropped_{0};
};

} // namespace vigil::findings
