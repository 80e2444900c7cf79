#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/findings/findings_forwarder.hpp"
#include "internal/findings/findings_sink.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using vigil::db::model::FindingRecord;
using vigil::findings::FindingsForwarder;
using vigil::findings::FindingsNotifier;
using vigil::findings::FindingsSink;
using vigil::findings::SubscriberSpec;
using vigil::pipeline::v1::NotifyFindingRequest;

class FakeNotifier final : public FindingsNotifier {
 public:
  ::grpc::Status Notify(const NotifyFindingRequest& req, std::chrono::milliseconds) override {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return !blocked_; });
    received_.push_back(req);
    if (fail_) {
      return ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "subscriber down");
    }
    return ::grpc::Status::OK;
  }

  void Block(bool blocked) {
    {
      std::lock_guard lock(mutex_);
      blocked_ = blocked;
    }
    cv_.notify_all();
  }

  void Fail() {
    std::lock_guard lock(mutex_);
    fail_ = true;
  }

  std::vector<NotifyFindingRequest> Received() const {
    std::lock_guard lock(mutex_);
    return received_;
  }

 private:
  mutable std::mutex                mutex_;
  std::condition_variable           cv_;
  bool                              blocked_ = false;
  bool                              fail_    = false;
  std::vector<NotifyFindingRequest> received_;
};

SubscriberSpec Subscriber(const std::string& name, std::set<vigil::pipeline::v1::Severity> severities = {}) {
  SubscriberSpec spec;
  spec.name       = name;
  spec.endpoint   = "inproc://" + name;
  spec.severities = std::move(severities);
  return spec;
}

struct Fixture {
  std::map<std::string, std::shared_ptr<FakeNotifier>> fakes;
  std::shared_ptr<FindingsForwarder>                   forwarder;

  Fixture(std::vector<SubscriberSpec> subscribers, std::size_t capacity = 16) {
    for (const auto& s : subscribers) {
      fakes[s.name] = std::make_shared<FakeNotifier>();
    }
    forwarder = std::make_shared<FindingsForwarder>(
        std::move(subscribers), [this](const SubscriberSpec& spec) { return fakes.at(spec.name); },
        FindingsForwarder::Options{capacity});
    forwarder->Start();
  }

  std::vector<NotifyFindingRequest> WaitFor(const std::string& subscriber, std::size_t n) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    auto       got      = fakes.at(subscriber)->Received();
    while (got.size() < n && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
      got = fakes.at(subscriber)->Received();
    }
    return got;
  }
};

FindingRecord MakeFinding(int64_t ts, vigil::pipeline::v1::Severity severity) {
  FindingRecord f;
  f.module       = "combat";
  f.entity_id    = "8f14e45f-ceea-467a-9af0-0000000000aa";
  f.check        = "reach";
  f.severity     = severity;
  f.confidence   = 0.9;
  f.timestamp_ms = ts;
  f.evidence     = R"({"distance":4.2})";
  return f;
}

void TestSubscribersFromConfig() {
  vigil::runtime::config::FindingsConfig config;
  auto*                                  s = config.add_subscribers();
  s->set_name("alerts");
  s->set_endpoint("localhost:9100");
  s->set_token("t");
  s->add_severities("high");
  s->add_severities(" SEVERITY_CRITICAL ");
  s->set_timeout_ms(500);
  auto* all = config.add_subscribers();
  all->set_name("archive");
  all->set_endpoint("localhost:9101");

  auto specs = vigil::findings::SubscribersFromConfig(config);
  assert(specs.size() == 2);
  assert(specs[0].severities.size() == 2);
  assert(specs[0].Wants(vigil::pipeline::v1::SEVERITY_CRITICAL));
  assert(!specs[0].Wants(vigil::pipeline::v1::SEVERITY_LOW));
  assert(specs[0].timeout == 500ms);
  assert(specs[1].Wants(vigil::pipeline::v1::SEVERITY_INFO));
  assert(specs[1].timeout == 3000ms);

  s->add_severities("urgent");
  bool threw = false;
  try {
    vigil::findings::SubscribersFromConfig(config);
  } catch (const vigil::util::InvalidArgument& e) {
    threw = std::string(e.what()).find("urgent") != std::string::npos;
  }
  assert(threw);

  vigil::runtime::config::FindingsConfig dup;
  dup.add_subscribers()->set_name("a");
  dup.mutable_subscribers(0)->set_endpoint("x:1");
  *dup.add_subscribers() = dup.subscribers(0);
  threw = false;
  try {
    vigil::findings::SubscribersFromConfig(dup);
  } catch (const vigil::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSinkForwardsNewFindingsBySeverity() {
  Fixture f({Subscriber("alerts", {vigil::pipeline::v1::SEVERITY_HIGH}), Subscriber("archive")});
  FindingsSink sink(std::make_shared<vigil::db::memory::MemoryRepository>(), f.forwarder);

  auto result = sink.Submit({MakeFinding(1000, vigil::pipeline::v1::SEVERITY_HIGH),
                             MakeFinding(2000, vigil::pipeline::v1::SEVERITY_LOW)},
                            5000);
  assert(result.accepted == 2);

  // a replay is stored nowhere and forwarded nowhere
  assert(sink.Submit({MakeFinding(1000, vigil::pipeline::v1::SEVERITY_HIGH)}, 6000).duplicates == 1);

  auto archive = f.WaitFor("archive", 2);
  auto alerts  = f.WaitFor("alerts", 1);
  f.forwarder->Stop();

  assert(archive.size() == 2);
  assert(alerts.size() == 1);
  assert(alerts[0].subscriber() == "alerts");
  assert(alerts[0].finding().timestamp_ms() == 1000);
  assert(alerts[0].finding().evidence().fields().at("distance").number_value() == 4.2);

  auto stats = f.forwarder->Stats();
  assert(stats.queued == 3);
  assert(stats.delivered == 3);
  assert(stats.dropped == 0);
}

void TestStalledSubscriberOnlyLosesItsOwn() {
  Fixture f({Subscriber("stalled"), Subscriber("healthy")}, 1);
  f.fakes["stalled"]->Block(true);

  for (int64_t ts = 1; ts <= 5; ++ts) {
    f.forwarder->Forward(MakeFinding(ts, vigil::pipeline::v1::SEVERITY_MEDIUM));
    // let the healthy worker keep its queue empty
    f.WaitFor("healthy", static_cast<std::size_t>(ts));
  }

  assert(f.fakes["healthy"]->Received().size() == 5);
  assert(f.forwarder->Stats().dropped >= 3);

  f.fakes["stalled"]->Block(false);
  f.forwarder->Stop();
  assert(f.fakes["stalled"]->Received().size() <= 2);
}

void TestFailedDeliveryIsCounted() {
  Fixture f({Subscriber("down")});
  f.fakes["down"]->Fail();
  f.forwarder->Forward(MakeFinding(1, vigil::pipeline::v1::SEVERITY_INFO));
  f.WaitFor("down", 1);
  f.forwarder->Stop();
  assert(f.forwarder->Stats().failed == 1);
  assert(f.forwarder->Stats().delivered == 0);
}

} // namespace

int main() {
  TestSubscribersFromConfig();
  TestSinkForwardsNewFindingsBySeverity();
  TestStalledSubscriberOnlyLosesItsOwn();
  TestFailedDeliveryIsCounted();
  std::cout << "vigil_findings_forwarder_test: pass\n";
  return 0;
}
