#include <grpcpp/create_channel.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/security/credentials.h>

#include <csignal>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "client/cpp/vigil_client.h"
#include "internal/model/event_category.hpp"
#include "vigil/pipeline/v1.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

constexpr const char* kModuleName = "reference-burst";
constexpr const char* kStateKey   = "reference.movement_total";

// Counts movement packets per entity and reports any entity that sends more
// than `threshold` of them inside one batch. The running total is kept in
// shared player state so it survives module restarts.
class BurstModule final : public vigil::pipeline::v1::DetectionModuleService::Service {
 public:
  BurstModule(std::shared_ptr<vigil::client::ModuleCallbackClient> callbacks, std::string module_token, int64_t threshold)
      : callbacks_(std::move(callbacks)), token_(std::move(module_token)), threshold_(threshold) {
  }

  grpc::Status Analyze(grpc::ServerContext* ctx, const vigil::pipeline::v1::AnalyzeRequest* req,
                       vigil::pipeline::v1::AnalyzeResponse* resp) override {
    if (!token_.empty()) {
      auto it = ctx->client_metadata().find("authorization");
      if (it == ctx->client_metadata().end() || std::string(it->second.data(), it->second.size()) != "Bearer " + token_) {
        return {grpc::StatusCode::UNAUTHENTICATED, "bad module token"};
      }
    }

    auto batch = vigil::client::ReadBatch(*req);
    if (!batch.ok()) {
      return {grpc::StatusCode::INVALID_ARGUMENT, batch.status().ToString()};
    }

    struct Tally {
      int64_t count   = 0;
      int64_t last_ts = 0;
    };
    std::map<std::string, Tally> per_entity;
    for (const auto& event : batch->events) {
      if (vigil::model::CategorizeEventType(event.pkt()) != vigil::model::EventCategory::kMovement) {
        continue;
      }
      auto& t = per_entity[event.uuid()];
      ++t.count;
      t.last_ts = std::max(t.last_ts, event.ts());
    }

    std::vector<vigil::pipeline::v1::Finding> findings;
    for (const auto& [entity, tally] : per_entity) {
      auto previous = callbacks_->GetStates(req->source_id(), entity, {kStateKey});
      if (!previous.ok()) {
        return {grpc::StatusCode::UNAVAILABLE, previous.status().ToString()};
      }

      double total = tally.count;
      if (auto it = previous->find(kStateKey); it != previous->end() && it->second.value().has_number_value()) {
        total += it->second.value().number_value();
      }

      google::protobuf::Value v;
      v.set_number_value(total);
      auto written = callbacks_->SetStates(req->source_id(), entity, {{kStateKey, v}});
      if (!written.ok()) {
        return {grpc::StatusCode::UNAVAILABLE, written.status().ToString()};
      }

      if (tally.count <= threshold_) {
        continue;
      }

      vigil::pipeline::v1::Finding f;
      f.set_module(kModuleName);
      f.set_entity_id(entity);
      f.set_check("movement_burst");
      f.set_severity(vigil::pipeline::v1::SEVERITY_MEDIUM);
      f.set_confidence(std::min(1.0, static_cast<double>(tally.count) / static_cast<double>(2 * threshold_)));
      f.set_timestamp_ms(tally.last_ts);
      f.set_source_id(req->source_id());
      f.set_session_id(req->session_id());
      f.set_batch_id(req->batch_id());
      f.set_title("Movement burst");
      f.set_description("movement packets in one batch exceed the configured threshold");
      (*f.mutable_evidence()->mutable_fields())["count"].set_number_value(static_cast<double>(tally.count));
      (*f.mutable_evidence()->mutable_fields())["threshold"].set_number_value(static_cast<double>(threshold_));
      findings.push_back(std::move(f));
    }

    if (!findings.empty()) {
      auto submitted = callbacks_->SubmitFindings(findings);
      if (!submitted.ok()) {
        return {grpc::StatusCode::UNAVAILABLE, submitted.status().ToString()};
      }
    }

    resp->set_findings_emitted(static_cast<int32_t>(findings.size()));
    return grpc::Status::OK;
  }

 private:
  std::shared_ptr<vigil::client::ModuleCallbackClient> callbacks_;
  std::string                                          token_;
  int64_t                                              threshold_;
};

} // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: vigil-reference-module <listen_addr> <backend_addr> <callback_token> [module_token] [threshold]\n";
    return 1;
  }

  const std::string listen_addr  = argv[1];
  const std::string backend_addr = argv[2];
  const std::string module_token = argc > 4 ? argv[4] : "";
  const int64_t     threshold    = argc > 5 ? std::stoll(argv[5]) : 40;

  auto callbacks = std::make_shared<vigil::client::ModuleCallbackClient>(
      grpc::CreateChannel(backend_addr, grpc::InsecureChannelCredentials()), argv[3]);

  BurstModule module(callbacks, module_token, threshold);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_addr, grpc::InsecureServerCredentials());
  builder.RegisterService(&module);
  auto server = builder.BuildAndStart();
  if (!server) {
    std::cerr << "failed to listen on " << listen_addr << '\n';
    return 1;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  std::cout << kModuleName << " listening on " << listen_addr << '\n';

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  server->Shutdown();
  return 0;
}
