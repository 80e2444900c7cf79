#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "vigil/pipeline/v1/batch.pb.h"
#include "vigil/pipeline/v1/callback_service.grpc.pb.h"
#include "vigil/pipeline/v1/module_service.pb.h"

namespace vigil::client {

/*
  SDK for detection modules calling back into the backend.

  Every call carries the module callback token and a deadline. Transport
  failures come back as arrow::Status, never as exceptions.
*/
class ModuleCallbackClient {
 public:
  ModuleCallbackClient(std::shared_ptr<::grpc::Channel> channel, std::string callback_token,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  arrow::Result<std::map<std::string, vigil::pipeline::v1::PlayerStateEntry>> GetStates(
      const std::string& source_id, const std::string& entity_id, const std::vector<std::string>& keys) const;

  arrow::Result<int32_t> SetStates(const std::string& source_id, const std::string& entity_id,
                                   const std::map<std::string, google::protobuf::Value>& values) const;

  arrow::Result<vigil::pipeline::v1::SubmitFindingsResponse> SubmitFindings(
      const std::vector<vigil::pipeline::v1::Finding>& findings) const;

 private:
  std::unique_ptr<vigil::pipeline::v1::CallbackService::Stub> stub_;
  std::string                                                 token_;
  std::chrono::milliseconds                                   timeout_;

  void Prepare(::grpc::ClientContext* ctx) const;
};

struct BatchView {
  vigil::pipeline::v1::BatchHeader              header;
  std::vector<vigil::pipeline::v1::PacketEvent> events;
};

template <typename Event>
struct DerivedView {
  vigil::pipeline::v1::BatchHeader header;
  std::vector<Event>               events;
};

// Decodes the gzip NDJSON payload carried by an Analyze call. Each reader
// accepts only the view named in request.transform.
arrow::Result<BatchView> ReadBatch(const vigil::pipeline::v1::AnalyzeRequest& request);
arrow::Result<DerivedView<vigil::pipeline::v1::MovementEvent>> ReadMovementEvents(
    const vigil::pipeline::v1::AnalyzeRequest& request);
arrow::Result<DerivedView<vigil::pipeline::v1::CombatEvent>> ReadCombatEvents(
    const vigil::pipeline::v1::AnalyzeRequest& request);

} // namespace vigil::client
