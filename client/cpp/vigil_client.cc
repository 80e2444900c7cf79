#include "vigil_client.h"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/codec/batch_codec.hpp"
#include "internal/codec/batch_transform.hpp"

namespace vigil::client {

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), ": ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

} // namespace

ModuleCallbackClient::ModuleCallbackClient(std::shared_ptr<::grpc::Channel> channel, std::string callback_token,
                                           std::chrono::milliseconds timeout)
    : stub_(vigil::pipeline::v1::CallbackService::NewStub(std::move(channel))),
      token_(std::move(callback_token)),
      timeout_(timeout) {
}

void ModuleCallbackClient::Prepare(::grpc::ClientContext* ctx) const {
  ctx->set_deadline(std::chrono::system_clock::now() + timeout_);
  if (!token_.empty()) {
    ctx->AddMetadata("authorization", "Bearer " + token_);
  }
}

arrow::Result<std::map<std::string, vigil::pipeline::v1::PlayerStateEntry>> ModuleCallbackClient::GetStates(
    const std::string& source_id, const std::string& entity_id, const std::vector<std::string>& keys) const {
  vigil::pipeline::v1::BatchGetPlayerStatesRequest req;
  req.set_source_id(source_id);
  req.set_entity_id(entity_id);
  for (const auto& key : keys) {
    req.add_keys(key);
  }

  vigil::pipeline::v1::BatchGetPlayerStatesResponse resp;
  ::grpc::ClientContext                               ctx;
  Prepare(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->BatchGetPlayerStates(&ctx, req, &resp), "BatchGetPlayerStates"));
  return std::map<std::string, vigil::pipeline::v1::PlayerStateEntry>(resp.states().begin(), resp.states().end());
}

arrow::Result<int32_t> ModuleCallbackClient::SetStates(const std::string& source_id, const std::string& entity_id,
                                                       const std::map<std::string, google::protobuf::Value>& values) const {
  vigil::pipeline::v1::BatchSetPlayerStatesRequest req;
  req.set_source_id(source_id);
  req.set_entity_id(entity_id);
  for (const auto& [key, value] : values) {
    (*req.mutable_values())[key] = value;
  }

  vigil::pipeline::v1::BatchSetPlayerStatesResponse resp;
  ::grpc::ClientContext                               ctx;
  Prepare(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->BatchSetPlayerStates(&ctx, req, &resp), "BatchSetPlayerStates"));
  return resp.written();
}

arrow::Result<vigil::pipeline::v1::SubmitFindingsResponse> ModuleCallbackClient::SubmitFindings(
    const std::vector<vigil::pipeline::v1::Finding>& findings) const {
  vigil::pipeline::v1::SubmitFindingsRequest req;
  for (const auto& finding : findings) {
    *req.add_findings() = finding;
  }

  vigil::pipeline::v1::SubmitFindingsResponse resp;
  ::grpc::ClientContext                         ctx;
  Prepare(&ctx);

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->SubmitFindings(&ctx, req, &resp), "SubmitFindings"));
  return resp;
}

arrow::Result<BatchView> ReadBatch(const vigil::pipeline::v1::AnalyzeRequest& request) {
  if (!request.transform().empty() && request.transform() != vigil::codec::ToString(vigil::codec::BatchTransform::kRaw)) {
    return arrow::Status::Invalid("ReadBatch: payload is a ", request.transform(), " view");
  }
  try {
    auto decoded = vigil::codec::DecodeBatch(request.payload());
    return BatchView{std::move(decoded.header), std::move(decoded.events)};
  } catch (const std::exception& e) {
    return arrow::Status::Invalid("ReadBatch: ", e.what());
  }
}

arrow::Result<DerivedView<vigil::pipeline::v1::MovementEvent>> ReadMovementEvents(
    const vigil::pipeline::v1::AnalyzeRequest& request) {
  try {
    auto decoded = vigil::codec::DecodeMovementEvents(request.payload());
    return DerivedView<vigil::pipeline::v1::MovementEvent>{std::move(decoded.header), std::move(decoded.events)};
  } catch (const std::exception& e) {
    return arrow::Status::Invalid("ReadMovementEvents: ", e.what());
  }
}

arrow::Result<DerivedView<vigil::pipeline::v1::CombatEvent>> ReadCombatEvents(
    const vigil::pipeline::v1::AnalyzeRequest& request) {
  try {
    auto decoded = vigil::codec::DecodeCombatEvents(request.payload());
    return DerivedView<vigil::pipeline::v1::CombatEvent>{std::move(decoded.header), std::move(decoded.events)};
  } catch (const std::exception& e) {
    return arrow::Status::Invalid("ReadCombatEvents: ", e.what());
  }
}

} // namespace vigil::client
