#include "module_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "module_registry.hpp"

namespace vigil::dispatch {

GrpcModuleClient::GrpcModuleClient(std::shared_ptr<::grpc::Channel> channel, std::string token)
    : stub_(vigil::pipeline::v1::DetectionModuleService::NewStub(std::move(channel))), token_(std::move(token)) {
}

::grpc::Status GrpcModuleClient::Analyze(const vigil::pipeline::v1::AnalyzeRequest& req,
                                         vigil::pipeline::v1::AnalyzeResponse* resp, std::chrono::milliseconds timeout) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  if (!token_.empty()) {
    ctx.AddMetadata("authorization", "Bearer " + token_);
  }
  return stub_->Analyze(&ctx, req, resp);
}

ModuleClientFactory GrpcModuleClientFactory(std::string module_token) {
  return [token = std::move(module_token)](const ModuleSpec& spec) -> std::shared_ptr<ModuleClient> {
    return std::make_shared<GrpcModuleClient>(::grpc::CreateChannel(spec.endpoint, ::grpc::InsecureChannelCredentials()),
                                              token);
  };
}

} // namespace vigil::dispatch
