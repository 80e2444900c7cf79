#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "vigil/pipeline/v1/module_service.grpc.pb.h"

namespace vigil::dispatch {

struct ModuleSpec;

/*
  Outbound call to one detection module.
*/
class ModuleClient {
 public:
  virtual ~ModuleClient() = default;

  virtual ::grpc::Status Analyze(const vigil::pipeline::v1::AnalyzeRequest& req,
                                 vigil::pipeline::v1::AnalyzeResponse* resp, std::chrono::milliseconds timeout) = 0;
};

using ModuleClientFactory = std::function<std::shared_ptr<ModuleClient>(const ModuleSpec&)>;

class GrpcModuleClient final : public ModuleClient {
 public:
  GrpcModuleClient(std::shared_ptr<::grpc::Channel> channel, std::string token);

  ::grpc::Status Analyze(const vigil::pipeline::v1::AnalyzeRequest& req, vigil::pipeline::v1::AnalyzeResponse* resp,
                         std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<vigil::pipeline::v1::DetectionModuleService::Stub> stub_;
  std::string                                                       token_;
};

// Insecure channel per module endpoint, authenticated with module_token.
ModuleClientFactory GrpcModuleClientFactory(std::string module_token);

} // namespace vigil::dispatch
