#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>

#include "internal/service/callback_service.hpp"
#include "vigil/pipeline/v1/callback_service.grpc.pb.h"

namespace vigil::grpc {

class CallbackServer final : public vigil::pipeline::v1::CallbackService::Service {
public:
  CallbackServer(std::shared_ptr<vigil::service::CallbackService> svc, std::string module_callback_token);

  ::grpc::Status BatchGetPlayerStates(::grpc::ServerContext* ctx,
                                      const vigil::pipeline::v1::BatchGetPlayerStatesRequest* req,
                                      vigil::pipeline::v1::BatchGetPlayerStatesResponse* resp) override;

  ::grpc::Status BatchSetPlayerStates(::grpc::ServerContext* ctx,
                                      const vigil::pipeline::v1::BatchSetPlayerStatesRequest* req,
                                      vigil::pipeline::v1::BatchSetPlayerStatesResponse* resp) override;

  ::grpc::Status SubmitFindings(::grpc::ServerContext* ctx,
                                const vigil::pipeline::v1::SubmitFindingsRequest* req,
                                vigil::pipeline::v1::SubmitFindingsResponse* resp) override;

private:
  std::shared_ptr<vigil::service::CallbackService> service_;
  std::string token_;
};

}
