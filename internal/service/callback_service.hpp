#pragma once

#include "service_context.hpp"
#include "vigil/pipeline/v1/callback_service.pb.h"

namespace vigil::service {

/*
  Surface detection modules call back into: shared player state and
  findings submission.
*/
class CallbackService {
public:
  explicit CallbackService(ServiceContext ctx);

  vigil::pipeline::v1::BatchGetPlayerStatesResponse
  BatchGetPlayerStates(const vigil::pipeline::v1::BatchGetPlayerStatesRequest& req);

  vigil::pipeline::v1::BatchSetPlayerStatesResponse
  BatchSetPlayerStates(const vigil::pipeline::v1::BatchSetPlayerStatesRequest& req);

  vigil::pipeline::v1::SubmitFindingsResponse
  SubmitFindings(const vigil::pipeline::v1::SubmitFindingsRequest& req);

private:
  ServiceContext ctx_;
};

}
