#include "callback_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/findings/findings_sink.hpp"
#include "internal/state/player_state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace vigil::service {

using namespace vigil::pipeline::v1;

namespace {

std::string EvidenceToJson(const Finding& finding) {
  if (!finding.has_evidence()) {
    return "{}";
  }
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(finding.evidence(), &json);
  if (!status.ok()) {
    throw util::InvalidArgument("finding evidence is not representable as JSON: " + std::string(status.message()));
  }
  return json;
}

db::model::FindingRecord FromProto(const Finding& f) {
  db::model::FindingRecord record;
  record.module       = f.module();
  record.entity_id    = f.entity_id();
  record.check        = f.check();
  record.severity     = f.severity();
  record.confidence   = f.confidence();
  record.evidence     = EvidenceToJson(f);
  record.timestamp_ms = f.timestamp_ms();
  record.source_id    = f.source_id();
  record.session_id   = f.session_id();
  record.batch_id     = f.batch_id();
  record.title        = f.title();
  record.description  = f.description();
  return record;
}

} // namespace

CallbackService::CallbackService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.player_state || !ctx_.findings) {
    throw std::invalid_argument("CallbackService: player state store and findings sink are required");
  }
}

BatchGetPlayerStatesResponse CallbackService::BatchGetPlayerStates(const BatchGetPlayerStatesRequest& req) {
  return ObserveRpc("CallbackService.BatchGetPlayerStates", req.entity_id(), [&] {
    const std::vector<std::string> keys(req.keys().begin(), req.keys().end());
    const auto                     states = ctx_.player_state->BatchGet(req.source_id(), req.entity_id(), keys);

    BatchGetPlayerStatesResponse resp;
    auto*                        out = resp.mutable_states();
    for (const auto& [key, stored] : states) {
      PlayerStateEntry entry;
      stored.value.ToProto(entry.mutable_value());
      entry.set_updated_at_ms(stored.updated_at_ms);
      (*out)[key] = std::move(entry);
    }
    return resp;
  });
}

BatchSetPlayerStatesResponse CallbackService::BatchSetPlayerStates(const BatchSetPlayerStatesRequest& req) {
  return ObserveRpc("CallbackService.BatchSetPlayerStates", req.entity_id(), [&] {
    std::map<std::string, model::StateValue> values;
    for (const auto& [key, value] : req.values()) {
      values.emplace(key, model::StateValue::FromProto(value));
    }

    BatchSetPlayerStatesResponse resp;
    resp.set_written(static_cast<int32_t>(
        ctx_.player_state->BatchSet(req.source_id(), req.entity_id(), values, util::NowUnixMillis())));
    return resp;
  });
}

SubmitFindingsResponse CallbackService::SubmitFindings(const SubmitFindingsRequest& req) {
  return ObserveRpc("CallbackService.SubmitFindings", "", [&] {
    std::vector<db::model::FindingRecord> findings;
    findings.reserve(static_cast<size_t>(req.findings_size()));
    for (const auto& f : req.findings()) {
      findings.push_back(FromProto(f));
    }

    const auto result = ctx_.findings->Submit(std::move(findings), util::NowUnixMillis());

    SubmitFindingsResponse resp;
    resp.set_accepted(static_cast<int32_t>(result.accepted));
    resp.set_duplicates(static_cast<int32_t>(result.duplicates));
    return resp;
  });
}

}
