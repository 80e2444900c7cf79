#pragma once

#include <cstdint>
#include <string>

#include "vigil/pipeline/v1/callback_service.pb.h"

namespace vigil::db::model {

struct FindingRecord {
  uint64_t                      finding_id = 0;
  std::string                   module;
  std::string                   entity_id;
  std::string                   check;
  vigil::pipeline::v1::Severity severity   = vigil::pipeline::v1::SEVERITY_UNSPECIFIED;
  double                        confidence = 0.0;
  // evidence as JSON object text
  std::string evidence;
  int64_t     timestamp_ms = 0;
  std::string source_id;
  std::string session_id;
  std::string batch_id;
  std::string title;
  std::string description;
  int64_t     received_at_ms = 0;
};

} // namespace vigil::db::model
