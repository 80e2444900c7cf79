#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/finding_record.hpp"
#include "internal/findings/findings_forwarder.hpp"

namespace vigil::findings {

struct SubmitResult {
  uint32_t accepted   = 0;
  uint32_t duplicates = 0;
};

/*
  Durable, deduplicated sink for findings reported by detection modules.

  A request is validated as a whole before anything is written; an unset
  severity is stored as SEVERITY_INFO. Each finding is then stored in its
  own transaction; a repeat of (module, entity, check, timestamp) counts
  as a duplicate, not an error. Only newly stored findings are forwarded.
*/
class FindingsSink {
 public:
  explicit FindingsSink(std::shared_ptr<db::Repository> repository,
                        std::shared_ptr<FindingsForwarder> forwarder = nullptr);

  SubmitResult Submit(std::vector<db::model::FindingRecord> findings, int64_t received_at_ms);

  std::vector<db::model::FindingRecord> List(const std::string& entity_id, uint64_t limit);

 private:
  static void Validate(const db::model::FindingRecord& finding, std::size_t index);
  bool        InsertOne(const db::model::FindingRecord& finding);

  std::shared_ptr<db::Repository>    repo_;
  std::shared_ptr<FindingsForwarder> forwarder_;
};

} // namespace vigil::findings
