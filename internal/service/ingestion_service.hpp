#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/batch_index_record.hpp"
#include "service_context.hpp"
#include "vigil/pipeline/v1/ingest_service.pb.h"

namespace vigil::service {

/*
  Accepts batches from capture agents.

  A batch is decoded and validated in full, stored under its derived
  object key, indexed, and only then handed to the dispatcher. Replays of
  an indexed batch return the original key with duplicate=true and do not
  dispatch again.
*/
class IngestionService {
public:
  explicit IngestionService(ServiceContext ctx);

  vigil::pipeline::v1::IngestResponse Ingest(const vigil::pipeline::v1::IngestRequest& req);

  std::vector<vigil::db::model::BatchIndexRecord> ListBatches(const std::string& source_id, uint64_t limit);

  std::vector<vigil::db::model::DispatchRecord> ListDispatches(const std::string& storage_key);

private:
  vigil::pipeline::v1::IngestResponse Duplicate(const vigil::db::model::BatchIndexRecord& existing) const;

  ServiceContext ctx_;
};

}
