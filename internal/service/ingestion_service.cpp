#include "ingestion_service.hpp"

#include <arrow/buffer.h>

#include <stdexcept>

#include "internal/codec/batch_codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/model/event_category.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/batch_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace vigil::service {

using namespace vigil::pipeline::v1;
using vigil::observability::IntField;
using vigil::observability::StringField;

namespace {

void ThrowOnFailure(const db::Result& r, const std::string& what) {
  if (r.code == db::ErrorCode::Busy || r.code == db::ErrorCode::IOError) {
    throw util::Unavailable(what + ": " + r.message);
  }
  throw std::runtime_error(what + ": " + r.message);
}

} // namespace

IngestionService::IngestionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository || !ctx_.batch_store) {
    throw std::invalid_argument("IngestionService: repository and batch store are required");
  }
}

IngestResponse IngestionService::Duplicate(const db::model::BatchIndexRecord& existing) const {
  VIGIL_LOG_INFO("duplicate batch ignored", {StringField("storage_key", existing.storage_key)});
  IngestResponse resp;
  resp.set_storage_key(existing.storage_key);
  resp.set_record_count(static_cast<int64_t>(existing.record_count));
  resp.set_duplicate(true);
  return resp;
}

IngestResponse IngestionService::Ingest(const IngestRequest& req) {
  return ObserveRpc("IngestService.Ingest", req.batch_id(), [&] {
    const auto& payload = req.payload();
    if (payload.empty()) {
      throw util::InvalidArgument("ingest: payload is empty");
    }
    if (payload.size() > ctx_.max_payload_bytes) {
      throw util::InvalidArgument("ingest: payload exceeds " + std::to_string(ctx_.max_payload_bytes) + " bytes");
    }

    const auto decoded = codec::DecodeBatch(payload, ctx_.max_decoded_bytes);
    const auto key = storage::common::BatchStorageKey(decoded.header.source_id(), decoded.header.session_id(),
                                                      req.batch_id());

    {
      auto tx       = ctx_.repository->Begin();
      auto existing = ctx_.repository->GetBatch(*tx, key);
      tx->Commit();
      if (existing) {
        return Duplicate(*existing);
      }
    }

    auto buffer = arrow::Buffer::FromString(std::string(payload));
    try {
      ctx_.batch_store->Put(key, buffer);
    } catch (const util::InvalidArgument&) {
      throw;
    } catch (const std::exception& e) {
      throw util::Unavailable(std::string("ingest: object store write failed: ") + e.what());
    }

    db::model::BatchIndexRecord record;
    record.storage_key    = key;
    record.batch_id       = req.batch_id();
    record.source_id      = decoded.header.source_id();
    record.session_id     = decoded.header.session_id();
    record.created_at_ms  = decoded.header.created_at_ms();
    record.ingested_at_ms = util::NowUnixMillis();
    record.record_count   = decoded.events.size();
    record.payload_bytes  = payload.size();
    record.status         = db::model::BatchStatus::kIndexed;

    // A concurrent replay may win the race between the lookup and here.
    try {
      auto tx = ctx_.repository->Begin();
      auto r  = ctx_.repository->InsertBatch(*tx, record);
      if (r.code == db::ErrorCode::AlreadyExists) {
        tx->Rollback();
        return Duplicate(record);
      }
      if (!r) {
        ThrowOnFailure(r, "ingest: index batch");
      }
      tx->Commit();
    } catch (const util::AlreadyExists&) {
      return Duplicate(record);
    }

    model::CategoryMask categories = 0;
    for (const auto& event : decoded.events) {
      categories |= model::MaskOf(model::CategorizeEventType(event.pkt()));
    }

    if (ctx_.dispatcher) {
      ctx_.dispatcher->Enqueue(dispatch::IndexedBatch{record, categories, buffer});
    }

    VIGIL_LOG_INFO("batch ingested", {StringField("storage_key", key),
                                      IntField("record_count", static_cast<int64_t>(record.record_count)),
                                      IntField("payload_bytes", static_cast<int64_t>(record.payload_bytes))});

    IngestResponse resp;
    resp.set_storage_key(key);
    resp.set_record_count(static_cast<int64_t>(record.record_count));
    resp.set_duplicate(false);
    return resp;
  });
}

std::vector<db::model::BatchIndexRecord> IngestionService::ListBatches(const std::string& source_id, uint64_t limit) {
  auto tx  = ctx_.repository->Begin();
  auto out = ctx_.repository->ListBatches(*tx, source_id, limit);
  tx->Commit();
  return out;
}

std::vector<db::model::DispatchRecord> IngestionService::ListDispatches(const std::string& storage_key) {
  auto tx  = ctx_.repository->Begin();
  auto out = ctx_.repository->ListDispatches(*tx, storage_key);
  tx->Commit();
  return out;
}

}
