#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/upload/ingest_client.hpp"

namespace vigil::spool {
class DurableSpool;
}

namespace vigil::upload {

struct UploadReport {
  uint64_t attempted   = 0;
  uint64_t uploaded    = 0;
  uint64_t retained    = 0;
  uint64_t quarantined = 0;
};

/*
  Drains the spool oldest-first.

      accepted   -> delete
      transient  -> keep, stop this pass (order is preserved)
      permanent  -> quarantine

  A file that has failed transiently max_transient_attempts times in a row
  is stepped over so it cannot hold back the files behind it. It is
  quarantined once a later file in the same pass is accepted; if the next
  file fails too the backend is assumed down and the pass stops. A file that
  vanished since listing (quota eviction) is skipped; one that cannot be
  read is quarantined. Re-running a pass is always safe.
*/
class BatchUploader {
 public:
  static constexpr uint32_t kDefaultMaxTransientAttempts = 20;

  BatchUploader(std::shared_ptr<spool::DurableSpool> spool, std::shared_ptr<IngestClient> client,
                std::chrono::milliseconds timeout, uint32_t max_transient_attempts = kDefaultMaxTransientAttempts);

  UploadReport UploadPending();

 private:
  std::shared_ptr<spool::DurableSpool> spool_;
  std::shared_ptr<IngestClient>        client_;
  std::chrono::milliseconds            timeout_;
  uint32_t                             max_transient_attempts_;

  std::mutex                      mutex_;
  // batch_id -> consecutive transient failures
  std::map<std::string, uint32_t> transient_failures_;
};

} // namespace vigil::upload
