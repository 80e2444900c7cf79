#include "durable_spool.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <chrono>

#include "internal/codec/batch_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace vigil::spool {

namespace fs = std::filesystem;

using storage::common::ReadAll;
using storage::common::Unwrap;

namespace {

bool EndsWith(const std::string& value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool OldestFirst(const SpoolFileHandle& a, const SpoolFileHandle& b) {
  if (a.modified != b.modified) return a.modified < b.modified;
  return a.path.filename() < b.path.filename();
}

} // namespace

DurableSpool::Options DurableSpool::OptionsFromConfig(const vigil::runtime::config::SpoolConfig& config) {
  Options options;
  options.dir = config.dir().empty() ? fs::path("spool") : fs::path(config.dir());
  if (!config.prefix().empty()) options.prefix = config.prefix();
  if (config.max_mb() > 0) options.max_bytes = config.max_mb() * 1024ull * 1024ull;
  return options;
}

DurableSpool::DurableSpool(Options options) : options_(std::move(options)) {
  quarantine_dir_ = options_.dir / "quarantine";
  fs::create_directories(options_.dir);
  fs::create_directories(quarantine_dir_);
  RemoveStaleTmpFiles();
}

void DurableSpool::RemoveStaleTmpFiles() {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(options_.dir, ec)) {
    const auto name = entry.path().filename().string();
    if (entry.is_regular_file() && EndsWith(name, kTmpSuffix)) {
      std::error_code remove_ec;
      fs::remove(entry.path(), remove_ec);
      VIGIL_LOG_WARN("Removed stale spool tmp file", {observability::StringField("path", entry.path().string())});
    }
  }
}

std::string DurableSpool::NextBatchId() const {
  return options_.prefix + "-" + std::to_string(util::NowUnixMillis()) + "-" + util::GenerateUUIDString();
}

std::vector<SpoolFileHandle> DurableSpool::Scan(const fs::path& dir) const {
  std::vector<SpoolFileHandle> out;
  std::error_code              ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    const auto name = entry.path().filename().string();
    if (!EndsWith(name, kExtension)) continue;

    SpoolFileHandle handle;
    handle.path       = entry.path();
    handle.batch_id   = name.substr(0, name.size() - std::string_view(kExtension).size());
    handle.size_bytes = entry.file_size(entry_ec);
    handle.modified   = entry.last_write_time(entry_ec);
    if (entry_ec) continue; // vanished while scanning
    out.push_back(std::move(handle));
  }
  std::sort(out.begin(), out.end(), OldestFirst);
  return out;
}

uint64_t DurableSpool::TotalBytesLocked() const {
  uint64_t total = 0;
  for (const auto& h : Scan(options_.dir)) total += h.size_bytes;
  for (const auto& h : Scan(quarantine_dir_)) total += h.size_bytes;
  return total;
}

void DurableSpool::EnforceQuotaLocked(uint64_t incoming_bytes) {
  auto candidates = Scan(options_.dir);
  auto quarantined = Scan(quarantine_dir_);
  candidates.insert(candidates.end(), quarantined.begin(), quarantined.end());
  std::sort(candidates.begin(), candidates.end(), OldestFirst);

  uint64_t total = 0;
  for (const auto& h : candidates) total += h.size_bytes;

  for (const auto& victim : candidates) {
    if (total + incoming_bytes <= options_.max_bytes) break;

    std::error_code ec;
    if (fs::remove(victim.path, ec)) {
      total -= victim.size_bytes;
      VIGIL_LOG_WARN("Spool quota exceeded, evicted batch",
                     {observability::StringField("batch_id", victim.batch_id),
                      observability::IntField("size_bytes", static_cast<int64_t>(victim.size_bytes))});
    } else if (ec) {
      VIGIL_LOG_ERROR("Failed to evict spool file",
                      {observability::StringField("path", victim.path.string()), observability::StringField("error", ec.message())});
    }
  }
}

std::optional<SpoolFileHandle> DurableSpool::WriteBatch(const model::PacketBatch& batch) {
  std::shared_ptr<arrow::Buffer> encoded;
  try {
    encoded = codec::EncodeBatch(batch);
  } catch (const std::exception& e) {
    VIGIL_LOG_ERROR("Failed to encode batch", {observability::StringField("error", e.what()),
                                               observability::IntField("records", batch.RecordCount())});
    return std::nullopt;
  }
  return Publish(encoded);
}

std::optional<SpoolFileHandle> DurableSpool::Publish(const std::shared_ptr<arrow::Buffer>& encoded) {
  const auto started = util::SteadyNow();

  std::lock_guard lock(mutex_);

  EnforceQuotaLocked(static_cast<uint64_t>(encoded->size()));

  const auto batch_id   = NextBatchId();
  const auto final_path = options_.dir / (batch_id + kExtension);
  const auto tmp_path   = fs::path(final_path.string() + kTmpSuffix);

  try {
    {
      auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
      Unwrap(out->Write(encoded->data(), encoded->size()));
      Unwrap(out->Flush());
      Unwrap(out->Close());
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
      // Not every filesystem supports rename over; a hard link is still atomic.
      std::error_code link_ec;
      fs::create_hard_link(tmp_path, final_path, link_ec);
      if (link_ec) {
        throw std::runtime_error("publish failed: " + ec.message() + "; link fallback: " + link_ec.message());
      }
      fs::remove(tmp_path, link_ec);
    }
  } catch (const std::exception& e) {
    std::error_code ec;
    fs::remove(tmp_path, ec);
    VIGIL_LOG_ERROR("Spool write failed",
                    {observability::StringField("batch_id", batch_id), observability::StringField("error", e.what())});
    return std::nullopt;
  }

  SpoolFileHandle handle;
  handle.path       = final_path;
  handle.batch_id   = batch_id;
  handle.size_bytes = static_cast<uint64_t>(encoded->size());
  std::error_code ec;
  handle.modified = fs::last_write_time(final_path, ec);

  const auto elapsed = std::chrono::duration<double, std::milli>(util::SteadyNow() - started).count();
  auto&      metrics = observability::Metrics::Instance();
  metrics.ObserveSpoolWriteMs(elapsed);
  metrics.SetSpoolBytes(options_.dir.string(), TotalBytesLocked());

  VIGIL_LOG_DEBUG("Spooled batch", {observability::StringField("batch_id", batch_id),
                                    observability::IntField("size_bytes", static_cast<int64_t>(handle.size_bytes))});
  return handle;
}

std::vector<SpoolFileHandle> DurableSpool::ListPublished() const {
  std::lock_guard lock(mutex_);
  return Scan(options_.dir);
}

std::vector<SpoolFileHandle> DurableSpool::ListQuarantined() const {
  std::lock_guard lock(mutex_);
  return Scan(quarantine_dir_);
}

std::shared_ptr<arrow::Buffer> DurableSpool::Read(const SpoolFileHandle& handle) const {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  if (!fs::exists(handle.path, ec)) {
    throw util::NotFound("spool file gone: " + handle.batch_id);
  }
  auto file = Unwrap(arrow::io::ReadableFile::Open(handle.path.string()));
  return ReadAll(file);
}

bool DurableSpool::Remove(const SpoolFileHandle& handle) {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  const bool      removed = fs::remove(handle.path, ec);
  if (ec) {
    VIGIL_LOG_ERROR("Failed to remove spool file",
                    {observability::StringField("path", handle.path.string()), observability::StringField("error", ec.message())});
  }
  observability::Metrics::Instance().SetSpoolBytes(options_.dir.string(), TotalBytesLocked());
  return removed;
}

bool DurableSpool::Quarantine(const SpoolFileHandle& handle) {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  if (!fs::exists(handle.path, ec)) {
    return false;
  }
  fs::rename(handle.path, quarantine_dir_ / handle.path.filename(), ec);
  if (ec) {
    VIGIL_LOG_ERROR("Failed to quarantine spool file",
                    {observability::StringField("path", handle.path.string()), observability::StringField("error", ec.message())});
    return false;
  }
  VIGIL_LOG_WARN("Quarantined spool file", {observability::StringField("batch_id", handle.batch_id)});
  return true;
}

uint64_t DurableSpool::TotalBytes() const {
  std::lock_guard lock(mutex_);
  return TotalBytesLocked();
}

} // namespace vigil::spool
