#include "findings_sink.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vigil::findings {

using vigil::observability::IntField;
using vigil::observability::StringField;

FindingsSink::FindingsSink(std::shared_ptr<db::Repository> repository, std::shared_ptr<FindingsForwarder> forwarder)
    : repo_(std::move(repository)), forwarder_(std::move(forwarder)) {
  if (!repo_) {
    throw std::invalid_argument("FindingsSink: repository is null");
  }
}

void FindingsSink::Validate(const db::model::FindingRecord& finding, std::size_t index) {
  const std::string where = "finding[" + std::to_string(index) + "]: ";
  if (finding.module.empty()) {
    throw util::InvalidArgument(where + "module must not be empty");
  }
  if (finding.entity_id.empty()) {
    throw util::InvalidArgument(where + "entity_id must not be empty");
  }
  if (finding.check.empty()) {
    throw util::InvalidArgument(where + "check must not be empty");
  }
  if (!vigil::pipeline::v1::Severity_IsValid(finding.severity)) {
    throw util::InvalidArgument(where + "severity " + std::to_string(finding.severity) + " is not a known level");
  }
  if (!std::isfinite(finding.confidence) || finding.confidence < 0.0 || finding.confidence > 1.0) {
    throw util::InvalidArgument(where + "confidence must be within [0, 1]");
  }
  if (finding.timestamp_ms <= 0) {
    throw util::InvalidArgument(where + "timestamp_ms must be positive");
  }
}

bool FindingsSink::InsertOne(const db::model::FindingRecord& finding) {
  auto tx = repo_->Begin();
  auto r  = repo_->InsertFinding(*tx, finding);
  if (r.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  if (!r) {
    if (r.code == db::ErrorCode::Busy || r.code == db::ErrorCode::IOError) {
      throw util::Unavailable("insert finding: " + r.message);
    }
    throw std::runtime_error("insert finding: " + r.message);
  }
  try {
    tx->Commit();
  } catch (const util::AlreadyExists&) {
    // lost a race against an identical concurrent submission
    return false;
  }
  return true;
}

SubmitResult FindingsSink::Submit(std::vector<db::model::FindingRecord> findings, int64_t received_at_ms) {
  for (std::size_t i = 0; i < findings.size(); ++i) {
    Validate(findings[i], i);
  }

  SubmitResult result;
  for (auto& finding : findings) {
    finding.received_at_ms = received_at_ms;
    if (finding.severity == vigil::pipeline::v1::SEVERITY_UNSPECIFIED) {
      finding.severity = vigil::pipeline::v1::SEVERITY_INFO;
    }
    if (finding.evidence.empty()) {
      finding.evidence = "{}";
    }

    if (!InsertOne(finding)) {
      ++result.duplicates;
      continue;
    }
    ++result.accepted;
    VIGIL_LOG_INFO("finding recorded",
                   {StringField("module", finding.module), StringField("entity_id", finding.entity_id),
                    StringField("check", finding.check),
                    StringField("severity", vigil::pipeline::v1::Severity_Name(finding.severity)),
                    IntField("timestamp_ms", finding.timestamp_ms)});
    if (forwarder_) {
      forwarder_->Forward(finding);
    }
  }
  return result;
}

std::vector<db::model::FindingRecord> FindingsSink::List(const std::string& entity_id, uint64_t limit) {
  auto tx  = repo_->Begin();
  auto out = repo_->ListFindings(*tx, entity_id, limit);
  tx->Commit();
  return out;
}

} // namespace vigil::findings
