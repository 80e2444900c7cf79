#include "findings_forwarder.hpp"

#include <google/protobuf/util/json_util.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <optional>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace vigil::findings {

using vigil::observability::IntField;
using vigil::observability::StringField;
using vigil::pipeline::v1::NotifyFindingRequest;
using vigil::pipeline::v1::Severity;

namespace {

constexpr std::chrono::milliseconds kPollInterval{200};

std::optional<Severity> ParseSeverity(std::string_view name) {
  const auto trimmed = util::Trim(name);
  for (auto s : {vigil::pipeline::v1::SEVERITY_INFO, vigil::pipeline::v1::SEVERITY_LOW,
                 vigil::pipeline::v1::SEVERITY_MEDIUM, vigil::pipeline::v1::SEVERITY_HIGH,
                 vigil::pipeline::v1::SEVERITY_CRITICAL}) {
    // accepts both "high" and "SEVERITY_HIGH"
    const auto& full = vigil::pipeline::v1::Severity_Name(s);
    if (util::EqualsIgnoreCase(trimmed, full) ||
        util::EqualsIgnoreCase(trimmed, std::string_view(full).substr(std::string_view("SEVERITY_").size()))) {
      return s;
    }
  }
  return std::nullopt;
}

} // namespace

std::vector<SubscriberSpec> SubscribersFromConfig(const vigil::runtime::config::FindingsConfig& config) {
  std::vector<SubscriberSpec> out;
  std::set<std::string>       names;

  for (const auto& s : config.subscribers()) {
    if (s.name().empty()) {
      throw util::InvalidArgument("findings config: subscriber name must not be empty");
    }
    if (!names.insert(s.name()).second) {
      throw util::InvalidArgument("findings config: duplicate subscriber '" + s.name() + "'");
    }
    if (s.endpoint().empty()) {
      throw util::InvalidArgument("findings config: '" + s.name() + "' has no endpoint");
    }

    SubscriberSpec spec;
    spec.name     = s.name();
    spec.endpoint = s.endpoint();
    spec.token    = s.token();
    if (s.timeout_ms() > 0) {
      spec.timeout = std::chrono::milliseconds(s.timeout_ms());
    }
    for (const auto& name : s.severities()) {
      auto severity = ParseSeverity(name);
      if (!severity) {
        throw util::InvalidArgument("findings config: '" + s.name() + "' has unknown severity '" + name + "'");
      }
      spec.severities.insert(*severity);
    }
    out.push_back(std::move(spec));
  }
  return out;
}

GrpcFindingsNotifier::GrpcFindingsNotifier(std::shared_ptr<::grpc::Channel> channel, std::string token)
    : stub_(vigil::pipeline::v1::FindingsSubscriberService::NewStub(std::move(channel))), token_(std::move(token)) {
}

::grpc::Status GrpcFindingsNotifier::Notify(const NotifyFindingRequest& req, std::chrono::milliseconds timeout) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  if (!token_.empty()) {
    ctx.AddMetadata("authorization", "Bearer " + token_);
  }
  vigil::pipeline::v1::NotifyFindingResponse resp;
  return stub_->Notify(&ctx, req, &resp);
}

NotifierFactory GrpcNotifierFactory() {
  return [](const SubscriberSpec& spec) -> std::shared_ptr<FindingsNotifier> {
    return std::make_shared<GrpcFindingsNotifier>(
        ::grpc::CreateChannel(spec.endpoint, ::grpc::InsecureChannelCredentials()), spec.token);
  };
}

vigil::pipeline::v1::Finding ToProto(const db::model::FindingRecord& record) {
  vigil::pipeline::v1::Finding f;
  f.set_module(record.module);
  f.set_entity_id(record.entity_id);
  f.set_check(record.check);
  f.set_severity(record.severity);
  f.set_confidence(record.confidence);
  f.set_timestamp_ms(record.timestamp_ms);
  f.set_source_id(record.source_id);
  f.set_session_id(record.session_id);
  f.set_batch_id(record.batch_id);
  f.set_title(record.title);
  f.set_description(record.description);

  // stored evidence was produced from a Struct, so it parses back
  if (!record.evidence.empty()) {
    auto status = google::protobuf::util::JsonStringToMessage(record.evidence, f.mutable_evidence());
    if (!status.ok()) {
      f.clear_evidence();
    }
  }
  return f;
}

FindingsForwarder::FindingsForwarder(std::vector<SubscriberSpec> subscribers, NotifierFactory factory,
                                     Options options) {
  if (!factory) {
    throw std::invalid_argument("FindingsForwarder: notifier factory is required");
  }
  for (auto& spec : subscribers) {
    auto notifier = factory(spec);
    subscribers_.push_back(std::make_unique<Subscriber>(std::move(spec), std::move(notifier), options.queue_capacity));
  }
}

FindingsForwarder::~FindingsForwarder() {
  Stop();
}

void FindingsForwarder::Start() {
  if (started_.exchange(true)) return;
  for (auto& s : subscribers_) {
    s->thread = std::thread(&FindingsForwarder::Run, this, std::ref(*s));
  }
}

void FindingsForwarder::Stop() {
  for (auto& s : subscribers_) {
    s->queue.Shutdown();
  }
  for (auto& s : subscribers_) {
    if (s->thread.joinable()) {
      s->thread.join();
    }
  }
}

void FindingsForwarder::Forward(const db::model::FindingRecord& finding) {
  for (auto& s : subscribers_) {
    if (!s->spec.Wants(finding.severity)) {
      continue;
    }
    NotifyFindingRequest req;
    *req.mutable_finding() = ToProto(finding);
    req.set_subscriber(s->spec.name);
    if (!s->queue.TryEnqueue(std::move(req))) {
      ++dropped_;
      VIGIL_LOG_WARN("finding notification dropped",
                     {StringField("subscriber", s->spec.name), StringField("entity_id", finding.entity_id),
                      StringField("check", finding.check)});
      continue;
    }
    ++queued_;
  }
}

ForwarderStats FindingsForwarder::Stats() const {
  ForwarderStats s;
  s.queued    = queued_.load();
  s.delivered = delivered_.load();
  s.failed    = failed_.load();
  s.dropped   = dropped_.load();
  return s;
}

void FindingsForwarder::Run(Subscriber& subscriber) {
  for (;;) {
    auto batch = subscriber.queue.DrainBatch(1, kPollInterval);
    if (batch.empty()) {
      if (subscriber.queue.IsShutdown()) break;
      continue;
    }

    for (const auto& req : batch) {
      ::grpc::Status status;
      try {
        status = subscriber.notifier->Notify(req, subscriber.spec.timeout);
      } catch (const std::exception& e) {
        status = ::grpc::Status(::grpc::StatusCode::INTERNAL, e.what());
      }

      if (status.ok()) {
        ++delivered_;
        continue;
      }
      ++failed_;
      VIGIL_LOG_WARN("finding notification failed",
                     {StringField("subscriber", subscriber.spec.name),
                      StringField("entity_id", req.finding().entity_id()),
                      IntField("code", static_cast<int64_t>(status.error_code())),
                      StringField("error", status.error_message())});
    }
  }
}

} // namespace vigil::findings
