#include "command_feed.hpp"

#include <charconv>
#include <optional>
#include <sstream>

#include "agent.hpp"
#include "internal/codec/batch_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace vigil::agent {

namespace {

CommandReply Error(std::string message) {
  return CommandReply{false, std::move(message)};
}

std::optional<int32_t> ParseInt(const std::string& text) {
  int32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string Describe(const model::DevSession& s) {
  std::ostringstream out;
  out << "session=" << s.session_id << " entity=" << s.entity_id << " label=" << s.label
      << " phase=" << model::ToString(s.phase) << " state=" << s.StateName() << " elapsed=" << s.elapsed_seconds
      << "s cycle=" << s.cycle_index;
  return out.str();
}

} // namespace

std::vector<std::string> SplitWords(std::string_view line) {
  std::vector<std::string> out;
  std::size_t              i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    const auto start = i;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
    if (i > start) out.emplace_back(line.substr(start, i - start));
  }
  return out;
}

CommandFeed::CommandFeed(Agent& agent, ReloadFn reload) : agent_(agent), reload_(std::move(reload)) {
}

CommandReply CommandFeed::Handle(std::string_view raw, int64_t now_ms) {
  const auto line = util::Trim(raw);
  if (line.empty() || line.front() == '#') {
    return {};
  }
  if (line.front() == '{') {
    return HandleEvent(line);
  }

  const auto args = SplitWords(line);
  const auto& cmd = args.front();

  try {
    if (cmd == "join" && (args.size() == 2 || args.size() == 3)) {
      std::optional<std::string_view> name;
      if (args.size() == 3) name = args[2];
      agent_.Exemptions().OnConnect(args[1], name, now_ms);
      return {true, "joined " + args[1]};
    }
    if (cmd == "quit" && args.size() == 2) {
      agent_.Dev().OnDisconnect(args[1], now_ms);
      agent_.Exemptions().OnDisconnect(args[1]);
      return {true, "quit " + args[1]};
    }
    if (cmd == "transfer" && args.size() == 2) {
      agent_.Exemptions().OnTransfer(args[1], now_ms);
      return {true, "transferred " + args[1]};
    }
    if (cmd == "exempt" && args.size() == 4) {
      const auto reason  = capture::ParseExemptionReason(args[2]);
      const auto seconds = ParseInt(args[3]);
      if (!reason) return Error("unknown exemption reason: " + args[2]);
      if (!seconds || *seconds <= 0) return Error("exempt: seconds must be a positive integer");
      agent_.Exemptions().Exempt(args[1], *reason, static_cast<int64_t>(*seconds) * 1000, now_ms);
      return {true, "exempted " + args[1] + " (" + std::string(capture::ToString(*reason)) + ")"};
    }
    if (cmd == "dev") {
      return HandleDev(args, now_ms);
    }
    if (cmd == "stats" && args.size() == 1) {
      return Stats();
    }
    if (cmd == "reload" && args.size() == 1) {
      if (!reload_) return Error("reload is not available");
      reload_();
      return {true, "reloaded"};
    }
  } catch (const std::exception& e) {
    return Error(e.what());
  }

  return Error("unrecognized command: " + std::string(line));
}

CommandReply CommandFeed::HandleEvent(std::string_view line) {
  try {
    auto record  = codec::FromEvent(codec::ParseEventLine(line));
    agent_.Capture().Capture(std::move(record));
    return {};
  } catch (const util::InvalidArgument& e) {
    return Error(std::string("bad event: ") + e.what());
  }
}

CommandReply CommandFeed::HandleDev(const std::vector<std::string>& args, int64_t now_ms) {
  if (args.size() < 3) {
    return Error("usage: dev start|stop|status <entity> ...");
  }
  const auto& sub    = args[1];
  const auto& entity = args[2];

  if (sub == "start") {
    if (args.size() < 4 || args.size() > 7) {
      return Error("usage: dev start <entity> <label> [duration] [warmup] [toggle]");
    }
    std::optional<model::DevSessionSettings> settings;
    if (args.size() > 4) {
      auto s = agent_.Dev().Defaults();
      int32_t* targets[] = {&s.duration_seconds, &s.warmup_seconds, &s.toggle_seconds};
      for (std::size_t i = 4; i < args.size(); ++i) {
        const auto v = ParseInt(args[i]);
        if (!v || *v < 0) return Error("dev start: '" + args[i] + "' is not a non-negative integer");
        *targets[i - 4] = *v;
      }
      settings = s;
    }
    const auto session = agent_.Dev().Start(entity, args[3], settings, now_ms);
    return {true, "dev started " + Describe(session)};
  }
  if (sub == "stop" && args.size() == 3) {
    if (!agent_.Dev().Stop(entity, now_ms)) {
      return Error("no dev session for " + entity);
    }
    return {true, "dev stopped " + entity};
  }
  if (sub == "status" && args.size() == 3) {
    const auto session = agent_.Dev().Status(entity);
    if (!session) return {true, "no dev session for " + entity};
    return {true, Describe(*session)};
  }
  return Error("usage: dev start|stop|status <entity> ...");
}

CommandReply CommandFeed::Stats() const {
  const auto         s = agent_.Capture().Stats();
  std::ostringstream out;
  out << "enqueued=" << s.enqueued << " unresolved=" << s.unresolved << " malformed=" << s.malformed
      << " exempt=" << s.exempt
      << " sampled=" << s.sampled << " filtered=" << s.filtered << " overflow=" << s.overflow
      << " queue=" << agent_.Capture().Queue()->Size() << "/" << agent_.Capture().Queue()->Capacity()
      << " batches=" << agent_.Assembler().BatchesWritten() << " spool_files=" << agent_.Spool().ListPublished().size()
      << " spool_bytes=" << agent_.Spool().TotalBytes() << " quarantined=" << agent_.Spool().ListQuarantined().size()
      << " dev_sessions=" << agent_.Dev().ActiveSessions();
  return {true, out.str()};
}

} // namespace vigil::agent
