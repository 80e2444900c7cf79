#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/agent/agent.hpp"
#include "internal/agent/command_feed.hpp"
#include "internal/util/time.hpp"

namespace {

class AcceptAll final : public vigil::upload::IngestClient {
 public:
  vigil::upload::UploadOutcome Upload(const std::string& batch_id, const std::shared_ptr<arrow::Buffer>&,
                                      std::chrono::milliseconds) override {
    vigil::upload::UploadOutcome outcome;
    outcome.result      = vigil::upload::UploadResult::kAccepted;
    outcome.storage_key = "server-a/boot-1/" + batch_id;
    return outcome;
  }
};

struct Fixture {
  std::filesystem::path                 dir;
  std::unique_ptr<vigil::agent::Agent> agent;
  int                                   reloads = 0;

  explicit Fixture(bool dev_enabled = true) {
    dir = std::filesystem::temp_directory_path() /
          ("vigil_command_feed_" + std::to_string(vigil::util::NowUnixMillis()));

    vigil::runtime::config::AgentConfig config;
    config.set_source_id("server-a");
    config.set_session_id("boot-1");
    config.mutable_capture()->set_queue_capacity(64);
    config.mutable_spool()->set_dir(dir.string());
    config.mutable_dev()->set_enabled(dev_enabled);
    agent = std::make_unique<vigil::agent::Agent>(config, std::make_shared<AcceptAll>());
  }

  ~Fixture() {
    agent.reset();
    std::filesystem::remove_all(dir);
  }

  std::size_t Queued() const {
    return agent->Capture().Queue()->Size();
  }
};

void TestSplitWords() {
  const auto words = vigil::agent::SplitWords("  dev\tstart  u-1   speed ");
  assert(words.size() == 4);
  assert(words[0] == "dev");
  assert(words[1] == "start");
  assert(words[2] == "u-1");
  assert(words[3] == "speed");
  assert(vigil::agent::SplitWords("   ").empty());
}

void TestBlankAndCommentLinesAreIgnored() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  for (const char* line : {"", "   ", "# comment", "  # indented comment"}) {
    const auto reply = feed.Handle(line, 0);
    assert(reply.ok);
    assert(reply.message.empty());
  }
  assert(f.Queued() == 0);
}

void TestEventLinesAreCaptured() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  auto reply = feed.Handle(R"({"ts":"5000","dir":"serverbound","pkt":"PLAYER_POSITION","uuid":"u-1","fields":{"x":1.5}})", 5000);
  assert(reply.ok);
  assert(reply.message.empty());
  assert(f.Queued() == 1);

  // no identity: dropped and counted, not an input error
  reply = feed.Handle(R"({"ts":"5001","pkt":"PLAYER_POSITION"})", 5001);
  assert(reply.ok);
  assert(f.Queued() == 1);
  assert(f.agent->Capture().Stats().unresolved == 1);

  reply = feed.Handle(R"({"ts":"5002","pkt":"PLAYER_POSITION","uuid":"u-1","dir":"sideways"})", 5002);
  assert(!reply.ok);
  assert(reply.message.find("bad event") == 0);

  reply = feed.Handle(R"({"pkt":)", 5003);
  assert(!reply.ok);
  assert(f.Queued() == 1);
}

void TestJoinGraceAndExemptions() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  auto reply = feed.Handle("join u-1 Steve", 10000);
  assert(reply.ok);
  assert(reply.message == "joined u-1");

  // inside the join grace window
  feed.Handle(R"({"ts":"11000","pkt":"PLAYER_POSITION","uuid":"u-1"})", 11000);
  assert(f.Queued() == 0);
  assert(f.agent->Capture().Stats().exempt == 1);

  // after it
  feed.Handle(R"({"ts":"13000","pkt":"PLAYER_POSITION","uuid":"u-1"})", 13000);
  assert(f.Queued() == 1);

  reply = feed.Handle("exempt u-1 teleport 2", 20000);
  assert(reply.ok);
  assert(reply.message == "exempted u-1 (teleport)");
  feed.Handle(R"({"ts":"21000","pkt":"PLAYER_POSITION","uuid":"u-1"})", 21000);
  assert(f.Queued() == 1);
  feed.Handle(R"({"ts":"22000","pkt":"PLAYER_POSITION","uuid":"u-1"})", 22000);
  assert(f.Queued() == 2);

  assert(!feed.Handle("exempt u-1 gliding 2", 0).ok);
  assert(!feed.Handle("exempt u-1 teleport 0", 0).ok);
  assert(!feed.Handle("exempt u-1 teleport soon", 0).ok);

  reply = feed.Handle("transfer u-1", 30000);
  assert(reply.ok);
  feed.Handle(R"({"ts":"30100","pkt":"PLAYER_POSITION","uuid":"u-1"})", 30100);
  assert(f.Queued() == 2);

  reply = feed.Handle("quit u-1", 40000);
  assert(reply.ok);
  assert(reply.message == "quit u-1");
}

void TestDevCommands() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  auto reply = feed.Handle("dev start u-2 killaura 20 3 5", 1000);
  assert(reply.ok);
  assert(reply.message.find("dev started session=") == 0);
  assert(reply.message.find("label=killaura") != std::string::npos);
  // start marker bypasses capture gating
  assert(f.Queued() == 1);
  assert(f.agent->Dev().ActiveSessions() == 1);

  // one session per entity
  reply = feed.Handle("dev start u-2 other", 1100);
  assert(!reply.ok);

  reply = feed.Handle("dev status u-2", 1200);
  assert(reply.ok);
  assert(reply.message.find("entity=u-2") != std::string::npos);

  assert(!feed.Handle("dev start u-2 killaura x", 1300).ok);
  assert(!feed.Handle("dev start u-3", 1300).ok);
  assert(!feed.Handle("dev launch u-2", 1300).ok);

  reply = feed.Handle("dev stop u-2", 2000);
  assert(reply.ok);
  assert(reply.message == "dev stopped u-2");
  assert(f.Queued() == 2);

  reply = feed.Handle("dev stop u-2", 2100);
  assert(!reply.ok);

  reply = feed.Handle("dev status u-2", 2200);
  assert(reply.ok);
  assert(reply.message == "no dev session for u-2");
}

void TestDevDisabledRejectsStart() {
  Fixture                   f(false);
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  const auto reply = feed.Handle("dev start u-2 killaura", 1000);
  assert(!reply.ok);
  assert(f.Queued() == 0);
}

void TestStatsAndReload() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, [&f] { ++f.reloads; });

  feed.Handle(R"({"ts":"5000","pkt":"PLAYER_POSITION","uuid":"u-1"})", 5000);
  auto reply = feed.Handle("stats", 5000);
  assert(reply.ok);
  assert(reply.message.find("enqueued=1") == 0);
  assert(reply.message.find("queue=1/64") != std::string::npos);
  assert(reply.message.find(" malformed=0 ") != std::string::npos);
  assert(reply.message.find("dev_sessions=0") != std::string::npos);

  reply = feed.Handle("reload", 5000);
  assert(reply.ok);
  assert(f.reloads == 1);

  assert(!feed.Handle("reload now", 5000).ok);
  assert(!feed.Handle("stats please", 5000).ok);

  vigil::agent::CommandFeed without_reload(*f.agent, nullptr);
  assert(!without_reload.Handle("reload", 5000).ok);
}

void TestUnknownCommand() {
  Fixture                   f;
  vigil::agent::CommandFeed feed(*f.agent, nullptr);

  const auto reply = feed.Handle("teleport u-1", 0);
  assert(!reply.ok);
  assert(reply.message == "unrecognized command: teleport u-1");
  assert(!feed.Handle("join", 0).ok);
  assert(!feed.Handle("quit a b", 0).ok);
}

} // namespace

int main() {
  TestSplitWords();
  TestBlankAndCommentLinesAreIgnored();
  TestEventLinesAreCaptured();
  TestJoinGraceAndExemptions();
  TestDevCommands();
  TestDevDisabledRejectsStart();
  TestStatsAndReload();
  TestUnknownCommand();

  std::cout << "vigil_command_feed_test: pass\n";
  return 0;
}
