#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::agent {

class Agent;

struct CommandReply {
  bool        ok = true;
  // empty for captured events, so bulk input stays quiet
  std::string message;
};

/*
  Line protocol fed to the agent on stdin.

      {...}                                   PacketEvent JSON, captured
      join <entity> [name]                    connect, starts join grace
      quit <entity>                           disconnect
      transfer <entity>                       world/server transfer grace
      exempt <entity> <reason> <seconds>      explicit exemption
      dev start <entity> <label> [duration] [warmup] [toggle]
      dev stop <entity>
      dev status <entity>
      stats
      reload                                  re-reads the config file
*/
class CommandFeed {
 public:
  using ReloadFn = std::function<void()>;

  CommandFeed(Agent& agent, ReloadFn reload);

  CommandReply Handle(std::string_view line, int64_t now_ms);

 private:
  CommandReply HandleEvent(std::string_view line);
  CommandReply HandleDev(const std::vector<std::string>& args, int64_t now_ms);
  CommandReply Stats() const;

  Agent&   agent_;
  ReloadFn reload_;
};

std::vector<std::string> SplitWords(std::string_view line);

} // namespace vigil::agent
