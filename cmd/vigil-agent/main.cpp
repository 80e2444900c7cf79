#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <iostream>
#include <string>

#include "internal/agent/agent.hpp"
#include "internal/agent/command_feed.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

using vigil::agent::Agent;
using vigil::agent::CommandFeed;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

// Splits stdin into lines without blocking past the poll timeout, so a
// signal is noticed even while no input arrives.
class StdinLines {
 public:
  // false on EOF or a read error
  template <typename Fn>
  bool Pump(int timeout_ms, Fn&& on_line) {
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    const int ready = ::poll(&fd, 1, timeout_ms);
    if (ready < 0) return errno == EINTR;
    if (ready == 0) return true;

    char buf[8192];
    const auto n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0) return errno == EINTR || errno == EAGAIN;
    if (n == 0) {
      if (!pending_.empty()) on_line(pending_);
      pending_.clear();
      return false;
    }

    pending_.append(buf, static_cast<std::size_t>(n));
    std::size_t start = 0;
    for (auto pos = pending_.find('\n'); pos != std::string::npos; pos = pending_.find('\n', start)) {
      on_line(std::string_view(pending_).substr(start, pos - start));
      start = pos + 1;
    }
    pending_.erase(0, start);
    return true;
  }

 private:
  std::string pending_;
};

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: vigil-agent <agent.yaml> OR vigil-agent --config <agent.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = vigil::config::ConfigLoader::LoadAgentFromYaml(config_path);

    vigil::observability::InitializeTracing(config.observability());
    vigil::observability::InitializeMetrics(config.observability());
    vigil::observability::InitializeLogging(config.logging(), "vigil-agent");

    Agent agent(config);

    CommandFeed feed(agent, [&] {
      auto reloaded = vigil::config::ConfigLoader::LoadAgentFromYaml(config_path);
      agent.Reload(reloaded);
    });

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    agent.Start();
    VIGIL_LOG_INFO("Vigil capture agent started", {vigil::observability::StringField("source_id", config.source_id())});

    StdinLines input;
    while (g_running) {
      const bool open = input.Pump(250, [&](std::string_view line) {
        const auto reply = feed.Handle(line, vigil::util::NowUnixMillis());
        if (!reply.message.empty()) {
          (reply.ok ? std::cout : std::cerr) << reply.message << std::endl;
        }
      });
      if (!open) break;
    }

    VIGIL_LOG_INFO("Shutting down capture agent");

    agent.Stop();
    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    VIGIL_LOG_ERROR("Fatal error", {vigil::observability::StringField("error", e.what())});
    vigil::observability::ShutdownLogging();
    vigil::observability::ShutdownMetrics();
    vigil::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
