#pragma once

#include "kild/sessions/types.hpp"

#include <string_view>
#include <vector>

namespace kild::daemon {
class IDaemonClient;
}
namespace kild::process {
class IProcessTable;
}
namespace kild::terminal {
class TerminalRegistry;
}

namespace kild::sessions {

enum class ProcessStatus { Running, Stopped, Unknown };

[[nodiscard]] std::string_view to_string(ProcessStatus status);

struct SessionResolution {
  ProcessStatus status = ProcessStatus::Stopped;
  /// Some agent could not be checked. Diagnostic only; never changes `status`.
  bool any_unknown = false;
  std::vector<ProcessStatus> agents;
};

class StatusResolver {
public:
  /// `daemon` may be null; daemon handles then resolve to Stopped.
  StatusResolver(const process::IProcessTable &processes,
                 const terminal::TerminalRegistry &terminals, daemon::IDaemonClient *daemon);

  [[nodiscard]] ProcessStatus resolve_agent(const AgentProcess &agent) const;
  [[nodiscard]] SessionResolution resolve(const Session &session) const;

private:
  [[nodiscard]] ProcessStatus resolve_local(const agents::LocalHandle &handle) const;
  [[nodiscard]] ProcessStatus resolve_terminal(const agents::TerminalHandle &handle) const;
  [[nodiscard]] ProcessStatus resolve_daemon(const agents::DaemonHandle &handle) const;

  const process::IProcessTable &processes_;
  const terminal::TerminalRegistry &terminals_;
  daemon::IDaemonClient *daemon_;
};

} // namespace kild::sessions
