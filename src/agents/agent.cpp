#include "kild/agents/agent.hpp"

#include "kild/common/fs.hpp"

namespace kild::agents {

std::string_view AgentError::code() const {
  switch (kind) {
  case AgentErrorKind::UnknownAgent:
    return "UNKNOWN_AGENT";
  case AgentErrorKind::AgentNotAvailable:
    return "AGENT_NOT_AVAILABLE";
  case AgentErrorKind::SpawnFailed:
    return "AGENT_SPAWN_FAILED";
  }
  return "AGENT_SPAWN_FAILED";
}

std::string_view to_string(const RuntimeMode mode) {
  switch (mode) {
  case RuntimeMode::Terminal:
    return "terminal";
  case RuntimeMode::Daemon:
    return "daemon";
  case RuntimeMode::Local:
    return "local";
  }
  return "terminal";
}

std::optional<RuntimeMode> runtime_mode_from_string(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "terminal") {
    return RuntimeMode::Terminal;
  }
  if (normalized == "daemon") {
    return RuntimeMode::Daemon;
  }
  if (normalized == "local") {
    return RuntimeMode::Local;
  }
  return std::nullopt;
}

} // namespace kild::agents
