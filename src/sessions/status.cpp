#include "kild/sessions/status.hpp"

#include "kild/daemon/client.hpp"
#include "kild/observability/global.hpp"
#include "kild/process/process.hpp"
#include "kild/terminal/registry.hpp"

namespace kild::sessions {

std::string_view to_string(const ProcessStatus status) {
  switch (status) {
  case ProcessStatus::Running:
    return "running";
  case ProcessStatus::Stopped:
    return "stopped";
  case ProcessStatus::Unknown:
    return "unknown";
  }
  return "unknown";
}

StatusResolver::StatusResolver(const process::IProcessTable &processes,
                               const terminal::TerminalRegistry &terminals,
                               daemon::IDaemonClient *daemon)
    : processes_(processes), terminals_(terminals), daemon_(daemon) {}

ProcessStatus StatusResolver::resolve_local(const agents::LocalHandle &handle) const {
  auto found = processes_.find(handle.pid);
  if (!found.ok()) {
    observability::record_warning("status", "process check failed for pid " +
                                                std::to_string(handle.pid) + ": " +
                                                found.error().message);
    return ProcessStatus::Unknown;
  }
  if (!found.value().has_value()) {
    return ProcessStatus::Stopped;
  }
  const std::optional<std::uint64_t> start_time =
      handle.start_time != 0 ? std::optional<std::uint64_t>(handle.start_time) : std::nullopt;
  const std::optional<std::string> name =
      handle.process_name.empty() ? std::nullopt : std::optional<std::string>(handle.process_name);
  return process::same_process(*found.value(), name, start_time) ? ProcessStatus::Running
                                                                 : ProcessStatus::Stopped;
}

ProcessStatus StatusResolver::resolve_terminal(const agents::TerminalHandle &handle) const {
  if (!handle.window_id.has_value() || handle.window_id->empty()) {
    return ProcessStatus::Unknown;
  }
  const terminal::ITerminalBackend *backend = terminals_.find(handle.terminal_type);
  if (backend == nullptr) {
    observability::record_warning("status", "unknown terminal '" + handle.terminal_type + "'");
    return ProcessStatus::Unknown;
  }
  auto open = backend->is_window_open(*handle.window_id);
  if (!open.ok()) {
    observability::record_warning("status", "window check failed for " + *handle.window_id +
                                                ": " + open.error().message);
    return ProcessStatus::Unknown;
  }
  if (!open.value().has_value()) {
    return ProcessStatus::Unknown;
  }
  return *open.value() ? ProcessStatus::Running : ProcessStatus::Stopped;
}

ProcessStatus StatusResolver::resolve_daemon(const agents::DaemonHandle &handle) const {
  if (daemon_ == nullptr) {
    observability::record_warning("status", "no daemon client configured for session " +
                                                handle.session_id);
    return ProcessStatus::Stopped;
  }
  auto status = daemon_->get_session_status(handle.session_id);
  if (!status.ok()) {
    const auto &error = status.error();
    observability::record_warning("status", "daemon query for " + handle.session_id +
                                                " failed: " + error.message);
    return error.is_unreachable() ? ProcessStatus::Stopped : ProcessStatus::Unknown;
  }
  switch (status.value()) {
  case daemon::DaemonSessionStatus::Running:
  case daemon::DaemonSessionStatus::Creating:
    return ProcessStatus::Running;
  case daemon::DaemonSessionStatus::Stopped:
  case daemon::DaemonSessionStatus::NotFound:
    return ProcessStatus::Stopped;
  }
  return ProcessStatus::Stopped;
}

ProcessStatus StatusResolver::resolve_agent(const AgentProcess &agent) const {
  const auto &handles = agent.handles;
  if (handles.local.has_value()) {
    return resolve_local(*handles.local);
  }
  if (handles.terminal.has_value()) {
    return resolve_terminal(*handles.terminal);
  }
  if (handles.daemon.has_value()) {
    return resolve_daemon(*handles.daemon);
  }
  return ProcessStatus::Stopped;
}

SessionResolution StatusResolver::resolve(const Session &session) const {
  SessionResolution resolution;
  resolution.agents.reserve(session.agents.size());
  for (const auto &agent : session.agents) {
    const ProcessStatus status = resolve_agent(agent);
    resolution.agents.push_back(status);
    if (status == ProcessStatus::Running) {
      resolution.status = ProcessStatus::Running;
    } else if (status == ProcessStatus::Unknown) {
      resolution.any_unknown = true;
    }
  }
  return resolution;
}

} // namespace kild::sessions
