#include "kild/agents/backends.hpp"

#include "kild/common/fs.hpp"
#include "kild/daemon/client.hpp"
#include "kild/observability/global.hpp"
#include "kild/process/pid_file.hpp"
#include "kild/process/process.hpp"
#include "kild/terminal/registry.hpp"

namespace kild::agents {

namespace {

AgentError spawn_failed(std::string message) {
  return AgentError{.kind = AgentErrorKind::SpawnFailed, .message = std::move(message)};
}

std::string first_word(std::string_view command) {
  const std::string trimmed = common::trim(std::string(command));
  const auto space = trimmed.find_first_of(" \t");
  return space == std::string::npos ? trimmed : trimmed.substr(0, space);
}

/// Look the freshly started process up so the record carries its start time.
common::Result<LocalHandle, AgentError> capture_local_handle(const process::IProcessTable &table,
                                                             const int pid) {
  auto found = table.find(pid);
  if (!found.ok()) {
    return common::Result<LocalHandle, AgentError>::failure(
        spawn_failed("unable to inspect pid " + std::to_string(pid) + ": " +
                     found.error().message));
  }
  if (!found.value().has_value()) {
    return common::Result<LocalHandle, AgentError>::failure(
        spawn_failed("agent process " + std::to_string(pid) + " exited immediately"));
  }
  const auto &info = *found.value();
  return common::Result<LocalHandle, AgentError>::success(
      LocalHandle{.pid = info.pid, .process_name = info.name, .start_time = info.start_time});
}

} // namespace

CommandAgentBackend::CommandAgentBackend(common::ICommandRunner &runner) : runner_(runner) {}

bool CommandAgentBackend::is_available() const {
  return runner_.command_exists(first_word(default_command()));
}

common::Result<AgentHandles, AgentError>
CommandAgentBackend::spawn(const SpawnRequest &request, const LaunchContext &context) const {
  if (common::trim(request.command).empty()) {
    return common::Result<AgentHandles, AgentError>::failure(
        spawn_failed("empty command for agent " + std::string(name())));
  }
  switch (context.mode) {
  case RuntimeMode::Local:
    return spawn_local(request, context);
  case RuntimeMode::Daemon:
    return spawn_in_daemon(request, context);
  case RuntimeMode::Terminal:
    break;
  }
  return spawn_in_terminal(request, context);
}

common::Result<AgentHandles, AgentError>
CommandAgentBackend::spawn_local(const SpawnRequest &request, const LaunchContext &context) const {
  using SpawnResult = common::Result<AgentHandles, AgentError>;
  if (context.processes == nullptr) {
    return SpawnResult::failure(spawn_failed("no process table for local launch"));
  }

  auto pid = runner_.spawn_detached({"sh", "-c", "exec " + request.command}, request.working_dir);
  if (!pid.ok()) {
    return SpawnResult::failure(spawn_failed(pid.error()));
  }
  auto handle = capture_local_handle(*context.processes, pid.value());
  if (!handle.ok()) {
    return SpawnResult::failure(handle.error());
  }

  AgentHandles handles;
  handles.local = handle.value();
  return SpawnResult::success(std::move(handles));
}

common::Result<AgentHandles, AgentError>
CommandAgentBackend::spawn_in_terminal(const SpawnRequest &request,
                                       const LaunchContext &context) const {
  using SpawnResult = common::Result<AgentHandles, AgentError>;
  if (context.terminals == nullptr) {
    return SpawnResult::failure(spawn_failed("no terminal registry for terminal launch"));
  }

  auto terminal = context.terminals->resolve(context.terminal_preference);
  if (!terminal.ok()) {
    return SpawnResult::failure(spawn_failed(std::string(terminal.error().code()) + ": " +
                                             terminal.error().message));
  }
  const terminal::ITerminalBackend &backend = *terminal.value();

  const auto pids_dir = common::ensure_dir(context.pids_dir);
  if (!pids_dir.ok()) {
    return SpawnResult::failure(spawn_failed(pids_dir.error()));
  }
  const auto pid_file = process::pid_file_path(context.pids_dir, request.spawn_id);
  if (auto stale = process::remove_pid_file(pid_file); !stale.ok()) {
    return SpawnResult::failure(spawn_failed(stale.error().message));
  }

  auto window = backend.execute_spawn(terminal::SpawnConfig{
      .working_dir = request.working_dir,
      .command = process::wrap_command_with_pid_capture(request.command, pid_file),
      .title = request.title});
  if (!window.ok()) {
    return SpawnResult::failure(spawn_failed(window.error().message));
  }

  AgentHandles handles;
  handles.terminal =
      TerminalHandle{.terminal_type = std::string(backend.name()), .window_id = window.value()};

  if (context.processes == nullptr) {
    return SpawnResult::success(std::move(handles));
  }

  auto pid = process::wait_for_pid_file(pid_file, context.pid_wait);
  if (!pid.ok()) {
    // The window is up; keep tracking it through the terminal handle alone.
    observability::record_warning("agents", "no pid for " + request.spawn_id + ": " +
                                                pid.error().message);
    return SpawnResult::success(std::move(handles));
  }
  auto local = capture_local_handle(*context.processes, pid.value().value);
  if (local.ok()) {
    handles.local = local.value();
  } else {
    observability::record_warning("agents", local.error().message);
  }
  return SpawnResult::success(std::move(handles));
}

common::Result<AgentHandles, AgentError>
CommandAgentBackend::spawn_in_daemon(const SpawnRequest &request,
                                     const LaunchContext &context) const {
  using SpawnResult = common::Result<AgentHandles, AgentError>;
  if (context.daemon == nullptr) {
    return SpawnResult::failure(spawn_failed("no daemon client for daemon launch"));
  }

  auto created = context.daemon->create_session(request.spawn_id, request.working_dir,
                                                request.command);
  if (!created.ok()) {
    return SpawnResult::failure(spawn_failed(std::string(created.error().code()) + ": " +
                                             created.error().message));
  }

  AgentHandles handles;
  handles.daemon = DaemonHandle{.session_id = created.value()};
  return SpawnResult::success(std::move(handles));
}

} // namespace kild::agents
