#include "kild/sessions/manager.hpp"

#include "kild/common/fs.hpp"
#include "kild/daemon/client.hpp"
#include "kild/git/naming.hpp"
#include "kild/observability/global.hpp"
#include "kild/process/pid_file.hpp"
#include "kild/process/process.hpp"
#include "kild/terminal/registry.hpp"

namespace kild::sessions {

namespace {

std::string spawn_id_for(const Session &session) {
  return session.id + "_" + std::to_string(session.agents.size());
}

std::string pid_detail(const int pid) { return "pid=" + std::to_string(pid); }

} // namespace

LifecycleManager::LifecycleManager(const config::Config &config, SessionStore store,
                                   const agents::AgentRegistry &agents,
                                   const terminal::TerminalRegistry &terminals,
                                   process::IProcessTable &processes,
                                   git::IWorktreeManager &worktrees, daemon::IDaemonClient *daemon)
    : config_(config), store_(std::move(store)), agents_(agents), terminals_(terminals),
      processes_(processes), worktrees_(worktrees), daemon_(daemon) {}

StatusResolver LifecycleManager::resolver() const {
  return StatusResolver(processes_, terminals_, daemon_);
}

agents::RuntimeMode LifecycleManager::default_runtime_mode() const {
  return agents::runtime_mode_from_string(config_.runtime.mode)
      .value_or(agents::RuntimeMode::Terminal);
}

common::Result<AgentProcess, SessionError>
LifecycleManager::launch_agent(const Session &session, const std::string &agent_name,
                               const agents::RuntimeMode mode, const std::string &terminal) const {
  using LaunchResult = common::Result<AgentProcess, SessionError>;
  auto backend = agents_.resolve(agent_name);
  if (!backend.ok()) {
    return LaunchResult::failure(SessionError::from(backend.error()));
  }
  const agents::IAgentBackend &agent = *backend.value();

  std::string configured;
  if (const auto it = config_.agent.commands.find(std::string(agent.name()));
      it != config_.agent.commands.end()) {
    configured = it->second;
  }
  const std::string command = agents::resolve_agent_command(agent, configured);
  if (command.empty()) {
    return LaunchResult::failure(
        SessionError{.kind = SessionErrorKind::InvalidCommand,
                     .message = "no command configured for agent " + std::string(agent.name())});
  }

  const std::string spawn_id = spawn_id_for(session);
  const agents::LaunchContext context{
      .mode = mode,
      .terminal_preference = terminal.empty() ? config_.terminal.default_terminal : terminal,
      .terminals = &terminals_,
      .daemon = daemon_,
      .processes = &processes_,
      .pids_dir = config_.pids_dir,
      .pid_wait = std::chrono::milliseconds(config_.process.pid_wait_ms)};

  auto handles = agent.spawn(agents::SpawnRequest{.spawn_id = spawn_id,
                                                  .working_dir = session.worktree_path,
                                                  .command = command,
                                                  .title = spawn_id},
                             context);
  if (!handles.ok()) {
    return LaunchResult::failure(SessionError::from(handles.error()));
  }

  return LaunchResult::success(AgentProcess{.agent = std::string(agent.name()),
                                            .spawn_id = spawn_id,
                                            .command = command,
                                            .opened_at = common::now_rfc3339(),
                                            .handles = std::move(handles.value())});
}

common::Result<Session, SessionError> LifecycleManager::create(const CreateRequest &request) {
  using CreateResult = common::Result<Session, SessionError>;

  auto branch = git::validate_branch_name(request.branch);
  if (!branch.ok()) {
    return CreateResult::failure(SessionError::from(branch.error()));
  }
  const std::string agent_name =
      request.agent.empty() ? config_.agent.default_agent : common::to_lower(request.agent);
  observability::record_session_event("create", "started", branch.value(), "agent=" + agent_name);

  std::filesystem::path project_path = request.project_path;
  if (project_path.empty()) {
    std::error_code ec;
    project_path = std::filesystem::current_path(ec);
    if (ec) {
      return CreateResult::failure(
          SessionError::io("unable to determine the current directory: " + ec.message()));
    }
  }
  auto repo_root = worktrees_.repo_root(project_path);
  if (!repo_root.ok()) {
    return CreateResult::failure(SessionError::from(repo_root.error()));
  }

  Session session;
  session.project_id = git::project_id(repo_root.value());
  session.branch = branch.value();
  session.id = git::session_id(session.project_id, session.branch);
  if (store_.exists(session.id)) {
    return CreateResult::failure(
        SessionError{.kind = SessionErrorKind::AlreadyExists,
                     .message = "kild '" + session.branch + "' already exists"});
  }

  auto ports = store_.allocate_port_range(config_.ports.count, config_.ports.base);
  if (!ports.ok()) {
    return CreateResult::failure(ports.error());
  }
  session.port_range_start = ports.value().first;
  session.port_range_end = ports.value().second;
  session.port_count = config_.ports.count;

  session.worktree_path =
      git::worktree_path_for(config_.worktrees_dir, session.project_id, session.branch);
  if (auto created = worktrees_.create(repo_root.value(), session.worktree_path,
                                       git::kild_branch_name(session.branch));
      !created.ok()) {
    return CreateResult::failure(SessionError::from(created.error()));
  }
  observability::record_session_event("create", "worktree_created", session.id,
                                      session.worktree_path.string());

  const agents::RuntimeMode mode = request.runtime.value_or(default_runtime_mode());
  auto agent = launch_agent(session, agent_name, mode, request.terminal);
  if (!agent.ok()) {
    if (auto rollback = worktrees_.remove(session.worktree_path, true); !rollback.ok()) {
      observability::record_warning("create", "failed to remove worktree after launch error: " +
                                                  rollback.error().message);
    }
    return CreateResult::failure(agent.error());
  }

  session.agent = agent.value().agent;
  session.status = SessionStatus::Active;
  session.created_at = common::now_rfc3339();
  session.last_activity = session.created_at;
  session.note = request.note;
  session.runtime_mode = mode;
  session.agents.push_back(std::move(agent.value()));

  if (auto saved = store_.save(session); !saved.ok()) {
    return CreateResult::failure(saved.error());
  }
  observability::record_session_event("create", "completed", session.id,
                                      "agent=" + session.agent);
  return CreateResult::success(std::move(session));
}

common::Result<Session, SessionError> LifecycleManager::open(const OpenRequest &request) {
  using OpenResult = common::Result<Session, SessionError>;
  auto found = store_.find_by_branch(request.branch);
  if (!found.ok()) {
    return OpenResult::failure(found.error());
  }
  Session session = std::move(found.value());
  observability::record_session_event("open", "started", session.id);

  std::error_code ec;
  if (!std::filesystem::is_directory(session.worktree_path, ec)) {
    return OpenResult::failure(
        SessionError{.kind = SessionErrorKind::WorktreeNotFound,
                     .message = "worktree " + session.worktree_path.string() + " no longer exists"});
  }

  const std::string agent_name = !request.agent.empty() ? common::to_lower(request.agent)
                                 : !session.agent.empty() ? session.agent
                                                          : config_.agent.default_agent;
  const agents::RuntimeMode mode =
      request.runtime.value_or(session.runtime_mode.value_or(default_runtime_mode()));

  auto agent = launch_agent(session, agent_name, mode, request.terminal);
  if (!agent.ok()) {
    return OpenResult::failure(agent.error());
  }

  session.agents.push_back(std::move(agent.value()));
  session.status = SessionStatus::Active;
  session.last_activity = common::now_rfc3339();
  if (!session.runtime_mode.has_value()) {
    session.runtime_mode = mode;
  }
  if (auto saved = store_.save(session); !saved.ok()) {
    return OpenResult::failure(saved.error());
  }
  observability::record_session_event("open", "completed", session.id,
                                      "agents=" + std::to_string(session.agents.size()));
  return OpenResult::success(std::move(session));
}

common::Result<void, SessionError> LifecycleManager::terminate_agents(const Session &session,
                                                                      const std::string &operation) {
  std::vector<SessionError> kill_errors;
  for (const auto &agent : session.agents) {
    const auto &handles = agent.handles;
    if (handles.terminal.has_value()) {
      const terminal::ITerminalBackend *backend = terminals_.find(handles.terminal->terminal_type);
      if (backend == nullptr) {
        observability::record_warning(operation, "unknown terminal '" +
                                                     handles.terminal->terminal_type +
                                                     "', window left open");
      } else if (auto closed = backend->close_window(handles.terminal->window_id); !closed.ok()) {
        observability::record_warning(operation, "failed to close terminal: " +
                                                     closed.error().message);
      } else {
        observability::record_session_event(operation, "terminal_closed", session.id,
                                            handles.terminal->window_id.value_or(""));
      }
    }

    if (!handles.local.has_value()) {
      continue;
    }
    const auto &local = *handles.local;
    auto killed = processes_.kill(
        local.pid,
        local.process_name.empty() ? std::nullopt : std::optional<std::string>(local.process_name),
        local.start_time != 0 ? std::optional<std::uint64_t>(local.start_time) : std::nullopt);
    if (killed.ok()) {
      observability::record_session_event(operation, "kill_completed", session.id,
                                          pid_detail(local.pid));
    } else if (killed.error().kind == process::ProcessErrorKind::NotFound) {
      observability::record_session_event(operation, "kill_already_dead", session.id,
                                          pid_detail(local.pid));
    } else {
      observability::record_error(operation, "failed to kill " + pid_detail(local.pid) + ": " +
                                                 killed.error().message);
      kill_errors.push_back(SessionError::from(killed.error()));
    }
  }

  if (kill_errors.empty()) {
    return common::Result<void, SessionError>::success();
  }
  if (kill_errors.size() == 1) {
    return common::Result<void, SessionError>::failure(kill_errors.front());
  }
  return common::Result<void, SessionError>::failure(SessionError{
      .kind = kill_errors.front().kind,
      .message = std::to_string(kill_errors.size()) +
                 " processes failed to stop; kill them manually (first: " +
                 kill_errors.front().message + ")"});
}

void LifecycleManager::destroy_daemon_sessions(const Session &session, const bool force) const {
  for (const auto &agent : session.agents) {
    if (!agent.handles.daemon.has_value()) {
      continue;
    }
    const std::string &daemon_session = agent.handles.daemon->session_id;
    if (daemon_ == nullptr) {
      observability::record_warning("destroy", "no daemon client, daemon session " +
                                                   daemon_session + " left running");
      continue;
    }
    if (auto destroyed = daemon_->destroy_session(daemon_session, force); !destroyed.ok()) {
      observability::record_warning("destroy", "failed to destroy daemon session " +
                                                   daemon_session + ": " +
                                                   destroyed.error().message);
    } else {
      observability::record_session_event("destroy", "daemon_session_destroyed", session.id,
                                          daemon_session);
    }
  }
}

void LifecycleManager::remove_pid_files(const Session &session, const std::string &operation) const {
  for (const auto &agent : session.agents) {
    if (agent.spawn_id.empty()) {
      continue;
    }
    if (auto removed = process::remove_pid_file(process::pid_file_path(config_.pids_dir, agent.spawn_id));
        !removed.ok()) {
      observability::record_warning(operation, removed.error().message);
    }
  }
}

void LifecycleManager::remove_sidecars(const Session &session, const std::string &operation,
                                       const bool include_pr) const {
  if (auto removed = store_.remove_agent_status(session.id); !removed.ok()) {
    observability::record_warning(operation, removed.error().message);
  }
  if (!include_pr) {
    return;
  }
  if (auto removed = store_.remove_pr_info(session.id); !removed.ok()) {
    observability::record_warning(operation, removed.error().message);
  }
}

common::Result<void, SessionError> LifecycleManager::stop_session(Session session) {
  observability::record_session_event("stop", "started", session.id);
  if (auto terminated = terminate_agents(session, "stop"); !terminated.ok()) {
    return terminated;
  }
  remove_pid_files(session, "stop");
  remove_sidecars(session, "stop", false);

  if (!session.runtime_mode.has_value()) {
    bool has_daemon_agent = false;
    for (const auto &agent : session.agents) {
      has_daemon_agent = has_daemon_agent || agent.handles.daemon.has_value();
    }
    session.runtime_mode =
        has_daemon_agent ? agents::RuntimeMode::Daemon : agents::RuntimeMode::Terminal;
  }
  session.clear_handles();
  session.status = SessionStatus::Stopped;
  session.last_activity = common::now_rfc3339();
  if (auto saved = store_.save(session); !saved.ok()) {
    return saved;
  }
  observability::record_session_event("stop", "completed", session.id);
  return common::Result<void, SessionError>::success();
}

common::Result<void, SessionError> LifecycleManager::stop(const std::string &branch) {
  auto found = store_.find_by_branch(branch);
  if (!found.ok()) {
    return common::Result<void, SessionError>::failure(found.error());
  }
  return stop_session(std::move(found.value()));
}

BulkResult LifecycleManager::stop_all() {
  BulkResult result;
  auto sessions = store_.list();
  if (!sessions.ok()) {
    result.failed.emplace_back("*", sessions.error());
    return result;
  }
  for (auto &session : sessions.value()) {
    if (session.status != SessionStatus::Active) {
      continue;
    }
    const std::string branch = session.branch;
    if (auto stopped = stop_session(std::move(session)); stopped.ok()) {
      result.succeeded.push_back(branch);
    } else {
      result.failed.emplace_back(branch, stopped.error());
    }
  }
  return result;
}

common::Result<void, SessionError> LifecycleManager::destroy(const std::string &branch,
                                                             const bool force) {
  using DestroyResult = common::Result<void, SessionError>;
  auto found = store_.find_by_branch(branch);
  if (!found.ok()) {
    return DestroyResult::failure(found.error());
  }
  const Session &session = found.value();
  observability::record_session_event("destroy", "started", session.id,
                                      force ? "force=true" : "force=false");

  if (auto terminated = terminate_agents(session, "destroy"); !terminated.ok()) {
    return terminated;
  }
  destroy_daemon_sessions(session, force);

  if (auto removed = worktrees_.remove(session.worktree_path, force); !removed.ok()) {
    return DestroyResult::failure(SessionError::from(removed.error()));
  }
  observability::record_session_event("destroy", "worktree_removed", session.id,
                                      session.worktree_path.string());

  remove_pid_files(session, "destroy");
  remove_sidecars(session, "destroy", true);
  if (auto removed = store_.remove(session.id); !removed.ok()) {
    return removed;
  }
  observability::record_session_event("destroy", "completed", session.id);
  return DestroyResult::success();
}

common::Result<std::vector<Session>, SessionError> LifecycleManager::list() const {
  auto sessions = store_.list();
  if (sessions.ok()) {
    std::uint64_t active = 0;
    for (const auto &session : sessions.value()) {
      active += session.status == SessionStatus::Active ? 1 : 0;
    }
    observability::record_metric(observability::ActiveSessionsMetric{.count = active});
  }
  return sessions;
}

common::Result<Session, SessionError> LifecycleManager::get(const std::string &branch) const {
  return store_.find_by_branch(branch);
}

common::Result<SessionResolution, SessionError>
LifecycleManager::status(const std::string &branch) const {
  auto found = store_.find_by_branch(branch);
  if (!found.ok()) {
    return common::Result<SessionResolution, SessionError>::failure(found.error());
  }
  return common::Result<SessionResolution, SessionError>::success(resolver().resolve(found.value()));
}

wait::PollResult<SessionResolution, SessionError>
LifecycleManager::wait_for_status(const std::string &branch, const ProcessStatus wanted,
                                  const std::chrono::milliseconds timeout,
                                  const std::chrono::milliseconds interval) const {
  const StatusResolver status_resolver = resolver();
  const wait::Probe<SessionResolution, SessionError> probe =
      [this, &branch, wanted,
       &status_resolver]() -> common::Result<SessionResolution, wait::ProbeError<SessionError>> {
    using ProbeResult = common::Result<SessionResolution, wait::ProbeError<SessionError>>;
    auto found = store_.find_by_branch(branch);
    if (!found.ok()) {
      return ProbeResult::failure(
          wait::ProbeError<SessionError>::terminal(found.error(), found.error().message));
    }
    SessionResolution resolution = status_resolver.resolve(found.value());
    if (resolution.status != wanted) {
      return ProbeResult::failure(wait::ProbeError<SessionError>::retryable(
          SessionError{.kind = SessionErrorKind::NotFound,
                       .message = "'" + branch + "' is " +
                                  std::string(to_string(resolution.status))},
          "'" + branch + "' is " + std::string(to_string(resolution.status))));
    }
    return ProbeResult::success(std::move(resolution));
  };

  return wait::poll<SessionResolution, SessionError>(
      probe, wait::PollOptions{.timeout = timeout,
                               .interval = interval,
                               .target = "kild '" + branch + "' to be " +
                                         std::string(to_string(wanted))});
}

common::Result<void, SessionError>
LifecycleManager::report_agent_status(const std::string &branch, const AgentActivity activity) {
  auto found = store_.find_by_branch(branch);
  if (!found.ok()) {
    return common::Result<void, SessionError>::failure(found.error());
  }
  return store_.write_agent_status(
      found.value().id,
      AgentStatusInfo{.activity = activity, .updated_at = common::now_rfc3339()});
}

} // namespace kild::sessions
