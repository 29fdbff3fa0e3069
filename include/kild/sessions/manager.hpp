#pragma once

#include "kild/agents/registry.hpp"
#include "kild/common/result.hpp"
#include "kild/config/schema.hpp"
#include "kild/git/worktree.hpp"
#include "kild/sessions/status.hpp"
#include "kild/sessions/store.hpp"
#include "kild/sessions/types.hpp"
#include "kild/wait/poller.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
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

struct CreateRequest {
  std::string branch;
  std::string agent;
  std::optional<std::string> note;
  std::filesystem::path project_path;
  std::optional<agents::RuntimeMode> runtime;
  std::string terminal;
};

struct OpenRequest {
  std::string branch;
  std::string agent;
  std::optional<agents::RuntimeMode> runtime;
  std::string terminal;
};

struct BulkResult {
  std::vector<std::string> succeeded;
  std::vector<std::pair<std::string, SessionError>> failed;

  [[nodiscard]] bool ok() const { return failed.empty(); }
};

class LifecycleManager {
public:
  LifecycleManager(const config::Config &config, SessionStore store,
                   const agents::AgentRegistry &agents,
                   const terminal::TerminalRegistry &terminals, process::IProcessTable &processes,
                   git::IWorktreeManager &worktrees, daemon::IDaemonClient *daemon);

  /// New worktree, port range and first agent. Nothing is saved unless every step succeeds.
  [[nodiscard]] common::Result<Session, SessionError> create(const CreateRequest &request);

  [[nodiscard]] common::Result<Session, SessionError> open(const OpenRequest &request);

  /// Close terminals, kill processes, drop pid files and the status sidecar, then mark the
  /// session Stopped with every handle cleared. Safe to repeat.
  [[nodiscard]] common::Result<void, SessionError> stop(const std::string &branch);

  /// Stop, tear down daemon sessions, remove the worktree, then delete the record and its
  /// sidecars. Without `force`, uncommitted changes abort and keep the record.
  [[nodiscard]] common::Result<void, SessionError> destroy(const std::string &branch, bool force);

  [[nodiscard]] BulkResult stop_all();

  [[nodiscard]] common::Result<std::vector<Session>, SessionError> list() const;
  [[nodiscard]] common::Result<Session, SessionError> get(const std::string &branch) const;
  [[nodiscard]] common::Result<SessionResolution, SessionError>
  status(const std::string &branch) const;

  [[nodiscard]] wait::PollResult<SessionResolution, SessionError>
  wait_for_status(const std::string &branch, ProcessStatus wanted,
                  std::chrono::milliseconds timeout,
                  std::chrono::milliseconds interval = wait::DEFAULT_POLL_INTERVAL) const;

  [[nodiscard]] common::Result<void, SessionError> report_agent_status(const std::string &branch,
                                                                       AgentActivity activity);

  [[nodiscard]] const SessionStore &store() const { return store_; }
  [[nodiscard]] StatusResolver resolver() const;

private:
  [[nodiscard]] common::Result<AgentProcess, SessionError>
  launch_agent(const Session &session, const std::string &agent_name, agents::RuntimeMode mode,
               const std::string &terminal) const;
  [[nodiscard]] agents::RuntimeMode default_runtime_mode() const;

  [[nodiscard]] common::Result<void, SessionError> stop_session(Session session);
  [[nodiscard]] common::Result<void, SessionError> terminate_agents(const Session &session,
                                                                    const std::string &operation);
  void destroy_daemon_sessions(const Session &session, bool force) const;
  void remove_pid_files(const Session &session, const std::string &operation) const;
  void remove_sidecars(const Session &session, const std::string &operation,
                       bool include_pr) const;

  const config::Config &config_;
  SessionStore store_;
  const agents::AgentRegistry &agents_;
  const terminal::TerminalRegistry &terminals_;
  process::IProcessTable &processes_;
  git::IWorktreeManager &worktrees_;
  daemon::IDaemonClient *daemon_;
};

} // namespace kild::sessions
