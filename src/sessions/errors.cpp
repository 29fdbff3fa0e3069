#include "kild/sessions/errors.hpp"

#include "kild/agents/agent.hpp"
#include "kild/daemon/errors.hpp"
#include "kild/git/errors.hpp"
#include "kild/process/process.hpp"
#include "kild/terminal/terminal.hpp"

namespace kild::sessions {

std::string_view SessionError::code() const {
  switch (kind) {
  case SessionErrorKind::NotFound:
    return "SESSION_NOT_FOUND";
  case SessionErrorKind::AlreadyExists:
    return "SESSION_ALREADY_EXISTS";
  case SessionErrorKind::WorktreeNotFound:
    return "WORKTREE_NOT_FOUND";
  case SessionErrorKind::InvalidName:
    return "INVALID_NAME";
  case SessionErrorKind::InvalidCommand:
    return "INVALID_COMMAND";
  case SessionErrorKind::InvalidPortCount:
    return "INVALID_PORT_COUNT";
  case SessionErrorKind::PortRangeExhausted:
    return "PORT_RANGE_EXHAUSTED";
  case SessionErrorKind::InvalidProcessMetadata:
    return "INVALID_PROCESS_METADATA";
  case SessionErrorKind::InvalidStructure:
    return "INVALID_STRUCTURE";
  case SessionErrorKind::UncommittedChanges:
    return "UNCOMMITTED_CHANGES";
  case SessionErrorKind::ProcessKillFailed:
    return "PROCESS_KILL_FAILED";
  case SessionErrorKind::ProcessAccessDenied:
    return "PROCESS_ACCESS_DENIED";
  case SessionErrorKind::GitError:
    return "GIT_ERROR";
  case SessionErrorKind::TerminalError:
    return "TERMINAL_ERROR";
  case SessionErrorKind::AgentError:
    return "AGENT_ERROR";
  case SessionErrorKind::DaemonError:
    return "DAEMON_ERROR";
  case SessionErrorKind::IoError:
    return "IO_ERROR";
  }
  return "IO_ERROR";
}

bool SessionError::is_user_error() const {
  switch (kind) {
  case SessionErrorKind::NotFound:
  case SessionErrorKind::AlreadyExists:
  case SessionErrorKind::WorktreeNotFound:
  case SessionErrorKind::InvalidName:
  case SessionErrorKind::InvalidCommand:
  case SessionErrorKind::InvalidPortCount:
  case SessionErrorKind::UncommittedChanges:
    return true;
  default:
    return false;
  }
}

SessionError SessionError::not_found(const std::string &branch) {
  return SessionError{.kind = SessionErrorKind::NotFound,
                      .message = "no kild found for branch '" + branch + "'"};
}

SessionError SessionError::io(std::string message) {
  return SessionError{.kind = SessionErrorKind::IoError, .message = std::move(message)};
}

SessionError SessionError::from(const git::GitError &error) {
  switch (error.kind) {
  case git::GitErrorKind::UncommittedChanges:
    return SessionError{.kind = SessionErrorKind::UncommittedChanges, .message = error.message};
  case git::GitErrorKind::InvalidBranchName:
    return SessionError{.kind = SessionErrorKind::InvalidName, .message = error.message};
  default:
    return SessionError{.kind = SessionErrorKind::GitError,
                        .message = std::string(error.code()) + ": " + error.message};
  }
}

SessionError SessionError::from(const agents::AgentError &error) {
  return SessionError{.kind = SessionErrorKind::AgentError,
                      .message = std::string(error.code()) + ": " + error.message};
}

SessionError SessionError::from(const process::ProcessError &error) {
  if (error.kind == process::ProcessErrorKind::AccessDenied) {
    return SessionError{.kind = SessionErrorKind::ProcessAccessDenied, .message = error.message};
  }
  return SessionError{.kind = SessionErrorKind::ProcessKillFailed, .message = error.message};
}

SessionError SessionError::from(const terminal::TerminalError &error) {
  return SessionError{.kind = SessionErrorKind::TerminalError,
                      .message = std::string(error.code()) + ": " + error.message};
}

SessionError SessionError::from(const daemon::DaemonError &error) {
  return SessionError{.kind = SessionErrorKind::DaemonError,
                      .message = std::string(error.code()) + ": " + error.message};
}

} // namespace kild::sessions
