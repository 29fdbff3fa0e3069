#pragma once

#include <string>
#include <string_view>

namespace kild::agents {
struct AgentError;
}
namespace kild::daemon {
struct DaemonError;
}
namespace kild::git {
struct GitError;
}
namespace kild::process {
struct ProcessError;
}
namespace kild::terminal {
struct TerminalError;
}

namespace kild::sessions {

enum class SessionErrorKind {
  NotFound,
  AlreadyExists,
  WorktreeNotFound,
  InvalidName,
  InvalidCommand,
  InvalidPortCount,
  PortRangeExhausted,
  InvalidProcessMetadata,
  InvalidStructure,
  UncommittedChanges,
  ProcessKillFailed,
  ProcessAccessDenied,
  GitError,
  TerminalError,
  AgentError,
  DaemonError,
  IoError,
};

struct SessionError {
  SessionErrorKind kind = SessionErrorKind::IoError;
  std::string message;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const;

  [[nodiscard]] static SessionError not_found(const std::string &branch);
  [[nodiscard]] static SessionError io(std::string message);
  [[nodiscard]] static SessionError from(const git::GitError &error);
  [[nodiscard]] static SessionError from(const agents::AgentError &error);
  [[nodiscard]] static SessionError from(const process::ProcessError &error);
  [[nodiscard]] static SessionError from(const terminal::TerminalError &error);
  [[nodiscard]] static SessionError from(const daemon::DaemonError &error);
};

} // namespace kild::sessions
