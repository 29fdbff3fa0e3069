#pragma once

#include "kild/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kild::terminal {
class TerminalRegistry;
}
namespace kild::daemon {
class IDaemonClient;
}
namespace kild::process {
class IProcessTable;
}

namespace kild::agents {

enum class AgentErrorKind { UnknownAgent, AgentNotAvailable, SpawnFailed };

struct AgentError {
  AgentErrorKind kind = AgentErrorKind::SpawnFailed;
  std::string message;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const {
    return kind == AgentErrorKind::UnknownAgent || kind == AgentErrorKind::AgentNotAvailable;
  }
};

enum class RuntimeMode { Terminal, Daemon, Local };

[[nodiscard]] std::string_view to_string(RuntimeMode mode);
[[nodiscard]] std::optional<RuntimeMode> runtime_mode_from_string(const std::string &text);

struct LocalHandle {
  int pid = 0;
  std::string process_name;
  std::uint64_t start_time = 0;
};

struct TerminalHandle {
  std::string terminal_type;
  std::optional<std::string> window_id;
};

struct DaemonHandle {
  std::string session_id;
};

/// Every way of finding a running agent again. More than one family may be set; status
/// resolution checks local, then terminal, then daemon.
struct AgentHandles {
  std::optional<LocalHandle> local;
  std::optional<TerminalHandle> terminal;
  std::optional<DaemonHandle> daemon;

  [[nodiscard]] bool has_any() const {
    return local.has_value() || terminal.has_value() || daemon.has_value();
  }
  void clear() {
    local.reset();
    terminal.reset();
    daemon.reset();
  }
};

struct SpawnRequest {
  std::string spawn_id;
  std::filesystem::path working_dir;
  std::string command;
  std::string title;
};

struct LaunchContext {
  RuntimeMode mode = RuntimeMode::Terminal;
  std::string terminal_preference;
  const terminal::TerminalRegistry *terminals = nullptr;
  daemon::IDaemonClient *daemon = nullptr;
  process::IProcessTable *processes = nullptr;
  std::filesystem::path pids_dir;
  std::chrono::milliseconds pid_wait{3000};
};

class IAgentBackend {
public:
  virtual ~IAgentBackend() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view display_name() const = 0;
  [[nodiscard]] virtual bool is_available() const = 0;
  [[nodiscard]] virtual std::string_view default_command() const = 0;
  [[nodiscard]] virtual std::vector<std::string> process_patterns() const = 0;

  [[nodiscard]] virtual common::Result<AgentHandles, AgentError>
  spawn(const SpawnRequest &request, const LaunchContext &context) const = 0;
};

} // namespace kild::agents
