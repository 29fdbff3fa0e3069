#pragma once

#include <string>
#include <string_view>

namespace kild::daemon {

enum class DaemonErrorKind {
  NotRunning,
  ConnectionFailed,
  Timeout,
  ProtocolError,
  /// The daemon answered with an error of its own; `daemon_code` carries it.
  DaemonReported,
};

struct DaemonError {
  DaemonErrorKind kind = DaemonErrorKind::ConnectionFailed;
  std::string message;
  std::string daemon_code;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const { return kind == DaemonErrorKind::NotRunning; }
  [[nodiscard]] bool is_unreachable() const;
};

} // namespace kild::daemon
