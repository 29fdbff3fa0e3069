#pragma once

#include "kild/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kild::terminal {

enum class TerminalErrorKind { NotAvailable, UnknownTerminal, SpawnFailed, CloseFailed, QueryFailed };

struct TerminalError {
  TerminalErrorKind kind = TerminalErrorKind::SpawnFailed;
  std::string message;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const {
    return kind == TerminalErrorKind::NotAvailable || kind == TerminalErrorKind::UnknownTerminal;
  }
};

struct SpawnConfig {
  std::filesystem::path working_dir;
  std::string command;
  std::string title;
};

class ITerminalBackend {
public:
  virtual ~ITerminalBackend() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view display_name() const = 0;
  [[nodiscard]] virtual bool is_available() const = 0;

  [[nodiscard]] virtual common::Result<std::optional<std::string>, TerminalError>
  execute_spawn(const SpawnConfig &config) const = 0;

  /// Closing an untracked (nullopt) or already-closed window succeeds.
  [[nodiscard]] virtual common::Result<void, TerminalError>
  close_window(const std::optional<std::string> &window_id) const = 0;

  /// nullopt when the backend cannot tell.
  [[nodiscard]] virtual common::Result<std::optional<bool>, TerminalError>
  is_window_open(const std::string &window_id) const = 0;
};

} // namespace kild::terminal
