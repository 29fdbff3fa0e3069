#pragma once

#include "kild/common/command.hpp"
#include "kild/terminal/terminal.hpp"

namespace kild::terminal {

class TmuxBackend final : public ITerminalBackend {
public:
  explicit TmuxBackend(common::ICommandRunner &runner);

  [[nodiscard]] std::string_view name() const override { return "tmux"; }
  [[nodiscard]] std::string_view display_name() const override { return "tmux"; }
  [[nodiscard]] bool is_available() const override;

  [[nodiscard]] common::Result<std::optional<std::string>, TerminalError>
  execute_spawn(const SpawnConfig &config) const override;
  [[nodiscard]] common::Result<void, TerminalError>
  close_window(const std::optional<std::string> &window_id) const override;
  [[nodiscard]] common::Result<std::optional<bool>, TerminalError>
  is_window_open(const std::string &window_id) const override;

  [[nodiscard]] static std::string session_name_for(const std::string &title);

private:
  common::ICommandRunner &runner_;
};

} // namespace kild::terminal
