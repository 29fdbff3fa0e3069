#pragma once

#include "kild/common/command.hpp"
#include "kild/terminal/terminal.hpp"

#include <string>
#include <vector>

namespace kild::terminal {

class AlacrittyBackend final : public ITerminalBackend {
public:
  explicit AlacrittyBackend(common::ICommandRunner &runner);

  [[nodiscard]] std::string_view name() const override { return "alacritty"; }
  [[nodiscard]] std::string_view display_name() const override { return "Alacritty"; }
  [[nodiscard]] bool is_available() const override;

  [[nodiscard]] common::Result<std::optional<std::string>, TerminalError>
  execute_spawn(const SpawnConfig &config) const override;
  [[nodiscard]] common::Result<void, TerminalError>
  close_window(const std::optional<std::string> &window_id) const override;
  [[nodiscard]] common::Result<std::optional<bool>, TerminalError>
  is_window_open(const std::string &window_id) const override;

private:
  [[nodiscard]] common::Result<std::vector<std::string>, TerminalError> window_titles() const;

  common::ICommandRunner &runner_;
};

} // namespace kild::terminal
