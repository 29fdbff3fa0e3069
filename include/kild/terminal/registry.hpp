#pragma once

#include "kild/common/command.hpp"
#include "kild/terminal/terminal.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kild::terminal {

class TerminalRegistry {
public:
  explicit TerminalRegistry(std::vector<std::unique_ptr<ITerminalBackend>> backends);

  TerminalRegistry(TerminalRegistry &&) = default;
  TerminalRegistry &operator=(TerminalRegistry &&) = default;
  TerminalRegistry(const TerminalRegistry &) = delete;
  TerminalRegistry &operator=(const TerminalRegistry &) = delete;

  [[nodiscard]] const ITerminalBackend *find(std::string_view name) const;

  [[nodiscard]] common::Result<const ITerminalBackend *, TerminalError>
  resolve(const std::string &preferred) const;

  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] static TerminalRegistry create_default(common::ICommandRunner &runner);

private:
  std::vector<std::unique_ptr<ITerminalBackend>> backends_;
  std::unordered_map<std::string, ITerminalBackend *> by_name_;
};

[[nodiscard]] const TerminalRegistry &builtin_terminal_registry();

} // namespace kild::terminal
