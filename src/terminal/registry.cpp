#include "kild/terminal/registry.hpp"

#include "kild/common/fs.hpp"
#include "kild/terminal/alacritty.hpp"
#include "kild/terminal/tmux.hpp"

namespace kild::terminal {

TerminalRegistry::TerminalRegistry(std::vector<std::unique_ptr<ITerminalBackend>> backends)
    : backends_(std::move(backends)) {
  for (const auto &backend : backends_) {
    by_name_[common::to_lower(std::string(backend->name()))] = backend.get();
  }
}

const ITerminalBackend *TerminalRegistry::find(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

common::Result<const ITerminalBackend *, TerminalError>
TerminalRegistry::resolve(const std::string &preferred) const {
  using ResolveResult = common::Result<const ITerminalBackend *, TerminalError>;
  const std::string wanted = common::trim(preferred);
  if (!wanted.empty()) {
    const ITerminalBackend *backend = find(wanted);
    if (backend == nullptr) {
      return ResolveResult::failure(TerminalError{.kind = TerminalErrorKind::UnknownTerminal,
                                                  .message = "unknown terminal '" + wanted + "'"});
    }
    if (!backend->is_available()) {
      return ResolveResult::failure(
          TerminalError{.kind = TerminalErrorKind::NotAvailable,
                        .message = "terminal '" + wanted + "' is not available"});
    }
    return ResolveResult::success(backend);
  }

  for (const auto &backend : backends_) {
    if (backend->is_available()) {
      return ResolveResult::success(backend.get());
    }
  }
  return ResolveResult::failure(TerminalError{.kind = TerminalErrorKind::NotAvailable,
                                              .message = "no supported terminal is available"});
}

std::vector<std::string> TerminalRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(backends_.size());
  for (const auto &backend : backends_) {
    out.emplace_back(backend->name());
  }
  return out;
}

TerminalRegistry TerminalRegistry::create_default(common::ICommandRunner &runner) {
  std::vector<std::unique_ptr<ITerminalBackend>> backends;
  backends.push_back(std::make_unique<TmuxBackend>(runner));
  backends.push_back(std::make_unique<AlacrittyBackend>(runner));
  return TerminalRegistry(std::move(backends));
}

const TerminalRegistry &builtin_terminal_registry() {
  static common::CliCommandRunner runner;
  static const TerminalRegistry registry = TerminalRegistry::create_default(runner);
  return registry;
}

} // namespace kild::terminal
