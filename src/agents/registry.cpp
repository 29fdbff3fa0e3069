#include "kild/agents/registry.hpp"

#include "kild/agents/backends.hpp"
#include "kild/common/fs.hpp"

namespace kild::agents {

AgentRegistry::AgentRegistry(std::vector<std::unique_ptr<IAgentBackend>> backends)
    : backends_(std::move(backends)) {
  for (const auto &backend : backends_) {
    by_name_[common::to_lower(std::string(backend->name()))] = backend.get();
  }
}

const IAgentBackend *AgentRegistry::find(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(common::trim(std::string(name))));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

common::Result<const IAgentBackend *, AgentError>
AgentRegistry::resolve(const std::string &name) const {
  using ResolveResult = common::Result<const IAgentBackend *, AgentError>;
  const IAgentBackend *backend = find(name);
  if (backend == nullptr) {
    std::string known;
    for (const auto &entry : names()) {
      known += known.empty() ? entry : ", " + entry;
    }
    return ResolveResult::failure(AgentError{
        .kind = AgentErrorKind::UnknownAgent,
        .message = "unknown agent '" + name + "' (known agents: " + known + ")"});
  }
  if (!backend->is_available()) {
    return ResolveResult::failure(AgentError{
        .kind = AgentErrorKind::AgentNotAvailable,
        .message = std::string(backend->display_name()) + " is not installed ('" +
                   std::string(backend->default_command()) + "' not found on PATH)"});
  }
  return ResolveResult::success(backend);
}

std::vector<std::string> AgentRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(backends_.size());
  for (const auto &backend : backends_) {
    out.emplace_back(backend->name());
  }
  return out;
}

AgentRegistry AgentRegistry::create_default(common::ICommandRunner &runner) {
  std::vector<std::unique_ptr<IAgentBackend>> backends;
  backends.push_back(std::make_unique<AmpBackend>(runner));
  backends.push_back(std::make_unique<ClaudeBackend>(runner));
  backends.push_back(std::make_unique<CodexBackend>(runner));
  backends.push_back(std::make_unique<GeminiBackend>(runner));
  backends.push_back(std::make_unique<KiroBackend>(runner));
  backends.push_back(std::make_unique<OpencodeBackend>(runner));
  return AgentRegistry(std::move(backends));
}

const AgentRegistry &builtin_agent_registry() {
  static common::CliCommandRunner runner;
  static const AgentRegistry registry = AgentRegistry::create_default(runner);
  return registry;
}

std::string resolve_agent_command(const IAgentBackend &backend, const std::string &configured) {
  const std::string trimmed = common::trim(configured);
  if (!trimmed.empty()) {
    return trimmed;
  }
  return std::string(backend.default_command());
}

} // namespace kild::agents
