#pragma once

#include "kild/agents/agent.hpp"
#include "kild/common/command.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kild::agents {

class AgentRegistry {
public:
  explicit AgentRegistry(std::vector<std::unique_ptr<IAgentBackend>> backends);

  AgentRegistry(AgentRegistry &&) = default;
  AgentRegistry &operator=(AgentRegistry &&) = default;
  AgentRegistry(const AgentRegistry &) = delete;
  AgentRegistry &operator=(const AgentRegistry &) = delete;

  [[nodiscard]] const IAgentBackend *find(std::string_view name) const;

  [[nodiscard]] common::Result<const IAgentBackend *, AgentError>
  resolve(const std::string &name) const;

  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] const std::vector<std::unique_ptr<IAgentBackend>> &backends() const {
    return backends_;
  }

  [[nodiscard]] static AgentRegistry create_default(common::ICommandRunner &runner);

private:
  std::vector<std::unique_ptr<IAgentBackend>> backends_;
  std::unordered_map<std::string, IAgentBackend *> by_name_;
};

[[nodiscard]] const AgentRegistry &builtin_agent_registry();

[[nodiscard]] std::string resolve_agent_command(const IAgentBackend &backend,
                                                const std::string &configured);

} // namespace kild::agents
