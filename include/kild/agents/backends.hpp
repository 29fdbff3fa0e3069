#pragma once

#include "kild/agents/agent.hpp"
#include "kild/common/command.hpp"

namespace kild::agents {

class CommandAgentBackend : public IAgentBackend {
public:
  explicit CommandAgentBackend(common::ICommandRunner &runner);

  [[nodiscard]] bool is_available() const override;
  [[nodiscard]] common::Result<AgentHandles, AgentError>
  spawn(const SpawnRequest &request, const LaunchContext &context) const override;

private:
  [[nodiscard]] common::Result<AgentHandles, AgentError>
  spawn_local(const SpawnRequest &request, const LaunchContext &context) const;
  [[nodiscard]] common::Result<AgentHandles, AgentError>
  spawn_in_terminal(const SpawnRequest &request, const LaunchContext &context) const;
  [[nodiscard]] common::Result<AgentHandles, AgentError>
  spawn_in_daemon(const SpawnRequest &request, const LaunchContext &context) const;

  common::ICommandRunner &runner_;
};

class AmpBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "amp"; }
  [[nodiscard]] std::string_view display_name() const override { return "Amp"; }
  [[nodiscard]] std::string_view default_command() const override { return "amp"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override { return {"amp"}; }
};

class ClaudeBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "claude"; }
  [[nodiscard]] std::string_view display_name() const override { return "Claude Code"; }
  [[nodiscard]] std::string_view default_command() const override { return "claude"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override {
    return {"claude", "claude-code"};
  }
};

class CodexBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "codex"; }
  [[nodiscard]] std::string_view display_name() const override { return "Codex CLI"; }
  [[nodiscard]] std::string_view default_command() const override { return "codex"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override { return {"codex"}; }
};

class GeminiBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "gemini"; }
  [[nodiscard]] std::string_view display_name() const override { return "Gemini CLI"; }
  [[nodiscard]] std::string_view default_command() const override { return "gemini"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override {
    return {"gemini", "gemini-cli"};
  }
};

class KiroBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "kiro"; }
  [[nodiscard]] std::string_view display_name() const override { return "Kiro CLI"; }
  [[nodiscard]] std::string_view default_command() const override { return "kiro-cli chat"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override {
    return {"kiro-cli", "kiro"};
  }
};

class OpencodeBackend final : public CommandAgentBackend {
public:
  using CommandAgentBackend::CommandAgentBackend;
  [[nodiscard]] std::string_view name() const override { return "opencode"; }
  [[nodiscard]] std::string_view display_name() const override { return "OpenCode"; }
  [[nodiscard]] std::string_view default_command() const override { return "opencode"; }
  [[nodiscard]] std::vector<std::string> process_patterns() const override {
    return {"opencode"};
  }
};

} // namespace kild::agents
