#pragma once

#include "kild/agents/agent.hpp"
#include "kild/common/result.hpp"
#include "kild/sessions/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kild::sessions {

enum class SessionStatus { Active, Stopped };

[[nodiscard]] std::string_view to_string(SessionStatus status);
[[nodiscard]] std::optional<SessionStatus> session_status_from_string(const std::string &text);

enum class AgentActivity { Idle, Working, Waiting };

[[nodiscard]] std::string_view to_string(AgentActivity activity);
[[nodiscard]] std::optional<AgentActivity> agent_activity_from_string(const std::string &text);

struct AgentProcess {
  std::string agent;
  std::string spawn_id;
  std::string command;
  std::string opened_at;
  agents::AgentHandles handles;
};

struct Session {
  std::string id;
  std::string project_id;
  std::string branch;
  std::filesystem::path worktree_path;
  std::string agent;
  SessionStatus status = SessionStatus::Active;
  std::string created_at;
  std::string last_activity;
  std::optional<std::string> note;
  std::uint32_t port_range_start = 0;
  std::uint32_t port_range_end = 0;
  std::uint32_t port_count = 0;
  std::optional<agents::RuntimeMode> runtime_mode;
  std::vector<AgentProcess> agents;

  [[nodiscard]] bool has_any_handle() const;
  void clear_handles();
};

struct AgentStatusInfo {
  AgentActivity activity = AgentActivity::Idle;
  std::string updated_at;
};

[[nodiscard]] std::string session_to_json(const Session &session);
[[nodiscard]] common::Result<Session, SessionError> session_from_json(const std::string &json);

[[nodiscard]] std::string agent_status_to_json(const AgentStatusInfo &info);
[[nodiscard]] std::optional<AgentStatusInfo> agent_status_from_json(const std::string &json);

} // namespace kild::sessions
