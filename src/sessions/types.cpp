#include "kild/sessions/types.hpp"

#include "kild/common/fs.hpp"
#include "kild/common/json_util.hpp"

#include <limits>

namespace kild::sessions {

namespace {

SessionError invalid_structure(std::string message) {
  return SessionError{.kind = SessionErrorKind::InvalidStructure, .message = std::move(message)};
}

std::string agent_to_json(const AgentProcess &agent) {
  const auto &handles = agent.handles;
  common::JsonObjectWriter writer;
  writer.add_string("agent", agent.agent)
      .add_string("spawn_id", agent.spawn_id)
      .add_string("command", agent.command)
      .add_string("opened_at", agent.opened_at);
  if (handles.local.has_value()) {
    writer.add_number("process_id", static_cast<std::uint64_t>(handles.local->pid))
        .add_string("process_name", handles.local->process_name)
        .add_number("process_start_time", handles.local->start_time);
  } else {
    writer.add_optional_number("process_id", std::nullopt)
        .add_optional_string("process_name", std::nullopt)
        .add_optional_number("process_start_time", std::nullopt);
  }
  if (handles.terminal.has_value()) {
    writer.add_string("terminal_type", handles.terminal->terminal_type)
        .add_optional_string("terminal_window_id", handles.terminal->window_id);
  } else {
    writer.add_optional_string("terminal_type", std::nullopt)
        .add_optional_string("terminal_window_id", std::nullopt);
  }
  writer.add_optional_string("daemon_session_id",
                             handles.daemon.has_value()
                                 ? std::optional<std::string>(handles.daemon->session_id)
                                 : std::nullopt);
  return writer.str();
}

common::Result<AgentProcess, SessionError> agent_from_json(const std::string &json) {
  using AgentResult = common::Result<AgentProcess, SessionError>;
  const auto fields = common::json_parse_flat(json);
  if (!fields.has_value()) {
    return AgentResult::failure(invalid_structure("malformed agent entry"));
  }

  AgentProcess agent;
  agent.agent = common::json_string_field(*fields, "agent").value_or("");
  agent.spawn_id = common::json_string_field(*fields, "spawn_id").value_or("");
  agent.command = common::json_string_field(*fields, "command").value_or("");
  agent.opened_at = common::json_string_field(*fields, "opened_at").value_or("");
  if (agent.agent.empty()) {
    return AgentResult::failure(invalid_structure("agent entry has no agent name"));
  }

  const auto pid = common::json_u64_field(*fields, "process_id");
  const auto name = common::json_string_field(*fields, "process_name");
  const auto start_time = common::json_u64_field(*fields, "process_start_time");
  const int present = static_cast<int>(pid.has_value()) + static_cast<int>(name.has_value()) +
                      static_cast<int>(start_time.has_value());
  if (present == 3) {
    if (*pid == 0 || *pid > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return AgentResult::failure(
          SessionError{.kind = SessionErrorKind::InvalidProcessMetadata,
                       .message = "agent " + agent.spawn_id + " has an invalid process_id"});
    }
    agent.handles.local = agents::LocalHandle{
        .pid = static_cast<int>(*pid), .process_name = *name, .start_time = *start_time};
  } else if (present != 0) {
    return AgentResult::failure(SessionError{
        .kind = SessionErrorKind::InvalidProcessMetadata,
        .message = "agent " + agent.spawn_id +
                   " must have process_id, process_name and process_start_time all set or all "
                   "absent"});
  }

  if (auto terminal_type = common::json_string_field(*fields, "terminal_type");
      terminal_type.has_value()) {
    agent.handles.terminal =
        agents::TerminalHandle{.terminal_type = *terminal_type,
                               .window_id = common::json_string_field(*fields, "terminal_window_id")};
  }
  if (auto daemon_id = common::json_string_field(*fields, "daemon_session_id");
      daemon_id.has_value()) {
    agent.handles.daemon = agents::DaemonHandle{.session_id = *daemon_id};
  }
  return AgentResult::success(std::move(agent));
}

std::uint32_t u32_field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto value = common::json_u64_field(fields, key).value_or(0);
  return value > 0xFFFFFFFFULL ? 0 : static_cast<std::uint32_t>(value);
}

} // namespace

std::string_view to_string(const SessionStatus status) {
  return status == SessionStatus::Active ? "active" : "stopped";
}

std::optional<SessionStatus> session_status_from_string(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "active") {
    return SessionStatus::Active;
  }
  if (normalized == "stopped") {
    return SessionStatus::Stopped;
  }
  return std::nullopt;
}

std::string_view to_string(const AgentActivity activity) {
  switch (activity) {
  case AgentActivity::Idle:
    return "idle";
  case AgentActivity::Working:
    return "working";
  case AgentActivity::Waiting:
    return "waiting";
  }
  return "idle";
}

std::optional<AgentActivity> agent_activity_from_string(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "idle") {
    return AgentActivity::Idle;
  }
  if (normalized == "working") {
    return AgentActivity::Working;
  }
  if (normalized == "waiting") {
    return AgentActivity::Waiting;
  }
  return std::nullopt;
}

bool Session::has_any_handle() const {
  for (const auto &agent : agents) {
    if (agent.handles.has_any()) {
      return true;
    }
  }
  return false;
}

void Session::clear_handles() {
  for (auto &agent : agents) {
    agent.handles.clear();
  }
}

std::string session_to_json(const Session &session) {
  std::string agents_json = "[";
  for (std::size_t i = 0; i < session.agents.size(); ++i) {
    if (i > 0) {
      agents_json += ",";
    }
    agents_json += agent_to_json(session.agents[i]);
  }
  agents_json += "]";

  return common::JsonObjectWriter()
      .add_string("id", session.id)
      .add_string("project_id", session.project_id)
      .add_string("branch", session.branch)
      .add_string("worktree_path", session.worktree_path.string())
      .add_string("agent", session.agent)
      .add_string("status", std::string(to_string(session.status)))
      .add_string("created_at", session.created_at)
      .add_string("last_activity", session.last_activity)
      .add_optional_string("note", session.note)
      .add_number("port_range_start", session.port_range_start)
      .add_number("port_range_end", session.port_range_end)
      .add_number("port_count", session.port_count)
      .add_optional_string("runtime_mode",
                           session.runtime_mode.has_value()
                               ? std::optional<std::string>(
                                     std::string(agents::to_string(*session.runtime_mode)))
                               : std::nullopt)
      .add_raw("agents", agents_json)
      .str();
}

common::Result<Session, SessionError> session_from_json(const std::string &json) {
  using SessionResult = common::Result<Session, SessionError>;
  const auto fields = common::json_parse_flat(json);
  if (!fields.has_value()) {
    return SessionResult::failure(invalid_structure("session record is not a JSON object"));
  }

  Session session;
  session.id = common::json_string_field(*fields, "id").value_or("");
  session.project_id = common::json_string_field(*fields, "project_id").value_or("");
  session.branch = common::json_string_field(*fields, "branch").value_or("");
  session.worktree_path = common::json_string_field(*fields, "worktree_path").value_or("");
  if (session.id.empty() || session.project_id.empty() || session.branch.empty() ||
      session.worktree_path.empty()) {
    return SessionResult::failure(
        invalid_structure("session record is missing id, project_id, branch or worktree_path"));
  }

  session.agent = common::json_string_field(*fields, "agent").value_or("");
  const std::string status = common::json_string_field(*fields, "status").value_or("active");
  const auto parsed_status = session_status_from_string(status);
  if (!parsed_status.has_value()) {
    return SessionResult::failure(invalid_structure("unknown session status '" + status + "'"));
  }
  session.status = *parsed_status;
  session.created_at = common::json_string_field(*fields, "created_at").value_or("");
  session.last_activity =
      common::json_string_field(*fields, "last_activity").value_or(session.created_at);
  session.note = common::json_string_field(*fields, "note");
  session.port_range_start = u32_field(*fields, "port_range_start");
  session.port_range_end = u32_field(*fields, "port_range_end");
  session.port_count = u32_field(*fields, "port_count");
  if (auto mode = common::json_string_field(*fields, "runtime_mode"); mode.has_value()) {
    session.runtime_mode = agents::runtime_mode_from_string(*mode);
  }

  if (const auto it = fields->find("agents"); it != fields->end()) {
    if (it->second.type == common::JsonType::Array) {
      for (const auto &entry : common::json_split_top_level_objects(it->second.text)) {
        auto agent = agent_from_json(entry);
        if (!agent.ok()) {
          return SessionResult::failure(agent.error());
        }
        session.agents.push_back(std::move(agent.value()));
      }
    } else if (it->second.type != common::JsonType::Null) {
      return SessionResult::failure(invalid_structure("agents must be an array"));
    }
  }
  return SessionResult::success(std::move(session));
}

std::string agent_status_to_json(const AgentStatusInfo &info) {
  return common::JsonObjectWriter()
      .add_string("status", std::string(to_string(info.activity)))
      .add_string("updated_at", info.updated_at)
      .str();
}

std::optional<AgentStatusInfo> agent_status_from_json(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  const auto status = common::json_string_field(*fields, "status");
  if (!status.has_value()) {
    return std::nullopt;
  }
  const auto activity = agent_activity_from_string(*status);
  if (!activity.has_value()) {
    return std::nullopt;
  }
  return AgentStatusInfo{.activity = *activity,
                         .updated_at = common::json_string_field(*fields, "updated_at").value_or("")};
}

} // namespace kild::sessions
