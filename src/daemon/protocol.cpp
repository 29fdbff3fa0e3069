#include "kild/daemon/protocol.hpp"

#include "kild/common/fs.hpp"
#include "kild/common/json_util.hpp"

namespace kild::daemon {

std::string_view DaemonError::code() const {
  switch (kind) {
  case DaemonErrorKind::NotRunning:
    return "DAEMON_NOT_RUNNING";
  case DaemonErrorKind::ConnectionFailed:
    return "DAEMON_CONNECTION_FAILED";
  case DaemonErrorKind::Timeout:
    return "DAEMON_TIMEOUT";
  case DaemonErrorKind::ProtocolError:
    return "DAEMON_PROTOCOL_ERROR";
  case DaemonErrorKind::DaemonReported:
    return "DAEMON_ERROR";
  }
  return "DAEMON_ERROR";
}

bool DaemonError::is_unreachable() const {
  return kind == DaemonErrorKind::NotRunning || kind == DaemonErrorKind::ConnectionFailed ||
         kind == DaemonErrorKind::Timeout;
}

std::string_view to_string(const DaemonSessionStatus status) {
  switch (status) {
  case DaemonSessionStatus::Running:
    return "running";
  case DaemonSessionStatus::Stopped:
    return "stopped";
  case DaemonSessionStatus::Creating:
    return "creating";
  case DaemonSessionStatus::NotFound:
    return "not_found";
  }
  return "not_found";
}

std::optional<DaemonSessionStatus> daemon_status_from_string(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "running") {
    return DaemonSessionStatus::Running;
  }
  if (normalized == "stopped") {
    return DaemonSessionStatus::Stopped;
  }
  if (normalized == "creating") {
    return DaemonSessionStatus::Creating;
  }
  return std::nullopt;
}

std::string encode_get_session_request(const std::string &request_id,
                                       const std::string &session_id) {
  return common::JsonObjectWriter()
      .add_string("type", "get_session")
      .add_string("id", request_id)
      .add_string("session_id", session_id)
      .str();
}

std::string encode_create_session_request(const std::string &request_id,
                                          const std::string &session_id,
                                          const std::filesystem::path &working_dir,
                                          const std::string &command) {
  return common::JsonObjectWriter()
      .add_string("type", "create_session")
      .add_string("id", request_id)
      .add_string("session_id", session_id)
      .add_string("working_directory", working_dir.string())
      .add_string("command", command)
      .str();
}

std::string encode_destroy_session_request(const std::string &request_id,
                                           const std::string &session_id, const bool force) {
  return common::JsonObjectWriter()
      .add_string("type", "destroy_session")
      .add_string("id", request_id)
      .add_string("session_id", session_id)
      .add_bool("force", force)
      .str();
}

common::Result<DaemonResponse, DaemonError> parse_daemon_response(const std::string &line) {
  using ParseResult = common::Result<DaemonResponse, DaemonError>;
  const auto fields = common::json_parse_flat(line);
  if (!fields.has_value()) {
    return ParseResult::failure(DaemonError{.kind = DaemonErrorKind::ProtocolError,
                                            .message = "daemon sent malformed JSON",
                                            .daemon_code = {}});
  }

  DaemonResponse response;
  response.type = common::json_string_field(*fields, "type").value_or("");
  response.id = common::json_string_field(*fields, "id").value_or("");
  if (response.type.empty()) {
    return ParseResult::failure(DaemonError{.kind = DaemonErrorKind::ProtocolError,
                                            .message = "daemon response has no type",
                                            .daemon_code = {}});
  }

  if (response.type == "error") {
    response.error_code = common::json_string_field(*fields, "code").value_or("unknown");
    response.error_message = common::json_string_field(*fields, "message").value_or("");
    return ParseResult::success(std::move(response));
  }

  if (const auto it = fields->find("session");
      it != fields->end() && it->second.type == common::JsonType::Object) {
    const auto session = common::json_parse_flat(it->second.text);
    if (!session.has_value()) {
      return ParseResult::failure(DaemonError{.kind = DaemonErrorKind::ProtocolError,
                                              .message = "daemon sent a malformed session",
                                              .daemon_code = {}});
    }
    response.session_id = common::json_string_field(*session, "id");
    if (const auto status = common::json_string_field(*session, "status"); status.has_value()) {
      response.session_status = daemon_status_from_string(*status);
      if (!response.session_status.has_value()) {
        return ParseResult::failure(DaemonError{.kind = DaemonErrorKind::ProtocolError,
                                                .message = "unknown session status '" + *status +
                                                           "'",
                                                .daemon_code = {}});
      }
    }
  }
  return ParseResult::success(std::move(response));
}

} // namespace kild::daemon
