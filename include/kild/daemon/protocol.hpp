#pragma once

#include "kild/common/result.hpp"
#include "kild/daemon/errors.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kild::daemon {

enum class DaemonSessionStatus { Running, Stopped, Creating, NotFound };

[[nodiscard]] std::string_view to_string(DaemonSessionStatus status);
[[nodiscard]] std::optional<DaemonSessionStatus> daemon_status_from_string(const std::string &text);

struct DaemonResponse {
  std::string type;
  std::string id;
  std::optional<std::string> session_id;
  std::optional<DaemonSessionStatus> session_status;
  std::string error_code;
  std::string error_message;
};

[[nodiscard]] std::string encode_get_session_request(const std::string &request_id,
                                                     const std::string &session_id);
[[nodiscard]] std::string encode_create_session_request(const std::string &request_id,
                                                        const std::string &session_id,
                                                        const std::filesystem::path &working_dir,
                                                        const std::string &command);
[[nodiscard]] std::string encode_destroy_session_request(const std::string &request_id,
                                                         const std::string &session_id, bool force);

[[nodiscard]] common::Result<DaemonResponse, DaemonError>
parse_daemon_response(const std::string &line);

} // namespace kild::daemon
