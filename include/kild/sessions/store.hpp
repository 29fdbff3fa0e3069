#pragma once

#include "kild/common/result.hpp"
#include "kild/sessions/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kild::sessions {

/// One `<safe_id>.json` record per session plus its `.status` and `.pr` sidecars, all in
/// `sessions_dir`. Writes are atomic; concurrent writers race last-writer-wins.
class SessionStore {
public:
  explicit SessionStore(std::filesystem::path sessions_dir);

  [[nodiscard]] const std::filesystem::path &dir() const { return sessions_dir_; }
  [[nodiscard]] std::filesystem::path record_path(const std::string &session_id) const;
  [[nodiscard]] std::filesystem::path status_path(const std::string &session_id) const;
  [[nodiscard]] std::filesystem::path pr_path(const std::string &session_id) const;

  [[nodiscard]] common::Result<void, SessionError> save(const Session &session) const;
  [[nodiscard]] common::Result<Session, SessionError> load(const std::string &session_id) const;
  [[nodiscard]] bool exists(const std::string &session_id) const;
  [[nodiscard]] common::Result<std::vector<Session>, SessionError> list() const;
  [[nodiscard]] common::Result<Session, SessionError> find_by_branch(const std::string &branch) const;
  [[nodiscard]] common::Result<void, SessionError> remove(const std::string &session_id) const;

  [[nodiscard]] common::Result<void, SessionError>
  write_agent_status(const std::string &session_id, const AgentStatusInfo &info) const;
  [[nodiscard]] std::optional<AgentStatusInfo> read_agent_status(const std::string &session_id) const;
  [[nodiscard]] common::Result<void, SessionError>
  remove_agent_status(const std::string &session_id) const;

  [[nodiscard]] common::Result<void, SessionError> write_pr_info(const std::string &session_id,
                                                                 const std::string &json) const;
  [[nodiscard]] std::optional<std::string> read_pr_info(const std::string &session_id) const;
  [[nodiscard]] common::Result<void, SessionError> remove_pr_info(const std::string &session_id) const;

  /// First free `[start, end]` block of `count` ports at or above `base`, skipping ranges held
  /// by existing sessions.
  [[nodiscard]] common::Result<std::pair<std::uint32_t, std::uint32_t>, SessionError>
  allocate_port_range(std::uint32_t count, std::uint32_t base) const;

private:
  [[nodiscard]] common::Result<void, SessionError>
  remove_file(const std::filesystem::path &path) const;

  std::filesystem::path sessions_dir_;
};

} // namespace kild::sessions
