#include "kild/sessions/store.hpp"

#include "kild/common/fs.hpp"
#include "kild/common/json_util.hpp"
#include "kild/observability/global.hpp"

#include <algorithm>

namespace kild::sessions {

namespace {

constexpr std::uint32_t MAX_PORT = 65535;

} // namespace

SessionStore::SessionStore(std::filesystem::path sessions_dir)
    : sessions_dir_(std::move(sessions_dir)) {}

std::filesystem::path SessionStore::record_path(const std::string &session_id) const {
  return sessions_dir_ / (common::escape_filename(session_id) + ".json");
}

std::filesystem::path SessionStore::status_path(const std::string &session_id) const {
  return sessions_dir_ / (common::escape_filename(session_id) + ".status");
}

std::filesystem::path SessionStore::pr_path(const std::string &session_id) const {
  return sessions_dir_ / (common::escape_filename(session_id) + ".pr");
}

common::Result<void, SessionError> SessionStore::save(const Session &session) const {
  if (const auto dir = common::ensure_dir(sessions_dir_); !dir.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(dir.error()));
  }
  const auto written = common::write_file_atomic(record_path(session.id), session_to_json(session));
  if (!written.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(written.error()));
  }
  return common::Result<void, SessionError>::success();
}

common::Result<Session, SessionError> SessionStore::load(const std::string &session_id) const {
  const auto path = record_path(session_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Session, SessionError>::failure(
        SessionError{.kind = SessionErrorKind::NotFound, .message = "no session '" + session_id + "'"});
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Session, SessionError>::failure(SessionError::io(content.error()));
  }
  auto session = session_from_json(content.value());
  if (!session.ok()) {
    return common::Result<Session, SessionError>::failure(
        SessionError{.kind = session.error().kind,
                     .message = path.filename().string() + ": " + session.error().message});
  }
  return session;
}

bool SessionStore::exists(const std::string &session_id) const {
  std::error_code ec;
  return std::filesystem::exists(record_path(session_id), ec);
}

common::Result<std::vector<Session>, SessionError> SessionStore::list() const {
  using ListResult = common::Result<std::vector<Session>, SessionError>;
  std::vector<Session> sessions;
  std::error_code ec;
  if (!std::filesystem::exists(sessions_dir_, ec)) {
    return ListResult::success(std::move(sessions));
  }

  std::filesystem::directory_iterator it(sessions_dir_, ec);
  if (ec) {
    return ListResult::failure(
        SessionError::io("unable to read " + sessions_dir_.string() + ": " + ec.message()));
  }
  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    const auto content = common::read_file(entry.path());
    if (!content.ok()) {
      observability::record_warning("sessions", content.error());
      continue;
    }
    auto session = session_from_json(content.value());
    if (!session.ok()) {
      observability::record_warning("sessions", "skipping " + entry.path().filename().string() +
                                                    ": " + session.error().message);
      continue;
    }
    sessions.push_back(std::move(session.value()));
  }

  std::sort(sessions.begin(), sessions.end(),
            [](const Session &a, const Session &b) { return a.id < b.id; });
  return ListResult::success(std::move(sessions));
}

common::Result<Session, SessionError> SessionStore::find_by_branch(const std::string &branch) const {
  auto sessions = list();
  if (!sessions.ok()) {
    return common::Result<Session, SessionError>::failure(sessions.error());
  }
  const std::string wanted = common::trim(branch);
  for (auto &session : sessions.value()) {
    if (session.branch == wanted) {
      return common::Result<Session, SessionError>::success(std::move(session));
    }
  }
  return common::Result<Session, SessionError>::failure(SessionError::not_found(wanted));
}

common::Result<void, SessionError> SessionStore::remove_file(const std::filesystem::path &path) const {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Result<void, SessionError>::failure(
        SessionError::io("failed to delete " + path.string() + ": " + ec.message()));
  }
  return common::Result<void, SessionError>::success();
}

common::Result<void, SessionError> SessionStore::remove(const std::string &session_id) const {
  return remove_file(record_path(session_id));
}

common::Result<void, SessionError>
SessionStore::write_agent_status(const std::string &session_id, const AgentStatusInfo &info) const {
  if (const auto dir = common::ensure_dir(sessions_dir_); !dir.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(dir.error()));
  }
  const auto written = common::write_file_atomic(status_path(session_id), agent_status_to_json(info));
  if (!written.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(written.error()));
  }
  return common::Result<void, SessionError>::success();
}

std::optional<AgentStatusInfo> SessionStore::read_agent_status(const std::string &session_id) const {
  const auto path = status_path(session_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return std::nullopt;
  }
  return agent_status_from_json(content.value());
}

common::Result<void, SessionError>
SessionStore::remove_agent_status(const std::string &session_id) const {
  return remove_file(status_path(session_id));
}

common::Result<void, SessionError> SessionStore::write_pr_info(const std::string &session_id,
                                                               const std::string &json) const {
  if (!common::json_parse_flat(json).has_value()) {
    return common::Result<void, SessionError>::failure(
        SessionError{.kind = SessionErrorKind::InvalidStructure,
                     .message = "PR info must be a JSON object"});
  }
  if (const auto dir = common::ensure_dir(sessions_dir_); !dir.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(dir.error()));
  }
  const auto written = common::write_file_atomic(pr_path(session_id), json);
  if (!written.ok()) {
    return common::Result<void, SessionError>::failure(SessionError::io(written.error()));
  }
  return common::Result<void, SessionError>::success();
}

std::optional<std::string> SessionStore::read_pr_info(const std::string &session_id) const {
  const auto path = pr_path(session_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto content = common::read_file(path);
  if (!content.ok() || !common::json_parse_flat(content.value()).has_value()) {
    return std::nullopt;
  }
  return content.value();
}

common::Result<void, SessionError> SessionStore::remove_pr_info(const std::string &session_id) const {
  return remove_file(pr_path(session_id));
}

common::Result<std::pair<std::uint32_t, std::uint32_t>, SessionError>
SessionStore::allocate_port_range(const std::uint32_t count, const std::uint32_t base) const {
  using PortResult = common::Result<std::pair<std::uint32_t, std::uint32_t>, SessionError>;
  if (count == 0 || count > 1000) {
    return PortResult::failure(SessionError{.kind = SessionErrorKind::InvalidPortCount,
                                            .message = "port count must be between 1 and 1000"});
  }

  auto sessions = list();
  if (!sessions.ok()) {
    return PortResult::failure(sessions.error());
  }
  std::vector<std::pair<std::uint32_t, std::uint32_t>> taken;
  for (const auto &session : sessions.value()) {
    if (session.port_count > 0) {
      taken.emplace_back(session.port_range_start, session.port_range_end);
    }
  }
  std::sort(taken.begin(), taken.end());

  std::uint64_t start = std::max<std::uint32_t>(base, 1);
  for (const auto &[taken_start, taken_end] : taken) {
    if (taken_end < start) {
      continue;
    }
    if (start + count - 1 < taken_start) {
      break;
    }
    start = static_cast<std::uint64_t>(taken_end) + 1;
  }

  const std::uint64_t end = start + count - 1;
  if (end > MAX_PORT) {
    return PortResult::failure(SessionError{
        .kind = SessionErrorKind::PortRangeExhausted,
        .message = "no free block of " + std::to_string(count) + " ports at or above " +
                   std::to_string(base)});
  }
  return PortResult::success({static_cast<std::uint32_t>(start), static_cast<std::uint32_t>(end)});
}

} // namespace kild::sessions
