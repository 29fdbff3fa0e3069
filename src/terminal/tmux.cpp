#include "kild/terminal/tmux.hpp"

#include "kild/common/fs.hpp"

namespace kild::terminal {

namespace {

constexpr auto TMUX_TIMEOUT = std::chrono::milliseconds(5000);

bool reports_missing_session(const common::CommandResult &result) {
  const std::string err = common::to_lower(result.stderr_text);
  return err.find("can't find session") != std::string::npos ||
         err.find("no server running") != std::string::npos ||
         err.find("session not found") != std::string::npos ||
         err.find("error connecting") != std::string::npos;
}

} // namespace

TmuxBackend::TmuxBackend(common::ICommandRunner &runner) : runner_(runner) {}

bool TmuxBackend::is_available() const { return runner_.command_exists("tmux"); }

std::string TmuxBackend::session_name_for(const std::string &title) {
  return "kild-" + common::escape_filename(title);
}

common::Result<std::optional<std::string>, TerminalError>
TmuxBackend::execute_spawn(const SpawnConfig &config) const {
  using SpawnResult = common::Result<std::optional<std::string>, TerminalError>;
  const std::string session = session_name_for(config.title);

  auto result = runner_.run({"tmux", "new-session", "-d", "-s", session, "-c",
                             config.working_dir.string(), config.command},
                            {.allow_failure = false, .timeout = TMUX_TIMEOUT, .working_dir = {}});
  if (!result.ok()) {
    return SpawnResult::failure(TerminalError{.kind = TerminalErrorKind::SpawnFailed,
                                              .message = "tmux new-session failed: " +
                                                         common::trim(result.error())});
  }
  return SpawnResult::success(session);
}

common::Result<void, TerminalError>
TmuxBackend::close_window(const std::optional<std::string> &window_id) const {
  using CloseResult = common::Result<void, TerminalError>;
  if (!window_id.has_value() || window_id->empty()) {
    return CloseResult::success();
  }

  auto result = runner_.run({"tmux", "kill-session", "-t", "=" + *window_id},
                            {.allow_failure = true, .timeout = TMUX_TIMEOUT, .working_dir = {}});
  if (!result.ok()) {
    return CloseResult::failure(
        TerminalError{.kind = TerminalErrorKind::CloseFailed, .message = result.error()});
  }
  if (result.value().exit_code != 0 && !reports_missing_session(result.value())) {
    return CloseResult::failure(TerminalError{
        .kind = TerminalErrorKind::CloseFailed,
        .message = "tmux kill-session " + *window_id + ": " +
                   common::trim(result.value().stderr_text)});
  }
  return CloseResult::success();
}

common::Result<std::optional<bool>, TerminalError>
TmuxBackend::is_window_open(const std::string &window_id) const {
  using QueryResult = common::Result<std::optional<bool>, TerminalError>;
  auto result = runner_.run({"tmux", "has-session", "-t", "=" + window_id},
                            {.allow_failure = true, .timeout = TMUX_TIMEOUT, .working_dir = {}});
  if (!result.ok()) {
    return QueryResult::failure(
        TerminalError{.kind = TerminalErrorKind::QueryFailed, .message = result.error()});
  }
  const auto &outcome = result.value();
  if (outcome.exit_code == 0) {
    return QueryResult::success(true);
  }
  if (outcome.exit_code == 1 || reports_missing_session(outcome)) {
    return QueryResult::success(false);
  }
  return QueryResult::success(std::nullopt);
}

} // namespace kild::terminal
