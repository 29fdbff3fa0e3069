#include "kild/terminal/alacritty.hpp"

#include "kild/common/fs.hpp"
#include "kild/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>

namespace kild::terminal {

namespace {

constexpr auto HYPRCTL_TIMEOUT = std::chrono::milliseconds(3000);

std::string window_title_for(const std::string &title) {
  return "kild-" + common::escape_filename(title);
}

} // namespace

AlacrittyBackend::AlacrittyBackend(common::ICommandRunner &runner) : runner_(runner) {}

bool AlacrittyBackend::is_available() const {
  const char *hyprland = std::getenv("HYPRLAND_INSTANCE_SIGNATURE");
  if (hyprland == nullptr || *hyprland == '\0') {
    return false;
  }
  return runner_.command_exists("alacritty") && runner_.command_exists("hyprctl");
}

common::Result<std::optional<std::string>, TerminalError>
AlacrittyBackend::execute_spawn(const SpawnConfig &config) const {
  using SpawnResult = common::Result<std::optional<std::string>, TerminalError>;
  const std::string title = window_title_for(config.title);

  auto pid = runner_.spawn_detached({"alacritty", "--title", title, "--working-directory",
                                     config.working_dir.string(), "-e", "sh", "-c",
                                     config.command},
                                    config.working_dir);
  if (!pid.ok()) {
    return SpawnResult::failure(
        TerminalError{.kind = TerminalErrorKind::SpawnFailed, .message = pid.error()});
  }
  return SpawnResult::success(title);
}

common::Result<std::vector<std::string>, TerminalError> AlacrittyBackend::window_titles() const {
  using TitlesResult = common::Result<std::vector<std::string>, TerminalError>;
  auto result = runner_.run({"hyprctl", "clients", "-j"},
                            {.allow_failure = false, .timeout = HYPRCTL_TIMEOUT, .working_dir = {}});
  if (!result.ok()) {
    return TitlesResult::failure(TerminalError{.kind = TerminalErrorKind::QueryFailed,
                                               .message = "hyprctl clients: " + result.error()});
  }

  std::vector<std::string> titles;
  for (const auto &object :
       common::json_split_top_level_objects(common::trim(result.value().stdout_text))) {
    const auto fields = common::json_parse_flat(object);
    if (!fields.has_value()) {
      continue;
    }
    if (auto title = common::json_string_field(*fields, "title"); title.has_value()) {
      titles.push_back(std::move(*title));
    }
  }
  return TitlesResult::success(std::move(titles));
}

common::Result<void, TerminalError>
AlacrittyBackend::close_window(const std::optional<std::string> &window_id) const {
  using CloseResult = common::Result<void, TerminalError>;
  if (!window_id.has_value() || window_id->empty()) {
    return CloseResult::success();
  }

  auto open = is_window_open(*window_id);
  if (open.ok() && open.value().has_value() && !*open.value()) {
    return CloseResult::success();
  }

  auto result = runner_.run({"hyprctl", "dispatch", "closewindow", "title:^(" + *window_id + ")$"},
                            {.allow_failure = false, .timeout = HYPRCTL_TIMEOUT, .working_dir = {}});
  if (!result.ok()) {
    return CloseResult::failure(
        TerminalError{.kind = TerminalErrorKind::CloseFailed, .message = result.error()});
  }
  return CloseResult::success();
}

common::Result<std::optional<bool>, TerminalError>
AlacrittyBackend::is_window_open(const std::string &window_id) const {
  using QueryResult = common::Result<std::optional<bool>, TerminalError>;
  auto titles = window_titles();
  if (!titles.ok()) {
    return QueryResult::failure(titles.error());
  }
  const auto &all = titles.value();
  return QueryResult::success(std::find(all.begin(), all.end(), window_id) != all.end());
}

} // namespace kild::terminal
