#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "kild/terminal/alacritty.hpp"
#include "kild/terminal/registry.hpp"
#include "kild/terminal/tmux.hpp"

namespace {

kild::common::CommandResult exit_with(const int code, std::string stderr_text = "",
                                      std::string stdout_text = "") {
  return kild::common::CommandResult{
      .exit_code = code, .stdout_text = std::move(stdout_text), .stderr_text = std::move(stderr_text)};
}

} // namespace

void register_terminal_tests(std::vector<kild::tests::TestCase> &tests) {
  using kild::tests::require;
  using kild::testing::FakeCommandRunner;
  namespace terminal = kild::terminal;

  tests.push_back({"tmux_spawn_uses_detached_session_named_after_title", [] {
                     FakeCommandRunner runner;
                     runner.add_response({"tmux", "new-session"}, exit_with(0));
                     terminal::TmuxBackend tmux(runner);

                     const auto spawned = tmux.execute_spawn(terminal::SpawnConfig{
                         .working_dir = "/work/tree", .command = "claude", .title = "abc/feat_0"});
                     require(spawned.ok(), spawned.ok() ? "" : spawned.error().message);
                     require(spawned.value() == std::optional<std::string>("kild-abc_2ffeat_5f0"),
                             "window id should be the session name");
                     const auto &call = runner.calls.front();
                     require(call[3] == "-s" && call[4] == "kild-abc_2ffeat_5f0", "session flag mismatch");
                     require(call[6] == "/work/tree", "working directory mismatch");
                     require(call.back() == "claude", "command should be passed last");
                   }});

  tests.push_back({"tmux_spawn_failure_is_reported", [] {
                     FakeCommandRunner runner;
                     runner.add_response({"tmux", "new-session"}, exit_with(1, "duplicate session"));
                     terminal::TmuxBackend tmux(runner);
                     const auto spawned = tmux.execute_spawn(
                         terminal::SpawnConfig{.working_dir = "/w", .command = "x", .title = "t"});
                     require(!spawned.ok(), "spawn should fail");
                     require(spawned.error().kind == terminal::TerminalErrorKind::SpawnFailed,
                             "spawn failure kind expected");
                   }});

  tests.push_back({"tmux_close_treats_missing_session_as_closed", [] {
                     FakeCommandRunner runner;
                     runner.add_response({"tmux", "kill-session"},
                                         exit_with(1, "can't find session: kild-x"));
                     terminal::TmuxBackend tmux(runner);
                     require(tmux.close_window(std::string("kild-x")).ok(),
                             "missing session should count as closed");
                     require(tmux.close_window(std::nullopt).ok(), "untracked window closes trivially");
                     require(runner.calls.size() == 1, "untracked close should not run tmux");
                   }});

  tests.push_back({"tmux_close_reports_other_failures", [] {
                     FakeCommandRunner runner;
                     runner.add_response({"tmux", "kill-session"}, exit_with(2, "permission denied"));
                     terminal::TmuxBackend tmux(runner);
                     const auto closed = tmux.close_window(std::string("kild-x"));
                     require(!closed.ok(), "unexpected failure should surface");
                     require(closed.error().kind == terminal::TerminalErrorKind::CloseFailed,
                             "close failure kind expected");
                   }});

  tests.push_back({"tmux_has_session_maps_exit_codes", [] {
                     FakeCommandRunner open_runner;
                     open_runner.add_response({"tmux", "has-session"}, exit_with(0));
                     const auto open = terminal::TmuxBackend(open_runner).is_window_open("kild-a");
                     require(open.ok() && open.value() == std::optional<bool>(true), "open expected");

                     FakeCommandRunner gone_runner;
                     gone_runner.add_response({"tmux", "has-session"}, exit_with(1));
                     const auto gone = terminal::TmuxBackend(gone_runner).is_window_open("kild-a");
                     require(gone.ok() && gone.value() == std::optional<bool>(false), "closed expected");

                     FakeCommandRunner odd_runner;
                     odd_runner.add_response({"tmux", "has-session"}, exit_with(7, "weird"));
                     const auto odd = terminal::TmuxBackend(odd_runner).is_window_open("kild-a");
                     require(odd.ok() && !odd.value().has_value(), "unknown expected");
                   }});

  tests.push_back({"alacritty_needs_hyprland", [] {
                     FakeCommandRunner runner;
                     runner.set_available("alacritty", true);
                     runner.set_available("hyprctl", true);
                     terminal::AlacrittyBackend alacritty(runner);
                     {
                       const kild::testing::EnvGuard env("HYPRLAND_INSTANCE_SIGNATURE", std::nullopt);
                       require(!alacritty.is_available(), "no hyprland means unavailable");
                     }
                     const kild::testing::EnvGuard env("HYPRLAND_INSTANCE_SIGNATURE",
                                                       std::string("abc"));
                     require(alacritty.is_available(), "hyprland plus binaries means available");
                   }});

  tests.push_back({"alacritty_window_lookup_by_title", [] {
                     FakeCommandRunner runner;
                     runner.add_response({"hyprctl", "clients", "-j"},
                                         exit_with(0, "",
                                                   R"([{"title":"kild-abc_0","pid":1},{"title":"vim"}])"));
                     terminal::AlacrittyBackend alacritty(runner);
                     const auto open = alacritty.is_window_open("kild-abc_0");
                     require(open.ok() && open.value() == std::optional<bool>(true), "window expected");
                     const auto closed = alacritty.is_window_open("kild-other");
                     require(closed.ok() && closed.value() == std::optional<bool>(false),
                             "missing window expected");
                     require(alacritty.close_window(std::string("kild-other")).ok(),
                             "closing a gone window succeeds");
                   }});

  tests.push_back({"registry_resolves_by_name_or_first_available", [] {
                     std::vector<std::unique_ptr<terminal::ITerminalBackend>> backends;
                     auto first = std::make_unique<kild::testing::MockTerminal>("first");
                     first->available = false;
                     backends.push_back(std::move(first));
                     backends.push_back(std::make_unique<kild::testing::MockTerminal>("Second"));
                     const terminal::TerminalRegistry registry(std::move(backends));

                     const auto fallback = registry.resolve("");
                     require(fallback.ok() && fallback.value()->name() == "Second",
                             "first available backend expected");
                     require(registry.find("SECOND") != nullptr, "lookup is case-insensitive");

                     const auto unavailable = registry.resolve("first");
                     require(!unavailable.ok() &&
                                 unavailable.error().kind == terminal::TerminalErrorKind::NotAvailable,
                             "unavailable backend should be reported");

                     const auto unknown = registry.resolve("kitty");
                     require(!unknown.ok() &&
                                 unknown.error().kind == terminal::TerminalErrorKind::UnknownTerminal,
                             "unknown backend should be reported");
                   }});

  tests.push_back({"default_registry_lists_builtin_backends", [] {
                     FakeCommandRunner runner;
                     const auto registry = terminal::TerminalRegistry::create_default(runner);
                     const auto names = registry.names();
                     require(names.size() == 2 && names[0] == "tmux" && names[1] == "alacritty",
                             "builtin backends mismatch");
                   }});
}
