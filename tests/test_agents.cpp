#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "kild/agents/backends.hpp"
#include "kild/agents/registry.hpp"
#include "kild/process/pid_file.hpp"
#include "kild/terminal/registry.hpp"

namespace {

/// Runs the spawn command through a real shell so the pid capture can be observed.
class ShellTerminal final : public kild::terminal::ITerminalBackend {
public:
  [[nodiscard]] std::string_view name() const override { return "shell"; }
  [[nodiscard]] std::string_view display_name() const override { return "Shell"; }
  [[nodiscard]] bool is_available() const override { return true; }

  [[nodiscard]] kild::common::Result<std::optional<std::string>, kild::terminal::TerminalError>
  execute_spawn(const kild::terminal::SpawnConfig &config) const override {
    using SpawnResult =
        kild::common::Result<std::optional<std::string>, kild::terminal::TerminalError>;
    auto pid = runner_.spawn_detached({"sh", "-c", config.command}, config.working_dir);
    if (!pid.ok()) {
      return SpawnResult::failure(kild::terminal::TerminalError{
          .kind = kild::terminal::TerminalErrorKind::SpawnFailed, .message = pid.error()});
    }
    return SpawnResult::success(std::nullopt);
  }

  [[nodiscard]] kild::common::Result<void, kild::terminal::TerminalError>
  close_window(const std::optional<std::string> &) const override {
    return kild::common::Result<void, kild::terminal::TerminalError>::success();
  }

  [[nodiscard]] kild::common::Result<std::optional<bool>, kild::terminal::TerminalError>
  is_window_open(const std::string &) const override {
    return kild::common::Result<std::optional<bool>, kild::terminal::TerminalError>::success(
        std::nullopt);
  }

private:
  mutable kild::common::CliCommandRunner runner_;
};

kild::terminal::TerminalRegistry single_terminal(std::unique_ptr<kild::terminal::ITerminalBackend> backend) {
  std::vector<std::unique_ptr<kild::terminal::ITerminalBackend>> backends;
  backends.push_back(std::move(backend));
  return kild::terminal::TerminalRegistry(std::move(backends));
}

kild::agents::SpawnRequest request_in(const std::filesystem::path &dir, std::string command) {
  return kild::agents::SpawnRequest{.spawn_id = "proj/feat_0",
                                    .working_dir = dir,
                                    .command = std::move(command),
                                    .title = "proj/feat_0"};
}

} // namespace

void register_agents_tests(std::vector<kild::tests::TestCase> &tests) {
  using kild::tests::require;
  using kild::testing::FakeCommandRunner;
  using kild::testing::TempWorkspace;
  namespace agents = kild::agents;

  tests.push_back({"registry_lists_builtin_agents", [] {
                     FakeCommandRunner runner;
                     const auto registry = agents::AgentRegistry::create_default(runner);
                     const auto names = registry.names();
                     require(names.size() == 6, "six builtin agents expected");
                     require(registry.find(" Claude ") != nullptr, "lookup trims and lowercases");
                     require(registry.find("kiro")->default_command() == "kiro-cli chat",
                             "kiro default command mismatch");
                     const auto patterns = registry.find("claude")->process_patterns();
                     require(patterns.size() == 2, "claude has two process patterns");
                   }});

  tests.push_back({"registry_resolve_reports_unknown_and_missing", [] {
                     FakeCommandRunner runner;
                     runner.set_available("codex", true);
                     runner.set_available("kiro-cli", true);
                     const auto registry = agents::AgentRegistry::create_default(runner);

                     const auto unknown = registry.resolve("cursor");
                     require(!unknown.ok(), "unknown agent should fail");
                     require(unknown.error().code() == "UNKNOWN_AGENT", "unknown code expected");
                     require(unknown.error().message.find("codex") != std::string::npos,
                             "known agents should be listed");

                     const auto missing = registry.resolve("claude");
                     require(!missing.ok() &&
                                 missing.error().kind == agents::AgentErrorKind::AgentNotAvailable,
                             "missing binary should fail");
                     require(missing.error().is_user_error(), "missing agent is a user error");

                     require(registry.resolve("codex").ok(), "installed agent should resolve");
                     require(registry.resolve("kiro").ok(),
                             "availability checks the first word of the command");
                   }});

  tests.push_back({"resolve_agent_command_prefers_override", [] {
                     FakeCommandRunner runner;
                     const agents::ClaudeBackend claude(runner);
                     require(agents::resolve_agent_command(claude, "  ") == "claude",
                             "blank override falls back to default");
                     require(agents::resolve_agent_command(claude, " claude --resume ") ==
                                 "claude --resume",
                             "override should be trimmed and used");
                   }});

  tests.push_back({"runtime_mode_strings", [] {
                     require(agents::to_string(agents::RuntimeMode::Daemon) == "daemon",
                             "daemon string mismatch");
                     require(agents::runtime_mode_from_string(" Local ") == agents::RuntimeMode::Local,
                             "parse should trim and lowercase");
                     require(!agents::runtime_mode_from_string("cloud").has_value(),
                             "unknown mode should not parse");
                   }});

  tests.push_back({"spawn_rejects_empty_command", [] {
                     FakeCommandRunner runner;
                     const agents::CodexBackend codex(runner);
                     const auto spawned = codex.spawn(request_in("/tmp", "   "),
                                                      agents::LaunchContext{.mode = agents::RuntimeMode::Local});
                     require(!spawned.ok(), "empty command should fail");
                     require(spawned.error().code() == "AGENT_SPAWN_FAILED", "spawn code expected");
                   }});

  tests.push_back({"local_spawn_records_process_identity", [] {
                     FakeCommandRunner runner;
                     kild::testing::MockProcessTable processes;
                     runner.on_spawn = [&processes](const std::vector<std::string> &) {
                       return kild::common::Result<int>::success(processes.add("codex", 777));
                     };
                     const agents::CodexBackend codex(runner);
                     const auto spawned = codex.spawn(
                         request_in("/work", "codex --full-auto"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Local, .processes = &processes});
                     require(spawned.ok(), spawned.ok() ? "" : spawned.error().message);
                     const auto &handles = spawned.value();
                     require(handles.local.has_value() && !handles.terminal.has_value() &&
                                 !handles.daemon.has_value(),
                             "local launch sets only the local handle");
                     require(handles.local->process_name == "codex" && handles.local->start_time == 777,
                             "identity should come from the process table");
                     require(runner.spawned.front().back() == "exec codex --full-auto",
                             "command should be exec'd through sh");
                   }});

  tests.push_back({"local_spawn_fails_when_process_exits_immediately", [] {
                     FakeCommandRunner runner;
                     kild::testing::MockProcessTable processes;
                     runner.on_spawn = [](const std::vector<std::string> &) {
                       return kild::common::Result<int>::success(99);
                     };
                     const agents::CodexBackend codex(runner);
                     const auto spawned = codex.spawn(
                         request_in("/work", "codex"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Local, .processes = &processes});
                     require(!spawned.ok(), "vanished process should fail the launch");
                   }});

  tests.push_back({"terminal_spawn_without_pid_keeps_terminal_handle", [] {
                     TempWorkspace ws;
                     kild::testing::ObserverCapture capture;
                     FakeCommandRunner runner;
                     kild::testing::MockProcessTable processes;
                     auto mock = std::make_unique<kild::testing::MockTerminal>();
                     const auto *terminal = mock.get();
                     const auto registry = single_terminal(std::move(mock));

                     const agents::ClaudeBackend claude(runner);
                     const auto spawned = claude.spawn(
                         request_in(ws.path(), "claude"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Terminal,
                                               .terminal_preference = "",
                                               .terminals = &registry,
                                               .daemon = nullptr,
                                               .processes = &processes,
                                               .pids_dir = ws.path() / "pids",
                                               .pid_wait = std::chrono::milliseconds(150)});
                     require(spawned.ok(), spawned.ok() ? "" : spawned.error().message);
                     require(spawned.value().terminal.has_value() && !spawned.value().local.has_value(),
                             "terminal handle only");
                     require(spawned.value().terminal->terminal_type == "mock", "terminal type mismatch");
                     require(spawned.value().terminal->window_id ==
                                 std::optional<std::string>("mock-proj_2ffeat_5f0"),
                             "window id mismatch");
                     require(terminal->spawns.front().command.find("exec claude") != std::string::npos,
                             "command should be wrapped with pid capture");
                     require(capture.warning_count() == 1, "missing pid should be logged");
                   }});

  tests.push_back({"terminal_spawn_captures_pid_from_shell", [] {
                     TempWorkspace ws;
                     FakeCommandRunner runner;
                     kild::process::SystemProcessTable processes("/proc", std::chrono::milliseconds(500));
                     const auto registry = single_terminal(std::make_unique<ShellTerminal>());

                     const agents::CodexBackend codex(runner);
                     const auto spawned = codex.spawn(
                         request_in(ws.path(), "sleep 30"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Terminal,
                                               .terminal_preference = "shell",
                                               .terminals = &registry,
                                               .daemon = nullptr,
                                               .processes = &processes,
                                               .pids_dir = ws.path() / "pids",
                                               .pid_wait = std::chrono::milliseconds(3000)});
                     require(spawned.ok(), spawned.ok() ? "" : spawned.error().message);
                     const auto &local = spawned.value().local;
                     require(local.has_value() && local->process_name == "sleep",
                             "local handle should describe the exec'd agent");
                     require(processes.kill(local->pid, local->process_name, local->start_time).ok(),
                             "cleanup kill failed");
                   }});

  tests.push_back({"terminal_spawn_reports_unknown_terminal", [] {
                     TempWorkspace ws;
                     FakeCommandRunner runner;
                     const auto registry = single_terminal(std::make_unique<kild::testing::MockTerminal>());
                     const agents::ClaudeBackend claude(runner);
                     const auto spawned = claude.spawn(
                         request_in(ws.path(), "claude"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Terminal,
                                               .terminal_preference = "iterm",
                                               .terminals = &registry,
                                               .pids_dir = ws.path() / "pids"});
                     require(!spawned.ok(), "unknown terminal should fail the launch");
                     require(spawned.error().message.find("UNKNOWN_TERMINAL") != std::string::npos,
                             "terminal error code should be carried");
                   }});

  tests.push_back({"daemon_spawn_records_session_id", [] {
                     FakeCommandRunner runner;
                     kild::testing::MockDaemonClient daemon;
                     const agents::GeminiBackend gemini(runner);
                     const auto spawned = gemini.spawn(
                         request_in("/work", "gemini"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Daemon, .daemon = &daemon});
                     require(spawned.ok(), spawned.ok() ? "" : spawned.error().message);
                     require(spawned.value().daemon.has_value() &&
                                 spawned.value().daemon->session_id == "proj/feat_0",
                             "daemon handle expected");
                     require(!spawned.value().local.has_value() && !spawned.value().terminal.has_value(),
                             "daemon launch sets only the daemon handle");
                   }});

  tests.push_back({"daemon_spawn_fails_when_daemon_is_down", [] {
                     FakeCommandRunner runner;
                     kild::testing::MockDaemonClient daemon;
                     daemon.failure = kild::daemon::DaemonErrorKind::NotRunning;
                     const agents::GeminiBackend gemini(runner);
                     const auto spawned = gemini.spawn(
                         request_in("/work", "gemini"),
                         agents::LaunchContext{.mode = agents::RuntimeMode::Daemon, .daemon = &daemon});
                     require(!spawned.ok(), "unreachable daemon should fail the launch");
                     require(spawned.error().message.find("DAEMON_NOT_RUNNING") != std::string::npos,
                             "daemon error code should be carried");
                   }});
}
