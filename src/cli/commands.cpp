#include "kild/cli/commands.hpp"

#include "kild/agents/registry.hpp"
#include "kild/common/command.hpp"
#include "kild/common/fs.hpp"
#include "kild/config/config.hpp"
#include "kild/daemon/client.hpp"
#include "kild/git/worktree.hpp"
#include "kild/observability/factory.hpp"
#include "kild/observability/global.hpp"
#include "kild/observability/noop_observer.hpp"
#include "kild/process/process.hpp"
#include "kild/sessions/manager.hpp"
#include "kild/terminal/registry.hpp"

#include <charconv>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace kild::cli {

namespace {

std::string version_string() {
#ifdef KILD_VERSION
  return std::string("kild ") + KILD_VERSION;
#else
  return "kild 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

struct GlobalOptions {
  bool quiet = false;
};

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    if (args[i] == "--quiet" || args[i] == "-q") {
      options.quiet = true;
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

void print_session_error(const sessions::SessionError &error) {
  if (error.is_user_error()) {
    std::cerr << "error: " << error.message << "\n";
  } else {
    std::cerr << "error [" << error.code() << "]: " << error.message << "\n";
  }
}

/// Everything a lifecycle command needs, wired from the loaded config.
struct Runtime {
  config::Config config;
  common::CliCommandRunner runner;
  process::SystemProcessTable processes;
  terminal::TerminalRegistry terminal_registry;
  agents::AgentRegistry agent_registry;
  daemon::SocketDaemonClient daemon_client;
  git::GitWorktreeManager worktrees;
  sessions::LifecycleManager manager;

  explicit Runtime(config::Config loaded)
      : config(std::move(loaded)),
        terminal_registry(terminal::TerminalRegistry::create_default(runner)),
        agent_registry(agents::AgentRegistry::create_default(runner)),
        daemon_client(config.daemon.socket_path,
                      std::chrono::milliseconds(config.daemon.timeout_ms)),
        worktrees(runner),
        manager(config, sessions::SessionStore(config.sessions_dir), agent_registry,
                terminal_registry, processes, worktrees, &daemon_client) {}
};

std::unique_ptr<Runtime> load_runtime(const GlobalOptions &options) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "error: " << cfg.error() << "\n";
    return nullptr;
  }
  if (options.quiet) {
    observability::set_global_observer(std::make_unique<observability::NoopObserver>());
  } else {
    observability::set_global_observer(observability::create_observer(cfg.value()));
  }

  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "error: invalid config: " << validated.error() << "\n";
    return nullptr;
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return std::make_unique<Runtime>(std::move(cfg.value()));
}

bool parse_runtime_option(std::vector<std::string> &args,
                          std::optional<agents::RuntimeMode> &runtime) {
  std::string value;
  if (!take_option(args, "--runtime", "", value)) {
    return true;
  }
  runtime = agents::runtime_mode_from_string(value);
  if (!runtime.has_value()) {
    std::cerr << "error: --runtime must be terminal, daemon or local\n";
    return false;
  }
  return true;
}

bool require_branch(const std::vector<std::string> &args, const std::string &usage) {
  if (args.size() != 1) {
    std::cerr << "usage: " << usage << "\n";
    return false;
  }
  return true;
}

void print_session(const sessions::Session &session) {
  std::cout << "kild:      " << session.branch << "\n";
  std::cout << "id:        " << session.id << "\n";
  std::cout << "worktree:  " << session.worktree_path.string() << "\n";
  std::cout << "agent:     " << session.agent << " (" << session.agents.size() << " launched)\n";
  std::cout << "ports:     " << session.port_range_start << "-" << session.port_range_end << "\n";
  if (session.note.has_value()) {
    std::cout << "note:      " << *session.note << "\n";
  }
}

int run_create(Runtime &runtime, std::vector<std::string> args) {
  sessions::CreateRequest request;
  std::string note;
  std::string project;
  (void)take_option(args, "--agent", "-a", request.agent);
  if (take_option(args, "--note", "-n", note)) {
    request.note = note;
  }
  (void)take_option(args, "--terminal", "-t", request.terminal);
  if (take_option(args, "--project", "-p", project)) {
    request.project_path = common::expand_path(project);
  }
  if (!parse_runtime_option(args, request.runtime)) {
    return 1;
  }
  if (!require_branch(args, "kild create <branch> [--agent A] [--note N] [--terminal T] "
                            "[--runtime R] [--project P]")) {
    return 1;
  }
  request.branch = args[0];

  auto created = runtime.manager.create(request);
  if (!created.ok()) {
    print_session_error(created.error());
    return 1;
  }
  std::cout << "Created kild '" << created.value().branch << "'\n";
  print_session(created.value());
  return 0;
}

int run_open(Runtime &runtime, std::vector<std::string> args) {
  sessions::OpenRequest request;
  (void)take_option(args, "--agent", "-a", request.agent);
  (void)take_option(args, "--terminal", "-t", request.terminal);
  if (!parse_runtime_option(args, request.runtime)) {
    return 1;
  }
  if (!require_branch(args, "kild open <branch> [--agent A] [--terminal T] [--runtime R]")) {
    return 1;
  }
  request.branch = args[0];

  auto opened = runtime.manager.open(request);
  if (!opened.ok()) {
    print_session_error(opened.error());
    return 1;
  }
  std::cout << "Opened " << opened.value().agents.back().agent << " in kild '"
            << opened.value().branch << "'\n";
  return 0;
}

int run_stop(Runtime &runtime, std::vector<std::string> args) {
  if (take_flag(args, "--all")) {
    const auto result = runtime.manager.stop_all();
    for (const auto &branch : result.succeeded) {
      std::cout << "Stopped '" << branch << "'\n";
    }
    for (const auto &[branch, error] : result.failed) {
      std::cerr << "Failed to stop '" << branch << "': " << error.message << "\n";
    }
    std::cout << result.succeeded.size() << " stopped, " << result.failed.size() << " failed\n";
    return result.ok() ? 0 : 1;
  }

  if (!require_branch(args, "kild stop <branch> | kild stop --all")) {
    return 1;
  }
  auto stopped = runtime.manager.stop(args[0]);
  if (!stopped.ok()) {
    print_session_error(stopped.error());
    return 1;
  }
  std::cout << "Stopped '" << args[0] << "'\n";
  return 0;
}

int run_destroy(Runtime &runtime, std::vector<std::string> args) {
  const bool force = take_flag(args, "--force") || take_flag(args, "-f");
  if (!require_branch(args, "kild destroy <branch> [--force]")) {
    return 1;
  }
  auto destroyed = runtime.manager.destroy(args[0], force);
  if (!destroyed.ok()) {
    print_session_error(destroyed.error());
    return 1;
  }
  std::cout << "Destroyed '" << args[0] << "'\n";
  return 0;
}

int run_list(Runtime &runtime) {
  auto sessions = runtime.manager.list();
  if (!sessions.ok()) {
    print_session_error(sessions.error());
    return 1;
  }
  if (sessions.value().empty()) {
    std::cout << "No kilds.\n";
    return 0;
  }
  const auto resolver = runtime.manager.resolver();
  for (const auto &session : sessions.value()) {
    const auto resolution = resolver.resolve(session);
    std::cout << session.branch << "  " << sessions::to_string(session.status) << "  "
              << sessions::to_string(resolution.status)
              << (resolution.any_unknown ? " (process check failed)" : "") << "  "
              << session.agent << "  " << session.port_range_start << "-"
              << session.port_range_end;
    if (const auto activity = runtime.manager.store().read_agent_status(session.id);
        activity.has_value()) {
      std::cout << "  " << sessions::to_string(activity->activity);
    }
    if (session.note.has_value()) {
      std::cout << "  " << *session.note;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_status(Runtime &runtime, std::vector<std::string> args) {
  std::string wait_for;
  std::string timeout_raw = "30000";
  const bool wait = take_option(args, "--wait", "", wait_for);
  (void)take_option(args, "--timeout", "", timeout_raw);
  if (!require_branch(args, "kild status <branch> [--wait running|stopped --timeout MS]")) {
    return 1;
  }
  const std::string &branch = args[0];

  if (wait) {
    const std::string wanted = common::to_lower(wait_for);
    if (wanted != "running" && wanted != "stopped") {
      std::cerr << "error: --wait must be running or stopped\n";
      return 1;
    }
    const auto timeout = parse_u64(timeout_raw);
    if (!timeout.has_value()) {
      std::cerr << "error: --timeout must be a number of milliseconds\n";
      return 1;
    }
    auto waited = runtime.manager.wait_for_status(
        branch, wanted == "running" ? sessions::ProcessStatus::Running
                                    : sessions::ProcessStatus::Stopped,
        std::chrono::milliseconds(*timeout));
    if (!waited.ok()) {
      std::cerr << "error [" << waited.error().code() << "]: " << waited.error().message << "\n";
      return 1;
    }
    std::cout << "'" << branch << "' is " << wanted << " (after "
              << waited.value().attempts << " checks, " << waited.value().elapsed.count()
              << "ms)\n";
    return 0;
  }

  auto session = runtime.manager.get(branch);
  if (!session.ok()) {
    print_session_error(session.error());
    return 1;
  }
  const auto resolution = runtime.manager.resolver().resolve(session.value());
  print_session(session.value());
  std::cout << "status:    " << sessions::to_string(session.value().status) << " / "
            << sessions::to_string(resolution.status)
            << (resolution.any_unknown ? " (process check failed)" : "") << "\n";
  for (std::size_t i = 0; i < session.value().agents.size(); ++i) {
    const auto &agent = session.value().agents[i];
    std::cout << "  " << agent.spawn_id << "  " << agent.agent << "  "
              << sessions::to_string(resolution.agents[i]) << "\n";
  }
  if (const auto activity = runtime.manager.store().read_agent_status(session.value().id);
      activity.has_value()) {
    std::cout << "activity:  " << sessions::to_string(activity->activity) << " ("
              << activity->updated_at << ")\n";
  }
  return 0;
}

int run_agent_status(Runtime &runtime, std::vector<std::string> args) {
  if (args.size() != 2) {
    std::cerr << "usage: kild agent-status <branch> idle|working|waiting\n";
    return 1;
  }
  const auto activity = sessions::agent_activity_from_string(args[1]);
  if (!activity.has_value()) {
    std::cerr << "error: status must be idle, working or waiting\n";
    return 1;
  }
  auto reported = runtime.manager.report_agent_status(args[0], *activity);
  if (!reported.ok()) {
    print_session_error(reported.error());
    return 1;
  }
  return 0;
}

int run_agents() {
  for (const auto &backend : agents::builtin_agent_registry().backends()) {
    std::cout << backend->name() << "  " << backend->display_name() << "  "
              << (backend->is_available() ? "available" : "not installed") << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: kild [--config PATH] [--quiet] <command> [options]\n\n";
  std::cout << "  create <branch>         Create a worktree and launch an agent in it\n";
  std::cout << "  open <branch>           Launch another agent in an existing kild\n";
  std::cout << "  stop <branch> | --all   Stop agents, keep the worktree\n";
  std::cout << "  destroy <branch>        Stop agents and remove the worktree (--force)\n";
  std::cout << "  list                    Show all kilds\n";
  std::cout << "  status <branch>         Show live status (--wait running|stopped)\n";
  std::cout << "  agent-status <branch> S Report agent activity (idle|working|waiting)\n";
  std::cout << "  agents                  Show supported agents\n";
  std::cout << "  config-path             Print the config file location\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  GlobalOptions options;
  std::string global_error;
  if (!apply_global_options(args, options, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "agents") {
    return run_agents();
  }

  const bool known = subcommand == "create" || subcommand == "open" || subcommand == "stop" ||
                     subcommand == "destroy" || subcommand == "list" || subcommand == "status" ||
                     subcommand == "agent-status";
  if (!known) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return 1;
  }

  auto runtime = load_runtime(options);
  if (runtime == nullptr) {
    return 1;
  }
  if (subcommand == "create") {
    return run_create(*runtime, std::move(args));
  }
  if (subcommand == "open") {
    return run_open(*runtime, std::move(args));
  }
  if (subcommand == "stop") {
    return run_stop(*runtime, std::move(args));
  }
  if (subcommand == "destroy") {
    return run_destroy(*runtime, std::move(args));
  }
  if (subcommand == "list") {
    return run_list(*runtime);
  }
  if (subcommand == "status") {
    return run_status(*runtime, std::move(args));
  }
  return run_agent_status(*runtime, std::move(args));
}

} // namespace kild::cli
