#include "kild/config/config.hpp"

#include "kild/agents/registry.hpp"
#include "kild/common/fs.hpp"
#include "kild/common/toml.hpp"
#include "kild/terminal/registry.hpp"

#include <cstdlib>
#include <sstream>

namespace kild::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".kild";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("KILD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::filesystem::path expand_config_value(const std::string &value) {
  return std::filesystem::path(common::expand_path(common::trim(value)));
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

common::Result<std::filesystem::path> kild_dir() {
  if (const char *env = non_empty_env("KILD_HOME"); env != nullptr) {
    return common::Result<std::filesystem::path>::success(expand_config_value(env));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = kild_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

bool is_known_runtime_mode(const std::string &mode) {
  const std::string normalized = common::to_lower(common::trim(mode));
  return normalized == "terminal" || normalized == "daemon" || normalized == "local";
}

Config default_config(const std::filesystem::path &root) {
  Config config;
  config.kild_dir = root;
  config.sessions_dir = root / "sessions";
  config.worktrees_dir = root / "worktrees";
  config.pids_dir = root / "pids";
  config.daemon.socket_path = (root / "daemon.sock").string();
  return config;
}

common::Result<Config> parse_config(const std::string &toml_text,
                                    const std::filesystem::path &root) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config = default_config(root);
  if (doc.has("paths.sessions_dir")) {
    config.sessions_dir = expand_config_value(doc.get_string("paths.sessions_dir"));
  }
  if (doc.has("paths.worktrees_dir")) {
    config.worktrees_dir = expand_config_value(doc.get_string("paths.worktrees_dir"));
  }
  if (doc.has("paths.pids_dir")) {
    config.pids_dir = expand_config_value(doc.get_string("paths.pids_dir"));
  }

  config.agent.default_agent =
      common::to_lower(doc.get_string("agent.default", config.agent.default_agent));
  for (const auto &name : doc.sections("agents")) {
    const std::string key = "agents." + name + ".command";
    if (doc.has(key)) {
      config.agent.commands[common::to_lower(name)] = doc.get_string(key);
    }
  }

  config.terminal.default_terminal =
      common::to_lower(doc.get_string("terminal.default", config.terminal.default_terminal));
  config.runtime.mode = common::to_lower(doc.get_string("runtime.mode", config.runtime.mode));

  config.ports.base = static_cast<std::uint32_t>(doc.get_u64("ports.base", config.ports.base));
  config.ports.count =
      static_cast<std::uint32_t>(doc.get_u64("ports.count", config.ports.count));

  if (doc.has("daemon.socket_path")) {
    config.daemon.socket_path = expand_config_value(doc.get_string("daemon.socket_path")).string();
  }
  config.daemon.timeout_ms = doc.get_u64("daemon.timeout_ms", config.daemon.timeout_ms);
  config.process.pid_wait_ms = doc.get_u64("process.pid_wait_ms", config.process.pid_wait_ms);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *dir = non_empty_env("KILD_SESSIONS_DIR"); dir != nullptr) {
    config.sessions_dir = expand_config_value(dir);
  }
  if (const char *agent = non_empty_env("KILD_DEFAULT_AGENT"); agent != nullptr) {
    config.agent.default_agent = common::to_lower(agent);
  }
  if (const char *terminal = non_empty_env("KILD_DEFAULT_TERMINAL"); terminal != nullptr) {
    config.terminal.default_terminal = common::to_lower(terminal);
  }
  if (const char *runtime = non_empty_env("KILD_RUNTIME"); runtime != nullptr) {
    config.runtime.mode = common::to_lower(runtime);
  }
  if (const char *socket = non_empty_env("KILD_DAEMON_SOCKET"); socket != nullptr) {
    config.daemon.socket_path = expand_config_value(socket).string();
  }
  if (const char *log = non_empty_env("KILD_LOG"); log != nullptr) {
    config.observability.backend = log;
  }
}

common::Result<Config> load_config() {
  const auto root = kild_dir();
  if (!root.ok()) {
    return common::Result<Config>::failure(root.error());
  }

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config = default_config(root.value());
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value(), root.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "[paths]\n";
  file << "sessions_dir = " << common::quote_toml_string(config.sessions_dir.string()) << "\n";
  file << "worktrees_dir = " << common::quote_toml_string(config.worktrees_dir.string()) << "\n";
  file << "pids_dir = " << common::quote_toml_string(config.pids_dir.string()) << "\n";

  file << "\n[agent]\n";
  file << "default = " << common::quote_toml_string(config.agent.default_agent) << "\n";
  for (const auto &[name, command] : config.agent.commands) {
    file << "\n[agents." << name << "]\n";
    file << "command = " << common::quote_toml_string(command) << "\n";
  }

  file << "\n[terminal]\n";
  file << "default = " << common::quote_toml_string(config.terminal.default_terminal) << "\n";

  file << "\n[runtime]\n";
  file << "mode = " << common::quote_toml_string(config.runtime.mode) << "\n";

  file << "\n[ports]\n";
  file << "base = " << config.ports.base << "\n";
  file << "count = " << config.ports.count << "\n";

  file << "\n[daemon]\n";
  file << "socket_path = " << common::quote_toml_string(config.daemon.socket_path) << "\n";
  file << "timeout_ms = " << config.daemon.timeout_ms << "\n";

  file << "\n[process]\n";
  file << "pid_wait_ms = " << config.process.pid_wait_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (agents::builtin_agent_registry().find(config.agent.default_agent) == nullptr) {
    return common::Result<std::vector<std::string>>::failure("Unknown agent.default: " +
                                                              config.agent.default_agent);
  }
  for (const auto &[name, command] : config.agent.commands) {
    if (agents::builtin_agent_registry().find(name) == nullptr) {
      warnings.push_back("agents." + name + " does not match a known agent");
    }
    if (common::trim(command).empty()) {
      return common::Result<std::vector<std::string>>::failure("agents." + name +
                                                                ".command is empty");
    }
  }

  if (const std::string terminal = common::trim(config.terminal.default_terminal);
      !terminal.empty() && terminal::builtin_terminal_registry().find(terminal) == nullptr) {
    return common::Result<std::vector<std::string>>::failure("Unknown terminal.default: " +
                                                              terminal);
  }

  if (!is_known_runtime_mode(config.runtime.mode)) {
    return common::Result<std::vector<std::string>>::failure("Invalid runtime.mode: " +
                                                              config.runtime.mode);
  }

  if (config.ports.count == 0 || config.ports.count > 1000) {
    return common::Result<std::vector<std::string>>::failure("ports.count must be 1-1000");
  }
  if (config.ports.base == 0 || config.ports.base > 65535) {
    return common::Result<std::vector<std::string>>::failure("ports.base must be 1-65535");
  }
  if (config.ports.base < 1024) {
    warnings.push_back("ports.base is below 1024; agents may need privileges to bind");
  }

  if (config.daemon.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "daemon.timeout_ms must be greater than zero");
  }
  if (config.daemon.socket_path.empty()) {
    warnings.push_back("daemon.socket_path is empty; daemon sessions cannot be queried");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop" && backend != "off") {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace kild::config
