#include "tests/helpers/test_helpers.hpp"

#include "kild/common/fs.hpp"
#include "kild/observability/global.hpp"
#include "kild/observability/noop_observer.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <poll.h>
#include <random>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace kild::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("kild-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

config::Config temp_config(const TempWorkspace &workspace) {
  config::Config config;
  config.kild_dir = workspace.path() / ".kild";
  config.sessions_dir = config.kild_dir / "sessions";
  config.worktrees_dir = config.kild_dir / "worktrees";
  config.pids_dir = config.kild_dir / "pids";
  config.daemon.socket_path = (config.kild_dir / "daemon.sock").string();
  config.runtime.mode = "local";
  config.process.pid_wait_ms = 200;
  config.observability.backend = "none";
  return config;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics.push_back(metric);
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

std::size_t ObserverCapture::warning_count() const {
  std::size_t count = 0;
  for (const auto &event : observer_->events) {
    if (std::holds_alternative<observability::WarningEvent>(event)) {
      ++count;
    }
  }
  return count;
}

void FakeCommandRunner::add_response(std::vector<std::string> argv_prefix,
                                     common::CommandResult result) {
  responses_.emplace_back(std::move(argv_prefix), std::move(result));
}

void FakeCommandRunner::set_available(const std::string &name, const bool available) {
  if (available) {
    available_.insert(name);
  } else {
    available_.erase(name);
  }
}

common::Result<common::CommandResult> FakeCommandRunner::run(const std::vector<std::string> &argv,
                                                             const common::CommandOptions &options) {
  calls.push_back(argv);
  const common::CommandResult *best = nullptr;
  std::size_t best_len = 0;
  for (const auto &[prefix, result] : responses_) {
    if (prefix.size() > argv.size() || prefix.size() < best_len) {
      continue;
    }
    if (std::equal(prefix.begin(), prefix.end(), argv.begin())) {
      best = &result;
      best_len = prefix.size();
    }
  }
  if (best == nullptr) {
    return common::Result<common::CommandResult>::failure("unexpected command: " +
                                                          common::join_args(argv));
  }
  if (best->exit_code != 0 && !options.allow_failure) {
    return common::Result<common::CommandResult>::failure(best->stderr_text);
  }
  return common::Result<common::CommandResult>::success(*best);
}

common::Result<int> FakeCommandRunner::spawn_detached(const std::vector<std::string> &argv,
                                                      const std::filesystem::path &) {
  spawned.push_back(argv);
  if (!on_spawn) {
    return common::Result<int>::failure("spawn not scripted");
  }
  return on_spawn(argv);
}

bool FakeCommandRunner::command_exists(const std::string &name) const {
  return available_.contains(name);
}

int MockProcessTable::add(const std::string &name, const std::uint64_t start_time) {
  const int pid = ++next_pid_;
  processes_[pid] = process::ProcessInfo{.pid = pid, .name = name, .start_time = start_time};
  return pid;
}

void MockProcessTable::put(const process::ProcessInfo &info) { processes_[info.pid] = info; }

void MockProcessTable::erase(const int pid) { processes_.erase(pid); }

void MockProcessTable::fail_kill(const int pid) { kill_failures_.insert(pid); }

void MockProcessTable::fail_find(const int pid) { find_failures_.insert(pid); }

common::Result<std::optional<process::ProcessInfo>, process::ProcessError>
MockProcessTable::find(const int pid) const {
  using FindResult = common::Result<std::optional<process::ProcessInfo>, process::ProcessError>;
  if (find_failures_.contains(pid)) {
    return FindResult::failure(process::ProcessError::system(pid, "proc table unreadable"));
  }
  const auto it = processes_.find(pid);
  if (it == processes_.end()) {
    return FindResult::success(std::nullopt);
  }
  return FindResult::success(it->second);
}

common::Result<void, process::ProcessError>
MockProcessTable::kill(const int pid, const std::optional<std::string> &expected_name,
                       const std::optional<std::uint64_t> &expected_start_time) {
  kill_calls.push_back(pid);
  const auto it = processes_.find(pid);
  if (it == processes_.end() ||
      !process::same_process(it->second, expected_name, expected_start_time)) {
    return common::Result<void, process::ProcessError>::failure(
        process::ProcessError::not_found(pid, "no such process"));
  }
  if (kill_failures_.contains(pid)) {
    return common::Result<void, process::ProcessError>::failure(
        process::ProcessError::kill_failed(pid, "process ignored SIGKILL"));
  }
  processes_.erase(it);
  return common::Result<void, process::ProcessError>::success();
}

MockTerminal::MockTerminal(std::string name) : name_(std::move(name)) {}

common::Result<std::optional<std::string>, terminal::TerminalError>
MockTerminal::execute_spawn(const terminal::SpawnConfig &config) const {
  spawns.push_back(config);
  const std::string id = name_ + "-" + common::escape_filename(config.title);
  open_windows.insert(id);
  return common::Result<std::optional<std::string>, terminal::TerminalError>::success(id);
}

common::Result<void, terminal::TerminalError>
MockTerminal::close_window(const std::optional<std::string> &window_id) const {
  if (fail_close) {
    return common::Result<void, terminal::TerminalError>::failure(terminal::TerminalError{
        .kind = terminal::TerminalErrorKind::CloseFailed, .message = "window refused to close"});
  }
  if (window_id.has_value()) {
    closed.push_back(*window_id);
    open_windows.erase(*window_id);
  }
  return common::Result<void, terminal::TerminalError>::success();
}

common::Result<std::optional<bool>, terminal::TerminalError>
MockTerminal::is_window_open(const std::string &window_id) const {
  if (cannot_tell) {
    return common::Result<std::optional<bool>, terminal::TerminalError>::success(std::nullopt);
  }
  return common::Result<std::optional<bool>, terminal::TerminalError>::success(
      open_windows.contains(window_id));
}

common::Result<daemon::DaemonSessionStatus, daemon::DaemonError>
MockDaemonClient::get_session_status(const std::string &session_id) {
  queries.push_back(session_id);
  if (failure.has_value()) {
    return common::Result<daemon::DaemonSessionStatus, daemon::DaemonError>::failure(
        daemon::DaemonError{.kind = *failure, .message = "mock daemon failure", .daemon_code = {}});
  }
  const auto it = sessions.find(session_id);
  return common::Result<daemon::DaemonSessionStatus, daemon::DaemonError>::success(
      it == sessions.end() ? daemon::DaemonSessionStatus::NotFound : it->second);
}

common::Result<std::string, daemon::DaemonError>
MockDaemonClient::create_session(const std::string &session_id, const std::filesystem::path &,
                                 const std::string &) {
  if (failure.has_value()) {
    return common::Result<std::string, daemon::DaemonError>::failure(
        daemon::DaemonError{.kind = *failure, .message = "mock daemon failure", .daemon_code = {}});
  }
  sessions[session_id] = daemon::DaemonSessionStatus::Running;
  return common::Result<std::string, daemon::DaemonError>::success(session_id);
}

common::Result<void, daemon::DaemonError>
MockDaemonClient::destroy_session(const std::string &session_id, const bool force) {
  destroyed.emplace_back(session_id, force);
  if (failure.has_value()) {
    return common::Result<void, daemon::DaemonError>::failure(
        daemon::DaemonError{.kind = *failure, .message = "mock daemon failure", .daemon_code = {}});
  }
  sessions.erase(session_id);
  return common::Result<void, daemon::DaemonError>::success();
}

common::Result<std::filesystem::path, git::GitError>
MockWorktreeManager::repo_root(const std::filesystem::path &path) {
  return common::Result<std::filesystem::path, git::GitError>::success(path);
}

common::Result<void, git::GitError>
MockWorktreeManager::create(const std::filesystem::path &, const std::filesystem::path &worktree_path,
                            const std::string &branch) {
  std::error_code ec;
  std::filesystem::create_directories(worktree_path, ec);
  if (ec) {
    return common::Result<void, git::GitError>::failure(
        git::GitError{.kind = git::GitErrorKind::CommandFailed, .message = ec.message()});
  }
  branches.push_back(branch);
  return common::Result<void, git::GitError>::success();
}

common::Result<bool, git::GitError>
MockWorktreeManager::has_uncommitted_changes(const std::filesystem::path &worktree_path) {
  return common::Result<bool, git::GitError>::success(dirty.contains(worktree_path));
}

common::Result<void, git::GitError>
MockWorktreeManager::remove(const std::filesystem::path &worktree_path, const bool force) {
  if (!force && dirty.contains(worktree_path)) {
    return common::Result<void, git::GitError>::failure(git::GitError{
        .kind = git::GitErrorKind::UncommittedChanges, .message = "worktree is dirty"});
  }
  std::error_code ec;
  std::filesystem::remove_all(worktree_path, ec);
  dirty.erase(worktree_path);
  return common::Result<void, git::GitError>::success();
}

FakeDaemonServer::FakeDaemonServer(std::filesystem::path socket_path, Handler handler)
    : socket_path_(std::move(socket_path)), handler_(std::move(handler)) {}

FakeDaemonServer::~FakeDaemonServer() { stop(); }

common::Status FakeDaemonServer::start() {
  if (running_.exchange(true)) {
    return common::Status::success();
  }
  std::error_code ec;
  std::filesystem::create_directories(socket_path_.parent_path(), ec);

  const std::string socket = socket_path_.string();
  if (socket.size() >= sizeof(sockaddr_un::sun_path)) {
    running_.store(false);
    return common::Status::error("fake daemon socket path is too long");
  }
  ::unlink(socket.c_str());

  listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    running_.store(false);
    return common::Status::error("failed to create fake daemon socket");
  }
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket.c_str());
  if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(listen_fd_, 8) != 0) {
    close(listen_fd_);
    listen_fd_ = -1;
    running_.store(false);
    return common::Status::error("failed to bind fake daemon socket");
  }

  worker_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

void FakeDaemonServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  ::unlink(socket_path_.c_str());
}

std::vector<std::string> FakeDaemonServer::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

void FakeDaemonServer::run_loop() {
  while (running_.load()) {
    struct pollfd pfd {
      .fd = listen_fd_, .events = POLLIN, .revents = 0,
    };
    if (poll(&pfd, 1, 50) <= 0) {
      continue;
    }
    const int client = ::accept(listen_fd_, nullptr, nullptr);
    if (client < 0) {
      continue;
    }

    std::string line;
    std::array<char, 256> chunk{};
    while (line.find('\n') == std::string::npos) {
      const ssize_t bytes = ::read(client, chunk.data(), chunk.size());
      if (bytes <= 0) {
        break;
      }
      line.append(chunk.data(), static_cast<std::size_t>(bytes));
    }
    line = common::trim(line);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(line);
    }

    const std::string reply = handler_(line);
    if (!reply.empty()) {
      const std::string payload = reply + "\n";
      (void)::send(client, payload.data(), payload.size(), MSG_NOSIGNAL);
    }
    close(client);
  }
}

bool git_available() {
  common::CliCommandRunner runner;
  return runner.command_exists("git");
}

void init_git_repo(const std::filesystem::path &dir) {
  common::CliCommandRunner runner;
  std::filesystem::create_directories(dir);
  const std::string repo = dir.string();
  const std::vector<std::vector<std::string>> steps = {
      {"git", "-C", repo, "init", "-q"},
      {"git", "-C", repo, "config", "user.email", "kild@example.com"},
      {"git", "-C", repo, "config", "user.name", "kild tests"},
      {"git", "-C", repo, "config", "commit.gpgsign", "false"},
  };
  for (const auto &step : steps) {
    auto result = runner.run(step);
    if (!result.ok()) {
      throw std::runtime_error(result.error());
    }
  }
  std::ofstream(dir / "README.md") << "kild test repo\n";
  for (const auto &step : std::vector<std::vector<std::string>>{
           {"git", "-C", repo, "add", "README.md"},
           {"git", "-C", repo, "commit", "-q", "-m", "initial"}}) {
    auto result = runner.run(step);
    if (!result.ok()) {
      throw std::runtime_error(result.error());
    }
  }
}

} // namespace kild::testing
