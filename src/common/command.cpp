#include "kild/common/command.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kild::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

std::vector<char *> make_argv(const std::vector<std::string> &args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

} // namespace

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

Result<CommandResult> CliCommandRunner::run(const std::vector<std::string> &args,
                                            const CommandOptions &options) {
  if (args.empty()) {
    return Result<CommandResult>::failure("command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return Result<CommandResult>::failure("failed to create pipes for " + args.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return Result<CommandResult>::failure("failed to fork " + args.front());
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
      _exit(126);
    }

    auto argv = make_argv(args);
    execvp(argv[0], argv.data());
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_pipe[0], stdout_text);
    read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe[0], stdout_text);
  read_into_buffer(stderr_pipe[0], stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  CommandResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return Result<CommandResult>::failure("command timed out: " + join_args(args));
    }
  }

  if (result.exit_code == 127 && !options.allow_failure) {
    return Result<CommandResult>::failure("command not found: " + args.front());
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + join_args(args)
                                    : join_args(args) + ": " + result.stderr_text;
    return Result<CommandResult>::failure(message);
  }

  return Result<CommandResult>::success(std::move(result));
}

Result<int> CliCommandRunner::spawn_detached(const std::vector<std::string> &args,
                                             const std::filesystem::path &working_dir) {
  if (args.empty()) {
    return Result<int>::failure("command is empty");
  }

  // The child reports exec failure through a close-on-exec pipe.
  int status_pipe[2] = {-1, -1};
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    return Result<int>::failure("failed to create status pipe for " + args.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(status_pipe);
    return Result<int>::failure("failed to fork " + args.front());
  }

  if (pid == 0) {
    close(status_pipe[0]);
    (void)setsid();
    const int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      (void)dup2(devnull, STDOUT_FILENO);
      (void)dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        close(devnull);
      }
    }
    int err = 0;
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      err = errno;
      (void)write(status_pipe[1], &err, sizeof(err));
      _exit(126);
    }
    auto argv = make_argv(args);
    execvp(argv[0], argv.data());
    err = errno;
    (void)write(status_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  close(status_pipe[1]);
  int child_errno = 0;
  ssize_t bytes = 0;
  do {
    bytes = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (bytes < 0 && errno == EINTR);
  close(status_pipe[0]);

  if (bytes > 0) {
    (void)waitpid(pid, nullptr, 0);
    return Result<int>::failure("failed to start " + args.front() + ": " +
                                std::strerror(child_errno));
  }
  return Result<int>::success(static_cast<int>(pid));
}

bool CliCommandRunner::command_exists(const std::string &name) const {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }
  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  std::stringstream stream(path_env);
  std::string dir;
  while (std::getline(stream, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    struct stat info {};
    if (stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
        access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace kild::common
