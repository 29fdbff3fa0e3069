#include "kild/process/process.hpp"

#include "kild/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <vector>

namespace kild::process {

namespace {

constexpr auto EXIT_POLL_STEP = std::chrono::milliseconds(50);
constexpr auto SIGKILL_BUDGET = std::chrono::milliseconds(1000);

} // namespace

std::string_view ProcessError::code() const {
  switch (kind) {
  case ProcessErrorKind::NotFound:
    return "PROCESS_NOT_FOUND";
  case ProcessErrorKind::KillFailed:
    return "PROCESS_KILL_FAILED";
  case ProcessErrorKind::AccessDenied:
    return "PROCESS_ACCESS_DENIED";
  case ProcessErrorKind::SystemError:
    return "PROCESS_SYSTEM_ERROR";
  }
  return "PROCESS_SYSTEM_ERROR";
}

ProcessError ProcessError::not_found(const int pid, std::string message) {
  return ProcessError{ProcessErrorKind::NotFound, pid, std::move(message)};
}

ProcessError ProcessError::kill_failed(const int pid, std::string message) {
  return ProcessError{ProcessErrorKind::KillFailed, pid, std::move(message)};
}

ProcessError ProcessError::access_denied(const int pid, std::string message) {
  return ProcessError{ProcessErrorKind::AccessDenied, pid, std::move(message)};
}

ProcessError ProcessError::system(const int pid, std::string message) {
  return ProcessError{ProcessErrorKind::SystemError, pid, std::move(message)};
}

bool same_process(const ProcessInfo &info, const std::optional<std::string> &expected_name,
                  const std::optional<std::uint64_t> &expected_start_time) {
  if (expected_start_time.has_value()) {
    return info.start_time == *expected_start_time;
  }
  if (expected_name.has_value() && !expected_name->empty()) {
    return info.name == *expected_name;
  }
  return true;
}

std::optional<ProcStat> parse_proc_stat(const int pid, const std::string &line) {
  // pid (comm) state ppid ... ; comm may itself contain spaces or parentheses.
  const auto open = line.find('(');
  const auto close = line.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    return std::nullopt;
  }

  ProcStat stat;
  stat.info.pid = pid;
  stat.info.name = line.substr(open + 1, close - open - 1);

  std::istringstream rest(line.substr(close + 1));
  std::vector<std::string> fields;
  std::string field;
  while (rest >> field) {
    fields.push_back(field);
  }
  // fields[0] is the state (field 3); starttime is field 22, i.e. fields[19].
  if (fields.size() < 20 || fields[0].empty()) {
    return std::nullopt;
  }
  stat.state = fields[0][0];
  stat.zombie = stat.state == 'Z' || stat.state == 'X' || stat.state == 'x';

  const std::string &start = fields[19];
  auto [ptr, ec] = std::from_chars(start.data(), start.data() + start.size(), stat.info.start_time);
  if (ec != std::errc() || ptr != start.data() + start.size()) {
    return std::nullopt;
  }
  return stat;
}

SystemProcessTable::SystemProcessTable(std::filesystem::path proc_root,
                                       const std::chrono::milliseconds grace_period)
    : proc_root_(std::move(proc_root)), grace_period_(grace_period) {}

common::Result<std::optional<ProcessInfo>, ProcessError>
SystemProcessTable::find(const int pid) const {
  using FindResult = common::Result<std::optional<ProcessInfo>, ProcessError>;
  if (pid <= 0) {
    return FindResult::failure(ProcessError::system(pid, "invalid pid " + std::to_string(pid)));
  }

  const auto stat_path = proc_root_ / std::to_string(pid) / "stat";
  errno = 0;
  std::ifstream in(stat_path);
  if (!in) {
    const int err = errno;
    if (err == ENOENT || err == ESRCH || err == 0) {
      return FindResult::success(std::nullopt);
    }
    if (err == EACCES || err == EPERM) {
      return FindResult::failure(
          ProcessError::access_denied(pid, "cannot read " + stat_path.string()));
    }
    return FindResult::failure(ProcessError::system(
        pid, "cannot read " + stat_path.string() + ": " + std::strerror(err)));
  }

  std::string line;
  std::getline(in, line);
  if (line.empty()) {
    // The process exited between open and read.
    return FindResult::success(std::nullopt);
  }

  const auto stat = parse_proc_stat(pid, line);
  if (!stat.has_value()) {
    return FindResult::failure(
        ProcessError::system(pid, "unrecognised format in " + stat_path.string()));
  }

  if (stat->zombie) {
    // Reap it if it is ours; harmless ECHILD otherwise.
    (void)waitpid(pid, nullptr, WNOHANG);
    return FindResult::success(std::nullopt);
  }
  return FindResult::success(stat->info);
}

bool SystemProcessTable::wait_for_exit(const int pid,
                                       const std::optional<std::uint64_t> &start_time,
                                       const std::chrono::milliseconds budget) const {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  while (true) {
    (void)waitpid(pid, nullptr, WNOHANG);
    const auto current = find(pid);
    if (current.ok()) {
      if (!current.value().has_value() ||
          !same_process(*current.value(), std::nullopt, start_time)) {
        return true;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(EXIT_POLL_STEP);
  }
}

common::Result<void, ProcessError>
SystemProcessTable::kill(const int pid, const std::optional<std::string> &expected_name,
                         const std::optional<std::uint64_t> &expected_start_time) {
  using KillResult = common::Result<void, ProcessError>;

  const auto current = find(pid);
  if (!current.ok()) {
    return KillResult::failure(current.error());
  }
  if (!current.value().has_value()) {
    return KillResult::failure(
        ProcessError::not_found(pid, "process " + std::to_string(pid) + " is not running"));
  }
  const ProcessInfo &info = *current.value();
  if (!same_process(info, expected_name, expected_start_time)) {
    return KillResult::failure(ProcessError::not_found(
        pid, "pid " + std::to_string(pid) + " now belongs to a different process (" + info.name +
                 ")"));
  }
  // Pin the identity we just confirmed so the wait loop notices PID reuse.
  const std::optional<std::uint64_t> identity = info.start_time;

  if (::kill(pid, SIGTERM) != 0) {
    const int err = errno;
    if (err == ESRCH) {
      return KillResult::failure(
          ProcessError::not_found(pid, "process " + std::to_string(pid) + " exited"));
    }
    if (err == EPERM) {
      return KillResult::failure(ProcessError::access_denied(
          pid, "not permitted to signal process " + std::to_string(pid)));
    }
    return KillResult::failure(ProcessError::kill_failed(
        pid, "SIGTERM to " + std::to_string(pid) + " failed: " + std::strerror(err)));
  }

  if (wait_for_exit(pid, identity, grace_period_)) {
    return KillResult::success();
  }

  if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    const int err = errno;
    return KillResult::failure(ProcessError::kill_failed(
        pid, "SIGKILL to " + std::to_string(pid) + " failed: " + std::strerror(err)));
  }

  if (wait_for_exit(pid, identity, SIGKILL_BUDGET)) {
    return KillResult::success();
  }
  return KillResult::failure(ProcessError::kill_failed(
      pid, "process " + std::to_string(pid) + " survived SIGKILL"));
}

} // namespace kild::process
