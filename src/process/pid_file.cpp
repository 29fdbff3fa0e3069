#include "kild/process/pid_file.hpp"

#include "kild/common/fs.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace kild::process {

std::filesystem::path pid_file_path(const std::filesystem::path &pids_dir,
                                    const std::string &spawn_id) {
  return pids_dir / (common::escape_filename(spawn_id) + ".pid");
}

std::string wrap_command_with_pid_capture(const std::string &command,
                                          const std::filesystem::path &pid_file) {
  return "echo $$ > " + common::shell_quote(pid_file.string()) + " && exec " + command;
}

common::Result<std::optional<int>, ProcessError> read_pid_file(const std::filesystem::path &path) {
  using ReadResult = common::Result<std::optional<int>, ProcessError>;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ReadResult::success(std::nullopt);
  }

  std::ifstream in(path);
  if (!in) {
    return ReadResult::failure(ProcessError::system(0, "unable to open pid file " + path.string()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string text = common::trim(buffer.str());
  if (text.empty()) {
    return ReadResult::success(std::nullopt);
  }

  int pid = 0;
  auto [ptr, parse_ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
  if (parse_ec != std::errc() || ptr != text.data() + text.size() || pid <= 0) {
    return ReadResult::failure(
        ProcessError::system(0, "pid file " + path.string() + " holds '" + text + "'"));
  }
  return ReadResult::success(pid);
}

common::Result<void, ProcessError> remove_pid_file(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Result<void, ProcessError>::failure(ProcessError::system(
        0, "failed to delete pid file " + path.string() + ": " + ec.message()));
  }
  return common::Result<void, ProcessError>::success();
}

wait::PollResult<int, ProcessError> wait_for_pid_file(const std::filesystem::path &path,
                                                      const std::chrono::milliseconds timeout) {
  const wait::Probe<int, ProcessError> probe =
      [&path]() -> common::Result<int, wait::ProbeError<ProcessError>> {
    using ProbeResult = common::Result<int, wait::ProbeError<ProcessError>>;
    auto read = read_pid_file(path);
    if (!read.ok()) {
      return ProbeResult::failure(
          wait::ProbeError<ProcessError>::terminal(read.error(), read.error().message));
    }
    if (!read.value().has_value()) {
      return ProbeResult::failure(wait::ProbeError<ProcessError>::retryable(
          ProcessError::not_found(0, "pid file not written yet"),
          path.filename().string() + " not written yet"));
    }
    return ProbeResult::success(*read.value());
  };

  return wait::poll<int, ProcessError>(
      probe, wait::PollOptions{.timeout = timeout,
                               .interval = wait::DEFAULT_POLL_INTERVAL,
                               .target = "pid file " + path.filename().string()});
}

} // namespace kild::process
