#pragma once

#include "kild/common/result.hpp"
#include "kild/process/process.hpp"
#include "kild/wait/poller.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace kild::process {

[[nodiscard]] std::filesystem::path pid_file_path(const std::filesystem::path &pids_dir,
                                                  const std::string &spawn_id);

/// Shell snippet that records the shell's pid, then execs `command` under that same pid:
///   echo $$ > '<pid_file>' && exec <command>
[[nodiscard]] std::string wrap_command_with_pid_capture(const std::string &command,
                                                        const std::filesystem::path &pid_file);

[[nodiscard]] common::Result<std::optional<int>, ProcessError>
read_pid_file(const std::filesystem::path &path);

[[nodiscard]] common::Result<void, ProcessError> remove_pid_file(const std::filesystem::path &path);

[[nodiscard]] wait::PollResult<int, ProcessError>
wait_for_pid_file(const std::filesystem::path &path, std::chrono::milliseconds timeout);

} // namespace kild::process
