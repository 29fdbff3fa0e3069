#pragma once

#include "kild/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kild::process {

enum class ProcessErrorKind { NotFound, KillFailed, AccessDenied, SystemError };

struct ProcessError {
  ProcessErrorKind kind = ProcessErrorKind::SystemError;
  int pid = 0;
  std::string message;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const { return false; }

  static ProcessError not_found(int pid, std::string message);
  static ProcessError kill_failed(int pid, std::string message);
  static ProcessError access_denied(int pid, std::string message);
  static ProcessError system(int pid, std::string message);
};

struct ProcessInfo {
  int pid = 0;
  std::string name;
  std::uint64_t start_time = 0;
};

/// True when `info` is still the process recorded as (expected_name, expected_start_time).
/// The start time is authoritative; the name is only compared when no start time was recorded.
[[nodiscard]] bool same_process(const ProcessInfo &info,
                                const std::optional<std::string> &expected_name,
                                const std::optional<std::uint64_t> &expected_start_time);

class IProcessTable {
public:
  virtual ~IProcessTable() = default;

  [[nodiscard]] virtual common::Result<std::optional<ProcessInfo>, ProcessError>
  find(int pid) const = 0;

  /// SIGTERM, bounded wait, then SIGKILL. A process that is gone, or whose identity no longer
  /// matches the expectation, yields NotFound.
  [[nodiscard]] virtual common::Result<void, ProcessError>
  kill(int pid, const std::optional<std::string> &expected_name,
       const std::optional<std::uint64_t> &expected_start_time) = 0;
};

class SystemProcessTable final : public IProcessTable {
public:
  explicit SystemProcessTable(std::filesystem::path proc_root = "/proc",
                              std::chrono::milliseconds grace_period = std::chrono::milliseconds(1000));

  [[nodiscard]] common::Result<std::optional<ProcessInfo>, ProcessError>
  find(int pid) const override;

  [[nodiscard]] common::Result<void, ProcessError>
  kill(int pid, const std::optional<std::string> &expected_name,
       const std::optional<std::uint64_t> &expected_start_time) override;

private:
  [[nodiscard]] bool wait_for_exit(int pid, const std::optional<std::uint64_t> &start_time,
                                   std::chrono::milliseconds budget) const;

  std::filesystem::path proc_root_;
  std::chrono::milliseconds grace_period_;
};

struct ProcStat {
  ProcessInfo info;
  char state = '?';
  bool zombie = false;
};

[[nodiscard]] std::optional<ProcStat> parse_proc_stat(int pid, const std::string &line);

} // namespace kild::process
