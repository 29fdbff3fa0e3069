#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace kild::config {

struct AgentConfig {
  std::string default_agent = "claude";
  std::map<std::string, std::string> commands;
};

struct TerminalConfig {
  std::string default_terminal;
};

struct RuntimeConfig {
  std::string mode = "terminal";
};

struct PortsConfig {
  std::uint32_t base = 3000;
  std::uint32_t count = 10;
};

struct DaemonConfig {
  std::string socket_path;
  std::uint64_t timeout_ms = 2000;
};

struct ProcessConfig {
  std::uint64_t pid_wait_ms = 3000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::filesystem::path kild_dir;
  std::filesystem::path sessions_dir;
  std::filesystem::path worktrees_dir;
  std::filesystem::path pids_dir;

  AgentConfig agent;
  TerminalConfig terminal;
  RuntimeConfig runtime;
  PortsConfig ports;
  DaemonConfig daemon;
  ProcessConfig process;
  ObservabilityConfig observability;
};

} // namespace kild::config
