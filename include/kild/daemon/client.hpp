#pragma once

#include "kild/common/result.hpp"
#include "kild/daemon/errors.hpp"
#include "kild/daemon/protocol.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace kild::daemon {

class IDaemonClient {
public:
  virtual ~IDaemonClient() = default;

  /// NotFound is a successful answer, not an error.
  [[nodiscard]] virtual common::Result<DaemonSessionStatus, DaemonError>
  get_session_status(const std::string &session_id) = 0;

  [[nodiscard]] virtual common::Result<std::string, DaemonError>
  create_session(const std::string &session_id, const std::filesystem::path &working_dir,
                 const std::string &command) = 0;

  /// Tear down a daemon session. A session the daemon no longer knows counts as destroyed.
  [[nodiscard]] virtual common::Result<void, DaemonError>
  destroy_session(const std::string &session_id, bool force) = 0;
};

class SocketDaemonClient final : public IDaemonClient {
public:
  SocketDaemonClient(std::filesystem::path socket_path, std::chrono::milliseconds timeout);

  [[nodiscard]] common::Result<DaemonSessionStatus, DaemonError>
  get_session_status(const std::string &session_id) override;

  [[nodiscard]] common::Result<std::string, DaemonError>
  create_session(const std::string &session_id, const std::filesystem::path &working_dir,
                 const std::string &command) override;

  [[nodiscard]] common::Result<void, DaemonError> destroy_session(const std::string &session_id,
                                                                  bool force) override;

private:
  [[nodiscard]] common::Result<DaemonResponse, DaemonError> request(const std::string &line) const;

  std::filesystem::path socket_path_;
  std::chrono::milliseconds timeout_;
};

} // namespace kild::daemon
