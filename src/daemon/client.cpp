#include "kild/daemon/client.hpp"

#include "kild/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace kild::daemon {

namespace {

DaemonError make_error(const DaemonErrorKind kind, std::string message) {
  return DaemonError{.kind = kind, .message = std::move(message), .daemon_code = {}};
}

class SocketGuard {
public:
  explicit SocketGuard(int fd) : fd_(fd) {}
  ~SocketGuard() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }
  SocketGuard(const SocketGuard &) = delete;
  SocketGuard &operator=(const SocketGuard &) = delete;

  [[nodiscard]] int get() const { return fd_; }

private:
  int fd_;
};

int remaining_ms(const std::chrono::steady_clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return std::max(0, static_cast<int>(remaining.count()));
}

} // namespace

SocketDaemonClient::SocketDaemonClient(std::filesystem::path socket_path,
                                       const std::chrono::milliseconds timeout)
    : socket_path_(common::expand_path(socket_path.string())), timeout_(timeout) {}

common::Result<DaemonResponse, DaemonError>
SocketDaemonClient::request(const std::string &line) const {
  using RequestResult = common::Result<DaemonResponse, DaemonError>;
  const std::string socket = socket_path_.string();
  if (socket.empty()) {
    return RequestResult::failure(
        make_error(DaemonErrorKind::NotRunning, "daemon socket path is empty"));
  }
  std::error_code ec;
  if (!std::filesystem::exists(socket_path_, ec)) {
    return RequestResult::failure(
        make_error(DaemonErrorKind::NotRunning, "daemon is not running (no socket at " + socket + ")"));
  }

  const SocketGuard fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (fd.get() < 0) {
    return RequestResult::failure(
        make_error(DaemonErrorKind::ConnectionFailed, "failed to create unix socket"));
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socket.size() >= sizeof(addr.sun_path)) {
    return RequestResult::failure(
        make_error(DaemonErrorKind::ConnectionFailed, "daemon socket path is too long"));
  }
  std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket.c_str());

  if (::connect(fd.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    if (err == ECONNREFUSED || err == ENOENT) {
      return RequestResult::failure(make_error(
          DaemonErrorKind::NotRunning, "daemon is not running (connection refused on " + socket + ")"));
    }
    return RequestResult::failure(make_error(DaemonErrorKind::ConnectionFailed,
                                             "failed to connect to daemon: " +
                                                 std::string(std::strerror(err))));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  const std::string payload = line + "\n";
  std::size_t sent = 0;
  while (sent < payload.size()) {
    struct pollfd pfd {
      .fd = fd.get(), .events = POLLOUT, .revents = 0,
    };
    const int ready = poll(&pfd, 1, remaining_ms(deadline));
    if (ready == 0) {
      return RequestResult::failure(
          make_error(DaemonErrorKind::Timeout, "timed out sending request to daemon"));
    }
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return RequestResult::failure(
          make_error(DaemonErrorKind::ConnectionFailed, "poll failed while sending to daemon"));
    }
    const ssize_t bytes =
        ::send(fd.get(), payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
    if (bytes < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return RequestResult::failure(
          make_error(DaemonErrorKind::ConnectionFailed, "failed to send request to daemon"));
    }
    sent += static_cast<std::size_t>(bytes);
  }

  std::string response;
  response.reserve(512);
  while (response.find('\n') == std::string::npos) {
    const int wait_ms = remaining_ms(deadline);
    if (wait_ms <= 0) {
      return RequestResult::failure(make_error(
          DaemonErrorKind::Timeout,
          "daemon did not answer within " + std::to_string(timeout_.count()) + "ms"));
    }
    struct pollfd pfd {
      .fd = fd.get(), .events = POLLIN, .revents = 0,
    };
    const int ready = poll(&pfd, 1, wait_ms);
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return RequestResult::failure(
          make_error(DaemonErrorKind::ConnectionFailed, "poll failed while reading from daemon"));
    }

    std::array<char, 512> chunk{};
    const ssize_t bytes = ::read(fd.get(), chunk.data(), chunk.size());
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes <= 0) {
      break;
    }
    response.append(chunk.data(), static_cast<std::size_t>(bytes));
  }

  const std::string reply = common::trim(response.substr(0, response.find('\n')));
  if (reply.empty()) {
    return RequestResult::failure(
        make_error(DaemonErrorKind::ConnectionFailed, "daemon closed the connection without a reply"));
  }
  return parse_daemon_response(reply);
}

common::Result<DaemonSessionStatus, DaemonError>
SocketDaemonClient::get_session_status(const std::string &session_id) {
  using StatusResult = common::Result<DaemonSessionStatus, DaemonError>;
  auto response = request(encode_get_session_request("status-" + session_id, session_id));
  if (!response.ok()) {
    return StatusResult::failure(response.error());
  }

  const DaemonResponse &reply = response.value();
  if (reply.type == "error") {
    if (reply.error_code == "session_not_found") {
      return StatusResult::success(DaemonSessionStatus::NotFound);
    }
    return StatusResult::failure(DaemonError{.kind = DaemonErrorKind::DaemonReported,
                                             .message = reply.error_message,
                                             .daemon_code = reply.error_code});
  }
  if (reply.type != "session_info" || !reply.session_status.has_value()) {
    return StatusResult::failure(make_error(DaemonErrorKind::ProtocolError,
                                            "unexpected '" + reply.type +
                                                "' reply to get_session"));
  }
  return StatusResult::success(*reply.session_status);
}

common::Result<std::string, DaemonError>
SocketDaemonClient::create_session(const std::string &session_id,
                                   const std::filesystem::path &working_dir,
                                   const std::string &command) {
  using CreateResult = common::Result<std::string, DaemonError>;
  auto response = request(
      encode_create_session_request("create-" + session_id, session_id, working_dir, command));
  if (!response.ok()) {
    return CreateResult::failure(response.error());
  }

  const DaemonResponse &reply = response.value();
  if (reply.type == "error") {
    return CreateResult::failure(DaemonError{.kind = DaemonErrorKind::DaemonReported,
                                             .message = reply.error_message,
                                             .daemon_code = reply.error_code});
  }
  if (reply.type != "session_info" && reply.type != "ack") {
    return CreateResult::failure(make_error(DaemonErrorKind::ProtocolError,
                                            "unexpected '" + reply.type +
                                                "' reply to create_session"));
  }
  return CreateResult::success(reply.session_id.value_or(session_id));
}

common::Result<void, DaemonError>
SocketDaemonClient::destroy_session(const std::string &session_id, const bool force) {
  using DestroyResult = common::Result<void, DaemonError>;
  auto response =
      request(encode_destroy_session_request("destroy-" + session_id, session_id, force));
  if (!response.ok()) {
    return DestroyResult::failure(response.error());
  }

  const DaemonResponse &reply = response.value();
  if (reply.type == "error") {
    if (reply.error_code == "session_not_found") {
      return DestroyResult::success();
    }
    return DestroyResult::failure(DaemonError{.kind = DaemonErrorKind::DaemonReported,
                                              .message = reply.error_message,
                                              .daemon_code = reply.error_code});
  }
  if (reply.type != "ack" && reply.type != "session_info") {
    return DestroyResult::failure(make_error(DaemonErrorKind::ProtocolError,
                                             "unexpected '" + reply.type +
                                                 "' reply to destroy_session"));
  }
  return DestroyResult::success();
}

} // namespace kild::daemon
