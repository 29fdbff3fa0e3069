#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "kild/common/json_util.hpp"
#include "kild/daemon/client.hpp"
#include "kild/daemon/protocol.hpp"

#include <thread>

namespace {

std::string session_info(const std::string &id, const std::string &status) {
  return R"({"type":"session_info","id":"r1","session":{"id":")" + id + R"(","status":")" +
         status + R"("}})";
}

} // namespace

void register_daemon_tests(std::vector<kild::tests::TestCase> &tests) {
  using kild::tests::require;
  using kild::tests::require_error;
  using kild::testing::FakeDaemonServer;
  using kild::testing::TempWorkspace;
  namespace daemon = kild::daemon;

  tests.push_back({"encode_get_session_request", [] {
                     const auto fields = kild::common::json_parse_flat(
                         daemon::encode_get_session_request("r1", "proj/feat_0"));
                     require(fields.has_value(), "request should be valid JSON");
                     require(kild::common::json_string_field(*fields, "type") == "get_session",
                             "type mismatch");
                     require(kild::common::json_string_field(*fields, "session_id") == "proj/feat_0",
                             "session id mismatch");
                   }});

  tests.push_back({"encode_create_session_request_carries_command", [] {
                     const auto fields = kild::common::json_parse_flat(
                         daemon::encode_create_session_request("r2", "s", "/work/tree", "claude \"x\""));
                     require(fields.has_value(), "request should be valid JSON");
                     require(kild::common::json_string_field(*fields, "working_directory") == "/work/tree",
                             "working directory mismatch");
                     require(kild::common::json_string_field(*fields, "command") == "claude \"x\"",
                             "command should be escaped and restored");
                   }});

  tests.push_back({"parse_session_info_and_error", [] {
                     const auto info = daemon::parse_daemon_response(session_info("s1", "Running"));
                     require(info.ok(), info.ok() ? "" : info.error().message);
                     require(info.value().session_status == daemon::DaemonSessionStatus::Running,
                             "status mismatch");
                     require(info.value().session_id == std::optional<std::string>("s1"), "id mismatch");

                     const auto error = daemon::parse_daemon_response(
                         R"({"type":"error","code":"session_not_found","message":"nope"})");
                     require(error.ok() && error.value().error_code == "session_not_found",
                             "error code mismatch");
                   }});

  tests.push_back({"parse_rejects_malformed_replies", [] {
                     const auto garbage = daemon::parse_daemon_response("not json");
                     require_error(garbage, "DAEMON_PROTOCOL_ERROR", "malformed JSON is a protocol error");
                     const auto no_type = daemon::parse_daemon_response(R"({"id":"x"})");
                     require(!no_type.ok(), "missing type should fail");
                     const auto bad_status =
                         daemon::parse_daemon_response(session_info("s1", "exploded"));
                     require(!bad_status.ok(), "unknown status should fail");
                   }});

  tests.push_back({"unreachable_kinds", [] {
                     require(daemon::DaemonError{.kind = daemon::DaemonErrorKind::NotRunning}.is_unreachable(),
                             "not running is unreachable");
                     require(daemon::DaemonError{.kind = daemon::DaemonErrorKind::Timeout}.is_unreachable(),
                             "timeout is unreachable");
                     require(!daemon::DaemonError{.kind = daemon::DaemonErrorKind::ProtocolError}
                                  .is_unreachable(),
                             "protocol errors mean the daemon answered");
                   }});

  tests.push_back({"client_reports_missing_socket_as_not_running", [] {
                     TempWorkspace ws;
                     daemon::SocketDaemonClient client(ws.path() / "absent.sock",
                                                       std::chrono::milliseconds(500));
                     const auto status = client.get_session_status("s1");
                     require(!status.ok(), "missing socket should fail");
                     require(status.error().kind == daemon::DaemonErrorKind::NotRunning,
                             "not running expected");
                   }});

  tests.push_back({"client_reads_session_status", [] {
                     TempWorkspace ws;
                     const auto socket = ws.path() / "d.sock";
                     FakeDaemonServer server(socket, [](const std::string &line) {
                       const auto fields = kild::common::json_parse_flat(line);
                       const auto id = kild::common::json_string_field(*fields, "session_id").value_or("");
                       if (id == "missing") {
                         return std::string(
                             R"({"type":"error","code":"session_not_found","message":"no session"})");
                       }
                       if (id == "broken") {
                         return std::string(R"({"type":"error","code":"internal","message":"boom"})");
                       }
                       return session_info(id, "stopped");
                     });
                     const auto started = server.start();
                     require(started.ok(), started.error());

                     daemon::SocketDaemonClient client(socket, std::chrono::milliseconds(2000));
                     const auto stopped = client.get_session_status("s1");
                     require(stopped.ok() && stopped.value() == daemon::DaemonSessionStatus::Stopped,
                             "stopped expected");

                     const auto missing = client.get_session_status("missing");
                     require(missing.ok() && missing.value() == daemon::DaemonSessionStatus::NotFound,
                             "session_not_found is a successful NotFound");

                     const auto broken = client.get_session_status("broken");
                     require(!broken.ok() && broken.error().kind == daemon::DaemonErrorKind::DaemonReported,
                             "other daemon errors are reported");
                     require(broken.error().daemon_code == "internal", "daemon code should be kept");

                     require(server.requests().size() == 3, "three requests expected");
                   }});

  tests.push_back({"client_create_session_accepts_ack", [] {
                     TempWorkspace ws;
                     const auto socket = ws.path() / "d.sock";
                     FakeDaemonServer server(socket, [](const std::string &) {
                       return std::string(R"({"type":"ack","id":"create-s1"})");
                     });
                     const auto started = server.start();
                     require(started.ok(), started.error());

                     daemon::SocketDaemonClient client(socket, std::chrono::milliseconds(2000));
                     const auto created = client.create_session("s1", ws.path(), "claude");
                     require(created.ok(), created.ok() ? "" : created.error().message);
                     require(created.value() == "s1", "requested id should be used for a bare ack");

                     const auto request = kild::common::json_parse_flat(server.requests().front());
                     require(request.has_value() &&
                                 kild::common::json_string_field(*request, "type") == "create_session",
                             "create_session request expected");
                   }});

  tests.push_back({"client_destroy_session_sends_force", [] {
                     TempWorkspace ws;
                     const auto socket = ws.path() / "d.sock";
                     FakeDaemonServer server(socket, [](const std::string &line) {
                       const auto fields = kild::common::json_parse_flat(line);
                       const auto id = kild::common::json_string_field(*fields, "session_id");
                       if (id == "gone") {
                         return std::string(
                             R"({"type":"error","code":"session_not_found","message":"no session"})");
                       }
                       if (id == "stuck") {
                         return std::string(R"({"type":"error","code":"busy","message":"pty busy"})");
                       }
                       return std::string(R"({"type":"ack","id":"destroy"})");
                     });
                     const auto started = server.start();
                     require(started.ok(), started.error());

                     daemon::SocketDaemonClient client(socket, std::chrono::milliseconds(2000));
                     require(client.destroy_session("s1", true).ok(), "ack should succeed");
                     require(client.destroy_session("gone", false).ok(),
                             "an unknown session is already destroyed");
                     const auto stuck = client.destroy_session("stuck", false);
                     require(!stuck.ok() && stuck.error().daemon_code == "busy",
                             "daemon errors are reported");

                     const auto first = kild::common::json_parse_flat(server.requests().front());
                     require(first.has_value() &&
                                 kild::common::json_string_field(*first, "type") == "destroy_session",
                             "destroy_session request expected");
                     require(kild::common::json_bool_field(*first, "force") == true,
                             "force flag should be sent");
                   }});

  tests.push_back({"client_times_out_on_silent_daemon", [] {
                     TempWorkspace ws;
                     const auto socket = ws.path() / "d.sock";
                     FakeDaemonServer server(socket, [](const std::string &) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(400));
                       return std::string();
                     });
                     const auto started = server.start();
                     require(started.ok(), started.error());

                     daemon::SocketDaemonClient client(socket, std::chrono::milliseconds(100));
                     const auto status = client.get_session_status("s1");
                     require(!status.ok(), "silent daemon should time out");
                     require(status.error().code() == "DAEMON_TIMEOUT", "timeout code expected");
                   }});
}
