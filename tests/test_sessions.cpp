#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "kild/git/errors.hpp"
#include "kild/process/process.hpp"
#include "kild/sessions/errors.hpp"
#include "kild/sessions/store.hpp"
#include "kild/sessions/types.hpp"

#include <fstream>

namespace {

kild::sessions::Session sample_session(const std::string &id, const std::string &branch) {
  kild::sessions::Session session;
  session.id = id;
  session.project_id = id.substr(0, id.find('/'));
  session.branch = branch;
  session.worktree_path = "/tmp/worktrees/" + branch;
  session.agent = "claude";
  session.created_at = "2024-05-01T12:00:00Z";
  session.last_activity = session.created_at;
  return session;
}

} // namespace

void register_sessions_tests(std::vector<kild::tests::TestCase> &tests) {
  using kild::tests::require;
  using kild::tests::require_error;
  using kild::testing::TempWorkspace;
  namespace sessions = kild::sessions;
  namespace agents = kild::agents;

  tests.push_back({"session_json_keeps_every_handle_family", [] {
                     auto session = sample_session("p1/feat", "feat");
                     session.note = "try the \"new\" parser";
                     session.runtime_mode = agents::RuntimeMode::Terminal;
                     session.port_range_start = 3000;
                     session.port_range_end = 3009;
                     session.port_count = 10;
                     sessions::AgentProcess agent{.agent = "claude",
                                                  .spawn_id = "p1/feat_0",
                                                  .command = "claude",
                                                  .opened_at = session.created_at,
                                                  .handles = {}};
                     agent.handles.local = agents::LocalHandle{
                         .pid = 4321, .process_name = "claude", .start_time = 987654321};
                     agent.handles.terminal =
                         agents::TerminalHandle{.terminal_type = "tmux", .window_id = "kild-p1_feat_0"};
                     agent.handles.daemon = agents::DaemonHandle{.session_id = "p1/feat_0"};
                     session.agents.push_back(agent);

                     const auto loaded = sessions::session_from_json(sessions::session_to_json(session));
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().message);
                     const auto &copy = loaded.value();
                     require(copy.note == session.note, "note mismatch");
                     require(copy.runtime_mode == agents::RuntimeMode::Terminal, "runtime mismatch");
                     require(copy.port_range_end == 3009 && copy.port_count == 10, "ports mismatch");
                     require(copy.agents.size() == 1, "one agent expected");
                     const auto &handles = copy.agents.front().handles;
                     require(handles.local.has_value() && handles.local->start_time == 987654321,
                             "local handle mismatch");
                     require(handles.terminal.has_value() &&
                                 handles.terminal->window_id == std::optional<std::string>("kild-p1_feat_0"),
                             "terminal handle mismatch");
                     require(handles.daemon.has_value() && handles.daemon->session_id == "p1/feat_0",
                             "daemon handle mismatch");
                   }});

  tests.push_back({"session_json_optional_fields_stay_absent", [] {
                     auto session = sample_session("p1/bare", "bare");
                     session.agents.push_back(sessions::AgentProcess{
                         .agent = "codex", .spawn_id = "p1/bare_0", .command = "codex", .opened_at = "", .handles = {}});
                     const auto loaded = sessions::session_from_json(sessions::session_to_json(session));
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().message);
                     require(!loaded.value().note.has_value(), "note should stay absent");
                     require(!loaded.value().runtime_mode.has_value(), "runtime should stay absent");
                     require(!loaded.value().agents.front().handles.has_any(),
                             "no handles should appear");
                   }});

  tests.push_back({"session_json_rejects_partial_process_metadata", [] {
                     const std::string json =
                         R"({"id":"p/x","project_id":"p","branch":"x","worktree_path":"/w",)"
                         R"("agents":[{"agent":"claude","spawn_id":"p/x_0","process_id":12}]})";
                     const auto loaded = sessions::session_from_json(json);
                     require(!loaded.ok(), "partial process metadata should fail");
                     require(loaded.error().code() == "INVALID_PROCESS_METADATA",
                             "process metadata code expected");
                   }});

  tests.push_back({"session_json_requires_identity_fields", [] {
                     const auto loaded = sessions::session_from_json(R"({"id":"p/x","branch":"x"})");
                     require(!loaded.ok() &&
                                 loaded.error().kind == sessions::SessionErrorKind::InvalidStructure,
                             "missing fields should fail");
                     const auto bad_agents = sessions::session_from_json(
                         R"({"id":"p/x","project_id":"p","branch":"x","worktree_path":"/w","agents":"no"})");
                     require(!bad_agents.ok(), "agents must be an array");
                     const auto null_agents = sessions::session_from_json(
                         R"({"id":"p/x","project_id":"p","branch":"x","worktree_path":"/w","agents":null})");
                     require(null_agents.ok() && null_agents.value().agents.empty(),
                             "null agents read as empty");
                   }});

  tests.push_back({"store_save_load_list_remove", [] {
                     TempWorkspace ws;
                     const sessions::SessionStore store(ws.path() / "sessions");
                     require(store.list().ok() && store.list().value().empty(),
                             "missing directory lists as empty");

                     require(store.save(sample_session("p2/b", "b")).ok(), "save b failed");
                     require(store.save(sample_session("p1/a", "a")).ok(), "save a failed");
                     require(store.record_path("p1/a").filename() == "p1_a.json",
                             "record file name mismatch");
                     require(store.exists("p1/a"), "record should exist");

                     const auto listed = store.list();
                     require(listed.ok() && listed.value().size() == 2, "two sessions expected");
                     require(listed.value().front().id == "p1/a", "list should be sorted by id");

                     const auto found = store.find_by_branch(" b ");
                     require(found.ok() && found.value().id == "p2/b", "branch lookup mismatch");
                     const auto missing = store.find_by_branch("zzz");
                     require_error(missing, "SESSION_NOT_FOUND", "unknown branch should be not found");

                     require(store.remove("p1/a").ok(), "remove failed");
                     require(store.remove("p1/a").ok(), "removing twice is fine");
                     const auto gone = store.load("p1/a");
                     require(!gone.ok() && gone.error().kind == sessions::SessionErrorKind::NotFound,
                             "removed record should be not found");
                   }});

  tests.push_back({"store_list_skips_unreadable_records", [] {
                     TempWorkspace ws;
                     kild::testing::ObserverCapture capture;
                     const sessions::SessionStore store(ws.path());
                     require(store.save(sample_session("p/good", "good")).ok(), "save failed");
                     ws.create_file("broken.json", "{ this is not json");
                     ws.create_file("notes.txt", "ignored");

                     const auto listed = store.list();
                     require(listed.ok() && listed.value().size() == 1, "only the good record expected");
                     require(capture.warning_count() == 1, "bad record should be logged");
                   }});

  tests.push_back({"store_sidecars", [] {
                     TempWorkspace ws;
                     const sessions::SessionStore store(ws.path());
                     require(!store.read_agent_status("p/x").has_value(), "no status yet");
                     require(store.write_agent_status("p/x", sessions::AgentStatusInfo{
                                                                 .activity = sessions::AgentActivity::Waiting,
                                                                 .updated_at = "2024-05-01T12:00:00Z"})
                                 .ok(),
                             "status write failed");
                     const auto status = store.read_agent_status("p/x");
                     require(status.has_value() && status->activity == sessions::AgentActivity::Waiting,
                             "status mismatch");

                     require(!store.write_pr_info("p/x", "[1]").ok(), "PR info must be an object");
                     require(store.write_pr_info("p/x", R"({"number":12,"state":"open"})").ok(),
                             "PR write failed");
                     require(store.read_pr_info("p/x").has_value(), "PR info expected");

                     require(store.remove_agent_status("p/x").ok(), "status remove failed");
                     require(store.remove_pr_info("p/x").ok(), "PR remove failed");
                     require(!std::filesystem::exists(store.status_path("p/x")), "status file remains");
                     require(!std::filesystem::exists(store.pr_path("p/x")), "PR file remains");
                   }});

  tests.push_back({"port_allocation_fills_gaps", [] {
                     TempWorkspace ws;
                     const sessions::SessionStore store(ws.path());
                     auto first = sample_session("p/a", "a");
                     first.port_range_start = 3000;
                     first.port_range_end = 3009;
                     first.port_count = 10;
                     auto third = sample_session("p/c", "c");
                     third.port_range_start = 3015;
                     third.port_range_end = 3019;
                     third.port_count = 5;
                     require(store.save(first).ok() && store.save(third).ok(), "save failed");

                     const auto small = store.allocate_port_range(5, 3000);
                     require(small.ok() && small.value().first == 3010 && small.value().second == 3014,
                             "gap between sessions should be used");
                     const auto big = store.allocate_port_range(10, 3000);
                     require(big.ok() && big.value().first == 3020, "large block goes after the last");
                   }});

  tests.push_back({"port_allocation_limits", [] {
                     TempWorkspace ws;
                     const sessions::SessionStore store(ws.path());
                     const auto zero = store.allocate_port_range(0, 3000);
                     require_error(zero, "INVALID_PORT_COUNT", "zero count should fail");
                     require(!store.allocate_port_range(1001, 3000).ok(), "too many ports should fail");
                     const auto high = store.allocate_port_range(10, 65530);
                     require(!high.ok() && high.error().kind == sessions::SessionErrorKind::PortRangeExhausted,
                             "range past 65535 should fail");
                   }});

  tests.push_back({"session_error_mapping", [] {
                     const auto dirty = sessions::SessionError::from(kild::git::GitError{
                         .kind = kild::git::GitErrorKind::UncommittedChanges, .message = "dirty"});
                     require(dirty.kind == sessions::SessionErrorKind::UncommittedChanges &&
                                 dirty.is_user_error(),
                             "uncommitted changes should stay a user error");
                     const auto denied = sessions::SessionError::from(
                         kild::process::ProcessError::access_denied(5, "nope"));
                     require(denied.code() == "PROCESS_ACCESS_DENIED", "access denied code expected");
                     const auto failed = sessions::SessionError::from(
                         kild::process::ProcessError::kill_failed(5, "stuck"));
                     require(failed.code() == "PROCESS_KILL_FAILED" && !failed.is_user_error(),
                             "kill failure is a system error");
                     require(sessions::SessionError::not_found("feat").is_user_error(),
                             "not found is a user error");
                   }});
}
