#include <gtest/gtest.h>
#include <ide-shell/term/session_manager.hpp>
#include "test_support.hpp"
#include <atomic>
#include <thread>

using namespace ideshell;
using namespace ideshell::testing;
using namespace std::chrono_literals;

static Config shell_config() {
    Config cfg; cfg.shell_program = "/bin/sh"; cfg.idle_timeout_seconds = 0;
    return cfg;
}

static std::vector<SessionEvent> run(TerminalSessionManager& m, const std::string& id, const std::string& cmd) {
    auto r = m.execute(id, cmd);
    EXPECT_TRUE(r.started()) << r.message;
    if (!r.events) return {};
    return r.events->collect();
}

TEST(TerminalSession, ClearEmitsSingleClearWithoutSpawning) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    ASSERT_TRUE(id);
    run(m, *id, "echo before");
    ASSERT_FALSE(m.transcript(*id).empty());
    auto r = m.execute(*id, "clear");
    ASSERT_TRUE(r.started());
    EXPECT_TRUE(r.builtin);
    EXPECT_FALSE(r.cancel);
    auto all = r.events->collect();
    auto evs = outputs(all);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind(), OutputKind::Clear);
    EXPECT_EQ(final_status(all)->status, SessionStatus::Succeeded);
    EXPECT_TRUE(m.transcript(*id).empty());
    EXPECT_EQ(m.history(*id), (std::vector<std::string>{"echo before"}));
}

TEST(TerminalSession, CdToMissingDirectory) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    ASSERT_TRUE(id);
    std::string before = m.session(*id)->working_directory;
    auto all = run(m, *id, "cd /definitely/not/here");
    auto evs = outputs(all);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind(), OutputKind::Error);
    EXPECT_EQ(final_status(all)->status, SessionStatus::Failed);
    EXPECT_EQ(m.session(*id)->working_directory, before);
    EXPECT_TRUE(m.history(*id).empty());
}

TEST(TerminalSession, CdThenPwd) {
    TempDir start;
    TerminalSessionManager m(shell_config());
    auto id = m.create_session(start.str());
    ASSERT_TRUE(id);
    auto cd = outputs(run(m, *id, "cd /tmp"));
    ASSERT_EQ(cd.size(), 1u);
    EXPECT_EQ(cd[0].kind(), OutputKind::Success);
    std::string tmp = fs::canonical("/tmp").string();
    EXPECT_EQ(m.session(*id)->working_directory, tmp);
    auto all = run(m, *id, "pwd");
    auto evs = outputs(all);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind(), OutputKind::Info);
    EXPECT_EQ(evs[0].message(), tmp);
    EXPECT_EQ(final_status(all)->status, SessionStatus::Succeeded);
}

TEST(TerminalSession, CdRelativeHomeAndTilde) {
    TempDir home;
    fs::create_directories(home.path / "proj/src");
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp", {{"HOME", home.str()}});
    ASSERT_TRUE(id);
    run(m, *id, "cd");
    EXPECT_EQ(m.session(*id)->working_directory, home.str());
    run(m, *id, "cd proj/src");
    EXPECT_EQ(m.session(*id)->working_directory, home / "proj/src");
    run(m, *id, "cd ..");
    EXPECT_EQ(m.session(*id)->working_directory, home / "proj");
    run(m, *id, "cd /");
    run(m, *id, "cd ~/proj");
    EXPECT_EQ(m.session(*id)->working_directory, home / "proj");
}

TEST(TerminalSession, CdWithShellOperatorsRunsInShell) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/");
    ASSERT_TRUE(id);
    auto r = m.execute(*id, "cd /tmp && pwd");
    ASSERT_TRUE(r.started());
    EXPECT_FALSE(r.builtin);
    r.events->collect();
    EXPECT_EQ(m.session(*id)->working_directory, "/");
    EXPECT_EQ(m.history(*id).size(), 1u);
}

TEST(TerminalSession, HelpListsBuiltins) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    auto evs = outputs(run(m, *id, "help"));
    ASSERT_GE(evs.size(), 3u);
    EXPECT_EQ(count_kind(evs, OutputKind::Info), evs.size());
    EXPECT_TRUE(any_message_contains(evs, OutputKind::Info, "cd [dir]"));
}

TEST(TerminalSession, FailuresAreClassifiedAndRecorded) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    auto all = run(m, *id, "echo oops >&2; exit 3");
    auto evs = outputs(all);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].kind(), OutputKind::Error);
    EXPECT_EQ(final_status(all)->status, SessionStatus::Failed);
    EXPECT_EQ(final_status(all)->exit_code, 3);
    auto missing = run(m, *id, "ide-shell-no-such-command-xyz");
    EXPECT_EQ(final_status(missing)->status, SessionStatus::Failed);
    EXPECT_EQ(m.history(*id).size(), 2u);
}

TEST(TerminalSession, HistoryWalkDoesNotMutate) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    run(m, *id, "echo one");
    run(m, *id, "cd /");
    run(m, *id, "echo two");
    std::vector<std::string> expected{"echo one", "echo two"};
    EXPECT_EQ(m.history(*id), expected);
    EXPECT_EQ(m.history_previous(*id), "echo two");
    EXPECT_EQ(m.history_previous(*id), "echo one");
    EXPECT_EQ(m.history_previous(*id), "echo one");
    EXPECT_EQ(m.history_next(*id), "echo two");
    EXPECT_FALSE(m.history_next(*id).has_value());
    EXPECT_EQ(m.history(*id), expected);
}

TEST(TerminalSession, BusySessionRejectsAndCancelYieldsCancelled) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    auto slow = m.execute(*id, "echo started; sleep 30");
    ASSERT_TRUE(slow.started());
    auto first = slow.events->next_for(10s);
    ASSERT_TRUE(first.has_value());
    auto busy = m.execute(*id, "echo hi");
    EXPECT_EQ(busy.outcome, ExecuteResult::Outcome::Busy);
    auto busy_builtin = m.execute(*id, "cd /");
    EXPECT_EQ(busy_builtin.outcome, ExecuteResult::Outcome::Busy);
    EXPECT_TRUE(slow.cancel.cancel());
    auto rest = slow.events->collect();
    EXPECT_EQ(final_status(rest)->status, SessionStatus::Cancelled);
    EXPECT_TRUE(m.wait_idle(*id, 5000ms));
    auto after = run(m, *id, "echo hi");
    EXPECT_EQ(final_status(after)->status, SessionStatus::Succeeded);
    // The rejected command never reached the history.
    EXPECT_EQ(m.history(*id), (std::vector<std::string>{"echo started; sleep 30", "echo hi"}));
}

TEST(TerminalSession, ConcurrentExecuteAdmitsOneCommand) {
    TempDir dir;
    TerminalSessionManager m(shell_config());
    auto id = m.create_session(dir.str());
    ASSERT_TRUE(id);
    const int n = 8;
    std::atomic<bool> go{false};
    std::vector<ExecuteResult> results(n);
    std::vector<std::thread> threads;
    for (int i=0;i<n;++i)
        threads.emplace_back([&, i]{
            while (!go) std::this_thread::yield();
            results[i] = m.execute(*id, "echo x >> starts.log; echo running; sleep 30");
        });
    go = true;
    for (auto& t : threads) t.join();

    int started = 0, busy = 0;
    ExecuteResult* winner = nullptr;
    for (auto& r : results) {
        if (r.started()) { ++started; winner = &r; }
        else if (r.outcome == ExecuteResult::Outcome::Busy) ++busy;
    }
    EXPECT_EQ(started, 1);
    EXPECT_EQ(busy, n - 1);
    ASSERT_NE(winner, nullptr);
    EXPECT_TRUE(m.session(*id)->busy);

    auto first = winner->events->next_for(10s);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(read_file(dir / "starts.log"), "x\n");
    EXPECT_EQ(m.history(*id).size(), 1u);
    EXPECT_TRUE(winner->cancel.cancel());
    EXPECT_EQ(final_status(winner->events->collect())->status, SessionStatus::Cancelled);
    EXPECT_TRUE(m.wait_idle(*id, 5000ms));
}

TEST(TerminalSession, SessionsAreIndependent) {
    TerminalSessionManager m(shell_config());
    auto a = m.create_session("/tmp");
    auto b = m.create_session("/");
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
    auto slow = m.execute(*a, "sleep 30");
    ASSERT_TRUE(slow.started());
    auto quick = run(m, *b, "echo parallel");
    EXPECT_EQ(outputs(quick).at(0).message(), "parallel");
    run(m, *b, "cd /tmp");
    EXPECT_EQ(m.session(*a)->working_directory, fs::canonical("/tmp").string());
    EXPECT_TRUE(m.session(*a)->busy);
    EXPECT_FALSE(m.session(*b)->busy);
    m.cancel(*a);
    slow.events->collect();
    EXPECT_EQ(m.sessions().size(), 2u);
}

TEST(TerminalSession, EnvironmentOverrides) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    ASSERT_TRUE(m.set_env(*id, "IDE_SESSION_VAR", "value1"));
    EXPECT_EQ(outputs(run(m, *id, "echo \"[$IDE_SESSION_VAR]\"")).at(0).message(), "[value1]");
    EXPECT_TRUE(m.unset_env(*id, "IDE_SESSION_VAR"));
    EXPECT_EQ(outputs(run(m, *id, "echo \"[$IDE_SESSION_VAR]\"")).at(0).message(), "[]");
    EXPECT_FALSE(m.set_env(*id, "BAD=KEY", "x"));
}

TEST(TerminalSession, CloseKillsAndRejects) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    auto slow = m.execute(*id, "sleep 30");
    ASSERT_TRUE(slow.started());
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(m.close_session(*id));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 15s);
    EXPECT_EQ(final_status(slow.events->collect())->status, SessionStatus::Cancelled);
    EXPECT_EQ(m.execute(*id, "echo hi").outcome, ExecuteResult::Outcome::NoSession);
    EXPECT_FALSE(m.session(*id).has_value());
    EXPECT_FALSE(m.close_session(*id));
}

TEST(TerminalSession, CreateRejectsMissingDirectory) {
    TerminalSessionManager m(shell_config());
    EXPECT_FALSE(m.create_session("/no/such/dir/ide-shell").has_value());
    EXPECT_TRUE(m.sessions().empty());
}

TEST(TerminalSession, BookmarksReplayIncrementsUseCount) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    TerminalSessionManager m(shell_config(), store);
    auto id = m.create_session("/tmp");
    ASSERT_TRUE(m.bookmark(*id, "echo replayed", "say something", {"demo"}));
    auto r = m.replay_bookmark(*id, "echo replayed");
    ASSERT_TRUE(r.started());
    auto all = r.events->collect();
    EXPECT_EQ(outputs(all).at(0).message(), "replayed");
    auto b = store->find_bookmark("echo replayed");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->use_count, 1);
    EXPECT_GT(b->last_used, 0);
    EXPECT_EQ(b->description, "say something");
    EXPECT_EQ(m.replay_bookmark(*id, "echo unknown").outcome, ExecuteResult::Outcome::NoBookmark);
    // Executed commands also reach the shared store.
    auto recent = store->recent(5);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].command, "echo replayed");
}

TEST(TerminalSession, ReplayOnBusySessionKeepsUseCount) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    TerminalSessionManager m(shell_config(), store);
    auto id = m.create_session("/tmp");
    ASSERT_TRUE(m.bookmark(*id, "echo replayed", ""));
    auto slow = m.execute(*id, "echo started; sleep 30");
    ASSERT_TRUE(slow.started());
    ASSERT_TRUE(slow.events->next_for(10s).has_value());
    EXPECT_EQ(m.replay_bookmark(*id, "echo replayed").outcome, ExecuteResult::Outcome::Busy);
    EXPECT_EQ(store->find_bookmark("echo replayed")->use_count, 0);
    slow.cancel.cancel();
    EXPECT_TRUE(m.wait_idle(*id, 5000ms));
}

TEST(TerminalSession, BookmarkNeedsStore) {
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    EXPECT_FALSE(m.bookmark(*id, "ls", "list"));
}

TEST(TerminalSession, SaveTranscript) {
    TempDir logs;
    TerminalSessionManager m(shell_config());
    auto id = m.create_session("/tmp");
    run(m, *id, "echo hello");
    run(m, *id, "echo bad >&2");
    auto path = m.save_transcript(*id, logs.str(), "session.txt");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, logs / "session.txt");
    EXPECT_EQ(read_file(*path), "INFO: hello\nERROR: bad\n");
}

TEST(TerminalSession, IdleTimeoutFailsCommand) {
    auto cfg = shell_config();
    cfg.idle_timeout_seconds = 1;
    TerminalSessionManager m(cfg);
    auto id = m.create_session("/tmp");
    auto all = run(m, *id, "sleep 30");
    EXPECT_EQ(final_status(all)->status, SessionStatus::Failed);
    EXPECT_TRUE(any_message_contains(outputs(all), OutputKind::Error, "Timed out"));
}
