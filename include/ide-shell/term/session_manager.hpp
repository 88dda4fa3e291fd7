/*
 * Terminal session manager - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/classify/classifier.hpp>
#include <ide-shell/config/config.hpp>
#include <ide-shell/event/output_event.hpp>
#include <ide-shell/exec/channel.hpp>
#include <ide-shell/term/history.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

struct TerminalSessionInfo {
    std::string id;
    std::string working_directory;
    std::map<std::string,std::string> environment;  // overrides on top of the host environment
    bool is_active = true;
    bool busy = false;                               // a command is in flight
    std::chrono::system_clock::time_point created_at;
};

struct ExecuteResult {
    enum class Outcome { Started, Busy, NoSession, NoBookmark };
    Outcome outcome = Outcome::Started;
    bool builtin = false;                            // handled without spawning
    std::string message;
    std::shared_ptr<Channel<SessionEvent>> events;   // closed after the StatusEvent
    CancelHandle cancel;
    bool started() const { return outcome == Outcome::Started; }
};

// Independent interactive sessions, each with its own directory,
// environment and history, and at most one command in flight.
class TerminalSessionManager {
public:
    explicit TerminalSessionManager(Config cfg, std::shared_ptr<HistoryStore> store = nullptr,
                                    const Classifier& classifier = default_classifier());
    ~TerminalSessionManager();
    TerminalSessionManager(const TerminalSessionManager&) = delete;
    TerminalSessionManager& operator=(const TerminalSessionManager&) = delete;

    // cwd defaults to the process working directory. nullopt if cwd is not a directory.
    std::optional<std::string> create_session(const std::string& cwd = "",
                                              std::map<std::string,std::string> env = {});
    bool close_session(const std::string& id);       // kills the live command
    std::optional<TerminalSessionInfo> session(const std::string& id) const;
    std::vector<TerminalSessionInfo> sessions() const;

    ExecuteResult execute(const std::string& id, const std::string& command);
    bool cancel(const std::string& id);
    // Blocks until no command is in flight; false on timeout or unknown session.
    bool wait_idle(const std::string& id, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::vector<std::string> history(const std::string& id) const;
    std::optional<std::string> history_previous(const std::string& id);
    std::optional<std::string> history_next(const std::string& id);

    bool set_env(const std::string& id, const std::string& key, const std::string& value);
    bool unset_env(const std::string& id, const std::string& key);

    // Requires an attached store.
    bool bookmark(const std::string& id, const std::string& command, const std::string& description,
                  std::vector<std::string> tags = {});
    ExecuteResult replay_bookmark(const std::string& id, const std::string& command);

    std::vector<OutputEvent> transcript(const std::string& id) const;
    // dir defaults to the configured transcript directory, name to terminal_<timestamp>.txt.
    std::optional<std::string> save_transcript(const std::string& id, const std::string& dir = "",
                                               const std::string& name = "");

    std::shared_ptr<HistoryStore> store() const { return m_store; }

private:
    struct Session;
    std::shared_ptr<Session> find(const std::string& id) const;
    void run(std::shared_ptr<Session> s, SpawnRequest req,
             std::shared_ptr<Channel<SessionEvent>> channel);

    Config m_cfg;
    std::shared_ptr<HistoryStore> m_store;
    const Classifier& m_classifier;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;
    unsigned long m_next_id = 1;
};

} // namespace ideshell
