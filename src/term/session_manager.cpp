/*
 * Terminal session manager implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/term/session_manager.hpp>
#include <ide-shell/exec/process.hpp>
#include <ide-shell/log/log.hpp>
#include <ide-shell/term/builtins.hpp>
#include <ide-shell/term/transcript.hpp>
#include <condition_variable>
#include <filesystem>
#include <thread>

namespace ideshell {
namespace fs = std::filesystem;

struct TerminalSessionManager::Session {
    std::string id;
    mutable std::mutex mutex;
    std::condition_variable idle_cv;
    std::string cwd;
    std::map<std::string,std::string> env;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    bool closed = false;
    bool busy = false;
    bool cancel_requested = false;
    Process* active = nullptr;   // owned by the worker; valid while set
    std::thread worker;
    CommandHistory history;
    std::vector<OutputEvent> transcript;

    // Caller holds mutex.
    void record(const OutputEvent& ev) {
        if (ev.kind() == OutputKind::Clear) transcript.clear();
        else transcript.push_back(ev);
    }

    TerminalSessionInfo info() const {
        std::lock_guard<std::mutex> lk(mutex);
        TerminalSessionInfo i;
        i.id = id; i.working_directory = cwd; i.environment = env;
        i.is_active = !closed; i.busy = busy; i.created_at = created_at;
        return i;
    }
};

static std::shared_ptr<Channel<SessionEvent>> finished_channel(const std::vector<OutputEvent>& events, StatusEvent status) {
    auto ch = std::make_shared<Channel<SessionEvent>>();
    for (auto& ev : events) ch->push(ev);
    ch->push(std::move(status));
    ch->close();
    return ch;
}

TerminalSessionManager::TerminalSessionManager(Config cfg, std::shared_ptr<HistoryStore> store, const Classifier& classifier)
    : m_cfg(std::move(cfg)), m_store(std::move(store)), m_classifier(classifier) {}

TerminalSessionManager::~TerminalSessionManager() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& kv : m_sessions) ids.push_back(kv.first);
    }
    for (auto& id : ids) close_session(id);
}

std::optional<std::string> TerminalSessionManager::create_session(const std::string& cwd, std::map<std::string,std::string> env) {
    std::error_code ec;
    fs::path dir = cwd.empty() ? fs::current_path(ec) : fs::path(cwd);
    if (ec || !fs::is_directory(dir, ec)) { log_debug("create_session: not a directory: " + dir.string()); return std::nullopt; }
    auto canon = fs::canonical(dir, ec);
    if (ec) return std::nullopt;
    auto s = std::make_shared<Session>();
    s->cwd = canon.string();
    s->env = std::move(env);
    std::lock_guard<std::mutex> lk(m_mutex);
    s->id = "term-" + std::to_string(m_next_id++);
    m_sessions[s->id] = s;
    log_debug("session " + s->id + " created in " + s->cwd);
    return s->id;
}

bool TerminalSessionManager::close_session(const std::string& id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) return false;
        s = it->second;
        m_sessions.erase(it);
    }
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(s->mutex);
        s->closed = true;
        if (s->busy) s->cancel_requested = true;
        if (s->active) s->active->kill();
        worker = std::move(s->worker);
    }
    if (worker.joinable()) worker.join();
    log_debug("session " + id + " closed");
    return true;
}

std::shared_ptr<TerminalSessionManager::Session> TerminalSessionManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_sessions.find(id);
    return it == m_sessions.end() ? nullptr : it->second;
}

std::optional<TerminalSessionInfo> TerminalSessionManager::session(const std::string& id) const {
    auto s = find(id);
    if (!s) return std::nullopt;
    return s->info();
}

std::vector<TerminalSessionInfo> TerminalSessionManager::sessions() const {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& kv : m_sessions) all.push_back(kv.second);
    }
    std::vector<TerminalSessionInfo> out;
    for (auto& s : all) out.push_back(s->info());
    return out;
}

ExecuteResult TerminalSessionManager::execute(const std::string& id, const std::string& command) {
    ExecuteResult res;
    auto s = find(id);
    if (!s) { res.outcome = ExecuteResult::Outcome::NoSession; res.message = "no such session: " + id; return res; }

    std::lock_guard<std::mutex> lk(s->mutex);
    if (s->closed) { res.outcome = ExecuteResult::Outcome::NoSession; res.message = "session closed: " + id; return res; }
    if (s->busy) { res.outcome = ExecuteResult::Outcome::Busy; res.message = "a command is already running in " + id; return res; }

    BuiltinContext ctx{s->cwd, s->env};
    if (auto b = run_builtin(command, ctx)) {
        for (auto& ev : b->events) s->record(ev);
        StatusEvent st;
        st.status = b->exit_code == 0 ? SessionStatus::Succeeded : SessionStatus::Failed;
        st.exit_code = b->exit_code;
        for (auto& ev : b->events) for (auto& e : ev.structured_errors()) st.errors.push_back(e);
        res.builtin = true;
        res.events = finished_channel(b->events, std::move(st));
        return res;
    }
    if (split_words(command).empty()) {
        res.builtin = true;
        StatusEvent st; st.status = SessionStatus::Succeeded; st.exit_code = 0;
        res.events = finished_channel({}, std::move(st));
        return res;
    }

    s->history.append(command);
    if (m_store) m_store->record(command);

    SpawnRequest req;
    req.cwd = s->cwd;
    req.env = s->env;
    req.env["PWD"] = s->cwd;
    req.argv = {m_cfg.shell_program, "-c", command};
    req.idle_timeout = std::chrono::milliseconds(static_cast<long long>(m_cfg.idle_timeout_seconds) * 1000);

    // The previous worker released the session before finishing; joining it
    // here cannot deadlock on s->mutex.
    if (s->worker.joinable()) s->worker.join();
    s->busy = true;
    s->cancel_requested = false;
    auto channel = std::make_shared<Channel<SessionEvent>>();
    s->worker = std::thread([this, s, req, channel]{ run(s, req, channel); });

    res.events = channel;
    res.cancel = CancelHandle([this, id]{ return cancel(id); });
    log_debug("session " + id + ": " + command);
    return res;
}

void TerminalSessionManager::run(std::shared_ptr<Session> s, SpawnRequest req,
                                 std::shared_ptr<Channel<SessionEvent>> channel) {
    std::vector<std::string> errors, warnings;
    size_t error_events = 0;
    auto publish = [&](OutputEvent ev) {
        if (ev.kind() == OutputKind::Error) ++error_events;
        for (auto& e : ev.structured_errors()) errors.push_back(e);
        for (auto& w : ev.structured_warnings()) warnings.push_back(w);
        { std::lock_guard<std::mutex> lk(s->mutex); s->record(ev); }
        channel->push(std::move(ev));
    };

    StatusEvent st;
    std::unique_ptr<Process> proc;
    try {
        proc = Process::spawn(req);
    } catch (const SpawnError& e) {
        publish(OutputEvent(OutputKind::Error, e.what(), {}, {e.what()}));
        st.status = SessionStatus::Failed;
        st.message = e.what();
    }
    if (proc) {
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            s->active = proc.get();
            if (s->cancel_requested) proc->kill();
        }
        ExitOutcome out = proc->drain([&](const RawLine& line) {
            publish(m_classifier.classify(line, BackendFamily::Shell));
        });
        bool cancelled;
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            s->active = nullptr;
            cancelled = s->cancel_requested;
        }
        proc.reset();
        st.exit_code = out.exit_code;
        if (cancelled) {
            st.status = SessionStatus::Cancelled;
            st.message = "cancelled";
        } else if (out.timed_out) {
            std::string msg = "Timed out: no output for " + std::to_string(m_cfg.idle_timeout_seconds) + "s, process killed";
            publish(OutputEvent(OutputKind::Error, msg, {}, {msg}));
            st.status = SessionStatus::Failed;
            st.message = msg;
        } else if (out.exit_code != 0 || error_events > 0) {
            st.status = SessionStatus::Failed;
            st.message = "exit code " + std::to_string(out.exit_code);
        } else {
            st.status = SessionStatus::Succeeded;
        }
    }
    st.errors = std::move(errors);
    st.warnings = std::move(warnings);
    {
        std::lock_guard<std::mutex> lk(s->mutex);
        s->busy = false;
    }
    s->idle_cv.notify_all();
    channel->push(std::move(st));
    channel->close();
}

bool TerminalSessionManager::cancel(const std::string& id) {
    auto s = find(id);
    if (!s) return false;
    std::lock_guard<std::mutex> lk(s->mutex);
    if (!s->busy) return false;
    s->cancel_requested = true;
    if (s->active) s->active->kill();
    return true;
}

bool TerminalSessionManager::wait_idle(const std::string& id, std::optional<std::chrono::milliseconds> timeout) {
    auto s = find(id);
    if (!s) return false;
    std::unique_lock<std::mutex> lk(s->mutex);
    if (timeout) return s->idle_cv.wait_for(lk, *timeout, [&]{ return !s->busy; });
    s->idle_cv.wait(lk, [&]{ return !s->busy; });
    return true;
}

std::vector<std::string> TerminalSessionManager::history(const std::string& id) const {
    auto s = find(id);
    if (!s) return {};
    std::lock_guard<std::mutex> lk(s->mutex);
    return s->history.entries();
}

std::optional<std::string> TerminalSessionManager::history_previous(const std::string& id) {
    auto s = find(id);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lk(s->mutex);
    return s->history.previous();
}

std::optional<std::string> TerminalSessionManager::history_next(const std::string& id) {
    auto s = find(id);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lk(s->mutex);
    return s->history.next();
}

bool TerminalSessionManager::set_env(const std::string& id, const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos) return false;
    auto s = find(id);
    if (!s) return false;
    std::lock_guard<std::mutex> lk(s->mutex);
    s->env[key] = value;
    return true;
}

bool TerminalSessionManager::unset_env(const std::string& id, const std::string& key) {
    auto s = find(id);
    if (!s) return false;
    std::lock_guard<std::mutex> lk(s->mutex);
    return s->env.erase(key) > 0;
}

bool TerminalSessionManager::bookmark(const std::string& id, const std::string& command, const std::string& description,
                                      std::vector<std::string> tags) {
    if (!m_store || command.empty() || !find(id)) return false;
    BookmarkedCommand b;
    if (auto existing = m_store->find_bookmark(command)) b = *existing;
    b.command = command;
    b.description = description;
    if (!tags.empty()) b.tags = std::move(tags);
    m_store->add_bookmark(b);
    return true;
}

ExecuteResult TerminalSessionManager::replay_bookmark(const std::string& id, const std::string& command) {
    ExecuteResult res;
    if (!m_store || !m_store->find_bookmark(command)) {
        res.outcome = ExecuteResult::Outcome::NoBookmark;
        res.message = "no bookmark for: " + command;
        return res;
    }
    res = execute(id, command);
    // Only a replay that actually ran counts as a use.
    if (res.started()) m_store->increment_use_count(command);
    return res;
}

std::vector<OutputEvent> TerminalSessionManager::transcript(const std::string& id) const {
    auto s = find(id);
    if (!s) return {};
    std::lock_guard<std::mutex> lk(s->mutex);
    return s->transcript;
}

std::optional<std::string> TerminalSessionManager::save_transcript(const std::string& id, const std::string& dir,
                                                                   const std::string& name) {
    if (!find(id)) return std::nullopt;
    return write_transcript(transcript(id), dir.empty() ? resolve_transcript_dir(m_cfg) : dir, name);
}

} // namespace ideshell
