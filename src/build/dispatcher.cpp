/*
 * Build dispatcher implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/build/dispatcher.hpp>
#include <ide-shell/backend/project.hpp>
#include <ide-shell/exec/process.hpp>
#include <ide-shell/log/log.hpp>
#include <condition_variable>
#include <filesystem>
#include <thread>

namespace ideshell {
namespace fs = std::filesystem;

struct BuildDispatcher::Session {
    std::string id;
    std::string project;
    BackendType backend;
    Operation operation;
    OperationParams params;
    std::vector<Stage> stages;
    std::shared_ptr<Channel<SessionEvent>> channel = std::make_shared<Channel<SessionEvent>>();

    mutable std::mutex mutex;
    std::condition_variable done_cv;
    SessionStatus status = SessionStatus::Idle;
    std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::vector<OutputEvent> events;
    std::vector<std::string> errors, warnings;
    size_t current_stage = 0;
    bool cancel_requested = false;
    Process* active = nullptr;   // owned by the worker; valid while set
    std::thread worker;

    void publish(OutputEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (auto& e : ev.structured_errors()) errors.push_back(e);
            for (auto& w : ev.structured_warnings()) warnings.push_back(w);
            events.push_back(ev);
        }
        channel->push(std::move(ev));
    }

    BuildSnapshot snapshot() const {
        std::lock_guard<std::mutex> lk(mutex);
        BuildSnapshot s;
        s.id = id; s.project = project; s.backend = backend; s.operation = operation;
        s.status = status; s.started_at = started_at; s.completed_at = completed_at;
        s.events = events; s.error_count = errors.size(); s.warning_count = warnings.size();
        s.stage_count = stages.size(); s.current_stage = current_stage;
        return s;
    }
};

static std::string normalize_project(const std::string& p) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(fs::absolute(p, ec), ec);
    return ec ? p : canon.string();
}

BuildDispatcher::BuildDispatcher(Config cfg, const Classifier& classifier)
    : m_cfg(std::move(cfg)), m_classifier(classifier) {}

BuildDispatcher::~BuildDispatcher() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& kv : m_sessions) all.push_back(kv.second);
    }
    for (auto& s : all) cancel(s->id);
    for (auto& s : all) if (s->worker.joinable()) s->worker.join();
}

std::vector<BuildDispatcher::Stage> BuildDispatcher::plan(const BuildRequest& req) const {
    auto make_stage = [&](BackendFamily family, Operation op) {
        std::shared_ptr<BackendAdapter> adapter = make_adapter(family, m_cfg);
        Stage st{adapter->name(), adapter->invocation(req.project, op, req.params), adapter, op};
        return st;
    };
    std::vector<Stage> stages;
    switch (req.backend) {
        case BackendType::ManagedBuildTool:
            stages.push_back(make_stage(BackendFamily::ManagedBuildTool, req.operation));
            break;
        case BackendType::PackageManager:
            stages.push_back(make_stage(BackendFamily::PackageManager, req.operation));
            break;
        case BackendType::NativeDriverExperimental:
            stages.push_back(make_stage(BackendFamily::NativeDriver, req.operation));
            break;
        case BackendType::Hybrid: {
            Operation second;
            switch (req.operation) {
                case Operation::Build:
                case Operation::CrossTargetBuild: second = Operation::Build; break;
                case Operation::Clean: second = Operation::Clean; break;
                case Operation::Test: second = Operation::Test; break;
                default:
                    throw InvalidOperationError(std::string("hybrid: ") + to_string(req.operation) + " is not supported");
            }
            stages.push_back(make_stage(BackendFamily::NativeDriver, req.operation));
            stages.push_back(make_stage(BackendFamily::ManagedBuildTool, second));
            break;
        }
    }
    return stages;
}

StartResult BuildDispatcher::start(const BuildRequest& req) {
    StartResult res;
    std::vector<Stage> stages;
    try {
        stages = plan(req);
    } catch (const InvalidOperationError& e) {
        res.outcome = StartResult::Outcome::InvalidOperation;
        res.message = e.what();
        log_debug(std::string("build rejected: ") + e.what());
        return res;
    }

    std::string project = normalize_project(req.project);
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& kv : m_sessions) {
            std::lock_guard<std::mutex> slk(kv.second->mutex);
            if (kv.second->project == project && kv.second->status == SessionStatus::Running) {
                res.outcome = StartResult::Outcome::Busy;
                res.message = "build " + kv.first + " is already running for " + project;
                return res;
            }
        }
        s = std::make_shared<Session>();
        s->id = "build-" + std::to_string(m_next_id++);
        s->project = project;
        s->backend = req.backend;
        s->operation = req.operation;
        s->params = req.params;
        s->stages = std::move(stages);
        s->status = SessionStatus::Running;
        m_sessions[s->id] = s;
    }
    log_debug("build " + s->id + ": " + to_string(req.backend) + " " + to_string(req.operation) + " in " + project);

    res.session_id = s->id;
    res.events = s->channel;
    std::string id = s->id;
    res.cancel = CancelHandle([this, id]{ return cancel(id); });
    s->worker = std::thread([this, s]{ run(s); });
    return res;
}

void BuildDispatcher::run(std::shared_ptr<Session> s) {
    SessionStatus final_status = SessionStatus::Succeeded;
    std::string final_message;
    int exit_code = -1;
    const auto idle = std::chrono::milliseconds(static_cast<long long>(m_cfg.idle_timeout_seconds) * 1000);

    for (size_t i=0; i<s->stages.size(); ++i) {
        const Stage& st = s->stages[i];
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            if (s->cancel_requested) { final_status = SessionStatus::Cancelled; break; }
            s->current_stage = i+1;
        }
        if (i > 0) {
            std::string label = "Stage " + std::to_string(i+1) + "/" + std::to_string(s->stages.size()) + ": " + st.adapter_name;
            s->publish(OutputEvent(OutputKind::Task, label, TaskInfo{st.adapter_name + ":" + to_string(st.operation)}));
        }
        s->publish(OutputEvent(OutputKind::Info, "Running: " + describe(st.invocation)));

        SpawnRequest sr;
        sr.cwd = st.invocation.cwd;
        sr.env = st.invocation.env;
        sr.argv = st.invocation.argv;
        sr.idle_timeout = idle;
        std::unique_ptr<Process> proc;
        try {
            proc = Process::spawn(sr);
        } catch (const SpawnError& e) {
            s->publish(OutputEvent(OutputKind::Error, std::string("Failed to start: ") + e.what(), {}, {e.what()}));
            final_status = SessionStatus::Failed;
            final_message = e.what();
        }
        if (!proc) {
            if (i+1 < s->stages.size())
                s->publish(OutputEvent(OutputKind::Error, "Skipped stage " + std::to_string(i+2) + " (" + s->stages[i+1].adapter_name + "): stage " + std::to_string(i+1) + " failed"));
            break;
        }
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            s->active = proc.get();
            if (s->cancel_requested) proc->kill();
        }

        size_t stage_errors = 0;
        BackendFamily family = st.invocation.family;
        ExitOutcome out = proc->drain([&](const RawLine& line) {
            OutputEvent ev = m_classifier.classify(line, family);
            if (ev.kind() == OutputKind::Error) ++stage_errors;
            s->publish(std::move(ev));
        });
        bool cancelled;
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            s->active = nullptr;
            cancelled = s->cancel_requested;
        }
        proc.reset();
        exit_code = out.exit_code;

        if (cancelled) { final_status = SessionStatus::Cancelled; break; }
        if (out.timed_out) {
            std::string msg = "Timed out: no output for " + std::to_string(m_cfg.idle_timeout_seconds) + "s, process killed";
            s->publish(OutputEvent(OutputKind::Error, msg, {}, {msg}));
            final_status = SessionStatus::Failed;
            final_message = msg;
        } else if (out.exit_code != 0 || stage_errors > 0) {
            final_status = SessionStatus::Failed;
            final_message = st.adapter_name + " exited with code " + std::to_string(out.exit_code);
        }
        if (final_status == SessionStatus::Failed) {
            if (i+1 < s->stages.size()) {
                std::string msg = "Skipped stage " + std::to_string(i+2) + " (" + s->stages[i+1].adapter_name + "): stage " + std::to_string(i+1) + " failed";
                s->publish(OutputEvent(OutputKind::Error, msg));
            }
            break;
        }
        for (auto& path : st.adapter->artifacts(st.invocation.cwd, st.operation, s->params)) {
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            std::string msg = "Generated: " + path;
            if (!ec) msg += " (" + format_size(size) + ")";
            s->publish(OutputEvent(OutputKind::Artifact, msg, ArtifactInfo{path}));
        }
    }

    StatusEvent done;
    {
        std::lock_guard<std::mutex> lk(s->mutex);
        if (final_status != SessionStatus::Failed && s->cancel_requested) final_status = SessionStatus::Cancelled;
        if (final_status == SessionStatus::Succeeded)
            final_message = std::string(to_string(s->operation)) + " succeeded (" + std::to_string(s->warnings.size()) + " warnings)";
        else if (final_status == SessionStatus::Cancelled)
            final_message = std::string(to_string(s->operation)) + " cancelled";
        done.status = final_status;
        done.message = final_message;
        done.exit_code = exit_code;
        done.errors = s->errors;
        done.warnings = s->warnings;
        s->status = final_status;
        s->completed_at = std::chrono::system_clock::now();
    }
    s->channel->push(done);
    s->channel->close();
    s->done_cv.notify_all();
    log_debug("build " + s->id + " " + to_string(final_status));
}

std::shared_ptr<BuildDispatcher::Session> BuildDispatcher::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_sessions.find(id);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool BuildDispatcher::cancel(const std::string& id) {
    auto s = find(id);
    if (!s) return false;
    std::lock_guard<std::mutex> lk(s->mutex);
    if (s->status != SessionStatus::Running) return false;
    s->cancel_requested = true;
    if (s->active) s->active->kill();
    log_debug("build " + id + " cancel requested");
    return true;
}

std::optional<BuildSnapshot> BuildDispatcher::session(const std::string& id) const {
    auto s = find(id);
    if (!s) return std::nullopt;
    return s->snapshot();
}

std::vector<BuildSnapshot> BuildDispatcher::sessions() const {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& kv : m_sessions) all.push_back(kv.second);
    }
    std::vector<BuildSnapshot> out;
    for (auto& s : all) out.push_back(s->snapshot());
    return out;
}

std::optional<SessionStatus> BuildDispatcher::wait(const std::string& id, std::optional<std::chrono::milliseconds> timeout) {
    auto s = find(id);
    if (!s) return std::nullopt;
    std::unique_lock<std::mutex> lk(s->mutex);
    auto done = [&]{ return is_terminal(s->status); };
    if (timeout) {
        if (!s->done_cv.wait_for(lk, *timeout, done)) return std::nullopt;
    } else {
        s->done_cv.wait(lk, done);
    }
    return s->status;
}

bool BuildDispatcher::clear(const std::string& id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) return false;
        {
            std::lock_guard<std::mutex> slk(it->second->mutex);
            if (!is_terminal(it->second->status)) return false;
        }
        s = it->second;
        m_sessions.erase(it);
    }
    if (s->worker.joinable()) s->worker.join();
    return true;
}

size_t BuildDispatcher::clear_finished() {
    std::vector<std::string> ids;
    for (auto& snap : sessions()) if (is_terminal(snap.status)) ids.push_back(snap.id);
    size_t n = 0;
    for (auto& id : ids) if (clear(id)) ++n;
    return n;
}

} // namespace ideshell
