/*
 * Build dispatcher - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/backend/adapter.hpp>
#include <ide-shell/classify/classifier.hpp>
#include <ide-shell/config/config.hpp>
#include <ide-shell/event/output_event.hpp>
#include <ide-shell/exec/channel.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

struct BuildRequest {
    std::string project;
    BackendType backend = BackendType::ManagedBuildTool;
    Operation operation = Operation::Build;
    OperationParams params;
};

// Copy of a session's state at one instant.
struct BuildSnapshot {
    std::string id;
    std::string project;
    BackendType backend = BackendType::ManagedBuildTool;
    Operation operation = Operation::Build;
    SessionStatus status = SessionStatus::Idle;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::vector<OutputEvent> events;
    size_t error_count = 0;
    size_t warning_count = 0;
    size_t stage_count = 0;
    size_t current_stage = 0;   // 1-based, 0 before the first spawn
};

struct StartResult {
    enum class Outcome { Started, Busy, InvalidOperation };
    Outcome outcome = Outcome::Started;
    std::string session_id;                          // empty unless Started
    std::string message;                             // reason when rejected
    std::shared_ptr<Channel<SessionEvent>> events;   // closed after the StatusEvent
    CancelHandle cancel;
    bool started() const { return outcome == Outcome::Started; }
};

// Runs build operations as sessions, one worker thread each. A HYBRID
// request runs the native driver first and the managed build tool only
// when the first stage succeeded.
class BuildDispatcher {
public:
    explicit BuildDispatcher(Config cfg, const Classifier& classifier = default_classifier());
    ~BuildDispatcher();                              // cancels and joins every build
    BuildDispatcher(const BuildDispatcher&) = delete;
    BuildDispatcher& operator=(const BuildDispatcher&) = delete;

    // Rejected (no state change) when the project already has a running build
    // or the backend does not define the operation.
    StartResult start(const BuildRequest& req);
    bool cancel(const std::string& id);              // false if unknown or not running

    std::optional<BuildSnapshot> session(const std::string& id) const;
    std::vector<BuildSnapshot> sessions() const;

    // Blocks until the session reaches a terminal status (or timeout); nullopt if unknown/timed out.
    std::optional<SessionStatus> wait(const std::string& id,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    bool clear(const std::string& id);               // only finished sessions
    size_t clear_finished();

private:
    struct Stage {
        std::string adapter_name;
        Invocation invocation;
        std::shared_ptr<BackendAdapter> adapter;
        Operation operation;
    };
    struct Session;

    std::vector<Stage> plan(const BuildRequest& req) const;
    void run(std::shared_ptr<Session> s);
    std::shared_ptr<Session> find(const std::string& id) const;

    Config m_cfg;
    const Classifier& m_classifier;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;
    unsigned long m_next_id = 1;
};

} // namespace ideshell
