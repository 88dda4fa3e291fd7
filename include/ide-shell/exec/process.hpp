/*
 * Process executor - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace ideshell {

// The OS refused to create the process (missing executable, bad cwd, exec failure).
class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string& what) : std::runtime_error(what) {}
};

enum class StreamSource { Stdout, Stderr };

struct RawLine {
    StreamSource source = StreamSource::Stdout;
    std::string text;
};

struct SpawnRequest {
    std::string cwd;
    std::map<std::string,std::string> env;  // overrides on top of the host environment
    std::vector<std::string> argv;
    std::chrono::milliseconds idle_timeout{0}; // 0 = no idle timeout
};

struct ExitOutcome {
    int exit_code = -1;     // valid when the process exited normally
    int term_signal = 0;    // signal that terminated it, 0 otherwise
    bool timed_out = false; // killed by the idle timeout
    bool killed = false;    // kill() was requested
    bool success() const { return term_signal == 0 && exit_code == 0 && !timed_out && !killed; }
};

// One spawned child (the ProcessHandle). The child leads its own process
// group; kill() signals the whole group. Owned by whoever spawned it.
class Process {
public:
    static std::unique_ptr<Process> spawn(const SpawnRequest& req);
    ~Process();
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return m_pid; }
    std::chrono::system_clock::time_point start_time() const { return m_started; }
    const std::string& cwd() const { return m_cwd; }
    const std::vector<std::string>& argv() const { return m_argv; }
    bool alive() const;

    // Reads stdout and stderr until both reach EOF, invoking on_line for each
    // line in the order it was read, then reaps the child. Call once.
    ExitOutcome drain(const std::function<void(const RawLine&)>& on_line);

    // SIGKILL to the process group. No-op once the child has exited.
    void kill();

private:
    Process() = default;
    void reap(int& status);

    pid_t m_pid = -1;
    int m_out_fd = -1;
    int m_err_fd = -1;
    std::chrono::system_clock::time_point m_started;
    std::string m_cwd;
    std::vector<std::string> m_argv;
    std::chrono::milliseconds m_idle_timeout{0};
    mutable std::mutex m_mutex;
    bool m_exited = false;  // child is a zombie or reaped; pid must not be signalled
    bool m_reaped = false;
    bool m_kill_requested = false;
};

} // namespace ideshell
