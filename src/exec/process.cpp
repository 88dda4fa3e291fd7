/*
 * Process executor implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/exec/process.hpp>
#include <ide-shell/exec/path.hpp>
#include <ide-shell/log/log.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ideshell {

namespace {

void close_fd(int& fd) { if (fd != -1) { ::close(fd); fd = -1; } }

std::map<std::string,std::string> merged_environment(const std::map<std::string,std::string>& overrides) {
    std::map<std::string,std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq+1);
    }
    for (auto &kv : overrides) env[kv.first] = kv.second;
    return env;
}

// Splits buffered bytes into complete lines; the remainder stays in pending.
void emit_lines(std::string& pending, StreamSource src, const std::function<void(const RawLine&)>& on_line) {
    size_t start = 0;
    while (true) {
        size_t nl = pending.find('\n', start);
        if (nl == std::string::npos) break;
        std::string text = pending.substr(start, nl-start);
        if (!text.empty() && text.back()=='\r') text.pop_back();
        on_line(RawLine{src, std::move(text)});
        start = nl+1;
    }
    pending.erase(0, start);
}

// Delivers an unterminated last line, if any.
void flush_partial(std::string& pending, StreamSource src, const std::function<void(const RawLine&)>& on_line) {
    if (pending.empty()) return;
    if (pending.back()=='\r') pending.pop_back();
    on_line(RawLine{src, std::move(pending)});
    pending.clear();
}

} // namespace

std::unique_ptr<Process> Process::spawn(const SpawnRequest& req) {
    if (req.argv.empty()) throw SpawnError("empty argument vector");
    if (!is_directory(req.cwd)) throw SpawnError("working directory does not exist: " + req.cwd);

    auto env = merged_environment(req.env);
    std::optional<std::string> path_list;
    auto pit = env.find("PATH");
    if (pit != env.end()) path_list = pit->second;
    auto exe = resolve_executable(req.argv[0], req.cwd, path_list);
    if (!exe) throw SpawnError(req.argv[0] + ": command not found");

    // Everything the child touches is built before fork.
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (auto &kv : env) env_strings.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv; cenv.reserve(env_strings.size()+1);
    for (auto &s : env_strings) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);
    std::vector<char*> cargv; cargv.reserve(req.argv.size()+1);
    for (auto &s : req.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) throw SpawnError(std::string("pipe: ") + std::strerror(errno));
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno; ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw SpawnError(std::string("pipe: ") + std::strerror(e));
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        int e = errno; for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        throw SpawnError(std::string("pipe: ") + std::strerror(e));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) ::close(fd);
        throw SpawnError(std::string("fork: ") + std::strerror(e));
    }
    if (pid == 0) {
        setpgid(0,0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        if (chdir(req.cwd.c_str()) != 0) { int e = errno; (void)!write(status_pipe[1], &e, sizeof(e)); _exit(127); }
        execve(exe->c_str(), cargv.data(), cenv.data());
        int e = errno;
        (void)!write(status_pipe[1], &e, sizeof(e));
        _exit(127);
    }
    setpgid(pid, pid);
    ::close(out_pipe[1]); ::close(err_pipe[1]); ::close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(status_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    ::close(status_pipe[0]);
    if (n == (ssize_t)sizeof(child_errno)) {
        int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        ::close(out_pipe[0]); ::close(err_pipe[0]);
        throw SpawnError(req.argv[0] + ": " + std::strerror(child_errno));
    }

    std::unique_ptr<Process> p(new Process());
    p->m_pid = pid;
    p->m_out_fd = out_pipe[0];
    p->m_err_fd = err_pipe[0];
    p->m_started = std::chrono::system_clock::now();
    p->m_cwd = req.cwd;
    p->m_argv = req.argv;
    p->m_idle_timeout = req.idle_timeout;
    log_debug("spawned pid " + std::to_string(pid) + ": " + *exe);
    return p;
}

Process::~Process() {
    if (m_pid > 0 && !m_reaped) {
        kill();
        close_fd(m_out_fd); close_fd(m_err_fd);
        int st = 0; while (waitpid(m_pid, &st, 0) < 0 && errno == EINTR) {}
    }
    close_fd(m_out_fd); close_fd(m_err_fd);
}

bool Process::alive() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_pid <= 0 || m_exited) return false;
    siginfo_t info{};
    if (waitid(P_PID, m_pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == m_pid)
        return false;
    return true;
}

void Process::kill() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_pid <= 0 || m_exited) return;
    m_kill_requested = true;
    if (::kill(-m_pid, SIGKILL) != 0 && errno != ESRCH) log_warn(std::string("kill: ") + std::strerror(errno));
}

void Process::reap(int& status) {
    siginfo_t info{};
    while (waitid(P_PID, m_pid, &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}
    { std::lock_guard<std::mutex> lk(m_mutex); m_exited = true; }
    while (waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {}
    m_reaped = true;
}

ExitOutcome Process::drain(const std::function<void(const RawLine&)>& on_line) {
    using clock = std::chrono::steady_clock;
    ExitOutcome out;
    std::string pending_out, pending_err;
    auto last_output = clock::now();
    std::optional<clock::time_point> kill_deadline;
    char buf[4096];

    while (m_out_fd != -1 || m_err_fd != -1) {
        struct pollfd pfds[2]; int nfds = 0;
        if (m_out_fd != -1) { pfds[nfds].fd = m_out_fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }
        if (m_err_fd != -1) { pfds[nfds].fd = m_err_fd; pfds[nfds].events = POLLIN; pfds[nfds].revents = 0; ++nfds; }

        int wait_ms = 100;
        if (m_idle_timeout.count() > 0 && !out.timed_out) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(m_idle_timeout - (clock::now() - last_output));
            if (left.count() <= 0) {
                out.timed_out = true;
                log_debug("pid " + std::to_string(m_pid) + " idle for " + std::to_string(m_idle_timeout.count()) + "ms, killing");
                kill();
            } else if (left.count() < wait_ms) wait_ms = (int)left.count();
        }
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_kill_requested && !kill_deadline) kill_deadline = clock::now() + std::chrono::seconds(2);
        }
        // A killed group normally closes its pipes at once; a descendant that
        // left the group may keep them open, so stop waiting after a grace period.
        if (kill_deadline && clock::now() > *kill_deadline) break;

        int r = poll(pfds, nfds, wait_ms);
        if (r < 0) { if (errno == EINTR) continue; log_warn(std::string("poll: ") + std::strerror(errno)); break; }
        if (r == 0) continue;
        for (int i=0;i<nfds;++i) {
            if (!(pfds[i].revents & (POLLIN|POLLHUP|POLLERR))) continue;
            bool is_out = pfds[i].fd == m_out_fd;
            std::string& pending = is_out ? pending_out : pending_err;
            StreamSource src = is_out ? StreamSource::Stdout : StreamSource::Stderr;
            ssize_t n = ::read(pfds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                flush_partial(pending, src, on_line);
                if (is_out) close_fd(m_out_fd); else close_fd(m_err_fd);
                continue;
            }
            last_output = clock::now();
            pending.append(buf, (size_t)n);
            emit_lines(pending, src, on_line);
        }
    }
    flush_partial(pending_out, StreamSource::Stdout, on_line);
    flush_partial(pending_err, StreamSource::Stderr, on_line);
    close_fd(m_out_fd); close_fd(m_err_fd);

    int status = 0;
    reap(status);
    if (WIFEXITED(status)) out.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) { out.term_signal = WTERMSIG(status); out.exit_code = 128 + out.term_signal; }
    { std::lock_guard<std::mutex> lk(m_mutex); out.killed = m_kill_requested; }
    log_debug("pid " + std::to_string(m_pid) + " finished with status " + std::to_string(out.exit_code));
    return out;
}

} // namespace ideshell
