// IDE-Shell interactive terminal
#include <ide-shell/backend/project.hpp>
#include <ide-shell/build/dispatcher.hpp>
#include <ide-shell/config/config.hpp>
#include <ide-shell/log/log.hpp>
#include <ide-shell/term/history.hpp>
#include <ide-shell/term/session_manager.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/utsname.h>
#include <vector>

using namespace ideshell;

static volatile sig_atomic_t g_interrupted = 0;
static Config g_cfg;

static void sigint_handler(int){ g_interrupted=1; }
static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static const char* kind_color(OutputKind k) {
    switch (k) {
        case OutputKind::Error: return "31";
        case OutputKind::Warning: return "33";
        case OutputKind::Success: return "32";
        case OutputKind::Task: return "36";
        case OutputKind::Artifact: return "1;35";
        default: return "0";
    }
}

static void print_event(const OutputEvent& ev) {
    if (ev.kind() == OutputKind::Clear) { if (g_cfg.color) std::cout << "\x1b[2J\x1b[H"; std::cout.flush(); return; }
    if (ev.kind() == OutputKind::Info) std::cout << ev.message() << '\n';
    else std::cout << apply_color(ev.message(), kind_color(ev.kind())) << '\n';
    std::cout.flush();
}

// Prints events until the StatusEvent; Ctrl-C cancels the operation.
static SessionStatus consume(const std::shared_ptr<Channel<SessionEvent>>& events, const CancelHandle& cancel, bool verbose_status) {
    SessionStatus last = SessionStatus::Idle;
    bool cancel_sent = false;
    while (!events->exhausted()) {
        if (g_interrupted && !cancel_sent && cancel) { cancel.cancel(); cancel_sent = true; }
        auto item = events->next_for(std::chrono::milliseconds(100));
        if (!item) continue;
        if (auto ev = std::get_if<OutputEvent>(&*item)) { print_event(*ev); continue; }
        auto& st = std::get<StatusEvent>(*item);
        last = st.status;
        if (st.status == SessionStatus::Cancelled) std::cout << apply_color("^C cancelled", "33") << '\n';
        else if (verbose_status || st.status == SessionStatus::Failed) {
            std::string line = std::string(to_string(st.status));
            if (!st.message.empty()) line += ": " + st.message;
            std::cout << apply_color(line, st.status == SessionStatus::Succeeded ? "32" : "31") << '\n';
        }
    }
    return last;
}

static void print_meta_help() {
    std::cout << "Session commands:\n"
              << "  :new [dir]             open a session (default: current session directory)\n"
              << "  :switch <id>           make <id> the current session\n"
              << "  :sessions              list sessions\n"
              << "  :close [id]            close a session\n"
              << "  :env KEY=VALUE | -KEY  set or unset a session variable\n"
              << "  :history               show this session's history\n"
              << "  :bookmark <cmd> [-- description]\n"
              << "  :bookmarks             list bookmarks\n"
              << "  :run <cmd>             replay a bookmark\n"
              << "  :save [file]           save the transcript\n"
              << "  :build [op] [type]     build the session directory (op: build clean test)\n"
              << "  :quit                  exit\n";
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, sigint_handler);
    std::string rc = default_config_path();
    load_config(rc, g_cfg);
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="-d"||a=="--debug") g_cfg.debug = true;
        else if (a=="--no-color") g_cfg.color = false;
        else if (a=="-h"||a=="--help") { std::cout << "usage: ide-shell [-d] [--no-color]\n"; return 0; }
        else { std::cerr << "ide-shell: unknown option " << a << '\n'; return 2; }
    }
    set_debug(g_cfg.debug);

    auto store = std::make_shared<FileBookmarkStore>(resolve_bookmark_file(g_cfg));
    if (!store->load()) log_debug("no bookmarks at " + store->path());
    TerminalSessionManager terminals(g_cfg, store);
    BuildDispatcher builds(g_cfg);

    std::cout << "\n" << apply_color("IDE-Shell", "1;36") << "\n";
    struct utsname u; uname(&u);
    std::cout << "System: " << u.sysname << " " << u.release << " (" << u.machine << ")\n";
    std::cout << "Built-ins: clear cd help. Type :help for session commands, :quit to exit.\n\n";

    auto first = terminals.create_session();
    if (!first) { log_error("cannot open a session in the current directory"); return 1; }
    std::string current = *first;

    std::string line;
    while (true) {
        g_interrupted = 0;
        auto info = terminals.session(current);
        std::string cwd = info ? info->working_directory : "?";
        std::cout << apply_color(current, "34") << " " << apply_color(cwd, "33") << "$ " << std::flush;
        if (!std::getline(std::cin, line)) { std::cout << '\n'; break; }
        if (line.empty()) continue;

        if (line[0] == ':') {
            std::istringstream iss(line.substr(1));
            std::string cmd; iss >> cmd;
            std::string rest; std::getline(iss, rest);
            if (!rest.empty() && rest[0]==' ') rest.erase(0, rest.find_first_not_of(' '));
            if (cmd=="quit"||cmd=="q") break;
            else if (cmd=="help") print_meta_help();
            else if (cmd=="new") {
                auto id = terminals.create_session(rest.empty() ? cwd : rest);
                if (id) { current = *id; std::cout << "opened " << *id << '\n'; }
                else std::cerr << "cannot open session in " << rest << '\n';
            } else if (cmd=="switch") {
                if (terminals.session(rest)) current = rest; else std::cerr << "no such session: " << rest << '\n';
            } else if (cmd=="sessions") {
                for (auto& s : terminals.sessions())
                    std::cout << (s.id==current ? "* " : "  ") << s.id << "  " << s.working_directory << (s.busy ? "  (running)" : "") << '\n';
            } else if (cmd=="close") {
                std::string id = rest.empty() ? current : rest;
                if (!terminals.close_session(id)) { std::cerr << "no such session: " << id << '\n'; continue; }
                if (id == current) {
                    auto left = terminals.sessions();
                    if (left.empty()) break;
                    current = left.front().id;
                }
            } else if (cmd=="env") {
                if (!rest.empty() && rest[0]=='-') terminals.unset_env(current, rest.substr(1));
                else {
                    auto eq = rest.find('=');
                    if (eq==std::string::npos || !terminals.set_env(current, rest.substr(0,eq), rest.substr(eq+1)))
                        std::cerr << "usage: :env KEY=VALUE | :env -KEY\n";
                }
            } else if (cmd=="history") {
                auto h = terminals.history(current);
                for (size_t i=0;i<h.size();++i) std::cout << "  " << i+1 << "  " << h[i] << '\n';
            } else if (cmd=="bookmark") {
                std::string command = rest, desc;
                auto sep = rest.find(" -- ");
                if (sep != std::string::npos) { command = rest.substr(0, sep); desc = rest.substr(sep+4); }
                if (command.empty()) { auto h = terminals.history(current); if (!h.empty()) command = h.back(); }
                if (command.empty() || !terminals.bookmark(current, command, desc)) std::cerr << "nothing to bookmark\n";
                else std::cout << "bookmarked: " << command << '\n';
            } else if (cmd=="bookmarks") {
                for (auto& b : store->bookmarks())
                    std::cout << (b.favorite ? "* " : "  ") << b.command << "  [" << b.use_count << "]"
                              << (b.description.empty() ? "" : "  " + b.description) << '\n';
            } else if (cmd=="run") {
                auto r = terminals.replay_bookmark(current, rest);
                if (!r.started()) std::cerr << r.message << '\n';
                else consume(r.events, r.cancel, false);
            } else if (cmd=="save") {
                auto path = terminals.save_transcript(current, "", rest);
                if (path) std::cout << "saved " << *path << '\n'; else std::cerr << "cannot save transcript\n";
            } else if (cmd=="build") {
                std::istringstream bs(rest); std::string op_name="build", type="debug";
                bs >> op_name >> type;
                auto op = parse_operation(op_name);
                auto backend = detect_backend(cwd);
                if (!op) { std::cerr << "unknown operation: " << op_name << '\n'; continue; }
                if (!backend) { std::cerr << "no Cargo.toml or Gradle script in " << cwd << '\n'; continue; }
                BuildRequest req; req.project = cwd; req.backend = *backend; req.operation = *op; req.params.build_type = type;
                auto r = builds.start(req);
                if (!r.started()) { std::cerr << r.message << '\n'; continue; }
                consume(r.events, r.cancel, true);
            } else {
                std::cerr << "unknown command :" << cmd << " (try :help)\n";
            }
            continue;
        }

        auto r = terminals.execute(current, line);
        if (!r.started()) { std::cerr << r.message << '\n'; continue; }
        consume(r.events, r.cancel, false);
    }
    return 0;
}
