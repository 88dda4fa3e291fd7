/*
 * IDE-Shell one-shot build runner
 * Runs one build operation against a project and prints its classified output;
 * also answers Maven "latest version" queries for Gradle dependencies.
 */
#include <ide-shell/backend/project.hpp>
#include <ide-shell/build/dispatcher.hpp>
#include <ide-shell/config/config.hpp>
#include <ide-shell/deps/maven.hpp>
#include <ide-shell/log/log.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace ideshell;

static volatile sig_atomic_t g_stop = 0;
static void sigint_handler(int){ g_stop = 1; }
static Config g_cfg;

static std::string apply_color(const std::string& s, const char* code){ if(!g_cfg.color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void usage() {
    std::cerr << "Usage: ide-build [options] <build|clean|test|add|remove|cross> [project] [-- extra args]\n"
              << "       ide-build latest <group:artifact>\n"
              << "       ide-build outdated <build.gradle[.kts]>\n"
              << "       ide-build detect [project]\n"
              << "Options:\n"
              << "  -d, --debug            debug diagnostics on stderr\n"
              << "  --no-color             plain output\n"
              << "  --backend B            gradle | cargo | hybrid | native (default: detected)\n"
              << "  --type T               debug | release | custom task/profile (default: debug)\n"
              << "  --target TRIPLE        target for cross builds\n"
              << "  --dep NAME             dependency for add/remove\n"
              << "  --version V            dependency version for add\n"
              << "  --features a,b         dependency features for add\n"
              << "  --env KEY=VALUE        toolchain environment override (repeatable)\n"
              << "  --timeout SECONDS      idle timeout (0 = none)\n";
}

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

static int run_latest(const std::string& coord_text) {
    auto c = parse_coordinate(coord_text);
    if (!c) { std::cerr << "ide-build: expected group:artifact, got '" << coord_text << "'\n"; return 2; }
    CurlHttpFetcher http(g_cfg.http_timeout_seconds);
    auto res = latest_version(http, g_cfg.maven_repository_url, *c);
    if (!res.version) { std::cerr << "ide-build: " << res.reason << '\n'; return 1; }
    std::cout << c->group << ":" << c->artifact << ":" << *res.version << '\n';
    return 0;
}

static int run_outdated(const std::string& script_path) {
    std::ifstream in(script_path);
    if (!in) { std::cerr << "ide-build: cannot read " << script_path << '\n'; return 1; }
    std::stringstream ss; ss << in.rdbuf();
    auto coords = scan_gradle_coordinates(ss.str());
    if (coords.empty()) { std::cout << "no dependency coordinates found\n"; return 0; }
    CurlHttpFetcher http(g_cfg.http_timeout_seconds);
    int outdated = 0;
    for (auto& c : coords) {
        auto res = latest_version(http, g_cfg.maven_repository_url, c);
        if (!res.version) { std::cout << c.to_string() << "  " << apply_color("? " + res.reason, "33") << '\n'; continue; }
        if (compare_versions(c.version, *res.version) < 0) {
            ++outdated;
            std::cout << c.to_string() << "  -> " << apply_color(*res.version, "32") << '\n';
        } else {
            std::cout << c.to_string() << "  up to date\n";
        }
    }
    return outdated > 0 ? 1 : 0;
}

int main(int argc, char* argv[]) {
    load_config(default_config_path(), g_cfg);

    std::vector<std::string> positional;
    std::optional<BackendType> backend;
    OperationParams params;
    bool extra = false;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        auto value = [&](const char* name) -> std::string {
            if (i+1 >= argc) { std::cerr << "ide-build: " << name << " needs a value\n"; std::exit(2); }
            return argv[++i];
        };
        if (extra) { params.extra_args.push_back(a); continue; }
        if (a=="--") extra = true;
        else if (a=="-d"||a=="--debug") g_cfg.debug = true;
        else if (a=="--no-color") g_cfg.color = false;
        else if (a=="-h"||a=="--help") { usage(); return 0; }
        else if (a=="--backend") {
            backend = parse_backend_type(value("--backend"));
            if (!backend) { std::cerr << "ide-build: unknown backend\n"; return 2; }
        }
        else if (a=="--type") params.build_type = value("--type");
        else if (a=="--target") params.target = value("--target");
        else if (a=="--dep") params.dependency = value("--dep");
        else if (a=="--version") params.version = value("--version");
        else if (a=="--features") {
            std::stringstream fs(value("--features")); std::string f;
            while (std::getline(fs, f, ',')) if (!f.empty()) params.features.push_back(f);
        }
        else if (a=="--env") {
            std::string kv = value("--env"); auto eq = kv.find('=');
            if (eq==std::string::npos || eq==0) { std::cerr << "ide-build: --env expects KEY=VALUE\n"; return 2; }
            params.env[kv.substr(0,eq)] = kv.substr(eq+1);
        }
        else if (a=="--timeout") {
            if (!apply_config_value(g_cfg, "idle_timeout_seconds", value("--timeout"))) { std::cerr << "ide-build: bad --timeout\n"; return 2; }
        }
        else if (!a.empty() && a[0]=='-') { std::cerr << "ide-build: unknown option " << a << '\n'; usage(); return 2; }
        else positional.push_back(a);
    }
    set_debug(g_cfg.debug);
    if (positional.empty()) { usage(); return 2; }

    const std::string& verb = positional[0];
    if (verb=="latest") { if (positional.size()<2) { usage(); return 2; } return run_latest(positional[1]); }
    if (verb=="outdated") { if (positional.size()<2) { usage(); return 2; } return run_outdated(positional[1]); }

    std::string project = positional.size() > 1 ? positional[1] : std::filesystem::current_path().string();
    if (verb=="detect") {
        auto t = detect_backend(project);
        if (!t) { std::cout << "none\n"; return 1; }
        std::cout << to_string(*t) << '\n';
        return 0;
    }

    auto op = parse_operation(verb);
    if (!op) { std::cerr << "ide-build: unknown operation '" << verb << "'\n"; usage(); return 2; }
    if (!backend) backend = detect_backend(project);
    if (!backend) { std::cerr << "ide-build: no Cargo.toml or Gradle script in " << project << " (use --backend)\n"; return 2; }

    std::signal(SIGINT, sigint_handler);
    BuildDispatcher dispatcher(g_cfg);
    BuildRequest req;
    req.project = project;
    req.backend = *backend;
    req.operation = *op;
    req.params = params;
    auto started = dispatcher.start(req);
    if (!started.started()) { std::cerr << "ide-build: " << started.message << '\n'; return 2; }

    std::cout << apply_color(std::string(to_string(*backend)) + " " + verb + " " + project, "1;36") << '\n';
    SessionStatus status = SessionStatus::Failed;
    bool cancel_sent = false;
    while (!started.events->exhausted()) {
        if (g_stop && !cancel_sent) { started.cancel.cancel(); cancel_sent = true; }
        auto item = started.events->next_for(std::chrono::milliseconds(100));
        if (!item) continue;
        if (auto ev = std::get_if<OutputEvent>(&*item)) {
            if (ev->kind() == OutputKind::Info) std::cout << ev->message() << '\n';
            else std::cout << apply_color(ev->message(), kind_color(ev->kind())) << '\n';
            continue;
        }
        auto& st = std::get<StatusEvent>(*item);
        status = st.status;
        std::string summary = std::string(to_string(st.status));
        if (!st.message.empty()) summary += ": " + st.message;
        summary += "  (" + std::to_string(st.errors.size()) + " errors, " + std::to_string(st.warnings.size()) + " warnings)";
        std::cout << apply_color(summary, st.status==SessionStatus::Succeeded ? "1;32" : "1;31") << '\n';
    }
    if (status == SessionStatus::Succeeded) return 0;
    if (status == SessionStatus::Cancelled) return 130;
    return 1;
}
