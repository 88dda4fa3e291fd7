/*
 * Terminal built-in commands implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/term/builtins.hpp>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace ideshell {
namespace fs = std::filesystem;

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string cur; bool have = false; char quote = 0;
    for (char c : text) {
        if (quote) {
            if (c == quote) quote = 0; else cur.push_back(c);
            continue;
        }
        if (c=='\'' || c=='"') { quote = c; have = true; continue; }
        if (c==' ' || c=='\t') {
            if (have) { words.push_back(cur); cur.clear(); have = false; }
            continue;
        }
        cur.push_back(c); have = true;
    }
    if (have) words.push_back(cur);
    return words;
}

bool is_builtin(const std::string& name) {
    return name=="clear" || name=="cd" || name=="help";
}

static bool has_shell_operators(const std::string& s) {
    return s.find_first_of(";&|<>`") != std::string::npos || s.find("$(") != std::string::npos;
}

static std::string session_home(const BuiltinContext& ctx) {
    auto it = ctx.env.find("HOME");
    if (it != ctx.env.end() && !it->second.empty()) return it->second;
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : "/";
}

static BuiltinResult do_cd(const std::vector<std::string>& argv, BuiltinContext& ctx) {
    BuiltinResult res;
    if (argv.size() > 2) {
        res.exit_code = 1;
        res.events.emplace_back(OutputKind::Error, "cd: too many arguments", EventPayload{}, std::vector<std::string>{"cd: too many arguments"});
        return res;
    }
    std::string target = argv.size() < 2 ? session_home(ctx) : argv[1];
    if (target == "~") target = session_home(ctx);
    else if (target.rfind("~/", 0) == 0) target = session_home(ctx) + target.substr(1);

    fs::path p(target);
    if (p.is_relative()) p = fs::path(ctx.cwd) / p;
    std::error_code ec;
    if (!fs::is_directory(p, ec)) {
        std::string msg = "cd: " + target + ": " + (fs::exists(p, ec) ? "Not a directory" : "No such file or directory");
        res.exit_code = 1;
        res.events.emplace_back(OutputKind::Error, msg, EventPayload{}, std::vector<std::string>{msg});
        return res;
    }
    auto canon = fs::canonical(p, ec);
    if (ec) {
        std::string msg = "cd: " + target + ": " + ec.message();
        res.exit_code = 1;
        res.events.emplace_back(OutputKind::Error, msg, EventPayload{}, std::vector<std::string>{msg});
        return res;
    }
    ctx.cwd = canon.string();
    res.events.emplace_back(OutputKind::Success, ctx.cwd);
    return res;
}

static BuiltinResult do_help() {
    BuiltinResult res;
    for (auto line : {"Built-in commands:",
                      "  clear        clear the terminal output",
                      "  cd [dir]     change the session directory (~ and relative paths allowed)",
                      "  help         show this help",
                      "Anything else runs in the configured shell with the session directory and environment."})
        res.events.emplace_back(OutputKind::Info, line);
    return res;
}

std::optional<BuiltinResult> run_builtin(const std::string& command_line, BuiltinContext& ctx) {
    auto argv = split_words(command_line);
    if (argv.empty() || !is_builtin(argv[0])) return std::nullopt;
    if (has_shell_operators(command_line)) return std::nullopt;
    if (argv[0]=="clear") {
        BuiltinResult res;
        res.events.emplace_back(OutputKind::Clear, "");
        return res;
    }
    if (argv[0]=="cd") return do_cd(argv, ctx);
    return do_help();
}

} // namespace ideshell
