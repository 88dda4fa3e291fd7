/*
 * Configuration implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/config/config.hpp>
#include <ide-shell/log/log.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ideshell {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static bool parse_bool(const std::string& val, bool& out) {
    if (val=="1"||val=="true"||val=="on"||val=="yes") { out = true; return true; }
    if (val=="0"||val=="false"||val=="off"||val=="no") { out = false; return true; }
    return false;
}

static bool parse_int(const std::string& val, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size() || v < 0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string default_config_path() {
    std::string over = getenv_or("IDE_SHELL_RC");
    if (!over.empty()) return over;
    std::string home = getenv_or("HOME");
    if (home.empty()) return ".ide-shellrc";
    return home + "/.ide-shellrc";
}

bool apply_config_value(Config& cfg, const std::string& key, const std::string& val) {
    if (key=="idle_timeout_seconds") return parse_int(val, cfg.idle_timeout_seconds);
    if (key=="http_timeout_seconds") return parse_int(val, cfg.http_timeout_seconds);
    if (key=="debug") return parse_bool(val, cfg.debug);
    if (key=="color") return parse_bool(val, cfg.color);
    if (key=="shell_program") { if (val.empty()) return false; cfg.shell_program = val; return true; }
    if (key=="gradle_program") { if (val.empty()) return false; cfg.gradle_program = val; return true; }
    if (key=="cargo_program") { if (val.empty()) return false; cfg.cargo_program = val; return true; }
    if (key=="native_driver_program") { if (val.empty()) return false; cfg.native_driver_program = val; return true; }
    if (key=="transcript_dir") { cfg.transcript_dir = val; return true; }
    if (key=="bookmark_file") { cfg.bookmark_file = val; return true; }
    if (key=="maven_repository_url") { if (val.empty()) return false; cfg.maven_repository_url = val; return true; }
    if (key=="gradle_extra_args") {
        cfg.gradle_extra_args.clear();
        std::istringstream iss(val); std::string a;
        while (iss >> a) cfg.gradle_extra_args.push_back(a);
        return true;
    }
    return false;
}

bool load_config(const std::string& path, Config& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { log_warn(path + ":" + std::to_string(lineno) + ": expected key=value"); continue; }
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        if (!apply_config_value(cfg, key, val))
            log_warn(path + ":" + std::to_string(lineno) + ": ignoring '" + key + "=" + val + "'");
    }
    return true;
}

std::string resolve_transcript_dir(const Config& cfg) {
    if (!cfg.transcript_dir.empty()) return cfg.transcript_dir;
    return getenv_or("HOME", ".") + "/.ide-shell/terminal_logs";
}

std::string resolve_bookmark_file(const Config& cfg) {
    if (!cfg.bookmark_file.empty()) return cfg.bookmark_file;
    return getenv_or("HOME", ".") + "/.ide-shell/bookmarks.tsv";
}

} // namespace ideshell
