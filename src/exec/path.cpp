/*
 * PATH resolution implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace ideshell {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    if ((st.st_mode & S_IXUSR) || (st.st_mode & S_IXGRP) || (st.st_mode & S_IXOTH)) return true;
    return false;
}

bool is_directory(const std::string& path) {
    struct stat st{};
    if (path.empty() || stat(path.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& cwd,
                                              const std::optional<std::string>& path_list) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        std::string full = (cmd[0] != '/' && !cwd.empty()) ? cwd + '/' + cmd : cmd;
        if (is_executable(full)) return full; else return std::nullopt;
    }
    std::string paths;
    if (path_list) paths = *path_list;
    else { const char* pathEnv = std::getenv("PATH"); if (!pathEnv) return std::nullopt; paths = pathEnv; }
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t colon = paths.find(':', start);
        if (colon == std::string::npos) { parts.push_back(paths.substr(start)); break; }
        parts.push_back(paths.substr(start, colon-start));
        start = colon+1;
    }
    for (auto &d : parts) {
        if (d.empty()) continue;
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

} // namespace ideshell
