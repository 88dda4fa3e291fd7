/*
 * Project inspection - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/backend/project.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace ideshell {
namespace fs = std::filesystem;

static bool exists_file(const fs::path& p) { std::error_code ec; return fs::is_regular_file(p, ec); }

bool has_gradle_script(const std::string& project) {
    fs::path root(project);
    for (auto n : {"build.gradle", "build.gradle.kts", "settings.gradle", "settings.gradle.kts"})
        if (exists_file(root / n)) return true;
    return false;
}

bool has_cargo_manifest(const std::string& project) { return exists_file(fs::path(project) / "Cargo.toml"); }

std::optional<BackendType> detect_backend(const std::string& project) {
    bool cargo = has_cargo_manifest(project), gradle = has_gradle_script(project);
    if (cargo && gradle) return BackendType::Hybrid;
    if (cargo) return BackendType::PackageManager;
    if (gradle) return BackendType::ManagedBuildTool;
    return std::nullopt;
}

template <typename Pred>
static std::vector<std::string> scan(const std::string& dir, Pred keep) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) return out;
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        if (keep(it->path().extension().string())) out.push_back(it->path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> list_files(const std::string& dir, const std::vector<std::string>& exts) {
    return scan(dir, [&](const std::string& ext) {
        return exts.empty() || std::find(exts.begin(), exts.end(), ext) != exts.end();
    });
}

std::vector<std::string> list_files_except(const std::string& dir, const std::vector<std::string>& excluded) {
    return scan(dir, [&](const std::string& ext) {
        return std::find(excluded.begin(), excluded.end(), ext) == excluded.end();
    });
}

std::vector<std::string> cargo_artifacts(const std::string& project, const std::string& target, const std::string& build_type) {
    fs::path dir = fs::path(project) / "target";
    if (!target.empty()) dir /= target;
    dir /= (build_type=="dev" || build_type.empty()) ? std::string("debug") : build_type;
    auto files = list_files_except(dir.string(), {".d", ".rlib", ".rmeta", ".pdb"});
    // cargo keeps bookkeeping such as .cargo-lock beside the outputs
    files.erase(std::remove_if(files.begin(), files.end(), [](const std::string& f) {
        return fs::path(f).filename().string().rfind('.', 0) == 0;
    }), files.end());
    return files;
}

std::string format_size(std::uintmax_t bytes) {
    char buf[32];
    if (bytes < 1024) std::snprintf(buf, sizeof(buf), "%ju B", bytes);
    else if (bytes < 1024*1024) std::snprintf(buf, sizeof(buf), "%.1f KB", bytes/1024.0);
    else std::snprintf(buf, sizeof(buf), "%.1f MB", bytes/(1024.0*1024.0));
    return buf;
}

} // namespace ideshell
