/*
 * Project inspection - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/backend/adapter.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

bool has_gradle_script(const std::string& project);
bool has_cargo_manifest(const std::string& project);

// Cargo.toml + Gradle script -> Hybrid, Cargo.toml -> PackageManager,
// Gradle script -> ManagedBuildTool, nothing -> nullopt.
std::optional<BackendType> detect_backend(const std::string& project);

// Regular files directly inside dir whose extension is in exts (".apk"), sorted.
// Empty exts matches every file. Missing dir yields an empty list.
std::vector<std::string> list_files(const std::string& dir, const std::vector<std::string>& exts = {});

// Regular files directly inside dir except those with an excluded extension.
std::vector<std::string> list_files_except(const std::string& dir, const std::vector<std::string>& excluded);

// Outputs of a cargo-style build: target/[<triple>/]<profile>/ minus
// dependency info and intermediate libraries.
std::vector<std::string> cargo_artifacts(const std::string& project, const std::string& target, const std::string& build_type);

// "1.2 MB" style size for artifact announcements.
std::string format_size(std::uintmax_t bytes);

} // namespace ideshell
