/*
 * PATH resolution utilities - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace ideshell {

// Resolve command name to an executable path. Names containing '/' are
// resolved against cwd when relative. Bare names are searched in path_list
// (a PATH-style colon list); when path_list is nullopt the host PATH is used.
std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::string& cwd = "",
                                              const std::optional<std::string>& path_list = std::nullopt);

bool is_directory(const std::string& path);

} // namespace ideshell
