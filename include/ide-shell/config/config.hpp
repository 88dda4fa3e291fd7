/*
 * Configuration - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace ideshell {

struct Config {
    int idle_timeout_seconds = 300;              // kill a process silent for this long (0 = never)
    std::string shell_program = "/bin/sh";       // runs non-builtin terminal commands
    std::string gradle_program = "gradle";       // used when the project has no ./gradlew
    std::vector<std::string> gradle_extra_args;  // appended after --console=plain
    std::string cargo_program = "cargo";
    std::string native_driver_program = "cargo"; // experimental native build driver
    std::string transcript_dir;                  // empty = ~/.ide-shell/terminal_logs
    std::string bookmark_file;                   // empty = ~/.ide-shell/bookmarks.tsv
    bool debug = false;
    bool color = true;
    std::string maven_repository_url = "https://repo1.maven.org/maven2";
    int http_timeout_seconds = 5;
};

// ~/.ide-shellrc, or $IDE_SHELL_RC when set.
std::string default_config_path();

// Reads key=value lines into cfg. Unknown keys and malformed values are
// reported with a warning and skipped. Returns false if the file is missing.
bool load_config(const std::string& path, Config& cfg);

// Applies a single key=value pair; false if the key is unknown or the value invalid.
bool apply_config_value(Config& cfg, const std::string& key, const std::string& value);

std::string resolve_transcript_dir(const Config& cfg);
std::string resolve_bookmark_file(const Config& cfg);

} // namespace ideshell
