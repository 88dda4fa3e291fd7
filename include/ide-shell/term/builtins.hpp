/*
 * Terminal built-in commands - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/event/output_event.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

struct BuiltinContext {
    std::string& cwd;                                // updated by cd
    const std::map<std::string,std::string>& env;    // session overrides
};

struct BuiltinResult {
    std::vector<OutputEvent> events;
    int exit_code = 0;
};

// Splits on whitespace honouring single and double quotes.
std::vector<std::string> split_words(const std::string& text);

bool is_builtin(const std::string& name);

// nullopt when the command line is not a built-in; commands using shell
// operators (cd x && ls) always go to the real shell.
std::optional<BuiltinResult> run_builtin(const std::string& command_line, BuiltinContext& ctx);

} // namespace ideshell
