/*
 * Diagnostic logging - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace ideshell {

// Debug lines are dropped unless enabled (config "debug" or -d).
void set_debug(bool on);
bool debug_enabled();

void log_debug(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace ideshell
