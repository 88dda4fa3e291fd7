/*
 * Diagnostic logging implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/log/log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace ideshell {

static std::atomic<bool> g_debug{false};
static std::mutex g_log_mutex; // worker threads log too

void set_debug(bool on) { g_debug = on; }
bool debug_enabled() { return g_debug; }

static void emit(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cerr << tag << ' ' << msg << '\n';
}

void log_debug(const std::string& msg) { if (g_debug) emit("[DEBUG]", msg); }
void log_warn(const std::string& msg) { emit("[WARN]", msg); }
void log_error(const std::string& msg) { emit("[ERROR]", msg); }

} // namespace ideshell
