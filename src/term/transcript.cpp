/*
 * Terminal transcripts implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/term/transcript.hpp>
#include <ide-shell/log/log.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace ideshell {

std::string default_transcript_name(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "terminal_%Y%m%d_%H%M%S.txt", &tm);
    return buf;
}

std::string render_transcript(const std::vector<OutputEvent>& events) {
    std::string out;
    for (auto& ev : events) { out += format_transcript_line(ev); out += '\n'; }
    return out;
}

std::optional<std::string> write_transcript(const std::vector<OutputEvent>& events,
                                            const std::string& dir, const std::string& name) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) { log_warn("cannot create " + dir + ": " + ec.message()); return std::nullopt; }
    fs::path file = fs::path(dir) / (name.empty() ? default_transcript_name() : name);
    std::ofstream out(file, std::ios::trunc);
    if (!out) { log_warn("cannot write " + file.string()); return std::nullopt; }
    out << render_transcript(events);
    out.flush();
    if (!out) { log_warn("short write to " + file.string()); return std::nullopt; }
    return file.string();
}

} // namespace ideshell
