/*
 * Terminal transcripts - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/event/output_event.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

// terminal_YYYYMMDD_HHMMSS.txt, local time.
std::string default_transcript_name(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// One "<KIND>: <message>" line per event.
std::string render_transcript(const std::vector<OutputEvent>& events);

// Writes dir/name (creating dir). Returns the file path, nullopt on I/O failure.
std::optional<std::string> write_transcript(const std::vector<OutputEvent>& events,
                                            const std::string& dir, const std::string& name = "");

} // namespace ideshell
