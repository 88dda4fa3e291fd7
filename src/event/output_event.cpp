/*
 * Output events implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/event/output_event.hpp>

namespace ideshell {

const char* to_string(OutputKind kind) {
    switch (kind) {
        case OutputKind::Info: return "INFO";
        case OutputKind::Error: return "ERROR";
        case OutputKind::Warning: return "WARNING";
        case OutputKind::Success: return "SUCCESS";
        case OutputKind::Task: return "TASK";
        case OutputKind::Artifact: return "ARTIFACT";
        case OutputKind::Clear: return "CLEAR";
    }
    return "INFO";
}

std::optional<OutputKind> parse_output_kind(const std::string& name) {
    for (auto k : {OutputKind::Info, OutputKind::Error, OutputKind::Warning, OutputKind::Success,
                   OutputKind::Task, OutputKind::Artifact, OutputKind::Clear})
        if (name == to_string(k)) return k;
    return std::nullopt;
}

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "IDLE";
        case SessionStatus::Running: return "RUNNING";
        case SessionStatus::Succeeded: return "SUCCEEDED";
        case SessionStatus::Failed: return "FAILED";
        case SessionStatus::Cancelled: return "CANCELLED";
    }
    return "IDLE";
}

std::string OutputEvent::artifact_path() const {
    if (auto a = std::get_if<ArtifactInfo>(&m_payload)) return a->path;
    return {};
}

std::string OutputEvent::task_name() const {
    if (auto t = std::get_if<TaskInfo>(&m_payload)) return t->name;
    return {};
}

std::optional<SourceLocation> OutputEvent::location() const {
    if (auto l = std::get_if<SourceLocation>(&m_payload)) return *l;
    return std::nullopt;
}

std::string format_transcript_line(const OutputEvent& ev) {
    return std::string(to_string(ev.kind())) + ": " + ev.message();
}

} // namespace ideshell
