/*
 * Output events - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/exec/process.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ideshell {

enum class OutputKind { Info, Error, Warning, Success, Task, Artifact, Clear };

const char* to_string(OutputKind kind);
std::optional<OutputKind> parse_output_kind(const std::string& name);

// Kind-specific payloads.
struct TaskInfo { std::string name; };
struct ArtifactInfo { std::string path; };
struct SourceLocation { std::string file; int line = 0; int column = 0; };
using EventPayload = std::variant<std::monostate, TaskInfo, ArtifactInfo, SourceLocation>;

// One classified unit of output. Built once, never modified afterwards.
class OutputEvent {
public:
    using Clock = std::chrono::system_clock;

    OutputEvent(OutputKind kind, std::string message,
                EventPayload payload = {},
                std::vector<std::string> errors = {},
                std::vector<std::string> warnings = {},
                StreamSource source = StreamSource::Stdout,
                Clock::time_point timestamp = Clock::now())
        : m_kind(kind), m_message(std::move(message)), m_payload(std::move(payload)),
          m_errors(std::move(errors)), m_warnings(std::move(warnings)),
          m_source(source), m_timestamp(timestamp) {}

    OutputKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }
    const EventPayload& payload() const { return m_payload; }
    const std::vector<std::string>& structured_errors() const { return m_errors; }
    const std::vector<std::string>& structured_warnings() const { return m_warnings; }
    StreamSource source() const { return m_source; }
    Clock::time_point timestamp() const { return m_timestamp; }

    // Path of an ARTIFACT event, task name of a TASK event, empty otherwise.
    std::string artifact_path() const;
    std::string task_name() const;
    std::optional<SourceLocation> location() const;

private:
    OutputKind m_kind;
    std::string m_message;
    EventPayload m_payload;
    std::vector<std::string> m_errors;
    std::vector<std::string> m_warnings;
    StreamSource m_source;
    Clock::time_point m_timestamp;
};

// Lifecycle of a build session or of one terminal command.
enum class SessionStatus { Idle, Running, Succeeded, Failed, Cancelled };

const char* to_string(SessionStatus status);
inline bool is_terminal(SessionStatus s) { return s==SessionStatus::Succeeded || s==SessionStatus::Failed || s==SessionStatus::Cancelled; }

// Last item on every channel: how the operation ended.
struct StatusEvent {
    SessionStatus status = SessionStatus::Idle;
    std::string message;
    int exit_code = -1;                 // -1 when no process exited normally
    std::vector<std::string> errors;    // all structured errors of the operation
    std::vector<std::string> warnings;
};

using SessionEvent = std::variant<OutputEvent, StatusEvent>;

// "<KIND>: <message>", the persisted transcript line.
std::string format_transcript_line(const OutputEvent& ev);

} // namespace ideshell
