/*
 * Output classifier - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/event/output_event.hpp>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace ideshell {

// Toolchain whose output conventions a rule table describes.
enum class BackendFamily { ManagedBuildTool, PackageManager, NativeDriver, Shell };

const char* to_string(BackendFamily family);

enum class StreamFilter { Any, Stdout, Stderr };
enum class Record { None, Error, Warning }; // structured list the detail goes to

struct RuleOptions {
    int detail_group = 0;       // capture recorded in structured errors/warnings
    Record record = Record::None;
    int task_group = -1;
    int artifact_group = -1;
    int file_group = -1, line_group = -1, column_group = -1;
    StreamFilter stream = StreamFilter::Any;
    bool icase = false;
};

struct Rule {
    Rule(const std::string& re, OutputKind kind, RuleOptions opts = {});
    std::string source;   // pattern text, for diagnostics
    std::regex pattern;
    OutputKind kind;
    RuleOptions opts;
};

// Ordered rules, first match wins; unmatched lines get the per-stream default.
struct RuleTable {
    std::string name;
    std::vector<Rule> rules;
    OutputKind stdout_default = OutputKind::Info;
    OutputKind stderr_default = OutputKind::Info;
};

RuleTable managed_build_tool_rules();
RuleTable package_manager_rules();
RuleTable native_driver_rules();
RuleTable shell_rules();

class Classifier {
public:
    Classifier(); // registers the four built-in tables
    // Adds or replaces the table for a family. Not synchronized with classify().
    void register_table(BackendFamily family, RuleTable table);
    const RuleTable* table(BackendFamily family) const;

    OutputEvent classify(const RawLine& line, BackendFamily family) const;
    OutputEvent classify(const std::string& line, BackendFamily family) const {
        return classify(RawLine{StreamSource::Stdout, line}, family);
    }
private:
    std::map<BackendFamily, RuleTable> m_tables;
};

// Shared instance with the built-in tables.
const Classifier& default_classifier();

} // namespace ideshell
