/*
 * Output classifier implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/classify/classifier.hpp>
#include <cstdlib>

namespace ideshell {

const char* to_string(BackendFamily family) {
    switch (family) {
        case BackendFamily::ManagedBuildTool: return "managed-build-tool";
        case BackendFamily::PackageManager: return "package-manager";
        case BackendFamily::NativeDriver: return "native-driver";
        case BackendFamily::Shell: return "shell";
    }
    return "shell";
}

Rule::Rule(const std::string& re, OutputKind k, RuleOptions o)
    : source(re),
      pattern(re, o.icase ? std::regex::ECMAScript | std::regex::icase : std::regex::ECMAScript),
      kind(k), opts(o) {}

// "Generated: <path> (<size>)" is what the dispatcher prints for every
// artifact found after a successful stage.
static const char* k_generated = R"(^Generated: (.+?)(?: \([^)]*\))?$)";

RuleTable managed_build_tool_rules() {
    RuleTable t; t.name = "gradle";
    auto& r = t.rules;
    r.emplace_back(R"(^> Task :(\S+))", OutputKind::Task, RuleOptions{.task_group=1});
    r.emplace_back(R"(^BUILD SUCCESSFUL\b)", OutputKind::Success);
    r.emplace_back(R"(^BUILD FAILED\b)", OutputKind::Error, RuleOptions{.record=Record::Error});
    r.emplace_back(R"(^FAILURE: (.*))", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    // kotlinc: "e: file:///src/Main.kt:12:5 Unresolved reference: foo"
    r.emplace_back(R"(^e: (?:file://)?(\S+?):(\d+):(\d+):? (.*))", OutputKind::Error,
                   RuleOptions{.detail_group=4, .record=Record::Error, .file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(R"(^e: (.*))", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    r.emplace_back(R"(^w: (?:file://)?(\S+?):(\d+):(\d+):? (.*))", OutputKind::Warning,
                   RuleOptions{.detail_group=4, .record=Record::Warning, .file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(R"(^w: (.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning});
    // javac / aapt: "Main.java:12: error: ';' expected"
    r.emplace_back(R"(^([\w./\-]+\.\w+):(\d+):(?:(\d+):)?\s*error:\s*(.*))", OutputKind::Error,
                   RuleOptions{.detail_group=4, .record=Record::Error, .file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(R"(^([\w./\-]+\.\w+):(\d+):(?:(\d+):)?\s*warning:\s*(.*))", OutputKind::Warning,
                   RuleOptions{.detail_group=4, .record=Record::Warning, .file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(k_generated, OutputKind::Artifact, RuleOptions{.artifact_group=1});
    r.emplace_back(R"(^(/\S+\.(?:apk|aab|jar|aar))$)", OutputKind::Artifact, RuleOptions{.artifact_group=1});
    r.emplace_back(R"((?:^|\s)warning:\s*(.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning, .icase=true});
    r.emplace_back(R"(\b(?:error|exception|failure|failed):\s*(.*))", OutputKind::Error,
                   RuleOptions{.detail_group=1, .record=Record::Error, .icase=true});
    return t;
}

RuleTable package_manager_rules() {
    RuleTable t; t.name = "cargo";
    auto& r = t.rules;
    r.emplace_back(R"(^error(?:\[E\d+\])?: (.*))", OutputKind::Error, RuleOptions{.record=Record::Error});
    r.emplace_back(R"(^warning: (.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning});
    r.emplace_back(R"(^\s+Compiling (\S+))", OutputKind::Task, RuleOptions{.task_group=1});
    r.emplace_back(R"(^\s+(?:Running|Doc-tests) (.+))", OutputKind::Task, RuleOptions{.task_group=1});
    r.emplace_back(R"(^\s+Finished\b)", OutputKind::Success);
    r.emplace_back(R"(^test result: ok\.)", OutputKind::Success);
    r.emplace_back(R"(^test result: FAILED\.)", OutputKind::Error, RuleOptions{.record=Record::Error});
    r.emplace_back(R"(^test (\S+) \.\.\. FAILED$)", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    r.emplace_back(R"(^\s*--> (.+):(\d+):(\d+)$)", OutputKind::Info, RuleOptions{.file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(k_generated, OutputKind::Artifact, RuleOptions{.artifact_group=1});
    r.emplace_back(R"(^(/\S+\.(?:so|a|dylib|dll|exe|wasm))$)", OutputKind::Artifact, RuleOptions{.artifact_group=1});
    return t;
}

RuleTable native_driver_rules() {
    RuleTable t; t.name = "native";
    auto& r = t.rules;
    // --message-format=short: "src/main.rs:2:5: error[E0308]: mismatched types"
    r.emplace_back(R"(^(.+?):(\d+):(\d+): error(?:\[E\d+\])?: (.*))", OutputKind::Error,
                   RuleOptions{.record=Record::Error, .file_group=1, .line_group=2, .column_group=3});
    r.emplace_back(R"(^(.+?):(\d+):(\d+): warning: (.*))", OutputKind::Warning,
                   RuleOptions{.detail_group=4, .record=Record::Warning, .file_group=1, .line_group=2, .column_group=3});
    for (auto& rule : package_manager_rules().rules) r.push_back(rule);
    return t;
}

RuleTable shell_rules() {
    RuleTable t; t.name = "shell";
    t.stderr_default = OutputKind::Error;
    auto& r = t.rules;
    r.emplace_back(R"(^(?:fatal|error)(?:\[\w+\])?: (.*))", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    r.emplace_back(R"(^warning: (.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning});
    r.emplace_back(R"(^hint: )", OutputKind::Info);
    r.emplace_back(R"(^npm ERR! (.*))", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    r.emplace_back(R"(^npm (?:WARN|warn) (.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning});
    r.emplace_back(R"(^E: (.*))", OutputKind::Error, RuleOptions{.detail_group=1, .record=Record::Error});
    r.emplace_back(R"(^W: (.*))", OutputKind::Warning, RuleOptions{.detail_group=1, .record=Record::Warning});
    // git and cargo report progress on stderr
    r.emplace_back(R"(^(?:Cloning into|remote:|To |From |Receiving objects|Resolving deltas|Switched to|Already on|Your branch|Already up to date))",
                   OutputKind::Info);
    r.emplace_back(R"(^\s+(?:Updating|Downloading|Downloaded|Locking|Adding|Removing|Checking|Fresh|Blocking)\b)", OutputKind::Info);
    r.emplace_back(R"(^\s+Compiling (\S+))", OutputKind::Task, RuleOptions{.task_group=1});
    r.emplace_back(R"(^\s+Finished\b)", OutputKind::Success);
    r.emplace_back(R"(^> Task :(\S+))", OutputKind::Task, RuleOptions{.task_group=1});
    r.emplace_back(R"(^BUILD SUCCESSFUL\b)", OutputKind::Success);
    r.emplace_back(R"(^BUILD FAILED\b)", OutputKind::Error, RuleOptions{.record=Record::Error});
    return t;
}

Classifier::Classifier() {
    m_tables.emplace(BackendFamily::ManagedBuildTool, managed_build_tool_rules());
    m_tables.emplace(BackendFamily::PackageManager, package_manager_rules());
    m_tables.emplace(BackendFamily::NativeDriver, native_driver_rules());
    m_tables.emplace(BackendFamily::Shell, shell_rules());
}

void Classifier::register_table(BackendFamily family, RuleTable table) {
    m_tables.insert_or_assign(family, std::move(table));
}

const RuleTable* Classifier::table(BackendFamily family) const {
    auto it = m_tables.find(family);
    return it == m_tables.end() ? nullptr : &it->second;
}

static std::string group(const std::smatch& m, int idx) {
    if (idx < 0 || (size_t)idx >= m.size() || !m[idx].matched) return {};
    return m[idx].str();
}

OutputEvent Classifier::classify(const RawLine& line, BackendFamily family) const {
    const RuleTable* t = table(family);
    if (t) {
        for (auto& rule : t->rules) {
            if (rule.opts.stream == StreamFilter::Stdout && line.source != StreamSource::Stdout) continue;
            if (rule.opts.stream == StreamFilter::Stderr && line.source != StreamSource::Stderr) continue;
            std::smatch m;
            if (!std::regex_search(line.text, m, rule.pattern)) continue;
            EventPayload payload;
            if (rule.opts.task_group >= 0) payload = TaskInfo{group(m, rule.opts.task_group)};
            else if (rule.opts.artifact_group >= 0) payload = ArtifactInfo{group(m, rule.opts.artifact_group)};
            else if (rule.opts.file_group >= 0) {
                SourceLocation loc; loc.file = group(m, rule.opts.file_group);
                auto ln = group(m, rule.opts.line_group); auto col = group(m, rule.opts.column_group);
                loc.line = ln.empty() ? 0 : std::atoi(ln.c_str());
                loc.column = col.empty() ? 0 : std::atoi(col.c_str());
                payload = loc;
            }
            std::vector<std::string> errors, warnings;
            std::string detail = group(m, rule.opts.detail_group);
            if (rule.opts.detail_group == 0) detail = line.text;
            if (rule.opts.record == Record::Error) errors.push_back(detail);
            else if (rule.opts.record == Record::Warning) warnings.push_back(detail);
            return OutputEvent(rule.kind, line.text, std::move(payload), std::move(errors), std::move(warnings), line.source);
        }
    }
    OutputKind def = OutputKind::Info;
    if (t) def = line.source == StreamSource::Stderr ? t->stderr_default : t->stdout_default;
    std::vector<std::string> errors;
    if (def == OutputKind::Error) errors.push_back(line.text);
    return OutputEvent(def, line.text, {}, std::move(errors), {}, line.source);
}

const Classifier& default_classifier() {
    static const Classifier instance;
    return instance;
}

} // namespace ideshell
