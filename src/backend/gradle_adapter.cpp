/*
 * Gradle adapter - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/backend/adapter.hpp>
#include <ide-shell/backend/project.hpp>
#include <filesystem>

namespace ideshell {
namespace fs = std::filesystem;

static std::string build_task(const std::string& build_type) {
    if (build_type=="debug") return "assembleDebug";
    if (build_type=="release") return "assembleRelease";
    return build_type;
}

Invocation GradleAdapter::invocation(const std::string& project, Operation op, const OperationParams& params) const {
    std::string task;
    switch (op) {
        case Operation::Build: task = build_task(params.build_type); break;
        case Operation::Clean: task = "clean"; break;
        case Operation::Test: task = "test"; break;
        case Operation::AddDependency:
        case Operation::RemoveDependency:
            throw InvalidOperationError("gradle: dependency edits are not supported, edit the build script");
        case Operation::CrossTargetBuild:
            throw InvalidOperationError("gradle: cross-target build is not defined");
    }
    if (task.empty()) throw InvalidOperationError("gradle: empty build type");
    Invocation inv;
    std::error_code ec;
    inv.argv.push_back(fs::is_regular_file(fs::path(project) / "gradlew", ec) ? "./gradlew" : m_program);
    inv.argv.push_back(task);
    inv.argv.push_back("--console=plain");
    inv.argv.insert(inv.argv.end(), m_extra.begin(), m_extra.end());
    inv.argv.insert(inv.argv.end(), params.extra_args.begin(), params.extra_args.end());
    inv.cwd = project;
    inv.env = params.env;
    inv.family = family();
    return inv;
}

std::vector<std::string> GradleAdapter::artifacts(const std::string& project, Operation op, const OperationParams& params) const {
    std::vector<std::string> out;
    if (op != Operation::Build) return out;
    fs::path root(project);
    auto add = [&](const std::vector<std::string>& files) { out.insert(out.end(), files.begin(), files.end()); };
    add(list_files((root / "app/build/outputs/apk" / params.build_type).string(), {".apk"}));
    add(list_files((root / "app/build/outputs/bundle" / params.build_type).string(), {".aab"}));
    add(list_files((root / "build/libs").string(), {".jar"}));
    add(list_files((root / "build/outputs/aar").string(), {".aar"}));
    return out;
}

} // namespace ideshell
