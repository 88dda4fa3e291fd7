/*
 * Native driver adapter - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/backend/adapter.hpp>
#include <ide-shell/backend/project.hpp>

namespace ideshell {

Invocation NativeDriverAdapter::invocation(const std::string& project, Operation op, const OperationParams& params) const {
    Invocation inv;
    auto& a = inv.argv;
    a.push_back(m_program);
    switch (op) {
        case Operation::Build:
        case Operation::CrossTargetBuild:
            if (op == Operation::CrossTargetBuild && params.target.empty())
                throw InvalidOperationError("native: cross-target build requires a target triple");
            a.push_back("build");
            if (params.build_type=="release") a.push_back("--release");
            else if (params.build_type!="debug") {
                if (params.build_type.empty()) throw InvalidOperationError("native: empty build type");
                a.push_back("--profile"); a.push_back(params.build_type);
            }
            a.push_back("--message-format=short");
            if (op == Operation::CrossTargetBuild) { a.push_back("--target"); a.push_back(params.target); }
            break;
        case Operation::Clean: a.push_back("clean"); break;
        case Operation::Test: a.push_back("test"); a.push_back("--message-format=short"); break;
        case Operation::AddDependency:
        case Operation::RemoveDependency:
            throw InvalidOperationError("native: dependency edits are not supported");
    }
    a.insert(a.end(), params.extra_args.begin(), params.extra_args.end());
    inv.cwd = project;
    inv.env = params.env;
    inv.family = family();
    return inv;
}

std::vector<std::string> NativeDriverAdapter::artifacts(const std::string& project, Operation op, const OperationParams& params) const {
    if (op == Operation::Build) return cargo_artifacts(project, "", params.build_type);
    if (op == Operation::CrossTargetBuild) return cargo_artifacts(project, params.target, params.build_type);
    return {};
}

} // namespace ideshell
