/*
 * Cargo adapter - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/backend/adapter.hpp>
#include <ide-shell/backend/project.hpp>

namespace ideshell {

static void push_profile(std::vector<std::string>& argv, const std::string& build_type) {
    if (build_type=="release") argv.push_back("--release");
    else if (!build_type.empty() && build_type!="debug" && build_type!="dev") { argv.push_back("--profile"); argv.push_back(build_type); }
}

Invocation CargoAdapter::invocation(const std::string& project, Operation op, const OperationParams& params) const {
    Invocation inv;
    auto& a = inv.argv;
    a.push_back(m_program);
    switch (op) {
        case Operation::Build: a.push_back("build"); push_profile(a, params.build_type); break;
        case Operation::Clean: a.push_back("clean"); break;
        case Operation::Test: a.push_back("test"); push_profile(a, params.build_type); break;
        case Operation::AddDependency: {
            if (params.dependency.empty()) throw InvalidOperationError("cargo add: dependency name required");
            a.push_back("add");
            a.push_back(params.version.empty() ? params.dependency : params.dependency + "@" + params.version);
            if (!params.features.empty()) {
                std::string joined;
                for (size_t i=0;i<params.features.size();++i) { if (i) joined += ','; joined += params.features[i]; }
                a.push_back("--features"); a.push_back(joined);
            }
            break;
        }
        case Operation::RemoveDependency:
            if (params.dependency.empty()) throw InvalidOperationError("cargo remove: dependency name required");
            a.push_back("remove"); a.push_back(params.dependency);
            break;
        case Operation::CrossTargetBuild:
            if (params.target.empty()) throw InvalidOperationError("cargo: cross-target build requires a target triple");
            a.push_back("build"); a.push_back("--target"); a.push_back(params.target);
            push_profile(a, params.build_type);
            break;
    }
    a.insert(a.end(), params.extra_args.begin(), params.extra_args.end());
    inv.cwd = project;
    inv.env = params.env;
    inv.family = family();
    return inv;
}

std::vector<std::string> CargoAdapter::artifacts(const std::string& project, Operation op, const OperationParams& params) const {
    if (op == Operation::Build) return cargo_artifacts(project, "", params.build_type);
    if (op == Operation::CrossTargetBuild) return cargo_artifacts(project, params.target, params.build_type);
    return {};
}

} // namespace ideshell
