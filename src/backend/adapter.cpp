/*
 * Backend adapters - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/backend/adapter.hpp>

namespace ideshell {

const char* to_string(BackendType type) {
    switch (type) {
        case BackendType::ManagedBuildTool: return "MANAGED_BUILD_TOOL";
        case BackendType::PackageManager: return "PACKAGE_MANAGER";
        case BackendType::Hybrid: return "HYBRID";
        case BackendType::NativeDriverExperimental: return "NATIVE_DRIVER_EXPERIMENTAL";
    }
    return "MANAGED_BUILD_TOOL";
}

std::optional<BackendType> parse_backend_type(const std::string& name) {
    if (name=="gradle"||name=="managed"||name=="MANAGED_BUILD_TOOL") return BackendType::ManagedBuildTool;
    if (name=="cargo"||name=="package"||name=="PACKAGE_MANAGER") return BackendType::PackageManager;
    if (name=="hybrid"||name=="HYBRID") return BackendType::Hybrid;
    if (name=="native"||name=="NATIVE_DRIVER_EXPERIMENTAL") return BackendType::NativeDriverExperimental;
    return std::nullopt;
}

const char* to_string(Operation op) {
    switch (op) {
        case Operation::Build: return "build";
        case Operation::Clean: return "clean";
        case Operation::Test: return "test";
        case Operation::AddDependency: return "add";
        case Operation::RemoveDependency: return "remove";
        case Operation::CrossTargetBuild: return "cross";
    }
    return "build";
}

std::optional<Operation> parse_operation(const std::string& name) {
    for (auto op : {Operation::Build, Operation::Clean, Operation::Test, Operation::AddDependency,
                    Operation::RemoveDependency, Operation::CrossTargetBuild})
        if (name == to_string(op)) return op;
    return std::nullopt;
}

std::string describe(const Invocation& inv) {
    std::string out;
    for (size_t i=0;i<inv.argv.size();++i) { if (i) out += ' '; out += inv.argv[i]; }
    return out;
}

std::unique_ptr<BackendAdapter> make_adapter(BackendFamily family, const Config& cfg) {
    switch (family) {
        case BackendFamily::ManagedBuildTool: return std::make_unique<GradleAdapter>(cfg);
        case BackendFamily::PackageManager: return std::make_unique<CargoAdapter>(cfg);
        case BackendFamily::NativeDriver: return std::make_unique<NativeDriverAdapter>(cfg);
        case BackendFamily::Shell: break;
    }
    return nullptr;
}

} // namespace ideshell
