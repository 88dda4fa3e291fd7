/*
 * Backend adapters - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ide-shell/classify/classifier.hpp>
#include <ide-shell/config/config.hpp>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ideshell {

enum class BackendType { ManagedBuildTool, PackageManager, Hybrid, NativeDriverExperimental };

const char* to_string(BackendType type);
std::optional<BackendType> parse_backend_type(const std::string& name); // "gradle", "cargo", "hybrid", "native" or the enum spelling

enum class Operation { Build, Clean, Test, AddDependency, RemoveDependency, CrossTargetBuild };

const char* to_string(Operation op);
std::optional<Operation> parse_operation(const std::string& name);

// Requested operation is not defined for the backend, or lacks a parameter.
class InvalidOperationError : public std::runtime_error {
public:
    explicit InvalidOperationError(const std::string& what) : std::runtime_error(what) {}
};

struct OperationParams {
    std::string build_type = "debug";          // debug, release, or a custom task/profile
    std::vector<std::string> extra_args;       // appended verbatim
    std::string dependency;                    // add/remove dependency
    std::string version;                       // optional for add
    std::vector<std::string> features;         // optional for add
    std::string target;                        // target triple for cross builds
    std::map<std::string,std::string> env;     // toolchain environment overrides
};

// What an adapter hands to the process executor.
struct Invocation {
    std::vector<std::string> argv;
    std::string cwd;
    std::map<std::string,std::string> env;
    BackendFamily family = BackendFamily::Shell; // rule table for the output
};

std::string describe(const Invocation& inv); // argv joined with spaces

// Maps operations to toolchain invocations. Never spawns anything.
class BackendAdapter {
public:
    virtual ~BackendAdapter() = default;
    virtual BackendFamily family() const = 0;
    virtual const char* name() const = 0;
    // Throws InvalidOperationError for unsupported operations or missing parameters.
    virtual Invocation invocation(const std::string& project, Operation op, const OperationParams& params) const = 0;
    // Files a successful run of op left behind, sorted.
    virtual std::vector<std::string> artifacts(const std::string& project, Operation op, const OperationParams& params) const = 0;
};

// Gradle: ./gradlew when the project ships a wrapper, the configured program otherwise.
class GradleAdapter : public BackendAdapter {
public:
    explicit GradleAdapter(const Config& cfg) : m_program(cfg.gradle_program), m_extra(cfg.gradle_extra_args) {}
    BackendFamily family() const override { return BackendFamily::ManagedBuildTool; }
    const char* name() const override { return "gradle"; }
    Invocation invocation(const std::string& project, Operation op, const OperationParams& params) const override;
    std::vector<std::string> artifacts(const std::string& project, Operation op, const OperationParams& params) const override;
private:
    std::string m_program;
    std::vector<std::string> m_extra;
};

class CargoAdapter : public BackendAdapter {
public:
    explicit CargoAdapter(const Config& cfg) : m_program(cfg.cargo_program) {}
    BackendFamily family() const override { return BackendFamily::PackageManager; }
    const char* name() const override { return "cargo"; }
    Invocation invocation(const std::string& project, Operation op, const OperationParams& params) const override;
    std::vector<std::string> artifacts(const std::string& project, Operation op, const OperationParams& params) const override;
private:
    std::string m_program;
};

// Experimental native driver; speaks the cargo command line with short diagnostics.
class NativeDriverAdapter : public BackendAdapter {
public:
    explicit NativeDriverAdapter(const Config& cfg) : m_program(cfg.native_driver_program) {}
    BackendFamily family() const override { return BackendFamily::NativeDriver; }
    const char* name() const override { return "native"; }
    Invocation invocation(const std::string& project, Operation op, const OperationParams& params) const override;
    std::vector<std::string> artifacts(const std::string& project, Operation op, const OperationParams& params) const override;
private:
    std::string m_program;
};

std::unique_ptr<BackendAdapter> make_adapter(BackendFamily family, const Config& cfg);

} // namespace ideshell
