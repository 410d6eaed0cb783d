#pragma once

#include "core/errors/error.hpp"
#include "process/process_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace modforge::toolchain {

// Absolute paths of the three tools the pipeline drives. Resolved once at
// startup and never mutated afterwards.
struct ToolchainHandle {
  std::filesystem::path home;
  std::filesystem::path compiler; // <home>/bin/javac
  std::filesystem::path packager; // <home>/bin/jmod
  std::filesystem::path linker;   // <home>/bin/jlink
};

// Picks the runtime home: `override_home` when set, otherwise `env_value`
// (the caller passes the JAVA_HOME environment value, or nullptr when unset).
// The chosen value must name an existing directory.
bool ResolveRuntimeHome(const std::optional<std::filesystem::path>& override_home,
                        const char* env_value, std::filesystem::path& home,
                        core::errors::Error& error);

ToolchainHandle MakeToolchain(const std::filesystem::path& home);

// Runs `jlink --version` and returns its trimmed stdout. The packaging stage
// stamps this string on the module unit.
bool ProbeToolchainVersion(process::IProcessRunner& runner, const ToolchainHandle& toolchain,
                           std::string& version, core::errors::Error& error);

} // namespace modforge::toolchain
