#pragma once

#include "archive/archive_scanner.hpp"
#include "core/errors/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace modforge::descriptor {

inline constexpr std::string_view kDescriptorSourceName = "module-info.java";
inline constexpr std::string_view kDescriptorClassName = "module-info.class";

// Renders `module <name> {` followed by one `exports <pkg>;` line per package,
// in set order, and a closing brace. No trailing newline.
std::string RenderModuleDescriptor(std::string_view module_name,
                                   const archive::PackageSet& packages);

// Force-clears `scratch_dir`, recreates it and writes the rendered descriptor
// to `<scratch_dir>/module-info.java`. The file must exist once the write
// returns, otherwise the call fails even if no I/O error was reported.
bool WriteModuleDescriptor(const std::filesystem::path& scratch_dir,
                           std::string_view module_name, const archive::PackageSet& packages,
                           std::filesystem::path& written_path, core::errors::Error& error);

} // namespace modforge::descriptor
