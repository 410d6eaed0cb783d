#pragma once

#include "core/errors/error.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace modforge::archive {

// Distinct dotted package names; std::set iteration gives the ascending
// lexicographic order descriptor rendering relies on.
using PackageSet = std::set<std::string>;

// Maps a class entry path to its package, e.g. `a/b/C.class` -> `a.b`.
// Returns nullopt for non-class entries and for classes in the default package
// (no separator), which a named module cannot export.
std::optional<std::string> PackageNameFromEntry(std::string_view entry_name);

struct ScanReport {
  std::size_t total_entries = 0;
  std::size_t class_entries = 0;
  std::size_t default_package_classes = 0;
};

// Reads the archive's central directory and collects the package of every
// class entry. Any open or parse failure is an ArchiveReadError and leaves
// `packages` empty.
bool ScanArchivePackages(const std::filesystem::path& archive_path, PackageSet& packages,
                         ScanReport& report, core::errors::Error& error);

} // namespace modforge::archive
