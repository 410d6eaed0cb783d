#include "archive/archive_scanner.hpp"

#include "archive/zip_format.hpp"
#include "archive/zip_reader.hpp"

#include <algorithm>

namespace modforge::archive {

std::optional<std::string> PackageNameFromEntry(std::string_view entry_name) {
  if (!IsClassEntryName(entry_name)) {
    return std::nullopt;
  }

  const std::size_t last_separator = entry_name.rfind('/');
  if (last_separator == std::string_view::npos) {
    return std::nullopt;
  }

  std::string package(entry_name.substr(0, last_separator));
  std::replace(package.begin(), package.end(), '/', '.');
  return package;
}

bool ScanArchivePackages(const std::filesystem::path& archive_path, PackageSet& packages,
                         ScanReport& report, core::errors::Error& error) {
  packages.clear();
  report = ScanReport{};
  error.Clear();

  ZipReader reader;
  std::string read_error;
  if (!reader.Open(archive_path, read_error)) {
    error = core::errors::MakeError(core::errors::ErrorKind::kArchiveRead, read_error);
    return false;
  }

  report.total_entries = reader.Entries().size();
  for (const auto& entry : reader.Entries()) {
    if (!IsClassEntryName(entry.name)) {
      continue;
    }
    ++report.class_entries;

    std::optional<std::string> package = PackageNameFromEntry(entry.name);
    if (!package.has_value()) {
      ++report.default_package_classes;
      continue;
    }
    packages.insert(std::move(*package));
  }

  return true;
}

} // namespace modforge::archive
