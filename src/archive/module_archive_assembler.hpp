#pragma once

#include "core/errors/error.hpp"

#include <cstddef>
#include <filesystem>

namespace modforge::archive {

struct AssemblyRequest {
  std::filesystem::path compiled_descriptor;
  std::filesystem::path source_archive;
  std::filesystem::path output_archive;
};

struct AssemblyReport {
  std::size_t class_entries_copied = 0;
  std::size_t entries_dropped = 0;
  bool source_descriptor_skipped = false;
};

// Builds the module archive consumed by the packaging tool:
// 1) the compiled descriptor, stored under its own file name
// 2) every class entry of `source_archive`, payload copied verbatim in source
//    order
//
// Resources, signatures and other metadata are dropped. A class entry that
// collides with the descriptor's name is skipped so the output holds exactly
// one descriptor. Failures are AssemblyWriteErrors and leave nothing at
// `output_archive`.
bool AssembleModuleArchive(const AssemblyRequest& request, AssemblyReport& report,
                           core::errors::Error& error);

} // namespace modforge::archive
