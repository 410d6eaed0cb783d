#include "archive/module_archive_assembler.hpp"

#include "archive/zip_format.hpp"
#include "archive/zip_reader.hpp"
#include "archive/zip_writer.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace modforge::archive {

namespace {

bool ReadBinaryFile(const fs::path& path, std::string& bytes, std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open compiled descriptor: " + path.string();
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(in_file), std::istreambuf_iterator<char>());
  if (in_file.bad()) {
    error = "failed while reading compiled descriptor: " + path.string();
    return false;
  }
  return true;
}

} // namespace

bool AssembleModuleArchive(const AssemblyRequest& request, AssemblyReport& report,
                           core::errors::Error& error) {
  report = AssemblyReport{};
  error.Clear();

  const auto fail = [&error](std::string message) {
    error = core::errors::MakeError(core::errors::ErrorKind::kAssemblyWrite, std::move(message));
    return false;
  };

  std::string io_error;
  std::string descriptor_bytes;
  if (!ReadBinaryFile(request.compiled_descriptor, descriptor_bytes, io_error)) {
    return fail(io_error);
  }
  const std::string descriptor_entry_name = request.compiled_descriptor.filename().string();

  ZipReader source;
  if (!source.Open(request.source_archive, io_error)) {
    return fail(io_error);
  }

  ZipWriter writer;
  if (!writer.Open(request.output_archive, io_error)) {
    return fail(io_error);
  }
  if (!writer.AddStoredEntry(descriptor_entry_name, descriptor_bytes, io_error)) {
    return fail(io_error);
  }

  for (const auto& entry : source.Entries()) {
    if (!IsClassEntryName(entry.name)) {
      ++report.entries_dropped;
      continue;
    }
    if (entry.name == descriptor_entry_name) {
      report.source_descriptor_skipped = true;
      ++report.entries_dropped;
      continue;
    }
    if (!writer.CopyEntryFrom(source, entry, io_error)) {
      return fail(io_error);
    }
    ++report.class_entries_copied;
  }

  if (!writer.Finish(io_error)) {
    return fail(io_error);
  }
  return true;
}

} // namespace modforge::archive
