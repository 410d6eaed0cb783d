#include "descriptor/descriptor_synthesizer.hpp"

#include "core/fs_utils.hpp"

namespace fs = std::filesystem;

namespace modforge::descriptor {

std::string RenderModuleDescriptor(std::string_view module_name,
                                   const archive::PackageSet& packages) {
  std::string text = "module ";
  text += module_name;
  text += " {";
  for (const auto& package : packages) {
    text += "\n    exports ";
    text += package;
    text += ';';
  }
  text += "\n}";
  return text;
}

bool WriteModuleDescriptor(const fs::path& scratch_dir, std::string_view module_name,
                           const archive::PackageSet& packages, fs::path& written_path,
                           core::errors::Error& error) {
  error.Clear();
  written_path.clear();

  const auto fail = [&error](std::string message) {
    error = core::errors::MakeError(core::errors::ErrorKind::kDescriptorWrite, std::move(message));
    return false;
  };

  if (module_name.empty()) {
    return fail("module name cannot be empty");
  }
  if (packages.empty()) {
    return fail("no exportable packages found; refusing to write an empty module descriptor");
  }

  std::string io_error;
  if (!core::ResetDirectory(scratch_dir, io_error)) {
    return fail("unable to prepare scratch directory: " + io_error);
  }

  const fs::path out_path = scratch_dir / kDescriptorSourceName;
  if (!core::WriteTextFileAtomic(out_path, RenderModuleDescriptor(module_name, packages),
                                 io_error)) {
    return fail("unable to write " + out_path.string() + ": " + io_error);
  }

  if (!core::RegularFileExists(out_path)) {
    return fail("module descriptor missing after write: " + out_path.string());
  }

  written_path = out_path;
  return true;
}

} // namespace modforge::descriptor
