#include "toolchain/toolchain.hpp"

#include "core/fs_utils.hpp"

#include <cctype>
#include <string_view>

namespace fs = std::filesystem;

namespace modforge::toolchain {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeError;

std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

} // namespace

bool ResolveRuntimeHome(const std::optional<fs::path>& override_home, const char* env_value,
                        fs::path& home, core::errors::Error& error) {
  error.Clear();
  home.clear();

  std::string source;
  fs::path candidate;
  if (override_home.has_value() && !override_home->empty()) {
    source = "--java-home";
    candidate = *override_home;
  } else if (env_value != nullptr && env_value[0] != '\0') {
    source = "JAVA_HOME";
    candidate = fs::path(env_value);
  } else {
    error = MakeError(ErrorKind::kToolchainNotFound,
                      "cannot find a runtime home: pass --java-home or set JAVA_HOME");
    return false;
  }

  if (!core::DirectoryExists(candidate)) {
    error = MakeError(ErrorKind::kToolchainNotFound,
                      source + " is set to a directory which does not exist: " +
                          candidate.string());
    return false;
  }

  home = core::AbsolutePath(candidate);
  return true;
}

ToolchainHandle MakeToolchain(const fs::path& home) {
  const fs::path bin = core::AbsolutePath(home) / "bin";
  ToolchainHandle handle;
  handle.home = core::AbsolutePath(home);
  handle.compiler = bin / "javac";
  handle.packager = bin / "jmod";
  handle.linker = bin / "jlink";
  return handle;
}

bool ProbeToolchainVersion(process::IProcessRunner& runner, const ToolchainHandle& toolchain,
                           std::string& version, core::errors::Error& error) {
  version.clear();
  error.Clear();

  process::ProcessRequest request;
  request.executable = toolchain.linker;
  request.arguments = {"--version"};
  request.merge_stderr = false;

  process::ProcessResult result;
  if (!runner.Run(request, result, error)) {
    return false;
  }

  const std::string trimmed = Trim(result.output);
  if (result.exit_code != 0) {
    error = MakeError(ErrorKind::kInvalidVersion,
                      "'" + process::DescribeCommand(request) + "' exited with code " +
                          std::to_string(result.exit_code));
    error.tool_output = core::errors::TailLines(result.lines);
    return false;
  }
  if (trimmed.empty()) {
    error = MakeError(ErrorKind::kInvalidVersion,
                      "invalid value: '" + result.output + "' reported by '" +
                          process::DescribeCommand(request) + "'");
    return false;
  }

  version = trimmed;
  return true;
}

} // namespace modforge::toolchain
