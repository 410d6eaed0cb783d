#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace modforge::cli {

// Everything the command line can set. Defaults mirror the documented usage.
struct CliOptions {
  std::filesystem::path android_jar;
  std::filesystem::path output_dir = "./compiler_module";
  std::filesystem::path scratch_dir = "./temp";
  std::optional<std::filesystem::path> java_home;
  std::string module_name = "java.base";
  std::string target_platform = "android";
  std::chrono::seconds tool_timeout{0};
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool show_help = false;
};

// Parses arguments (program name excluded). Any malformed or unknown input,
// and a missing or non-file --android-jar, is an ArgumentError.
bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     core::errors::Error& error);

void PrintUsage(std::ostream& out);

// Process entrypoint contract:
//   0 => runtime image linked and its modules file exists
//   1 => any failure; the error and full usage text go to stderr
int Dispatch(int argc, char** argv);

} // namespace modforge::cli
