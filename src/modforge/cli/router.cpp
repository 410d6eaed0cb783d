#include "modforge/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "pipeline/image_pipeline.hpp"
#include "process/process_runner.hpp"
#include "toolchain/toolchain.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>

namespace fs = std::filesystem;

namespace modforge::cli {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeError;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);

bool IsBlank(std::string_view value) {
  for (const char c : value) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               core::errors::Error& error) {
  const std::string_view option = args[i];
  if (i + 1 >= args.size()) {
    error = MakeError(ErrorKind::kArgument, "no value specified for " + std::string(option));
    return false;
  }
  const std::string_view raw = args[i + 1];
  if (IsBlank(raw)) {
    error = MakeError(ErrorKind::kArgument,
                      "invalid value for " + std::string(option) + ": '" + std::string(raw) + "'");
    return false;
  }
  value = std::string(raw);
  ++i;
  return true;
}

bool ParseTimeoutSeconds(const std::string& raw, std::chrono::seconds& timeout,
                         core::errors::Error& error) {
  long long seconds = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, seconds);
  if (ec != std::errc() || ptr != end || seconds < 0) {
    error = MakeError(ErrorKind::kArgument,
                      "invalid --tool-timeout-sec '" + raw + "' (expected a non-negative integer)");
    return false;
  }
  timeout = std::chrono::seconds(seconds);
  return true;
}

void ReportFailure(const core::errors::Error& error) {
  std::cerr << '\n' << core::errors::FormatError(error) << "\n\n";
  PrintUsage(std::cerr);
}

} // namespace

void PrintUsage(std::ostream& out) {
  out << "modforge - runtime image builder\n"
      << "Generates a custom runtime image whose single java.base module exports every\n"
      << "package of the given android.jar. The image backs code completion and analysis\n"
      << "against the Android API surface.\n"
      << "\n"
      << "usage:\n"
      << "  modforge --android-jar <path> [--output-dir <dir>] [options]\n"
      << "\n"
      << "options:\n"
      << "  -a, --android-jar <path>      android.jar whose classes form the java.base module.\n"
      << "                                REQUIRED.\n"
      << "  -o, --output-dir <dir>        Directory the runtime image is linked into. This\n"
      << "                                directory will be DELETED before linking.\n"
      << "                                Default: ./compiler_module\n"
      << "      --java-home <dir>         Runtime home providing bin/javac, bin/jmod and\n"
      << "                                bin/jlink. Default: $JAVA_HOME\n"
      << "      --scratch-dir <dir>       Directory for intermediate artifacts. Cleared on\n"
      << "                                every run. Default: ./temp\n"
      << "      --module-name <name>      Module to synthesize. Default: java.base\n"
      << "      --target-platform <tag>   Platform tag stamped on the module unit.\n"
      << "                                Default: android\n"
      << "      --tool-timeout-sec <n>    Kill a tool that runs longer than n seconds.\n"
      << "                                Default: 0 (wait indefinitely)\n"
      << "      --log-level <level>       " << core::logging::ExpectedLogLevelList()
      << ". Default: info\n"
      << "  -h, --help                    Print this help.\n"
      << "\n"
      << "Runs sharing a scratch or output directory corrupt each other; run one at a time.\n";
}

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     core::errors::Error& error) {
  error.Clear();
  bool has_android_jar = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;

    if (token == "--help" || token == "-h") {
      options.show_help = true;
      continue;
    }
    if (token == "--android-jar" || token == "-a") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.android_jar = fs::path(value);
      has_android_jar = true;
      continue;
    }
    if (token == "--output-dir" || token == "-o") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--java-home") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.java_home = fs::path(value);
      continue;
    }
    if (token == "--scratch-dir") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.scratch_dir = fs::path(value);
      continue;
    }
    if (token == "--module-name") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.module_name = value;
      continue;
    }
    if (token == "--target-platform") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.target_platform = value;
      continue;
    }
    if (token == "--tool-timeout-sec") {
      if (!TakeValue(args, i, value, error) ||
          !ParseTimeoutSeconds(value, options.tool_timeout, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      std::string level_error;
      if (!core::logging::ParseLogLevel(value, options.log_level, level_error)) {
        error = MakeError(ErrorKind::kArgument, level_error);
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = MakeError(ErrorKind::kArgument, "unknown option: " + std::string(token));
      return false;
    }
    error = MakeError(ErrorKind::kArgument, "unexpected argument: " + std::string(token));
    return false;
  }

  if (options.show_help) {
    return true;
  }
  if (!has_android_jar) {
    error = MakeError(ErrorKind::kArgument, "android.jar file must be specified!");
    return false;
  }
  if (!core::RegularFileExists(options.android_jar)) {
    error = MakeError(ErrorKind::kArgument,
                      "android.jar file does not exist or is not a regular file: " +
                          options.android_jar.string());
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  core::errors::Error error;
  if (!ParseCliOptions(args, options, error)) {
    ReportFailure(error);
    return kExitFailure;
  }
  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);

  fs::path java_home;
  if (!toolchain::ResolveRuntimeHome(options.java_home, std::getenv("JAVA_HOME"), java_home,
                                     error)) {
    ReportFailure(error);
    return kExitFailure;
  }

  process::PosixProcessRunner runner;
  pipeline::PipelineConfig config;
  config.toolchain = toolchain::MakeToolchain(java_home);
  if (!toolchain::ProbeToolchainVersion(runner, config.toolchain, config.module_version, error)) {
    ReportFailure(error);
    return kExitFailure;
  }

  config.archive_path = options.android_jar;
  config.output_dir = options.output_dir;
  config.scratch_dir = options.scratch_dir;
  config.module_name = options.module_name;
  config.target_platform = options.target_platform;
  config.tool_timeout = options.tool_timeout;

  logger.Info("generating compiler module",
              {{"android_jar", options.android_jar.string()},
               {"output_dir", options.output_dir.string()},
               {"java_home", config.toolchain.home.string()},
               {"jlink_version", config.module_version}});

  pipeline::ImagePipeline image_pipeline(std::move(config), runner, logger);
  pipeline::PipelineResult result;
  if (!image_pipeline.Run(result, error)) {
    ReportFailure(error);
    return kExitFailure;
  }

  std::cout << "runtime image generated: " << image_pipeline.Config().output_dir.string() << '\n';
  return kExitSuccess;
}

} // namespace modforge::cli
