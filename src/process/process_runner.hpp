#pragma once

#include "core/errors/error.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace modforge::process {

// Receives each output line (without its terminator) while the child runs.
using LineSink = std::function<void(std::string_view line)>;

struct ProcessRequest {
  std::filesystem::path executable;
  std::vector<std::string> arguments;
  // Route the child's stderr into the same pipe as stdout.
  bool merge_stderr = true;
  // Zero waits for as long as the child runs.
  std::chrono::seconds timeout{0};
  LineSink on_line;
};

struct ProcessResult {
  // Exit status of a normally terminated child, -1 when killed by a signal.
  int exit_code = -1;
  bool timed_out = false;
  std::string output;
  std::vector<std::string> lines;
};

// Renders `executable arg1 arg2 ...` for logs and error messages.
std::string DescribeCommand(const ProcessRequest& request);

// Runs one external executable to completion.
//
// Contract:
// - Returns false with a ProcessLaunchError only when the executable could
//   not be started. A started child that exits non-zero is a successful call;
//   callers interpret `result.exit_code`.
// - Output is drained for the whole life of the child, so a chatty tool can
//   never block on a full pipe.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  virtual bool Run(const ProcessRequest& request, ProcessResult& result,
                   core::errors::Error& error) = 0;
};

// fork/execv implementation. Each call owns exactly one drain thread that is
// joined before the call returns.
class PosixProcessRunner final : public IProcessRunner {
public:
  bool Run(const ProcessRequest& request, ProcessResult& result,
           core::errors::Error& error) override;
};

} // namespace modforge::process
