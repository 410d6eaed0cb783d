#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modforge::core::errors {

// Every kind is fatal. Nothing in the pipeline retries or degrades; the first
// populated Error aborts the run and surfaces to the CLI.
enum class ErrorKind {
  kNone = 0,
  kArgument,
  kToolchainNotFound,
  kArchiveRead,
  kDescriptorWrite,
  kProcessLaunch,
  kCompileFailed,
  kAssemblyWrite,
  kPackagingFailed,
  kLinkFailed,
  kInvalidVersion,
  kOutputDirectory,
  kStageSequence,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "NoError";
  case ErrorKind::kArgument:
    return "ArgumentError";
  case ErrorKind::kToolchainNotFound:
    return "ToolchainNotFoundError";
  case ErrorKind::kArchiveRead:
    return "ArchiveReadError";
  case ErrorKind::kDescriptorWrite:
    return "DescriptorWriteError";
  case ErrorKind::kProcessLaunch:
    return "ProcessLaunchError";
  case ErrorKind::kCompileFailed:
    return "CompileFailed";
  case ErrorKind::kAssemblyWrite:
    return "AssemblyWriteError";
  case ErrorKind::kPackagingFailed:
    return "PackagingFailed";
  case ErrorKind::kLinkFailed:
    return "LinkFailed";
  case ErrorKind::kInvalidVersion:
    return "InvalidVersionError";
  case ErrorKind::kOutputDirectory:
    return "OutputDirectoryError";
  case ErrorKind::kStageSequence:
    return "StageSequenceError";
  }

  return "UnknownError";
}

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  // Name of the pipeline stage that failed, empty outside the sequencer.
  std::string stage;
  // Tail of the external tool's merged output, empty for in-process failures.
  std::string tool_output;

  void Clear() {
    *this = Error{};
  }
};

inline Error MakeError(ErrorKind kind, std::string message) {
  Error error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

constexpr std::size_t kToolOutputTailLines = 20;

// Keeps the last `max_lines` lines so error text stays readable for tools that
// print thousands of lines before failing.
inline std::string TailLines(const std::vector<std::string>& lines,
                             std::size_t max_lines = kToolOutputTailLines) {
  const std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
  std::string tail;
  for (std::size_t i = first; i < lines.size(); ++i) {
    tail += lines[i];
    tail.push_back('\n');
  }
  return tail;
}

inline std::string FormatError(const Error& error) {
  std::string text = ToString(error.kind);
  if (!error.stage.empty()) {
    text += " (stage " + error.stage + ")";
  }
  text += ": " + error.message;
  if (!error.tool_output.empty()) {
    text += "\ntool output (tail):\n" + error.tool_output;
    if (text.back() == '\n') {
      text.pop_back();
    }
  }
  return text;
}

} // namespace modforge::core::errors
