#include "pipeline/pipeline_stage.hpp"

#include "core/fs_utils.hpp"

namespace modforge::pipeline {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeError;

bool FailStage(const PipelineStage& stage, ErrorKind kind, std::string message,
               core::errors::Error& error, const process::ProcessResult* process = nullptr) {
  error = MakeError(kind, std::move(message));
  error.stage = stage.name;
  if (process != nullptr) {
    error.tool_output = core::errors::TailLines(process->lines);
  }
  return false;
}

} // namespace

const char* ToString(PipelineState state) {
  switch (state) {
  case PipelineState::kIdle:
    return "idle";
  case PipelineState::kDescribing:
    return "describe";
  case PipelineState::kCompilingDescriptor:
    return "compile";
  case PipelineState::kAssemblingModuleArchive:
    return "assemble";
  case PipelineState::kPackagingModule:
    return "package";
  case PipelineState::kLinkingImage:
    return "link";
  case PipelineState::kDone:
    return "done";
  case PipelineState::kFailed:
    return "failed";
  }

  return "unknown";
}

bool ExecuteStage(const PipelineStage& stage, process::IProcessRunner& runner,
                  StageOutcome& outcome, core::errors::Error& error) {
  outcome = StageOutcome{};
  error.Clear();

  if (stage.command.has_value() == static_cast<bool>(stage.action)) {
    return FailStage(stage, ErrorKind::kStageSequence,
                     "stage must define exactly one of a command or an in-process action",
                     error);
  }
  if (stage.required_output.empty()) {
    return FailStage(stage, ErrorKind::kStageSequence, "stage declares no required output",
                     error);
  }

  for (const auto& input : stage.required_inputs) {
    if (!core::RegularFileExists(input)) {
      return FailStage(stage, ErrorKind::kStageSequence,
                       "required input artifact is missing: " + input.string(), error);
    }
  }

  if (stage.command.has_value()) {
    const process::ProcessRequest& request = *stage.command;
    const std::string command_line = process::DescribeCommand(request);
    outcome.ran_tool = true;

    if (!runner.Run(request, outcome.process, error)) {
      error.stage = stage.name;
      return false;
    }
    if (outcome.process.timed_out) {
      return FailStage(stage, stage.failure_kind,
                       "'" + command_line + "' timed out after " +
                           std::to_string(request.timeout.count()) + "s and was killed",
                       error, &outcome.process);
    }
    if (outcome.process.exit_code != 0) {
      return FailStage(stage, stage.failure_kind,
                       "'" + command_line + "' exited with code " +
                           std::to_string(outcome.process.exit_code),
                       error, &outcome.process);
    }
    if (!core::RegularFileExists(stage.required_output)) {
      return FailStage(stage, stage.failure_kind,
                       "'" + command_line + "' reported success but did not produce " +
                           stage.required_output.string(),
                       error, &outcome.process);
    }
    return true;
  }

  if (!stage.action(error)) {
    if (error.kind == ErrorKind::kNone) {
      error.kind = stage.failure_kind;
    }
    if (error.stage.empty()) {
      error.stage = stage.name;
    }
    return false;
  }
  if (!core::RegularFileExists(stage.required_output)) {
    return FailStage(stage, stage.failure_kind,
                     "stage completed but did not produce " + stage.required_output.string(),
                     error);
  }
  return true;
}

} // namespace modforge::pipeline
