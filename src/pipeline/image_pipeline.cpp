#include "pipeline/image_pipeline.hpp"

#include "archive/module_archive_assembler.hpp"
#include "core/fs_utils.hpp"
#include "descriptor/descriptor_synthesizer.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace modforge::pipeline {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeError;

// jlink treats the synthetic descriptor as a real system image unless this
// plugin is off; its assumptions do not hold for a one-module image.
constexpr std::string_view kSystemModulesPlugin = "system-modules";

PipelineConfig Normalize(PipelineConfig config) {
  config.archive_path = core::AbsolutePath(config.archive_path);
  config.output_dir = core::AbsolutePath(config.output_dir);
  config.scratch_dir = core::AbsolutePath(config.scratch_dir);
  return config;
}

// Clearing a directory removes everything below it, so neither the output nor
// the scratch directory may hold the input archive or the working directory,
// and the output directory may not hold the scratch directory.
bool CheckDirectoryLayout(const PipelineConfig& config, core::errors::Error& error) {
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);

  const auto guard = [&](const fs::path& dir, std::string_view role, ErrorKind kind) {
    std::string conflict;
    if (core::PathIsWithin(config.archive_path, dir)) {
      conflict = "input archive " + config.archive_path.string();
    } else if (!ec && core::PathIsWithin(cwd, dir)) {
      conflict = "working directory " + cwd.string();
    } else if (kind == ErrorKind::kOutputDirectory &&
               core::PathIsWithin(config.scratch_dir, dir)) {
      conflict = "scratch directory " + config.scratch_dir.string();
    }
    if (conflict.empty()) {
      return true;
    }
    error = MakeError(kind, "refusing to clear " + std::string(role) + " " + dir.string() +
                                ": it contains the " + conflict);
    return false;
  };

  return guard(config.output_dir, "output directory", ErrorKind::kOutputDirectory) &&
         guard(config.scratch_dir, "scratch directory", ErrorKind::kDescriptorWrite);
}

} // namespace

StageArtifacts ResolveArtifacts(const PipelineConfig& config) {
  const fs::path scratch = core::AbsolutePath(config.scratch_dir);
  StageArtifacts artifacts;
  artifacts.descriptor_source = scratch / descriptor::kDescriptorSourceName;
  artifacts.compiled_descriptor = scratch / descriptor::kDescriptorClassName;
  artifacts.module_archive = scratch / (config.module_name + "-module.jar");
  artifacts.module_unit = scratch / (config.module_name + ".jmod");
  artifacts.image_modules_file = core::AbsolutePath(config.output_dir) / "lib" / "modules";
  return artifacts;
}

process::ProcessRequest BuildCompileCommand(const PipelineConfig& config,
                                            const StageArtifacts& artifacts) {
  process::ProcessRequest request;
  request.executable = config.toolchain.compiler;
  request.arguments = {
      "--system=none",
      "--patch-module=" + config.module_name + "=" +
          core::AbsolutePath(config.archive_path).string(),
      "-d",
      artifacts.descriptor_source.parent_path().string(),
      artifacts.descriptor_source.string(),
  };
  request.timeout = config.tool_timeout;
  return request;
}

process::ProcessRequest BuildPackageCommand(const PipelineConfig& config,
                                            const StageArtifacts& artifacts) {
  process::ProcessRequest request;
  request.executable = config.toolchain.packager;
  request.arguments = {
      "create",
      "--module-version",
      config.module_version,
      "--target-platform",
      config.target_platform,
      "--class-path",
      artifacts.module_archive.string(),
      artifacts.module_unit.string(),
  };
  request.timeout = config.tool_timeout;
  return request;
}

process::ProcessRequest BuildLinkCommand(const PipelineConfig& config,
                                         const StageArtifacts& artifacts) {
  process::ProcessRequest request;
  request.executable = config.toolchain.linker;
  request.arguments = {
      "--module-path",
      artifacts.module_unit.string(),
      "--add-modules",
      config.module_name,
      "--output",
      core::AbsolutePath(config.output_dir).string(),
      "--disable-plugin",
      std::string(kSystemModulesPlugin),
  };
  request.timeout = config.tool_timeout;
  return request;
}

ImagePipeline::ImagePipeline(PipelineConfig config, process::IProcessRunner& runner,
                             core::logging::Logger& logger)
    : config_(Normalize(std::move(config))),
      artifacts_(ResolveArtifacts(config_)),
      runner_(runner),
      logger_(logger) {}

void ImagePipeline::Transition(PipelineState next) {
  state_ = next;
  logger_.SetStage(ToString(next));
  logger_.Debug("pipeline state changed");
}

bool ImagePipeline::Fail(core::errors::Error& error) {
  Transition(PipelineState::kFailed);
  logger_.Error("pipeline aborted",
                {{"error_kind", core::errors::ToString(error.kind)},
                 {"failed_stage", error.stage},
                 {"error", error.message}});
  return false;
}

process::LineSink ImagePipeline::ToolLineSink(const fs::path& executable) {
  const std::string tool = executable.filename().string();
  return [this, tool](std::string_view line) {
    logger_.Info("tool output", {{"tool", tool}, {"line", line}});
  };
}

bool ImagePipeline::Describe(PipelineResult& result, core::errors::Error& error) {
  if (!CheckDirectoryLayout(config_, error)) {
    error.stage = ToString(PipelineState::kDescribing);
    return false;
  }

  std::string io_error;
  if (!core::RemoveDirectoryTree(config_.output_dir, io_error)) {
    error = MakeError(ErrorKind::kOutputDirectory,
                      "unable to clear output directory before linking: " + io_error);
    error.stage = ToString(PipelineState::kDescribing);
    return false;
  }

  logger_.Info("generating module descriptor",
               {{"module", config_.module_name}, {"archive", config_.archive_path.string()}});

  archive::ScanReport report;
  if (!archive::ScanArchivePackages(config_.archive_path, result.packages, report, error)) {
    error.stage = ToString(PipelineState::kDescribing);
    return false;
  }
  logger_.Info("archive scanned", {{"packages", std::to_string(result.packages.size())},
                                   {"class_entries", std::to_string(report.class_entries)},
                                   {"entries", std::to_string(report.total_entries)}});
  if (report.default_package_classes > 0) {
    logger_.Warn("default-package classes cannot be exported and were left out of the descriptor",
                 {{"count", std::to_string(report.default_package_classes)}});
  }

  fs::path written;
  if (!descriptor::WriteModuleDescriptor(config_.scratch_dir, config_.module_name,
                                         result.packages, written, error)) {
    error.stage = ToString(PipelineState::kDescribing);
    return false;
  }
  result.descriptor_source = written;
  logger_.Info("module descriptor written", {{"path", written.string()}});
  return true;
}

bool ImagePipeline::RunStage(PipelineStage stage, PipelineResult& result,
                             core::errors::Error& error) {
  Transition(stage.state);
  if (stage.command.has_value()) {
    stage.command->on_line = ToolLineSink(stage.command->executable);
    logger_.Info("running tool", {{"command", process::DescribeCommand(*stage.command)}});
  }

  StageOutcome outcome;
  if (!ExecuteStage(stage, runner_, outcome, error)) {
    return false;
  }

  result.completed_stages.push_back(stage.name);
  logger_.Info("stage complete", {{"output", stage.required_output.string()}});
  return true;
}

bool ImagePipeline::Run(PipelineResult& result, core::errors::Error& error) {
  result = PipelineResult{};
  error.Clear();

  if (state_ != PipelineState::kIdle) {
    error = MakeError(ErrorKind::kStageSequence, "a pipeline instance runs at most once");
    return false;
  }

  Transition(PipelineState::kDescribing);
  if (!Describe(result, error)) {
    return Fail(error);
  }
  result.completed_stages.push_back(ToString(PipelineState::kDescribing));

  PipelineStage compile;
  compile.state = PipelineState::kCompilingDescriptor;
  compile.name = ToString(compile.state);
  compile.failure_kind = ErrorKind::kCompileFailed;
  compile.required_inputs = {artifacts_.descriptor_source, config_.archive_path};
  compile.command = BuildCompileCommand(config_, artifacts_);
  compile.required_output = artifacts_.compiled_descriptor;
  if (!RunStage(std::move(compile), result, error)) {
    return Fail(error);
  }
  result.compiled_descriptor = artifacts_.compiled_descriptor;

  PipelineStage assemble;
  assemble.state = PipelineState::kAssemblingModuleArchive;
  assemble.name = ToString(assemble.state);
  assemble.failure_kind = ErrorKind::kAssemblyWrite;
  assemble.required_inputs = {artifacts_.compiled_descriptor, config_.archive_path};
  assemble.action = [this](core::errors::Error& stage_error) {
    archive::AssemblyRequest request;
    request.compiled_descriptor = artifacts_.compiled_descriptor;
    request.source_archive = config_.archive_path;
    request.output_archive = artifacts_.module_archive;

    archive::AssemblyReport report;
    if (!archive::AssembleModuleArchive(request, report, stage_error)) {
      return false;
    }
    if (report.source_descriptor_skipped) {
      logger_.Warn("source archive already contained a module descriptor; replaced",
                   {{"entry", request.compiled_descriptor.filename().string()}});
    }
    logger_.Info("module archive assembled",
                 {{"class_entries", std::to_string(report.class_entries_copied)},
                  {"dropped_entries", std::to_string(report.entries_dropped)}});
    return true;
  };
  assemble.required_output = artifacts_.module_archive;
  if (!RunStage(std::move(assemble), result, error)) {
    return Fail(error);
  }
  result.module_archive = artifacts_.module_archive;

  PipelineStage package;
  package.state = PipelineState::kPackagingModule;
  package.name = ToString(package.state);
  package.failure_kind = ErrorKind::kPackagingFailed;
  package.required_inputs = {artifacts_.module_archive};
  package.command = BuildPackageCommand(config_, artifacts_);
  package.required_output = artifacts_.module_unit;
  if (!RunStage(std::move(package), result, error)) {
    return Fail(error);
  }
  result.module_unit = artifacts_.module_unit;

  PipelineStage link;
  link.state = PipelineState::kLinkingImage;
  link.name = ToString(link.state);
  link.failure_kind = ErrorKind::kLinkFailed;
  link.required_inputs = {artifacts_.module_unit};
  link.command = BuildLinkCommand(config_, artifacts_);
  link.required_output = artifacts_.image_modules_file;
  if (!RunStage(std::move(link), result, error)) {
    return Fail(error);
  }
  result.image_modules_file = artifacts_.image_modules_file;

  Transition(PipelineState::kDone);
  logger_.Info("runtime image generated", {{"output_dir", config_.output_dir.string()}});
  return true;
}

} // namespace modforge::pipeline
