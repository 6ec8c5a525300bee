#include "scenevault/cli/router.hpp"

#include "config/service_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/operation_error.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "model/checkpoint_write.hpp"
#include "reconcile/file_reconciler.hpp"
#include "recovery/checkpoint_manager.hpp"
#include "retention/retention_policy.hpp"
#include "store/file_checkpoint_store.hpp"

#include <charconv>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace scenevault::cli {

namespace {

constexpr std::string_view kVersion = "scenevault 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  scenevault list\n"
      << "  scenevault show <project_id>\n"
      << "  scenevault cancel <project_id>\n"
      << "  scenevault discard <project_id>\n"
      << "  scenevault create --title <title> [--job-id <id>] [--description <text>] "
         "[--id <project_id>]\n"
      << "  scenevault checkpoint <project_id> <write.json>\n"
      << "  scenevault fail <project_id> <message>\n"
      << "  scenevault purge [--older-than-days <n>] [--dry-run]\n"
      << "  scenevault version\n"
      << "common options:\n"
      << "  --store <dir> --config <file> --artifact-root <dir> --probe-timeout-ms <n> "
         "--log-level <debug|info|warn|error>\n";
}

// Flags every store-backed command accepts plus the command's own extras.
struct CommandOptions {
  config::ConfigOverrides overrides;
  std::vector<std::string> positionals;
  std::optional<std::string> title;
  std::optional<std::string> job_id;
  std::optional<std::string> description;
  std::optional<std::string> project_id;
  std::optional<std::uint32_t> older_than_days;
  bool dry_run = false;
};

bool ParseUnsigned(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

// Parses `args` into `options`. `extra_flags` names the command-specific
// flags that are allowed; anything else starting with '-' is a usage error.
bool ParseCommandOptions(const std::vector<std::string_view>& args,
                         const std::set<std::string_view>& extra_flags, CommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--dry-run" && extra_flags.count(token) != 0U) {
      options.dry_run = true;
      continue;
    }

    const bool is_common_flag = token == "--store" || token == "--config" ||
                                token == "--artifact-root" || token == "--probe-timeout-ms" ||
                                token == "--log-level";
    const bool is_value_flag = is_common_flag || (extra_flags.count(token) != 0U &&
                                                   token != "--dry-run");
    if (is_value_flag) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[i + 1];
      ++i;

      if (token == "--store") {
        options.overrides.store_dir = fs::path(value);
      } else if (token == "--config") {
        options.overrides.config_path = fs::path(value);
      } else if (token == "--artifact-root") {
        options.overrides.artifact_root = fs::path(value);
      } else if (token == "--probe-timeout-ms") {
        std::uint64_t parsed = 0;
        if (!ParseUnsigned(value, parsed)) {
          error = "invalid value for --probe-timeout-ms: " + std::string(value);
          return false;
        }
        options.overrides.probe_timeout_ms = parsed;
      } else if (token == "--log-level") {
        core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
        if (!core::logging::ParseLogLevel(value, parsed, error)) {
          return false;
        }
        options.overrides.log_level = parsed;
      } else if (token == "--title") {
        options.title = std::string(value);
      } else if (token == "--job-id") {
        options.job_id = std::string(value);
      } else if (token == "--description") {
        options.description = std::string(value);
      } else if (token == "--id") {
        options.project_id = std::string(value);
      } else if (token == "--older-than-days") {
        std::uint64_t parsed = 0;
        if (!ParseUnsigned(value, parsed) || parsed > 36500U) {
          error = "invalid value for --older-than-days: " + std::string(value);
          return false;
        }
        options.older_than_days = static_cast<std::uint32_t>(parsed);
      }
      continue;
    }

    if (token.size() > 1U && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    options.positionals.emplace_back(token);
  }
  return true;
}

bool ExpectPositionals(const CommandOptions& options, std::size_t count,
                       std::string_view command, std::string& error) {
  if (options.positionals.size() != count) {
    error = std::string(command) + " expects " + std::to_string(count) + " positional argument" +
            (count == 1U ? "" : "s") + ", got " + std::to_string(options.positionals.size());
    return false;
  }
  return true;
}

// Store, reconciler and manager wired from one resolved config.
struct Runtime {
  config::ServiceConfig config;
  std::unique_ptr<core::logging::Logger> logger;
  std::unique_ptr<store::FileCheckpointStore> store;
  std::unique_ptr<reconcile::FileReconciler> reconciler;
  std::unique_ptr<recovery::CheckpointManager> manager;
};

bool BuildRuntime(const CommandOptions& options, std::string_view command, Runtime& runtime,
                  std::string& error) {
  if (!config::ResolveServiceConfig(options.overrides, runtime.config, error)) {
    return false;
  }

  runtime.logger = std::make_unique<core::logging::Logger>(runtime.config.log_level, std::cerr);
  runtime.logger->SetCorrelationId(
      "cli-" + std::to_string(core::ToEpochMilliseconds(std::chrono::system_clock::now())));
  runtime.logger->Debug("config resolved",
                        {{"command", command},
                         {"store_dir", runtime.config.store_dir.string()},
                         {"artifact_root", runtime.config.artifact_root.string()},
                         {"probe_timeout_ms", std::to_string(runtime.config.probe_timeout.count())}});

  runtime.store =
      std::make_unique<store::FileCheckpointStore>(runtime.config.store_dir, *runtime.logger);

  reconcile::ReconcilerOptions reconciler_options;
  reconciler_options.artifact_root = runtime.config.artifact_root;
  reconciler_options.probe_timeout = runtime.config.probe_timeout;
  runtime.reconciler = std::make_unique<reconcile::FileReconciler>(
      reconciler_options, std::make_shared<reconcile::FilesystemPathProbe>(), *runtime.logger);

  recovery::ManagerOptions manager_options;
  manager_options.artifact_policy = runtime.config.artifact_policy;
  manager_options.max_checkpoint_history = runtime.config.max_checkpoint_history;
  runtime.manager = std::make_unique<recovery::CheckpointManager>(
      *runtime.store, *runtime.reconciler, *runtime.logger, manager_options);
  return true;
}

int ReportOperationError(const core::errors::OperationError& error) {
  std::cerr << "error: " << core::errors::FormatOperationError(error) << '\n';
  return core::errors::ToInt(core::errors::ToExitCode(error.kind));
}

// Shared prologue for store-backed commands: parse, check positionals, wire.
bool PrepareCommand(const std::vector<std::string_view>& args,
                    const std::set<std::string_view>& extra_flags, std::size_t positional_count,
                    std::string_view command, CommandOptions& options, Runtime& runtime,
                    int& exit_code) {
  std::string error;
  if (!ParseCommandOptions(args, extra_flags, options, error) ||
      !ExpectPositionals(options, positional_count, command, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitUsage;
    return false;
  }
  if (!BuildRuntime(options, command, runtime, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code = kExitFailure;
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandList(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 0U, "list", options, runtime, exit_code)) {
    return exit_code;
  }

  std::vector<recovery::RecoveryView> views;
  core::errors::OperationError error;
  if (!runtime.manager->ListIncompleteProjects(views, error)) {
    return ReportOperationError(error);
  }
  std::cout << recovery::ToSummaryListJson(views);
  return kExitSuccess;
}

int CommandShow(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 1U, "show", options, runtime, exit_code)) {
    return exit_code;
  }

  recovery::RecoveryView view;
  core::errors::OperationError error;
  if (!runtime.manager->GetProjectForRecovery(options.positionals[0], view, error)) {
    return ReportOperationError(error);
  }
  std::cout << recovery::ToDetailJson(view);
  return kExitSuccess;
}

int CommandCancel(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 1U, "cancel", options, runtime, exit_code)) {
    return exit_code;
  }

  recovery::CancelOutcome outcome = recovery::CancelOutcome::kCancelled;
  core::errors::OperationError error;
  if (!runtime.manager->CancelProject(options.positionals[0], outcome, error)) {
    return ReportOperationError(error);
  }
  std::cout << "{\"project_id\":" << core::QuoteJson(options.positionals[0])
            << ",\"outcome\":\"" << recovery::ToString(outcome) << "\"}\n";
  return kExitSuccess;
}

int CommandDiscard(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 1U, "discard", options, runtime, exit_code)) {
    return exit_code;
  }

  core::errors::OperationError error;
  if (!runtime.manager->DiscardProject(options.positionals[0], error)) {
    return ReportOperationError(error);
  }
  std::cout << "{\"project_id\":" << core::QuoteJson(options.positionals[0])
            << ",\"discarded\":true}\n";
  return kExitSuccess;
}

int CommandCreate(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {"--title", "--job-id", "--description", "--id"}, 0U, "create",
                      options, runtime, exit_code)) {
    return exit_code;
  }
  if (!options.title.has_value() || options.title->empty()) {
    std::cerr << "error: create requires --title <title>\n";
    return kExitUsage;
  }

  recovery::CreateProjectRequest request;
  request.project_id = options.project_id.value_or("");
  request.title = *options.title;
  request.job_id = options.job_id.value_or("");
  request.description = options.description.value_or("");

  model::Project created;
  core::errors::OperationError error;
  if (!runtime.manager->CreateProject(request, created, error)) {
    return ReportOperationError(error);
  }
  std::cout << "{\"project_id\":" << core::QuoteJson(created.project_id)
            << ",\"status\":\"" << model::ToString(created.status) << "\",\"current_stage\":\""
            << model::ToString(created.current_stage) << "\"}\n";
  return kExitSuccess;
}

int CommandCheckpoint(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 2U, "checkpoint", options, runtime, exit_code)) {
    return exit_code;
  }

  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(options.positionals[1], text, read_error)) {
    std::cerr << "error: " << read_error << '\n';
    return kExitFailure;
  }

  model::CheckpointWrite write;
  std::string parse_error;
  if (!model::ParseCheckpointWriteJson(text, write, parse_error)) {
    core::errors::OperationError error;
    error.Set(core::errors::ErrorKind::kInvalidArgument,
              "checkpoint write '" + options.positionals[1] + "': " + parse_error);
    return ReportOperationError(error);
  }
  write.project_id = options.positionals[0];

  model::Project committed;
  core::errors::OperationError error;
  if (!runtime.manager->RecordCheckpoint(write, committed, error)) {
    return ReportOperationError(error);
  }
  const model::Checkpoint* latest = committed.LatestCheckpoint();
  std::cout << "{\"project_id\":" << core::QuoteJson(committed.project_id)
            << ",\"sequence\":" << (latest != nullptr ? latest->sequence : 0U)
            << ",\"stage\":\"" << model::ToString(committed.current_stage) << "\",\"status\":\""
            << model::ToString(committed.status)
            << "\",\"progress_percent\":" << committed.progress_percent << "}\n";
  return kExitSuccess;
}

int CommandFail(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {}, 2U, "fail", options, runtime, exit_code)) {
    return exit_code;
  }

  model::Project committed;
  core::errors::OperationError error;
  if (!runtime.manager->RecordFailure(options.positionals[0], options.positionals[1], committed,
                                      error)) {
    return ReportOperationError(error);
  }
  std::cout << "{\"project_id\":" << core::QuoteJson(committed.project_id)
            << ",\"error_message\":" << core::QuoteJson(committed.error_message) << "}\n";
  return kExitSuccess;
}

int CommandPurge(const std::vector<std::string_view>& args) {
  CommandOptions options;
  Runtime runtime;
  int exit_code = kExitSuccess;
  if (!PrepareCommand(args, {"--older-than-days", "--dry-run"}, 0U, "purge", options, runtime,
                      exit_code)) {
    return exit_code;
  }

  retention::RetentionPolicy policy = config::ToRetentionPolicy(runtime.config);
  if (options.older_than_days.has_value()) {
    policy.max_age = std::chrono::hours(24) * *options.older_than_days;
  }
  policy.dry_run = options.dry_run;

  retention::PurgeReport report;
  core::errors::OperationError error;
  const bool ok = retention::PurgeExpiredProjects(*runtime.store, policy,
                                                  std::chrono::system_clock::now(),
                                                  *runtime.logger, report, error);
  std::cout << retention::ToJson(report, policy.dry_run);
  if (!ok) {
    return ReportOperationError(error);
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "list") {
    return CommandList(args);
  }
  if (command == "show") {
    return CommandShow(args);
  }
  if (command == "cancel") {
    return CommandCancel(args);
  }
  if (command == "discard") {
    return CommandDiscard(args);
  }
  if (command == "create") {
    return CommandCreate(args);
  }
  if (command == "checkpoint") {
    return CommandCheckpoint(args);
  }
  if (command == "fail") {
    return CommandFail(args);
  }
  if (command == "purge") {
    return CommandPurge(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace scenevault::cli
