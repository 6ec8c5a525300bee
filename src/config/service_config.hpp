#pragma once

#include "core/logging/logger.hpp"
#include "model/project.hpp"
#include "reconcile/file_reconciler.hpp"
#include "recovery/checkpoint_order.hpp"
#include "retention/retention_policy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scenevault::config {

inline constexpr std::string_view kDefaultStoreDir = "scenevault_store";

// Effective runtime settings. Precedence, lowest first:
//   built-in defaults < JSON config file < environment < CLI flags
struct ServiceConfig {
  std::filesystem::path store_dir{std::string(kDefaultStoreDir)};
  std::filesystem::path artifact_root;
  std::chrono::milliseconds probe_timeout = reconcile::kDefaultProbeTimeout;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::size_t max_checkpoint_history = recovery::kDefaultMaxCheckpointHistory;
  model::ArtifactPolicy artifact_policy;
  std::uint32_t retention_max_age_days = retention::kDefaultMaxAgeDays;
  bool retention_include_done = true;
  bool retention_include_cancelled = true;
};

// Values supplied on the command line. Unset fields leave lower layers alone.
struct ConfigOverrides {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> store_dir;
  std::optional<std::filesystem::path> artifact_root;
  std::optional<std::uint64_t> probe_timeout_ms;
  std::optional<core::logging::LogLevel> log_level;
};

// Applies keys present in a JSON config document over `config`. Unknown keys
// are rejected so typos do not silently fall back to defaults.
bool ApplyConfigJson(std::string_view text, ServiceConfig& config, std::string& error);

bool LoadConfigFile(const std::filesystem::path& path, ServiceConfig& config, std::string& error);

// SCENEVAULT_STORE_DIR and SCENEVAULT_LOG_LEVEL.
bool ApplyEnvironment(ServiceConfig& config, std::string& error);

// Full resolution. The config file comes from `overrides.config_path`, else
// SCENEVAULT_CONFIG; a named file that cannot be read is an error.
bool ResolveServiceConfig(const ConfigOverrides& overrides, ServiceConfig& config,
                          std::string& error);

retention::RetentionPolicy ToRetentionPolicy(const ServiceConfig& config);

} // namespace scenevault::config
