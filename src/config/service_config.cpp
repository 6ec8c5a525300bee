#include "config/service_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cstdlib>
#include <limits>
#include <set>

namespace scenevault::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::uint64_t kMaxProbeTimeoutMs = 60000U;

bool CheckKnownKeys(const JsonValue& object, const std::set<std::string>& known,
                    std::string_view scope, std::string& error) {
  for (const auto& [key, value] : object.object_value) {
    (void)value;
    if (known.count(key) == 0U) {
      error = "unknown config key '" + std::string(scope) + key + "'";
      return false;
    }
  }
  return true;
}

bool ReadOptionalString(const JsonValue& object, std::string_view key,
                        std::optional<std::string>& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "config key '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadOptionalBool(const JsonValue& object, std::string_view key, bool& out,
                      std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  if (field->type != JsonValue::Type::kBool) {
    error = "config key '" + std::string(key) + "' must be a boolean";
    return false;
  }
  out = field->bool_value;
  return true;
}

bool ReadOptionalUnsigned(const JsonValue& object, std::string_view key, std::uint64_t max_value,
                          std::optional<std::uint64_t>& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (field == nullptr) {
    return true;
  }
  std::uint64_t value = 0;
  if (!core::json::TryGetUnsigned(*field, value) || value > max_value) {
    error = "config key '" + std::string(key) + "' must be an integer within 0.." +
            std::to_string(max_value);
    return false;
  }
  out = value;
  return true;
}

bool ValidateProbeTimeout(const std::uint64_t timeout_ms, std::string& error) {
  if (timeout_ms == 0U || timeout_ms > kMaxProbeTimeoutMs) {
    error = "probe timeout must be within 1.." + std::to_string(kMaxProbeTimeoutMs) + " ms";
    return false;
  }
  return true;
}

} // namespace

bool ApplyConfigJson(std::string_view text, ServiceConfig& config, std::string& error) {
  error.clear();
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }
  if (!CheckKnownKeys(root,
                      {"store_dir", "artifact_root", "probe_timeout_ms", "log_level",
                       "max_checkpoint_history", "artifact_policy", "retention"},
                      "", error)) {
    return false;
  }

  std::optional<std::string> store_dir;
  std::optional<std::string> artifact_root;
  std::optional<std::string> log_level;
  std::optional<std::uint64_t> probe_timeout_ms;
  std::optional<std::uint64_t> max_history;
  if (!ReadOptionalString(root, "store_dir", store_dir, error) ||
      !ReadOptionalString(root, "artifact_root", artifact_root, error) ||
      !ReadOptionalString(root, "log_level", log_level, error) ||
      !ReadOptionalUnsigned(root, "probe_timeout_ms", kMaxProbeTimeoutMs, probe_timeout_ms,
                            error) ||
      !ReadOptionalUnsigned(root, "max_checkpoint_history", 100000U, max_history, error)) {
    return false;
  }

  if (store_dir.has_value()) {
    if (store_dir->empty()) {
      error = "config key 'store_dir' cannot be empty";
      return false;
    }
    config.store_dir = *store_dir;
  }
  if (artifact_root.has_value()) {
    config.artifact_root = *artifact_root;
  }
  if (log_level.has_value() && !core::logging::ParseLogLevel(*log_level, config.log_level, error)) {
    return false;
  }
  if (probe_timeout_ms.has_value()) {
    if (!ValidateProbeTimeout(*probe_timeout_ms, error)) {
      return false;
    }
    config.probe_timeout = std::chrono::milliseconds(*probe_timeout_ms);
  }
  if (max_history.has_value()) {
    if (*max_history == 0U) {
      error = "config key 'max_checkpoint_history' must be at least 1";
      return false;
    }
    config.max_checkpoint_history = static_cast<std::size_t>(*max_history);
  }

  if (const JsonValue* policy = core::json::FindMember(root, "artifact_policy");
      policy != nullptr) {
    if (policy->type != JsonValue::Type::kObject) {
      error = "config key 'artifact_policy' must be an object";
      return false;
    }
    if (!CheckKnownKeys(*policy, {"require_audio", "require_image"}, "artifact_policy.", error) ||
        !ReadOptionalBool(*policy, "require_audio", config.artifact_policy.require_audio, error) ||
        !ReadOptionalBool(*policy, "require_image", config.artifact_policy.require_image, error)) {
      return false;
    }
  }

  if (const JsonValue* retention = core::json::FindMember(root, "retention");
      retention != nullptr) {
    if (retention->type != JsonValue::Type::kObject) {
      error = "config key 'retention' must be an object";
      return false;
    }
    std::optional<std::uint64_t> max_age_days;
    if (!CheckKnownKeys(*retention, {"max_age_days", "include_done", "include_cancelled"},
                        "retention.", error) ||
        !ReadOptionalUnsigned(*retention, "max_age_days", 36500U, max_age_days, error) ||
        !ReadOptionalBool(*retention, "include_done", config.retention_include_done, error) ||
        !ReadOptionalBool(*retention, "include_cancelled", config.retention_include_cancelled,
                          error)) {
      return false;
    }
    if (max_age_days.has_value()) {
      config.retention_max_age_days = static_cast<std::uint32_t>(*max_age_days);
    }
  }
  return true;
}

bool LoadConfigFile(const std::filesystem::path& path, ServiceConfig& config, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ApplyConfigJson(text, config, error)) {
    error = "config file '" + path.string() + "': " + error;
    return false;
  }
  return true;
}

bool ApplyEnvironment(ServiceConfig& config, std::string& error) {
  if (const char* store_dir = std::getenv("SCENEVAULT_STORE_DIR");
      store_dir != nullptr && *store_dir != '\0') {
    config.store_dir = store_dir;
  }
  if (const char* log_level = std::getenv("SCENEVAULT_LOG_LEVEL");
      log_level != nullptr && *log_level != '\0') {
    if (!core::logging::ParseLogLevel(log_level, config.log_level, error)) {
      error = "SCENEVAULT_LOG_LEVEL: " + error;
      return false;
    }
  }
  return true;
}

bool ResolveServiceConfig(const ConfigOverrides& overrides, ServiceConfig& config,
                          std::string& error) {
  config = ServiceConfig{};
  error.clear();

  std::optional<std::filesystem::path> config_path = overrides.config_path;
  if (!config_path.has_value()) {
    if (const char* env_path = std::getenv("SCENEVAULT_CONFIG");
        env_path != nullptr && *env_path != '\0') {
      config_path = std::filesystem::path(env_path);
    }
  }
  if (config_path.has_value() && !LoadConfigFile(*config_path, config, error)) {
    return false;
  }

  if (!ApplyEnvironment(config, error)) {
    return false;
  }

  if (overrides.store_dir.has_value()) {
    config.store_dir = *overrides.store_dir;
  }
  if (overrides.artifact_root.has_value()) {
    config.artifact_root = *overrides.artifact_root;
  }
  if (overrides.probe_timeout_ms.has_value()) {
    if (!ValidateProbeTimeout(*overrides.probe_timeout_ms, error)) {
      return false;
    }
    config.probe_timeout = std::chrono::milliseconds(*overrides.probe_timeout_ms);
  }
  if (overrides.log_level.has_value()) {
    config.log_level = *overrides.log_level;
  }
  return true;
}

retention::RetentionPolicy ToRetentionPolicy(const ServiceConfig& config) {
  retention::RetentionPolicy policy;
  policy.max_age = std::chrono::hours(24) * config.retention_max_age_days;
  policy.include_done = config.retention_include_done;
  policy.include_cancelled = config.retention_include_cancelled;
  return policy;
}

} // namespace scenevault::config
