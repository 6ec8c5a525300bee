#pragma once

#include <filesystem>
#include <string>

namespace scenevault::reconcile {

// Existence check for one artifact path. Implementations may block (network
// mounts, object storage gateways); FileReconciler bounds every call.
class IPathProbe {
public:
  virtual ~IPathProbe() = default;

  // Sets `exists` to true only for an existing regular file. Returns false
  // when the probe itself failed; the path then counts as missing.
  virtual bool Probe(const std::filesystem::path& path, bool& exists, std::string& error) = 0;
};

// Local filesystem probe: `exists && is_regular_file`.
class FilesystemPathProbe final : public IPathProbe {
public:
  bool Probe(const std::filesystem::path& path, bool& exists, std::string& error) override;
};

} // namespace scenevault::reconcile
