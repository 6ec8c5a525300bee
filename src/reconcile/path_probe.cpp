#include "reconcile/path_probe.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace scenevault::reconcile {

bool FilesystemPathProbe::Probe(const fs::path& path, bool& exists, std::string& error) {
  exists = false;
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
      return true;
    }
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }
  exists = fs::is_regular_file(status);
  return true;
}

} // namespace scenevault::reconcile
