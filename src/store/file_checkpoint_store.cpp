#include "store/file_checkpoint_store.hpp"

#include "core/fs_utils.hpp"
#include "model/project_json.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace scenevault::store {

namespace {

using core::errors::ErrorKind;
using core::errors::OperationError;

constexpr std::string_view kRecordFileName = "project.json";
constexpr std::string_view kLockFileName = ".lock";
constexpr std::string_view kHistoryDirName = "checkpoints";

bool IsInterruptedWriteSimulationEnabled() {
  const char* raw = std::getenv("SCENEVAULT_TEST_INTERRUPT_STORE_WRITE");
  return raw != nullptr && std::string_view(raw) == "1";
}

bool WriteStoreTextAtomic(const fs::path& output_path, std::string_view text,
                          std::string& error) {
  if (!IsInterruptedWriteSimulationEnabled()) {
    return core::WriteTextFileAtomic(output_path, text, error);
  }

  // Test-only failure injection: the payload reaches a temp sibling but is
  // never renamed over the published file.
  if (!core::EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const fs::path temp_path = output_path.string() + ".tmp.interrupted";
  std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open simulated interrupted temp output file '" + temp_path.string() + "'";
    return false;
  }
  out_file << text;
  if (!out_file) {
    error =
        "failed while writing simulated interrupted temp output file '" + temp_path.string() + "'";
    return false;
  }
  error = "simulated interrupted store write before publish";
  return false;
}

// Cross-process exclusive lock on `<project_dir>/.lock`, held for the
// lifetime of the object.
class ScopedFileLock {
public:
  ScopedFileLock() = default;
  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  ~ScopedFileLock() {
    if (fd_ >= 0) {
      (void)::flock(fd_, LOCK_UN);
      (void)::close(fd_);
    }
  }

  // Returns false with errno-based detail in `error`. `missing_dir` is set
  // when the project directory disappeared underneath the caller.
  bool Acquire(const fs::path& lock_path, bool& missing_dir, std::string& error) {
    missing_dir = false;
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      missing_dir = errno == ENOENT;
      error = "failed to open lock file '" + lock_path.string() + "': " + std::strerror(errno);
      return false;
    }
    int rc = 0;
    do {
      rc = ::flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
      error = "failed to lock '" + lock_path.string() + "': " + std::strerror(errno);
      (void)::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

private:
  int fd_ = -1;
};

// Invalid ids cannot name a stored record, so lookups report them as absent.
bool CheckLookupId(const std::string& project_id, OperationError& error) {
  std::string id_error;
  if (!model::ValidateProjectId(project_id, id_error)) {
    error.Set(ErrorKind::kNotFound, "project not found: " + id_error);
    return false;
  }
  return true;
}

bool DirectoryExists(const fs::path& path, OperationError& error) {
  std::error_code ec;
  const bool exists = fs::is_directory(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    error.Set(ErrorKind::kStoreUnavailable,
              "failed to stat '" + path.string() + "': " + ec.message());
    return false;
  }
  return exists;
}

} // namespace

FileCheckpointStore::FileCheckpointStore(fs::path root, core::logging::Logger& logger)
    : root_(std::move(root)), logger_(&logger) {}

fs::path FileCheckpointStore::ProjectDir(const std::string& project_id) const {
  return root_ / project_id;
}

fs::path FileCheckpointStore::RecordPath(const std::string& project_id) const {
  return ProjectDir(project_id) / kRecordFileName;
}

fs::path FileCheckpointStore::CheckpointHistoryPath(const std::string& project_id,
                                                    const std::uint64_t sequence) const {
  return ProjectDir(project_id) / kHistoryDirName /
         ("checkpoint_" + std::to_string(sequence) + ".json");
}

std::shared_ptr<std::mutex> FileCheckpointStore::ProjectMutex(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(project_mutexes_guard_);
  auto& slot = project_mutexes_[project_id];
  if (slot == nullptr) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

bool FileCheckpointStore::WriteRecord(const model::Project& project, OperationError& error) {
  std::string write_error;
  // Audit copy goes first so a published record always has its latest
  // checkpoint on disk as well.
  if (const model::Checkpoint* latest = project.LatestCheckpoint(); latest != nullptr) {
    const fs::path history_path = CheckpointHistoryPath(project.project_id, latest->sequence);
    if (!WriteStoreTextAtomic(history_path, model::ToJson(*latest, project.project_id),
                              write_error)) {
      error.Set(ErrorKind::kStoreUnavailable, write_error);
      logger_->Warn("checkpoint history write failed",
                    {{"project_id", project.project_id},
                     {"path", history_path.string()},
                     {"error", write_error}});
      return false;
    }
  }

  const fs::path record_path = RecordPath(project.project_id);
  if (!WriteStoreTextAtomic(record_path, model::ToJson(project), write_error)) {
    error.Set(ErrorKind::kStoreUnavailable, write_error);
    logger_->Warn("project record write failed", {{"project_id", project.project_id},
                                                  {"path", record_path.string()},
                                                  {"error", write_error}});
    return false;
  }
  return true;
}

bool FileCheckpointStore::ReadRecord(const std::string& project_id, model::Project& project,
                                     OperationError& error, bool* corrupt) const {
  if (corrupt != nullptr) {
    *corrupt = false;
  }
  const fs::path record_path = RecordPath(project_id);
  std::error_code ec;
  if (!fs::exists(record_path, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      error.Set(ErrorKind::kStoreUnavailable,
                "failed to stat '" + record_path.string() + "': " + ec.message());
      return false;
    }
    error.Set(ErrorKind::kNotFound, "project not found: " + project_id);
    return false;
  }

  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(record_path, text, read_error)) {
    error.Set(ErrorKind::kStoreUnavailable, read_error);
    return false;
  }

  std::string parse_error;
  if (!model::ParseProjectJson(text, project, parse_error)) {
    if (corrupt != nullptr) {
      *corrupt = true;
    }
    error.Set(ErrorKind::kStoreUnavailable,
              "corrupt project record '" + record_path.string() + "': " + parse_error);
    return false;
  }
  if (project.project_id != project_id) {
    if (corrupt != nullptr) {
      *corrupt = true;
    }
    error.Set(ErrorKind::kStoreUnavailable, "project record '" + record_path.string() +
                                                "' carries mismatched id '" +
                                                project.project_id + "'");
    return false;
  }
  return true;
}

bool FileCheckpointStore::StoreRecord(const model::Project& project, const bool only_if_absent,
                                      OperationError& error) {
  error.Clear();
  std::string validation_error;
  if (!model::ValidateProject(project, model::ArtifactPolicy{false, false}, validation_error)) {
    error.Set(ErrorKind::kInvalidArgument, validation_error);
    return false;
  }

  const std::shared_ptr<std::mutex> project_mutex = ProjectMutex(project.project_id);
  std::lock_guard<std::mutex> guard(*project_mutex);

  const fs::path project_dir = ProjectDir(project.project_id);
  std::error_code ec;
  fs::create_directories(project_dir, ec);
  if (ec) {
    error.Set(ErrorKind::kStoreUnavailable,
              "failed to create directory '" + project_dir.string() + "': " + ec.message());
    return false;
  }

  ScopedFileLock file_lock;
  bool missing_dir = false;
  std::string lock_error;
  if (!file_lock.Acquire(project_dir / kLockFileName, missing_dir, lock_error)) {
    error.Set(ErrorKind::kStoreUnavailable, lock_error);
    return false;
  }

  if (only_if_absent) {
    // A directory without a published record is debris from an interrupted
    // write and does not count as an existing project.
    const fs::path record_path = RecordPath(project.project_id);
    const bool exists = fs::exists(record_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      error.Set(ErrorKind::kStoreUnavailable,
                "failed to stat '" + record_path.string() + "': " + ec.message());
      return false;
    }
    if (exists) {
      error.Set(ErrorKind::kInvalidArgument, "project already exists: " + project.project_id);
      return false;
    }
  }
  return WriteRecord(project, error);
}

bool FileCheckpointStore::Put(const model::Project& project, OperationError& error) {
  return StoreRecord(project, false, error);
}

bool FileCheckpointStore::Insert(const model::Project& project, OperationError& error) {
  return StoreRecord(project, true, error);
}

bool FileCheckpointStore::Get(const std::string& project_id, model::Project& project,
                              OperationError& error) const {
  error.Clear();
  if (!CheckLookupId(project_id, error)) {
    return false;
  }
  return ReadRecord(project_id, project, error);
}

bool FileCheckpointStore::List(std::vector<model::Project>& projects,
                               OperationError& error) const {
  projects.clear();
  error.Clear();

  std::error_code ec;
  if (!fs::exists(root_, ec)) {
    if (ec) {
      error.Set(ErrorKind::kStoreUnavailable,
                "failed to stat store root '" + root_.string() + "': " + ec.message());
      return false;
    }
    return true;
  }

  std::vector<std::string> project_ids;
  fs::directory_iterator it(root_, ec);
  const fs::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::path& entry_path = it->path();
    std::error_code entry_ec;
    if (core::IsAtomicTempPath(entry_path) || !it->is_directory(entry_ec)) {
      continue;
    }
    const std::string name = entry_path.filename().string();
    std::string id_error;
    if (!model::ValidateProjectId(name, id_error)) {
      continue;
    }
    project_ids.push_back(name);
  }
  if (ec) {
    error.Set(ErrorKind::kStoreUnavailable,
              "failed to scan store root '" + root_.string() + "': " + ec.message());
    return false;
  }

  std::sort(project_ids.begin(), project_ids.end());
  for (const std::string& project_id : project_ids) {
    model::Project project;
    OperationError read_error;
    bool corrupt = false;
    if (ReadRecord(project_id, project, read_error, &corrupt)) {
      projects.push_back(std::move(project));
      continue;
    }
    if (read_error.Is(ErrorKind::kNotFound)) {
      // Directory without a published record (never written, or deleted
      // between scan and read).
      continue;
    }
    if (corrupt) {
      logger_->Warn("skipping unreadable project record",
                    {{"project_id", project_id}, {"error", read_error.message}});
      continue;
    }
    error = read_error;
    return false;
  }
  return true;
}

bool FileCheckpointStore::Delete(const std::string& project_id, OperationError& error) {
  error.Clear();
  if (!CheckLookupId(project_id, error)) {
    return false;
  }

  const std::shared_ptr<std::mutex> project_mutex = ProjectMutex(project_id);
  std::lock_guard<std::mutex> guard(*project_mutex);

  const fs::path project_dir = ProjectDir(project_id);
  if (!DirectoryExists(project_dir, error)) {
    if (error.kind == ErrorKind::kNone) {
      error.Set(ErrorKind::kNotFound, "project not found: " + project_id);
    }
    return false;
  }

  ScopedFileLock file_lock;
  bool missing_dir = false;
  std::string lock_error;
  if (!file_lock.Acquire(project_dir / kLockFileName, missing_dir, lock_error)) {
    error.Set(missing_dir ? ErrorKind::kNotFound : ErrorKind::kStoreUnavailable,
              missing_dir ? "project not found: " + project_id : lock_error);
    return false;
  }

  std::error_code ec;
  fs::remove_all(project_dir, ec);
  if (ec) {
    error.Set(ErrorKind::kStoreUnavailable,
              "failed to remove '" + project_dir.string() + "': " + ec.message());
    logger_->Warn("project delete failed", {{"project_id", project_id}, {"error", ec.message()}});
    return false;
  }
  return true;
}

bool FileCheckpointStore::Update(const std::string& project_id, const ProjectMutator& mutator,
                                 model::Project& committed, OperationError& error) {
  error.Clear();
  if (!CheckLookupId(project_id, error)) {
    return false;
  }

  const std::shared_ptr<std::mutex> project_mutex = ProjectMutex(project_id);
  std::lock_guard<std::mutex> guard(*project_mutex);

  const fs::path project_dir = ProjectDir(project_id);
  if (!DirectoryExists(project_dir, error)) {
    if (error.kind == ErrorKind::kNone) {
      error.Set(ErrorKind::kNotFound, "project not found: " + project_id);
    }
    return false;
  }

  ScopedFileLock file_lock;
  bool missing_dir = false;
  std::string lock_error;
  if (!file_lock.Acquire(project_dir / kLockFileName, missing_dir, lock_error)) {
    error.Set(missing_dir ? ErrorKind::kNotFound : ErrorKind::kStoreUnavailable,
              missing_dir ? "project not found: " + project_id : lock_error);
    return false;
  }

  model::Project project;
  if (!ReadRecord(project_id, project, error)) {
    return false;
  }
  if (!mutator(project, error)) {
    if (error.kind == ErrorKind::kNone) {
      error.Set(ErrorKind::kInvalidArgument, "update rejected for project " + project_id);
    }
    return false;
  }
  if (project.project_id != project_id) {
    error.Set(ErrorKind::kInvalidArgument, "update cannot change the project id");
    return false;
  }

  std::string validation_error;
  if (!model::ValidateProject(project, model::ArtifactPolicy{false, false}, validation_error)) {
    error.Set(ErrorKind::kInvalidArgument, validation_error);
    return false;
  }
  if (!WriteRecord(project, error)) {
    return false;
  }
  committed = std::move(project);
  return true;
}

} // namespace scenevault::store
