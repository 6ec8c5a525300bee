#pragma once

#include "core/logging/logger.hpp"
#include "store/checkpoint_store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scenevault::store {

// Filesystem-backed store. Layout under `root`:
//   <project_id>/project.json                      full record (latest state)
//   <project_id>/checkpoints/checkpoint_<seq>.json audit copy of each accepted checkpoint
//   <project_id>/.lock                             advisory lock used by Update
//
// Every file is published with write-to-temp + rename. Setting
// SCENEVAULT_TEST_INTERRUPT_STORE_WRITE=1 makes each publish fail after the
// temp payload was written, which simulates a crash mid-write.
class FileCheckpointStore final : public ICheckpointStore {
public:
  FileCheckpointStore(std::filesystem::path root, core::logging::Logger& logger);

  const std::filesystem::path& Root() const {
    return root_;
  }

  bool Put(const model::Project& project, core::errors::OperationError& error) override;
  bool Insert(const model::Project& project, core::errors::OperationError& error) override;
  bool Get(const std::string& project_id, model::Project& project,
           core::errors::OperationError& error) const override;
  bool List(std::vector<model::Project>& projects,
            core::errors::OperationError& error) const override;
  bool Delete(const std::string& project_id, core::errors::OperationError& error) override;
  bool Update(const std::string& project_id, const ProjectMutator& mutator,
              model::Project& committed, core::errors::OperationError& error) override;

  std::filesystem::path ProjectDir(const std::string& project_id) const;
  std::filesystem::path RecordPath(const std::string& project_id) const;
  std::filesystem::path CheckpointHistoryPath(const std::string& project_id,
                                              std::uint64_t sequence) const;

private:
  std::shared_ptr<std::mutex> ProjectMutex(const std::string& project_id);
  // Validates, takes the per-id mutex and `flock`, then writes. With
  // `only_if_absent` an existing record fails the call with kInvalidArgument.
  bool StoreRecord(const model::Project& project, bool only_if_absent,
                   core::errors::OperationError& error);
  bool WriteRecord(const model::Project& project, core::errors::OperationError& error);
  // `corrupt` is set when the record exists but cannot be parsed.
  bool ReadRecord(const std::string& project_id, model::Project& project,
                  core::errors::OperationError& error, bool* corrupt = nullptr) const;

  std::filesystem::path root_;
  core::logging::Logger* logger_ = nullptr;

  std::mutex project_mutexes_guard_;
  std::map<std::string, std::shared_ptr<std::mutex>> project_mutexes_;
};

} // namespace scenevault::store
