#pragma once

#include "core/errors/operation_error.hpp"
#include "model/project.hpp"

#include <functional>
#include <string>
#include <vector>

namespace scenevault::store {

// Read-modify-write callback used by ICheckpointStore::Update. Returning false
// rejects the change; the callback must fill `error` and nothing is written.
using ProjectMutator =
    std::function<bool(model::Project& project, core::errors::OperationError& error)>;

// Durable project/checkpoint persistence contract.
//
// Contract goals:
// - one record per project id holding the full graph (scenes + checkpoints)
// - readers observe either the previous or the new record, never a mix
// - I/O trouble surfaces as kStoreUnavailable, never swallowed
class ICheckpointStore {
public:
  virtual ~ICheckpointStore() = default;

  // Inserts or replaces the full record.
  virtual bool Put(const model::Project& project, core::errors::OperationError& error) = 0;

  // Stores `project` only when no record exists for its id. The existence
  // check and the write happen under the same per-project lock, so of two
  // racing inserts exactly one succeeds; the other gets kInvalidArgument.
  virtual bool Insert(const model::Project& project, core::errors::OperationError& error) = 0;

  virtual bool Get(const std::string& project_id, model::Project& project,
                   core::errors::OperationError& error) const = 0;

  // All stored projects ordered by project id.
  virtual bool List(std::vector<model::Project>& projects,
                    core::errors::OperationError& error) const = 0;

  // Storage reclamation. kNotFound when the id was never stored.
  virtual bool Delete(const std::string& project_id, core::errors::OperationError& error) = 0;

  // Serialized read-modify-write for one project. Concurrent Update calls on
  // the same id never lose each other's changes. On success `committed` holds
  // the record as persisted.
  virtual bool Update(const std::string& project_id, const ProjectMutator& mutator,
                      model::Project& committed, core::errors::OperationError& error) = 0;
};

} // namespace scenevault::store
