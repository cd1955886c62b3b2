#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "annotations.h"
#include "backend.h"

namespace gridvfs {

// A backend that keeps its whole namespace in process memory. Objects are
// owned by the configured user; access rights and failures can be injected
// per path or per operation, which is what the facade tests rely on.
class MemoryBackend : public Backend {
 public:
  enum class Operation {
    kStat,
    kProbeAccess,
    kCreateObject,
    kListChildren,
    kLookupUserId,
    kQueryCapacity,
  };

  // Creates `root` (and its ancestors) as directories owned by
  // `owner_name#zone`, whose user id is `owner_id`.
  MemoryBackend(const std::string& root, const std::string& owner_name,
                const std::string& zone, const std::string& owner_id);
  DISALLOW_COPY_AND_ASSIGN(MemoryBackend);
  DISALLOW_MOVE(MemoryBackend);

  absl::StatusOr<std::unique_ptr<BackendSession>> Connect() override;

  // Places an object without going through a session, as another client
  // of the backend would.
  absl::Status AddObject(const std::string& path, const ObjectKind kind,
                         const uint64_t size);
  absl::Status AddObject(const std::string& path, const ObjectKind kind,
                         const uint64_t size, const std::string& owner_name);
  void AddUser(const std::string& qualified_name, const std::string& id);
  void SetAccess(const std::string& path, const AccessProbe& probe);
  void SetCapacity(const Capacity& capacity);

  // Every call of `op` fails with `status` until cleared.
  void InjectFailure(const Operation op, const absl::Status& status);
  void ClearFailures();
  void SetConnectFailure(const absl::Status& status);

  size_t OpenSessions() const;
  size_t SessionsOpened() const;

 protected:
  friend class MemorySession;

  absl::Status FailureFor(const Operation op) ABSL_LOCKS_EXCLUDED(mu_);
  void ReleaseSession();

  absl::StatusOr<ObjectStat> Stat(absl::string_view path)
      ABSL_LOCKS_EXCLUDED(mu_);
  absl::StatusOr<AccessProbe> ProbeAccess(absl::string_view path)
      ABSL_LOCKS_EXCLUDED(mu_);
  absl::Status CreateObject(absl::string_view path, const ObjectKind kind)
      ABSL_LOCKS_EXCLUDED(mu_);
  absl::StatusOr<std::vector<std::string>> ListChildren(absl::string_view path)
      ABSL_LOCKS_EXCLUDED(mu_);
  absl::StatusOr<std::string> LookupUserId(absl::string_view qualified_name)
      ABSL_LOCKS_EXCLUDED(mu_);
  absl::StatusOr<Capacity> QueryCapacity() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  absl::Status Insert(const std::string& path, const ObjectKind kind,
                      const uint64_t size, const std::string& owner_name)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const std::string owner_name_;
  const std::string zone_;

  mutable absl::Mutex mu_;
  absl::btree_map<std::string, ObjectStat> objects_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<std::string, AccessProbe> access_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<std::string, std::string> users_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<Operation, absl::Status> failures_ ABSL_GUARDED_BY(mu_);
  absl::Status connect_failure_ ABSL_GUARDED_BY(mu_);
  Capacity capacity_ ABSL_GUARDED_BY(mu_);

  std::atomic<size_t> open_sessions_{0};
  std::atomic<size_t> sessions_opened_{0};
};

}  // namespace gridvfs
