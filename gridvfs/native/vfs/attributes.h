#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <cstdint>
#include <memory>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "annotations.h"
#include "backend.h"

namespace gridvfs {

// The backend does not expose device numbers; every object reports this one.
constexpr dev_t kBackendDevice = 17;

// Protocol-side view of one object, rebuilt on every request.
struct AttributeRecord {
  uint64_t ino{0};
  uint64_t fileid{0};
  ObjectKind kind{ObjectKind::kRegular};
  mode_t mode{0};
  uint32_t nlink{0};
  uid_t uid{0};
  gid_t gid{0};
  uint64_t size{0};
  absl::Time atime;
  absl::Time mtime;
  absl::Time ctime;
  dev_t dev{kBackendDevice};
  dev_t rdev{kBackendDevice};
  uint64_t generation{0};
};

// Fills `sb` from `attr` for the FUSE replies.
void ToStat(const AttributeRecord& attr, struct stat* sb);

// Decides the permission bits reported for an object. Callers only see this
// interface, so an ACL-aware model can replace the fixed one.
class PermissionModel {
 public:
  virtual ~PermissionModel() = default;
  virtual mode_t PermissionBits(const ObjectStat& stat) const = 0;
};

// User read and write for everything, whatever the backend ACLs say.
class FixedPermissionModel : public PermissionModel {
 public:
  mode_t PermissionBits(const ObjectStat& stat) const override;
};

class AttributeTranslator {
 public:
  explicit AttributeTranslator(std::unique_ptr<PermissionModel> permissions);
  DISALLOW_COPY_AND_ASSIGN(AttributeTranslator);

  // Resolves the owner through `session`. An unknown owner or an owner id
  // that is not a decimal number is an I/O failure.
  absl::StatusOr<AttributeRecord> ToAttributes(const uint64_t handle,
                                               const ObjectStat& stat,
                                               BackendSession& session) const;

 private:
  std::unique_ptr<PermissionModel> permissions_;
};

// User permission bits honored by access checks; group and other bits in a
// request are ignored.
constexpr mode_t kAccessUserMask = S_IRUSR | S_IWUSR | S_IXUSR;

// Subset of `requested` that `probe` grants. Write implies read.
mode_t GrantedAccess(const mode_t requested, const AccessProbe& probe);

}  // namespace gridvfs
