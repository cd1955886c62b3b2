#include "attributes.h"

#include <glog/logging.h>

#include <cstring>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "status_util.h"

namespace gridvfs {
namespace {

mode_t TypeBits(const ObjectKind kind) {
  switch (kind) {
    case ObjectKind::kDirectory:
      return S_IFDIR;
    case ObjectKind::kRegular:
      return S_IFREG;
  }
  return S_IFREG;
}

}  // namespace

void ToStat(const AttributeRecord& attr, struct stat* sb) {
  memset(sb, 0, sizeof(*sb));
  sb->st_ino = attr.ino;
  sb->st_mode = attr.mode;
  sb->st_nlink = attr.nlink;
  sb->st_uid = attr.uid;
  sb->st_gid = attr.gid;
  sb->st_size = static_cast<off_t>(attr.size);
  sb->st_dev = attr.dev;
  sb->st_rdev = attr.rdev;
  sb->st_atim = absl::ToTimespec(attr.atime);
  sb->st_mtim = absl::ToTimespec(attr.mtime);
  sb->st_ctim = absl::ToTimespec(attr.ctime);
}

mode_t FixedPermissionModel::PermissionBits(const ObjectStat& stat) const {
  GRIDVFS_UNUSED(stat);
  return S_IRUSR | S_IWUSR;
}

AttributeTranslator::AttributeTranslator(
    std::unique_ptr<PermissionModel> permissions)
    : permissions_(std::move(permissions)) {
  CHECK(permissions_ != nullptr);
}

absl::StatusOr<AttributeRecord> AttributeTranslator::ToAttributes(
    const uint64_t handle, const ObjectStat& stat,
    BackendSession& session) const {
  const auto owner = absl::StrCat(stat.owner_name, "#", stat.owner_zone);
  auto id = session.LookupUserId(owner);
  if (!id.ok()) {
    return AsIoFailure(id.status(), absl::StrCat("resolving owner ", owner));
  }

  uint32_t uid;
  if (!absl::SimpleAtoi(*id, &uid)) {
    return IoFailure(
        absl::StrCat("owner ", owner, " has non-numeric id '", *id, "'"));
  }

  AttributeRecord attr;
  attr.ino = handle;
  attr.fileid = handle;
  attr.kind = stat.kind;
  attr.mode = TypeBits(stat.kind) | permissions_->PermissionBits(stat);
  // Hard links are not tracked.
  attr.nlink = 0;
  attr.uid = uid;
  attr.gid = 0;
  attr.size = stat.size;
  attr.atime = stat.modified_at;
  attr.mtime = stat.modified_at;
  attr.ctime = stat.created_at;
  attr.generation = static_cast<uint64_t>(absl::ToUnixMillis(stat.modified_at));

  VLOG(4) << "ToAttributes(" << handle << "): owner=" << owner
          << " uid=" << uid << " size=" << attr.size;
  return attr;
}

mode_t GrantedAccess(const mode_t requested, const AccessProbe& probe) {
  mode_t granted = 0;

  if ((requested & S_IXUSR) && probe.execute) {
    granted |= S_IXUSR;
  }

  bool can_write = false;
  if (requested & S_IWUSR) {
    can_write = probe.write;
    if (can_write) {
      granted |= S_IWUSR;
    }
  }

  if (requested & S_IRUSR) {
    if (can_write || probe.read) {
      granted |= S_IRUSR;
    }
  }

  return granted;
}

}  // namespace gridvfs
