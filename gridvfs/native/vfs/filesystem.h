#pragma once

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "annotations.h"
#include "attributes.h"
#include "backend.h"
#include "inode_allocator.h"
#include "inode_table.h"

namespace gridvfs {

struct FilesystemOptions {
  // Backend path served as handle 1.
  std::string root_path;
};

struct DirectoryEntry {
  std::string name;
  uint64_t handle;
  AttributeRecord attributes;
};

struct FsStat {
  uint64_t total_bytes{0};
  uint64_t total_files{0};
  uint64_t used_bytes{0};
  uint64_t used_files{0};
};

// Handle-addressed view of a path-addressed backend.
//
// All operations may be called concurrently. Every operation that talks to
// the backend opens its own session and drops it before returning. Errors
// use the canonical codes NotFound, AlreadyExists, PermissionDenied and
// InvalidArgument; anything else the backend reports comes back as an I/O
// failure (see status_util.h).
class Filesystem {
 public:
  // Verifies that the root exists and is readable, then maps it to
  // kRootHandle. `backend` must outlive the filesystem.
  static absl::StatusOr<std::unique_ptr<Filesystem>> Open(
      Backend* const backend, const FilesystemOptions& options);
  static absl::StatusOr<std::unique_ptr<Filesystem>> Open(
      Backend* const backend, const FilesystemOptions& options,
      std::unique_ptr<PermissionModel> permissions);

  DISALLOW_COPY_AND_ASSIGN(Filesystem);
  DISALLOW_MOVE(Filesystem);

  uint64_t GetRootHandle() const;
  const std::string& RootPath() const;

  absl::StatusOr<AttributeRecord> GetAttributes(const uint64_t handle);

  // Returns the subset of the user bits in `requested` (S_IRUSR, S_IWUSR,
  // S_IXUSR) the backend grants. Write access implies read access.
  absl::StatusOr<mode_t> CheckAccess(const uint64_t handle,
                                     const mode_t requested);

  // `owner` and `mode` are accepted but not applied to the new object.
  absl::StatusOr<uint64_t> Create(const uint64_t parent,
                                  const std::string& name,
                                  const ObjectKind kind,
                                  const std::string& owner,
                                  const mode_t mode);

  // Children the backend has not shown before receive fresh handles.
  absl::StatusOr<std::vector<DirectoryEntry>> List(const uint64_t handle);

  absl::StatusOr<uint64_t> Lookup(const uint64_t parent,
                                  const std::string& name);

  // The root is its own parent.
  absl::StatusOr<uint64_t> ParentOf(const uint64_t handle);

  // Lookup that also answers "." and "..". An unknown `parent` is NotFound;
  // a child missing from the backend is an empty optional.
  absl::StatusOr<std::optional<uint64_t>> ResolveName(const uint64_t parent,
                                                      const std::string& name);

  absl::StatusOr<FsStat> GetFsStat();

  absl::StatusOr<std::string> PathOf(const uint64_t handle);

 private:
  Filesystem(Backend* const backend, const std::string& root_path,
             std::unique_ptr<PermissionModel> permissions);

  absl::StatusOr<std::unique_ptr<BackendSession>> Connect();

  // Handle already mapped to `path`, or a newly registered one.
  uint64_t HandleForPath(const std::string& path);

  absl::StatusOr<AttributeRecord> StatPath(BackendSession& session,
                                           const std::string& path,
                                           const uint64_t handle);

  void SetOwnershipAndMode(const std::string& path, const std::string& owner,
                           const mode_t mode);

  Backend* const backend_;
  const std::string root_path_;
  AttributeTranslator translator_;
  InodeAllocator allocator_;
  InodeTable table_;
};

}  // namespace gridvfs
