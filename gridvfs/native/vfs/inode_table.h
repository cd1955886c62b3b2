#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "annotations.h"

namespace gridvfs {

// Bidirectional map between handles and normalized backend paths.
//
// Both directions are split into shards, each guarded by its own mutex.
// Register() holds the handle shard and the path shard together (handle
// shard first, always), so a reader never sees a handle without its path
// or the reverse. Lookups take a single reader lock.
class InodeTable {
 public:
  static constexpr size_t kShardCount = 32;

  InodeTable() = default;
  DISALLOW_COPY_AND_ASSIGN(InodeTable);
  DISALLOW_MOVE(InodeTable);

  // AlreadyExists if either side is taken, InvalidArgument if `path` does
  // not normalize. A failed call leaves the table untouched.
  absl::Status Register(const uint64_t handle, absl::string_view path);

  absl::StatusOr<std::string> PathFor(const uint64_t handle);

  // Empty when the path has not been seen yet.
  std::optional<uint64_t> HandleFor(absl::string_view path);

  size_t Size();

 private:
  struct HandleShard {
    absl::Mutex mu;
    absl::flat_hash_map<uint64_t, std::string> paths ABSL_GUARDED_BY(mu);
  };

  struct PathShard {
    absl::Mutex mu;
    absl::flat_hash_map<std::string, uint64_t> handles ABSL_GUARDED_BY(mu);
  };

  HandleShard& ShardFor(const uint64_t handle);
  PathShard& ShardFor(absl::string_view normalized_path);

  std::array<HandleShard, kShardCount> handle_shards_;
  std::array<PathShard, kShardCount> path_shards_;
};

}  // namespace gridvfs
