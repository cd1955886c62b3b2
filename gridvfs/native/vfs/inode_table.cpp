#include "inode_table.h"

#include <glog/logging.h>

#include "absl/hash/hash.h"
#include "absl/strings/str_cat.h"
#include "locking.h"
#include "path_util.h"

namespace gridvfs {

InodeTable::HandleShard& InodeTable::ShardFor(const uint64_t handle) {
  return handle_shards_[absl::Hash<uint64_t>{}(handle) % kShardCount];
}

InodeTable::PathShard& InodeTable::ShardFor(absl::string_view normalized_path) {
  return path_shards_[absl::Hash<absl::string_view>{}(normalized_path) %
                      kShardCount];
}

absl::Status InodeTable::Register(const uint64_t handle,
                                  absl::string_view path) {
  auto normalized = NormalizePath(path);
  if (!normalized.ok()) {
    return normalized.status();
  }

  auto& handle_shard = ShardFor(handle);
  auto& path_shard = ShardFor(*normalized);
  auto lock = OrderedMutexLock{&handle_shard.mu, &path_shard.mu};

  auto by_handle = handle_shard.paths.try_emplace(handle, *normalized);
  if (!by_handle.second) {
    return absl::AlreadyExistsError(
        absl::StrCat("handle ", handle, " is already mapped to '",
                     by_handle.first->second, "'"));
  }

  auto by_path = path_shard.handles.try_emplace(*normalized, handle);
  if (!by_path.second) {
    // Undo the first half before anyone can observe it.
    if (handle_shard.paths.erase(handle) != 1) {
      LOG(FATAL) << "Rollback of handle " << handle << " failed";
    }
    return absl::AlreadyExistsError(
        absl::StrCat("path '", *normalized, "' is already mapped to handle ",
                     by_path.first->second));
  }

  VLOG(3) << "Register " << handle << " <-> '" << *normalized << "'";
  return absl::OkStatus();
}

absl::StatusOr<std::string> InodeTable::PathFor(const uint64_t handle) {
  auto& shard = ShardFor(handle);
  auto lock = ReaderMutexLock{&shard.mu};
  auto p = shard.paths.find(handle);
  if (p == shard.paths.end()) {
    return absl::NotFoundError(absl::StrCat("inode #", handle));
  }
  return p->second;
}

std::optional<uint64_t> InodeTable::HandleFor(absl::string_view path) {
  auto normalized = NormalizePath(path);
  if (!normalized.ok()) {
    VLOG(2) << "HandleFor ignoring " << normalized.status();
    return std::nullopt;
  }

  auto& shard = ShardFor(*normalized);
  auto lock = ReaderMutexLock{&shard.mu};
  auto p = shard.handles.find(*normalized);
  if (p == shard.handles.end()) {
    return std::nullopt;
  }
  return p->second;
}

size_t InodeTable::Size() {
  size_t size = 0;
  for (auto& shard : handle_shards_) {
    auto lock = ReaderMutexLock{&shard.mu};
    size += shard.paths.size();
  }
  return size;
}

}  // namespace gridvfs
