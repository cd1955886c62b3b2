#pragma once

#include <atomic>
#include <cstdint>

#include "annotations.h"

namespace gridvfs {

// Handle 1 belongs to the storage root. It is also FUSE_ROOT_ID, which is
// what lets the daemon hand handles to the kernel unchanged.
constexpr uint64_t kRootHandle = 1;
constexpr uint64_t kFirstAllocatedHandle = kRootHandle + 1;

// Hands out handles in strictly increasing order. Handles are never
// returned to the allocator.
class InodeAllocator {
 public:
  explicit InodeAllocator(const uint64_t first = kFirstAllocatedHandle);
  DISALLOW_COPY_AND_ASSIGN(InodeAllocator);
  DISALLOW_MOVE(InodeAllocator);

  uint64_t Next();

  // The value the next call to Next() would return.
  uint64_t Peek() const;

 private:
  std::atomic<uint64_t> next_;
};

}  // namespace gridvfs
