#include "inode_allocator.h"

#include <glog/logging.h>

namespace gridvfs {

InodeAllocator::InodeAllocator(const uint64_t first) : next_(first) {
  CHECK_GT(first, kRootHandle) << "handle " << kRootHandle << " is reserved";
}

uint64_t InodeAllocator::Next() {
  return next_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t InodeAllocator::Peek() const {
  return next_.load(std::memory_order_relaxed);
}

}  // namespace gridvfs
