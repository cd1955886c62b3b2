#include "inode_allocator.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <functional>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "test_util.h"

using namespace gridvfs;
using namespace test_util;

class InodeAllocatorTest : public ::testing::Test {
  void SetUp() override { InitLogging(); }
};

TEST_F(InodeAllocatorTest, StartsAfterRoot) {
  InodeAllocator allocator;
  ASSERT_EQ(allocator.Peek(), 2);
  ASSERT_EQ(allocator.Next(), 2);
  ASSERT_EQ(allocator.Next(), 3);
  ASSERT_EQ(allocator.Peek(), 4);
}

TEST_F(InodeAllocatorTest, StrictlyIncreasing) {
  InodeAllocator allocator;
  uint64_t last = kRootHandle;
  for (int i = 0; i < 1000; ++i) {
    const auto next = allocator.Next();
    ASSERT_GT(next, last);
    last = next;
  }
}

TEST_F(InodeAllocatorTest, ConcurrentCallsAreDistinct) {
  InodeAllocator allocator;
  const size_t n_threads = std::thread::hardware_concurrency() * 4 + 2;
  const size_t per_thread = 2000;

  std::vector<std::vector<uint64_t>> results(n_threads);
  std::function<void(std::vector<uint64_t>&)> fn =
      [&allocator, per_thread](std::vector<uint64_t>& out) {
        out.reserve(per_thread);
        for (size_t i = 0; i < per_thread; ++i) {
          out.push_back(allocator.Next());
        }
      };

  std::vector<std::thread> threads;
  for (size_t i = 0; i < n_threads; ++i) {
    threads.emplace_back(fn, std::ref(results[i]));
  }
  for (auto& thread : threads) {
    thread.join();
  }

  absl::flat_hash_set<uint64_t> seen;
  for (const auto& out : results) {
    for (size_t i = 0; i < out.size(); ++i) {
      ASSERT_GT(out[i], kRootHandle);
      if (i > 0) {
        // Each thread observes its own values in increasing order.
        ASSERT_GT(out[i], out[i - 1]);
      }
      ASSERT_TRUE(seen.insert(out[i]).second) << "duplicate " << out[i];
    }
  }
  ASSERT_EQ(seen.size(), n_threads * per_thread);
}
