#pragma once

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "annotations.h"

namespace gridvfs {

class ABSL_SCOPED_LOCKABLE ReaderMutexLock {
 public:
  explicit ReaderMutexLock(absl::Mutex* mu) ABSL_SHARED_LOCK_FUNCTION(mu);
  ~ReaderMutexLock() ABSL_UNLOCK_FUNCTION();
  DISALLOW_COPY_AND_ASSIGN(ReaderMutexLock);
  DISALLOW_MOVE(ReaderMutexLock);

 private:
  absl::Mutex* const mu_;
};

// Holds two writer locks for the lifetime of the object. `first` is always
// acquired before `second`, so every caller must agree on which mutex plays
// which role to stay deadlock free.
class ABSL_SCOPED_LOCKABLE OrderedMutexLock {
 public:
  OrderedMutexLock(absl::Mutex* first, absl::Mutex* second)
      ABSL_EXCLUSIVE_LOCK_FUNCTION(first, second);
  ~OrderedMutexLock() ABSL_UNLOCK_FUNCTION();
  DISALLOW_COPY_AND_ASSIGN(OrderedMutexLock);
  DISALLOW_MOVE(OrderedMutexLock);

 private:
  absl::Mutex* const first_;
  absl::Mutex* const second_;
};

}  // namespace gridvfs
