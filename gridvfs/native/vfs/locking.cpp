#include "locking.h"

#include <glog/logging.h>

namespace gridvfs {

ReaderMutexLock::ReaderMutexLock(absl::Mutex* mu) : mu_(mu) {
  mu_->ReaderLock();
}

ReaderMutexLock::~ReaderMutexLock() { mu_->ReaderUnlock(); }

OrderedMutexLock::OrderedMutexLock(absl::Mutex* first, absl::Mutex* second)
    : first_(first), second_(second) {
  CHECK(first_ != second_) << "OrderedMutexLock requires distinct mutexes";
  first_->Lock();
  second_->Lock();
}

OrderedMutexLock::~OrderedMutexLock() {
  second_->Unlock();
  first_->Unlock();
}

}  // namespace gridvfs
