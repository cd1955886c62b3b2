#include "memory_backend.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "path_util.h"

namespace gridvfs {

class MemorySession : public BackendSession {
 public:
  explicit MemorySession(MemoryBackend* const backend) : backend_(backend) {}
  ~MemorySession() override { backend_->ReleaseSession(); }
  DISALLOW_COPY_AND_ASSIGN(MemorySession);
  DISALLOW_MOVE(MemorySession);

  absl::StatusOr<ObjectStat> Stat(absl::string_view path) override {
    return backend_->Stat(path);
  }

  absl::StatusOr<AccessProbe> ProbeAccess(absl::string_view path) override {
    return backend_->ProbeAccess(path);
  }

  absl::Status CreateObject(absl::string_view path,
                            const ObjectKind kind) override {
    return backend_->CreateObject(path, kind);
  }

  absl::StatusOr<std::vector<std::string>> ListChildren(
      absl::string_view path) override {
    return backend_->ListChildren(path);
  }

  absl::StatusOr<std::string> LookupUserId(
      absl::string_view qualified_name) override {
    return backend_->LookupUserId(qualified_name);
  }

  absl::StatusOr<Capacity> QueryCapacity() override {
    return backend_->QueryCapacity();
  }

 private:
  MemoryBackend* const backend_;
};

MemoryBackend::MemoryBackend(const std::string& root,
                             const std::string& owner_name,
                             const std::string& zone,
                             const std::string& owner_id)
    : owner_name_(owner_name), zone_(zone) {
  auto normalized = NormalizePath(root);
  CHECK(normalized.ok()) << normalized.status();

  auto lock = absl::MutexLock{&mu_};
  users_[absl::StrCat(owner_name_, "#", zone_)] = owner_id;
  capacity_ = Capacity{uint64_t{1} << 40, uint64_t{1} << 39};

  // Create every ancestor of the root, then the root itself.
  std::string prefix;
  objects_.emplace("/", ObjectStat{ObjectKind::kDirectory, 0, owner_name_,
                                   zone_, absl::Now(), absl::Now()});
  for (const auto& component :
       absl::StrSplit(*normalized, kPathSeparatorChar, absl::SkipEmpty())) {
    absl::StrAppend(&prefix, "/", component);
    auto status = Insert(prefix, ObjectKind::kDirectory, 0, owner_name_);
    CHECK(status.ok()) << status;
  }
}

absl::StatusOr<std::unique_ptr<BackendSession>> MemoryBackend::Connect() {
  {
    auto lock = absl::MutexLock{&mu_};
    if (!connect_failure_.ok()) {
      return connect_failure_;
    }
  }
  open_sessions_.fetch_add(1, std::memory_order_relaxed);
  sessions_opened_.fetch_add(1, std::memory_order_relaxed);
  return std::make_unique<MemorySession>(this);
}

void MemoryBackend::ReleaseSession() {
  CHECK_GT(open_sessions_.fetch_sub(1, std::memory_order_relaxed), 0u);
}

size_t MemoryBackend::OpenSessions() const {
  return open_sessions_.load(std::memory_order_relaxed);
}

size_t MemoryBackend::SessionsOpened() const {
  return sessions_opened_.load(std::memory_order_relaxed);
}

absl::Status MemoryBackend::Insert(const std::string& path,
                                   const ObjectKind kind, const uint64_t size,
                                   const std::string& owner_name) {
  auto parent = objects_.find(ParentPath(path));
  if (parent == objects_.end()) {
    return absl::NotFoundError(absl::StrCat("no parent for '", path, "'"));
  }
  if (parent->second.kind != ObjectKind::kDirectory) {
    return absl::NotFoundError(
        absl::StrCat("parent of '", path, "' is not a collection"));
  }

  const auto now = absl::Now();
  auto result = objects_.try_emplace(
      path, ObjectStat{kind, size, owner_name, zone_, now, now});
  if (!result.second) {
    return absl::AlreadyExistsError(absl::StrCat("'", path, "' exists"));
  }
  return absl::OkStatus();
}

absl::Status MemoryBackend::AddObject(const std::string& path,
                                      const ObjectKind kind,
                                      const uint64_t size) {
  return AddObject(path, kind, size, owner_name_);
}

absl::Status MemoryBackend::AddObject(const std::string& path,
                                      const ObjectKind kind,
                                      const uint64_t size,
                                      const std::string& owner_name) {
  auto normalized = NormalizePath(path);
  if (!normalized.ok()) {
    return normalized.status();
  }
  auto lock = absl::MutexLock{&mu_};
  if (objects_.contains(*normalized)) {
    return absl::AlreadyExistsError(absl::StrCat("'", *normalized, "' exists"));
  }
  return Insert(*normalized, kind, size, owner_name);
}

void MemoryBackend::AddUser(const std::string& qualified_name,
                            const std::string& id) {
  auto lock = absl::MutexLock{&mu_};
  users_[qualified_name] = id;
}

void MemoryBackend::SetAccess(const std::string& path,
                              const AccessProbe& probe) {
  auto lock = absl::MutexLock{&mu_};
  access_[path] = probe;
}

void MemoryBackend::SetCapacity(const Capacity& capacity) {
  auto lock = absl::MutexLock{&mu_};
  capacity_ = capacity;
}

void MemoryBackend::InjectFailure(const Operation op,
                                  const absl::Status& status) {
  auto lock = absl::MutexLock{&mu_};
  failures_[op] = status;
}

void MemoryBackend::ClearFailures() {
  auto lock = absl::MutexLock{&mu_};
  failures_.clear();
  connect_failure_ = absl::OkStatus();
}

void MemoryBackend::SetConnectFailure(const absl::Status& status) {
  auto lock = absl::MutexLock{&mu_};
  connect_failure_ = status;
}

absl::Status MemoryBackend::FailureFor(const Operation op) {
  auto lock = absl::MutexLock{&mu_};
  auto p = failures_.find(op);
  if (p == failures_.end()) {
    return absl::OkStatus();
  }
  return p->second;
}

absl::StatusOr<ObjectStat> MemoryBackend::Stat(absl::string_view path) {
  auto failure = FailureFor(Operation::kStat);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  auto p = objects_.find(path);
  if (p == objects_.end()) {
    return absl::NotFoundError(absl::StrCat("'", path, "' does not exist"));
  }
  return p->second;
}

absl::StatusOr<AccessProbe> MemoryBackend::ProbeAccess(absl::string_view path) {
  auto failure = FailureFor(Operation::kProbeAccess);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  if (!objects_.contains(path)) {
    return absl::NotFoundError(absl::StrCat("'", path, "' does not exist"));
  }
  auto p = access_.find(path);
  if (p == access_.end()) {
    return AccessProbe{true, true, true};
  }
  return p->second;
}

absl::Status MemoryBackend::CreateObject(absl::string_view path,
                                         const ObjectKind kind) {
  auto failure = FailureFor(Operation::kCreateObject);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  const auto key = std::string{path};
  if (objects_.contains(key)) {
    return absl::AlreadyExistsError(absl::StrCat("'", key, "' exists"));
  }
  auto parent_access = access_.find(ParentPath(key));
  if (parent_access != access_.end() && !parent_access->second.write) {
    return absl::PermissionDeniedError(
        absl::StrCat("no write access to the parent of '", key, "'"));
  }
  return Insert(key, kind, 0, owner_name_);
}

absl::StatusOr<std::vector<std::string>> MemoryBackend::ListChildren(
    absl::string_view path) {
  auto failure = FailureFor(Operation::kListChildren);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  auto dir = objects_.find(path);
  if (dir == objects_.end()) {
    return absl::NotFoundError(absl::StrCat("'", path, "' does not exist"));
  }
  if (dir->second.kind != ObjectKind::kDirectory) {
    return absl::InvalidArgumentError(
        absl::StrCat("'", path, "' is not a collection"));
  }

  const auto prefix = (path == "/") ? std::string{"/"}
                                    : absl::StrCat(path, "/");
  std::vector<std::string> children;
  for (auto p = objects_.lower_bound(prefix); p != objects_.end(); ++p) {
    if (p->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    if (p->first.size() == prefix.size() ||
        p->first.find(kPathSeparatorChar, prefix.size()) != std::string::npos) {
      continue;
    }
    children.push_back(p->first);
  }
  return children;
}

absl::StatusOr<std::string> MemoryBackend::LookupUserId(
    absl::string_view qualified_name) {
  auto failure = FailureFor(Operation::kLookupUserId);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  auto p = users_.find(qualified_name);
  if (p == users_.end()) {
    return absl::NotFoundError(
        absl::StrCat("no user named '", qualified_name, "'"));
  }
  return p->second;
}

absl::StatusOr<Capacity> MemoryBackend::QueryCapacity() {
  auto failure = FailureFor(Operation::kQueryCapacity);
  if (!failure.ok()) {
    return failure;
  }
  auto lock = absl::MutexLock{&mu_};
  return capacity_;
}

}  // namespace gridvfs
