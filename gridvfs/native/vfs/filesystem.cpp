#include "filesystem.h"

#include <glog/logging.h>

#include <ios>
#include <limits>

#include "absl/strings/str_cat.h"
#include "path_util.h"
#include "status_util.h"

namespace gridvfs {

absl::StatusOr<std::unique_ptr<Filesystem>> Filesystem::Open(
    Backend* const backend, const FilesystemOptions& options) {
  return Open(backend, options, std::make_unique<FixedPermissionModel>());
}

absl::StatusOr<std::unique_ptr<Filesystem>> Filesystem::Open(
    Backend* const backend, const FilesystemOptions& options,
    std::unique_ptr<PermissionModel> permissions) {
  if (backend == nullptr) {
    return absl::InvalidArgumentError("null backend");
  }
  if (permissions == nullptr) {
    return absl::InvalidArgumentError("null permission model");
  }
  auto root = NormalizePath(options.root_path);
  if (!root.ok()) {
    return root.status();
  }

  LOG(INFO) << "Establishing root at '" << *root << "'";
  {
    auto session = backend->Connect();
    if (!session.ok()) {
      return AsIoFailure(session.status(), "connecting to the backend");
    }
    auto stat = (*session)->Stat(*root);
    if (!stat.ok()) {
      if (absl::IsNotFound(stat.status())) {
        return absl::NotFoundError(
            absl::StrCat("cannot establish root at '", *root, "'"));
      }
      return TranslateBackendStatus(stat.status(), "stat of the root");
    }
    if (stat->kind != ObjectKind::kDirectory) {
      return absl::InvalidArgumentError(
          absl::StrCat("root '", *root, "' is not a collection"));
    }
    auto probe = (*session)->ProbeAccess(*root);
    if (!probe.ok()) {
      return AsIoFailure(probe.status(), "probing the root");
    }
    if (!probe->read) {
      return absl::NotFoundError(
          absl::StrCat("cannot establish root at '", *root, "': unreadable"));
    }
  }

  auto fs = std::unique_ptr<Filesystem>(
      new Filesystem(backend, *root, std::move(permissions)));
  auto status = fs->table_.Register(kRootHandle, *root);
  CHECK(status.ok()) << "Mapping the root failed: " << status;
  LOG(INFO) << "Root '" << *root << "' is inode #" << kRootHandle;
  return fs;
}

Filesystem::Filesystem(Backend* const backend, const std::string& root_path,
                       std::unique_ptr<PermissionModel> permissions)
    : backend_(backend),
      root_path_(root_path),
      translator_(std::move(permissions)) {}

uint64_t Filesystem::GetRootHandle() const { return kRootHandle; }

const std::string& Filesystem::RootPath() const { return root_path_; }

absl::StatusOr<std::string> Filesystem::PathOf(const uint64_t handle) {
  return table_.PathFor(handle);
}

absl::StatusOr<std::unique_ptr<BackendSession>> Filesystem::Connect() {
  auto session = backend_->Connect();
  if (!session.ok()) {
    return AsIoFailure(session.status(), "connecting to the backend");
  }
  return session;
}

uint64_t Filesystem::HandleForPath(const std::string& path) {
  if (auto known = table_.HandleFor(path)) {
    return *known;
  }

  const uint64_t handle = allocator_.Next();
  auto status = table_.Register(handle, path);
  if (status.ok()) {
    VLOG(2) << "Allocated inode #" << handle << " for '" << path << "'";
    return handle;
  }
  CHECK(absl::IsAlreadyExists(status)) << status;

  auto owner = table_.PathFor(handle);
  if (owner.ok()) {
    LOG(FATAL) << "Freshly allocated inode #" << handle
               << " is already mapped to '" << *owner << "'";
  }

  // Another request mapped the path between our check and our insert.
  auto winner = table_.HandleFor(path);
  if (!winner) {
    LOG(FATAL) << "Path '" << path << "' collided but has no handle: "
               << status;
  }
  VLOG(2) << "Adopted inode #" << *winner << " for '" << path << "'";
  return *winner;
}

absl::StatusOr<AttributeRecord> Filesystem::StatPath(BackendSession& session,
                                                     const std::string& path,
                                                     const uint64_t handle) {
  VLOG(3) << "StatPath(): path=" << path << ", inode=" << handle;
  auto stat = session.Stat(path);
  if (!stat.ok()) {
    return TranslateBackendStatus(stat.status(), absl::StrCat("stat ", path));
  }
  return translator_.ToAttributes(handle, *stat, session);
}

absl::StatusOr<AttributeRecord> Filesystem::GetAttributes(
    const uint64_t handle) {
  auto path = table_.PathFor(handle);
  if (!path.ok()) {
    return path.status();
  }
  auto session = Connect();
  if (!session.ok()) {
    return session.status();
  }
  return StatPath(**session, *path, handle);
}

absl::StatusOr<mode_t> Filesystem::CheckAccess(const uint64_t handle,
                                               const mode_t requested) {
  auto path = table_.PathFor(handle);
  if (!path.ok()) {
    return path.status();
  }
  VLOG(2) << "access(): path=" << *path << ", mode=0" << std::oct
          << requested;

  auto session = Connect();
  if (!session.ok()) {
    return session.status();
  }
  auto probe = (*session)->ProbeAccess(*path);
  if (!probe.ok()) {
    LOG(ERROR) << "Getting access for '" << *path
               << "' failed: " << probe.status();
    return AsIoFailure(probe.status(), absl::StrCat("access ", *path));
  }
  return GrantedAccess(requested & kAccessUserMask, *probe);
}

absl::StatusOr<uint64_t> Filesystem::Create(const uint64_t parent,
                                            const std::string& name,
                                            const ObjectKind kind,
                                            const std::string& owner,
                                            const mode_t mode) {
  auto status = ValidateName(name);
  if (!status.ok()) {
    return status;
  }
  if (owner.empty()) {
    return absl::InvalidArgumentError("empty owner");
  }

  auto parent_path = table_.PathFor(parent);
  if (!parent_path.ok()) {
    return parent_path.status();
  }
  auto path = JoinPath(*parent_path, name);
  if (!path.ok()) {
    return path.status();
  }

  VLOG(2) << "create(): parent=" << parent << ", name=" << name
          << ", kind=" << ObjectKindName(kind) << ", owner=" << owner
          << ", mode=0" << std::oct << mode;

  {
    auto session = Connect();
    if (!session.ok()) {
      return session.status();
    }
    status = (*session)->CreateObject(*path, kind);
    if (!status.ok()) {
      LOG(ERROR) << "Creating '" << *path << "' failed: " << status;
      return TranslateBackendStatus(status, absl::StrCat("create ", *path));
    }
  }

  const uint64_t handle = HandleForPath(*path);
  SetOwnershipAndMode(*path, owner, mode);
  return handle;
}

void Filesystem::SetOwnershipAndMode(const std::string& path,
                                     const std::string& owner,
                                     const mode_t mode) {
  // TODO: Apply owner and mode once the backend's ACL API is wired in.
  VLOG(3) << "SetOwnershipAndMode(): not applied to '" << path
          << "' (owner=" << owner << ", mode=0" << std::oct << mode << ")";
}

absl::StatusOr<std::vector<DirectoryEntry>> Filesystem::List(
    const uint64_t handle) {
  auto path = table_.PathFor(handle);
  if (!path.ok()) {
    return path.status();
  }
  auto session = Connect();
  if (!session.ok()) {
    return session.status();
  }

  auto children = (*session)->ListChildren(*path);
  if (!children.ok()) {
    return TranslateBackendStatus(children.status(),
                                  absl::StrCat("list ", *path));
  }

  std::vector<DirectoryEntry> entries;
  entries.reserve(children->size());
  for (const auto& child : *children) {
    auto normalized = NormalizePath(child);
    if (!normalized.ok()) {
      return AsIoFailure(normalized.status(),
                         absl::StrCat("listing ", *path));
    }
    auto stat = (*session)->Stat(*normalized);
    if (absl::IsNotFound(stat.status())) {
      VLOG(3) << "list(): '" << *normalized << "' vanished during listing";
      continue;
    }
    if (!stat.ok()) {
      return TranslateBackendStatus(stat.status(),
                                    absl::StrCat("stat ", *normalized));
    }

    const uint64_t child_handle = HandleForPath(*normalized);
    auto attributes = translator_.ToAttributes(child_handle, *stat, **session);
    if (!attributes.ok()) {
      return attributes.status();
    }
    entries.push_back(
        DirectoryEntry{BaseName(*normalized), child_handle, *attributes});
  }

  VLOG(2) << "list(): " << entries.size() << " entries in '" << *path << "'";
  return entries;
}

absl::StatusOr<uint64_t> Filesystem::Lookup(const uint64_t parent,
                                            const std::string& name) {
  auto status = ValidateName(name);
  if (!status.ok()) {
    return status;
  }
  auto parent_path = table_.PathFor(parent);
  if (!parent_path.ok()) {
    return parent_path.status();
  }
  auto path = JoinPath(*parent_path, name);
  if (!path.ok()) {
    return path.status();
  }

  if (auto known = table_.HandleFor(*path)) {
    return *known;
  }

  auto session = Connect();
  if (!session.ok()) {
    return session.status();
  }
  auto stat = (*session)->Stat(*path);
  if (!stat.ok()) {
    return TranslateBackendStatus(stat.status(), absl::StrCat("stat ", *path));
  }
  return HandleForPath(*path);
}

absl::StatusOr<uint64_t> Filesystem::ParentOf(const uint64_t handle) {
  auto path = table_.PathFor(handle);
  if (!path.ok()) {
    return path.status();
  }
  if (handle == kRootHandle || *path == root_path_) {
    return kRootHandle;
  }
  return HandleForPath(ParentPath(*path));
}

absl::StatusOr<std::optional<uint64_t>> Filesystem::ResolveName(
    const uint64_t parent, const std::string& name) {
  auto parent_path = table_.PathFor(parent);
  if (!parent_path.ok()) {
    return parent_path.status();
  }
  if (name == ".") {
    return std::optional<uint64_t>(parent);
  }
  if (name == "..") {
    auto up = ParentOf(parent);
    if (!up.ok()) {
      return up.status();
    }
    return std::optional<uint64_t>(*up);
  }

  auto handle = Lookup(parent, name);
  if (absl::IsNotFound(handle.status())) {
    VLOG(3) << "ResolveName(): no '" << name << "' in '" << *parent_path
            << "'";
    return std::optional<uint64_t>();
  }
  if (!handle.ok()) {
    return handle.status();
  }
  return std::optional<uint64_t>(*handle);
}

absl::StatusOr<FsStat> Filesystem::GetFsStat() {
  auto session = Connect();
  if (!session.ok()) {
    return session.status();
  }
  auto capacity = (*session)->QueryCapacity();
  if (!capacity.ok()) {
    return AsIoFailure(capacity.status(), "querying capacity");
  }
  if (capacity->free_bytes > capacity->total_bytes) {
    return IoFailure(absl::StrCat("backend reports ", capacity->free_bytes,
                                  " free of ", capacity->total_bytes,
                                  " bytes"));
  }

  FsStat stat;
  stat.total_bytes = capacity->total_bytes;
  stat.total_files = std::numeric_limits<uint64_t>::max();
  stat.used_bytes = capacity->total_bytes - capacity->free_bytes;
  stat.used_files = table_.Size();
  return stat;
}

}  // namespace gridvfs
