#include "local_backend.h"

#include <dirent.h>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <glog/logging.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "path_util.h"
#include "status_util.h"

namespace gridvfs {
namespace {

bool is_dot_or_dotdot(const char* name) {
  return name[0] == '.' &&
         (name[1] == '\0' || (name[1] == '.' && name[2] == '\0'));
}

absl::StatusOr<ObjectKind> KindOf(const struct stat& sb,
                                  absl::string_view path) {
  if (S_ISDIR(sb.st_mode)) {
    return ObjectKind::kDirectory;
  }
  if (S_ISREG(sb.st_mode)) {
    return ObjectKind::kRegular;
  }
  return absl::UnimplementedError(
      absl::StrCat("'", path, "' is neither a data object nor a collection"));
}

absl::StatusOr<std::string> UserName(const uid_t uid) {
  struct passwd pwd;
  struct passwd* result = nullptr;
  std::vector<char> buf(16384);
  const int err = getpwuid_r(uid, &pwd, buf.data(), buf.size(), &result);
  if (err != 0) {
    return FromErrno(err, absl::StrCat("getpwuid_r(", uid, ")"));
  }
  if (result == nullptr) {
    // Unnamed owners are published under their numeric id.
    return absl::StrCat(uid);
  }
  return std::string{pwd.pw_name};
}

}  // namespace

class LocalSession : public BackendSession {
 public:
  explicit LocalSession(LocalBackend* const backend) : backend_(backend) {}
  ~LocalSession() override { backend_->ReleaseSession(); }
  DISALLOW_COPY_AND_ASSIGN(LocalSession);
  DISALLOW_MOVE(LocalSession);

  absl::StatusOr<ObjectStat> Stat(absl::string_view path) override;
  absl::StatusOr<AccessProbe> ProbeAccess(absl::string_view path) override;
  absl::Status CreateObject(absl::string_view path,
                            const ObjectKind kind) override;
  absl::StatusOr<std::vector<std::string>> ListChildren(
      absl::string_view path) override;
  absl::StatusOr<std::string> LookupUserId(
      absl::string_view qualified_name) override;
  absl::StatusOr<Capacity> QueryCapacity() override;

 private:
  LocalBackend* const backend_;
};

absl::StatusOr<ObjectStat> LocalSession::Stat(absl::string_view path) {
  const auto host_path = backend_->HostPath(path);
  struct stat sb;
  if (lstat(host_path.c_str(), &sb) == -1) {
    return FromErrno(errno, absl::StrCat("lstat(", host_path, ")"));
  }

  auto kind = KindOf(sb, path);
  if (!kind.ok()) {
    return kind.status();
  }
  auto owner = UserName(sb.st_uid);
  if (!owner.ok()) {
    return owner.status();
  }

  ObjectStat stat;
  stat.kind = *kind;
  stat.size = S_ISDIR(sb.st_mode) ? 0 : static_cast<uint64_t>(sb.st_size);
  stat.owner_name = *owner;
  stat.owner_zone = backend_->Zone();
  stat.created_at = absl::TimeFromTimespec(sb.st_ctim);
  stat.modified_at = absl::TimeFromTimespec(sb.st_mtim);
  return stat;
}

absl::StatusOr<AccessProbe> LocalSession::ProbeAccess(absl::string_view path) {
  const auto host_path = backend_->HostPath(path);
  if (faccessat(AT_FDCWD, host_path.c_str(), F_OK, AT_EACCESS) == -1) {
    return FromErrno(errno, absl::StrCat("faccessat(", host_path, ")"));
  }

  AccessProbe probe;
  probe.read = faccessat(AT_FDCWD, host_path.c_str(), R_OK, AT_EACCESS) == 0;
  probe.write = faccessat(AT_FDCWD, host_path.c_str(), W_OK, AT_EACCESS) == 0;
  probe.execute =
      faccessat(AT_FDCWD, host_path.c_str(), X_OK, AT_EACCESS) == 0;
  return probe;
}

absl::Status LocalSession::CreateObject(absl::string_view path,
                                        const ObjectKind kind) {
  const auto host_path = backend_->HostPath(path);
  if (kind == ObjectKind::kDirectory) {
    if (mkdir(host_path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP) == -1) {
      return FromErrno(errno, absl::StrCat("mkdir(", host_path, ")"));
    }
    return absl::OkStatus();
  }

  int fd = open(host_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                S_IRUSR | S_IWUSR | S_IRGRP);
  if (fd == -1) {
    return FromErrno(errno, absl::StrCat("open(", host_path, ")"));
  }
  if (close(fd) == -1) {
    return FromErrno(errno, absl::StrCat("close(", host_path, ")"));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<std::string>> LocalSession::ListChildren(
    absl::string_view path) {
  const auto host_path = backend_->HostPath(path);
  DIR* dp = opendir(host_path.c_str());
  if (dp == nullptr) {
    return FromErrno(errno, absl::StrCat("opendir(", host_path, ")"));
  }

  std::vector<std::string> children;
  absl::Status status;
  while (true) {
    errno = 0;
    struct dirent* entry = readdir(dp);
    if (entry == nullptr) {
      if (errno) {
        status = FromErrno(errno, absl::StrCat("readdir(", host_path, ")"));
      }
      break;  // End of stream
    }
    if (is_dot_or_dotdot(entry->d_name)) {
      continue;
    }

    bool supported = entry->d_type == DT_REG || entry->d_type == DT_DIR;
    if (entry->d_type == DT_UNKNOWN) {
      struct stat sb;
      supported = fstatat(dirfd(dp), entry->d_name, &sb,
                          AT_SYMLINK_NOFOLLOW) == 0 &&
                  (S_ISREG(sb.st_mode) || S_ISDIR(sb.st_mode));
    }
    if (!supported) {
      VLOG(3) << "ListChildren(): skipping '" << entry->d_name << "' in "
              << host_path;
      continue;
    }
    children.push_back(backend_->BackendPath(path, entry->d_name));
  }

  PCHECK(closedir(dp) == 0);
  if (!status.ok()) {
    return status;
  }
  return children;
}

absl::StatusOr<std::string> LocalSession::LookupUserId(
    absl::string_view qualified_name) {
  std::vector<std::string> parts = absl::StrSplit(qualified_name, '#');
  if (parts.size() != 2 || parts[0].empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("malformed user name '", qualified_name, "'"));
  }
  if (parts[1] != backend_->Zone()) {
    return absl::NotFoundError(
        absl::StrCat("zone '", parts[1], "' is not served here"));
  }

  struct passwd pwd;
  struct passwd* result = nullptr;
  std::vector<char> buf(16384);
  const int err =
      getpwnam_r(parts[0].c_str(), &pwd, buf.data(), buf.size(), &result);
  if (err != 0) {
    return FromErrno(err, absl::StrCat("getpwnam_r(", parts[0], ")"));
  }
  if (result == nullptr) {
    // Owners published by number resolve to themselves.
    uint32_t uid;
    if (absl::SimpleAtoi(parts[0], &uid)) {
      return parts[0];
    }
    return absl::NotFoundError(absl::StrCat("no user named '", parts[0], "'"));
  }
  return absl::StrCat(pwd.pw_uid);
}

absl::StatusOr<Capacity> LocalSession::QueryCapacity() {
  const auto host_path = backend_->HostPath("/");
  struct statvfs sv;
  if (statvfs(host_path.c_str(), &sv) == -1) {
    return FromErrno(errno, absl::StrCat("statvfs(", host_path, ")"));
  }
  Capacity capacity;
  capacity.total_bytes = static_cast<uint64_t>(sv.f_blocks) * sv.f_frsize;
  capacity.free_bytes = static_cast<uint64_t>(sv.f_bavail) * sv.f_frsize;
  return capacity;
}

LocalBackend::LocalBackend(const std::string& host_root,
                           const std::string& zone)
    : host_root_(host_root), zone_(zone) {
  CHECK(!host_root_.empty()) << "host root is required";
}

absl::StatusOr<std::unique_ptr<BackendSession>> LocalBackend::Connect() {
  open_sessions_.fetch_add(1, std::memory_order_relaxed);
  return std::make_unique<LocalSession>(this);
}

void LocalBackend::ReleaseSession() {
  CHECK_GT(open_sessions_.fetch_sub(1, std::memory_order_relaxed), 0u);
}

size_t LocalBackend::OpenSessions() const {
  return open_sessions_.load(std::memory_order_relaxed);
}

std::string LocalBackend::HostPath(absl::string_view path) const {
  if (path == "/") {
    return host_root_;
  }
  return absl::StrCat(host_root_, path);
}

std::string LocalBackend::BackendPath(absl::string_view parent,
                                      absl::string_view name) const {
  if (parent == "/") {
    return absl::StrCat("/", name);
  }
  return absl::StrCat(parent, "/", name);
}

const std::string& LocalBackend::Zone() const { return zone_; }

}  // namespace gridvfs
