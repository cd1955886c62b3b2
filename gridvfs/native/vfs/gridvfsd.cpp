/*
  FUSE: Filesystem in Userspace
  Copyright (C) 2001-2007  Miklos Szeredi <miklos@szeredi.hu>
  Copyright (C) 2017       Nikolaus Rath <Nikolaus@rath.org>
  Copyright (C) 2018       Valve, Inc
  Copyright (C) 2020       Twitter, Inc

  This program can be distributed under the terms of the GNU GPLv2.
  See the file COPYING.
*/

/** @file
 *
 * Mounts a backend collection through the FUSE low-level API. Every kernel
 * request is answered by the handle-addressed Filesystem; FUSE inode numbers
 * are the Filesystem's handles, so the root is FUSE_ROOT_ID.
 *
 * Only metadata operations are served: lookup, getattr, access, object
 * creation, directory listing and statfs. Data transfer, links, renames and
 * removals are answered with ENOSYS by libfuse.
 */

#define FUSE_USE_VERSION 35

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

// C includes
#include <fuse3/fuse_lowlevel.h>
#include <sys/statvfs.h>
#include <unistd.h>

// C++ includes
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

#include "annotations.h"
#include "filesystem.h"
#include "local_backend.h"
#include "status_util.h"

DEFINE_string(backend_root, "", "Local directory served as the backend");
DEFINE_string(root_path, "/", "Backend path exposed as the mount root");
DEFINE_string(zone, "tempZone", "Zone reported for every owner");
DEFINE_string(mountpoint, "", "Where to mount the filesystem");
DEFINE_bool(debug, false, "Enable FUSE debug output");
DEFINE_bool(multithreaded, true, "Use multi-threaded processing");
DEFINE_int32(max_idle_threads, 10, "Idle worker threads kept by libfuse");
DEFINE_double(attr_timeout, 0.0,
              "Seconds the kernel may cache attributes and entries");

using namespace gridvfs;

static_assert(sizeof(fuse_ino_t) >= sizeof(uint64_t),
              "fuse_ino_t must be at least 64 bits");
static_assert(kRootHandle == FUSE_ROOT_ID,
              "the root handle must be the FUSE root inode");

namespace {

struct Daemon {
  Daemon() = default;
  DISALLOW_COPY_AND_ASSIGN(Daemon);
  DISALLOW_MOVE(Daemon);

  std::unique_ptr<LocalBackend> backend;
  std::unique_ptr<Filesystem> filesystem;
  double timeout{0};
};

// Listing materialized at opendir() and replayed by readdir().
struct DirHandle {
  std::vector<DirectoryEntry> entries;
};

Daemon& GetDaemon(fuse_req_t req) {
  return *static_cast<Daemon*>(fuse_req_userdata(req));
}

DirHandle* get_dir_handle(fuse_file_info* fi) {
  return reinterpret_cast<DirHandle*>(fi->fh);
}

std::string RequestOwner(fuse_req_t req) {
  return absl::StrCat(fuse_req_ctx(req)->uid);
}

void reply_status(fuse_req_t req, const absl::Status& status) {
  const int err = ToErrno(status);
  if (err == EIO) {
    LOG(WARNING) << "Request failed: " << status;
  }
  fuse_reply_err(req, err);
}

// Fills `e` for `handle`. Returns an errno value.
int fill_entry(Daemon& daemon, const uint64_t handle, fuse_entry_param* e) {
  memset(e, 0, sizeof(*e));
  e->attr_timeout = daemon.timeout;
  e->entry_timeout = daemon.timeout;

  auto attr = daemon.filesystem->GetAttributes(handle);
  if (!attr.ok()) {
    return ToErrno(attr.status());
  }
  e->ino = handle;
  ToStat(*attr, &e->attr);
  return 0;
}

void gvfs_init(void* userdata, fuse_conn_info* conn) {
  GRIDVFS_UNUSED(userdata);
  // Handles are stable for the life of the process.
  if (conn->capable & FUSE_CAP_EXPORT_SUPPORT) {
    conn->want |= FUSE_CAP_EXPORT_SUPPORT;
  }
}

void gvfs_lookup(fuse_req_t req, fuse_ino_t parent, const char* name) {
  VLOG(4) << "lookup(): name=" << name << ", parent=" << parent;
  auto& daemon = GetDaemon(req);

  fuse_entry_param e{};
  // "." and ".." arrive here when the mount is exported.
  auto handle = daemon.filesystem->ResolveName(parent, name);
  if (!handle.ok()) {
    reply_status(req, handle.status());
    return;
  }
  if (!handle->has_value()) {
    // Negative entry, so the kernel may cache the miss.
    e.attr_timeout = daemon.timeout;
    e.entry_timeout = daemon.timeout;
    e.ino = e.attr.st_ino = 0;
    fuse_reply_entry(req, &e);
    return;
  }

  const int err = fill_entry(daemon, **handle, &e);
  if (err) {
    fuse_reply_err(req, err);
    return;
  }
  fuse_reply_entry(req, &e);
}

void gvfs_forget(fuse_req_t req, fuse_ino_t ino, uint64_t nlookup) {
  // Handles are never reclaimed.
  VLOG(4) << "forget(): inode " << ino << " by " << nlookup;
  fuse_reply_none(req);
}

void gvfs_forget_multi(fuse_req_t req, size_t count,
                       fuse_forget_data* forgets) {
  GRIDVFS_UNUSED(forgets);
  VLOG(4) << "forget_multi(): " << count << " inodes";
  fuse_reply_none(req);
}

void gvfs_getattr(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi) {
  GRIDVFS_UNUSED(fi);
  auto& daemon = GetDaemon(req);
  auto attr = daemon.filesystem->GetAttributes(ino);
  if (!attr.ok()) {
    reply_status(req, attr.status());
    return;
  }
  struct stat sb;
  ToStat(*attr, &sb);
  fuse_reply_attr(req, &sb, daemon.timeout);
}

void gvfs_access(fuse_req_t req, fuse_ino_t ino, int mask) {
  auto& daemon = GetDaemon(req);
  if (mask == F_OK) {
    auto attr = daemon.filesystem->GetAttributes(ino);
    reply_status(req, attr.status());
    return;
  }

  // R_OK, W_OK and X_OK line up with the user permission bits.
  const mode_t requested = static_cast<mode_t>(mask & (R_OK | W_OK | X_OK))
                           << 6;
  auto granted = daemon.filesystem->CheckAccess(ino, requested);
  if (!granted.ok()) {
    reply_status(req, granted.status());
    return;
  }
  fuse_reply_err(req, (*granted == requested) ? 0 : EACCES);
}

void make_object(fuse_req_t req, fuse_ino_t parent, const char* name,
                 const ObjectKind kind, mode_t mode, fuse_file_info* fi) {
  auto& daemon = GetDaemon(req);
  auto handle =
      daemon.filesystem->Create(parent, name, kind, RequestOwner(req), mode);
  if (!handle.ok()) {
    reply_status(req, handle.status());
    return;
  }

  fuse_entry_param e;
  const int err = fill_entry(daemon, *handle, &e);
  if (err) {
    fuse_reply_err(req, err);
    return;
  }
  if (fi != nullptr) {
    fi->fh = 0;
    fuse_reply_create(req, &e, fi);
  } else {
    fuse_reply_entry(req, &e);
  }
}

void gvfs_mknod(fuse_req_t req, fuse_ino_t parent, const char* name,
                mode_t mode, dev_t rdev) {
  GRIDVFS_UNUSED(rdev);
  if (!S_ISREG(mode)) {
    fuse_reply_err(req, ENOTSUP);
    return;
  }
  make_object(req, parent, name, ObjectKind::kRegular, mode, nullptr);
}

void gvfs_mkdir(fuse_req_t req, fuse_ino_t parent, const char* name,
                mode_t mode) {
  make_object(req, parent, name, ObjectKind::kDirectory, S_IFDIR | mode,
              nullptr);
}

void gvfs_create(fuse_req_t req, fuse_ino_t parent, const char* name,
                 mode_t mode, fuse_file_info* fi) {
  make_object(req, parent, name, ObjectKind::kRegular, mode, fi);
}

void gvfs_opendir(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi) {
  auto& daemon = GetDaemon(req);
  auto entries = daemon.filesystem->List(ino);
  if (!entries.ok()) {
    reply_status(req, entries.status());
    return;
  }

  auto d = new (std::nothrow) DirHandle;
  if (d == nullptr) {
    fuse_reply_err(req, ENOMEM);
    return;
  }
  d->entries = std::move(*entries);
  fi->fh = reinterpret_cast<uint64_t>(d);
  fi->keep_cache = 0;
  fuse_reply_open(req, fi);
}

void do_readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                fuse_file_info* fi, const bool plus) {
  auto& daemon = GetDaemon(req);
  auto d = get_dir_handle(fi);
  VLOG(4) << "readdir(): inode " << ino << " started with offset " << offset;

  auto buf = std::unique_ptr<char[]>(new (std::nothrow) char[size]);
  if (!buf) {
    fuse_reply_err(req, ENOMEM);
    return;
  }
  char* p = buf.get();
  size_t rem = size;

  for (size_t i = static_cast<size_t>(offset); i < d->entries.size(); ++i) {
    const auto& entry = d->entries[i];
    const off_t next = static_cast<off_t>(i + 1);
    size_t entsize;
    if (plus) {
      fuse_entry_param e{};
      e.ino = entry.handle;
      e.attr_timeout = daemon.timeout;
      e.entry_timeout = daemon.timeout;
      ToStat(entry.attributes, &e.attr);
      entsize = fuse_add_direntry_plus(req, p, rem, entry.name.c_str(), &e,
                                       next);
    } else {
      struct stat sb;
      ToStat(entry.attributes, &sb);
      entsize = fuse_add_direntry(req, p, rem, entry.name.c_str(), &sb, next);
    }
    if (entsize > rem) {
      VLOG(4) << "readdir(): buffer full, returning data.";
      break;
    }
    p += entsize;
    rem -= entsize;
  }

  fuse_reply_buf(req, buf.get(), size - rem);
}

void gvfs_readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                  fuse_file_info* fi) {
  do_readdir(req, ino, size, offset, fi, false);
}

void gvfs_readdirplus(fuse_req_t req, fuse_ino_t ino, size_t size,
                      off_t offset, fuse_file_info* fi) {
  do_readdir(req, ino, size, offset, fi, true);
}

void gvfs_releasedir(fuse_req_t req, fuse_ino_t ino, fuse_file_info* fi) {
  GRIDVFS_UNUSED(ino);
  delete get_dir_handle(fi);
  fuse_reply_err(req, 0);
}

void gvfs_statfs(fuse_req_t req, fuse_ino_t ino) {
  GRIDVFS_UNUSED(ino);
  auto& daemon = GetDaemon(req);
  auto stat = daemon.filesystem->GetFsStat();
  if (!stat.ok()) {
    reply_status(req, stat.status());
    return;
  }

  constexpr unsigned long kBlockSize = 4096;
  struct statvfs sv {};
  sv.f_bsize = kBlockSize;
  sv.f_frsize = kBlockSize;
  sv.f_blocks = stat->total_bytes / kBlockSize;
  sv.f_bfree = (stat->total_bytes - stat->used_bytes) / kBlockSize;
  sv.f_bavail = sv.f_bfree;
  sv.f_files = stat->total_files;
  sv.f_ffree = stat->total_files - stat->used_files;
  sv.f_favail = sv.f_ffree;
  sv.f_namemax = 255;
  fuse_reply_statfs(req, &sv);
}

void assign_operations(fuse_lowlevel_ops& ops) {
  ops.init = gvfs_init;
  ops.lookup = gvfs_lookup;
  ops.forget = gvfs_forget;
  ops.forget_multi = gvfs_forget_multi;
  ops.getattr = gvfs_getattr;
  ops.access = gvfs_access;
  ops.mknod = gvfs_mknod;
  ops.mkdir = gvfs_mkdir;
  ops.create = gvfs_create;
  ops.opendir = gvfs_opendir;
  ops.readdir = gvfs_readdir;
  ops.readdirplus = gvfs_readdirplus;
  ops.releasedir = gvfs_releasedir;
  ops.statfs = gvfs_statfs;
}

}  // namespace

int main(int argc, char* argv[]) {
  google::SetCommandLineOption("GLOG_stderrthreshold", "1");
  google::SetCommandLineOption("GLOG_alsologtostderr", "true");
  google::SetCommandLineOption("GLOG_colorlogtostderr", "true");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_backend_root.empty()) {
    LOG(WARNING) << "No backend root specified!";
    exit(1);
  }

  if (FLAGS_mountpoint.empty()) {
    LOG(WARNING) << "No mountpoint specified!";
    exit(1);
  }

  LOG(INFO) << "Projecting '" << FLAGS_backend_root << "' (zone "
            << FLAGS_zone << ") -> '" << FLAGS_mountpoint << "'";

  Daemon daemon;
  daemon.timeout = FLAGS_attr_timeout;
  daemon.backend = std::make_unique<LocalBackend>(FLAGS_backend_root,
                                                  FLAGS_zone);

  FilesystemOptions options;
  options.root_path = FLAGS_root_path;
  auto filesystem = Filesystem::Open(daemon.backend.get(), options);
  if (!filesystem.ok()) {
    LOG(FATAL) << "Failed to open '" << FLAGS_root_path
               << "': " << filesystem.status();
  }
  daemon.filesystem = std::move(*filesystem);

  // Initialize fuse
  int ret = 1;
  fuse_args args = FUSE_ARGS_INIT(0, nullptr);
  if (fuse_opt_add_arg(&args, argv[0]) || fuse_opt_add_arg(&args, "-o") ||
      fuse_opt_add_arg(&args, "fsname=gridvfs") ||
      (FLAGS_debug && fuse_opt_add_arg(&args, "-odebug"))) {
    LOG(FATAL) << "Out of memory";
  }

  fuse_lowlevel_ops gvfs_oper{};
  assign_operations(gvfs_oper);
  auto se = fuse_session_new(&args, &gvfs_oper, sizeof(gvfs_oper), &daemon);
  if (se == nullptr) goto err_out1;

  if (fuse_set_signal_handlers(se) != 0) goto err_out2;

  // Don't apply umask, use modes exactly as specified
  umask(0);

  // Mount and run main loop
  struct fuse_loop_config loop_config;
  loop_config.clone_fd = 0;
  loop_config.max_idle_threads = FLAGS_max_idle_threads;

  if (fuse_session_mount(se, FLAGS_mountpoint.c_str()) != 0) goto err_out3;

  if (!FLAGS_multithreaded) {
    ret = fuse_session_loop(se);
  } else {
    ret = fuse_session_loop_mt(se, &loop_config);
  }

  fuse_session_unmount(se);
  LOG(INFO) << "Unmounted '" << FLAGS_mountpoint << "'";

err_out3:
  fuse_remove_signal_handlers(se);
err_out2:
  fuse_session_destroy(se);
err_out1:
  fuse_opt_free_args(&args);

  return ret ? 1 : 0;
}
