#include "test_util.h"

#include <fts.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <mutex>
#include <utility>

#include "glog/logging.h"

namespace test_util {

int RecursiveDelete(const std::string& dir) {
  bool ret = true;
  FTS* ftsp = NULL;
  FTSENT* curr;

  char* paths[] = {const_cast<char*>(dir.c_str()), nullptr};

  ftsp = fts_open(paths, FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, nullptr);
  if (!ftsp) {
    LOG(ERROR) << "fts_open error for path '" << dir << ": " << strerror(errno);
    ret = false;
    goto finish;
  }

  while ((curr = fts_read(ftsp))) {
    switch (curr->fts_info) {
      case FTS_NS:
      case FTS_DNR:
      case FTS_ERR:
        LOG(ERROR) << "fts_read error for path '" << curr->fts_accpath
                   << "': " << strerror(curr->fts_errno);
        ret = false;
        break;

      case FTS_D:
        // Directories are deleted in post-order (FTS_DP).
        break;

      case FTS_DP:
      case FTS_F:
      case FTS_SL:
      case FTS_SLNONE:
      case FTS_DEFAULT:
        if (remove(curr->fts_accpath) < 0) {
          LOG(ERROR) << "Could not remove '" << curr->fts_accpath
                     << "': " << strerror(errno);
          ret = false;
        }
        break;

      default:
        break;
    }
  }

finish:
  if (ftsp) {
    fts_close(ftsp);
  }

  return ret;
}

std::unique_ptr<gridvfs::Filesystem> OpenFilesystem(gridvfs::Backend* backend,
                                                    const std::string& root) {
  gridvfs::FilesystemOptions options;
  options.root_path = root;
  auto fs = gridvfs::Filesystem::Open(backend, options);
  CHECK(fs.ok()) << "Opening '" << root << "' failed: " << fs.status();
  return std::move(*fs);
}

Dir::Dir(const std::string& path, DIR* dir) : path_(path), dir_(dir) {}

Dir::Dir(Dir&& other) : path_(std::move(other.path_)), dir_(other.dir_) {
  other.dir_ = nullptr;
}

Dir::~Dir() {
  if (dir_ != nullptr) {
    closedir(dir_);
  }
}

File Dir::CreateFile(const std::string& name, const std::string& content) {
  auto path = path_ + "/" + name;
  int fd = open(path.c_str(), O_CREAT | O_RDWR, S_IRUSR | S_IWUSR);
  PCHECK(fd > 0);
  FILE* f = fdopen(fd, "w+");
  PCHECK(f != nullptr);
  if (!content.empty()) {
    PCHECK(fwrite(content.data(), 1, content.size(), f) == content.size());
    PCHECK(fflush(f) == 0);
  }
  return File{path, f};
}

const std::string kPatternSuffix = ".XXXXXX";

TempDir::TempDir(const std::string& prefix,
                 const bool schedule_recursive_removal)
    : Dir("", nullptr),
      schedule_recursive_removal_(schedule_recursive_removal) {
  char* bazel_test_dir = getenv("TEST_TMPDIR");
  // Use Bazel's preferred test dir, otherwise use the system-level temporary
  // directory
  auto root =
      (bazel_test_dir) ? std::string{bazel_test_dir} : ::testing::TempDir();
  auto pattern = root + "/" + prefix + kPatternSuffix;
  char pattern_cstr[PATH_MAX] = {};
  PCHECK(strncpy(pattern_cstr, pattern.c_str(), PATH_MAX - 1) == pattern_cstr);
  const char* dest = mkdtemp(pattern_cstr);
  PCHECK(dest != nullptr);
  path_ = std::string{dest};
  dir_ = opendir(path_.c_str());
  PCHECK(dir_ != nullptr);
}

TempDir::~TempDir() {
  if (schedule_recursive_removal_) {
    RecursiveDelete(path_);
  }
}

Dir Dir::CreateSubdir(const std::string& name) {
  CHECK(!path_.empty());
  const auto subdir_name = std::string{path_ + "/" + name};
  PCHECK(mkdir(subdir_name.c_str(), S_IRWXU) == 0);
  DIR* dir = opendir(subdir_name.c_str());
  PCHECK(dir != nullptr);

  return Dir{subdir_name, dir};
}

std::string Dir::Path() const { return path_; }

File::File(const std::string& path, FILE* const file)
    : path_(path), file_(file) {
  CHECK(file_ != nullptr);
}

File::File(File&& other) : path_(std::move(other.path_)), file_(other.file_) {
  other.file_ = nullptr;
}

File::~File() {
  if (file_) {
    PCHECK(fclose(file_) == 0);
  }
}

std::string File::Path() const { return path_; }

std::FILE* File::Get() { return file_; }

void InitLogging() {
  static std::once_flag logging_init;

  std::call_once(logging_init, []() {
    google::InitGoogleLogging(
        ::testing::UnitTest::GetInstance()->current_test_info()->name());
  });
}

}  // namespace test_util
