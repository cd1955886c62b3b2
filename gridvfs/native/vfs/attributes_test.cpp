#include "attributes.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <memory>

#include "memory_backend.h"
#include "status_util.h"
#include "test_util.h"

using namespace gridvfs;
using namespace test_util;

class AttributesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    InitLogging();
    backend_ = std::make_unique<MemoryBackend>("/tempZone/home/rods", "rods",
                                               "tempZone", "10001");
    auto session = backend_->Connect();
    ASSERT_TRUE(session.ok());
    session_ = std::move(*session);
  }

  void TearDown() override {
    session_.reset();
    ASSERT_EQ(backend_->OpenSessions(), 0);
  }

  ObjectStat MakeStat() {
    ObjectStat stat;
    stat.kind = ObjectKind::kRegular;
    stat.size = 4096;
    stat.owner_name = "rods";
    stat.owner_zone = "tempZone";
    stat.created_at = absl::FromUnixSeconds(1000);
    stat.modified_at = absl::FromUnixMillis(2000500);
    return stat;
  }

  std::unique_ptr<MemoryBackend> backend_;
  std::unique_ptr<BackendSession> session_;
  AttributeTranslator translator_{std::make_unique<FixedPermissionModel>()};
};

TEST_F(AttributesTest, Translate) {
  auto attr = translator_.ToAttributes(42, MakeStat(), *session_);
  ASSERT_TRUE(attr.ok()) << attr.status();

  ASSERT_EQ(attr->ino, 42);
  ASSERT_EQ(attr->fileid, 42);
  ASSERT_EQ(attr->kind, ObjectKind::kRegular);
  ASSERT_EQ(attr->mode, S_IFREG | S_IRUSR | S_IWUSR);
  ASSERT_EQ(attr->nlink, 0);
  ASSERT_EQ(attr->uid, 10001);
  ASSERT_EQ(attr->gid, 0);
  ASSERT_EQ(attr->size, 4096);
  ASSERT_EQ(attr->ctime, absl::FromUnixSeconds(1000));
  ASSERT_EQ(attr->mtime, absl::FromUnixMillis(2000500));
  // The backend has no access time; the modify time stands in for it.
  ASSERT_EQ(attr->atime, attr->mtime);
  ASSERT_EQ(attr->dev, kBackendDevice);
  ASSERT_EQ(attr->rdev, kBackendDevice);
  ASSERT_EQ(attr->generation, 2000500);
}

TEST_F(AttributesTest, DirectoryTypeBits) {
  auto stat = MakeStat();
  stat.kind = ObjectKind::kDirectory;
  auto attr = translator_.ToAttributes(1, stat, *session_);
  ASSERT_TRUE(attr.ok()) << attr.status();
  ASSERT_TRUE(S_ISDIR(attr->mode));
  ASSERT_EQ(attr->mode & 0777, S_IRUSR | S_IWUSR);
}

TEST_F(AttributesTest, UnknownOwnerIsIoFailure) {
  auto stat = MakeStat();
  stat.owner_name = "nobody";
  auto attr = translator_.ToAttributes(3, stat, *session_);
  ASSERT_FALSE(attr.ok());
  ASSERT_TRUE(IsIoFailure(attr.status())) << attr.status();
}

TEST_F(AttributesTest, NonNumericOwnerIdIsIoFailure) {
  backend_->AddUser("alice#tempZone", "not-a-number");
  auto stat = MakeStat();
  stat.owner_name = "alice";
  auto attr = translator_.ToAttributes(3, stat, *session_);
  ASSERT_FALSE(attr.ok());
  ASSERT_TRUE(IsIoFailure(attr.status())) << attr.status();
}

class GrantAllPermissionModel : public PermissionModel {
 public:
  mode_t PermissionBits(const ObjectStat& stat) const override {
    return stat.kind == ObjectKind::kDirectory ? 0755 : 0644;
  }
};

TEST_F(AttributesTest, PermissionModelIsPluggable) {
  AttributeTranslator translator{std::make_unique<GrantAllPermissionModel>()};
  auto attr = translator.ToAttributes(5, MakeStat(), *session_);
  ASSERT_TRUE(attr.ok()) << attr.status();
  ASSERT_EQ(attr->mode, S_IFREG | 0644);
}

TEST_F(AttributesTest, ToStat) {
  auto attr = translator_.ToAttributes(42, MakeStat(), *session_);
  ASSERT_TRUE(attr.ok()) << attr.status();

  struct stat sb;
  ToStat(*attr, &sb);
  ASSERT_EQ(sb.st_ino, 42);
  ASSERT_EQ(sb.st_size, 4096);
  ASSERT_EQ(sb.st_uid, 10001);
  ASSERT_EQ(sb.st_mtim.tv_sec, 2000);
  ASSERT_EQ(sb.st_mtim.tv_nsec, 500000000);
  ASSERT_EQ(sb.st_ctim.tv_sec, 1000);
}

TEST_F(AttributesTest, GrantedAccess) {
  const mode_t rwx = S_IRUSR | S_IWUSR | S_IXUSR;
  ASSERT_EQ(GrantedAccess(rwx, AccessProbe{true, true, true}), rwx);
  ASSERT_EQ(GrantedAccess(rwx, AccessProbe{false, false, false}), 0);
  ASSERT_EQ(GrantedAccess(S_IRUSR, AccessProbe{true, false, false}), S_IRUSR);
  ASSERT_EQ(GrantedAccess(S_IXUSR, AccessProbe{true, true, false}), 0);

  // Write implies read, but only when write was asked for.
  ASSERT_EQ(GrantedAccess(S_IRUSR | S_IWUSR, AccessProbe{false, true, false}),
            S_IRUSR | S_IWUSR);
  ASSERT_EQ(GrantedAccess(S_IRUSR, AccessProbe{false, true, false}), 0);

  // Nothing beyond the request is granted.
  ASSERT_EQ(GrantedAccess(S_IWUSR, AccessProbe{true, true, true}), S_IWUSR);
}
