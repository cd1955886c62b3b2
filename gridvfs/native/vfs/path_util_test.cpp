#include "path_util.h"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "test_util.h"

using namespace gridvfs;
using namespace test_util;

class PathUtilTest : public ::testing::Test {
  void SetUp() override { InitLogging(); }
};

TEST_F(PathUtilTest, Normalize) {
  {
    auto r = NormalizePath("/");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/");
  }
  {
    auto r = NormalizePath("/tempZone//home/rods/");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/tempZone/home/rods");
  }
  {
    auto r = NormalizePath("/tempZone/./home/alice/../rods");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/tempZone/home/rods");
  }
  {
    auto r = NormalizePath("/a/..");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/");
  }
}

TEST_F(PathUtilTest, NormalizeRejects) {
  ASSERT_TRUE(absl::IsInvalidArgument(NormalizePath("").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(NormalizePath("relative/path").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(NormalizePath("/..").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(NormalizePath("/a/../..").status()));
}

TEST_F(PathUtilTest, Join) {
  {
    auto r = JoinPath("/", "foo.txt");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/foo.txt");
  }
  {
    auto r = JoinPath("/tempZone/home", "rods");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(*r, "/tempZone/home/rods");
  }
  ASSERT_TRUE(absl::IsInvalidArgument(JoinPath("/a", "").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(JoinPath("/a", "..").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(JoinPath("/a", ".").status()));
  ASSERT_TRUE(absl::IsInvalidArgument(JoinPath("/a", "b/c").status()));
}

TEST_F(PathUtilTest, ParentAndBaseName) {
  ASSERT_EQ(ParentPath("/a/b/c"), "/a/b");
  ASSERT_EQ(ParentPath("/a"), "/");
  ASSERT_EQ(ParentPath("/"), "/");
  ASSERT_EQ(BaseName("/a/b/c"), "c");
  ASSERT_EQ(BaseName("/foo.txt"), "foo.txt");
}
