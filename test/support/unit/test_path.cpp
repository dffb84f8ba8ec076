/***
 * Name: test_path
 * Purpose: Verify lexical path helpers used for artifact naming.
 */
#include <gtest/gtest.h>

#include "wrapcc/support/path.h"

using namespace wrapcc::support;

TEST(Path, BaseName) {
  EXPECT_EQ(BaseName("dir/x.cpp"), "x.cpp");
  EXPECT_EQ(BaseName("x.cpp"), "x.cpp");
  EXPECT_EQ(BaseName("/abs/dir/lib.so.1"), "lib.so.1");
  EXPECT_EQ(BaseName("dir/"), "");
}

TEST(Path, DirName) {
  EXPECT_EQ(DirName("a/b/c"), "a/b");
  EXPECT_EQ(DirName("c"), "");
}

TEST(Path, StripExtension) {
  EXPECT_EQ(StripExtension("x.cpp"), "x");
  EXPECT_EQ(StripExtension("a.tar.gz"), "a.tar");
  EXPECT_EQ(StripExtension("noext"), "noext");
  EXPECT_EQ(StripExtension(".hidden"), ".hidden");
}

TEST(Path, JoinPath) {
  EXPECT_EQ(JoinPath("", "x.bc"), "x.bc");
  EXPECT_EQ(JoinPath("out", ".x.bc"), "out/.x.bc");
}
