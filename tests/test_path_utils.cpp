#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(corpus::NormalizeArchivePath("./setup.py"), "setup.py");
    EXPECT_EQ(corpus::NormalizeArchivePath("/pkg-1.0//src///mod.py"), "pkg-1.0/src/mod.py");
    EXPECT_EQ(corpus::NormalizeArchivePath("////././a//b"), "././a/b");
    EXPECT_EQ(corpus::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, IsSafePathComponent) {
    EXPECT_TRUE(corpus::IsSafePathComponent("requests"));
    EXPECT_TRUE(corpus::IsSafePathComponent("zope.interface-5.4.0.tar.gz"));
    EXPECT_FALSE(corpus::IsSafePathComponent(""));
    EXPECT_FALSE(corpus::IsSafePathComponent("."));
    EXPECT_FALSE(corpus::IsSafePathComponent(".."));
    EXPECT_FALSE(corpus::IsSafePathComponent("../evil"));
    EXPECT_FALSE(corpus::IsSafePathComponent("a\\b"));
}

TEST(PathUtilsTest, EndsWith) {
    EXPECT_TRUE(corpus::EndsWith("pkg-1.0.tar.gz", ".tar.gz"));
    EXPECT_TRUE(corpus::EndsWith("pkg.zip", ".zip"));
    EXPECT_FALSE(corpus::EndsWith("zip", ".zip"));
    EXPECT_FALSE(corpus::EndsWith("pkg.tar.gz.part", ".tar.gz"));
}
