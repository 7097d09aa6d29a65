#include "PathUtils.hpp"
#include "SortConfig.hpp"

#include <gtest/gtest.h>

TEST(PathUtilsTest, ExtensionKeyIsLowerCasedWithoutDot) {
    EXPECT_EQ(extensionKey("/tmp/a.txt"), "txt");
    EXPECT_EQ(extensionKey("/tmp/B.TXT"), "txt");
    EXPECT_EQ(extensionKey("archive.tar.GZ"), "gz");
}

TEST(PathUtilsTest, ExtensionlessFilesUseSentinel) {
    EXPECT_EQ(extensionKey("Makefile"), kNoExtensionKey);
    EXPECT_EQ(extensionKey(".bashrc"), kNoExtensionKey);
    EXPECT_EQ(extensionKey("trailing."), kNoExtensionKey);
}

TEST(PathUtilsTest, IsWithinComparesWholeSegments) {
    EXPECT_TRUE(isWithin("/data/out", "/data/out"));
    EXPECT_TRUE(isWithin("/data/out/txt/a.txt", "/data/out"));
    EXPECT_FALSE(isWithin("/data/output/a.txt", "/data/out"));
    EXPECT_FALSE(isWithin("/data", "/data/out"));
    EXPECT_FALSE(isWithin("/elsewhere/out", "/data/out"));
}

TEST(PathUtilsTest, ToLowerLeavesNonLettersAlone) {
    EXPECT_EQ(toLower("ReadMe.MD"), "readme.md");
    EXPECT_EQ(toLower("x (1).TXT"), "x (1).txt");
}

TEST(SortConfigTest, RelativeDestinationHangsOffRoot) {
    SortConfig config;
    config.root = "/";
    config.destDir = "sorted_by_extension";
    EXPECT_TRUE(config.destinationRoot().is_absolute());
    EXPECT_EQ(config.destinationRoot(), std::filesystem::path("/sorted_by_extension"));
}

TEST(SortConfigTest, DotDestinationMeansRoot) {
    SortConfig config;
    config.root = "/";
    config.destDir = ".";
    EXPECT_EQ(config.destinationRoot(), config.rootPath());
}

TEST(SortConfigTest, TrailingSeparatorIsDropped) {
    EXPECT_EQ(resolvePath("/does-not-exist-sortify/out/"), std::filesystem::path("/does-not-exist-sortify/out"));
}
