#include "FileMover.hpp"

#include "TempTree.hpp"

#include <string>
#include <system_error>

#include <gtest/gtest.h>

TEST(FileMoverTest, MovesIntoLowerCasedBucket) {
    TempTree tree;
    const auto source = tree.write("in/Report.PDF", "pdf body");

    FileMover mover(tree.root() / "out", false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::Moved);
    EXPECT_EQ(result.target, tree.root() / "out" / "pdf" / "Report.PDF");
    EXPECT_FALSE(tree.exists("in/Report.PDF"));
    EXPECT_EQ(tree.read("out/pdf/Report.PDF"), "pdf body");
}

TEST(FileMoverTest, ExtensionlessFilesGoToSentinelBucket) {
    TempTree tree;
    const auto source = tree.write("LICENSE");

    FileMover mover(tree.root() / "out", false);
    EXPECT_EQ(mover.process(source).target, tree.root() / "out" / "no_ext" / "LICENSE");
    EXPECT_TRUE(tree.exists("out/no_ext/LICENSE"));
}

TEST(FileMoverTest, CollisionsGetNumericSuffixAndNeverOverwrite) {
    TempTree tree;
    tree.write("out/txt/x.txt", "original");
    tree.write("out/txt/x (1).txt", "first copy");
    const auto source = tree.write("in/x.txt", "newcomer");

    FileMover mover(tree.root() / "out", false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::Moved);
    EXPECT_EQ(result.target, tree.root() / "out" / "txt" / "x (2).txt");
    EXPECT_EQ(tree.read("out/txt/x.txt"), "original");
    EXPECT_EQ(tree.read("out/txt/x (1).txt"), "first copy");
    EXPECT_EQ(tree.read("out/txt/x (2).txt"), "newcomer");
}

TEST(FileMoverTest, UniqueTargetKeepsOriginalCaseOfExtension) {
    TempTree tree;
    tree.write("out/txt/b.TXT");

    FileMover mover(tree.root() / "out", false);
    std::error_code ec;
    EXPECT_EQ(mover.uniqueTarget(tree.root() / "out" / "txt", "b.TXT", ec), tree.root() / "out" / "txt" / "b (1).TXT");
    EXPECT_FALSE(ec);
}

TEST(FileMoverTest, AlreadyGroupedFileStaysPut) {
    TempTree tree;
    const auto source = tree.write("txt/a.txt");

    FileMover mover(tree.root(), false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::AlreadyGrouped);
    EXPECT_EQ(result.target, source);
    EXPECT_TRUE(tree.exists("txt/a.txt"));
    EXPECT_FALSE(tree.exists("txt/txt"));
}

TEST(FileMoverTest, DryRunTouchesNothing) {
    TempTree tree;
    const auto source = tree.write("a.txt");

    FileMover mover(tree.root() / "out", true);
    testing::internal::CaptureStdout();
    const MoveResult result = mover.process(source);
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(result.status, MoveStatus::Planned);
    EXPECT_EQ(result.target, tree.root() / "out" / "txt" / "a.txt");
    EXPECT_TRUE(tree.exists("a.txt"));
    EXPECT_FALSE(tree.exists("out"));
    EXPECT_NE(output.find("DRY-RUN: "), std::string::npos);
}

TEST(FileMoverTest, DryRunPlansCollisionsLikeALiveRun) {
    TempTree tree;
    const auto first = tree.write("one/x.txt");
    const auto second = tree.write("two/x.txt");

    FileMover mover(tree.root() / "out", true);
    EXPECT_EQ(mover.process(first).target, tree.root() / "out" / "txt" / "x.txt");
    EXPECT_EQ(mover.process(second).target, tree.root() / "out" / "txt" / "x (1).txt");
}

TEST(FileMoverTest, VanishedSourceIsSkippedWithoutCrashing) {
    TempTree tree;
    const auto source = tree.write("gone.txt");
    std::filesystem::remove(source);

    FileMover mover(tree.root() / "out", false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::Vanished);
    EXPECT_FALSE(tree.exists("out/txt/gone.txt"));
}

TEST(FileMoverTest, BucketBlockedByFileFailsWithoutLosingSource) {
    TempTree tree;
    tree.write("out/txt", "not a directory");
    const auto source = tree.write("a.txt", "keep me");

    FileMover mover(tree.root() / "out", false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::Failed);
    EXPECT_EQ(tree.read("a.txt"), "keep me");
    EXPECT_EQ(tree.read("out/txt"), "not a directory");
}

// 251 + ".txt" fills the usual 255-byte name limit, so no " (N)" variant can exist.
TEST(FileMoverTest, CollidingMaximumLengthNameFailsInsteadOfSpinning) {
    TempTree tree;
    const std::string name = std::string(251, 'a') + ".txt";
    tree.write("out/txt/" + name, "resident");
    const auto source = tree.write("in/" + name, "newcomer");

    FileMover mover(tree.root() / "out", false);
    const MoveResult result = mover.process(source);

    EXPECT_EQ(result.status, MoveStatus::Failed);
    EXPECT_EQ(result.target, source);
    EXPECT_EQ(tree.read("in/" + name), "newcomer");
    EXPECT_EQ(tree.read("out/txt/" + name), "resident");
}

TEST(FileMoverTest, CollidingMaximumLengthNameFailsInDryRun) {
    TempTree tree;
    const std::string name = std::string(251, 'b') + ".txt";
    tree.write("out/txt/" + name, "resident");
    const auto source = tree.write("in/" + name, "newcomer");

    FileMover mover(tree.root() / "out", true);
    EXPECT_EQ(mover.process(source).status, MoveStatus::Failed);
    EXPECT_EQ(tree.read("in/" + name), "newcomer");
}

TEST(FileMoverTest, UniqueTargetReportsUncheckableNames) {
    TempTree tree;
    const std::string name = std::string(251, 'c') + ".txt";
    tree.write("out/txt/" + name);

    FileMover mover(tree.root() / "out", false);
    std::error_code ec;
    EXPECT_TRUE(mover.uniqueTarget(tree.root() / "out" / "txt", name, ec).empty());
    EXPECT_TRUE(ec);
}
