#include <gtest/gtest.h>

#include "pipeline/archive_path_policy.hpp"
#include "pipeline/output_verifier.hpp"
#include "testing.hpp"

namespace repack {
namespace {

TEST(OutputVerifierTest, ListsEntriesOfValidArchive) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("out.tar");
    ASSERT_TRUE(testutil::WriteBytesFile(path, testutil::BuildTar({
        {"images", "", AE_IFDIR},
        {"images/a.png", "png-a", AE_IFREG},
        {"readme.txt", "hello", AE_IFREG},
    })));

    OutputVerifier verifier;
    OutputVerifier::Summary summary;
    auto res = verifier.Verify(path, summary);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(summary.entries, 3u);
    EXPECT_EQ(summary.names[1], "images/a.png");
}

TEST(OutputVerifierTest, RejectsGarbage) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("out.7z");
    ASSERT_TRUE(testutil::WriteTextFile(path, "definitely not an archive"));

    OutputVerifier verifier;
    OutputVerifier::Summary summary;
    EXPECT_FALSE(verifier.Verify(path, summary).is_ok());
}

TEST(OutputVerifierTest, RejectsMissingFile) {
    OutputVerifier verifier;
    OutputVerifier::Summary summary;
    auto res = verifier.Verify("/nonexistent/out.7z", summary);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("cannot open"), std::string::npos);
}

TEST(OutputVerifierTest, RejectsEntriesEscapingTheRoot) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("out.tar");
    ASSERT_TRUE(testutil::WriteBytesFile(path, testutil::BuildTar({
        {"../escape.txt", "x", AE_IFREG},
    })));

    OutputVerifier verifier;
    OutputVerifier::Summary summary;
    auto res = verifier.Verify(path, summary);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("escapes archive root"), std::string::npos);
}

TEST(ArchivePathPolicyTest, NormalizesContainedEntryPath) {
    std::string out;
    auto res = CheckArchiveEntryPath("./dir//file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/file.txt");
}

TEST(ArchivePathPolicyTest, RejectsAbsolutePath) {
    std::string out;
    auto res = CheckArchiveEntryPath("/etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("absolute path"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsNamelessEntry) {
    std::string out;
    EXPECT_FALSE(CheckArchiveEntryPath(nullptr, out).is_ok());
    EXPECT_FALSE(CheckArchiveEntryPath("", out).is_ok());
}

TEST(ArchivePathPolicyTest, ContainmentLooksAtWholeSegments) {
    EXPECT_TRUE(IsContainedEntryPath("a/b/c.png"));
    EXPECT_TRUE(IsContainedEntryPath("a/..b/c"));
    EXPECT_TRUE(IsContainedEntryPath("dir/"));
    EXPECT_FALSE(IsContainedEntryPath("../x"));
    EXPECT_FALSE(IsContainedEntryPath("a/../../x"));
    EXPECT_FALSE(IsContainedEntryPath("a/.."));
    EXPECT_FALSE(IsContainedEntryPath("a\\b"));
    EXPECT_FALSE(IsContainedEntryPath(""));
}

} // namespace
} // namespace repack
