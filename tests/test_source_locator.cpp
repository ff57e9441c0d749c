#include <gtest/gtest.h>

#include "pipeline/source_locator.hpp"
#include "testing.hpp"

#include <filesystem>

namespace repack {
namespace {

TEST(SourceLocatorTest, ExplicitPathWinsUnchecked) {
    SourceQuery query;
    query.explicit_path = "/does/not/matter.7z";
    query.search_dir = "/nonexistent";

    std::string out;
    auto res = SourceLocator::Resolve(query, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "/does/not/matter.7z");
}

TEST(SourceLocatorTest, SingleMatchIsSelected) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("photos.7z"), "x"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("notes.txt"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();

    std::string out;
    auto res = SourceLocator::Resolve(query, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, tmp.Join("photos.7z"));
}

TEST(SourceLocatorTest, NoMatchFails) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("notes.txt"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();

    std::string out;
    auto res = SourceLocator::Resolve(query, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("expected exactly one match"), std::string::npos);
    EXPECT_NE(res.msg.find("found 0"), std::string::npos);
}

TEST(SourceLocatorTest, SeveralMatchesFailAndAreListed) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("b.7z"), "x"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("a.7z"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();

    std::string out;
    auto res = SourceLocator::Resolve(query, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("found 2"), std::string::npos);
    EXPECT_NE(res.msg.find(tmp.Join("a.7z") + ", " + tmp.Join("b.7z")), std::string::npos);
    EXPECT_TRUE(out.empty());
}

TEST(SourceLocatorTest, ExcludedOutputIsNeverSelected) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("input.7z"), "x"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("temp_result.7z"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();
    query.excluded = {tmp.Join("temp_result.7z")};

    std::string out;
    auto res = SourceLocator::Resolve(query, out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, tmp.Join("input.7z"));
}

TEST(SourceLocatorTest, DirectoriesAndHiddenFilesDoNotMatch) {
    testutil::TemporaryDirectory tmp;
    std::filesystem::create_directories(tmp.Join("dir.7z"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join(".hidden.7z"), "x"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("real.7z"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();

    std::vector<std::string> matches;
    ASSERT_TRUE(SourceLocator::FindMatches(query, matches).is_ok());
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0], tmp.Join("real.7z"));
}

TEST(SourceLocatorTest, CustomPatternIsHonoured) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("bundle.tar"), "x"));
    ASSERT_TRUE(testutil::WriteTextFile(tmp.Join("other.7z"), "x"));

    SourceQuery query;
    query.search_dir = tmp.Path();
    query.pattern = "*.tar";

    std::string out;
    ASSERT_TRUE(SourceLocator::Resolve(query, out).is_ok());
    EXPECT_EQ(out, tmp.Join("bundle.tar"));
}

TEST(SourceLocatorTest, MissingSearchDirectoryFails) {
    SourceQuery query;
    query.search_dir = "/nonexistent/repack-search-dir";

    std::string out;
    EXPECT_FALSE(SourceLocator::Resolve(query, out).is_ok());
}

} // namespace
} // namespace repack
