// DIRGATE - Tree Search Engine Tests
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include <gtest/gtest.h>

#include "dirgate/search/tree_search.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/util/fs.h"

#include <memory>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace dirgate {
namespace search {
namespace {

namespace fs = util::fs;

class TreeSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp_.IsValid());
        root_ = tmp_.GetPath();

        ASSERT_TRUE(fs::WriteFile(root_ / "report.txt", "hello"));
        ASSERT_TRUE(fs::WriteFile(root_ / "Report-2023.pdf", "%PDF"));
        ASSERT_TRUE(fs::WriteFile(root_ / "notes.md", "# notes"));
        ASSERT_TRUE(fs::CreateDirectories(root_ / "docs/sub"));
        ASSERT_TRUE(fs::WriteFile(root_ / "docs/report_draft.txt", "draft"));
        ASSERT_TRUE(fs::CreateDirectories(root_ / "docs/report_dir"));
        ASSERT_TRUE(fs::WriteFile(root_ / "docs/sub/deep_report.txt", "deep"));
        ASSERT_TRUE(fs::CreateDirectories(root_ / "reports"));
        ASSERT_TRUE(fs::WriteFile(root_ / "reports/q1.txt", "q1"));
        // A matching symlink to a directory is reported but never followed
        ASSERT_EQ(::symlink((root_ / "docs").CStr(), (root_ / "report_link").CStr()), 0);

        security::PathGuard::Config config;
        config.root = root_.String();
        guard_.reset(new security::PathGuard(config));
    }

    SearchRequest Request(const std::string& term) const {
        return SearchRequest(guard_->Root(), term);
    }

    static std::vector<std::string> Names(const SearchResult& result) {
        std::vector<std::string> names;
        for (const auto& entry : result.entries) {
            names.push_back(entry.name);
        }
        return names;
    }

    fs::TempDirectory tmp_{"dirgate_search_test"};
    fs::Path root_;
    std::unique_ptr<security::PathGuard> guard_;
    TreeSearchEngine engine_;
};

TEST_F(TreeSearchTest, FindsAndRanksMatches) {
    SearchResult result = engine_.Search(Request("report"));

    std::vector<std::string> expected{
        "report_link",
        "reports",
        "Report-2023.pdf",
        "report.txt",
        "docs/report_dir",
        "docs/report_draft.txt",
        "docs/sub/deep_report.txt",
    };
    EXPECT_EQ(Names(result), expected);
    EXPECT_FALSE(result.truncated);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.skippedDirectories, 0u);
    EXPECT_EQ(result.message, "Found 7 results (limit: 10000)");
}

TEST_F(TreeSearchTest, DeeperDirectoriesRankAfterTopLevelFiles) {
    SearchResult result = engine_.Search(Request("report"));
    ASSERT_EQ(result.entries.size(), 7u);

    // Depth 0 directories, then depth 0 files, then depth 1 and below
    EXPECT_TRUE(result.entries[0].isDirectory);
    EXPECT_TRUE(result.entries[1].isDirectory);
    EXPECT_FALSE(result.entries[2].isDirectory);
    EXPECT_FALSE(result.entries[3].isDirectory);
    EXPECT_EQ(result.entries[3].name, "report.txt");
    EXPECT_TRUE(result.entries[4].isDirectory);
    EXPECT_EQ(result.entries[4].name, "docs/report_dir");
}

TEST_F(TreeSearchTest, MatchingIsCaseInsensitive) {
    SearchResult result = engine_.Search(Request("REPORT"));
    EXPECT_EQ(result.entries.size(), 7u);
}

TEST_F(TreeSearchTest, EntryFields) {
    SearchResult result = engine_.Search(Request("report.txt"));
    ASSERT_EQ(result.entries.size(), 1u);

    const FileEntry& entry = result.entries[0];
    EXPECT_EQ(entry.name, "report.txt");
    EXPECT_EQ(entry.absolutePath, (root_ / "report.txt").String());
    EXPECT_EQ(entry.sizeBytes, 5u);
    EXPECT_FALSE(entry.isDirectory);

    result = engine_.Search(Request("reports"));
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_TRUE(result.entries[0].isDirectory);
    EXPECT_EQ(result.entries[0].sizeBytes, 0u);
}

TEST_F(TreeSearchTest, TopLevelOnly) {
    SearchRequest request = Request("report");
    request.includeSubdirectories = false;

    std::vector<std::string> expected{
        "report_link", "reports", "Report-2023.pdf", "report.txt",
    };
    EXPECT_EQ(Names(engine_.Search(request)), expected);
}

TEST_F(TreeSearchTest, DepthLimit) {
    SearchRequest request = Request("report");
    request.maxDepth = 1;

    SearchResult result = engine_.Search(request);
    EXPECT_EQ(result.entries.size(), 6u);
    EXPECT_EQ(result.entries.back().name, "docs/report_draft.txt");
}

TEST_F(TreeSearchTest, TruncatesAtResultCap) {
    SearchRequest request = Request("report");
    request.maxResults = 2;

    SearchResult result = engine_.Search(request);
    EXPECT_EQ(result.entries.size(), 2u);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.message, "Search returned 2+ results. Try a more specific search term.");
}

TEST_F(TreeSearchTest, ExactlyAtCapIsNotTruncated) {
    SearchRequest request = Request("report");
    request.maxResults = 7;

    SearchResult result = engine_.Search(request);
    EXPECT_EQ(result.entries.size(), 7u);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.message, "Found 7 results (limit: 7)");
}

TEST_F(TreeSearchTest, NoMatches) {
    SearchResult result = engine_.Search(Request("zzz"));
    EXPECT_TRUE(result.entries.empty());
    EXPECT_EQ(result.message,
              "No results found for 'zzz' in '" + root_.String() + "' (limit: 10000)");
}

TEST_F(TreeSearchTest, ExpiredBudgetReportsTimeout) {
    SearchRequest request = Request("report");
    request.timeBudget = util::Milliseconds(0);

    SearchResult result = engine_.Search(request);
    EXPECT_TRUE(result.timedOut);
    EXPECT_TRUE(result.entries.empty());
    EXPECT_NE(result.message.find("Search timed out after 0 seconds"), std::string::npos);
}

TEST_F(TreeSearchTest, VanishedRootIsCounted) {
    auto outcome = guard_->Validate("gone");
    ASSERT_TRUE(outcome.IsValid());

    SearchResult result = engine_.Search(SearchRequest(outcome.Value(), "report"));
    EXPECT_TRUE(result.entries.empty());
    EXPECT_EQ(result.vanishedDirectories, 1u);
    EXPECT_EQ(result.skippedDirectories, 0u);
}

TEST_F(TreeSearchTest, UnreadableDirectoriesAreSkipped) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    ASSERT_EQ(::chmod((root_ / "docs/sub").CStr(), 0), 0);

    SearchResult result = engine_.Search(Request("report"));
    ::chmod((root_ / "docs/sub").CStr(), 0755);

    EXPECT_EQ(result.entries.size(), 6u);
    EXPECT_EQ(result.skippedDirectories, 1u);
    EXPECT_NE(result.message.find("Skipped 1 directories due to permissions"),
              std::string::npos);
}

TEST(TreeSearchEngineTest, TopLevelFileBeforeNestedDirectory) {
    fs::TempDirectory tmp("dirgate_search_order");
    ASSERT_TRUE(tmp.IsValid());
    ASSERT_TRUE(fs::WriteFile(tmp.GetPath() / "a_x.txt", "a"));
    ASSERT_TRUE(fs::CreateDirectories(tmp.GetPath() / "sub/x_dir"));

    security::PathGuard::Config config;
    config.root = tmp.GetPath().String();
    security::PathGuard guard(config);

    TreeSearchEngine engine;
    SearchResult result = engine.Search(SearchRequest(guard.Root(), "x"));
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].name, "a_x.txt");
    EXPECT_EQ(result.entries[1].name, "sub/x_dir");
}

TEST(TreeSearchEngineTest, NameMatches) {
    EXPECT_TRUE(TreeSearchEngine::NameMatches("Quarterly_REPORT.txt", "report"));
    EXPECT_FALSE(TreeSearchEngine::NameMatches("notes.md", "report"));
}

} // namespace
} // namespace search
} // namespace dirgate
