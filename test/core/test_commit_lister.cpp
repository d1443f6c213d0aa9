#include <gtest/gtest.h>

#include <sstream>

#include "fake_history.hpp"
#include "core/CommitLister.hpp"
#include "util/Logger.hpp"

using namespace mergereport;
using mergereport::test::FakeHistory;

class CommitListerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Error);
        history.add("c0", {}, "initial", {"verifier.c"});
        history.add("c1", {"c0"}, "bpf: one", {"verifier.c", "bpf.h"}, "Body of one.");
        history.add("c2", {"c1"}, "docs: unrelated", {"README"});
        history.add("s1", {"c1"}, "bpf: side", {"verifier.c"});
        history.add("mm", {"c2", "s1"}, "Merge branch 'side'", {"verifier.c"});
        history.add("c3", {"mm"}, "bpf: three", {"verifier.c"});
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::Info);
    }

    FakeHistory history;
    std::ostringstream out;
};

// Test: Lists non-merge commits touching the path, newest first
TEST_F(CommitListerTest, ListsTouchingCommitsNewestFirst) {
    CommitLister lister(history, out);
    auto count = lister.run(RevisionRange{"c0", "c3"}, "verifier.c");
    ASSERT_TRUE(count.has_value()) << count.error().message;
    EXPECT_EQ(count.value(), 3u);

    std::string text = out.str();
    size_t p3 = text.find("commit c3\n");
    size_t ps = text.find("commit s1\n");
    size_t p1 = text.find("commit c1\n");
    ASSERT_NE(p3, std::string::npos);
    ASSERT_NE(ps, std::string::npos);
    ASSERT_NE(p1, std::string::npos);
    EXPECT_LT(p3, ps);
    EXPECT_LT(ps, p1);
    EXPECT_EQ(text.find("commit mm\n"), std::string::npos);
    EXPECT_EQ(text.find("commit c2\n"), std::string::npos);
    EXPECT_EQ(text.find("commit c0\n"), std::string::npos);
    EXPECT_NE(text.find("    Body of one.\n"), std::string::npos);
}

// Test: Path filter applies per commit
TEST_F(CommitListerTest, OnlyCommitsTouchingPath) {
    CommitLister lister(history, out);
    auto count = lister.run(RevisionRange{"c0", "c3"}, "bpf.h");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 1u);
    EXPECT_NE(out.str().find("commit c1\n"), std::string::npos);
    EXPECT_NE(out.str().find("    bpf.h\n"), std::string::npos);
}

// Test: No matching commits is a successful, silent run
TEST_F(CommitListerTest, NoMatchesWritesNothing) {
    CommitLister lister(history, out);
    auto count = lister.run(RevisionRange{"c0", "c3"}, "nothing.c");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 0u);
    EXPECT_TRUE(out.str().empty());
}

// Test: A commit whose details cannot be read is skipped
TEST_F(CommitListerTest, DetailFailureSkipsCommit) {
    history.failSubject.insert("s1");
    CommitLister lister(history, out);
    auto count = lister.run(RevisionRange{"c0", "c3"}, "verifier.c");
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count.value(), 2u);
    EXPECT_EQ(out.str().find("commit s1\n"), std::string::npos);
}

// Test: Listing failure is fatal
TEST_F(CommitListerTest, ListingFailureIsFatal) {
    CommitLister lister(history, out);
    auto count = lister.run(RevisionRange{"c0", "missing"}, "verifier.c");
    EXPECT_FALSE(count.has_value());
    EXPECT_TRUE(out.str().empty());
}
