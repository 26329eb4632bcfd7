//! # Rewrite Planner Tests
//!
//! Per-link decisions: which links change, what they become, and which are
//! reported instead. Documents and the move table are built in memory; no
//! files are touched.

#include "migrate/planner.hpp"
#include "migrate/resolver.hpp"

#include <gtest/gtest.h>

using namespace doclink;
using namespace doclink::migrate;

class PlannerTest : public ::testing::Test {
protected:
    MoveTable table;
    DocumentSet documents;

    void moves(std::initializer_list<std::pair<const char*, const char*>> entries) {
        for (const auto& [from, to] : entries) {
            auto error = table.add(from, to);
            ASSERT_FALSE(error.has_value()) << error->message;
        }
    }

    /// Builds the post-migration document set from the files on disk.
    void files(std::vector<std::string> on_disk) {
        documents = DocumentSet::after_migration(on_disk, table);
    }

    LinkReference link(const std::string& source, const std::string& text) {
        std::vector<LinkReference> links;
        std::vector<Issue> issues;
        LinkScanner::scan_text(source, text, links, issues);
        EXPECT_EQ(links.size(), 1u);
        return links.empty() ? LinkReference{} : links.front();
    }

    LinkDecision decide(const std::string& source, const std::string& text) {
        RewritePlanner planner(table, documents);
        return planner.plan_link(link(source, text));
    }
};

// ============================================================================
// Source Location
// ============================================================================

TEST_F(PlannerTest, LocateUnmovedSource) {
    moves({{"a.md", "topic/a.md"}});
    files({"a.md", "b.md"});
    RewritePlanner planner(table, documents);

    auto loc = planner.locate("b.md");
    EXPECT_EQ(loc.old_dir, "");
    EXPECT_EQ(loc.new_dir, "");
}

TEST_F(PlannerTest, LocateSourceStillAtOldPath) {
    moves({{"a.md", "topic/a.md"}});
    files({"a.md"});
    RewritePlanner planner(table, documents);

    auto loc = planner.locate("a.md");
    EXPECT_EQ(loc.old_dir, "");
    EXPECT_EQ(loc.new_dir, "topic");
}

TEST_F(PlannerTest, LocateSourceAlreadyMoved) {
    moves({{"a.md", "topic/a.md"}});
    files({"topic/a.md"});
    RewritePlanner planner(table, documents);

    auto loc = planner.locate("topic/a.md");
    EXPECT_EQ(loc.old_dir, "");
    EXPECT_EQ(loc.new_dir, "topic");
}

// ============================================================================
// Decisions
// ============================================================================

TEST_F(PlannerTest, LinkToMovedTargetIsRewritten) {
    moves({{"a.md", "topic/a.md"}});
    files({"b.md", "topic/a.md"});

    auto decision = decide("b.md", "[x](a.md)");
    ASSERT_TRUE(decision.replacement.has_value());
    EXPECT_EQ(*decision.replacement, "topic/a.md");
    EXPECT_FALSE(decision.issue.has_value());
}

TEST_F(PlannerTest, LinkFromMovedSourceIsRewritten) {
    moves({{"a.md", "topic/a.md"}});
    files({"topic/a.md", "shared.md"});

    auto decision = decide("topic/a.md", "[s](shared.md)");
    ASSERT_TRUE(decision.replacement.has_value());
    EXPECT_EQ(*decision.replacement, "../shared.md");
}

TEST_F(PlannerTest, BothEndpointsMoved) {
    moves({{"a.md", "topic1/a.md"}, {"b.md", "topic2/b.md"}});
    files({"topic1/a.md", "topic2/b.md"});

    auto decision = decide("topic1/a.md", "[b](b.md)");
    ASSERT_TRUE(decision.replacement.has_value());
    EXPECT_EQ(*decision.replacement, "../topic2/b.md");
}

TEST_F(PlannerTest, AnchorIsPreserved) {
    moves({{"a.md", "topic/a.md"}});
    files({"b.md", "topic/a.md"});

    auto decision = decide("b.md", "[x](a.md#install-steps)");
    ASSERT_TRUE(decision.replacement.has_value());
    EXPECT_EQ(*decision.replacement, "topic/a.md#install-steps");
}

TEST_F(PlannerTest, UnaffectedLinkIsLeftAlone) {
    moves({{"a.md", "topic/a.md"}});
    files({"b.md", "c.md", "topic/a.md"});

    auto decision = decide("b.md", "[c](c.md)");
    EXPECT_FALSE(decision.replacement.has_value());
    EXPECT_FALSE(decision.issue.has_value());
}

TEST_F(PlannerTest, AlreadyRewrittenLinkIsLeftAlone) {
    moves({{"a.md", "topic/a.md"}});
    files({"topic/a.md", "shared.md"});

    auto decision = decide("topic/a.md", "[s](../shared.md)");
    EXPECT_FALSE(decision.replacement.has_value());
    EXPECT_FALSE(decision.issue.has_value());
}

TEST_F(PlannerTest, MissingTargetIsUnresolvable) {
    moves({{"a.md", "topic/a.md"}});
    files({"b.md", "topic/a.md"});

    auto decision = decide("b.md", "[gone](deleted.md)");
    EXPECT_FALSE(decision.replacement.has_value());
    ASSERT_TRUE(decision.issue.has_value());
    EXPECT_EQ(decision.issue->kind, IssueKind::UnresolvableTarget);
    EXPECT_EQ(decision.issue->file, "b.md");
    EXPECT_EQ(decision.issue->line, 1u);
}

TEST_F(PlannerTest, LinkAboveRootIsUnresolvable) {
    files({"b.md"});

    auto decision = decide("b.md", "[up](../outside.md)");
    ASSERT_TRUE(decision.issue.has_value());
    EXPECT_EQ(decision.issue->kind, IssueKind::UnresolvableTarget);
}

TEST_F(PlannerTest, AmbiguousLinkIsAnErrorAndLeftUnchanged) {
    // topic/b.md exists, and b.md exists at the root: from the moved source
    // "b.md" is valid now but meant the root document before the move.
    moves({{"a.md", "topic/a.md"}});
    files({"topic/a.md", "topic/b.md", "b.md"});

    auto decision = decide("topic/a.md", "[b](b.md)");
    EXPECT_FALSE(decision.replacement.has_value());
    ASSERT_TRUE(decision.issue.has_value());
    EXPECT_EQ(decision.issue->kind, IssueKind::AmbiguousLink);
    EXPECT_EQ(issue_severity(decision.issue->kind), Severity::Error);
    EXPECT_STREQ(issue_code(decision.issue->kind), "D007");
}

TEST_F(PlannerTest, SiblingMovedBesideUnmovedSourceIsAmbiguous) {
    // a.md has not been moved yet. Its "b.md" means the root document, but
    // read from topic/ it lands on the sibling that moves in with it.
    moves({{"a.md", "topic/a.md"}, {"topic-b.md", "topic/b.md"}});
    files({"a.md", "b.md", "topic-b.md"});

    auto decision = decide("a.md", "[b](b.md)");
    EXPECT_FALSE(decision.replacement.has_value());
    ASSERT_TRUE(decision.issue.has_value());
    EXPECT_EQ(decision.issue->kind, IssueKind::AmbiguousLink);
    EXPECT_EQ(issue_severity(decision.issue->kind), Severity::Error);
}

// ============================================================================
// Plans
// ============================================================================

TEST_F(PlannerTest, EditsSortedByDescendingOffset) {
    moves({{"a.md", "topic/a.md"}, {"c.md", "topic/c.md"}});
    files({"b.md", "topic/a.md", "topic/c.md"});

    std::vector<LinkReference> links;
    std::vector<Issue> issues;
    LinkScanner::scan_text("b.md", "[a](a.md) then [c](c.md)\n[a again](a.md#x)\n", links,
                           issues);
    ASSERT_EQ(links.size(), 3u);

    RewritePlanner planner(table, documents);
    Plan plan = planner.plan(links);
    EXPECT_EQ(plan.links_examined, 3u);
    EXPECT_EQ(plan.edit_count(), 3u);
    ASSERT_EQ(plan.edits.count("b.md"), 1u);

    const auto& edits = plan.edits.at("b.md");
    EXPECT_GT(edits[0].offset, edits[1].offset);
    EXPECT_GT(edits[1].offset, edits[2].offset);
    EXPECT_EQ(edits[0].replacement, "topic/a.md#x");
    EXPECT_EQ(edits[2].original, "a.md");
}

// ============================================================================
// Resolver
// ============================================================================

TEST_F(PlannerTest, ResolveEmptyPathIsMalformed) {
    files({"b.md"});
    auto result = resolve("#only-anchor", "", "", table, documents);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, IssueKind::MalformedLink);
}

TEST_F(PlannerTest, ResolveUsesNewSourceDirectory) {
    moves({{"guide.md", "guides/guide.md"}});
    files({"guide.md", "guides/index.md", "faq.md"});

    auto result = resolve("faq.md#top", "", "guides", table, documents);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "../faq.md#top");
}
