//! # Move Table Tests
//!
//! Manifest parsing, canonicalization, rejection of inconsistent tables and
//! the `nest` directive.

#include "migrate/move_table.hpp"
#include "test_tree.hpp"

#include <gtest/gtest.h>

using namespace doclink;
using namespace doclink::migrate;

class MoveTableTest : public TempTreeTest {
protected:
    MoveTable parse_ok(const std::string& text) {
        auto result = MoveTable::parse(text, root);
        if (is_err(result)) {
            ADD_FAILURE() << "unexpected error: " << unwrap_err(result).message;
            return MoveTable{};
        }
        return unwrap(result);
    }

    ConfigError parse_err(const std::string& text) {
        auto result = MoveTable::parse(text, root, "moves.txt");
        if (is_ok(result)) {
            ADD_FAILURE() << "expected a configuration error for:\n" << text;
            return ConfigError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Manifest Syntax
// ============================================================================

TEST_F(MoveTableTest, ArrowAndWhitespaceForms) {
    auto table = parse_ok("a.md -> topic/a.md\n"
                          "b.md topic/b.md\n");
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.lookup("a.md").value_or(""), "topic/a.md");
    EXPECT_EQ(table.lookup("b.md").value_or(""), "topic/b.md");
    EXPECT_EQ(table.reverse_lookup("topic/a.md").value_or(""), "a.md");
}

TEST_F(MoveTableTest, CommentsAndBlankLines) {
    auto table = parse_ok("# reorganization\n"
                          "\n"
                          "a.md -> topic/a.md   # moved in the first pass\r\n");
    EXPECT_EQ(table.size(), 1u);
    EXPECT_TRUE(table.is_moved("a.md"));
    EXPECT_TRUE(table.is_destination("topic/a.md"));
}

TEST_F(MoveTableTest, PathsAreCanonicalized) {
    auto table = parse_ok("./a.md -> topic/./sub/../a.md\n"
                          "docs\\b.md -> topic\\b.md\n");
    EXPECT_EQ(table.lookup("a.md").value_or(""), "topic/a.md");
    EXPECT_EQ(table.lookup("docs/b.md").value_or(""), "topic/b.md");
}

TEST_F(MoveTableTest, IdentityEntriesAreDropped) {
    auto table = parse_ok("a.md -> ./a.md\n");
    EXPECT_TRUE(table.empty());
}

TEST_F(MoveTableTest, MalformedLineReportsLocation) {
    auto error = parse_err("a.md -> topic/a.md\n"
                           "a.md => b.md c.md\n");
    EXPECT_EQ(error.file, "moves.txt");
    EXPECT_EQ(error.line, 2u);
    EXPECT_NE(error.message.find("expected"), std::string::npos);
}

// ============================================================================
// Consistency
// ============================================================================

TEST_F(MoveTableTest, DuplicateSourceIsRejected) {
    auto error = parse_err("a.md -> x/a.md\n"
                           "a.md -> y/a.md\n");
    EXPECT_EQ(error.line, 2u);
    EXPECT_NE(error.message.find("moved twice"), std::string::npos);
}

TEST_F(MoveTableTest, DuplicateDestinationIsRejected) {
    auto error = parse_err("a.md -> topic/x.md\n"
                           "b.md -> topic/x.md\n");
    EXPECT_NE(error.message.find("destination of two moves"), std::string::npos);
}

TEST_F(MoveTableTest, ChainsAreRejected) {
    auto error = parse_err("a.md -> b.md\n"
                           "b.md -> c.md\n");
    EXPECT_NE(error.message.find("chains"), std::string::npos);
}

TEST_F(MoveTableTest, EscapingPathIsRejected) {
    auto error = parse_err("../outside.md -> topic/outside.md\n");
    EXPECT_NE(error.message.find("escapes the content root"), std::string::npos);
}

TEST_F(MoveTableTest, AbsolutePathIsRejected) {
    auto error = parse_err("/a.md -> topic/a.md\n");
    EXPECT_NE(error.message.find("relative to the content root"), std::string::npos);
}

TEST_F(MoveTableTest, NonMarkdownIsRejected) {
    auto error = parse_err("logo.png -> img/logo.png\n");
    EXPECT_NE(error.message.find("not a Markdown document"), std::string::npos);
}

// ============================================================================
// nest Directive
// ============================================================================

TEST_F(MoveTableTest, NestDerivesEntriesFromDirectory) {
    write("guides/setup.md", "# Setup\n");
    write("guides/usage.md", "# Usage\n");
    write("guides/index.md", "# Guides\n");
    write("guides/notes.txt", "not a document\n");

    auto table = parse_ok("nest guides\n");
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.lookup("guides-setup.md").value_or(""), "guides/setup.md");
    EXPECT_EQ(table.lookup("guides-usage.md").value_or(""), "guides/usage.md");
    EXPECT_FALSE(table.is_destination("guides/index.md"));
}

TEST_F(MoveTableTest, NestWithExplicitPrefix) {
    write("ops/deploy/rollback.md", "# Rollback\n");

    auto table = parse_ok("nest ops/deploy deploy_\n");
    EXPECT_EQ(table.lookup("ops/deploy_rollback.md").value_or(""), "ops/deploy/rollback.md");
}

TEST_F(MoveTableTest, NestMissingDirectoryIsRejected) {
    auto error = parse_err("nest missing\n");
    EXPECT_EQ(error.line, 1u);
    EXPECT_NE(error.message.find("does not exist"), std::string::npos);
}

TEST_F(MoveTableTest, NestWithTooManyArguments) {
    auto error = parse_err("nest a b c\n");
    EXPECT_NE(error.message.find("nest <dir> [prefix]"), std::string::npos);
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(MoveTableTest, LoadFromFile) {
    write("moves.txt", "a.md -> topic/a.md\n");
    auto result = MoveTable::load(root / "moves.txt", root);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).size(), 1u);
}

TEST_F(MoveTableTest, LoadMissingFile) {
    auto result = MoveTable::load(root / "absent.txt", root);
    ASSERT_TRUE(is_err(result));
    EXPECT_FALSE(unwrap_err(result).file.empty());
}
