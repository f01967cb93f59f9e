#include <richdoc-cpp/document.hpp>
#include <richdoc-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace richdoc_cpp;

namespace {

auto three_paragraphs() -> Document {
    return Document{{
        make_paragraph("n1", AttributedText{"one"}),
        make_paragraph("n2", AttributedText{"two"}),
        make_paragraph("n3", AttributedText{"three"}),
    }};
}

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(Document, default_constructed_is_empty) {
    const auto doc = Document{};
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.node_count(), 0u);
    EXPECT_TRUE(doc.nodes().empty());
}

TEST(Document, keeps_node_order) {
    const auto doc = three_paragraphs();
    ASSERT_EQ(doc.node_count(), 3u);
    EXPECT_EQ(doc.nodes()[0].id, "n1");
    EXPECT_EQ(doc.nodes()[2].id, "n3");
}

TEST(Document, duplicate_ids_are_rejected) {
    try {
        (void)Document{{make_paragraph("a"), make_horizontal_rule("a")}};
        FAIL() << "expected an Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::duplicate_node_id);
    }
}

// -- Lookup -------------------------------------------------------------------

TEST(Document, node_by_id_finds_or_returns_null) {
    const auto doc = three_paragraphs();
    ASSERT_NE(doc.node_by_id("n2"), nullptr);
    EXPECT_EQ(doc.node_by_id("n2")->text()->text(), "two");
    EXPECT_EQ(doc.node_by_id("missing"), nullptr);
}

TEST(Document, node_at_valid_index) {
    const auto doc = three_paragraphs();
    EXPECT_EQ(doc.node_at(1).id, "n2");
}

TEST(Document, node_at_out_of_range_throws) {
    const auto doc = three_paragraphs();
    try {
        (void)doc.node_at(3);
        FAIL() << "expected an Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::out_of_range);
    }
}

TEST(Document, node_after_and_before) {
    const auto doc = three_paragraphs();
    EXPECT_EQ(doc.node_after("n1")->id, "n2");
    EXPECT_EQ(doc.node_before("n3")->id, "n2");
}

TEST(Document, neighbours_are_null_at_boundaries_and_for_unknown_ids) {
    const auto doc = three_paragraphs();
    EXPECT_EQ(doc.node_after("n3"), nullptr);
    EXPECT_EQ(doc.node_before("n1"), nullptr);
    EXPECT_EQ(doc.node_after("missing"), nullptr);
    EXPECT_EQ(doc.node_before("missing"), nullptr);
}

TEST(Document, node_index_and_contains) {
    const auto doc = three_paragraphs();
    EXPECT_EQ(doc.node_index("n1"), 0u);
    EXPECT_EQ(doc.node_index("n3"), 2u);
    EXPECT_EQ(doc.node_index("missing"), Document::npos);
    EXPECT_TRUE(doc.contains("n2"));
    EXPECT_FALSE(doc.contains("missing"));
}

// -- Equality and description -------------------------------------------------

TEST(Document, equality_compares_nodes) {
    EXPECT_EQ(three_paragraphs(), three_paragraphs());
    EXPECT_NE(three_paragraphs(), Document{});
}

TEST(Document, to_string_lists_nodes) {
    const auto doc = Document{{make_horizontal_rule("hr")}};
    EXPECT_EQ(to_string(doc), "Document(1 nodes)\n  [0] HorizontalRule(id: hr, metadata: {})");
}
