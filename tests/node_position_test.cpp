#include <richdoc-cpp/document_position.hpp>
#include <richdoc-cpp/node_position.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <unordered_set>

using namespace richdoc_cpp;

// -- TextAffinity -------------------------------------------------------------

TEST(TextAffinity, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(TextAffinity::upstream),   "upstream");
    EXPECT_EQ(to_string_view(TextAffinity::downstream), "downstream");
}

// -- TextNodePosition ---------------------------------------------------------

TEST(TextNodePosition, affinity_defaults_to_downstream) {
    const auto p = TextNodePosition{.offset = 5};
    EXPECT_EQ(p.affinity, TextAffinity::downstream);
}

TEST(TextNodePosition, with_helpers_replace_one_field) {
    const auto p = TextNodePosition{.offset = 5};
    EXPECT_EQ(p.with_offset(2), (TextNodePosition{.offset = 2, .affinity = TextAffinity::downstream}));
    EXPECT_EQ(p.with_affinity(TextAffinity::upstream),
              (TextNodePosition{.offset = 5, .affinity = TextAffinity::upstream}));
}

TEST(TextNodePosition, equality_includes_affinity) {
    EXPECT_NE(TextNodePosition{.offset = 1},
              TextNodePosition{.offset = 1}.with_affinity(TextAffinity::upstream));
}

// -- BinaryNodePosition -------------------------------------------------------

TEST(BinaryNodePosition, factories_pick_side) {
    EXPECT_EQ(BinaryNodePosition::upstream().side, TextAffinity::upstream);
    EXPECT_EQ(BinaryNodePosition::downstream().side, TextAffinity::downstream);
    EXPECT_NE(BinaryNodePosition::upstream(), BinaryNodePosition::downstream());
}

// -- NodePosition -------------------------------------------------------------

TEST(NodePosition, text_and_binary_positions_never_compare_equal) {
    const auto text = NodePosition{TextNodePosition{.offset = 0}};
    const auto binary = NodePosition{BinaryNodePosition::upstream()};
    EXPECT_NE(text, binary);
}

TEST(NodePosition, to_string_renders_both_kinds) {
    EXPECT_EQ(to_string(NodePosition{TextNodePosition{.offset = 3}}),
              "TextNodePosition(offset: 3, affinity: downstream)");
    EXPECT_EQ(to_string(NodePosition{BinaryNodePosition::downstream()}),
              "BinaryNodePosition(downstream)");
}

TEST(NodePosition, hash_distinguishes_positions) {
    auto set = std::unordered_set<NodePosition>{
        TextNodePosition{.offset = 1},
        TextNodePosition{.offset = 1},
        TextNodePosition{.offset = 2},
        BinaryNodePosition::upstream(),
    };
    EXPECT_EQ(set.size(), 3u);
}

// -- DocumentPosition ---------------------------------------------------------

TEST(DocumentPosition, with_helpers_replace_one_field) {
    const auto p = DocumentPosition{.node_id = "n1", .node_position = TextNodePosition{.offset = 4}};

    const auto moved = p.with_node_id("n2");
    EXPECT_EQ(moved.node_id, "n2");
    EXPECT_EQ(moved.node_position, p.node_position);

    const auto after = p.with_node_position(BinaryNodePosition::downstream());
    EXPECT_EQ(after.node_id, "n1");
    EXPECT_EQ(after.node_position, NodePosition{BinaryNodePosition::downstream()});
}

TEST(DocumentPosition, equality_and_hash) {
    const auto a = DocumentPosition{.node_id = "n1", .node_position = TextNodePosition{.offset = 4}};
    const auto b = DocumentPosition{.node_id = "n1", .node_position = TextNodePosition{.offset = 4}};
    EXPECT_EQ(a, b);
    EXPECT_EQ(std::hash<DocumentPosition>{}(a), std::hash<DocumentPosition>{}(b));
    EXPECT_NE(a, a.with_node_id("n2"));
}

TEST(DocumentPosition, to_string_nests_node_position) {
    const auto p = DocumentPosition{.node_id = "img", .node_position = BinaryNodePosition::upstream()};
    EXPECT_EQ(to_string(p),
              "DocumentPosition(node_id: img, node_position: BinaryNodePosition(upstream))");
}
