#include <richdoc-cpp/change_event.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace richdoc_cpp;

TEST(DocumentChangeEvent, equality_is_structural) {
    EXPECT_EQ(DocumentChangeEvent{TextChanged{.node_id = "a"}},
              DocumentChangeEvent{TextChanged{.node_id = "a"}});
    EXPECT_NE(DocumentChangeEvent{TextChanged{.node_id = "a"}},
              DocumentChangeEvent{TextChanged{.node_id = "b"}});
    EXPECT_NE((DocumentChangeEvent{NodeInserted{.node_id = "a", .index = 0}}),
              (DocumentChangeEvent{NodeDeleted{.node_id = "a", .index = 0}}));
}

TEST(DocumentChangeEvent, to_string_covers_all_variants) {
    EXPECT_EQ(to_string(NodeInserted{.node_id = "n2", .index = 1}),
              "NodeInserted(node_id: n2, index: 1)");
    EXPECT_EQ(to_string(NodeDeleted{.node_id = "n2", .index = 1}),
              "NodeDeleted(node_id: n2, index: 1)");
    EXPECT_EQ(to_string(NodeReplaced{.old_node_id = "a", .new_node_id = "b"}),
              "NodeReplaced(old_node_id: a, new_node_id: b)");
    EXPECT_EQ(to_string(NodeMoved{.node_id = "m", .old_index = 0, .new_index = 2}),
              "NodeMoved(node_id: m, old_index: 0, new_index: 2)");
    EXPECT_EQ(to_string(TextChanged{.node_id = "t"}), "TextChanged(node_id: t)");
}

TEST(DocumentChangeEvent, visit_dispatches_on_kind) {
    const auto event = DocumentChangeEvent{NodeMoved{.node_id = "m", .old_index = 3, .new_index = 1}};
    ASSERT_TRUE(std::holds_alternative<NodeMoved>(event));
    EXPECT_EQ(std::get<NodeMoved>(event).old_index, 3u);
}
