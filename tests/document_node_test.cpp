#include <richdoc-cpp/document_node.hpp>
#include <richdoc-cpp/error.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>

using namespace richdoc_cpp;

// -- Enums --------------------------------------------------------------------

TEST(NodeKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(NodeKind::text_block),      "text_block");
    EXPECT_EQ(to_string_view(NodeKind::paragraph),       "paragraph");
    EXPECT_EQ(to_string_view(NodeKind::list_item),       "list_item");
    EXPECT_EQ(to_string_view(NodeKind::code_block),      "code_block");
    EXPECT_EQ(to_string_view(NodeKind::image),           "image");
    EXPECT_EQ(to_string_view(NodeKind::horizontal_rule), "horizontal_rule");
}

TEST(ParagraphBlockType, to_string_view_covers_headers) {
    EXPECT_EQ(to_string_view(ParagraphBlockType::header1), "header1");
    EXPECT_EQ(to_string_view(ParagraphBlockType::header6), "header6");
    EXPECT_EQ(to_string_view(ParagraphBlockType::blockquote), "blockquote");
}

TEST(ListItemType, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ListItemType::ordered),   "ordered");
    EXPECT_EQ(to_string_view(ListItemType::unordered), "unordered");
}

// -- Factories and kinds ------------------------------------------------------

TEST(DocumentNode, factories_set_kind) {
    EXPECT_EQ(make_text_block("a").kind(), NodeKind::text_block);
    EXPECT_EQ(make_paragraph("b").kind(), NodeKind::paragraph);
    EXPECT_EQ(make_list_item("c").kind(), NodeKind::list_item);
    EXPECT_EQ(make_code_block("d").kind(), NodeKind::code_block);
    EXPECT_EQ(make_image("e", "https://img.example/e.png").kind(), NodeKind::image);
    EXPECT_EQ(make_horizontal_rule("f").kind(), NodeKind::horizontal_rule);
}

TEST(DocumentNode, text_nodes_expose_their_text) {
    const auto p = make_paragraph("p1", AttributedText{"Hello"});
    ASSERT_TRUE(p.is_text_node());
    ASSERT_NE(p.text(), nullptr);
    EXPECT_EQ(p.text()->text(), "Hello");

    const auto code = make_code_block("c1", AttributedText{"int x;"}, std::string{"cpp"});
    EXPECT_TRUE(code.is_text_node());
    EXPECT_EQ(code.as<CodeBlock>()->language, std::string{"cpp"});
}

TEST(DocumentNode, non_text_nodes_have_no_text) {
    const auto image = make_image("i1", "https://img.example/cat.png", std::string{"a cat"}, 640.0, 480.0);
    EXPECT_FALSE(image.is_text_node());
    EXPECT_EQ(image.text(), nullptr);
    EXPECT_EQ(image.as<Image>()->width, 640.0);

    EXPECT_FALSE(make_horizontal_rule("hr").is_text_node());
}

TEST(DocumentNode, as_returns_null_for_other_kind) {
    const auto p = make_paragraph("p1");
    EXPECT_NE(p.as<Paragraph>(), nullptr);
    EXPECT_EQ(p.as<ListItem>(), nullptr);
}

TEST(DocumentNode, list_item_defaults) {
    const auto item = make_list_item("li");
    const auto* content = item.as<ListItem>();
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(content->type, ListItemType::unordered);
    EXPECT_EQ(content->indent, 0);
}

TEST(DocumentNode, generator_overloads_draw_ids) {
    auto ids = NodeIdGenerator{SequentialNodeIds{"n"}};
    const auto a = make_paragraph(ids, AttributedText{"one"});
    const auto b = make_list_item(ids, AttributedText{"two"}, ListItemType::ordered, 1);
    const auto c = make_horizontal_rule(ids);

    EXPECT_EQ(a.id, "n-0");
    EXPECT_EQ(b.id, "n-1");
    EXPECT_EQ(c.id, "n-2");
    EXPECT_EQ(b.as<ListItem>()->indent, 1);

    EXPECT_EQ(make_text_block(ids).id, "n-3");
    EXPECT_EQ(make_code_block(ids, AttributedText{"x = 1"}, "python").as<CodeBlock>()->language,
              "python");
    EXPECT_EQ(make_image(ids, "cat.png").id, "n-5");
}

// -- Copy-with ----------------------------------------------------------------

TEST(DocumentNode, with_text_replaces_only_text) {
    const auto h = make_paragraph("h1", AttributedText{"Intro"}, ParagraphBlockType::header1,
                                  Metadata{{"anchor", std::string{"intro"}}});
    const auto edited = h.with_text(AttributedText{"Introduction"});

    EXPECT_EQ(edited.id, "h1");
    EXPECT_EQ(edited.text()->text(), "Introduction");
    EXPECT_EQ(edited.as<Paragraph>()->block_type, ParagraphBlockType::header1);
    EXPECT_EQ(edited.metadata, h.metadata);
    EXPECT_EQ(h.text()->text(), "Intro");
}

TEST(DocumentNode, with_text_on_non_text_node_throws) {
    const auto hr = make_horizontal_rule("hr");
    try {
        (void)hr.with_text(AttributedText{"x"});
        FAIL() << "expected an Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::precondition_violation);
    }
}

TEST(DocumentNode, with_id_and_metadata_preserve_content) {
    const auto p = make_paragraph("p1", AttributedText{"body"});
    const auto renamed = p.with_id("p2");
    const auto tagged = p.with_metadata(Metadata{{"align", std::string{"center"}}});

    EXPECT_EQ(renamed.id, "p2");
    EXPECT_EQ(renamed.content, p.content);
    EXPECT_EQ(get_scalar<std::string>(tagged.metadata, "align"), std::string{"center"});
    EXPECT_EQ(tagged.content, p.content);
}

TEST(DocumentNode, with_content_can_change_kind) {
    const auto p = make_paragraph("p1", AttributedText{"- item"});
    const auto li = p.with_content(ListItem{.text = AttributedText{"item"}});
    EXPECT_EQ(li.kind(), NodeKind::list_item);
    EXPECT_EQ(li.id, "p1");
}

// -- Equality and hashing -----------------------------------------------------

TEST(DocumentNode, equality_is_structural) {
    const auto a = make_paragraph("p", AttributedText{"x"});
    const auto b = make_paragraph("p", AttributedText{"x"});
    EXPECT_EQ(a, b);
    EXPECT_EQ(std::hash<DocumentNode>{}(a), std::hash<DocumentNode>{}(b));

    EXPECT_NE(a, b.with_metadata(Metadata{{"k", true}}));
    EXPECT_NE(a, make_paragraph("p", AttributedText{"x"}, ParagraphBlockType::blockquote));
    EXPECT_NE(a, make_text_block("p", AttributedText{"x"}));
}

TEST(DocumentNode, attributions_take_part_in_equality) {
    const auto plain = make_paragraph("p", AttributedText{"word"});
    const auto styled = plain.with_text(plain.text()->apply_attribution(attributions::bold(), 0, 3));
    EXPECT_NE(plain, styled);
}

// -- Description --------------------------------------------------------------

TEST(DocumentNode, to_string_names_kind_and_fields) {
    const auto p = make_paragraph("p1", AttributedText{"Hi"}, ParagraphBlockType::header1);
    EXPECT_EQ(to_string(p),
              "Paragraph(id: p1, block_type: header1, text: AttributedText(\"Hi\", spans: []), "
              "metadata: {})");
    EXPECT_EQ(to_string(make_horizontal_rule("hr")), "HorizontalRule(id: hr, metadata: {})");
}
