/// @file document_node.hpp
/// @brief DocumentNode: one block of document content.

#pragma once

#include <richdoc-cpp/attributed_text.hpp>
#include <richdoc-cpp/node_id.hpp>
#include <richdoc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace richdoc_cpp {

// -- Block kinds --------------------------------------------------------------

/// Semantic block type of a Paragraph.
enum class ParagraphBlockType : std::uint8_t {
    paragraph,
    header1,
    header2,
    header3,
    header4,
    header5,
    header6,
    blockquote,
    code_block,
};

constexpr auto to_string_view(ParagraphBlockType type) noexcept -> std::string_view {
    switch (type) {
        case ParagraphBlockType::paragraph:  return "paragraph";
        case ParagraphBlockType::header1:    return "header1";
        case ParagraphBlockType::header2:    return "header2";
        case ParagraphBlockType::header3:    return "header3";
        case ParagraphBlockType::header4:    return "header4";
        case ParagraphBlockType::header5:    return "header5";
        case ParagraphBlockType::header6:    return "header6";
        case ParagraphBlockType::blockquote: return "blockquote";
        case ParagraphBlockType::code_block: return "code_block";
    }
    return "unknown";
}

/// Marker style of a ListItem.
enum class ListItemType : std::uint8_t {
    unordered,  ///< Bulleted.
    ordered,    ///< Numbered.
};

constexpr auto to_string_view(ListItemType type) noexcept -> std::string_view {
    switch (type) {
        case ListItemType::unordered: return "unordered";
        case ListItemType::ordered:   return "ordered";
    }
    return "unknown";
}

// -- Node content -------------------------------------------------------------

/// Plain text-bearing block with no further semantics.
struct TextBlock {
    AttributedText text;
    auto operator==(const TextBlock&) const -> bool = default;
};

/// Body text, heading, blockquote, or code paragraph.
struct Paragraph {
    AttributedText text;
    ParagraphBlockType block_type{ParagraphBlockType::paragraph};
    auto operator==(const Paragraph&) const -> bool = default;
};

/// One item of an ordered or unordered list. `indent` 0 is the top level.
struct ListItem {
    AttributedText text;
    ListItemType type{ListItemType::unordered};
    int indent{0};
    auto operator==(const ListItem&) const -> bool = default;
};

/// Fenced source code with an optional language tag.
struct CodeBlock {
    AttributedText text;
    std::optional<std::string> language;
    auto operator==(const CodeBlock&) const -> bool = default;
};

/// An image. Non-text: addressable only before or after its content.
struct Image {
    std::string image_url;
    std::optional<std::string> alt_text;
    std::optional<double> width;
    std::optional<double> height;
    auto operator==(const Image&) const -> bool = default;
};

/// A divider. Non-text.
struct HorizontalRule {
    auto operator==(const HorizontalRule&) const -> bool = default;
};

/// The closed set of block kinds.
using NodeContent = std::variant<
    TextBlock,
    Paragraph,
    ListItem,
    CodeBlock,
    Image,
    HorizontalRule
>;

/// Discriminator matching NodeContent's alternatives, in order.
enum class NodeKind : std::uint8_t {
    text_block,
    paragraph,
    list_item,
    code_block,
    image,
    horizontal_rule,
};

constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::text_block:      return "text_block";
        case NodeKind::paragraph:       return "paragraph";
        case NodeKind::list_item:       return "list_item";
        case NodeKind::code_block:      return "code_block";
        case NodeKind::image:           return "image";
        case NodeKind::horizontal_rule: return "horizontal_rule";
    }
    return "unknown";
}

// -- DocumentNode -------------------------------------------------------------

/// A block-level unit of a document.
///
/// Every node carries an `id` that is unique within its Document and an
/// immutable metadata map; `content` holds the kind-specific fields.
/// Nodes are values: derive modified copies with the with_*() helpers and
/// install them through MutableDocument.
///
/// @code
/// auto heading = make_paragraph("intro", AttributedText{"Introduction"},
///                               ParagraphBlockType::header1);
/// auto edited = heading.with_text(heading.text()->insert(0, AttributedText{"1. "}));
/// @endcode
struct DocumentNode {
    std::string id;
    Metadata metadata;
    NodeContent content;

    auto kind() const -> NodeKind { return static_cast<NodeKind>(content.index()); }

    /// Whether this node carries AttributedText (and takes TextNodePosition).
    auto is_text_node() const -> bool;

    /// The node's text, or nullptr for non-text nodes.
    auto text() const -> const AttributedText*;

    /// Typed access to the content, or nullptr when the kind differs.
    template <typename T>
    auto as() const -> const T* { return std::get_if<T>(&content); }

    // -- Copy-with ------------------------------------------------------------

    auto with_id(std::string new_id) const -> DocumentNode;
    auto with_metadata(Metadata new_metadata) const -> DocumentNode;
    auto with_content(NodeContent new_content) const -> DocumentNode;

    /// Replace the text of a text-bearing node.
    /// @throws Exception (precondition_violation) on a non-text node.
    auto with_text(AttributedText new_text) const -> DocumentNode;

    auto operator==(const DocumentNode&) const -> bool = default;
};

// -- Factories ----------------------------------------------------------------

auto make_text_block(std::string id, AttributedText text = {}, Metadata metadata = {})
    -> DocumentNode;

auto make_paragraph(std::string id, AttributedText text = {},
                    ParagraphBlockType block_type = ParagraphBlockType::paragraph,
                    Metadata metadata = {}) -> DocumentNode;

auto make_list_item(std::string id, AttributedText text = {},
                    ListItemType type = ListItemType::unordered, int indent = 0,
                    Metadata metadata = {}) -> DocumentNode;

auto make_code_block(std::string id, AttributedText text = {},
                     std::optional<std::string> language = std::nullopt,
                     Metadata metadata = {}) -> DocumentNode;

auto make_image(std::string id, std::string image_url,
                std::optional<std::string> alt_text = std::nullopt,
                std::optional<double> width = std::nullopt,
                std::optional<double> height = std::nullopt,
                Metadata metadata = {}) -> DocumentNode;

auto make_horizontal_rule(std::string id, Metadata metadata = {}) -> DocumentNode;

inline auto make_text_block(NodeIdGenerator& ids, AttributedText text = {}) -> DocumentNode {
    return make_text_block(ids(), std::move(text));
}

/// Build a paragraph whose id is drawn from `ids`.
inline auto make_paragraph(NodeIdGenerator& ids, AttributedText text = {},
                           ParagraphBlockType block_type = ParagraphBlockType::paragraph)
    -> DocumentNode {
    return make_paragraph(ids(), std::move(text), block_type);
}

/// Build a list item whose id is drawn from `ids`.
inline auto make_list_item(NodeIdGenerator& ids, AttributedText text = {},
                           ListItemType type = ListItemType::unordered, int indent = 0)
    -> DocumentNode {
    return make_list_item(ids(), std::move(text), type, indent);
}

inline auto make_code_block(NodeIdGenerator& ids, AttributedText text = {},
                            std::optional<std::string> language = std::nullopt) -> DocumentNode {
    return make_code_block(ids(), std::move(text), std::move(language));
}

inline auto make_image(NodeIdGenerator& ids, std::string image_url,
                       std::optional<std::string> alt_text = std::nullopt) -> DocumentNode {
    return make_image(ids(), std::move(image_url), std::move(alt_text));
}

/// Build a horizontal rule whose id is drawn from `ids`.
inline auto make_horizontal_rule(NodeIdGenerator& ids) -> DocumentNode {
    return make_horizontal_rule(ids());
}

/// Human-readable description, e.g.
/// `Paragraph(id: p1, block_type: header1, text: AttributedText("Hi", spans: []), metadata: {})`.
auto to_string(const DocumentNode& node) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::DocumentNode> {
    auto operator()(const richdoc_cpp::DocumentNode& node) const noexcept -> std::size_t;
};

/// @endcond
