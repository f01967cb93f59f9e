/// @file document.hpp
/// @brief Document: an ordered, read-only list of nodes.

#pragma once

#include <richdoc-cpp/document_node.hpp>

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace richdoc_cpp {

/// An ordered sequence of DocumentNodes with unique ids.
///
/// Document exposes the read side only; MutableDocument adds mutation.
/// Lookups by id scan the node list linearly, which suits the document
/// sizes an editing session works with.
///
/// @code
/// auto doc = Document{{
///     make_paragraph("title", AttributedText{"Notes"}, ParagraphBlockType::header1),
///     make_paragraph("body", AttributedText{"First line"}),
/// }};
/// doc.node_index("body");      // 1
/// doc.node_after("title")->id; // "body"
/// @endcode
class Document {
public:
    /// Returned by node_index() when no node has the requested id.
    static constexpr auto npos = std::numeric_limits<std::size_t>::max();

    /// Construct an empty document.
    Document() = default;

    /// Construct from `nodes`, in order.
    /// @throws Exception (duplicate_node_id) if two nodes share an id.
    explicit Document(std::vector<DocumentNode> nodes);

    // -- Reading --------------------------------------------------------------

    /// Every node, in document order.
    auto nodes() const -> std::span<const DocumentNode> { return nodes_; }

    auto node_count() const -> std::size_t { return nodes_.size(); }
    auto empty() const -> bool { return nodes_.empty(); }

    /// The node with `id`, or nullptr.
    auto node_by_id(std::string_view id) const -> const DocumentNode*;

    /// The node at `index`.
    /// @throws Exception (out_of_range) if `index >= node_count()`.
    auto node_at(std::size_t index) const -> const DocumentNode&;

    /// The node following `id`, or nullptr at the end or for an unknown id.
    auto node_after(std::string_view id) const -> const DocumentNode*;

    /// The node preceding `id`, or nullptr at the start or for an unknown id.
    auto node_before(std::string_view id) const -> const DocumentNode*;

    /// Position of the node with `id`, or npos.
    auto node_index(std::string_view id) const -> std::size_t;

    auto contains(std::string_view id) const -> bool { return node_index(id) != npos; }

    auto operator==(const Document& other) const -> bool { return nodes_ == other.nodes_; }

protected:
    std::vector<DocumentNode> nodes_;
};

/// One line per node, e.g. `Document(2 nodes)\n  [0] Paragraph(...)`.
auto to_string(const Document& document) -> std::string;

}  // namespace richdoc_cpp
