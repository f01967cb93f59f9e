/// @file document_position.hpp
/// @brief DocumentPosition: a node id plus a position inside that node.

#pragma once

#include <richdoc-cpp/node_position.hpp>

#include <string>
#include <utility>

namespace richdoc_cpp {

/// A location in a Document.
///
/// Not validated on construction: the node may be absent from a given
/// document, and the position kind may not suit the node.
struct DocumentPosition {
    std::string node_id;
    NodePosition node_position{TextNodePosition{}};

    auto with_node_id(std::string id) const -> DocumentPosition {
        return DocumentPosition{.node_id = std::move(id), .node_position = node_position};
    }

    auto with_node_position(NodePosition position) const -> DocumentPosition {
        return DocumentPosition{.node_id = node_id, .node_position = std::move(position)};
    }

    auto operator==(const DocumentPosition&) const -> bool = default;
};

/// e.g. `DocumentPosition(node_id: p1, node_position: TextNodePosition(offset: 3, ...))`.
auto to_string(const DocumentPosition& position) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::DocumentPosition> {
    auto operator()(const richdoc_cpp::DocumentPosition& p) const noexcept -> std::size_t {
        auto h = std::hash<std::string>{}(p.node_id);
        richdoc_cpp::detail::hash_combine(h, std::hash<richdoc_cpp::NodePosition>{}(p.node_position));
        return h;
    }
};

/// @endcond
