/// @file change_event.hpp
/// @brief Events describing MutableDocument changes.

#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace richdoc_cpp {

/// A node was inserted at `index`.
struct NodeInserted {
    std::string node_id;  ///< Id of the new node.
    std::size_t index;    ///< Position of the new node after insertion.
    auto operator==(const NodeInserted&) const -> bool = default;
};

/// A node was removed.
struct NodeDeleted {
    std::string node_id;  ///< Id of the removed node.
    std::size_t index;    ///< Position the node occupied before removal.
    auto operator==(const NodeDeleted&) const -> bool = default;
};

/// A node was swapped for another, possibly under a new id.
struct NodeReplaced {
    std::string old_node_id;
    std::string new_node_id;
    auto operator==(const NodeReplaced&) const -> bool = default;
};

/// A node changed position.
struct NodeMoved {
    std::string node_id;
    std::size_t old_index;
    std::size_t new_index;
    auto operator==(const NodeMoved&) const -> bool = default;
};

/// Only the text of a text-bearing node changed. No MutableDocument call
/// emits this; update_node() reports NodeReplaced.
struct TextChanged {
    std::string node_id;
    auto operator==(const TextChanged&) const -> bool = default;
};

/// The set of possible document changes.
using DocumentChangeEvent = std::variant<
    NodeInserted,
    NodeDeleted,
    NodeReplaced,
    NodeMoved,
    TextChanged
>;

/// The events produced by one successful mutation.
using ChangeBatch = std::vector<DocumentChangeEvent>;

/// Human-readable description, e.g. `NodeInserted(node_id: n2, index: 1)`.
auto to_string(const DocumentChangeEvent& event) -> std::string;

}  // namespace richdoc_cpp
