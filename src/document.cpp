#include <richdoc-cpp/change_event.hpp>
#include <richdoc-cpp/document.hpp>

#include "raise.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace richdoc_cpp {

Document::Document(std::vector<DocumentNode> nodes) : nodes_{std::move(nodes)} {
    auto seen = std::set<std::string_view>{};
    for (const auto& node : nodes_) {
        if (!seen.insert(node.id).second) {
            detail::raise(ErrorKind::duplicate_node_id,
                "document: node id '" + node.id + "' appears more than once");
        }
    }
}

auto Document::node_by_id(std::string_view id) const -> const DocumentNode* {
    const auto index = node_index(id);
    return index == npos ? nullptr : &nodes_[index];
}

auto Document::node_at(std::size_t index) const -> const DocumentNode& {
    if (index >= nodes_.size()) {
        detail::raise(ErrorKind::out_of_range,
            "node_at: index " + std::to_string(index) +
            " is not below node count " + std::to_string(nodes_.size()));
    }
    return nodes_[index];
}

auto Document::node_after(std::string_view id) const -> const DocumentNode* {
    const auto index = node_index(id);
    if (index == npos || index + 1 >= nodes_.size()) return nullptr;
    return &nodes_[index + 1];
}

auto Document::node_before(std::string_view id) const -> const DocumentNode* {
    const auto index = node_index(id);
    if (index == npos || index == 0) return nullptr;
    return &nodes_[index - 1];
}

auto Document::node_index(std::string_view id) const -> std::size_t {
    auto it = std::ranges::find(nodes_, id, &DocumentNode::id);
    if (it == nodes_.end()) return npos;
    return static_cast<std::size_t>(it - nodes_.begin());
}

auto to_string(const Document& document) -> std::string {
    auto out = "Document(" + std::to_string(document.node_count()) + " nodes)";
    auto index = std::size_t{0};
    for (const auto& node : document.nodes()) {
        out += "\n  [" + std::to_string(index++) + "] " + to_string(node);
    }
    return out;
}

// -- Change events ------------------------------------------------------------

auto to_string(const DocumentChangeEvent& event) -> std::string {
    return std::visit(overload{
        [](const NodeInserted& e) {
            return "NodeInserted(node_id: " + e.node_id +
                   ", index: " + std::to_string(e.index) + ")";
        },
        [](const NodeDeleted& e) {
            return "NodeDeleted(node_id: " + e.node_id +
                   ", index: " + std::to_string(e.index) + ")";
        },
        [](const NodeReplaced& e) {
            return "NodeReplaced(old_node_id: " + e.old_node_id +
                   ", new_node_id: " + e.new_node_id + ")";
        },
        [](const NodeMoved& e) {
            return "NodeMoved(node_id: " + e.node_id +
                   ", old_index: " + std::to_string(e.old_index) +
                   ", new_index: " + std::to_string(e.new_index) + ")";
        },
        [](const TextChanged& e) {
            return "TextChanged(node_id: " + e.node_id + ")";
        },
    }, event);
}

}  // namespace richdoc_cpp
