#include <richdoc-cpp/mutable_document.hpp>

#include "raise.hpp"

#include <plog/Log.h>

#include <cstddef>
#include <string>
#include <utility>

namespace richdoc_cpp {

MutableDocument::MutableDocument(std::vector<DocumentNode> nodes)
    : Document{std::move(nodes)} {}

// -- Validation ---------------------------------------------------------------

auto MutableDocument::require_index(std::string_view id, const char* op) const -> std::size_t {
    const auto index = node_index(id);
    if (index == npos) {
        detail::raise(ErrorKind::not_found,
            std::string{op} + ": no node with id '" + std::string{id} + "'");
    }
    return index;
}

void MutableDocument::require_unused(const std::string& new_id, std::string_view old_id,
                                     const char* op) const {
    if (new_id != old_id && contains(new_id)) {
        detail::raise(ErrorKind::duplicate_node_id,
            std::string{op} + ": node id '" + new_id + "' is already in use");
    }
}

// -- Mutation -----------------------------------------------------------------

auto MutableDocument::insert_node(std::size_t index, DocumentNode node) -> ChangeBatch {
    if (index > nodes_.size()) {
        detail::raise(ErrorKind::out_of_range,
            "insert_node: index " + std::to_string(index) +
            " is beyond node count " + std::to_string(nodes_.size()));
    }
    if (contains(node.id)) {
        detail::raise(ErrorKind::duplicate_node_id,
            "insert_node: node id '" + node.id + "' is already in use");
    }

    auto id = node.id;
    nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
    PLOGD << "insert_node: '" << id << "' at " << index;
    return publish({NodeInserted{.node_id = std::move(id), .index = index}});
}

auto MutableDocument::delete_node(std::string_view id) -> ChangeBatch {
    const auto index = require_index(id, "delete_node");

    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(index));
    PLOGD << "delete_node: '" << id << "' from " << index;
    return publish({NodeDeleted{.node_id = std::string{id}, .index = index}});
}

auto MutableDocument::replace_node(std::string_view old_id, DocumentNode node) -> ChangeBatch {
    const auto index = require_index(old_id, "replace_node");
    require_unused(node.id, old_id, "replace_node");

    auto event = NodeReplaced{.old_node_id = std::string{old_id}, .new_node_id = node.id};
    nodes_[index] = std::move(node);
    PLOGD << "replace_node: '" << event.old_node_id << "' -> '" << event.new_node_id << "'";
    return publish({std::move(event)});
}

auto MutableDocument::move_node(std::string_view id, std::size_t new_index) -> ChangeBatch {
    const auto old_index = require_index(id, "move_node");
    if (new_index >= nodes_.size()) {
        detail::raise(ErrorKind::out_of_range,
            "move_node: index " + std::to_string(new_index) +
            " is not below node count " + std::to_string(nodes_.size()));
    }

    auto node = std::move(nodes_[old_index]);
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(old_index));
    nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(new_index), std::move(node));
    PLOGD << "move_node: '" << id << "' " << old_index << " -> " << new_index;
    return publish({NodeMoved{.node_id = std::string{id}, .old_index = old_index,
                              .new_index = new_index}});
}

auto MutableDocument::update_node(std::string_view id, const NodeUpdater& updater) -> ChangeBatch {
    const auto index = require_index(id, "update_node");

    auto updated = updater(nodes_[index]);
    require_unused(updated.id, id, "update_node");

    auto event = NodeReplaced{.old_node_id = std::string{id}, .new_node_id = updated.id};
    nodes_[index] = std::move(updated);
    PLOGD << "update_node: '" << event.old_node_id << "' -> '" << event.new_node_id << "'";
    return publish({std::move(event)});
}

// -- Observation --------------------------------------------------------------

auto MutableDocument::subscribe(ChangeListener listener) -> SubscriptionId {
    const auto id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

auto MutableDocument::unsubscribe(SubscriptionId id) -> bool {
    return listeners_.erase(id) > 0;
}

auto MutableDocument::publish(ChangeBatch batch) -> ChangeBatch {
    last_changes_ = batch;

    // Snapshot so a listener may unsubscribe itself or others while running.
    auto snapshot = std::vector<ChangeListener>{};
    snapshot.reserve(listeners_.size());
    for (const auto& [_, listener] : listeners_) snapshot.push_back(listener);
    for (const auto& listener : snapshot) listener(batch);

    return batch;
}

}  // namespace richdoc_cpp
