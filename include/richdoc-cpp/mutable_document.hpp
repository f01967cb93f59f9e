/// @file mutable_document.hpp
/// @brief MutableDocument: a Document with change notification.

#pragma once

#include <richdoc-cpp/change_event.hpp>
#include <richdoc-cpp/document.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace richdoc_cpp {

/// Callback receiving the events of one mutation.
using ChangeListener = std::function<void(const ChangeBatch&)>;

/// Handle returned by MutableDocument::subscribe().
using SubscriptionId = std::uint64_t;

/// Transforms a node for MutableDocument::update_node().
using NodeUpdater = std::function<DocumentNode(const DocumentNode&)>;

/// A Document that can be edited and observed.
///
/// Every mutation either succeeds completely, returning and broadcasting
/// its events, or throws Exception before touching the node list. Listeners
/// run synchronously, once per successful mutation, with exactly that
/// mutation's batch.
///
/// Notification is last-batch-only: last_changes() holds the batch of the
/// most recent mutation and is overwritten by the next one. A listener
/// subscribed after a mutation returns does not see its events.
///
/// Not internally synchronised; one owner mutates. A listener may mutate the
/// document it observes: the nested call notifies every listener with its
/// own batch and leaves last_changes() holding that batch, while the outer
/// call still returns and finishes delivering its own.
///
/// @code
/// auto doc = MutableDocument{{make_paragraph("n1")}};
/// auto events = doc.insert_node(1, make_paragraph("n2"));
/// // events == ChangeBatch{NodeInserted{"n2", 1}}
/// @endcode
class MutableDocument : public Document {
public:
    MutableDocument() = default;

    /// @throws Exception (duplicate_node_id) if two nodes share an id.
    explicit MutableDocument(std::vector<DocumentNode> nodes);

    // -- Mutation -------------------------------------------------------------

    /// Insert `node` before position `index`; `index == node_count()` appends.
    /// @throws Exception (out_of_range) if `index > node_count()`.
    /// @throws Exception (duplicate_node_id) if `node.id` is already present.
    auto insert_node(std::size_t index, DocumentNode node) -> ChangeBatch;

    /// Remove the node with `id`.
    /// @throws Exception (not_found) if no node has `id`.
    auto delete_node(std::string_view id) -> ChangeBatch;

    /// Put `node` in place of the node with `old_id`.
    /// @throws Exception (not_found) if no node has `old_id`.
    /// @throws Exception (duplicate_node_id) if `node.id` differs from
    ///   `old_id` and belongs to another node.
    auto replace_node(std::string_view old_id, DocumentNode node) -> ChangeBatch;

    /// Move the node with `id` so that it ends up at `new_index`.
    /// `new_index` counts positions in the list with the node removed.
    /// @throws Exception (not_found) if no node has `id`.
    /// @throws Exception (out_of_range) if `new_index >= node_count()`.
    auto move_node(std::string_view id, std::size_t new_index) -> ChangeBatch;

    /// Replace the node with `id` by `updater(node)`.
    ///
    /// Emits NodeReplaced{id, updater(node).id}, whatever the updater
    /// changed. An exception thrown by `updater` propagates with the
    /// document unchanged.
    /// @throws Exception (not_found) if no node has `id`.
    /// @throws Exception (duplicate_node_id) as for replace_node().
    auto update_node(std::string_view id, const NodeUpdater& updater) -> ChangeBatch;

    // -- Observation ----------------------------------------------------------

    /// Register `listener` for every future mutation.
    auto subscribe(ChangeListener listener) -> SubscriptionId;

    /// Stop notifying the listener. Returns false for an unknown id.
    auto unsubscribe(SubscriptionId id) -> bool;

    /// Events of the most recent successful mutation; empty before the first.
    auto last_changes() const -> const ChangeBatch& { return last_changes_; }

    auto listener_count() const -> std::size_t { return listeners_.size(); }

private:
    auto require_index(std::string_view id, const char* op) const -> std::size_t;
    void require_unused(const std::string& new_id, std::string_view old_id,
                        const char* op) const;
    auto publish(ChangeBatch batch) -> ChangeBatch;

    ChangeBatch last_changes_;
    std::map<SubscriptionId, ChangeListener> listeners_;
    SubscriptionId next_subscription_{1};
};

}  // namespace richdoc_cpp
