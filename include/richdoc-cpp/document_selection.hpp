/// @file document_selection.hpp
/// @brief DocumentSelection: a base and an extent position.

#pragma once

#include <richdoc-cpp/document.hpp>
#include <richdoc-cpp/document_position.hpp>
#include <richdoc-cpp/node_position.hpp>

#include <string>
#include <utility>

namespace richdoc_cpp {

/// A selection from `base` (where it was anchored) to `extent` (the end
/// that moves). Direction is not stored; affinity() derives it from a
/// Document's node order.
///
/// @code
/// auto sel = DocumentSelection{
///     .base = {.node_id = "n2", .node_position = TextNodePosition{.offset = 0}},
///     .extent = {.node_id = "n1", .node_position = TextNodePosition{.offset = 3}},
/// };
/// sel.affinity(doc);   // upstream
/// sel.normalize(doc);  // base n1:3, extent n2:0
/// @endcode
struct DocumentSelection {
    DocumentPosition base;
    DocumentPosition extent;

    /// A caret at `position`.
    static auto collapsed(DocumentPosition position) -> DocumentSelection {
        return DocumentSelection{.base = position, .extent = std::move(position)};
    }

    auto is_collapsed() const -> bool { return base == extent; }
    auto is_expanded() const -> bool { return !is_collapsed(); }

    /// downstream when `extent` is at or after `base` in `document` order,
    /// upstream otherwise. Always downstream when collapsed.
    ///
    /// Nodes are ordered by index; a node id that `document` does not
    /// contain orders before every node it does. Within one node, text
    /// offsets compare numerically and a binary upstream side precedes the
    /// downstream side. Mismatched position kinds in one node give
    /// downstream.
    auto affinity(const Document& document) const -> TextAffinity;

    /// This selection with base and extent swapped if affinity() is
    /// upstream, otherwise unchanged.
    auto normalize(const Document& document) const -> DocumentSelection;

    auto with_base(DocumentPosition position) const -> DocumentSelection {
        return DocumentSelection{.base = std::move(position), .extent = extent};
    }

    auto with_extent(DocumentPosition position) const -> DocumentSelection {
        return DocumentSelection{.base = base, .extent = std::move(position)};
    }

    auto operator==(const DocumentSelection&) const -> bool = default;
};

/// `DocumentSelection(base: ..., extent: ...)`.
auto to_string(const DocumentSelection& selection) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::DocumentSelection> {
    auto operator()(const richdoc_cpp::DocumentSelection& s) const noexcept -> std::size_t {
        auto h = std::hash<richdoc_cpp::DocumentPosition>{}(s.base);
        richdoc_cpp::detail::hash_combine(h, std::hash<richdoc_cpp::DocumentPosition>{}(s.extent));
        return h;
    }
};

/// @endcond
