#include <richdoc-cpp/document_selection.hpp>

#include <cstddef>
#include <string>
#include <variant>

namespace richdoc_cpp {

auto to_string(const NodePosition& position) -> std::string {
    return std::visit(overload{
        [](const TextNodePosition& p) {
            return "TextNodePosition(offset: " + std::to_string(p.offset) +
                   ", affinity: " + std::string{to_string_view(p.affinity)} + ")";
        },
        [](const BinaryNodePosition& p) {
            return "BinaryNodePosition(" + std::string{to_string_view(p.side)} + ")";
        },
    }, position);
}

auto to_string(const DocumentPosition& position) -> std::string {
    return "DocumentPosition(node_id: " + position.node_id +
           ", node_position: " + to_string(position.node_position) + ")";
}

auto to_string(const DocumentSelection& selection) -> std::string {
    return "DocumentSelection(base: " + to_string(selection.base) +
           ", extent: " + to_string(selection.extent) + ")";
}

// Document order of a node; ids the document lacks come first.
static auto order_of(const Document& document, const std::string& id) -> std::ptrdiff_t {
    const auto index = document.node_index(id);
    return index == Document::npos ? -1 : static_cast<std::ptrdiff_t>(index);
}

static auto same_node_affinity(const NodePosition& base, const NodePosition& extent) -> TextAffinity {
    const auto* base_text = std::get_if<TextNodePosition>(&base);
    const auto* extent_text = std::get_if<TextNodePosition>(&extent);
    if (base_text && extent_text) {
        return extent_text->offset >= base_text->offset ? TextAffinity::downstream
                                                        : TextAffinity::upstream;
    }

    const auto* base_binary = std::get_if<BinaryNodePosition>(&base);
    const auto* extent_binary = std::get_if<BinaryNodePosition>(&extent);
    if (base_binary && extent_binary) {
        if (*base_binary == *extent_binary) return TextAffinity::downstream;
        return extent_binary->side;
    }

    return TextAffinity::downstream;
}

auto DocumentSelection::affinity(const Document& document) const -> TextAffinity {
    if (is_collapsed()) return TextAffinity::downstream;

    const auto base_order = order_of(document, base.node_id);
    const auto extent_order = order_of(document, extent.node_id);

    if (extent_order > base_order) return TextAffinity::downstream;
    if (extent_order < base_order) return TextAffinity::upstream;
    return same_node_affinity(base.node_position, extent.node_position);
}

auto DocumentSelection::normalize(const Document& document) const -> DocumentSelection {
    if (affinity(document) == TextAffinity::upstream) {
        return DocumentSelection{.base = extent, .extent = base};
    }
    return *this;
}

}  // namespace richdoc_cpp
