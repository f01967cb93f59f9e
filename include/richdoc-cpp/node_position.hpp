/// @file node_position.hpp
/// @brief Positions inside a single DocumentNode.

#pragma once

#include <richdoc-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace richdoc_cpp {

/// Which side of a boundary a position or selection leans towards.
enum class TextAffinity : std::uint8_t {
    upstream,    ///< Towards the start of the document.
    downstream,  ///< Towards the end of the document.
};

constexpr auto to_string_view(TextAffinity affinity) noexcept -> std::string_view {
    switch (affinity) {
        case TextAffinity::upstream:   return "upstream";
        case TextAffinity::downstream: return "downstream";
    }
    return "unknown";
}

/// A caret location inside a text-bearing node.
///
/// `affinity` decides which character the offset sticks to when it falls on
/// a soft line break.
struct TextNodePosition {
    std::size_t offset{0};
    TextAffinity affinity{TextAffinity::downstream};

    auto with_offset(std::size_t o) const -> TextNodePosition {
        return TextNodePosition{.offset = o, .affinity = affinity};
    }

    auto with_affinity(TextAffinity a) const -> TextNodePosition {
        return TextNodePosition{.offset = offset, .affinity = a};
    }

    auto operator==(const TextNodePosition&) const -> bool = default;
};

/// A location on a non-text node, which has only two: before its content
/// (upstream) and after it (downstream).
struct BinaryNodePosition {
    TextAffinity side{TextAffinity::upstream};

    static constexpr auto upstream() -> BinaryNodePosition {
        return BinaryNodePosition{.side = TextAffinity::upstream};
    }

    static constexpr auto downstream() -> BinaryNodePosition {
        return BinaryNodePosition{.side = TextAffinity::downstream};
    }

    auto operator==(const BinaryNodePosition&) const -> bool = default;
};

/// A position inside some node. Text-bearing nodes take TextNodePosition,
/// non-text nodes take BinaryNodePosition; the pairing is not enforced.
using NodePosition = std::variant<TextNodePosition, BinaryNodePosition>;

/// e.g. `TextNodePosition(offset: 3, affinity: downstream)` or
/// `BinaryNodePosition(upstream)`.
auto to_string(const NodePosition& position) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::TextNodePosition> {
    auto operator()(const richdoc_cpp::TextNodePosition& p) const noexcept -> std::size_t {
        auto h = std::hash<std::size_t>{}(p.offset);
        richdoc_cpp::detail::hash_combine(h, static_cast<std::size_t>(p.affinity));
        return h;
    }
};

template <>
struct std::hash<richdoc_cpp::BinaryNodePosition> {
    auto operator()(const richdoc_cpp::BinaryNodePosition& p) const noexcept -> std::size_t {
        return std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(p.side));
    }
};

/// @endcond
