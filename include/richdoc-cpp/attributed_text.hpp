/// @file attributed_text.hpp
/// @brief AttributedText: immutable text with attribution spans.

#pragma once

#include <richdoc-cpp/attribution.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace richdoc_cpp {

/// Whether a SpanMarker opens or closes an attribution span.
enum class SpanMarkerType : std::uint8_t {
    start,  ///< Opens a span.
    end,    ///< Closes a span.
};

/// Convert a SpanMarkerType to its string representation.
constexpr auto to_string_view(SpanMarkerType type) noexcept -> std::string_view {
    switch (type) {
        case SpanMarkerType::start: return "start";
        case SpanMarkerType::end:   return "end";
    }
    return "unknown";
}

/// One boundary of an attribution span.
///
/// Markers order by offset, then start before end at the same offset, then
/// by attribution. The last key only breaks ties so that a normalised
/// marker list is canonical.
struct SpanMarker {
    Attribution attribution;  ///< The attribution this marker belongs to.
    std::size_t offset{0};    ///< Code point offset of the boundary.
    SpanMarkerType type{SpanMarkerType::start};  ///< Opening or closing.

    /// Copy with a different offset.
    auto with_offset(std::size_t o) const -> SpanMarker {
        return SpanMarker{.attribution = attribution, .offset = o, .type = type};
    }

    /// Copy with a different marker type.
    auto with_type(SpanMarkerType t) const -> SpanMarker {
        return SpanMarker{.attribution = attribution, .offset = offset, .type = t};
    }

    auto operator==(const SpanMarker&) const -> bool = default;
};

/// Marker sort order: offset, then start-before-end, then attribution.
auto operator<(const SpanMarker& a, const SpanMarker& b) -> bool;

/// A resolved span; both `start` and `end` are inclusive.
struct AttributionSpan {
    Attribution attribution;
    std::size_t start{0};
    std::size_t end{0};

    auto operator==(const AttributionSpan&) const -> bool = default;
};

/// Immutable rich text: a code point string plus sorted span markers.
///
/// Every operation returns a new AttributedText; the receiver is never
/// modified. Offsets and length() count Unicode code points. The marker
/// list is kept sorted and normalised: overlapping or adjacent (gap <= 1)
/// spans whose attributions can merge are always collapsed into one.
///
/// Copies share their immutable storage, so passing AttributedText by
/// value is cheap.
///
/// @code
/// auto text = AttributedText{"hello world"}
///     .apply_attribution(attributions::bold(), 0, 4);
/// text.has_attribution_at(2, attributions::bold());  // true
/// text.has_attribution_at(5, attributions::bold());  // false
/// @endcode
///
/// Failing operations throw Exception: `start > end` is a
/// precondition_violation, an offset beyond length() is out_of_range.
class AttributedText {
public:
    /// Empty text without attributions.
    AttributedText();

    /// Decode UTF-8 text. Malformed sequences become U+FFFD.
    explicit AttributedText(std::string_view utf8);

    /// Decode UTF-8 text and adopt `markers` (sorted and normalised here).
    AttributedText(std::string_view utf8, std::vector<SpanMarker> markers);

    /// Take code points directly.
    explicit AttributedText(std::u32string code_points,
                            std::vector<SpanMarker> markers = {});

    // -- Content --------------------------------------------------------------

    /// The text encoded as UTF-8.
    auto text() const -> std::string;

    /// The stored code points.
    auto code_points() const -> const std::u32string& { return *text_; }

    /// Number of code points.
    auto length() const -> std::size_t { return text_->size(); }

    auto empty() const -> bool { return text_->empty(); }

    /// The canonical sorted marker list.
    auto markers() const -> std::span<const SpanMarker> { return *markers_; }

    /// Every resolved span, in marker order of their end markers.
    auto spans() const -> std::vector<AttributionSpan>;

    // -- Attribution queries --------------------------------------------------

    /// Every attribution covering `offset`.
    auto attributions_at(std::size_t offset) const -> std::set<Attribution>;

    /// Whether `attribution` covers `offset`.
    auto has_attribution_at(std::size_t offset, const Attribution& attribution) const -> bool;

    /// The span of `attribution` containing `offset`, if any.
    auto attribution_span_at(std::size_t offset, const Attribution& attribution) const
        -> std::optional<AttributionSpan>;

    /// Every span with `span.start <= end && span.end >= start`.
    auto attribution_spans_in_range(std::size_t start, std::size_t end) const
        -> std::vector<AttributionSpan>;

    // -- Attribution edits ----------------------------------------------------

    /// Apply `attribution` over [start, end] (inclusive), merging with
    /// overlapping or adjacent spans of the same merge class.
    auto apply_attribution(const Attribution& attribution,
                           std::size_t start, std::size_t end) const -> AttributedText;

    /// Remove `attribution` from [start, end] (inclusive). Portions of
    /// existing spans outside the range survive. When the attribution is
    /// absent the result shares storage with *this.
    auto remove_attribution(const Attribution& attribution,
                            std::size_t start, std::size_t end) const -> AttributedText;

    /// Remove `attribution` if it covers every offset of [start, end],
    /// otherwise apply it over the whole range.
    auto toggle_attribution(const Attribution& attribution,
                            std::size_t start, std::size_t end) const -> AttributedText;

    // -- Text edits -----------------------------------------------------------

    /// Extract [start, end) with spans clipped and re-indexed from 0.
    auto copy_text(std::size_t start) const -> AttributedText;
    auto copy_text(std::size_t start, std::size_t end) const -> AttributedText;

    /// Splice `other` in at `offset`. Markers of *this at or after `offset`
    /// shift right by other.length(); markers of `other` shift by `offset`.
    auto insert(std::size_t offset, const AttributedText& other) const -> AttributedText;

    /// Remove [start, end) (exclusive end). Spans inside are dropped, spans
    /// after shift left, spans straddling a boundary are clipped.
    auto erase(std::size_t start, std::size_t end) const -> AttributedText;

    /// Replace [start, end] (inclusive) with `replacement`:
    /// `erase(start, end + 1).insert(start, replacement)`.
    auto replace_sub(std::size_t start, std::size_t end,
                     const AttributedText& replacement) const -> AttributedText;

    // -- Identity -------------------------------------------------------------

    /// True when both values share the same immutable storage.
    auto shares_storage_with(const AttributedText& other) const noexcept -> bool {
        return text_ == other.text_ && markers_ == other.markers_;
    }

    auto operator==(const AttributedText& other) const -> bool;

private:
    AttributedText(std::shared_ptr<const std::u32string> text,
                   std::shared_ptr<const std::vector<SpanMarker>> markers);

    /// Build a value over the same text with `markers` normalised.
    auto with_markers(std::vector<SpanMarker> markers) const -> AttributedText;

    auto is_fully_covered(const Attribution& attribution,
                          std::size_t start, std::size_t end) const -> bool;

    std::shared_ptr<const std::u32string> text_;
    std::shared_ptr<const std::vector<SpanMarker>> markers_;
};

/// Render as `AttributedText("...", spans: [bold 0..4])`.
auto to_string(const AttributedText& text) -> std::string;

}  // namespace richdoc_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<richdoc_cpp::SpanMarker> {
    auto operator()(const richdoc_cpp::SpanMarker& m) const noexcept -> std::size_t {
        auto h = std::hash<richdoc_cpp::Attribution>{}(m.attribution);
        richdoc_cpp::detail::hash_combine(h, std::hash<std::size_t>{}(m.offset));
        richdoc_cpp::detail::hash_combine(h, static_cast<std::size_t>(m.type));
        return h;
    }
};

template <>
struct std::hash<richdoc_cpp::AttributedText> {
    auto operator()(const richdoc_cpp::AttributedText& t) const noexcept -> std::size_t {
        auto h = std::hash<std::u32string>{}(t.code_points());
        for (const auto& m : t.markers()) {
            richdoc_cpp::detail::hash_combine(h, std::hash<richdoc_cpp::SpanMarker>{}(m));
        }
        return h;
    }
};

/// @endcond
