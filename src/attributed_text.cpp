#include <richdoc-cpp/attributed_text.hpp>

#include "encoding/utf8.hpp"
#include "raise.hpp"
#include "span_algebra.hpp"

#include <algorithm>
#include <compare>
#include <iterator>
#include <ranges>
#include <string>
#include <utility>

namespace richdoc_cpp {

auto operator<(const SpanMarker& a, const SpanMarker& b) -> bool {
    if (a.offset != b.offset) return a.offset < b.offset;
    if (a.type != b.type) return a.type == SpanMarkerType::start;
    return a.attribution < b.attribution;
}

// -- Argument checks ----------------------------------------------------------

static void check_ordered(std::size_t start, std::size_t end, const char* op) {
    if (start > end) {
        detail::raise(ErrorKind::precondition_violation,
            std::string{op} + ": start " + std::to_string(start) +
            " is after end " + std::to_string(end));
    }
}

static void check_within(std::size_t offset, std::size_t length, const char* op) {
    if (offset > length) {
        detail::raise(ErrorKind::out_of_range,
            std::string{op} + ": offset " + std::to_string(offset) +
            " is beyond length " + std::to_string(length));
    }
}

static auto empty_text() -> const std::shared_ptr<const std::u32string>& {
    static const auto text = std::make_shared<const std::u32string>();
    return text;
}

static auto empty_markers() -> const std::shared_ptr<const std::vector<SpanMarker>>& {
    static const auto markers = std::make_shared<const std::vector<SpanMarker>>();
    return markers;
}

static auto share(std::vector<SpanMarker> markers) -> std::shared_ptr<const std::vector<SpanMarker>> {
    if (markers.empty()) return empty_markers();
    return std::make_shared<const std::vector<SpanMarker>>(std::move(markers));
}

static void push_span(std::vector<SpanMarker>& out, const Attribution& attribution,
                      std::size_t start, std::size_t end) {
    out.push_back(SpanMarker{.attribution = attribution, .offset = start, .type = SpanMarkerType::start});
    out.push_back(SpanMarker{.attribution = attribution, .offset = end, .type = SpanMarkerType::end});
}

// -- Construction -------------------------------------------------------------

AttributedText::AttributedText()
    : text_{empty_text()}, markers_{empty_markers()} {}

AttributedText::AttributedText(std::string_view utf8)
    : text_{std::make_shared<const std::u32string>(encoding::decode_utf8(utf8))},
      markers_{empty_markers()} {}

AttributedText::AttributedText(std::string_view utf8, std::vector<SpanMarker> markers)
    : text_{std::make_shared<const std::u32string>(encoding::decode_utf8(utf8))},
      markers_{share(detail::normalize_markers(std::move(markers)))} {}

AttributedText::AttributedText(std::u32string code_points, std::vector<SpanMarker> markers)
    : text_{std::make_shared<const std::u32string>(std::move(code_points))},
      markers_{share(detail::normalize_markers(std::move(markers)))} {}

AttributedText::AttributedText(std::shared_ptr<const std::u32string> text,
                               std::shared_ptr<const std::vector<SpanMarker>> markers)
    : text_{std::move(text)}, markers_{std::move(markers)} {}

auto AttributedText::with_markers(std::vector<SpanMarker> markers) const -> AttributedText {
    return AttributedText{text_, share(detail::normalize_markers(std::move(markers)))};
}

auto AttributedText::text() const -> std::string {
    return encoding::encode_utf8(*text_);
}

auto AttributedText::spans() const -> std::vector<AttributionSpan> {
    return detail::resolve_spans(*markers_);
}

// -- Attribution queries ------------------------------------------------------

auto AttributedText::attributions_at(std::size_t offset) const -> std::set<Attribution> {
    auto result = std::set<Attribution>{};
    for (auto& span : spans()) {
        if (span.start <= offset && offset <= span.end) {
            result.insert(std::move(span.attribution));
        }
    }
    return result;
}

auto AttributedText::has_attribution_at(std::size_t offset,
                                        const Attribution& attribution) const -> bool {
    return attribution_span_at(offset, attribution).has_value();
}

auto AttributedText::attribution_span_at(std::size_t offset, const Attribution& attribution) const
    -> std::optional<AttributionSpan> {
    for (auto& span : spans()) {
        if (span.attribution == attribution && span.start <= offset && offset <= span.end) {
            return std::move(span);
        }
    }
    return std::nullopt;
}

auto AttributedText::attribution_spans_in_range(std::size_t start, std::size_t end) const
    -> std::vector<AttributionSpan> {
    auto result = spans();
    std::erase_if(result, [&](const AttributionSpan& span) {
        return !(span.start <= end && span.end >= start);
    });
    return result;
}

// -- Attribution edits --------------------------------------------------------

auto AttributedText::apply_attribution(const Attribution& attribution,
                                       std::size_t start, std::size_t end) const -> AttributedText {
    check_ordered(start, end, "apply_attribution");
    check_within(end, length(), "apply_attribution");

    auto updated = std::vector<SpanMarker>{markers_->begin(), markers_->end()};
    push_span(updated, attribution, start, end);
    return with_markers(std::move(updated));
}

auto AttributedText::remove_attribution(const Attribution& attribution,
                                        std::size_t start, std::size_t end) const -> AttributedText {
    check_ordered(start, end, "remove_attribution");
    check_within(end, length(), "remove_attribution");

    auto existing = spans();
    std::erase_if(existing, [&](const AttributionSpan& s) { return s.attribution != attribution; });
    if (existing.empty()) return *this;

    auto updated = std::vector<SpanMarker>{};
    std::ranges::copy_if(*markers_, std::back_inserter(updated),
        [&](const SpanMarker& m) { return m.attribution != attribution; });

    for (const auto& span : existing) {
        if (span.end < start || span.start > end) {
            push_span(updated, span.attribution, span.start, span.end);
            continue;
        }
        // Overlaps the range: only the parts outside it survive.
        if (span.start < start) {
            push_span(updated, span.attribution, span.start, start - 1);
        }
        if (span.end > end) {
            push_span(updated, span.attribution, end + 1, span.end);
        }
    }

    return with_markers(std::move(updated));
}

auto AttributedText::toggle_attribution(const Attribution& attribution,
                                        std::size_t start, std::size_t end) const -> AttributedText {
    check_ordered(start, end, "toggle_attribution");
    check_within(end, length(), "toggle_attribution");

    if (is_fully_covered(attribution, start, end)) {
        return remove_attribution(attribution, start, end);
    }
    return apply_attribution(attribution, start, end);
}

auto AttributedText::is_fully_covered(const Attribution& attribution,
                                      std::size_t start, std::size_t end) const -> bool {
    auto candidates = spans();
    std::erase_if(candidates, [&](const AttributionSpan& s) { return s.attribution != attribution; });
    std::ranges::sort(candidates, {}, &AttributionSpan::start);

    auto covered = start;
    for (const auto& span : candidates) {
        if (span.start > covered) break;
        if (span.end >= covered) covered = span.end + 1;
        if (covered > end) return true;
    }
    return false;
}

// -- Text edits ---------------------------------------------------------------

auto AttributedText::copy_text(std::size_t start) const -> AttributedText {
    check_within(start, length(), "copy_text");
    return copy_text(start, length());
}

auto AttributedText::copy_text(std::size_t start, std::size_t end) const -> AttributedText {
    check_ordered(start, end, "copy_text");
    check_within(end, length(), "copy_text");
    if (start == end) return AttributedText{};

    auto new_text = text_->substr(start, end - start);
    auto new_markers = std::vector<SpanMarker>{};

    for (const auto& span : spans()) {
        if (span.end < start || span.start >= end) continue;

        const auto clipped_start = std::max(span.start, start);
        const auto clipped_end = span.end >= end ? end - 1 : span.end;
        push_span(new_markers, span.attribution, clipped_start - start, clipped_end - start);
    }

    return AttributedText{std::move(new_text), std::move(new_markers)};
}

auto AttributedText::insert(std::size_t offset, const AttributedText& other) const -> AttributedText {
    check_within(offset, length(), "insert");
    if (other.empty() && other.markers_->empty()) return *this;

    auto new_text = std::u32string{};
    new_text.reserve(length() + other.length());
    new_text.append(*text_, 0, offset);
    new_text.append(*other.text_);
    new_text.append(*text_, offset);

    const auto insert_len = other.length();
    auto new_markers = std::vector<SpanMarker>{};
    new_markers.reserve(markers_->size() + other.markers_->size());

    for (const auto& m : *markers_) {
        new_markers.push_back(m.offset >= offset ? m.with_offset(m.offset + insert_len) : m);
    }
    for (const auto& m : *other.markers_) {
        new_markers.push_back(m.with_offset(m.offset + offset));
    }

    return AttributedText{std::move(new_text), std::move(new_markers)};
}

auto AttributedText::erase(std::size_t start, std::size_t end) const -> AttributedText {
    check_ordered(start, end, "erase");
    check_within(end, length(), "erase");
    if (start == end) return *this;

    const auto delete_len = end - start;
    auto new_text = std::u32string{};
    new_text.reserve(length() - delete_len);
    new_text.append(*text_, 0, start);
    new_text.append(*text_, end);

    auto new_markers = std::vector<SpanMarker>{};

    for (const auto& span : spans()) {
        // Entirely inside the erased range.
        if (span.start >= start && span.end < end) continue;

        // Entirely after.
        if (span.start >= end) {
            push_span(new_markers, span.attribution,
                      span.start - delete_len, span.end - delete_len);
            continue;
        }

        // Entirely before.
        if (span.end < start) {
            push_span(new_markers, span.attribution, span.start, span.end);
            continue;
        }

        // Straddles a boundary.
        const auto new_start = std::min(span.start, start);
        if (span.end >= end) {
            push_span(new_markers, span.attribution, new_start, span.end - delete_len);
        } else {
            // span.start < start here, so start - 1 cannot wrap.
            push_span(new_markers, span.attribution, new_start, start - 1);
        }
    }

    return AttributedText{std::move(new_text), std::move(new_markers)};
}

auto AttributedText::replace_sub(std::size_t start, std::size_t end,
                                 const AttributedText& replacement) const -> AttributedText {
    check_ordered(start, end, "replace_sub");
    check_within(end + 1, length(), "replace_sub");
    return erase(start, end + 1).insert(start, replacement);
}

auto AttributedText::operator==(const AttributedText& other) const -> bool {
    if (shares_storage_with(other)) return true;
    return *text_ == *other.text_ && *markers_ == *other.markers_;
}

auto to_string(const AttributedText& text) -> std::string {
    auto out = "AttributedText(\"" + text.text() + "\", spans: [";
    auto first = true;
    for (const auto& span : text.spans()) {
        if (!first) out += ", ";
        first = false;
        out += to_string(span.attribution) + " " + std::to_string(span.start) +
               ".." + std::to_string(span.end);
    }
    out += "])";
    return out;
}

}  // namespace richdoc_cpp
