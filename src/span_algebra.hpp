#pragma once

// Internal header — not installed. Marker <-> span conversion and the
// normalisation pass shared by every AttributedText operation.

#include <richdoc-cpp/attributed_text.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <numeric>
#include <utility>
#include <vector>

namespace richdoc_cpp::detail {

// Disjoint-set forest over indices [0, n).
class UnionFind {
public:
    explicit UnionFind(std::size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    auto find(std::size_t x) -> std::size_t {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];  // path halving
            x = parent_[x];
        }
        return x;
    }

    // The smaller root wins so class representatives are the first member.
    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<std::size_t> parent_;
};

// Resolve a sorted marker list into spans. Each attribution keeps its own
// stack of open start offsets: a start pushes, an end pops the most recent
// start. Unmatched ends are ignored and unclosed starts are dropped.
inline auto resolve_spans(const std::vector<SpanMarker>& sorted) -> std::vector<AttributionSpan> {
    auto spans = std::vector<AttributionSpan>{};
    auto open = std::map<Attribution, std::vector<std::size_t>>{};

    for (const auto& marker : sorted) {
        if (marker.type == SpanMarkerType::start) {
            open[marker.attribution].push_back(marker.offset);
            continue;
        }
        auto it = open.find(marker.attribution);
        if (it == open.end() || it->second.empty()) continue;
        const auto start = it->second.back();
        it->second.pop_back();
        spans.push_back(AttributionSpan{
            .attribution = marker.attribution,
            .start = start,
            .end = marker.offset,
        });
    }

    return spans;
}

inline auto markers_from_spans(const std::vector<AttributionSpan>& spans) -> std::vector<SpanMarker> {
    auto markers = std::vector<SpanMarker>{};
    markers.reserve(spans.size() * 2);
    for (const auto& span : spans) {
        markers.push_back(SpanMarker{
            .attribution = span.attribution,
            .offset = span.start,
            .type = SpanMarkerType::start,
        });
        markers.push_back(SpanMarker{
            .attribution = span.attribution,
            .offset = span.end,
            .type = SpanMarkerType::end,
        });
    }
    return markers;
}

// Collapse overlapping and adjacent (gap <= 1) spans of the same merge
// class. Classes are the connected components of mutual can_merge_with()
// over the distinct attributions present; a folded span keeps the
// attribution of its earliest member.
inline auto merge_spans(std::vector<AttributionSpan> spans) -> std::vector<AttributionSpan> {
    if (spans.empty()) return {};

    auto distinct = std::vector<Attribution>{};
    auto index_of = std::map<Attribution, std::size_t>{};
    for (const auto& span : spans) {
        if (index_of.try_emplace(span.attribution, distinct.size()).second) {
            distinct.push_back(span.attribution);
        }
    }

    auto classes = UnionFind{distinct.size()};
    for (std::size_t i = 0; i < distinct.size(); ++i) {
        for (std::size_t j = i + 1; j < distinct.size(); ++j) {
            if (distinct[i].can_merge_with(distinct[j]) &&
                distinct[j].can_merge_with(distinct[i])) {
                classes.unite(i, j);
            }
        }
    }

    auto groups = std::map<std::size_t, std::vector<AttributionSpan>>{};
    for (auto& span : spans) {
        const auto root = classes.find(index_of.at(span.attribution));
        groups[root].push_back(std::move(span));
    }

    auto result = std::vector<AttributionSpan>{};
    for (auto& [root, members] : groups) {
        std::ranges::stable_sort(members, {}, &AttributionSpan::start);

        auto current = members.front();
        for (std::size_t i = 1; i < members.size(); ++i) {
            const auto& next = members[i];
            if (next.start <= current.end + 1) {
                current.end = std::max(current.end, next.end);
            } else {
                result.push_back(std::move(current));
                current = next;
            }
        }
        result.push_back(std::move(current));
    }

    return result;
}

// Sort, resolve, merge, and re-emit a canonical sorted marker list.
inline auto normalize_markers(std::vector<SpanMarker> markers) -> std::vector<SpanMarker> {
    if (markers.empty()) return {};

    std::ranges::stable_sort(markers, [](const SpanMarker& a, const SpanMarker& b) {
        return a < b;
    });
    auto merged = merge_spans(resolve_spans(markers));
    auto result = markers_from_spans(merged);
    std::ranges::sort(result, [](const SpanMarker& a, const SpanMarker& b) {
        return a < b;
    });
    return result;
}

}  // namespace richdoc_cpp::detail
