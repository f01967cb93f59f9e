// Fuzz target for AttributedText — runs a byte-driven edit script and traps
// as soon as the marker list stops being sorted and normalised, or an
// apply/remove changes coverage outside its range.

#include <richdoc-cpp/attributed_text.hpp>
#include <richdoc-cpp/error.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

using namespace richdoc_cpp;

namespace {

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_{data}, size_{size} {}

    auto done() const -> bool { return pos_ >= size_; }

    auto next() -> std::uint8_t { return done() ? 0 : data_[pos_++]; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_{0};
};

auto pick_attribution(std::uint8_t b) -> Attribution {
    switch (b % 4) {
        case 0: return attributions::bold();
        case 1: return attributions::italics();
        case 2: return attributions::link("https://a.example");
        default: return attributions::link("https://b.example");
    }
}

// Sorted, balanced, and no two spans of one attribution within gap 1.
void check_invariants(const AttributedText& text) {
    const auto markers = text.markers();
    if (markers.size() % 2 != 0) __builtin_trap();
    if (!std::is_sorted(markers.begin(), markers.end())) __builtin_trap();

    auto spans = text.spans();
    if (spans.size() * 2 != markers.size()) __builtin_trap();

    auto by_attribution = std::map<Attribution, std::vector<AttributionSpan>>{};
    for (auto& span : spans) {
        if (span.start > span.end) __builtin_trap();
        if (span.end > text.length()) __builtin_trap();
        by_attribution[span.attribution].push_back(span);
    }
    for (auto& [_, group] : by_attribution) {
        std::ranges::sort(group, {}, &AttributionSpan::start);
        for (std::size_t i = 1; i < group.size(); ++i) {
            if (group[i].start <= group[i - 1].end + 1) __builtin_trap();
        }
    }
}

// Offsets inside [start, end] carry the attribution exactly when `covered`
// says so; every other offset is as it was before the edit.
void check_coverage(const AttributedText& before, const AttributedText& after,
                    const Attribution& attribution, std::size_t start, std::size_t end,
                    bool covered) {
    for (std::size_t offset = 0; offset <= after.length(); ++offset) {
        const auto expected = (offset >= start && offset <= end)
            ? covered
            : before.has_attribution_at(offset, attribution);
        if (after.has_attribution_at(offset, attribution) != expected) __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto in = ByteReader{data, size};
    auto text = AttributedText{"the quick brown fox jumps over the lazy dog"};

    while (!in.done()) {
        const auto op = in.next() % 6;
        const auto a = static_cast<std::size_t>(in.next());
        const auto b = static_cast<std::size_t>(in.next());
        const auto attribution = pick_attribution(in.next());

        try {
            switch (op) {
                case 0: {
                    auto applied = text.apply_attribution(attribution, a, b);
                    check_coverage(text, applied, attribution, a, b, true);
                    text = std::move(applied);
                    break;
                }
                case 1: {
                    auto removed = text.remove_attribution(attribution, a, b);
                    check_coverage(text, removed, attribution, a, b, false);
                    text = std::move(removed);
                    break;
                }
                case 2: text = text.toggle_attribution(attribution, a, b); break;
                case 3: text = text.erase(a, b); break;
                case 4: {
                    auto piece = AttributedText{"xyz"}.apply_attribution(attribution, 0, b % 3);
                    text = text.insert(a, piece);
                    break;
                }
                default: {
                    // Erasing a range and reinserting its copy is lossless.
                    if (a > b || b > text.length()) break;
                    const auto restored = text.erase(a, b).insert(a, text.copy_text(a, b));
                    if (restored.code_points() != text.code_points()) __builtin_trap();
                    break;
                }
            }
        } catch (const Exception&) {
            // Out-of-range and inverted arguments are expected in random scripts.
        }

        check_invariants(text);
        if (text.length() > 4096) break;
    }
    return 0;
}
