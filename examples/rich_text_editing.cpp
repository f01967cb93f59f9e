// rich_text_editing — styling, typing, and deleting inside one paragraph
//
// Demonstrates: AttributedText, apply/toggle/remove attribution, insert,
//               erase, copy_text, span queries

#include <richdoc-cpp/richdoc.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>
#include <string>

namespace rd = richdoc_cpp;

static void print_spans(const char* label, const rd::AttributedText& text) {
    std::printf("%s: \"%s\"\n", label, text.text().c_str());
    for (const auto& span : text.spans()) {
        std::printf("  %-28s [%zu..%zu]\n", rd::to_string(span.attribution).c_str(),
                    span.start, span.end);
    }
}

int main() {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::warning, &consoleAppender);

    auto text = rd::AttributedText{"hello world"};

    // Overlapping bold ranges fold into one span
    text = text.apply_attribution(rd::attributions::bold(), 0, 4)
               .apply_attribution(rd::attributions::bold(), 3, 8);
    print_spans("Bold applied twice", text);

    // Links to different targets never merge
    text = text.apply_attribution(rd::attributions::link("https://example.com"), 6, 10);
    print_spans("With link", text);

    // Typing inside a span extends it
    text = text.insert(5, rd::AttributedText{","});
    print_spans("After typing a comma", text);

    // Toggle: italics is absent, so it is applied; toggling again removes it
    text = text.toggle_attribution(rd::attributions::italics(), 0, 4);
    std::printf("Italic at 2 after first toggle: %s\n",
                text.has_attribution_at(2, rd::attributions::italics()) ? "yes" : "no");
    text = text.toggle_attribution(rd::attributions::italics(), 0, 4);
    std::printf("Italic at 2 after second toggle: %s\n",
                text.has_attribution_at(2, rd::attributions::italics()) ? "yes" : "no");

    // Cut and paste keeps the styling of the moved text
    const auto clip = text.copy_text(7, 12);
    text = text.erase(7, 12);
    print_spans("After cut", text);
    text = text.insert(0, clip.insert(clip.length(), rd::AttributedText{" "}));
    print_spans("After paste at start", text);

    // Bad arguments throw; the value is untouched
    try {
        text = text.erase(3, 100);
    } catch (const rd::Exception& e) {
        std::printf("Rejected: %s (%s)\n", e.what(),
                    std::string{rd::to_string_view(e.kind())}.c_str());
    }

    std::printf("\n%s\n", rd::to_string(text).c_str());
    return 0;
}
