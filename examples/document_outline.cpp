// document_outline — build a document, observe edits, and track a selection
//
// Demonstrates: node factories, NodeIdGenerator, MutableDocument mutations,
//               change listeners, DocumentSelection affinity/normalize

#include <richdoc-cpp/richdoc.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdio>
#include <string>

namespace rd = richdoc_cpp;

static void print_outline(const rd::Document& doc) {
    for (const auto& node : doc.nodes()) {
        const auto kind = std::string{rd::to_string_view(node.kind())};
        if (const auto* text = node.text()) {
            std::printf("  %-8s %-16s \"%s\"\n", node.id.c_str(), kind.c_str(), text->text().c_str());
        } else {
            std::printf("  %-8s %s\n", node.id.c_str(), kind.c_str());
        }
    }
}

int main() {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::debug, &consoleAppender);

    auto ids = rd::NodeIdGenerator{rd::SequentialNodeIds{"n"}};

    auto doc = rd::MutableDocument{{
        rd::make_paragraph(ids, rd::AttributedText{"Shopping"}, rd::ParagraphBlockType::header1),
        rd::make_list_item(ids, rd::AttributedText{"apples"}),
        rd::make_list_item(ids, rd::AttributedText{"bread"}),
    }};

    // Print every batch as it is emitted
    (void)doc.subscribe([](const rd::ChangeBatch& batch) {
        for (const auto& event : batch) {
            std::printf("event: %s\n", rd::to_string(event).c_str());
        }
    });

    (void)doc.insert_node(3, rd::make_list_item(ids, rd::AttributedText{"cheese"}));
    (void)doc.move_node("n-3", 1);
    (void)doc.insert_node(doc.node_count(), rd::make_horizontal_rule(ids));

    // Every update reports NodeReplaced, even a text-only edit
    (void)doc.update_node("n-2", [](const rd::DocumentNode& node) {
        return node.with_text(node.text()->insert(0, rd::AttributedText{"fresh "}));
    });

    // Promote the heading
    (void)doc.update_node("n-0", [](const rd::DocumentNode& node) {
        return node.with_content(rd::Paragraph{
            .text = *node.text(),
            .block_type = rd::ParagraphBlockType::header2,
        });
    });

    std::printf("\nOutline (%zu nodes):\n", doc.node_count());
    print_outline(doc);

    // A selection dragged from the third item back up into the heading
    const auto selection = rd::DocumentSelection{
        .base = {.node_id = "n-2", .node_position = rd::TextNodePosition{.offset = 3}},
        .extent = {.node_id = "n-0", .node_position = rd::TextNodePosition{.offset = 2}},
    };
    std::printf("\nSelection affinity: %s\n",
                std::string{rd::to_string_view(selection.affinity(doc))}.c_str());
    std::printf("Normalized: %s\n", rd::to_string(selection.normalize(doc)).c_str());

    try {
        (void)doc.delete_node("n-99");
    } catch (const rd::Exception& e) {
        std::printf("\nRejected: %s\n", e.what());
    }
    return 0;
}
