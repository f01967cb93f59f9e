// Fuzz target for MutableDocument — random insert/delete/move/replace/update
// scripts. Traps when ids stop being unique, when node_index() disagrees with
// node order, or when a listener sees a batch other than the one returned.

#include <richdoc-cpp/error.hpp>
#include <richdoc-cpp/mutable_document.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

using namespace richdoc_cpp;

namespace {

void check_invariants(const MutableDocument& doc) {
    auto seen = std::set<std::string_view>{};
    const auto nodes = doc.nodes();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (!seen.insert(nodes[i].id).second) __builtin_trap();
        if (doc.node_index(nodes[i].id) != i) __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto doc = MutableDocument{};
    auto ids = SequentialNodeIds{"f"};
    auto delivered = ChangeBatch{};
    (void)doc.subscribe([&](const ChangeBatch& batch) { delivered = batch; });

    for (size_t i = 0; i + 1 < size; i += 2) {
        const auto op = data[i] % 5;
        const auto arg = static_cast<std::size_t>(data[i + 1]);
        const auto target = "f-" + std::to_string(arg % (ids.peek() + 1));

        try {
            auto batch = ChangeBatch{};
            switch (op) {
                case 0: batch = doc.insert_node(arg % (doc.node_count() + 2), make_paragraph(ids())); break;
                case 1: batch = doc.delete_node(target); break;
                case 2: batch = doc.move_node(target, arg % (doc.node_count() + 1)); break;
                case 3: batch = doc.replace_node(target, make_horizontal_rule(target)); break;
                default:
                    batch = doc.update_node(target, [](const DocumentNode& node) {
                        if (!node.is_text_node()) return node;
                        return node.with_text(node.text()->insert(0, AttributedText{"+"}));
                    });
                    break;
            }
            if (batch != delivered || batch != doc.last_changes()) __builtin_trap();
        } catch (const Exception&) {
            // Unknown ids and bad indices are expected in random scripts.
        }

        check_invariants(doc);
    }
    return 0;
}
