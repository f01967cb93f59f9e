#include <richdoc-cpp/document_node.hpp>

#include "raise.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace richdoc_cpp {

auto DocumentNode::is_text_node() const -> bool {
    return text() != nullptr;
}

auto DocumentNode::text() const -> const AttributedText* {
    return std::visit([](const auto& c) -> const AttributedText* {
        if constexpr (requires { c.text; }) {
            return &c.text;
        } else {
            return nullptr;
        }
    }, content);
}

auto DocumentNode::with_id(std::string new_id) const -> DocumentNode {
    auto copy = *this;
    copy.id = std::move(new_id);
    return copy;
}

auto DocumentNode::with_metadata(Metadata new_metadata) const -> DocumentNode {
    auto copy = *this;
    copy.metadata = std::move(new_metadata);
    return copy;
}

auto DocumentNode::with_content(NodeContent new_content) const -> DocumentNode {
    auto copy = *this;
    copy.content = std::move(new_content);
    return copy;
}

auto DocumentNode::with_text(AttributedText new_text) const -> DocumentNode {
    if (!is_text_node()) {
        detail::raise(ErrorKind::precondition_violation,
            "with_text: node '" + id + "' of kind " +
            std::string{to_string_view(kind())} + " carries no text");
    }
    auto copy = *this;
    std::visit([&](auto& c) {
        if constexpr (requires { c.text; }) {
            c.text = std::move(new_text);
        }
    }, copy.content);
    return copy;
}

// -- Factories ----------------------------------------------------------------

auto make_text_block(std::string id, AttributedText text, Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = TextBlock{.text = std::move(text)},
    };
}

auto make_paragraph(std::string id, AttributedText text, ParagraphBlockType block_type,
                    Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = Paragraph{.text = std::move(text), .block_type = block_type},
    };
}

auto make_list_item(std::string id, AttributedText text, ListItemType type, int indent,
                    Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = ListItem{.text = std::move(text), .type = type, .indent = indent},
    };
}

auto make_code_block(std::string id, AttributedText text, std::optional<std::string> language,
                     Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = CodeBlock{.text = std::move(text), .language = std::move(language)},
    };
}

auto make_image(std::string id, std::string image_url, std::optional<std::string> alt_text,
                std::optional<double> width, std::optional<double> height,
                Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = Image{
            .image_url = std::move(image_url),
            .alt_text = std::move(alt_text),
            .width = width,
            .height = height,
        },
    };
}

auto make_horizontal_rule(std::string id, Metadata metadata) -> DocumentNode {
    return DocumentNode{
        .id = std::move(id),
        .metadata = std::move(metadata),
        .content = HorizontalRule{},
    };
}

// -- Description --------------------------------------------------------------

static auto optional_to_string(const std::optional<std::string>& s) -> std::string {
    return s ? *s : "null";
}

static auto optional_to_string(const std::optional<double>& d) -> std::string {
    if (!d) return "null";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", *d);
    return buf;
}

static auto content_name(NodeKind kind) -> std::string {
    switch (kind) {
        case NodeKind::text_block:      return "TextBlock";
        case NodeKind::paragraph:       return "Paragraph";
        case NodeKind::list_item:       return "ListItem";
        case NodeKind::code_block:      return "CodeBlock";
        case NodeKind::image:           return "Image";
        case NodeKind::horizontal_rule: return "HorizontalRule";
    }
    return "Node";
}

auto to_string(const DocumentNode& node) -> std::string {
    auto fields = std::visit(overload{
        [](const TextBlock& c) {
            return ", text: " + to_string(c.text);
        },
        [](const Paragraph& c) {
            return ", block_type: " + std::string{to_string_view(c.block_type)} +
                   ", text: " + to_string(c.text);
        },
        [](const ListItem& c) {
            return ", type: " + std::string{to_string_view(c.type)} +
                   ", indent: " + std::to_string(c.indent) + ", text: " + to_string(c.text);
        },
        [](const CodeBlock& c) {
            return ", language: " + optional_to_string(c.language) + ", text: " + to_string(c.text);
        },
        [](const Image& c) {
            return ", image_url: " + c.image_url +
                   ", alt_text: " + optional_to_string(c.alt_text) +
                   ", width: " + optional_to_string(c.width) +
                   ", height: " + optional_to_string(c.height);
        },
        [](const HorizontalRule&) { return std::string{}; },
    }, node.content);

    return content_name(node.kind()) + "(id: " + node.id + fields +
           ", metadata: " + to_string(node.metadata) + ")";
}

}  // namespace richdoc_cpp

auto std::hash<richdoc_cpp::DocumentNode>::operator()(
    const richdoc_cpp::DocumentNode& node) const noexcept -> std::size_t {
    using richdoc_cpp::detail::hash_combine;

    auto h = std::hash<std::string>{}(node.id);
    hash_combine(h, std::hash<richdoc_cpp::Metadata>{}(node.metadata));
    hash_combine(h, node.content.index());
    std::visit(richdoc_cpp::overload{
        [&](const richdoc_cpp::TextBlock& c) {
            hash_combine(h, std::hash<richdoc_cpp::AttributedText>{}(c.text));
        },
        [&](const richdoc_cpp::Paragraph& c) {
            hash_combine(h, std::hash<richdoc_cpp::AttributedText>{}(c.text));
            hash_combine(h, static_cast<std::size_t>(c.block_type));
        },
        [&](const richdoc_cpp::ListItem& c) {
            hash_combine(h, std::hash<richdoc_cpp::AttributedText>{}(c.text));
            hash_combine(h, static_cast<std::size_t>(c.type));
            hash_combine(h, std::hash<int>{}(c.indent));
        },
        [&](const richdoc_cpp::CodeBlock& c) {
            hash_combine(h, std::hash<richdoc_cpp::AttributedText>{}(c.text));
            hash_combine(h, std::hash<std::optional<std::string>>{}(c.language));
        },
        [&](const richdoc_cpp::Image& c) {
            hash_combine(h, std::hash<std::string>{}(c.image_url));
            hash_combine(h, std::hash<std::optional<std::string>>{}(c.alt_text));
            hash_combine(h, std::hash<std::optional<double>>{}(c.width));
            hash_combine(h, std::hash<std::optional<double>>{}(c.height));
        },
        [&](const richdoc_cpp::HorizontalRule&) {},
    }, node.content);
    return h;
}
