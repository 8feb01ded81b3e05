// render.cpp - Default materializer

#include <vdom/render.h>
#include <vdom/live_node.h>
#include <vdom/log.h>
#include <vdom/tree.h>

#include <stdexcept>
#include <string>

namespace vdom {

namespace {

Document& require_document(const RenderOptions& options)
{
    if (!options.document) {
        throw std::invalid_argument("vdom::render: no document to create nodes with");
    }
    return *options.document;
}

} // anonymous namespace

LiveNodePtr render(const Tree& tree, const RenderOptions& options)
{
    const Tree forced = handle_thunks(tree, nullptr).a;

    return forced.visit([&](const auto& node) -> LiveNodePtr {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, WidgetPtr>) {
            return node->materialize(options);
        } else if constexpr (std::is_same_v<T, Text>) {
            return require_document(options).create_text(node.text);
        } else if constexpr (std::is_same_v<T, Element>) {
            LiveNodePtr live = require_document(options).create_element(node.tag);
            if (!live) {
                warn(options, "document returned no node", forced);
                return nullptr;
            }

            if (options.apply_props) {
                options.apply_props(*live, node.properties, nullptr);
            } else {
                apply_properties(*live, node.properties, nullptr);
            }

            for (const auto& child : node.children) {
                if (LiveNodePtr child_node = render(child, options)) {
                    live->append_child(std::move(child_node));
                }
            }
            return live;
        } else {
            // handle_thunks never leaves a thunk behind
            throw std::logic_error("vdom::render: unforced thunk");
        }
    });
}

void warn(const RenderOptions& options, std::string_view message, const Tree& tree)
{
    if (options.warn) {
        options.warn(message, tree);
        return;
    }
    std::string text{message};
    if (const Element* el = tree.as_element()) {
        text += " <" + el->tag + ">";
    }
    detail::log_warning("vdom", text);
}

} // namespace vdom
