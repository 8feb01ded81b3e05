// patch_apply.cpp - Apply engine

#include <vdom/patch_apply.h>
#include <vdom/dom_index.h>
#include <vdom/live_node.h>
#include <vdom/log.h>

#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vdom {

namespace {

LiveNodePtr materialize(const Tree& tree, const PatchConfig& config)
{
    return config.render(tree, config);
}

void destroy_widget(LiveNode& node, const Tree& tree)
{
    if (const Widget* widget = tree.as_widget()) {
        widget->destroy(node);
    }
}

/// Put `next` where `node` is, when both exist and differ
void splice(const LiveNodePtr& node, const LiveNodePtr& next)
{
    if (!node || !next || node == next) {
        return;
    }
    if (LiveNode* parent = node->parent()) {
        parent->replace_child(next, *node);
    }
}

// ============================================================
// Operations
// ============================================================

LiveNodePtr remove_node(const LiveNodePtr& node, const Tree& tree)
{
    if (LiveNode* parent = node->parent()) {
        parent->remove_child(*node);
    }
    destroy_widget(*node, tree);
    return nullptr;
}

LiveNodePtr insert_node(const LiveNodePtr& parent, const Tree& next, const PatchConfig& config)
{
    if (LiveNodePtr child = materialize(next, config)) {
        parent->append_child(std::move(child));
    }
    return parent;
}

/// Edits in place only when the prior value was a text leaf; a widget that
/// materialized a text node still gets its own Remove afterwards
LiveNodePtr replace_text(const LiveNodePtr& node, const Tree& prior, const Tree& next,
                         const PatchConfig& config)
{
    const Text* text = next.as_text();
    if (prior.is_text() && node->is_text() && text) {
        node->set_text(text->text);
        return node;
    }
    LiveNodePtr replacement = materialize(next, config);
    splice(node, replacement);
    return replacement;
}

LiveNodePtr replace_node(const LiveNodePtr& node, const Tree& next, const PatchConfig& config)
{
    LiveNodePtr replacement = materialize(next, config);
    splice(node, replacement);
    return replacement;
}

LiveNodePtr update_widget(const LiveNodePtr& node, const std::optional<Tree>& prior, const Tree& next,
                          const PatchConfig& config)
{
    const Widget* prior_widget = prior ? prior->as_widget() : nullptr;
    const Widget* next_widget = next.as_widget();
    const bool updating = prior_widget && next_widget && should_update(*prior_widget, *next_widget);

    LiveNodePtr result;
    if (updating) {
        result = next_widget->update(*prior_widget, node);
        if (!result) {
            result = node;
        }
    } else {
        result = materialize(next, config);
    }

    splice(node, result);

    if (!updating && prior) {
        destroy_widget(*node, *prior);
    }
    return result;
}

LiveNodePtr update_props(const LiveNodePtr& node, const Tree& prior, const Props& delta, const PatchConfig& config)
{
    const Element* el = prior.as_element();
    const Props* previous = el ? &el->properties : nullptr;
    if (config.apply_props) {
        config.apply_props(*node, delta, previous);
    } else {
        apply_properties(*node, delta, previous);
    }
    return node;
}

LiveNodePtr reorder_children(const LiveNodePtr& node, const Tree& prior, const Moves& moves,
                             const PatchConfig& config)
{
    std::unordered_map<std::string, LiveNodePtr> keyed;

    for (const auto& r : moves.removes) {
        LiveNodePtr child = node->child_at(r.from);
        if (!child) {
            warn(config, "reorder: no child at index " + std::to_string(r.from), prior);
            continue;
        }
        LiveNodePtr detached = node->remove_child(*child);
        if (r.key) {
            keyed.insert_or_assign(*r.key, std::move(detached));
        }
    }

    for (const auto& ins : moves.inserts) {
        auto it = keyed.find(ins.key);
        if (it == keyed.end()) {
            warn(config, "reorder: no removed child with key '" + ins.key + "'", prior);
            continue;
        }
        const LiveNodePtr reference = ins.to >= node->child_count() ? nullptr : node->child_at(ins.to);
        node->insert_before(it->second, reference.get());
    }

    return node;
}

LiveNodePtr enter_thunk(const LiveNodePtr& node, const PatchSet& nested, const PatchConfig& config)
{
    LiveNodePtr result = config.patch(node, nested, config);
    splice(node, result);
    return result;
}

} // anonymous namespace

// ============================================================
// Public API
// ============================================================

LiveNodePtr apply_patch(const Patch& p, const LiveNodePtr& node, const PatchConfig& config)
{
    return std::visit([&](const auto& op) -> LiveNodePtr {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, op::Remove>) {
            return remove_node(node, op.node);
        } else if constexpr (std::is_same_v<T, op::Insert>) {
            return insert_node(node, op.next, config);
        } else if constexpr (std::is_same_v<T, op::ReplaceText>) {
            return replace_text(node, op.node, op.next, config);
        } else if constexpr (std::is_same_v<T, op::ReplaceNode>) {
            return replace_node(node, op.next, config);
        } else if constexpr (std::is_same_v<T, op::UpdateWidget>) {
            return update_widget(node, op.node, op.next, config);
        } else if constexpr (std::is_same_v<T, op::UpdateProps>) {
            return update_props(node, op.node, op.delta, config);
        } else if constexpr (std::is_same_v<T, op::Reorder>) {
            return reorder_children(node, op.node, op.moves, config);
        } else {
            if (!op.patches) {
                return node;
            }
            return enter_thunk(node, *op.patches, config);
        }
    }, p);
}

LiveNodePtr apply(LiveNodePtr root, const PatchSet& patches, const PatchConfig& config)
{
    const std::vector<std::size_t> positions = patches.positions();
    if (positions.empty()) {
        return root;
    }

    const NodeMap nodes = locate(root, patches.node0, positions);

    for (std::size_t position : positions) {
        auto it = nodes.find(position);
        if (it == nodes.end()) {
            throw PatchError("vdom::apply: no live node at position " + std::to_string(position), position);
        }

        const LiveNodePtr node = it->second;
        for (const auto& p : *patches.at(position)) {
            LiveNodePtr result = apply_patch(p, node, config);
            if (node == root) {
                root = std::move(result);
            }
        }
    }

    return root;
}

PatchConfig make_config(PatchOptions options)
{
    if (!options.document && !options.render) {
        throw std::invalid_argument("vdom::make_config: a document or a materializer is required");
    }

    PatchConfig config;
    config.document = options.document;

    config.apply_props = options.apply_props
        ? std::move(options.apply_props)
        : PropertyApplier{&vdom::apply_properties};

    config.warn = options.warn
        ? std::move(options.warn)
        : WarnFn{[](std::string_view message, const Tree& tree) { warn(RenderOptions{}, message, tree); }};

    config.render = options.render
        ? std::move(options.render)
        : Materializer{[](const Tree& tree, const RenderOptions& opts) { return vdom::render(tree, opts); }};

    config.patch = options.patch
        ? std::move(options.patch)
        : Patcher{&vdom::apply};

    return config;
}

LiveNodePtr patch(LiveNodePtr root, const PatchSet& patches, PatchOptions options)
{
    const PatchConfig config = make_config(std::move(options));
    return config.patch(std::move(root), patches, config);
}

} // namespace vdom
