// diff.cpp - Tree diff: walk, children reconciliation and teardown sweep

#include <vdom/diff.h>

#include <immer/algorithm.hpp>
#include <immer/map_transient.hpp>

#include <algorithm>

namespace vdom {

namespace {

bool is_nested_dict(const std::string& name)
{
    return name == ATTRIBUTES || name == STYLE;
}

/// One-level diff of two dictionaries, nullopt when equal
std::optional<PropDict> diff_dict(const PropDict& prior, const PropDict& next)
{
    auto delta = PropDict{}.transient();

    immer::diff(prior, next, immer::make_differ(
        // added
        [&](const auto& added) { delta.set(added.first, added.second); },
        // removed
        [&](const auto& removed) { delta.set(removed.first, std::nullopt); },
        // retained key
        [&](const auto& old_kv, const auto& new_kv) {
            if (old_kv.second != new_kv.second) {
                delta.set(new_kv.first, new_kv.second);
            }
        }));

    if (delta.empty()) {
        return std::nullopt;
    }
    return delta.persistent();
}

// ============================================================
// Differ - builds one PatchSet
//
// Position arithmetic: the k-th child of the node at `index` sits at
// index + 1 + sum(1 + descendant_count) over the children before it.
// The teardown sweep reuses the same arithmetic so that patches for
// discarded hooks and widgets land on the positions locate() will resolve.
// ============================================================

class Differ {
public:
    explicit Differ(PatchSet& set) : set_(set) {}

    void walk(const Tree& a, const Tree* b, std::size_t index);

private:
    PatchList& at(std::size_t index) { return set_.patches[index]; }

    void diff_children(const Tree& a_tree, const Element& a, const Element& b, std::size_t index);
    void thunks(const Tree& a, const Tree* b, std::size_t index);

    void clear_state(const Tree& node, std::size_t index);
    void unhook(const Tree& node, std::size_t index);
    void destroy_widgets(const Tree& node, std::size_t index);

    PatchSet& set_;
};

void Differ::walk(const Tree& a, const Tree* b, std::size_t index)
{
    if (b && a.same(*b)) {
        return;
    }

    bool must_clear = false;

    if (a.is_thunk() || (b && b->is_thunk())) {
        thunks(a, b, index);
    } else if (!b) {
        // A widget gets exactly one remove: its own
        if (!a.is_widget()) {
            clear_state(a, index);
        }
        at(index).push_back(op::Remove{a});
    } else if (const Element* next = b->as_element()) {
        const Element* prior = a.as_element();
        if (prior && prior->tag == next->tag && prior->key == next->key) {
            if (auto delta = diff_props(prior->properties, next->properties)) {
                at(index).push_back(op::UpdateProps{a, std::move(*delta)});
            }
            diff_children(a, *prior, *next, index);
        } else {
            at(index).push_back(op::ReplaceNode{a, *b});
            must_clear = true;
        }
    } else if (const Text* next_text = b->as_text()) {
        if (const Text* prior_text = a.as_text()) {
            if (prior_text->text != next_text->text) {
                at(index).push_back(op::ReplaceText{a, *b});
            }
        } else {
            at(index).push_back(op::ReplaceText{a, *b});
            must_clear = true;
        }
    } else if (b->is_widget()) {
        if (a.is_widget()) {
            at(index).push_back(op::UpdateWidget{a, *b});
        } else {
            at(index).push_back(op::UpdateWidget{std::nullopt, *b});
            must_clear = true;
        }
    }

    if (must_clear) {
        clear_state(a, index);
    }

    // Do not leave empty lists behind for positions that produced nothing
    if (auto it = set_.patches.find(index); it != set_.patches.end() && it->second.empty()) {
        set_.patches.erase(it);
    }
}

void Differ::diff_children(const Tree& a_tree, const Element& a, const Element& b, std::size_t index)
{
    const Children& prior_children = a.children;
    ReorderResult ordered = reorder(prior_children, b.children);
    const auto& next_children = ordered.children;

    const std::size_t prior_len = prior_children.size();
    const std::size_t len = std::max(prior_len, next_children.size());
    const std::size_t parent = index;

    for (std::size_t i = 0; i < len; ++i) {
        index += 1;

        const Tree* left = i < prior_len ? &prior_children[i] : nullptr;
        const Tree* right = i < next_children.size() && next_children[i] ? &*next_children[i] : nullptr;

        if (!left) {
            if (right) {
                // Excess next items are appended to the parent
                at(parent).push_back(op::Insert{*right});
            }
        } else {
            walk(*left, right, index);
            index += left->descendant_count();
        }
    }

    if (ordered.moves) {
        at(parent).push_back(op::Reorder{a_tree, std::move(*ordered.moves)});
    }
}

void Differ::thunks(const Tree& a, const Tree* b, std::size_t index)
{
    Forced forced = handle_thunks(a, b);
    PatchSet nested = forced.b ? diff(forced.a, *forced.b) : PatchSet{forced.a};
    if (!forced.b) {
        // Thunk removal: sweep the forced tree and remove its root
        Differ inner(nested);
        inner.walk(forced.a, nullptr, 0);
    }
    if (!nested.empty()) {
        auto& list = at(index);
        list.clear();
        list.push_back(op::EnterThunk{a, std::make_shared<const PatchSet>(std::move(nested))});
    }
}

// ============================================================
// Teardown sweep
// ============================================================

void Differ::clear_state(const Tree& node, std::size_t index)
{
    unhook(node, index);
    destroy_widgets(node, index);
}

void Differ::unhook(const Tree& node, std::size_t index)
{
    if (const Element* el = node.as_element()) {
        if (el->has_hooks()) {
            auto delta = Props{}.transient();
            for (const auto& [name, _] : el->hooks) {
                delta.set(name, PropValue{});
            }
            at(index).push_back(op::UpdateProps{node, delta.persistent()});
        }

        if (el->has_descendant_hooks || el->has_thunks) {
            for (const auto& child : el->children) {
                index += 1;
                unhook(child, index);
                index += child.descendant_count();
            }
        }
    } else if (node.is_thunk()) {
        thunks(node, nullptr, index);
    }
}

void Differ::destroy_widgets(const Tree& node, std::size_t index)
{
    if (node.is_widget()) {
        at(index).push_back(op::Remove{node});
    } else if (const Element* el = node.as_element(); el && (el->has_widgets || el->has_thunks)) {
        for (const auto& child : el->children) {
            index += 1;
            destroy_widgets(child, index);
            index += child.descendant_count();
        }
    } else if (node.is_thunk()) {
        thunks(node, nullptr, index);
    }
}

} // anonymous namespace

// ============================================================
// Public API
// ============================================================

PatchSet diff(const Tree& prior, const Tree& next)
{
    PatchSet set{prior};
    Differ differ(set);
    differ.walk(prior, &next, 0);
    return set;
}

std::optional<Props> diff_props(const Props& prior, const Props& next)
{
    auto delta = Props{}.transient();

    immer::diff(prior, next, immer::make_differ(
        // added
        [&](const auto& added) { delta.set(added.first, added.second); },
        // removed
        [&](const auto& removed) { delta.set(removed.first, PropValue{}); },
        // retained key
        [&](const auto& old_kv, const auto& new_kv) {
            const PropValue& old_value = old_kv.second;
            const PropValue& new_value = new_kv.second;
            if (old_value == new_value) {
                return;
            }
            if (is_nested_dict(new_kv.first)) {
                auto* old_dict = old_value.get_if<PropDict>();
                auto* new_dict = new_value.get_if<PropDict>();
                if (old_dict && new_dict) {
                    if (auto nested = diff_dict(*old_dict, *new_dict)) {
                        delta.set(new_kv.first, PropValue{std::move(*nested)});
                    }
                    return;
                }
            }
            delta.set(new_kv.first, new_value);
        }));

    if (delta.empty()) {
        return std::nullopt;
    }
    return delta.persistent();
}

} // namespace vdom
