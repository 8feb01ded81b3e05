// tree.cpp - Tree value construction and thunk forcing

#include <vdom/tree.h>

#include <immer/map_transient.hpp>

#include <stdexcept>

namespace vdom {

namespace {

const Key no_key{};

/// Fill in the counters an element caches at construction
void summarize(Element& el)
{
    el.child_count = el.children.size();

    auto hooks = Props{}.transient();
    for (const auto& [name, value] : el.properties) {
        if (auto* h = value.hook(); h && h->must_unhook()) {
            hooks.set(name, value);
        }
    }
    el.hooks = hooks.persistent();

    for (const auto& child : el.children) {
        child.visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Element>) {
                el.descendant_count += arg.descendant_count;
                el.has_widgets = el.has_widgets || arg.has_widgets;
                el.has_thunks = el.has_thunks || arg.has_thunks;
                el.has_descendant_hooks = el.has_descendant_hooks || arg.has_hooks() || arg.has_descendant_hooks;
            } else if constexpr (std::is_same_v<T, WidgetPtr>) {
                el.has_widgets = true;
            } else if constexpr (std::is_same_v<T, ThunkPtr>) {
                el.has_thunks = true;
            }
        });
    }

    el.descendant_count += el.child_count;
}

} // anonymous namespace

// ============================================================
// Tree
// ============================================================

Tree::Tree(TreeNode node) : node_(std::move(node)) {}

Tree Tree::element(std::string tag, Props properties, Children children, Key key)
{
    Element el;
    el.tag = std::move(tag);
    el.properties = std::move(properties);
    el.children = std::move(children);
    el.key = std::move(key);
    summarize(el);
    return Tree{TreeNode{std::move(el)}};
}

Tree Tree::text(std::string value, Key key)
{
    return Tree{TreeNode{Text{std::move(value), std::move(key)}}};
}

Tree Tree::widget(WidgetPtr widget)
{
    if (!widget) {
        throw std::invalid_argument("Tree::widget: null widget");
    }
    return Tree{TreeNode{std::move(widget)}};
}

Tree Tree::thunk(ThunkPtr thunk)
{
    if (!thunk) {
        throw std::invalid_argument("Tree::thunk: null thunk");
    }
    return Tree{TreeNode{std::move(thunk)}};
}

Tree::Kind Tree::kind() const noexcept
{
    switch (node_.get().data.index()) {
        case 0: return Kind::Element;
        case 1: return Kind::Text;
        case 2: return Kind::Widget;
        default: return Kind::Thunk;
    }
}

const Element* Tree::as_element() const noexcept
{
    return std::get_if<Element>(&node_.get().data);
}

const Text* Tree::as_text() const noexcept
{
    return std::get_if<Text>(&node_.get().data);
}

const Widget* Tree::as_widget() const noexcept
{
    auto* w = std::get_if<WidgetPtr>(&node_.get().data);
    return w ? w->get() : nullptr;
}

Thunk* Tree::as_thunk() const noexcept
{
    auto* t = std::get_if<ThunkPtr>(&node_.get().data);
    return t ? t->get() : nullptr;
}

const Key& Tree::key() const noexcept
{
    return visit([](const auto& arg) -> const Key& {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Element> || std::is_same_v<T, Text>) {
            return arg.key;
        } else if constexpr (std::is_same_v<T, WidgetPtr>) {
            return arg->key();
        } else {
            return no_key;
        }
    });
}

std::size_t Tree::descendant_count() const noexcept
{
    auto* el = as_element();
    return el ? el->descendant_count : 0;
}

// ============================================================
// Widget
// ============================================================

LiveNodePtr Widget::update(const Widget&, const LiveNodePtr&) const
{
    return nullptr;
}

void Widget::destroy(LiveNode&) const {}

bool should_update(const Widget& prior, const Widget& next) noexcept
{
    if (prior.key() && next.key()) {
        return *prior.key() == *next.key();
    }
    return prior.identity() == next.identity();
}

// ============================================================
// Thunk
// ============================================================

Thunk::Thunk(RenderFn render) : render_(std::move(render)) {}

const Tree& Thunk::render(const Tree* prior)
{
    if (!cache_) {
        Tree result = render_(prior);
        if (result.is_thunk()) {
            throw std::logic_error("Thunk::render: render function returned a thunk");
        }
        cache_.emplace(std::move(result));
    }
    return *cache_;
}

Tree make_thunk(Thunk::RenderFn render)
{
    return Tree::thunk(std::make_shared<Thunk>(std::move(render)));
}

Forced handle_thunks(const Tree& a, const Tree* b)
{
    Thunk* thunk_a = a.as_thunk();
    Thunk* thunk_b = b ? b->as_thunk() : nullptr;

    if (thunk_a && thunk_b) {
        Tree forced_b = thunk_b->render(&a);
        return Forced{thunk_a->render(nullptr), std::move(forced_b)};
    }
    if (thunk_b) {
        return Forced{a, thunk_b->render(&a)};
    }
    if (thunk_a) {
        return Forced{thunk_a->render(nullptr), b ? std::optional<Tree>{*b} : std::nullopt};
    }
    return Forced{a, b ? std::optional<Tree>{*b} : std::nullopt};
}

} // namespace vdom
