// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree.h
/// @brief Immutable tree values: elements, text leaves, widgets and thunks.
///
/// A Tree is a cheap handle (an immer::box) to an immutable node. Copying a
/// Tree shares the node, and Tree::same() compares node identity, which is
/// what lets diff() skip unchanged subtrees in O(1).
///
/// The node is a closed sum over four variants:
/// - Element: tag, properties, children, optional key, plus derived counters
///   cached at construction (descendant_count drives position arithmetic)
/// - Text: an immutable string
/// - Widget: an opaque, externally managed unit (a "hole" diff never enters)
/// - Thunk: a deferred tree, rendered at most once and memoized

#pragma once

#include <vdom/vdom_config.h>
#include <vdom/api.h>
#include <vdom/props.h>
#include <vdom/tree_fwd.h>

#include <immer/box.hpp>
#include <immer/vector.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <variant>

namespace vdom {

using Children = immer::vector<Tree>;

// ============================================================
// Tree - handle to an immutable node
// ============================================================

class VDOM_API Tree {
public:
    enum class Kind { Element, Text, Widget, Thunk };

    static Tree element(std::string tag, Props properties = {}, Children children = {}, Key key = std::nullopt);
    static Tree text(std::string value, Key key = std::nullopt);
    static Tree widget(WidgetPtr widget);
    static Tree thunk(ThunkPtr thunk);

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] bool is_element() const noexcept { return kind() == Kind::Element; }
    [[nodiscard]] bool is_text() const noexcept { return kind() == Kind::Text; }
    [[nodiscard]] bool is_widget() const noexcept { return kind() == Kind::Widget; }
    [[nodiscard]] bool is_thunk() const noexcept { return kind() == Kind::Thunk; }

    [[nodiscard]] const Element* as_element() const noexcept;
    [[nodiscard]] const Text* as_text() const noexcept;
    [[nodiscard]] const Widget* as_widget() const noexcept;
    [[nodiscard]] Thunk* as_thunk() const noexcept;

    /// Reconciliation key of an element, text or widget; thunks are unkeyed
    [[nodiscard]] const Key& key() const noexcept;

    /// Width of this node's position range minus one (0 for leaves)
    [[nodiscard]] std::size_t descendant_count() const noexcept;

    /// Reference identity (same underlying node)
    [[nodiscard]] bool same(const Tree& other) const noexcept { return &node_.get() == &other.node_.get(); }

    [[nodiscard]] const TreeNode& node() const noexcept { return node_.get(); }

    /// Dispatch over the four variants
    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const;

private:
    explicit Tree(TreeNode node);

    immer::box<TreeNode> node_;
};

// ============================================================
// Element / Text
// ============================================================

struct Element {
    std::string tag;
    Props properties;
    Children children;
    Key key;

    // Derived at construction
    std::size_t child_count = 0;
    std::size_t descendant_count = 0;
    bool has_widgets = false;           ///< any widget at or below the children
    bool has_thunks = false;            ///< any thunk at or below the children
    bool has_descendant_hooks = false;  ///< any descendant element carries unhook hooks
    Props hooks;                        ///< own properties that are Teardown::Unhook hooks

    [[nodiscard]] bool has_hooks() const noexcept { return !hooks.empty(); }
};

struct Text {
    std::string text;
    Key key;
};

struct TreeNode {
    std::variant<Element, Text, WidgetPtr, ThunkPtr> data;
};

template <typename Visitor>
decltype(auto) Tree::visit(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), node_.get().data);
}

// ============================================================
// Widget
//
// Widgets form "holes" in the tree: diff() never looks inside them, it only
// decides whether the next widget updates the prior one in place or replaces
// it. One widget updates a prior one when both carry the same key, or, when
// keys are missing, when both are the same widget type.
// ============================================================

class VDOM_API Widget {
public:
    explicit Widget(Key key = std::nullopt) : key_(std::move(key)) {}
    virtual ~Widget() = default;

    Widget(const Widget&) = delete;
    Widget& operator=(const Widget&) = delete;

    [[nodiscard]] const Key& key() const noexcept { return key_; }

    /// Identity of the materialize capability (the dynamic widget type)
    [[nodiscard]] std::type_index identity() const noexcept { return typeid(*this); }

    /// Build the live node for this widget
    virtual LiveNodePtr materialize(const RenderOptions& options) const = 0;

    /// Update the live node built by `prior`; returning nullptr keeps `node`
    virtual LiveNodePtr update(const Widget& prior, const LiveNodePtr& node) const;

    /// Release whatever materialize() acquired
    virtual void destroy(LiveNode& node) const;

private:
    Key key_;
};

[[nodiscard]] VDOM_API bool should_update(const Widget& prior, const Widget& next) noexcept;

// ============================================================
// Thunk
//
// A deferred tree. render() is evaluated at most once per instance, the
// result is cached and returned by every later call. The render function
// sees the tree it is replacing (nullptr when there is none) and must return
// a forced tree (never another thunk).
// ============================================================

class VDOM_API Thunk {
public:
    using RenderFn = std::function<Tree(const Tree* prior)>;

    explicit Thunk(RenderFn render);
    virtual ~Thunk() = default;

    Thunk(const Thunk&) = delete;
    Thunk& operator=(const Thunk&) = delete;

    /// @throws std::logic_error if the render function returns a thunk
    const Tree& render(const Tree* prior);

protected:
    [[nodiscard]] const Tree* cached() const noexcept { return cache_ ? &*cache_ : nullptr; }

private:
    RenderFn render_;
    std::optional<Tree> cache_;
};

/// Thunk driven by a state value: rendered against a prior StateThunk whose
/// state compares equal, it reuses the prior's cached tree.
template <typename S>
class StateThunk : public Thunk {
public:
    using ViewFn  = std::function<Tree(const S& state)>;
    using EqualFn = std::function<bool(const S& previous, const S& current)>;

    StateThunk(ViewFn view, EqualFn equal, S state)
        : Thunk([this](const Tree* prior) { return render_against(prior); })
        , view_(std::move(view))
        , equal_(std::move(equal))
        , state_(std::move(state)) {}

    [[nodiscard]] const S& state() const noexcept { return state_; }

private:
    Tree render_against(const Tree* prior) const {
        if (prior) {
            if (auto* previous = dynamic_cast<const StateThunk*>(prior->as_thunk())) {
                if (previous->cached() && equal_(previous->state_, state_)) {
                    return *previous->cached();
                }
            }
        }
        return view_(state_);
    }

    ViewFn view_;
    EqualFn equal_;
    S state_;
};

[[nodiscard]] VDOM_API Tree make_thunk(Thunk::RenderFn render);

template <typename S>
[[nodiscard]] Tree make_state_thunk(typename StateThunk<S>::ViewFn view, S state,
                                    typename StateThunk<S>::EqualFn equal = std::equal_to<S>{}) {
    return Tree::thunk(std::make_shared<StateThunk<S>>(std::move(view), std::move(equal), std::move(state)));
}

/// Result of forcing a (prior, next) pair
struct Forced {
    Tree a;
    std::optional<Tree> b;
};

/// Force `a` and `b` (b may be absent) as cheaply as possible:
/// both thunks render b against a first, then a against nothing.
[[nodiscard]] VDOM_API Forced handle_thunks(const Tree& a, const Tree* b);

} // namespace vdom
