// test_tree.cpp - Tests for tree values, widgets and thunks

#include <catch2/catch_all.hpp>
#include <vdom/builders.h>
#include <vdom/tree.h>

#include <string>

using namespace vdom;

namespace {

class PlainWidget : public Widget {
public:
    using Widget::Widget;

    LiveNodePtr materialize(const RenderOptions&) const override { return nullptr; }
};

class OtherWidget final : public PlainWidget {
public:
    using PlainWidget::PlainWidget;
};

} // anonymous namespace

// ============================================================
// Element counters
// ============================================================

TEST_CASE("Element caches descendant counts", "[tree][element]") {
    Tree tree = h("div", {}, {
        h("span", {}, {text("a")}),
        text("b"),
        h("ul", {}, {h("li", {}, {text("c")}), h("li")})
    });

    const Element* el = tree.as_element();
    REQUIRE(el != nullptr);
    REQUIRE(el->child_count == 3);
    // span, "a", "b", ul, li, "c", li
    REQUIRE(tree.descendant_count() == 7);
    REQUIRE(el->children[0].descendant_count() == 1);
    REQUIRE(text("leaf").descendant_count() == 0);
}

TEST_CASE("Element flags summarize the subtree", "[tree][element]") {
    auto unhooking = make_hook([](LiveNode&, const std::string&, const PropValue&) {},
                               [](LiveNode&, const std::string&, const PropValue&) {});
    auto plain_hook = make_hook([](LiveNode&, const std::string&, const PropValue&) {});

    SECTION("Plain tree") {
        Tree tree = h("div", {}, {h("p", {}, {text("x")})});
        const Element* el = tree.as_element();
        REQUIRE_FALSE(el->has_widgets);
        REQUIRE_FALSE(el->has_thunks);
        REQUIRE_FALSE(el->has_descendant_hooks);
        REQUIRE_FALSE(el->has_hooks());
    }

    SECTION("Nested widget") {
        Tree tree = h("div", {}, {h("p", {}, {Tree::widget(std::make_shared<PlainWidget>())})});
        REQUIRE(tree.as_element()->has_widgets);
    }

    SECTION("Nested thunk") {
        Tree tree = h("div", {}, {h("p", {}, {make_thunk([](const Tree*) { return text("x"); })})});
        REQUIRE(tree.as_element()->has_thunks);
    }

    SECTION("Only unhooking hooks are recorded") {
        Tree tree = h("input", props({{"focus", unhooking}, {"track", plain_hook}, {"value", "x"}}));
        const Element* el = tree.as_element();
        REQUIRE(el->has_hooks());
        REQUIRE(el->hooks.size() == 1);
        REQUIRE(el->hooks.find("focus") != nullptr);
    }

    SECTION("Descendant hooks") {
        Tree tree = h("form", {}, {h("div", {}, {h("input", props({{"focus", unhooking}}))})});
        REQUIRE(tree.as_element()->has_descendant_hooks);
        REQUIRE_FALSE(tree.as_element()->has_hooks());
    }
}

TEST_CASE("Tree kinds and keys", "[tree]") {
    REQUIRE(h("div", {}, {}, "k").key() == Key{"k"});
    REQUIRE(text("t", "tk").key() == Key{"tk"});
    REQUIRE_FALSE(h("div").key().has_value());
    REQUIRE(Tree::widget(std::make_shared<PlainWidget>(Key{"w"})).key() == Key{"w"});
    REQUIRE_FALSE(make_thunk([](const Tree*) { return text("x"); }).key().has_value());

    REQUIRE(h("div").kind() == Tree::Kind::Element);
    REQUIRE(text("x").kind() == Tree::Kind::Text);
    REQUIRE(make_thunk([](const Tree*) { return text("x"); }).is_thunk());

    REQUIRE_THROWS_AS(Tree::widget(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(Tree::thunk(nullptr), std::invalid_argument);
}

TEST_CASE("Copies share the node", "[tree]") {
    Tree a = h("div", {}, {text("x")});
    Tree copy = a;
    Tree rebuilt = h("div", {}, {text("x")});

    REQUIRE(a.same(copy));
    REQUIRE_FALSE(a.same(rebuilt));
}

// ============================================================
// Widget
// ============================================================

TEST_CASE("Widget update decision", "[tree][widget]") {
    SECTION("Same type without keys") {
        REQUIRE(should_update(PlainWidget{}, PlainWidget{}));
    }

    SECTION("Different types without keys") {
        REQUIRE_FALSE(should_update(PlainWidget{}, OtherWidget{}));
    }

    SECTION("Keys decide when both are present") {
        REQUIRE(should_update(PlainWidget{Key{"a"}}, OtherWidget{Key{"a"}}));
        REQUIRE_FALSE(should_update(PlainWidget{Key{"a"}}, PlainWidget{Key{"b"}}));
    }

    SECTION("One key missing falls back to type") {
        REQUIRE(should_update(PlainWidget{Key{"a"}}, PlainWidget{}));
    }
}

// ============================================================
// Thunk
// ============================================================

TEST_CASE("Thunk renders at most once", "[tree][thunk]") {
    int calls = 0;
    Tree thunk = make_thunk([&](const Tree*) {
        ++calls;
        return h("p", {}, {text("lazy")});
    });

    const Tree& first = thunk.as_thunk()->render(nullptr);
    const Tree& second = thunk.as_thunk()->render(nullptr);
    Forced forced = handle_thunks(thunk, nullptr);

    REQUIRE(calls == 1);
    REQUIRE(first.same(second));
    REQUIRE(forced.a.same(first));
    REQUIRE_FALSE(forced.b.has_value());
}

TEST_CASE("Thunk returning a thunk is rejected", "[tree][thunk]") {
    Tree thunk = make_thunk([](const Tree*) {
        return make_thunk([](const Tree*) { return text("inner"); });
    });
    REQUIRE_THROWS_AS(thunk.as_thunk()->render(nullptr), std::logic_error);
}

TEST_CASE("handle_thunks forces the next tree against the prior", "[tree][thunk]") {
    const Tree* seen = nullptr;
    Tree prior = h("div");
    Tree next = make_thunk([&](const Tree* p) {
        seen = p;
        return text("x");
    });

    Forced forced = handle_thunks(prior, &next);
    REQUIRE(seen == &prior);
    REQUIRE(forced.a.same(prior));
    REQUIRE(forced.b->is_text());
}

TEST_CASE("StateThunk reuses the prior tree for equal state", "[tree][thunk]") {
    int views = 0;
    auto view = [&](const int& n) {
        ++views;
        return h("span", {}, {text(std::to_string(n))});
    };

    Tree prior = make_state_thunk<int>(view, 1);
    const Tree& prior_tree = prior.as_thunk()->render(nullptr);

    SECTION("Equal state") {
        Tree next = make_state_thunk<int>(view, 1);
        Forced forced = handle_thunks(prior, &next);
        REQUIRE(views == 1);
        REQUIRE(forced.b->same(prior_tree));
    }

    SECTION("Changed state") {
        Tree next = make_state_thunk<int>(view, 2);
        Forced forced = handle_thunks(prior, &next);
        REQUIRE(views == 2);
        REQUIRE_FALSE(forced.b->same(prior_tree));
    }
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("ElementBuilder collects attributes and styles", "[tree][builder]") {
    Tree item = ElementBuilder("li")
        .key("row-1")
        .prop("title", "first row")
        .attr("data-id", "1")
        .style("color", "red")
        .text("first")
        .finish();

    const Element* el = item.as_element();
    REQUIRE(el->tag == "li");
    REQUIRE(el->key == Key{"row-1"});
    REQUIRE(el->child_count == 1);

    const PropValue* attributes = el->properties.find(ATTRIBUTES);
    REQUIRE(attributes != nullptr);
    REQUIRE(attributes->get_if<PropDict>()->at("data-id") == std::optional<std::string>{"1"});

    const PropValue* style = el->properties.find(STYLE);
    REQUIRE(style != nullptr);
    REQUIRE(style->get_if<PropDict>()->at("color") == std::optional<std::string>{"red"});

    REQUIRE(*el->properties.find("title") == PropValue{"first row"});
}
