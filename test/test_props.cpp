// test_props.cpp - Tests for property diffing and the default applier

#include <catch2/catch_all.hpp>
#include <vdom/apply_props.h>
#include <vdom/diff.h>
#include <vdom/memory_tree.h>

#include <string>
#include <vector>

using namespace vdom;

// ============================================================
// diff_props
// ============================================================

TEST_CASE("diff_props on equal maps", "[props][diff]") {
    Props a = props({{"id", "x"}, {"tabIndex", 2}, {"attributes", dict({{"role", "list"}})}});
    Props b = props({{"id", "x"}, {"tabIndex", 2}, {"attributes", dict({{"role", "list"}})}});

    REQUIRE_FALSE(diff_props(a, b).has_value());
    REQUIRE_FALSE(diff_props(Props{}, Props{}).has_value());
}

TEST_CASE("diff_props on primitive values", "[props][diff]") {
    Props prior = props({{"id", "x"}, {"checked", true}, {"value", "old"}});
    Props next = props({{"id", "x"}, {"value", "new"}, {"tabIndex", 3}});

    auto delta = diff_props(prior, next);
    REQUIRE(delta.has_value());
    REQUIRE(delta->size() == 3);

    SECTION("Removed name maps to Unset") {
        REQUIRE(delta->find("checked")->is_unset());
    }

    SECTION("Changed name maps to the next value") {
        REQUIRE(*delta->find("value") == PropValue{"new"});
    }

    SECTION("Added name maps to its value") {
        REQUIRE(*delta->find("tabIndex") == PropValue{3});
    }

    SECTION("Unchanged name is absent") {
        REQUIRE(delta->find("id") == nullptr);
    }
}

TEST_CASE("diff_props descends into attributes and style", "[props][diff]") {
    Props prior = props({
        {"attributes", dict({{"role", "list"}, {"data-id", "1"}})},
        {"style", dict({{"color", "red"}, {"margin", "0"}})},
    });
    Props next = props({
        {"attributes", dict({{"role", "list"}, {"data-row", "2"}})},
        {"style", dict({{"color", "blue"}, {"margin", "0"}})},
    });

    auto delta = diff_props(prior, next);
    REQUIRE(delta.has_value());

    const PropDict* attributes = delta->find(ATTRIBUTES)->get_if<PropDict>();
    REQUIRE(attributes != nullptr);
    REQUIRE(attributes->size() == 2);
    REQUIRE_FALSE(attributes->at("data-id").has_value());
    REQUIRE(attributes->at("data-row") == std::optional<std::string>{"2"});

    const PropDict* style = delta->find(STYLE)->get_if<PropDict>();
    REQUIRE(style != nullptr);
    REQUIRE(style->size() == 1);
    REQUIRE(style->at("color") == std::optional<std::string>{"blue"});
}

TEST_CASE("diff_props replaces other dictionaries whole", "[props][diff]") {
    PropDict next_data = dict({{"a", "1"}, {"b", "3"}});
    Props prior = props({{"dataset", dict({{"a", "1"}, {"b", "2"}})}});
    Props next = props({{"dataset", next_data}});

    auto delta = diff_props(prior, next);
    REQUIRE(delta.has_value());
    REQUIRE(*delta->find("dataset") == PropValue{next_data});
}

TEST_CASE("diff_props compares hooks by identity", "[props][diff][hook]") {
    auto noop = [](LiveNode&, const std::string&, const PropValue&) {};
    HookPtr hook = make_hook(noop);

    REQUIRE_FALSE(diff_props(props({{"h", hook}}), props({{"h", hook}})).has_value());

    auto delta = diff_props(props({{"h", hook}}), props({{"h", make_hook(noop)}}));
    REQUIRE(delta.has_value());
    REQUIRE(delta->find("h")->is_hook());
}

// ============================================================
// apply_properties
// ============================================================

TEST_CASE("apply_properties on a fresh node", "[props][apply]") {
    auto node = MemoryNode::make_element("div");
    Props all = props({
        {"id", "main"},
        {"hidden", false},
        {"attributes", dict({{"role", "list"}})},
        {"style", dict({{"color", "red"}})},
    });

    apply_properties(*node, all, nullptr);

    REQUIRE(*node->property("id") == PropValue{"main"});
    REQUIRE(*node->property("hidden") == PropValue{false});
    REQUIRE(*node->attribute("role") == "list");
    REQUIRE(*node->style("color") == "red");
    REQUIRE(node->property(ATTRIBUTES) == nullptr);
    REQUIRE(node->property(STYLE) == nullptr);
}

TEST_CASE("apply_properties with a delta", "[props][apply]") {
    auto node = MemoryNode::make_element("div");
    Props prior = props({
        {"id", "main"},
        {"title", "t"},
        {"attributes", dict({{"role", "list"}, {"data-id", "1"}})},
        {"style", dict({{"color", "red"}, {"margin", "0"}})},
    });
    apply_properties(*node, prior, nullptr);

    SECTION("Unset removes the property") {
        Props next = props({
            {"id", "main"},
            {"attributes", dict({{"role", "list"}, {"data-id", "1"}})},
            {"style", dict({{"color", "red"}, {"margin", "0"}})},
        });
        apply_properties(*node, *diff_props(prior, next), &prior);
        REQUIRE(node->property("title") == nullptr);
        REQUIRE(node->property("id") != nullptr);
    }

    SECTION("Entry-level attribute and style changes") {
        Props next = props({
            {"id", "main"},
            {"title", "t"},
            {"attributes", dict({{"role", "grid"}})},
            {"style", dict({{"color", "red"}})},
        });
        apply_properties(*node, *diff_props(prior, next), &prior);
        REQUIRE(*node->attribute("role") == "grid");
        REQUIRE(node->attribute("data-id") == nullptr);
        REQUIRE(*node->style("color") == "red");
        REQUIRE(node->style("margin") == nullptr);
    }

    SECTION("Removing the whole attribute and style maps") {
        Props next = props({{"id", "main"}, {"title", "t"}});
        apply_properties(*node, *diff_props(prior, next), &prior);
        REQUIRE(node->attributes().empty());
        REQUIRE(node->styles().empty());
    }
}

TEST_CASE("apply_properties drives hooks", "[props][apply][hook]") {
    std::vector<std::string> events;
    HookPtr focus = make_hook(
        [&](LiveNode&, const std::string& name, const PropValue& previous) {
            events.push_back("hook " + name + (previous.is_unset() ? "" : " again"));
        },
        [&](LiveNode&, const std::string& name, const PropValue& next) {
            events.push_back("unhook " + name + (next.is_unset() ? "" : " for new"));
        });

    auto node = MemoryNode::make_element("input");
    Props prior = props({{"focus", focus}});
    apply_properties(*node, prior, nullptr);
    REQUIRE(events == std::vector<std::string>{"hook focus"});

    SECTION("Hooks never land in the property table") {
        REQUIRE(node->property("focus") == nullptr);
    }

    SECTION("Removal unhooks") {
        Props next;
        apply_properties(*node, *diff_props(prior, next), &prior);
        REQUIRE(events == std::vector<std::string>{"hook focus", "unhook focus"});
    }

    SECTION("Replacement unhooks the old hook, then hooks the new one") {
        HookPtr other = make_hook([&](LiveNode&, const std::string& name, const PropValue& previous) {
            events.push_back("other " + name + (previous.is_hook() ? " after hook" : ""));
        });
        Props next = props({{"focus", other}});
        apply_properties(*node, *diff_props(prior, next), &prior);
        REQUIRE(events == std::vector<std::string>{"hook focus", "unhook focus for new", "other focus after hook"});
    }
}
