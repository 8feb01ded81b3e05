// test_memory_tree.cpp - Tests for the in-memory live tree backend

#include <catch2/catch_all.hpp>
#include <vdom/builders.h>
#include <vdom/memory_tree.h>
#include <vdom/render.h>

#include <string>

using namespace vdom;

namespace {

class ForeignNode final : public LiveNode {
public:
    bool is_text() const noexcept override { return true; }
    void set_text(std::string_view) override {}
    LiveNode* parent() const noexcept override { return nullptr; }
    std::size_t child_count() const noexcept override { return 0; }
    LiveNodePtr child_at(std::size_t) const override { return nullptr; }
    void append_child(LiveNodePtr) override {}
    void insert_before(LiveNodePtr, const LiveNode*) override {}
    LiveNodePtr remove_child(const LiveNode&) override { return nullptr; }
    void replace_child(LiveNodePtr, const LiveNode&) override {}
    void set_property(const std::string&, const PropValue&) override {}
    void remove_property(const std::string&) override {}
    void set_attribute(const std::string&, const std::string&) override {}
    void remove_attribute(const std::string&) override {}
    void set_style(const std::string&, const std::string&) override {}
    void remove_style(const std::string&) override {}
};

} // anonymous namespace

// ============================================================
// Structure
// ============================================================

TEST_CASE("MemoryNode child operations", "[memory_tree]") {
    auto parent = MemoryNode::make_element("ul");
    auto a = MemoryNode::make_element("li");
    auto b = MemoryNode::make_element("li");
    auto c = MemoryNode::make_element("li");

    parent->append_child(a);
    parent->append_child(c);
    parent->insert_before(b, c.get());

    REQUIRE(parent->child_count() == 3);
    REQUIRE(parent->child_at(1) == b);
    REQUIRE(b->parent() == parent.get());
    REQUIRE(parent->child_at(3) == nullptr);

    SECTION("remove_child detaches") {
        LiveNodePtr removed = parent->remove_child(*a);
        REQUIRE(removed == a);
        REQUIRE(a->parent() == nullptr);
        REQUIRE(parent->child_count() == 2);
    }

    SECTION("replace_child swaps in place") {
        auto d = MemoryNode::make_element("li");
        parent->replace_child(d, *b);
        REQUIRE(parent->child_at(1) == d);
        REQUIRE(b->parent() == nullptr);
        REQUIRE(d->parent() == parent.get());
    }

    SECTION("Moving a child detaches it from its old place") {
        parent->insert_before(c, a.get());
        REQUIRE(parent->child_count() == 3);
        REQUIRE(parent->child_at(0) == c);
        REQUIRE(parent->child_at(2) == b);

        auto other = MemoryNode::make_element("ol");
        other->append_child(a);
        REQUIRE(parent->child_count() == 2);
        REQUIRE(a->parent() == other.get());
    }

    SECTION("Invalid operations throw") {
        auto stranger = MemoryNode::make_element("li");
        REQUIRE_THROWS_AS(parent->remove_child(*stranger), std::invalid_argument);
        REQUIRE_THROWS_AS(parent->append_child(std::make_shared<ForeignNode>()), std::invalid_argument);
        REQUIRE_THROWS_AS(a->set_text("x"), std::logic_error);
    }
}

// ============================================================
// Markup
// ============================================================

TEST_CASE("to_markup is deterministic", "[memory_tree][markup]") {
    MemoryDocument doc;
    Tree tree = ElementBuilder("div")
        .attr("role", "main")
        .attr("aria-label", "x")
        .style("margin", "0")
        .style("color", "red")
        .prop("tabIndex", 2)
        .text("a < b & c")
        .finish();

    LiveNodePtr node = render(tree, {.document = &doc});

    REQUIRE(to_markup(*node) ==
            "<div aria-label=\"x\" role=\"main\" style=\"color:red;margin:0;\" .tabIndex=\"2\">"
            "a &lt; b &amp; c</div>");
    REQUIRE(doc.elements_created() == 1);
    REQUIRE(doc.texts_created() == 1);
}

TEST_CASE("to_markup rejects foreign nodes", "[memory_tree][markup]") {
    ForeignNode foreign;
    REQUIRE_THROWS_AS(to_markup(foreign), std::invalid_argument);
}
