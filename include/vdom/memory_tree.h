// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file memory_tree.h
/// @brief In-memory live tree backend.
///
/// MemoryNode is a small DOM-like element/text node with mutable property,
/// attribute and style tables (tsl::robin_map). It is the backend used by the
/// tests and examples, and doubles as a reference for writing other backends.
///
/// to_markup() serializes a subtree deterministically (names sorted), so two
/// live trees are structurally equivalent exactly when their markup matches:
/// @code
///   MemoryDocument doc;
///   auto node = render(tree, {.document = &doc});
///   std::cout << to_markup(*node);   // <ul class="list"><li>a</li></ul>
/// @endcode

#pragma once

#include <vdom/api.h>
#include <vdom/live_node.h>
#include <vdom/props.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vdom {

/// Transparent hash for heterogeneous robin_map lookup
struct NameHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

struct NameEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

using PropertyTable = tsl::robin_map<std::string, PropValue, NameHash, NameEqual>;
using StringTable   = tsl::robin_map<std::string, std::string, NameHash, NameEqual>;

class VDOM_API MemoryNode : public LiveNode {
public:
    enum class Kind { Element, Text };

    [[nodiscard]] static std::shared_ptr<MemoryNode> make_element(std::string tag);
    [[nodiscard]] static std::shared_ptr<MemoryNode> make_text(std::string text);

    MemoryNode(Kind kind, std::string name_or_text);
    ~MemoryNode() override;

    MemoryNode(const MemoryNode&) = delete;
    MemoryNode& operator=(const MemoryNode&) = delete;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& tag() const noexcept { return tag_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    [[nodiscard]] const PropertyTable& properties() const noexcept { return properties_; }
    [[nodiscard]] const StringTable& attributes() const noexcept { return attributes_; }
    [[nodiscard]] const StringTable& styles() const noexcept { return styles_; }

    /// Property value, or nullptr
    [[nodiscard]] const PropValue* property(std::string_view name) const;
    /// Attribute value, or nullptr
    [[nodiscard]] const std::string* attribute(std::string_view name) const;
    /// Style entry, or nullptr
    [[nodiscard]] const std::string* style(std::string_view name) const;

    [[nodiscard]] const std::vector<LiveNodePtr>& children() const noexcept { return children_; }

    // LiveNode
    [[nodiscard]] bool is_text() const noexcept override { return kind_ == Kind::Text; }
    void set_text(std::string_view text) override;

    [[nodiscard]] LiveNode* parent() const noexcept override { return parent_; }
    [[nodiscard]] std::size_t child_count() const noexcept override { return children_.size(); }
    [[nodiscard]] LiveNodePtr child_at(std::size_t index) const override;
    void append_child(LiveNodePtr child) override;
    void insert_before(LiveNodePtr child, const LiveNode* reference) override;
    LiveNodePtr remove_child(const LiveNode& child) override;
    void replace_child(LiveNodePtr replacement, const LiveNode& old) override;

    void set_property(const std::string& name, const PropValue& value) override;
    void remove_property(const std::string& name) override;
    void set_attribute(const std::string& name, const std::string& value) override;
    void remove_attribute(const std::string& name) override;
    void set_style(const std::string& name, const std::string& value) override;
    void remove_style(const std::string& name) override;

private:
    /// Take ownership of `child` as a child of this node
    MemoryNode& adopt(const LiveNodePtr& child);
    [[nodiscard]] std::vector<LiveNodePtr>::iterator find_child(const LiveNode& child);

    Kind kind_;
    std::string tag_;
    std::string text_;
    MemoryNode* parent_ = nullptr;
    std::vector<LiveNodePtr> children_;
    PropertyTable properties_;
    StringTable attributes_;
    StringTable styles_;
};

/// Node factory for MemoryNode trees, counting what it creates
class VDOM_API MemoryDocument : public Document {
public:
    [[nodiscard]] LiveNodePtr create_element(const std::string& tag) override;
    [[nodiscard]] LiveNodePtr create_text(const std::string& text) override;

    [[nodiscard]] std::size_t elements_created() const noexcept { return elements_created_; }
    [[nodiscard]] std::size_t texts_created() const noexcept { return texts_created_; }
    void reset_stats() noexcept { elements_created_ = texts_created_ = 0; }

private:
    std::size_t elements_created_ = 0;
    std::size_t texts_created_ = 0;
};

/// Deterministic serialization of a MemoryNode subtree
/// @throws std::invalid_argument when the subtree holds a foreign node type
[[nodiscard]] VDOM_API std::string to_markup(const LiveNode& node);

} // namespace vdom
