// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file live_node.h
/// @brief Abstract interface of the mutable tree that patches are applied to.
///
/// The diff/patch core never hard-wires a tree technology. Everything it
/// needs from the live tree goes through these two interfaces:
/// - LiveNode: structure edits, text replacement and the property surface
/// - Document: node construction (used by the default materializer)
///
/// Ownership follows the DOM model: a parent owns its children through
/// LiveNodePtr, parent links are non-owning.

#pragma once

#include <vdom/api.h>
#include <vdom/props.h>
#include <vdom/tree_fwd.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace vdom {

class VDOM_API LiveNode {
public:
    virtual ~LiveNode() = default;

    // --------------------------------------------------------
    // Text
    // --------------------------------------------------------

    [[nodiscard]] virtual bool is_text() const noexcept = 0;

    /// Replace the content of a text node in place
    virtual void set_text(std::string_view text) = 0;

    // --------------------------------------------------------
    // Structure
    // --------------------------------------------------------

    [[nodiscard]] virtual LiveNode* parent() const noexcept = 0;
    [[nodiscard]] virtual std::size_t child_count() const noexcept = 0;

    /// Child at `index`, or nullptr when out of range
    [[nodiscard]] virtual LiveNodePtr child_at(std::size_t index) const = 0;

    /// Append `child`, detaching it from any previous parent first
    virtual void append_child(LiveNodePtr child) = 0;

    /// Insert `child` before `reference`; nullptr reference appends
    virtual void insert_before(LiveNodePtr child, const LiveNode* reference) = 0;

    /// Detach `child`; returns it so the caller may keep it alive
    virtual LiveNodePtr remove_child(const LiveNode& child) = 0;

    /// Put `replacement` where `old` is and detach `old`
    virtual void replace_child(LiveNodePtr replacement, const LiveNode& old) = 0;

    // --------------------------------------------------------
    // Property surface
    // --------------------------------------------------------

    virtual void set_property(const std::string& name, const PropValue& value) = 0;
    virtual void remove_property(const std::string& name) = 0;
    virtual void set_attribute(const std::string& name, const std::string& value) = 0;
    virtual void remove_attribute(const std::string& name) = 0;
    virtual void set_style(const std::string& name, const std::string& value) = 0;
    virtual void remove_style(const std::string& name) = 0;
};

class VDOM_API Document {
public:
    virtual ~Document() = default;

    [[nodiscard]] virtual LiveNodePtr create_element(const std::string& tag) = 0;
    [[nodiscard]] virtual LiveNodePtr create_text(const std::string& text) = 0;
};

} // namespace vdom
