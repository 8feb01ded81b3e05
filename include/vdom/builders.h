// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Construction helpers for tree values.
///
/// ElementBuilder accumulates properties and children in immer transients
/// and produces the immutable element once, in O(n):
/// @code
///   Tree item = ElementBuilder("li")
///       .key("row-1")
///       .attr("data-id", "1")
///       .style("color", "red")
///       .text("first")
///       .finish();
/// @endcode
///
/// h() and text() cover the common literal cases:
/// @code
///   Tree list = h("ul", props({{"className", "list"}}), {text("a"), text("b")});
/// @endcode

#pragma once

#include <vdom/vdom_config.h>
#include <vdom/api.h>
#include <vdom/props.h>
#include <vdom/tree.h>

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

#include <string>
#include <vector>

namespace vdom {

class VDOM_API ElementBuilder {
public:
    explicit ElementBuilder(std::string tag);

    // Move operations (allowed)
    ElementBuilder(ElementBuilder&&) noexcept = default;
    ElementBuilder& operator=(ElementBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    ElementBuilder(const ElementBuilder&) = delete;
    ElementBuilder& operator=(const ElementBuilder&) = delete;

    ElementBuilder& key(std::string key);
    ElementBuilder& prop(const std::string& name, PropValue value);
    ElementBuilder& attr(const std::string& name, std::string value);
    ElementBuilder& style(const std::string& name, std::string value);
    ElementBuilder& hook(const std::string& name, HookPtr hook);
    ElementBuilder& child(Tree child);
    ElementBuilder& text(std::string value);

    template <typename Range>
    ElementBuilder& children(const Range& range) {
        for (const auto& c : range) {
            children_.push_back(c);
        }
        return *this;
    }

    /// Produce the element. "attributes" and "style" collected through
    /// attr()/style() override entries of the same name set with prop().
    [[nodiscard]] Tree finish();

private:
    std::string tag_;
    Key key_;
    Props::transient_type props_;
    PropDict::transient_type attributes_;
    PropDict::transient_type styles_;
    Children::transient_type children_;
};

[[nodiscard]] VDOM_API Tree h(std::string tag, Props properties = {}, std::vector<Tree> children = {},
                              Key key = std::nullopt);

[[nodiscard]] VDOM_API Tree text(std::string value, Key key = std::nullopt);

} // namespace vdom
