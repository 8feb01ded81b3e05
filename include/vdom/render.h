// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render.h
/// @brief Default materializer: builds a live subtree from a tree value.

#pragma once

#include <vdom/api.h>
#include <vdom/apply_props.h>
#include <vdom/tree_fwd.h>

#include <functional>
#include <string_view>

namespace vdom {

using WarnFn = std::function<void(std::string_view message, const Tree& tree)>;

struct RenderOptions {
    Document* document = nullptr;   ///< node factory (required by render())
    PropertyApplier apply_props;    ///< empty means apply_properties
    WarnFn warn;                    ///< empty means the logging helper
};

using Materializer = std::function<LiveNodePtr(const Tree& tree, const RenderOptions& options)>;

/// Materialize `tree`:
/// - thunks are forced against nothing
/// - widgets build their own node via Widget::materialize
/// - text becomes a document text node
/// - elements become document elements with properties applied and
///   children rendered recursively
///
/// @throws std::invalid_argument when options.document is null and a text
///         or element node has to be created
[[nodiscard]] VDOM_API LiveNodePtr render(const Tree& tree, const RenderOptions& options);

/// Report through options.warn, or the logging helper when unset
VDOM_API void warn(const RenderOptions& options, std::string_view message, const Tree& tree);

} // namespace vdom
