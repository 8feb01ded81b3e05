// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Tree comparison producing a PatchSet.
///
/// Positions in the result are assigned by a pre-order walk of `prior`: the
/// root is 0 and the k-th child of a node at position p starts at
/// p + 1 + sum(1 + descendant_count) of the children before it. The patch set
/// can therefore be interpreted from `prior` alone.
///
/// Example:
/// @code
///   auto before = h("ul", {}, {text("a")});
///   auto after  = h("ul", {}, {text("b")});
///   auto set = diff(before, after);   // {1: [VTEXT "a" -> "b"]}
///   root = patch(root, set, {.document = &doc});
/// @endcode

#pragma once

#include <vdom/api.h>
#include <vdom/patch.h>
#include <vdom/props.h>
#include <vdom/tree.h>

#include <optional>

namespace vdom {

/// Compute the patches transforming `prior` into `next`.
/// Pure apart from memoizing any thunks it forces.
[[nodiscard]] VDOM_API PatchSet diff(const Tree& prior, const Tree& next);

/// Property delta between two property maps, nullopt when equal.
/// - names only in `prior` map to Unset
/// - names only in `next`, or with a changed value, map to the next value
/// - "attributes" and "style" dictionaries are diffed one level deep; a
///   removed entry maps to nullopt
[[nodiscard]] VDOM_API std::optional<Props> diff_props(const Props& prior, const Props& next);

} // namespace vdom
