// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Patch operations and the sparse patch set produced by diff().

#pragma once

#include <vdom/api.h>
#include <vdom/props.h>
#include <vdom/reorder.h>
#include <vdom/tree.h>

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vdom {

// ============================================================
// Patch operations
//
// Every operation except Insert carries the prior tree value it targets, so
// apply time can run lifecycle effects (widget destroy, hook unhook, previous
// properties).
// ============================================================

namespace op {

/// Detach the node; destroys it when it was a widget
struct Remove {
    Tree node;
};

/// Materialize `next` and append it to the node at this position
struct Insert {
    Tree next;
};

struct ReplaceText {
    Tree node;
    Tree next;
};

/// Materialize `next` and splice it in place of the node
struct ReplaceNode {
    Tree node;
    Tree next;
};

/// Update the prior widget in place or replace it (decided at apply time)
struct UpdateWidget {
    std::optional<Tree> node;  ///< prior tree, only when it was a widget
    Tree next;
};

struct UpdateProps {
    Tree node;
    Props delta;
};

struct Reorder {
    Tree node;
    Moves moves;
};

/// Patch the node with a nested patch set (computed from forced thunks)
struct EnterThunk {
    Tree node;  ///< prior tree at this position, before forcing
    std::shared_ptr<const PatchSet> patches;
};

} // namespace op

using Patch = std::variant<op::Remove,
                           op::Insert,
                           op::ReplaceText,
                           op::ReplaceNode,
                           op::UpdateWidget,
                           op::UpdateProps,
                           op::Reorder,
                           op::EnterThunk>;

using PatchList = std::vector<Patch>;

// ============================================================
// PatchSet
//
// Sparse map from position (pre-order index in node0's shape) to the
// patches to apply there, in order. Positions without changes are absent.
// ============================================================

struct VDOM_API PatchSet {
    Tree node0;
    std::map<std::size_t, PatchList> patches;

    explicit PatchSet(Tree root) : node0(std::move(root)) {}

    [[nodiscard]] bool empty() const noexcept { return patches.empty(); }

    /// Number of positions carrying patches
    [[nodiscard]] std::size_t size() const noexcept { return patches.size(); }

    /// Ascending positions carrying patches
    [[nodiscard]] std::vector<std::size_t> positions() const;

    /// Patches at `position`, or nullptr
    [[nodiscard]] const PatchList* at(std::size_t position) const;

    /// Print one line per patch
    void print(std::ostream& os) const;
};

/// Name of the patch operation ("REMOVE", "PROPS", ...)
[[nodiscard]] VDOM_API const char* patch_name(const Patch& p) noexcept;

/// One-line description of a patch
[[nodiscard]] VDOM_API std::string to_string(const Patch& p);

} // namespace vdom
