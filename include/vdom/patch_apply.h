// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_apply.h
/// @brief Applies a PatchSet to a live tree.
///
/// The apply engine keeps no state between calls. Every call indexes the
/// patched positions with locate(), then applies each position's patches in
/// ascending position order, threading the root through when the root itself
/// is replaced or removed.
///
/// Collaborators are injected through PatchConfig:
/// - patch: the recursive patcher (used for nested thunk patch sets)
/// - render: the materializer (inherited RenderOptions are passed to it)
/// - apply_props: the property applier
/// - warn: diagnostics for tolerated anomalies
///
/// Usage:
/// @code
///   MemoryDocument doc;
///   LiveNodePtr root = render(before, {.document = &doc});
///   root = patch(root, diff(before, after), {.document = &doc});
/// @endcode

#pragma once

#include <vdom/api.h>
#include <vdom/patch.h>
#include <vdom/render.h>

#include <functional>
#include <stdexcept>
#include <string>

namespace vdom {

/// A patch set did not match the live tree it was applied to
class VDOM_API PatchError : public std::runtime_error {
public:
    PatchError(const std::string& message, std::size_t position)
        : std::runtime_error(message), position_(position) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

using Patcher = std::function<LiveNodePtr(LiveNodePtr root, const PatchSet& patches, const PatchConfig& config)>;

struct PatchConfig : RenderOptions {
    Patcher patch;
    Materializer render;
};

/// Optional overrides; anything left empty gets the default implementation
struct PatchOptions {
    Document* document = nullptr;
    Patcher patch;
    Materializer render;
    PropertyApplier apply_props;
    WarnFn warn;
};

/// Fill in defaults: apply() as patcher, render() as materializer,
/// apply_properties() as property applier, the logging helper as warn.
/// @throws std::invalid_argument when neither a document nor a custom
///         materializer is supplied
[[nodiscard]] VDOM_API PatchConfig make_config(PatchOptions options);

/// Entry point: build the config and dispatch through config.patch
VDOM_API LiveNodePtr patch(LiveNodePtr root, const PatchSet& patches, PatchOptions options);

/// Default patcher. Returns the (possibly new, possibly null) root.
/// @throws PatchError when a patched position has no live node
VDOM_API LiveNodePtr apply(LiveNodePtr root, const PatchSet& patches, const PatchConfig& config);

/// Apply a single patch to the node located at its position.
/// Returns the node now standing at that position (nullptr after a removal).
VDOM_API LiveNodePtr apply_patch(const Patch& p, const LiveNodePtr& node, const PatchConfig& config);

} // namespace vdom
