// apply_props.h - Default property applier

#pragma once

#include <vdom/api.h>
#include <vdom/props.h>

#include <functional>

namespace vdom {

/// Applies a property map (a full property set, or a delta from diff_props)
/// to a live node. `previous` is the property map the node was last rendered
/// with, or nullptr for a fresh node.
using PropertyApplier = std::function<void(LiveNode& node, const Props& delta, const Props* previous)>;

/// Default applier:
/// - Unset: removes the property (unhooking a prior Teardown::Unhook hook,
///   removing every prior attribute or style entry for "attributes"/"style")
/// - Hook: removes the previous value, then calls hook()
/// - "attributes" / "style" dictionaries: set or remove entry by entry
/// - any other dictionary or primitive: assigned wholesale
VDOM_API void apply_properties(LiveNode& node, const Props& delta, const Props* previous);

} // namespace vdom
