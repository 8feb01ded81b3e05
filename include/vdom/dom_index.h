// dom_index.h - Map patch positions onto live nodes
//
// locate() walks the live tree and the prior tree value together, but only
// descends into a child when the child's position range
// [start, start + descendant_count] contains a requested position. The cost
// of indexing is thus proportional to the number of patched positions times
// the tree depth, not to the size of the tree.

#pragma once

#include <vdom/api.h>
#include <vdom/tree.h>

#include <cstddef>
#include <map>
#include <span>

namespace vdom {

using NodeMap = std::map<std::size_t, LiveNodePtr>;

/// Does some position in the ascending list `positions` fall in [left, right]?
[[nodiscard]] VDOM_API bool index_in_range(std::span<const std::size_t> positions,
                                           std::size_t left, std::size_t right) noexcept;

/// Find the live node for every requested position.
/// @param positions ascending positions (as returned by PatchSet::positions)
/// Positions with no live counterpart are left out of the result.
[[nodiscard]] VDOM_API NodeMap locate(const LiveNodePtr& root, const Tree& tree,
                                      std::span<const std::size_t> positions);

} // namespace vdom
