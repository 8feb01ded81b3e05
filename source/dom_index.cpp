// dom_index.cpp - Sparse position index over a live tree

#include <vdom/dom_index.h>
#include <vdom/live_node.h>

#include <algorithm>

namespace vdom {

namespace {

void recurse(const LiveNodePtr& node, const Tree& tree, std::span<const std::size_t> positions,
             NodeMap& nodes, std::size_t root_index)
{
    if (!node) {
        return;
    }

    if (index_in_range(positions, root_index, root_index)) {
        nodes.emplace(root_index, node);
    }

    const Element* el = tree.as_element();
    if (!el) {
        return;
    }

    std::size_t i = 0;
    for (const auto& child : el->children) {
        root_index += 1;
        const std::size_t next_index = root_index + child.descendant_count();

        if (index_in_range(positions, root_index, next_index)) {
            recurse(node->child_at(i), child, positions, nodes, root_index);
        }

        root_index = next_index;
        ++i;
    }
}

} // anonymous namespace

bool index_in_range(std::span<const std::size_t> positions, std::size_t left, std::size_t right) noexcept
{
    // First position not below `left`; in range when it is not above `right`
    auto it = std::ranges::lower_bound(positions, left);
    return it != positions.end() && *it <= right;
}

NodeMap locate(const LiveNodePtr& root, const Tree& tree, std::span<const std::size_t> positions)
{
    NodeMap nodes;
    if (positions.empty()) {
        return nodes;
    }
    recurse(root, tree, positions, nodes, 0);
    return nodes;
}

} // namespace vdom
