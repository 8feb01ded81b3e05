// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file reorder.h
/// @brief Keyed child reconciliation.
///
/// reorder() aligns the next children with the prior children so that slot i
/// of the result is diffed against prior child i, and describes how the live
/// children must be moved to reach the next order:
///
///   prior: [a b c]       next: [c a b]
///   aligned children: [a b c]       (matched by key)
///   moves: removes {from 2, key c}; inserts {to 0, key c}
///
/// Lists where either side has no keyed items are diffed positionally and
/// produce no moves.

#pragma once

#include <vdom/api.h>
#include <vdom/tree.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vdom {

struct Moves {
    struct Remove {
        std::size_t from;  ///< index in the child list as left by previous removes
        Key key;           ///< set when the removed child is re-inserted later

        bool operator==(const Remove&) const = default;
    };

    struct Insert {
        std::size_t to;    ///< index in the child list as left by previous inserts
        std::string key;

        bool operator==(const Insert&) const = default;
    };

    std::vector<Remove> removes;
    std::vector<Insert> inserts;
};

struct ReorderResult {
    /// Next children permuted to line up with the prior children; nullopt
    /// marks a prior child with no counterpart (a deletion)
    std::vector<std::optional<Tree>> children;

    /// Live-tree moves, or nullopt when positional patches suffice
    std::optional<Moves> moves;
};

/// Reconcile two sibling lists.
///
/// Keys are matched first-come: when a key repeats within one list, the first
/// item owns the key and later duplicates are matched positionally like
/// unkeyed items.
[[nodiscard]] VDOM_API ReorderResult reorder(const Children& prior, const Children& next);

/// Apply `moves` to a plain sequence of keys (testing and diagnostics aid):
/// the removes run in order, then the inserts.
[[nodiscard]] VDOM_API std::vector<Key> simulate_moves(std::vector<Key> keys, const Moves& moves);

} // namespace vdom
