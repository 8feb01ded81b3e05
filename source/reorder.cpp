// reorder.cpp - Keyed child reconciliation

#include <vdom/reorder.h>

#include <algorithm>
#include <unordered_map>

namespace vdom {

namespace {

// ============================================================
// KeyIndex - reverse mapping from key to position, plus the positions of
// unkeyed items. A key repeated within one list belongs to its first item;
// the later duplicates are listed as free.
// ============================================================

struct KeyIndex {
    std::unordered_map<std::string, std::size_t> keys;
    std::vector<std::size_t> free;
    std::vector<const std::string*> owned;  ///< effective key per item, nullptr if free

    [[nodiscard]] const std::size_t* find(const std::string& key) const {
        auto it = keys.find(key);
        return it == keys.end() ? nullptr : &it->second;
    }
};

KeyIndex key_index(const Children& items)
{
    KeyIndex index;
    index.owned.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& key = items[i].key();
        if (key && index.keys.emplace(*key, i).second) {
            index.owned.push_back(&*key);
        } else {
            index.free.push_back(i);
            index.owned.push_back(nullptr);
        }
    }
    return index;
}

bool same_key(const std::string* a, const std::string* b)
{
    if (!a || !b) return a == b;
    return *a == *b;
}

} // anonymous namespace

ReorderResult reorder(const Children& prior, const Children& next)
{
    const KeyIndex next_index = key_index(next);
    const KeyIndex prior_index = key_index(prior);

    ReorderResult result;

    // Without keys on both sides there is nothing to match
    if (prior_index.free.size() == prior.size() || next_index.free.size() == next.size()) {
        result.children.reserve(next.size());
        for (const auto& child : next) {
            result.children.emplace_back(child);
        }
        return result;
    }

    // aligned[i] = index into `next`, nullopt for a deleted prior item
    std::vector<std::optional<std::size_t>> aligned;
    aligned.reserve(std::max(prior.size(), next.size()));

    std::size_t free_index = 0;
    const std::size_t free_count = next_index.free.size();
    std::size_t deleted_items = 0;

    // Match every prior item with a next item: by key, else by free slot
    for (std::size_t i = 0; i < prior.size(); ++i) {
        if (const std::string* key = prior_index.owned[i]) {
            if (const std::size_t* match = next_index.find(*key)) {
                aligned.emplace_back(*match);
            } else {
                ++deleted_items;
                aligned.emplace_back(std::nullopt);
            }
        } else if (free_index < free_count) {
            aligned.emplace_back(next_index.free[free_index++]);
        } else {
            ++deleted_items;
            aligned.emplace_back(std::nullopt);
        }
    }

    const std::size_t last_free_index =
        free_index >= next_index.free.size() ? next.size() : next_index.free[free_index];

    // Append new keyed items and leftover free items
    for (std::size_t j = 0; j < next.size(); ++j) {
        if (const std::string* key = next_index.owned[j]) {
            if (!prior_index.find(*key)) {
                aligned.emplace_back(j);
            }
        } else if (j >= last_free_index) {
            aligned.emplace_back(j);
        }
    }

    // Simulate turning `aligned` into `next`, recording the moves
    std::vector<std::optional<std::size_t>> simulate = aligned;
    std::size_t simulate_index = 0;
    Moves moves;

    auto key_at = [&](std::size_t index) -> const std::string* {
        if (index >= simulate.size() || !simulate[index]) return nullptr;
        return next_index.owned[*simulate[index]];
    };
    auto remove_at = [&](std::size_t index) {
        moves.removes.push_back(Moves::Remove{index, key_at(index) ? Key{*key_at(index)} : Key{}});
        simulate.erase(simulate.begin() + static_cast<std::ptrdiff_t>(index));
    };
    auto is_placeholder = [&](std::size_t index) {
        return index < simulate.size() && !simulate[index];
    };

    for (std::size_t k = 0; k < next.size();) {
        const std::string* wanted_key = next_index.owned[k];

        // Remove deleted items
        while (is_placeholder(simulate_index)) {
            remove_at(simulate_index);
        }

        const bool has_item = simulate_index < simulate.size();
        const std::string* simulate_key = key_at(simulate_index);

        if (has_item && same_key(simulate_key, wanted_key)) {
            ++simulate_index;
            ++k;
            continue;
        }

        if (wanted_key) {
            // A key is needed in this position
            if (simulate_key) {
                if (*next_index.find(*simulate_key) != k + 1) {
                    // Inserting the wanted item would not put this one in place: move it
                    remove_at(simulate_index);
                    if (!same_key(key_at(simulate_index), wanted_key)) {
                        moves.inserts.push_back(Moves::Insert{k, *wanted_key});
                    } else {
                        ++simulate_index;
                    }
                } else {
                    moves.inserts.push_back(Moves::Insert{k, *wanted_key});
                }
            } else {
                moves.inserts.push_back(Moves::Insert{k, *wanted_key});
            }
            ++k;
        } else if (simulate_key) {
            // A keyed item with no wanted key here: take it out
            remove_at(simulate_index);
        } else {
            // Unreachable for lists built above: unkeyed items keep their relative order
            ++k;
        }
    }

    // Remove whatever the simulation did not consume
    while (simulate_index < simulate.size()) {
        remove_at(simulate_index);
    }

    result.children.reserve(aligned.size());
    for (const auto& slot : aligned) {
        if (slot) {
            result.children.emplace_back(next[*slot]);
        } else {
            result.children.emplace_back(std::nullopt);
        }
    }

    // Only deletions: the per-position remove patches already do this
    if (moves.removes.size() == deleted_items && moves.inserts.empty()) {
        return result;
    }

    result.moves = std::move(moves);
    return result;
}

std::vector<Key> simulate_moves(std::vector<Key> keys, const Moves& moves)
{
    std::unordered_map<std::string, Key> held;
    for (const auto& r : moves.removes) {
        if (r.from >= keys.size()) continue;
        if (r.key) {
            held.emplace(*r.key, keys[r.from]);
        }
        keys.erase(keys.begin() + static_cast<std::ptrdiff_t>(r.from));
    }
    for (const auto& ins : moves.inserts) {
        auto it = held.find(ins.key);
        if (it == held.end()) continue;
        const auto to = std::min(ins.to, keys.size());
        keys.insert(keys.begin() + static_cast<std::ptrdiff_t>(to), it->second);
    }
    return keys;
}

} // namespace vdom
