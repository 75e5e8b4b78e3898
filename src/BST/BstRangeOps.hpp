/**
 * @brief Range-scoped queries and edits on immutable binary search trees.
 *
 * A range splits a tree into three parts: the keys beyond it to the left (too
 * low), the keys in it, and the keys beyond it to the right (too high). Each
 * operation walks one root-to-leaf path per bounded side.
 */

#ifndef BSTRANGEOPS_HPP
#define BSTRANGEOPS_HPP

#include <cstdint>
#include <optional>
#include <utility>  // std::move

#include "BstCommon.hpp"
#include "BstNode.hpp"
#include "GeneralRange.hpp"

/**
 * @brief Whether `key` lies outside `range` on the given side.
 */
template<typename T, typename Compare>
inline bool bst_beyond(const GeneralRange<T, Compare>& range, const T& key, BstSide side) {
    return side == BstSide::LEFT ? range.too_low(key) : range.too_high(key);
}

namespace bst_detail {

template<BstNodeType N, typename A, typename T, typename Compare>
inline std::uint64_t total_beyond_range_to_side(const A& aggregate, const GeneralRange<T, Compare>& range,
                                                BstSide side, const BstNodePtr<N>& root) {
    std::uint64_t accum{0};
    const N* node{root.get()};
    while (node != nullptr) {
        if (bst_beyond(range, node->key(), side)) {
            accum += aggregate.entry_value(*node) + aggregate.tree_value(node->child(side));
            node = node->child(other_side(side)).get();
        } else {
            node = node->child(side).get();
        }
    }
    return accum;
}

template<BstNodeType N, typename T, typename Compare, typename P, typename F>
inline BstNodePtr<N> sub_tree_beyond_range_to_side(const GeneralRange<T, Compare>& range, const P& policy,
                                                   const F& factory, BstSide side, const BstNodePtr<N>& root) {
    if (root == nullptr) {
        return nullptr;
    }
    if (!bst_beyond(range, root->key(), side)) {
        return sub_tree_beyond_range_to_side(range, policy, factory, side, root->child(side));
    }
    // root and everything on its `side` are out of range; only the inner child needs trimming
    const auto& inner{root->child(other_side(side))};
    auto trimmed{sub_tree_beyond_range_to_side(range, policy, factory, side, inner)};
    if (trimmed == inner) {
        return root;
    }
    if (side == BstSide::LEFT) {
        return policy.balance(factory, *root, root->child(BstSide::LEFT), std::move(trimmed));
    }
    return policy.balance(factory, *root, std::move(trimmed), root->child(BstSide::RIGHT));
}

template<typename T, typename Compare, typename PF>
inline std::optional<typename PF::path_type> furthest_path(const GeneralRange<T, Compare>& range, BstSide side,
                                                           const PF& path_factory,
                                                           const typename PF::path_type& current) {
    const auto& tip{current.tip()};
    const auto back{other_side(side)};
    if (bst_beyond(range, tip->key(), side)) {
        if (tip->has_child(back)) {
            return furthest_path(range, side, path_factory, path_factory.extension(current, back));
        }
        return std::nullopt;
    }
    if (tip->has_child(side)) {
        if (auto alternative{furthest_path(range, side, path_factory, path_factory.extension(current, side))}) {
            return alternative;
        }
    }
    if (bst_beyond(range, tip->key(), back)) {
        return std::nullopt;
    }
    return current;
}

} // namespace bst_detail

/**
 * @brief Sums the aggregate over the entries of `root` whose keys lie in `range`.
 *
 * Computed as the whole-tree total minus what lies beyond each bound, so only
 * one path per bounded side is visited.
 *
 * Time complexity: O(height)
 */
template<BstNodeType N, typename A, typename T, typename Compare>
inline std::uint64_t bst_total_in_range(const A& aggregate, const GeneralRange<T, Compare>& range,
                                        const BstNodePtr<N>& root) {
    if (root == nullptr || range.is_empty()) {
        return 0;
    }
    auto total{aggregate.tree_value(root)};
    if (range.has_lower_bound()) {
        total -= bst_detail::total_beyond_range_to_side(aggregate, range, BstSide::LEFT, root);
    }
    if (range.has_upper_bound()) {
        total -= bst_detail::total_beyond_range_to_side(aggregate, range, BstSide::RIGHT, root);
    }
    return total;
}

/**
 * @brief Returns `root` without the entries whose keys lie in `range`.
 *
 * The surviving left and right parts are rebalanced and joined with `policy`,
 * which must cope with arbitrarily unbalanced inputs.
 *
 * Time complexity: O(height) node allocations plus the policy's work
 */
template<BstNodeType N, typename T, typename Compare, typename P, typename F>
inline BstNodePtr<N> bst_minus_range(const GeneralRange<T, Compare>& range, const P& policy, const F& factory,
                                     const BstNodePtr<N>& root) {
    BstNodePtr<N> below{};
    BstNodePtr<N> above{};
    if (range.has_lower_bound()) {
        below = bst_detail::sub_tree_beyond_range_to_side(range, policy, factory, BstSide::LEFT, root);
    }
    if (range.has_upper_bound()) {
        above = bst_detail::sub_tree_beyond_range_to_side(range, policy, factory, BstSide::RIGHT, root);
    }
    return policy.combine(factory, std::move(below), std::move(above));
}

/**
 * @brief Returns the path to the in-range entry furthest toward `side`, or nothing
 * if no entry of `root` lies in `range`.
 *
 * `side == LEFT` yields the smallest in-range entry, the start of an ascending
 * traversal; `side == RIGHT` yields the largest.
 */
template<BstNodeType N, typename T, typename Compare, typename PF>
inline std::optional<typename PF::path_type> bst_furthest_path(const GeneralRange<T, Compare>& range, BstSide side,
                                                               const PF& path_factory, const BstNodePtr<N>& root) {
    if (root == nullptr) {
        return std::nullopt;
    }
    return bst_detail::furthest_path(range, side, path_factory, path_factory.initial_path(root));
}

#endif // BSTRANGEOPS_HPP
