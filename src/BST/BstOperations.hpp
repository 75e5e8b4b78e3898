/**
 * @brief Point operations on immutable binary search trees.
 *
 * All operations are pure: they take a root, return new roots, and never touch
 * the nodes they were given. Recursion depth is bounded by the tree height.
 */

#ifndef BSTOPERATIONS_HPP
#define BSTOPERATIONS_HPP

#include <cassert>
#include <utility>  // std::move, std::unreachable

#include "BstCommon.hpp"
#include "BstMutation.hpp"
#include "BstNode.hpp"

/**
 * @brief Decides what happens to the entry at a key.
 *
 * `modify(key, original)` receives the node currently holding `key` (or null)
 * and returns the new entry. The new entry must have the same key.
 */
template<typename M, typename N>
concept BstModifierFor = BstNodeType<N> && requires(const M& m, const typename N::key_type& key, const BstNodePtr<N>& original) {
    { m.modify(key, original) } -> std::convertible_to<BstModificationResult<N>>;
};

/**
 * @brief Restructures a subtree so that it stays balanced.
 *
 * `balance(factory, source, left, right)` returns a tree holding the entry of
 * `source` together with all entries of `left` and `right`, in order.
 * `combine(factory, left, right)` joins two trees whose keys are ordered.
 */
template<typename P, typename N, typename F>
concept BstBalancePolicyFor = BstNodeFactoryFor<F, N> && requires(const P& p, const F& f, const N& source, BstNodePtr<N> child) {
    { p.balance(f, source, child, child) } -> std::convertible_to<BstNodePtr<N>>;
    { p.combine(f, child, child) } -> std::convertible_to<BstNodePtr<N>>;
};

/**
 * @brief Returns the node with the given key, or null.
 *
 * Time complexity: O(height)
 */
template<typename K, BstNodeType N, typename Compare>
inline const N* bst_seek(const Compare& comparator, const BstNodePtr<N>& tree, const K& key) {
    const N* node{tree.get()};
    while (node != nullptr) {
        if (comparator(key, node->key())) {
            node = node->child(BstSide::LEFT).get();
        } else if (comparator(node->key(), key)) {
            node = node->child(BstSide::RIGHT).get();
        } else {
            return node;
        }
    }
    return nullptr;
}

namespace bst_detail {

template<typename N, typename Rule>
inline BstMutationResult<typename N::key_type, N> modify(const BstNodePtr<N>& tree, const typename N::key_type& key,
                                                         const Rule& rule) {
    const auto& factory{rule.node_factory};
    const auto& policy{rule.balance_policy};

    BstModificationResult<N> modification{rule.modifier.modify(key, tree)};
    assert((modification.original_target() == tree) && "modifier must report the entry it was given");

    BstNodePtr<N> left{};
    BstNodePtr<N> right{};
    if (tree != nullptr) {
        left = tree->child(BstSide::LEFT);
        right = tree->child(BstSide::RIGHT);
    }

    BstNodePtr<N> changed_root{};
    switch (modification.type()) {
        case BstModificationType::IDENTITY:
            changed_root = tree;
            break;
        case BstModificationType::REBUILDING_CHANGE:
            if (const auto& target{modification.changed_target()}; target != nullptr) {
                changed_root = factory.create_node(*target, std::move(left), std::move(right));
            } else {
                // removal needs rebalancing and must be reported as such
                assert(tree == nullptr && "rebuilding change removed an entry");
            }
            break;
        case BstModificationType::REBALANCING_CHANGE:
            if (const auto& target{modification.changed_target()}; target != nullptr) {
                changed_root = policy.balance(factory, *target, std::move(left), std::move(right));
            } else if (tree != nullptr) {
                changed_root = policy.combine(factory, std::move(left), std::move(right));
            }
            break;
    }
    return BstMutationResult<typename N::key_type, N>::mutation_result(key, tree, std::move(changed_root),
                                                                   std::move(modification));
}

} // namespace bst_detail

/**
 * @brief Applies the rule's modifier at `key` and rebuilds the path up to the root.
 *
 * Only nodes on the path from the root to the key are reallocated; all other
 * subtrees are shared with the original tree.
 *
 * Time complexity: O(height) node allocations plus the balance policy's work
 */
template<BstNodeType N, typename Compare, typename Rule>
inline BstMutationResult<typename N::key_type, N> bst_mutate(const Compare& comparator, const Rule& rule,
                                                             const BstNodePtr<N>& tree,
                                                             const typename N::key_type& key) {
    if (tree == nullptr) {
        return bst_detail::modify<N>(tree, key, rule);
    }
    BstSide side;
    if (comparator(key, tree->key())) {
        side = BstSide::LEFT;
    } else if (comparator(tree->key(), key)) {
        side = BstSide::RIGHT;
    } else {
        return bst_detail::modify<N>(tree, key, rule);
    }
    const auto result{bst_mutate(comparator, rule, tree->child(side), key)};
    return result.lift(tree, side, rule.node_factory, rule.balance_policy);
}

/**
 * @brief Removes the smallest entry of a non-empty tree.
 *
 * The extracted node is the result's original target; the remaining tree is its changed root.
 */
template<BstNodeType N, typename F, typename P>
inline BstMutationResult<typename N::key_type, N> bst_extract_min(const BstNodePtr<N>& root, const F& factory,
                                                                  const P& policy) {
    assert(root != nullptr);
    if (root->has_child(BstSide::LEFT)) {
        return bst_extract_min(root->child(BstSide::LEFT), factory, policy)
            .lift(root, BstSide::LEFT, factory, policy);
    }
    return BstMutationResult<typename N::key_type, N>::mutation_result(
        root->key(), root, root->child(BstSide::RIGHT),
        BstModificationResult<N>::rebalancing_change(root, nullptr));
}

/**
 * @brief Removes the largest entry of a non-empty tree.
 */
template<BstNodeType N, typename F, typename P>
inline BstMutationResult<typename N::key_type, N> bst_extract_max(const BstNodePtr<N>& root, const F& factory,
                                                                  const P& policy) {
    assert(root != nullptr);
    if (root->has_child(BstSide::RIGHT)) {
        return bst_extract_max(root->child(BstSide::RIGHT), factory, policy)
            .lift(root, BstSide::RIGHT, factory, policy);
    }
    return BstMutationResult<typename N::key_type, N>::mutation_result(
        root->key(), root, root->child(BstSide::LEFT),
        BstModificationResult<N>::rebalancing_change(root, nullptr));
}

/**
 * @brief Adds `new_min`, whose key is below every key in `root`, as the leftmost entry.
 */
template<BstNodeType N, typename F, typename P>
inline BstNodePtr<N> bst_insert_min(const BstNodePtr<N>& root, const N& new_min, const F& factory,
                                    const P& policy) {
    if (root == nullptr) {
        return bst_create_leaf(factory, new_min);
    }
    return policy.balance(factory, *root, bst_insert_min(root->child(BstSide::LEFT), new_min, factory, policy),
                          root->child(BstSide::RIGHT));
}

/**
 * @brief Adds `new_max`, whose key is above every key in `root`, as the rightmost entry.
 */
template<BstNodeType N, typename F, typename P>
inline BstNodePtr<N> bst_insert_max(const BstNodePtr<N>& root, const N& new_max, const F& factory,
                                    const P& policy) {
    if (root == nullptr) {
        return bst_create_leaf(factory, new_max);
    }
    return policy.balance(factory, *root, root->child(BstSide::LEFT),
                          bst_insert_max(root->child(BstSide::RIGHT), new_max, factory, policy));
}

#endif // BSTOPERATIONS_HPP
