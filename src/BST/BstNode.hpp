/**
 * @brief Immutable binary search tree node base.
 *
 * Nodes own their children through std::shared_ptr<const N>. A node is never
 * modified after construction; every edit allocates fresh nodes along the path
 * from the edited position to the root and reuses all other subtrees:
 *
 *        d               d'          <- new
 *       / \             / \
 *      b   f    ==>    b'  f         <- f shared by both versions
 *     /               / \
 *    a               a   c           <- a shared, c new
 */

#ifndef BSTNODE_HPP
#define BSTNODE_HPP

#include <concepts>
#include <cstdint>
#include <memory>   // std::shared_ptr
#include <utility>  // std::move

#include "BstCommon.hpp"

template<typename N>
using BstNodePtr = std::shared_ptr<const N>;

/**
 * @brief CRTP base holding the key and the two child links of a node of type N.
 */
template<typename K, typename N>
class BstNode {
public:
    using key_type = K;
    using node_ptr = BstNodePtr<N>;

private:
    K key_;
    node_ptr left_;
    node_ptr right_;

protected:
    inline BstNode(K key, node_ptr left, node_ptr right)
        : key_{std::move(key)}
        , left_{std::move(left)}
        , right_{std::move(right)} {}

public:
    BstNode(const BstNode&) = delete;
    BstNode& operator=(const BstNode&) = delete;

    inline const K& key() const noexcept { return key_; }

    inline const node_ptr& child(BstSide side) const noexcept {
        return side == BstSide::LEFT ? left_ : right_;
    }

    inline bool has_child(BstSide side) const noexcept {
        return child(side) != nullptr;
    }
};

/**
 * @brief A node type usable by the BST engine.
 */
template<typename N>
concept BstNodeType = requires(const N& n, BstSide side) {
    typename N::key_type;
    { n.key() } -> std::convertible_to<const typename N::key_type&>;
    { n.child(side) } -> std::convertible_to<const BstNodePtr<N>&>;
    { n.has_child(side) } -> std::convertible_to<bool>;
};

/**
 * @brief Creates a node with the payload of `source` and the given children,
 * recomputing all derived fields.
 */
template<typename F, typename N>
concept BstNodeFactoryFor = BstNodeType<N> && requires(const F& f, const N& source, BstNodePtr<N> child) {
    { f.create_node(source, child, child) } -> std::convertible_to<BstNodePtr<N>>;
};

/**
 * @brief A subtree aggregate: a per-entry value summed over subtrees.
 */
template<typename A, typename N>
concept BstAggregateFor = BstNodeType<N> && requires(const A& a, const N& entry, const BstNodePtr<N>& tree) {
    { a.entry_value(entry) } -> std::convertible_to<std::uint64_t>;
    { a.tree_value(tree) } -> std::convertible_to<std::uint64_t>;
};

template<BstNodeType N, BstNodeFactoryFor<N> F>
inline BstNodePtr<N> bst_create_leaf(const F& factory, const N& source) {
    return factory.create_node(source, nullptr, nullptr);
}

#endif // BSTNODE_HPP
