/**
 * @brief Weight-balanced rebalancing policies.
 *
 * Balance is measured by an aggregate over each subtree (for the multiset, the
 * number of distinct entries). A node is out of balance when one child's
 * weight is at least SINGLE_ROTATE_RATIO times the other's; it is repaired by a
 * single rotation, or a double rotation when the inner grandchild is heavy:
 *
 *      s                 r                 s                  rl
 *     / \               / \               / \               /    \
 *    L   r     ==>     s   rr            L   r     ==>     s      r
 *       / \           / \                   / \           / \    / \
 *      rl  rr        L   rl               rl   rr        L  a   b  rr
 *                                        /  \
 *    (single, rl light)                 a    b      (double, rl heavy)
 *
 * reference: S. Adams, "Functional Pearls: Efficient sets - a balancing act", JFP 3(4), 1993
 */

#ifndef BSTBALANCEPOLICIES_HPP
#define BSTBALANCEPOLICIES_HPP

#include <cassert>
#include <cstdint>
#include <utility>  // std::move

#include "BstCommon.hpp"
#include "BstNode.hpp"
#include "BstOperations.hpp"

inline constexpr std::uint64_t SINGLE_ROTATE_RATIO = 4;
inline constexpr std::uint64_t SECOND_ROTATE_RATIO = 2;

/**
 * @brief Builds nodes as requested without ever restructuring.
 */
template<BstNodeType N, BstAggregateFor<N> A>
class BstNoRebalancePolicy {
    A count_aggregate_;

public:
    inline explicit BstNoRebalancePolicy(A count_aggregate = A{}) : count_aggregate_{std::move(count_aggregate)} {}

    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> balance(const F& factory, const N& source, BstNodePtr<N> left, BstNodePtr<N> right) const {
        return factory.create_node(source, std::move(left), std::move(right));
    }

    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> combine(const F& factory, BstNodePtr<N> left, BstNodePtr<N> right) const {
        if (left == nullptr) {
            return right;
        }
        if (right == nullptr) {
            return left;
        }
        if (count_aggregate_.tree_value(left) > count_aggregate_.tree_value(right)) {
            return factory.create_node(*left, left->child(BstSide::LEFT),
                                       combine(factory, left->child(BstSide::RIGHT), std::move(right)));
        }
        return factory.create_node(*right, combine(factory, std::move(left), right->child(BstSide::LEFT)),
                                   right->child(BstSide::RIGHT));
    }
};

/**
 * @brief Repairs a subtree after a single insertion or removal below it.
 *
 * Assumes `left` and `right` are each balanced and that their weights differ by
 * at most one insertion or removal from a balanced configuration.
 */
template<BstNodeType N, BstAggregateFor<N> A>
class BstSingleRebalancePolicy {
    A count_aggregate_;

    template<typename F>
    inline BstNodePtr<N> single_left(const F& factory, const N& source, BstNodePtr<N> left,
                                     const BstNodePtr<N>& right) const {
        assert(right != nullptr);
        return factory.create_node(*right,
                                   factory.create_node(source, std::move(left), right->child(BstSide::LEFT)),
                                   right->child(BstSide::RIGHT));
    }

    template<typename F>
    inline BstNodePtr<N> single_right(const F& factory, const N& source, const BstNodePtr<N>& left,
                                      BstNodePtr<N> right) const {
        assert(left != nullptr);
        return factory.create_node(*left, left->child(BstSide::LEFT),
                                   factory.create_node(source, left->child(BstSide::RIGHT), std::move(right)));
    }

    template<typename F>
    inline BstNodePtr<N> rotate_left(const F& factory, const N& source, BstNodePtr<N> left,
                                     BstNodePtr<N> right) const {
        assert(right != nullptr);
        const auto& rl{right->child(BstSide::LEFT)};
        const auto& rr{right->child(BstSide::RIGHT)};
        if (count_aggregate_.tree_value(rl) >= SECOND_ROTATE_RATIO * count_aggregate_.tree_value(rr)) {
            right = single_right(factory, *right, rl, rr);
        }
        return single_left(factory, source, std::move(left), right);
    }

    template<typename F>
    inline BstNodePtr<N> rotate_right(const F& factory, const N& source, BstNodePtr<N> left,
                                      BstNodePtr<N> right) const {
        assert(left != nullptr);
        const auto& lr{left->child(BstSide::RIGHT)};
        const auto& ll{left->child(BstSide::LEFT)};
        if (count_aggregate_.tree_value(lr) >= SECOND_ROTATE_RATIO * count_aggregate_.tree_value(ll)) {
            left = single_left(factory, *left, ll, lr);
        }
        return single_right(factory, source, left, std::move(right));
    }

public:
    inline explicit BstSingleRebalancePolicy(A count_aggregate = A{}) : count_aggregate_{std::move(count_aggregate)} {}

    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> balance(const F& factory, const N& source, BstNodePtr<N> left, BstNodePtr<N> right) const {
        const auto count_left{count_aggregate_.tree_value(left)};
        const auto count_right{count_aggregate_.tree_value(right)};
        if (count_left + count_right > 1) {
            if (count_right >= SINGLE_ROTATE_RATIO * count_left) {
                return rotate_left(factory, source, std::move(left), std::move(right));
            } else if (count_left >= SINGLE_ROTATE_RATIO * count_right) {
                return rotate_right(factory, source, std::move(left), std::move(right));
            }
        }
        return factory.create_node(source, std::move(left), std::move(right));
    }

    /**
     * @brief Joins two balanced trees by promoting the extreme entry of the heavier one.
     */
    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> combine(const F& factory, BstNodePtr<N> left, BstNodePtr<N> right) const {
        if (left == nullptr) {
            return right;
        }
        if (right == nullptr) {
            return left;
        }
        if (count_aggregate_.tree_value(left) > count_aggregate_.tree_value(right)) {
            const auto extracted{bst_extract_max(left, factory, *this)};
            return balance(factory, *extracted.original_target(), extracted.changed_root(), std::move(right));
        }
        const auto extracted{bst_extract_min(right, factory, *this)};
        return balance(factory, *extracted.original_target(), std::move(left), extracted.changed_root());
    }
};

/**
 * @brief Rebalances subtrees of arbitrary relative weight, for bulk edits such as range removal.
 */
template<BstNodeType N, BstAggregateFor<N> A>
class BstFullRebalancePolicy {
    A count_aggregate_;
    BstSingleRebalancePolicy<N, A> single_;

public:
    inline explicit BstFullRebalancePolicy(A count_aggregate = A{})
        : count_aggregate_{count_aggregate}
        , single_{std::move(count_aggregate)} {}

    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> balance(const F& factory, const N& source, BstNodePtr<N> left, BstNodePtr<N> right) const {
        if (left == nullptr) {
            return bst_insert_min(right, source, factory, single_);
        }
        if (right == nullptr) {
            return bst_insert_max(left, source, factory, single_);
        }
        const auto count_left{count_aggregate_.tree_value(left)};
        const auto count_right{count_aggregate_.tree_value(right)};
        if (SINGLE_ROTATE_RATIO * count_left <= count_right) {
            auto result_left{balance(factory, source, std::move(left), right->child(BstSide::LEFT))};
            return single_.balance(factory, *right, std::move(result_left), right->child(BstSide::RIGHT));
        } else if (SINGLE_ROTATE_RATIO * count_right <= count_left) {
            auto result_right{balance(factory, source, left->child(BstSide::RIGHT), std::move(right))};
            return single_.balance(factory, *left, left->child(BstSide::LEFT), std::move(result_right));
        }
        return factory.create_node(source, std::move(left), std::move(right));
    }

    template<BstNodeFactoryFor<N> F>
    inline BstNodePtr<N> combine(const F& factory, BstNodePtr<N> left, BstNodePtr<N> right) const {
        if (left == nullptr) {
            return right;
        }
        if (right == nullptr) {
            return left;
        }
        const auto count_left{count_aggregate_.tree_value(left)};
        const auto count_right{count_aggregate_.tree_value(right)};
        if (SINGLE_ROTATE_RATIO * count_left <= count_right) {
            auto result_left{combine(factory, std::move(left), right->child(BstSide::LEFT))};
            return single_.balance(factory, *right, std::move(result_left), right->child(BstSide::RIGHT));
        } else if (SINGLE_ROTATE_RATIO * count_right <= count_left) {
            auto result_right{combine(factory, left->child(BstSide::RIGHT), std::move(right))};
            return single_.balance(factory, *left, left->child(BstSide::LEFT), std::move(result_right));
        }
        return single_.combine(factory, std::move(left), std::move(right));
    }
};

#endif // BSTBALANCEPOLICIES_HPP
