#ifndef BSTMUTATION_HPP
#define BSTMUTATION_HPP

#include <cassert>
#include <cstdint>
#include <utility>  // std::move, std::unreachable

#include "BstCommon.hpp"
#include "BstNode.hpp"

enum struct BstModificationType : std::uint8_t {
    // No change: the tree is returned as is.
    IDENTITY           = 0,
    // Payload changed but the tree shape is unchanged; ancestors are rebuilt, not rebalanced.
    REBUILDING_CHANGE  = 1,
    // An entry was inserted or removed; ancestors may need rebalancing.
    REBALANCING_CHANGE = 2,
};

/**
 * @brief Outcome of modifying the entry at a single key, as reported by a modifier.
 */
template<typename N>
class BstModificationResult {
    BstNodePtr<N> original_target_;
    BstNodePtr<N> changed_target_;
    BstModificationType type_;

    inline BstModificationResult(BstNodePtr<N> original, BstNodePtr<N> changed, BstModificationType type)
        : original_target_{std::move(original)}
        , changed_target_{std::move(changed)}
        , type_{type} {}

public:
    static inline BstModificationResult identity(BstNodePtr<N> target) {
        auto copy{target};
        return BstModificationResult{std::move(copy), std::move(target), BstModificationType::IDENTITY};
    }

    static inline BstModificationResult rebuilding_change(BstNodePtr<N> original, BstNodePtr<N> changed) {
        return BstModificationResult{std::move(original), std::move(changed), BstModificationType::REBUILDING_CHANGE};
    }

    static inline BstModificationResult rebalancing_change(BstNodePtr<N> original, BstNodePtr<N> changed) {
        return BstModificationResult{std::move(original), std::move(changed), BstModificationType::REBALANCING_CHANGE};
    }

    inline const BstNodePtr<N>& original_target() const noexcept { return original_target_; }
    inline const BstNodePtr<N>& changed_target() const noexcept { return changed_target_; }
    inline BstModificationType type() const noexcept { return type_; }
};

/**
 * @brief Result of a mutation at one key: the subtree root and the target entry,
 * before and after.
 *
 * Results are produced at the position of the key and lifted one level at a
 * time until they describe the whole tree.
 */
template<typename K, typename N>
class BstMutationResult {
    K target_key_;
    BstNodePtr<N> original_root_;
    BstNodePtr<N> changed_root_;
    BstModificationResult<N> modification_;

    inline BstMutationResult(K target_key, BstNodePtr<N> original_root, BstNodePtr<N> changed_root,
                             BstModificationResult<N> modification)
        : target_key_{std::move(target_key)}
        , original_root_{std::move(original_root)}
        , changed_root_{std::move(changed_root)}
        , modification_{std::move(modification)} {
        assert((original_target() == nullptr || original_root_ != nullptr) && "original target without original root");
        assert((changed_target() == nullptr || changed_root_ != nullptr) && "changed target without changed root");
        assert((type() != BstModificationType::IDENTITY || original_root_ == changed_root_) && "identity changed the root");
    }

public:
    static inline BstMutationResult mutation_result(K target_key, BstNodePtr<N> original_root,
                                                    BstNodePtr<N> changed_root,
                                                    BstModificationResult<N> modification) {
        return BstMutationResult{std::move(target_key), std::move(original_root), std::move(changed_root),
                                 std::move(modification)};
    }

    inline const K& target_key() const noexcept { return target_key_; }
    inline const BstNodePtr<N>& original_root() const noexcept { return original_root_; }
    inline const BstNodePtr<N>& changed_root() const noexcept { return changed_root_; }
    inline const BstNodePtr<N>& original_target() const noexcept { return modification_.original_target(); }
    inline const BstNodePtr<N>& changed_target() const noexcept { return modification_.changed_target(); }
    inline BstModificationType type() const noexcept { return modification_.type(); }

    /**
     * @brief Propagates this result to the parent whose `side` child was this result's original root.
     *
     * The parent is rebuilt around the changed child for a rebuilding change,
     * and rebalanced for a rebalancing change. Identity results only move up.
     */
    template<typename F, typename P>
    inline BstMutationResult lift(const BstNodePtr<N>& lift_original_root, BstSide side,
                                  const F& node_factory, const P& balance_policy) const {
        assert(lift_original_root != nullptr);
        assert(lift_original_root->child(side) == original_root_ && "lifting into the wrong parent");
        switch (type()) {
            case BstModificationType::IDENTITY:
                return BstMutationResult{target_key_, lift_original_root, lift_original_root, modification_};
            case BstModificationType::REBUILDING_CHANGE:
            case BstModificationType::REBALANCING_CHANGE: {
                auto left{lift_original_root->child(BstSide::LEFT)};
                auto right{lift_original_root->child(BstSide::RIGHT)};
                (side == BstSide::LEFT ? left : right) = changed_root_;
                auto changed{type() == BstModificationType::REBUILDING_CHANGE
                    ? node_factory.create_node(*lift_original_root, std::move(left), std::move(right))
                    : balance_policy.balance(node_factory, *lift_original_root, std::move(left), std::move(right))};
                return BstMutationResult{target_key_, lift_original_root, std::move(changed), modification_};
            }
        }
        std::unreachable();
    }
};

/**
 * @brief Everything needed to carry out a mutation: what to do at the key, how
 * to rebalance, and how to build nodes. Holds references only.
 */
template<typename M, typename P, typename F>
struct BstMutationRule {
    const M& modifier;
    const P& balance_policy;
    const F& node_factory;
};

template<typename M, typename P, typename F>
inline BstMutationRule<M, P, F> make_mutation_rule(const M& modifier, const P& balance_policy, const F& node_factory) {
    return BstMutationRule<M, P, F>{modifier, balance_policy, node_factory};
}

#endif // BSTMUTATION_HPP
