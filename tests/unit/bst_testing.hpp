#ifndef BST_TESTING_HPP
#define BST_TESTING_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <set>
#include <utility>
#include <vector>

#include "BST/BstBalancePolicies.hpp"
#include "BST/BstMutation.hpp"
#include "BST/BstNode.hpp"
#include "BST/BstOperations.hpp"
#include "BST/MultisetNode.hpp"

using IntNode = MultisetNode<int>;
using IntNodePtr = BstNodePtr<IntNode>;
using IntFactory = MultisetNodeFactory<int>;
using DistinctAggregate = MultisetDistinctAggregate<int>;
using SizeAggregate = MultisetSizeAggregate<int>;
using SinglePolicy = BstSingleRebalancePolicy<IntNode, DistinctAggregate>;
using FullPolicy = BstFullRebalancePolicy<IntNode, DistinctAggregate>;
using NoRebalancePolicy = BstNoRebalancePolicy<IntNode, DistinctAggregate>;
using IntEntries = std::vector<std::pair<int, int>>;

// Sets the count at a key; 0 removes the key.
struct SetCountTo {
    const IntFactory& factory;
    int count;

    BstModificationResult<IntNode> modify(const int& key, const IntNodePtr& original) const {
        const int old_count = IntNode::count_or_zero(original.get());
        if (old_count == count) {
            return BstModificationResult<IntNode>::identity(original);
        }
        if (count == 0) {
            return BstModificationResult<IntNode>::rebalancing_change(original, nullptr);
        }
        auto changed = factory.create_entry(key, count);
        if (old_count == 0) {
            return BstModificationResult<IntNode>::rebalancing_change(nullptr, changed);
        }
        return BstModificationResult<IntNode>::rebuilding_change(original, changed);
    }
};

template<typename P>
inline IntNodePtr set_count(const IntNodePtr& root, int key, int count, const IntFactory& factory, const P& policy) {
    const SetCountTo modifier{factory, count};
    return bst_mutate(std::less<int>{}, make_mutation_rule(modifier, policy, factory), root, key).changed_root();
}

template<typename P>
inline IntNodePtr insert_all(IntNodePtr root, const std::vector<int>& keys, const IntFactory& factory, const P& policy) {
    for (int key : keys) {
        root = set_count(root, key, 1, factory, policy);
    }
    return root;
}

inline void in_order(const IntNodePtr& root, IntEntries& out) {
    if (root == nullptr) {
        return;
    }
    in_order(root->child(BstSide::LEFT), out);
    out.emplace_back(root->key(), root->count());
    in_order(root->child(BstSide::RIGHT), out);
}

inline IntEntries in_order(const IntNodePtr& root) {
    IntEntries out;
    in_order(root, out);
    return out;
}

inline std::vector<int> keys_of(const IntNodePtr& root) {
    std::vector<int> keys;
    for (const auto& [key, count] : in_order(root)) {
        keys.push_back(key);
    }
    return keys;
}

inline std::size_t height(const IntNodePtr& root) {
    if (root == nullptr) {
        return 0;
    }
    return 1 + std::max(height(root->child(BstSide::LEFT)), height(root->child(BstSide::RIGHT)));
}

inline void collect_nodes(const IntNodePtr& root, std::set<const IntNode*>& out) {
    if (root == nullptr) {
        return;
    }
    out.insert(root.get());
    collect_nodes(root->child(BstSide::LEFT), out);
    collect_nodes(root->child(BstSide::RIGHT), out);
}

// Keys strictly inside (lo, hi), and every size/distinct field equal to the sum over the subtree.
inline bool subtree_consistent(const IntNodePtr& root, std::int64_t lo, std::int64_t hi) {
    if (root == nullptr) {
        return true;
    }
    const auto key = static_cast<std::int64_t>(root->key());
    if (key <= lo || key >= hi || root->count() <= 0) {
        return false;
    }
    const auto& left = root->child(BstSide::LEFT);
    const auto& right = root->child(BstSide::RIGHT);
    if (root->size() != IntNode::size_or_zero(left) + IntNode::size_or_zero(right) +
                            static_cast<std::uint64_t>(root->count())) {
        return false;
    }
    if (root->distinct() != IntNode::distinct_or_zero(left) + IntNode::distinct_or_zero(right) + 1) {
        return false;
    }
    return subtree_consistent(left, lo, key) && subtree_consistent(right, key, hi);
}

inline bool tree_consistent(const IntNodePtr& root) {
    return subtree_consistent(root, std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max());
}

// Generous logarithmic bound for a weight-balanced tree of n entries.
inline bool height_is_logarithmic(const IntNodePtr& root) {
    const auto n = IntNode::distinct_or_zero(root);
    return height(root) <= 4 * static_cast<std::size_t>(std::bit_width(n)) + 1;
}

#endif // BST_TESTING_HPP
