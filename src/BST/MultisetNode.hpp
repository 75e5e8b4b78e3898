#ifndef MULTISETNODE_HPP
#define MULTISETNODE_HPP

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>   // std::allocate_shared
#include <utility>  // std::move

#include "allocator/tracking_allocator.hpp"
#include "BstNode.hpp"

/**
 * @brief Node of a sorted multiset: a key with its occurrence count, plus the
 * total count and number of distinct keys of the subtree it roots.
 */
template<typename K>
class MultisetNode : public BstNode<K, MultisetNode<K>> {
    using base_t = BstNode<K, MultisetNode<K>>;

    std::uint64_t size_;
    std::size_t distinct_;
    int count_;

public:
    using typename base_t::node_ptr;

    inline MultisetNode(K key, int count, node_ptr left, node_ptr right)
        : base_t{std::move(key), std::move(left), std::move(right)}
        , size_{static_cast<std::uint64_t>(count) + size_or_zero(this->child(BstSide::LEFT))
                + size_or_zero(this->child(BstSide::RIGHT))}
        , distinct_{1 + distinct_or_zero(this->child(BstSide::LEFT)) + distinct_or_zero(this->child(BstSide::RIGHT))}
        , count_{count} {
        assert(count > 0 && "multiset nodes hold at least one occurrence");
    }

    inline int count() const noexcept { return count_; }
    inline std::uint64_t size() const noexcept { return size_; }
    inline std::size_t distinct() const noexcept { return distinct_; }

    static inline std::uint64_t size_or_zero(const node_ptr& node) noexcept {
        return node == nullptr ? 0 : node->size_;
    }

    static inline std::size_t distinct_or_zero(const node_ptr& node) noexcept {
        return node == nullptr ? 0 : node->distinct_;
    }

    static inline int count_or_zero(const MultisetNode* node) noexcept {
        return node == nullptr ? 0 : node->count_;
    }
};

/**
 * @brief Total number of occurrences.
 */
template<typename K>
struct MultisetSizeAggregate {
    inline std::uint64_t entry_value(const MultisetNode<K>& entry) const noexcept {
        return static_cast<std::uint64_t>(entry.count());
    }
    inline std::uint64_t tree_value(const BstNodePtr<MultisetNode<K>>& tree) const noexcept {
        return MultisetNode<K>::size_or_zero(tree);
    }
};

/**
 * @brief Number of distinct keys. Also the weight used for balancing.
 */
template<typename K>
struct MultisetDistinctAggregate {
    inline std::uint64_t entry_value(const MultisetNode<K>&) const noexcept {
        return 1;
    }
    inline std::uint64_t tree_value(const BstNodePtr<MultisetNode<K>>& tree) const noexcept {
        return MultisetNode<K>::distinct_or_zero(tree);
    }
};

/**
 * @brief Allocates multiset nodes through a tracking allocator.
 */
template<typename K>
class MultisetNodeFactory {
    using node_t = MultisetNode<K>;
    using allocator_t = tracking_allocator<node_t>;

    allocator_t allocator_;

public:
    inline explicit MultisetNodeFactory(typename allocator_t::counter_type& bytes_allocated) noexcept
        : allocator_{bytes_allocated} {}

    inline BstNodePtr<node_t> create_node(const node_t& source, BstNodePtr<node_t> left,
                                          BstNodePtr<node_t> right) const {
        return std::allocate_shared<node_t>(allocator_, source.key(), source.count(), std::move(left),
                                            std::move(right));
    }

    inline BstNodePtr<node_t> create_entry(const K& key, int count) const {
        return std::allocate_shared<node_t>(allocator_, key, count, nullptr, nullptr);
    }
};

#endif // MULTISETNODE_HPP
