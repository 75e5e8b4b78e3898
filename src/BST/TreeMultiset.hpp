/**
 * @brief A sorted multiset over an immutable, weight-balanced binary search tree.
 *
 * The current tree is published through a single atomic root. Every mutation
 * loads the root, builds the changed path off to the side, and publishes it
 * with one compare-and-set. If another thread published first, the mutation
 * throws ConcurrentModificationError and the multiset is left untouched;
 * retrying is up to the caller.
 *
 * Views (head_multiset, tail_multiset, sub_multiset, and plain copies) share
 * the root with the multiset they came from and restrict it to a range, so a
 * write through any view is visible through all of them.
 *
 * Iteration walks the tree version that was current when the iterator was
 * created and yields Entry snapshots; later mutations do not affect it.
 */

#ifndef TREEMULTISET_HPP
#define TREEMULTISET_HPP

#include <atomic>
#include <cassert>
#include <climits>     // INT_MAX
#include <cstddef>
#include <cstdint>
#include <functional>  // std::less
#include <iterator>
#include <memory>      // std::shared_ptr, std::make_shared
#include <optional>
#include <stdexcept>   // std::invalid_argument
#include <string>
#include <utility>     // std::move
#include <variant>
#include <vector>

#include "allocator/tracking_allocator.hpp"
#include "BstBalancePolicies.hpp"
#include "BstCommon.hpp"
#include "BstInOrderPath.hpp"
#include "BstMutation.hpp"
#include "BstNode.hpp"
#include "BstOperations.hpp"
#include "BstRangeOps.hpp"
#include "GeneralRange.hpp"
#include "MultisetNode.hpp"

template<typename K, typename Compare = std::less<K>>
class TreeMultiset {
public:
    using key_type = K;
    using key_compare = Compare;
    using node_type = MultisetNode<K>;
    using range_type = GeneralRange<K, Compare>;

    /**
     * @brief An element together with its number of occurrences.
     */
    struct Entry {
        K element;
        int count;

        bool operator==(const Entry&) const = default;
    };

private:
    using node_ptr = BstNodePtr<node_type>;
    using factory_t = MultisetNodeFactory<K>;
    using single_policy_t = BstSingleRebalancePolicy<node_type, MultisetDistinctAggregate<K>>;
    using full_policy_t = BstFullRebalancePolicy<node_type, MultisetDistinctAggregate<K>>;
    using path_t = BstInOrderPath<node_type>;
    using result_t = BstMutationResult<K, node_type>;

    // Nodes hold an allocator bound to `allocated`, so it must be declared
    // before (and destroyed after) `root`.
    struct RootReference {
        typename tracking_allocator<node_type>::counter_type allocated{0};
        std::atomic<node_ptr> root{};
    };

    struct AddModifier {
        int occurrences;
    };
    struct RemoveModifier {
        int occurrences;
    };
    struct SetCountModifier {
        int count;
    };
    struct ConditionalSetCountModifier {
        int expected;
        int count;
    };
    using modifier_kind_t = std::variant<AddModifier, RemoveModifier, SetCountModifier, ConditionalSetCountModifier>;

    /**
     * @brief Maps the old count at a key to the new one and classifies the change.
     */
    class CountModifier {
        modifier_kind_t kind_;
        const factory_t& factory_;

        inline int new_count(int old_count) const {
            return std::visit(overload{
                [&](const AddModifier& m) {
                    if (static_cast<std::int64_t>(old_count) + m.occurrences > INT_MAX) {
                        throw std::invalid_argument("too many occurrences: " +
                                                    std::to_string(static_cast<std::int64_t>(old_count) + m.occurrences));
                    }
                    return old_count + m.occurrences;
                },
                [&](const RemoveModifier& m) {
                    return old_count > m.occurrences ? old_count - m.occurrences : 0;
                },
                [](const SetCountModifier& m) { return m.count; },
                [&](const ConditionalSetCountModifier& m) {
                    return old_count == m.expected ? m.count : old_count;
                },
            }, kind_);
        }

    public:
        inline CountModifier(modifier_kind_t kind, const factory_t& factory)
            : kind_{kind}, factory_{factory} {}

        inline BstModificationResult<node_type> modify(const K& key, const node_ptr& original) const {
            const auto old_count{node_type::count_or_zero(original.get())};
            const auto updated{new_count(old_count)};
            if (updated == old_count) {
                return BstModificationResult<node_type>::identity(original);
            }
            if (updated == 0) {
                return BstModificationResult<node_type>::rebalancing_change(original, nullptr);
            }
            auto changed{factory_.create_entry(key, updated)};
            if (old_count == 0) {
                return BstModificationResult<node_type>::rebalancing_change(nullptr, std::move(changed));
            }
            return BstModificationResult<node_type>::rebuilding_change(original, std::move(changed));
        }
    };

    std::shared_ptr<RootReference> root_reference_;
    range_type range_;

    inline TreeMultiset(std::shared_ptr<RootReference> root_reference, range_type range)
        : root_reference_{std::move(root_reference)}
        , range_{std::move(range)} {}

    inline node_ptr load_root() const {
        return root_reference_->root.load(std::memory_order_acquire);
    }

    inline void check_and_set(node_ptr expected, node_ptr changed) {
        if (!root_reference_->root.compare_exchange_strong(expected, std::move(changed),
                                                           std::memory_order_acq_rel,
                                                           std::memory_order_acquire)) {
            throw ConcurrentModificationError("multiset was modified concurrently");
        }
    }

    inline result_t mutate(const K& key, modifier_kind_t kind) {
        const factory_t factory{root_reference_->allocated};
        const single_policy_t policy{};
        const CountModifier modifier{kind, factory};
        const auto root{load_root()};
        auto result{bst_mutate(range_.comparator(), make_mutation_rule(modifier, policy, factory), root, key)};
        assert(result.original_root() == root);
        check_and_set(root, result.changed_root());
        return result;
    }

    inline void check_in_range(const K& key) const {
        if (!range_.contains(key)) {
            throw std::invalid_argument("element is outside the range of this multiset");
        }
    }

    static inline void check_non_negative(int n, const char* what) {
        if (n < 0) {
            throw std::invalid_argument(std::string{what} + " cannot be negative: " + std::to_string(n));
        }
    }

public:
    /**
     * @brief Forward iterator over Entry snapshots, in either direction.
     *
     * Holds the tree version it started from; a default-constructed iterator
     * is the end iterator.
     */
    class const_iterator {
        std::shared_ptr<RootReference> owner_;  // keeps the allocation counter alive for the path's nodes
        std::optional<path_t> path_;
        std::optional<range_type> range_;
        BstSide direction_{BstSide::RIGHT};
        std::optional<Entry> current_;

        inline void capture() {
            if (path_.has_value()) {
                const auto& tip{path_->tip()};
                current_ = Entry{tip->key(), tip->count()};
            } else {
                current_.reset();
            }
        }

        friend class TreeMultiset;

        inline const_iterator(std::shared_ptr<RootReference> owner, std::optional<path_t> path, range_type range,
                              BstSide direction)
            : owner_{std::move(owner)}
            , path_{std::move(path)}
            , range_{std::move(range)}
            , direction_{direction} {
            capture();
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const Entry*;
        using reference = const Entry&;

        const_iterator() = default;

        inline reference operator*() const {
            assert(current_.has_value() && "dereferencing the end iterator");
            return *current_;
        }

        inline pointer operator->() const { return &**this; }

        inline const_iterator& operator++() {
            assert(path_.has_value() && "advancing the end iterator");
            if (path_->has_next(direction_)) {
                path_->advance(direction_);
                if (bst_beyond(*range_, path_->tip()->key(), direction_)) {
                    path_.reset();
                }
            } else {
                path_.reset();
            }
            capture();
            return *this;
        }

        inline const_iterator operator++(int) {
            auto copy{*this};
            ++*this;
            return copy;
        }

        inline bool operator==(const const_iterator& other) const {
            if (!path_.has_value() || !other.path_.has_value()) {
                return path_.has_value() == other.path_.has_value();
            }
            return path_->tip() == other.path_->tip();
        }
    };

    using iterator = const_iterator;

private:
    static inline const_iterator iterate_from(const std::shared_ptr<RootReference>& root_reference,
                                              const range_type& range, BstSide start) {
        const auto root{root_reference->root.load(std::memory_order_acquire)};
        auto path{bst_furthest_path(range, start, BstInOrderPathFactory<node_type>{}, root)};
        return const_iterator{root_reference, std::move(path), range, other_side(start)};
    }

public:
    /**
     * @brief An iterable over the entries of a multiset in one direction.
     */
    class EntryView {
        std::shared_ptr<RootReference> root_reference_;
        range_type range_;
        BstSide start_;

    public:
        inline EntryView(std::shared_ptr<RootReference> root_reference, range_type range, BstSide start)
            : root_reference_{std::move(root_reference)}, range_{std::move(range)}, start_{start} {}

        inline const_iterator begin() const { return iterate_from(root_reference_, range_, start_); }
        inline const_iterator end() const { return const_iterator{}; }
    };

    /**
     * @brief Creates an empty multiset.
     */
    inline explicit TreeMultiset(Compare comparator = Compare{})
        : root_reference_{std::make_shared<RootReference>()}
        , range_{range_type::all(std::move(comparator))} {}

    /**
     * @brief Creates a multiset holding one occurrence of each element of [first, last).
     */
    template<std::input_iterator It, std::sentinel_for<It> S>
    inline TreeMultiset(It first, S last, Compare comparator = Compare{})
        : TreeMultiset{std::move(comparator)} {
        for (; first != last; ++first) {
            add(*first);
        }
    }

    inline const Compare& comparator() const noexcept { return range_.comparator(); }
    inline const range_type& range() const noexcept { return range_; }

    /**
     * @brief Number of occurrences of `key`; 0 if it is absent or outside this view.
     *
     * Time complexity: O(log n)
     */
    inline int count(const K& key) const {
        if (!range_.contains(key)) {
            return 0;
        }
        const auto root{load_root()};
        return node_type::count_or_zero(bst_seek(range_.comparator(), root, key));
    }

    inline bool contains(const K& key) const { return count(key) > 0; }

    /**
     * @brief Adds `occurrences` occurrences of `key`.
     * @return The count before the call
     * @throws std::invalid_argument if occurrences is negative, the key is outside
     *         this view, or the count would exceed INT_MAX
     * @throws ConcurrentModificationError if another thread changed the multiset meanwhile
     */
    inline int add(const K& key, int occurrences = 1) {
        check_non_negative(occurrences, "occurrences");
        if (occurrences == 0) {
            return count(key);
        }
        check_in_range(key);
        const auto result{mutate(key, AddModifier{occurrences})};
        return node_type::count_or_zero(result.original_target().get());
    }

    /**
     * @brief Removes up to `occurrences` occurrences of `key`.
     * @return The count before the call; 0 for a key outside this view
     * @throws std::invalid_argument if occurrences is negative
     * @throws ConcurrentModificationError if another thread changed the multiset meanwhile
     */
    inline int remove(const K& key, int occurrences = 1) {
        check_non_negative(occurrences, "occurrences");
        if (occurrences == 0) {
            return count(key);
        }
        if (!range_.contains(key)) {
            return 0;
        }
        const auto result{mutate(key, RemoveModifier{occurrences})};
        return node_type::count_or_zero(result.original_target().get());
    }

    /**
     * @brief Sets the count of `key`.
     * @return The count before the call
     */
    inline int set_count(const K& key, int count) {
        check_non_negative(count, "count");
        check_in_range(key);
        const auto result{mutate(key, SetCountModifier{count})};
        return node_type::count_or_zero(result.original_target().get());
    }

    /**
     * @brief Sets the count of `key` to `new_count` only if it is currently `old_count`.
     * @return Whether the count was `old_count` at the time of the call
     */
    inline bool set_count(const K& key, int old_count, int new_count) {
        check_non_negative(old_count, "old count");
        check_non_negative(new_count, "new count");
        check_in_range(key);
        const auto result{mutate(key, ConditionalSetCountModifier{old_count, new_count})};
        return node_type::count_or_zero(result.original_target().get()) == old_count;
    }

    /**
     * @brief Total number of occurrences in this view.
     *
     * Time complexity: O(log n)
     */
    inline std::uint64_t size() const {
        return bst_total_in_range(MultisetSizeAggregate<K>{}, range_, load_root());
    }

    inline std::size_t distinct_elements() const {
        return static_cast<std::size_t>(bst_total_in_range(MultisetDistinctAggregate<K>{}, range_, load_root()));
    }

    inline bool empty() const { return distinct_elements() == 0; }

    /**
     * @brief Removes every element of this view from the underlying multiset.
     * @throws ConcurrentModificationError if another thread changed the multiset meanwhile
     */
    inline void clear() {
        const factory_t factory{root_reference_->allocated};
        const full_policy_t policy{};
        const auto root{load_root()};
        if (root == nullptr) {
            return;
        }
        check_and_set(root, bst_minus_range(range_, policy, factory, root));
    }

    /**
     * @brief View of the elements below `upper` (inclusive if CLOSED).
     */
    inline TreeMultiset head_multiset(const K& upper, BoundType type) const {
        return TreeMultiset{root_reference_, range_.intersect(range_type::up_to(range_.comparator(), upper, type))};
    }

    /**
     * @brief View of the elements above `lower` (inclusive if CLOSED).
     */
    inline TreeMultiset tail_multiset(const K& lower, BoundType type) const {
        return TreeMultiset{root_reference_, range_.intersect(range_type::down_to(range_.comparator(), lower, type))};
    }

    /**
     * @throws std::invalid_argument if lower > upper, or lower == upper with both bounds OPEN
     */
    inline TreeMultiset sub_multiset(const K& lower, BoundType lower_type, const K& upper, BoundType upper_type) const {
        return TreeMultiset{root_reference_,
                            range_.intersect(range_type::range(range_.comparator(), lower, lower_type, upper, upper_type))};
    }

    inline const_iterator iterate_from(BstSide start) const {
        return iterate_from(root_reference_, range_, start);
    }

    inline const_iterator begin() const { return iterate_from(BstSide::LEFT); }
    inline const_iterator end() const { return const_iterator{}; }

    inline EntryView entries() const { return EntryView{root_reference_, range_, BstSide::LEFT}; }
    inline EntryView descending_entries() const { return EntryView{root_reference_, range_, BstSide::RIGHT}; }

    /**
     * @brief The distinct elements of this view in ascending order.
     */
    inline std::vector<K> element_set() const {
        std::vector<K> elements{};
        for (auto it{begin()}; it != end(); ++it) {
            elements.push_back(it->element);
        }
        return elements;
    }

    inline std::optional<Entry> first_entry() const {
        const auto it{iterate_from(BstSide::LEFT)};
        return it == const_iterator{} ? std::nullopt : std::optional<Entry>{*it};
    }

    inline std::optional<Entry> last_entry() const {
        const auto it{iterate_from(BstSide::RIGHT)};
        return it == const_iterator{} ? std::nullopt : std::optional<Entry>{*it};
    }

    /**
     * @brief Removes and returns the smallest entry of this view.
     * @throws ConcurrentModificationError if the entry changed between reading and removing it
     */
    inline std::optional<Entry> poll_first_entry() {
        return poll(first_entry());
    }

    inline std::optional<Entry> poll_last_entry() {
        return poll(last_entry());
    }

    /**
     * @brief Gets the bytes currently held by tree nodes of the underlying multiset
     *
     * Counts every live tree version, including those pinned by iterators.
     */
    inline std::size_t get_allocated_bytes() const {
        return root_reference_->allocated.load(std::memory_order_relaxed);
    }

private:
    inline std::optional<Entry> poll(std::optional<Entry> entry) {
        if (entry.has_value() && !set_count(entry->element, entry->count, 0)) {
            throw ConcurrentModificationError("entry changed before it could be polled");
        }
        return entry;
    }
};

#endif // TREEMULTISET_HPP
