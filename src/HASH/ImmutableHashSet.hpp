/**
 * @brief An immutable hash set built through an open-addressed table with
 * hash-flooding defense.
 *
 * The builder probes linearly from smear(hash) & mask. A probe run longer than
 * MAX_RUN_MULTIPLIER * log2(table size) means the input is colliding far more
 * than random hashes would, so the builder switches, once and for all, to a
 * set ordered by (smeared hash, Less) whose lookups stay O(log n) however the
 * hashes are distributed. Before building, the whole table is scanned for long
 * runs as well, so a built regular table never needs more than
 * O(log n) probes per lookup.
 *
 * Elements are kept in insertion order for iteration.
 */

#ifndef IMMUTABLEHASHSET_HPP
#define IMMUTABLEHASHSET_HPP

#include <algorithm>  // std::max
#include <cstddef>
#include <cstdint>
#include <functional>  // std::hash, std::equal_to, std::less
#include <iterator>
#include <set>
#include <span>
#include <utility>     // std::move
#include <variant>
#include <vector>

#include "HashCommon.hpp"
#include "../BST/BstCommon.hpp"  // overload

template<typename E, typename Hash = std::hash<E>, typename KeyEqual = std::equal_to<E>, typename Less = std::less<E>>
class ImmutableHashSet {
    struct HashedElement {
        std::uint32_t smeared;
        E element;
    };

    struct Probe {
        std::uint32_t smeared;
        const E& element;
    };

    // Orders by smeared hash first, so elements with distinct hashes never need Less.
    struct HashedLess {
        using is_transparent = void;
        Less less;

        template<typename A, typename B>
        inline bool operator()(const A& a, const B& b) const {
            if (a.smeared != b.smeared) {
                return a.smeared < b.smeared;
            }
            return less(a.element, b.element);
        }
    };

    using flood_index_t = std::set<HashedElement, HashedLess>;

    struct SingletonSet {
        E element;
        std::size_t hash_code;
    };

    struct RegularSet {
        std::vector<E> elements;
        std::vector<std::uint32_t> table;  // 0 = empty, otherwise index + 1 into elements
        std::size_t hash_code;
    };

    struct FloodResistantSet {
        std::vector<E> elements;
        flood_index_t index;
        std::size_t hash_code;
    };

    using StorageType = std::variant<std::monostate, SingletonSet, RegularSet, FloodResistantSet>;

    StorageType storage_;
    Hash hash_;
    KeyEqual equal_;

    inline ImmutableHashSet(StorageType storage, Hash hash, KeyEqual equal)
        : storage_{std::move(storage)}, hash_{std::move(hash)}, equal_{std::move(equal)} {}

public:
    using value_type = E;
    using const_iterator = typename std::span<const E>::iterator;

    class Builder;

    /**
     * @brief An empty set.
     */
    ImmutableHashSet() = default;

    /**
     * @brief Checks whether `e` is in the set
     *
     * Time complexity: O(1) expected, O(log n) worst case
     */
    inline bool contains(const E& e) const {
        return std::visit(overload{
            [](const std::monostate&) { return false; },
            [&](const SingletonSet& s) { return equal_(s.element, e); },
            [&](const RegularSet& s) {
                const auto mask{s.table.size() - 1};
                for (std::size_t i{smear(hash_(e))};; ++i) {
                    const auto slot{s.table[i & mask]};
                    if (slot == 0) {
                        return false;
                    }
                    if (equal_(s.elements[slot - 1], e)) {
                        return true;
                    }
                }
            },
            [&](const FloodResistantSet& s) {
                return s.index.find(Probe{smear(hash_(e)), e}) != s.index.end();
            },
        }, storage_);
    }

    /**
     * @brief The elements in insertion order.
     */
    inline std::span<const E> elements() const noexcept {
        return std::visit(overload{
            [](const std::monostate&) { return std::span<const E>{}; },
            [](const SingletonSet& s) { return std::span<const E>{&s.element, 1}; },
            [](const RegularSet& s) { return std::span<const E>{s.elements}; },
            [](const FloodResistantSet& s) { return std::span<const E>{s.elements}; },
        }, storage_);
    }

    inline const_iterator begin() const noexcept { return elements().begin(); }
    inline const_iterator end() const noexcept { return elements().end(); }

    inline std::size_t size() const noexcept { return elements().size(); }
    inline bool empty() const noexcept { return size() == 0; }

    /**
     * @brief Sum of the element hashes, independent of insertion order.
     */
    inline std::size_t hash_code() const noexcept {
        return std::visit(overload{
            [](const std::monostate&) { return std::size_t{0}; },
            [](const auto& s) { return s.hash_code; },
        }, storage_);
    }

    /**
     * @brief Whether the set was built through the flooding-resistant fallback.
     */
    inline bool is_hash_flooding_resistant() const noexcept {
        return std::holds_alternative<FloodResistantSet>(storage_);
    }
};

/**
 * @brief Accumulates distinct elements and builds an ImmutableHashSet.
 *
 * Starts with an open-addressed table; moves to the flooding-resistant
 * fallback on a probe run of max_run_before_fallback(table size) slots. The
 * move is never undone. A builder can keep adding after build().
 */
template<typename E, typename Hash, typename KeyEqual, typename Less>
class ImmutableHashSet<E, Hash, KeyEqual, Less>::Builder {
    struct RegularSetBuilder {
        std::vector<E> elements;
        std::vector<std::uint32_t> table;  // empty until the second distinct element
        std::size_t max_run{0};
        std::size_t expand_table_threshold{0};
        std::size_t hash_sum{0};
        std::size_t expected_capacity{0};
    };

    struct FallbackSetBuilder {
        std::vector<E> elements;
        flood_index_t index;
        std::size_t hash_sum{0};
    };

    std::variant<RegularSetBuilder, FallbackSetBuilder> impl_;
    Hash hash_;
    KeyEqual equal_;
    Less less_;

    inline std::vector<std::uint32_t> rebuild_hash_table(std::size_t table_size, const std::vector<E>& elements) const {
        std::vector<std::uint32_t> table(table_size, 0);
        const auto mask{table_size - 1};
        for (std::size_t i{0}; i < elements.size(); ++i) {
            for (std::size_t j{smear(hash_(elements[i]))};; ++j) {
                if (table[j & mask] == 0) {
                    table[j & mask] = static_cast<std::uint32_t>(i + 1);
                    break;
                }
            }
        }
        return table;
    }

    inline void resize_table(RegularSetBuilder& b, std::size_t table_size) const {
        b.table = rebuild_hash_table(table_size, b.elements);
        b.max_run = max_run_before_fallback(table_size);
        b.expand_table_threshold = static_cast<std::size_t>(DESIRED_LOAD_FACTOR * static_cast<double>(table_size));
    }

    inline void ensure_table_capacity(RegularSetBuilder& b, std::size_t min_capacity) const {
        if (b.table.empty()) {
            resize_table(b, choose_table_size(min_capacity));
        } else if (min_capacity > b.expand_table_threshold && b.table.size() < MAX_TABLE_SIZE) {
            resize_table(b, b.table.size() * 2);
        }
    }

    /**
     * @return false if the probe ran out before finding `e` or an empty slot
     */
    inline bool insert_in_hash_table(RegularSetBuilder& b, const E& e) const {
        const auto e_hash{hash_(e)};
        const std::size_t i0{smear(e_hash)};
        const auto mask{b.table.size() - 1};
        for (auto i{i0}; i - i0 < b.max_run; ++i) {
            const auto index{i & mask};
            const auto slot{b.table[index]};
            if (slot == 0) {
                b.elements.push_back(e);
                b.table[index] = static_cast<std::uint32_t>(b.elements.size());
                b.hash_sum += e_hash;
                ensure_table_capacity(b, b.elements.size());
                return true;
            }
            if (equal_(b.elements[slot - 1], e)) {
                return true;
            }
        }
        return false;
    }

    inline bool add_regular(RegularSetBuilder& b, const E& e) const {
        if (b.table.empty()) {
            if (b.elements.empty()) {
                b.elements.push_back(e);
                b.hash_sum += hash_(e);
                return true;
            }
            // second candidate: the new table takes over the first element
            ensure_table_capacity(b, std::max<std::size_t>(b.expected_capacity, b.elements.size() + 1));
        }
        return insert_in_hash_table(b, e);
    }

    inline void add_fallback(FallbackSetBuilder& b, const E& e) const {
        const auto smeared{smear(hash_(e))};
        if (b.index.find(Probe{smeared, e}) != b.index.end()) {
            return;
        }
        b.index.insert(HashedElement{smeared, e});
        b.elements.push_back(e);
        b.hash_sum += hash_(e);
    }

    inline void fall_back(RegularSetBuilder& b) {
        FallbackSetBuilder fallback{{}, flood_index_t{HashedLess{less_}}, 0};
        fallback.elements.reserve(b.elements.size());
        for (const auto& e : b.elements) {
            add_fallback(fallback, e);
        }
        impl_ = std::move(fallback);
    }

public:
    /**
     * @param expected_capacity Number of distinct elements the first table is sized for
     */
    inline explicit Builder(std::size_t expected_capacity = 4, Hash hash = Hash{}, KeyEqual equal = KeyEqual{},
                            Less less = Less{})
        : impl_{RegularSetBuilder{}}
        , hash_{std::move(hash)}
        , equal_{std::move(equal)}
        , less_{std::move(less)} {
        std::get<RegularSetBuilder>(impl_).expected_capacity = expected_capacity;
        std::get<RegularSetBuilder>(impl_).elements.reserve(expected_capacity);
    }

    /**
     * @brief Adds `e` unless an equal element was added before.
     */
    inline Builder& add(const E& e) {
        if (auto* regular{std::get_if<RegularSetBuilder>(&impl_)}) {
            if (add_regular(*regular, e)) {
                return *this;
            }
            // a probe run hit max_run_before_fallback
            fall_back(*regular);
        }
        add_fallback(std::get<FallbackSetBuilder>(impl_), e);
        return *this;
    }

    template<std::input_iterator It, std::sentinel_for<It> S>
    inline Builder& add_all(It first, S last) {
        for (; first != last; ++first) {
            add(*first);
        }
        return *this;
    }

    /**
     * @brief Adds every element of `other`, in its insertion order.
     */
    inline Builder& combine(const Builder& other) {
        for (const auto& e : other.deduplicated()) {
            add(e);
        }
        return *this;
    }

    /**
     * @brief An independent builder with the same contents and mode.
     */
    inline Builder copy() const {
        return Builder{*this};
    }

    /**
     * @brief Shrinks an oversized table, then scans it for hash flooding and
     * falls back if any long run is found.
     */
    inline void review() {
        auto* regular{std::get_if<RegularSetBuilder>(&impl_)};
        if (regular == nullptr || regular->table.empty()) {
            return;
        }
        const auto target_table_size{choose_table_size(regular->elements.size())};
        if (target_table_size * 2 < regular->table.size()) {
            resize_table(*regular, target_table_size);
        }
        if (hash_flooding_detected(regular->table)) {
            fall_back(*regular);
        }
    }

    /**
     * @brief Builds the set. Reviews the table first.
     * @throws std::invalid_argument if the table would exceed MAX_TABLE_SIZE
     */
    inline ImmutableHashSet build() {
        review();
        auto storage{std::visit(overload{
            [&](const RegularSetBuilder& b) -> StorageType {
                switch (b.elements.size()) {
                    case 0: return std::monostate{};
                    case 1: return SingletonSet{b.elements.front(), b.hash_sum};
                    default: return RegularSet{b.elements, b.table, b.hash_sum};
                }
            },
            [&](const FallbackSetBuilder& b) -> StorageType {
                switch (b.elements.size()) {
                    case 0: return std::monostate{};
                    case 1: return SingletonSet{b.elements.front(), b.hash_sum};
                    default: return FloodResistantSet{b.elements, b.index, b.hash_sum};
                }
            },
        }, impl_)};
        return ImmutableHashSet{std::move(storage), hash_, equal_};
    }

    /**
     * @brief Distinct elements added so far, in insertion order.
     */
    inline std::span<const E> deduplicated() const noexcept {
        return std::visit([](const auto& b) { return std::span<const E>{b.elements}; }, impl_);
    }

    inline std::size_t size() const noexcept { return deduplicated().size(); }

    /**
     * @brief Slots in the open-addressed table; 0 before the second distinct element or after falling back.
     */
    inline std::size_t table_size() const noexcept {
        const auto* regular{std::get_if<RegularSetBuilder>(&impl_)};
        return regular == nullptr ? 0 : regular->table.size();
    }

    inline bool is_hash_flooding_resistant() const noexcept {
        return std::holds_alternative<FallbackSetBuilder>(impl_);
    }
};

#endif // IMMUTABLEHASHSET_HPP
