#include "doctest.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <random>
#include <utility>
#include <vector>

#include "BST/TreeMultiset.hpp"

using Multiset = TreeMultiset<int>;

static bool matches(const Multiset& ms, const std::map<int, int>& reference) {
    if (ms.distinct_elements() != reference.size()) {
        return false;
    }
    auto expected = reference.begin();
    for (const auto& entry : ms) {
        if (expected == reference.end() || entry.element != expected->first || entry.count != expected->second) {
            return false;
        }
        ++expected;
    }
    return expected == reference.end();
}

static std::uint64_t reference_total(const std::map<int, int>& reference, int lo, int hi) {
    std::uint64_t total = 0;
    for (auto it = reference.lower_bound(lo); it != reference.end() && it->first <= hi; ++it) {
        total += static_cast<std::uint64_t>(it->second);
    }
    return total;
}

TEST_SUITE("TreeMultiset Fuzz") {
    TEST_CASE("random operations against std::map") {
        std::mt19937 rng(12345);
        std::uniform_int_distribution<int> op_dist(0, 9);
        std::uniform_int_distribution<int> key_dist(-500, 500);
        std::uniform_int_distribution<int> count_dist(0, 6);

        Multiset ms;
        std::map<int, int> reference;
        std::uint64_t expected_size = 0;

        for (int i = 0; i < 20000; ++i) {
            const int key = key_dist(rng);
            const int n = count_dist(rng);
            const int before = reference.contains(key) ? reference[key] : 0;
            const int op = op_dist(rng);
            int after = before;
            if (op < 4) {
                REQUIRE(ms.add(key, n) == before);
                after = before + n;
            } else if (op < 7) {
                REQUIRE(ms.remove(key, n) == before);
                after = before > n ? before - n : 0;
            } else if (op < 9) {
                REQUIRE(ms.set_count(key, n) == before);
                after = n;
            } else {
                const int guess = count_dist(rng) % 2 == 0 ? before : before + 1;
                REQUIRE(ms.set_count(key, guess, n) == (guess == before));
                after = guess == before ? n : before;
            }
            expected_size = expected_size - static_cast<std::uint64_t>(before) + static_cast<std::uint64_t>(after);
            if (after == 0) {
                reference.erase(key);
            } else {
                reference[key] = after;
            }
            REQUIRE(ms.count(key) == after);
            if (i % 1000 == 0) {
                REQUIRE(matches(ms, reference));
            }
        }
        REQUIRE(matches(ms, reference));
        REQUIRE(ms.size() == expected_size);
    }

    TEST_CASE("random range counts against std::map") {
        std::mt19937 rng(99);
        std::uniform_int_distribution<int> key_dist(0, 2000);
        std::uniform_int_distribution<int> count_dist(1, 9);

        Multiset ms;
        std::map<int, int> reference;
        for (int i = 0; i < 3000; ++i) {
            const int key = key_dist(rng);
            const int n = count_dist(rng);
            ms.add(key, n);
            reference[key] += n;
        }

        for (int i = 0; i < 500; ++i) {
            int lo = key_dist(rng);
            int hi = key_dist(rng);
            if (lo > hi) {
                std::swap(lo, hi);
            }
            const auto view = ms.sub_multiset(lo, BoundType::CLOSED, hi, BoundType::CLOSED);
            REQUIRE(view.size() == reference_total(reference, lo, hi));
            const auto distinct = static_cast<std::size_t>(
                std::distance(reference.lower_bound(lo), reference.upper_bound(hi)));
            REQUIRE(view.distinct_elements() == distinct);
        }
    }

    TEST_CASE("random view clears against std::map") {
        std::mt19937 rng(7);
        std::uniform_int_distribution<int> key_dist(0, 1000);

        Multiset ms;
        std::map<int, int> reference;
        for (int round = 0; round < 50; ++round) {
            for (int i = 0; i < 100; ++i) {
                const int key = key_dist(rng);
                ms.add(key);
                ++reference[key];
            }
            int lo = key_dist(rng);
            int hi = key_dist(rng);
            if (lo > hi) {
                std::swap(lo, hi);
            }
            ms.sub_multiset(lo, BoundType::CLOSED, hi, BoundType::OPEN).clear();
            reference.erase(reference.lower_bound(lo), reference.lower_bound(hi));
            REQUIRE(matches(ms, reference));
        }
    }
}
