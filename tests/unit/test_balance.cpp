#include "doctest.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <numeric>
#include <random>
#include <vector>

#include "bst_testing.hpp"

// Builds a right spine 0..n-1 without rebalancing.
static IntNodePtr degenerate_tree(int n, const IntFactory& factory) {
    const NoRebalancePolicy policy{};
    IntNodePtr root;
    for (int i = 0; i < n; ++i) {
        root = set_count(root, i, 1, factory, policy);
    }
    return root;
}

TEST_SUITE("BST Balance Policies") {
    TEST_CASE("no-rebalance policy degenerates on sorted input") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const auto root = degenerate_tree(64, factory);
        REQUIRE(height(root) == 64);
        REQUIRE(tree_consistent(root));
    }

    TEST_CASE("no-rebalance combine keeps order") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const NoRebalancePolicy policy{};
        const auto left = insert_all(nullptr, {1, 2, 3}, factory, policy);
        const auto right = insert_all(nullptr, {10, 11}, factory, policy);
        const auto joined = policy.combine(factory, left, right);
        REQUIRE(keys_of(joined) == std::vector<int>{1, 2, 3, 10, 11});
        REQUIRE(tree_consistent(joined));
        REQUIRE(policy.combine(factory, nullptr, right) == right);
        REQUIRE(policy.combine(factory, left, nullptr) == left);
    }

    TEST_CASE("single rebalance keeps sorted insertions logarithmic") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const SinglePolicy policy{};
        std::vector<int> ascending(2000);
        std::iota(ascending.begin(), ascending.end(), 0);
        const auto up = insert_all(nullptr, ascending, factory, policy);
        REQUIRE(tree_consistent(up));
        REQUIRE(height_is_logarithmic(up));

        std::vector<int> descending(ascending.rbegin(), ascending.rend());
        const auto down = insert_all(nullptr, descending, factory, policy);
        REQUIRE(tree_consistent(down));
        REQUIRE(height_is_logarithmic(down));
        REQUIRE(keys_of(down) == ascending);
    }

    TEST_CASE("single rebalance after removals") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const SinglePolicy policy{};
        std::vector<int> keys(1000);
        std::iota(keys.begin(), keys.end(), 0);
        auto root = insert_all(nullptr, keys, factory, policy);
        // remove the lower 900 keys one at a time
        for (int i = 0; i < 900; ++i) {
            root = set_count(root, i, 0, factory, policy);
            REQUIRE(root->distinct() == static_cast<std::size_t>(999 - i));
        }
        REQUIRE(tree_consistent(root));
        REQUIRE(height_is_logarithmic(root));
    }

    TEST_CASE("single rebalance rotation cases") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const SinglePolicy policy{};
        const auto source = factory.create_entry(0, 1);

        // right-heavy, outer grandchild heavy: single left rotation
        const auto right = insert_all(nullptr, {1, 2, 3, 4, 5}, factory, policy);
        const auto rotated = policy.balance(factory, *source, nullptr, right);
        REQUIRE(keys_of(rotated) == std::vector<int>{0, 1, 2, 3, 4, 5});
        REQUIRE(tree_consistent(rotated));
        REQUIRE(height(rotated) <= height(right));

        // left-heavy
        const auto high = factory.create_entry(100, 1);
        const auto left = insert_all(nullptr, {10, 20, 30, 40, 50}, factory, policy);
        const auto rotated_right = policy.balance(factory, *high, left, nullptr);
        REQUIRE(keys_of(rotated_right) == std::vector<int>{10, 20, 30, 40, 50, 100});
        REQUIRE(tree_consistent(rotated_right));
        REQUIRE(height(rotated_right) <= height(left));
    }

    TEST_CASE("single rebalance combine") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const SinglePolicy policy{};
        const auto left = insert_all(nullptr, {1, 2, 3, 4, 5, 6, 7}, factory, policy);
        const auto right = insert_all(nullptr, {10, 11, 12, 13, 14}, factory, policy);
        const auto joined = policy.combine(factory, left, right);
        REQUIRE(keys_of(joined) == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 10, 11, 12, 13, 14});
        REQUIRE(tree_consistent(joined));
    }

    TEST_CASE("full rebalance balances arbitrarily skewed inputs") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const FullPolicy policy{};
        const SinglePolicy single{};

        std::vector<int> big;
        for (int i = 0; i < 1000; ++i) {
            big.push_back(i);
        }
        const auto left = insert_all(nullptr, big, factory, single);
        const auto source = factory.create_entry(5000, 2);
        const auto right = factory.create_entry(6000, 1);

        const auto balanced = policy.balance(factory, *source, left, right);
        REQUIRE(tree_consistent(balanced));
        REQUIRE(balanced->distinct() == 1002);
        REQUIRE(height_is_logarithmic(balanced));

        const auto low = factory.create_entry(-1, 1);
        const auto prepended = policy.balance(factory, *low, nullptr, left);
        REQUIRE(tree_consistent(prepended));
        REQUIRE(keys_of(prepended).front() == -1);
        REQUIRE(height_is_logarithmic(prepended));
    }

    TEST_CASE("full rebalance combine of very different sizes") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const FullPolicy policy{};
        const SinglePolicy single{};

        std::vector<int> big(2000);
        std::iota(big.begin(), big.end(), 0);
        const auto left = insert_all(nullptr, big, factory, single);
        const auto right = insert_all(nullptr, {5000, 5001}, factory, single);

        const auto joined = policy.combine(factory, left, right);
        REQUIRE(tree_consistent(joined));
        REQUIRE(joined->distinct() == 2002);
        REQUIRE(height_is_logarithmic(joined));

        const auto reversed = policy.combine(factory, insert_all(nullptr, {-5, -4}, factory, single), left);
        REQUIRE(tree_consistent(reversed));
        REQUIRE(keys_of(reversed).front() == -5);
        REQUIRE(height_is_logarithmic(reversed));
    }

    TEST_CASE("random operations keep trees balanced") {
        std::atomic<std::size_t> bytes{0};
        const IntFactory factory{bytes};
        const SinglePolicy policy{};
        std::mt19937 rng(4242);
        std::uniform_int_distribution<int> key_dist(0, 3000);
        std::uniform_int_distribution<int> count_dist(0, 3);

        IntNodePtr root;
        for (int i = 0; i < 5000; ++i) {
            root = set_count(root, key_dist(rng), count_dist(rng), factory, policy);
        }
        REQUIRE(tree_consistent(root));
        REQUIRE(height_is_logarithmic(root));
    }
}
