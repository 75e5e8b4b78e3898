#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <climits>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "BST/TreeMultiset.hpp"

using Multiset = TreeMultiset<int>;

static std::vector<Multiset::Entry> entries_of(const Multiset& ms) {
    std::vector<Multiset::Entry> out;
    for (const auto& entry : ms) {
        out.push_back(entry);
    }
    return out;
}

TEST_SUITE("TreeMultiset Basics") {
    TEST_CASE("create empty multiset") {
        Multiset ms;
        REQUIRE(ms.empty());
        REQUIRE(ms.size() == 0);
        REQUIRE(ms.distinct_elements() == 0);
        REQUIRE(ms.count(5) == 0);
        REQUIRE(ms.begin() == ms.end());
    }

    TEST_CASE("add accumulates occurrences") {
        Multiset ms;
        REQUIRE(ms.add(5, 1) == 0);
        REQUIRE(ms.add(3, 1) == 0);
        REQUIRE(ms.add(5, 2) == 1);
        REQUIRE(ms.count(5) == 3);
        REQUIRE(ms.count(3) == 1);
        REQUIRE(ms.count(4) == 0);
        REQUIRE(ms.size() == 4);
        REQUIRE(ms.distinct_elements() == 2);

        const auto entries = entries_of(ms);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0] == Multiset::Entry{3, 1});
        REQUIRE(entries[1] == Multiset::Entry{5, 3});
    }

    TEST_CASE("add with default occurrences") {
        Multiset ms;
        ms.add(7);
        ms.add(7);
        REQUIRE(ms.count(7) == 2);
        REQUIRE(ms.contains(7));
        REQUIRE(!ms.contains(8));
    }

    TEST_CASE("add zero occurrences returns current count without change") {
        Multiset ms;
        ms.add(1, 4);
        const auto before = ms.get_allocated_bytes();
        REQUIRE(ms.add(1, 0) == 4);
        REQUIRE(ms.add(2, 0) == 0);
        REQUIRE(ms.count(2) == 0);
        REQUIRE(ms.get_allocated_bytes() == before);
    }

    TEST_CASE("add negative occurrences throws") {
        Multiset ms;
        REQUIRE_THROWS_AS(ms.add(1, -1), std::invalid_argument);
        REQUIRE(ms.empty());
    }

    TEST_CASE("add beyond INT_MAX throws and leaves count unchanged") {
        Multiset ms;
        ms.add(1, INT_MAX - 1);
        REQUIRE(ms.add(1, 1) == INT_MAX - 1);
        REQUIRE(ms.count(1) == INT_MAX);
        REQUIRE_THROWS_AS(ms.add(1, 1), std::invalid_argument);
        REQUIRE(ms.count(1) == INT_MAX);
        REQUIRE(ms.size() == static_cast<std::uint64_t>(INT_MAX));
    }

    TEST_CASE("size sums counts beyond 32 bits") {
        Multiset ms;
        ms.add(1, INT_MAX);
        ms.add(2, INT_MAX);
        ms.add(3, INT_MAX);
        REQUIRE(ms.size() == 3ull * static_cast<std::uint64_t>(INT_MAX));
    }

    TEST_CASE("remove decrements and deletes at zero") {
        Multiset ms;
        ms.add(10, 3);
        REQUIRE(ms.remove(10, 2) == 3);
        REQUIRE(ms.count(10) == 1);
        REQUIRE(ms.remove(10) == 1);
        REQUIRE(ms.count(10) == 0);
        REQUIRE(ms.empty());
    }

    TEST_CASE("remove more than present removes all") {
        Multiset ms;
        ms.add(10, 3);
        ms.add(20, 1);
        REQUIRE(ms.remove(10, 100) == 3);
        REQUIRE(ms.count(10) == 0);
        REQUIRE(ms.distinct_elements() == 1);
    }

    TEST_CASE("remove nonexistent element") {
        Multiset ms;
        ms.add(10);
        REQUIRE(ms.remove(99) == 0);
        REQUIRE(ms.size() == 1);
    }

    TEST_CASE("remove zero and negative occurrences") {
        Multiset ms;
        ms.add(10, 2);
        REQUIRE(ms.remove(10, 0) == 2);
        REQUIRE(ms.count(10) == 2);
        REQUIRE_THROWS_AS(ms.remove(10, -3), std::invalid_argument);
        REQUIRE(ms.count(10) == 2);
    }

    TEST_CASE("add then remove restores count") {
        Multiset ms;
        for (int i = 0; i < 50; ++i) {
            ms.add(i, i % 3 + 1);
        }
        for (int k : {0, 17, 49, 100}) {
            const int before = ms.count(k);
            ms.add(k, 5);
            ms.remove(k, 5);
            REQUIRE(ms.count(k) == before);
        }
    }

    TEST_CASE("set_count") {
        Multiset ms;
        REQUIRE(ms.set_count(4, 7) == 0);
        REQUIRE(ms.count(4) == 7);
        REQUIRE(ms.set_count(4, 2) == 7);
        REQUIRE(ms.count(4) == 2);
        REQUIRE(ms.set_count(4, 0) == 2);
        REQUIRE(ms.count(4) == 0);
        REQUIRE(ms.empty());
        REQUIRE_THROWS_AS(ms.set_count(4, -1), std::invalid_argument);
    }

    TEST_CASE("conditional set_count succeeds only on matching count") {
        Multiset ms;
        ms.add(4, 3);
        REQUIRE(!ms.set_count(4, 2, 10));
        REQUIRE(ms.count(4) == 3);
        REQUIRE(ms.set_count(4, 3, 10));
        REQUIRE(ms.count(4) == 10);
        REQUIRE(ms.set_count(5, 0, 1));
        REQUIRE(ms.count(5) == 1);
        REQUIRE(ms.set_count(5, 1, 0));
        REQUIRE(ms.count(5) == 0);
        REQUIRE(ms.set_count(6, 0, 0));
        REQUIRE(ms.count(6) == 0);
    }

    TEST_CASE("conditional set_count rejects negative counts") {
        Multiset ms;
        REQUIRE_THROWS_AS(ms.set_count(1, -1, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(ms.set_count(1, 0, -2), std::invalid_argument);
    }

    TEST_CASE("clear removes everything") {
        Multiset ms;
        for (int i = 0; i < 100; ++i) {
            ms.add(i, 2);
        }
        ms.clear();
        REQUIRE(ms.empty());
        REQUIRE(ms.size() == 0);
        ms.clear();
        REQUIRE(ms.empty());
        ms.add(3);
        REQUIRE(ms.count(3) == 1);
    }

    TEST_CASE("construct from iterator range") {
        const std::vector<int> values{5, 1, 5, 3, 1, 5};
        Multiset ms{values.begin(), values.end()};
        REQUIRE(ms.size() == 6);
        REQUIRE(ms.count(5) == 3);
        REQUIRE(ms.count(1) == 2);
        REQUIRE(ms.count(3) == 1);
        REQUIRE(ms.element_set() == std::vector<int>{1, 3, 5});
    }

    TEST_CASE("custom comparator orders iteration") {
        TreeMultiset<int, std::greater<int>> ms;
        ms.add(1);
        ms.add(3);
        ms.add(2, 2);
        std::vector<int> order;
        for (const auto& entry : ms) {
            order.push_back(entry.element);
        }
        REQUIRE(order == std::vector<int>{3, 2, 1});
        REQUIRE(ms.first_entry()->element == 3);
    }

    TEST_CASE("string keys") {
        TreeMultiset<std::string> ms;
        ms.add("pear");
        ms.add("apple", 2);
        ms.add("fig");
        REQUIRE(ms.element_set() == std::vector<std::string>{"apple", "fig", "pear"});
        REQUIRE(ms.count("apple") == 2);
        REQUIRE(ms.remove("apple") == 2);
        REQUIRE(ms.count("apple") == 1);
    }

    TEST_CASE("first and last entries") {
        Multiset ms;
        REQUIRE(!ms.first_entry().has_value());
        REQUIRE(!ms.last_entry().has_value());
        ms.add(8, 2);
        ms.add(-3);
        ms.add(12, 5);
        REQUIRE(*ms.first_entry() == Multiset::Entry{-3, 1});
        REQUIRE(*ms.last_entry() == Multiset::Entry{12, 5});
    }

    TEST_CASE("poll first and last entries") {
        Multiset ms;
        ms.add(1, 2);
        ms.add(2, 3);
        ms.add(3, 4);
        REQUIRE(*ms.poll_first_entry() == Multiset::Entry{1, 2});
        REQUIRE(*ms.poll_last_entry() == Multiset::Entry{3, 4});
        REQUIRE(ms.element_set() == std::vector<int>{2});
        REQUIRE(*ms.poll_first_entry() == Multiset::Entry{2, 3});
        REQUIRE(ms.empty());
        REQUIRE(!ms.poll_first_entry().has_value());
        REQUIRE(!ms.poll_last_entry().has_value());
    }

    TEST_CASE("descending iteration") {
        Multiset ms;
        for (int i : {4, 2, 9, 7}) {
            ms.add(i, i);
        }
        std::vector<Multiset::Entry> seen;
        for (const auto& entry : ms.descending_entries()) {
            seen.push_back(entry);
        }
        REQUIRE(seen == std::vector<Multiset::Entry>{{9, 9}, {7, 7}, {4, 4}, {2, 2}});
    }

    TEST_CASE("iterator post-increment and arrow") {
        Multiset ms;
        ms.add(1);
        ms.add(2, 2);
        auto it = ms.begin();
        auto prev = it++;
        REQUIRE(prev->element == 1);
        REQUIRE(it->element == 2);
        REQUIRE(it->count == 2);
        ++it;
        REQUIRE(it == ms.end());
    }
}
