#ifndef BSTCOMMON_HPP
#define BSTCOMMON_HPP

#include <concepts>    // std::equality_comparable
#include <cstdint>
#include <stdexcept>   // std::runtime_error
#include <string>

/**
 * @brief Side of a binary search tree node.
 */
enum struct BstSide : std::uint8_t {
    LEFT  = 0,
    RIGHT = 1,
};

constexpr inline BstSide other_side(BstSide side) noexcept {
    return side == BstSide::LEFT ? BstSide::RIGHT : BstSide::LEFT;
}

/**
 * @brief Whether an endpoint of a range is included in the range.
 */
enum struct BoundType : std::uint8_t {
    OPEN   = 0,
    CLOSED = 1,
};

template<typename... Fs>
struct overload : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
overload(Fs...) -> overload<Fs...>;

/**
 * @brief Raised when the shared root of a multiset changed between reading it
 * and swapping in the mutated tree.
 */
struct ConcurrentModificationError : std::runtime_error {
    explicit ConcurrentModificationError(const std::string& what)
        : std::runtime_error{what} {}
};

/**
 * @brief Three-way comparison through a strict weak ordering.
 */
template<typename Compare, typename A, typename B>
constexpr inline int compare_with(const Compare& cmp, const A& a, const B& b) {
    if (cmp(a, b)) {
        return -1;
    }
    if (cmp(b, a)) {
        return 1;
    }
    return 0;
}

// Comparators without operator== (std::less and friends, lambdas) are assumed equal.
template<typename Compare>
constexpr inline bool comparators_equal(const Compare& a, const Compare& b) {
    if constexpr (std::equality_comparable<Compare>) {
        return a == b;
    } else {
        return true;
    }
}

/**
 * @brief Comparator imposing the reverse of another comparator's order.
 */
template<typename Compare>
struct ReverseCompare {
    Compare forward{};

    template<typename A, typename B>
    constexpr inline bool operator()(const A& a, const B& b) const {
        return forward(b, a);
    }

    constexpr inline bool operator==(const ReverseCompare& other) const {
        return comparators_equal(forward, other.forward);
    }
};

#endif // BSTCOMMON_HPP
