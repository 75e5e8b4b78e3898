/**
 * @brief Intervals over an arbitrary comparator-ordered type.
 *
 * A range is a pair of cuts. A cut sits between values of the ordered type:
 *
 *            BELOW_VALUE(v)   ABOVE_VALUE(v)
 *                   |    v    |
 *   BELOW_ALL  ...--+---[x]---+--...  ABOVE_ALL
 *
 * Bounds map onto cuts as follows:
 *   lower CLOSED v -> BELOW_VALUE(v)     upper CLOSED v -> ABOVE_VALUE(v)
 *   lower OPEN   v -> ABOVE_VALUE(v)     upper OPEN   v -> BELOW_VALUE(v)
 *
 * A value x lies in the range iff lower < x < upper when cuts and values are
 * compared in the combined order above.
 */

#ifndef GENERALRANGE_HPP
#define GENERALRANGE_HPP

#include <cassert>
#include <cstdint>
#include <functional>  // std::less
#include <optional>    // std::optional
#include <stdexcept>   // std::invalid_argument
#include <utility>     // std::move

#include "BstCommon.hpp"

enum struct CutKind : std::uint8_t {
    BELOW_ALL   = 0,
    BELOW_VALUE = 1,
    ABOVE_VALUE = 2,
    ABOVE_ALL   = 3,
};

template<typename T>
class Cut {
    CutKind kind_{CutKind::BELOW_ALL};
    std::optional<T> endpoint_{};

    constexpr inline Cut(CutKind kind, std::optional<T> endpoint)
        : kind_{kind}, endpoint_{std::move(endpoint)} {}

public:
    static constexpr inline Cut below_all() { return Cut{CutKind::BELOW_ALL, std::nullopt}; }
    static constexpr inline Cut above_all() { return Cut{CutKind::ABOVE_ALL, std::nullopt}; }
    static constexpr inline Cut below_value(T v) { return Cut{CutKind::BELOW_VALUE, std::move(v)}; }
    static constexpr inline Cut above_value(T v) { return Cut{CutKind::ABOVE_VALUE, std::move(v)}; }

    static constexpr inline Cut lower_bound(T v, BoundType type) {
        return type == BoundType::CLOSED ? below_value(std::move(v)) : above_value(std::move(v));
    }

    static constexpr inline Cut upper_bound(T v, BoundType type) {
        return type == BoundType::CLOSED ? above_value(std::move(v)) : below_value(std::move(v));
    }

    constexpr inline CutKind kind() const noexcept { return kind_; }
    constexpr inline bool has_endpoint() const noexcept { return endpoint_.has_value(); }

    constexpr inline const T& endpoint() const {
        assert(endpoint_.has_value() && "unbounded cut has no endpoint");
        return *endpoint_;
    }

    /**
     * @brief Whether this cut lies strictly below the given value.
     */
    template<typename Compare>
    constexpr inline bool is_less_than(const T& value, const Compare& cmp) const {
        switch (kind_) {
            case CutKind::BELOW_ALL:   return true;
            case CutKind::ABOVE_ALL:   return false;
            case CutKind::BELOW_VALUE: return !cmp(value, *endpoint_);
            case CutKind::ABOVE_VALUE: return cmp(*endpoint_, value);
        }
        std::unreachable();
    }

    /**
     * @brief Three-way comparison of two cuts in the combined cut/value order.
     */
    template<typename Compare>
    static constexpr inline int compare(const Cut& a, const Cut& b, const Compare& cmp) {
        if (a.kind_ == CutKind::BELOW_ALL || b.kind_ == CutKind::ABOVE_ALL) {
            return a.kind_ == b.kind_ ? 0 : -1;
        }
        if (a.kind_ == CutKind::ABOVE_ALL || b.kind_ == CutKind::BELOW_ALL) {
            return a.kind_ == b.kind_ ? 0 : 1;
        }
        if (const auto c{compare_with(cmp, *a.endpoint_, *b.endpoint_)}; c != 0) {
            return c;
        }
        if (a.kind_ == b.kind_) {
            return 0;
        }
        return a.kind_ == CutKind::BELOW_VALUE ? -1 : 1;
    }

    /**
     * @brief The same cut seen through the reversed order.
     */
    constexpr inline Cut reverse() const {
        switch (kind_) {
            case CutKind::BELOW_ALL:   return above_all();
            case CutKind::ABOVE_ALL:   return below_all();
            case CutKind::BELOW_VALUE: return above_value(*endpoint_);
            case CutKind::ABOVE_VALUE: return below_value(*endpoint_);
        }
        std::unreachable();
    }
};

/**
 * @brief An interval over T with optional open or closed endpoints, ordered by Compare.
 *
 * Ranges are immutable values. An empty intersection is never an error; it is
 * normalized to lower == upper == ABOVE_VALUE(v), i.e. (v, v].
 */
template<typename T, typename Compare = std::less<T>>
class GeneralRange {
public:
    using value_type = T;
    using comparator_type = Compare;

private:
    Compare comparator_;
    Cut<T> lower_;
    Cut<T> upper_;

    GeneralRange(Compare comparator, Cut<T> lower, Cut<T> upper)
        : comparator_{std::move(comparator)}
        , lower_{std::move(lower)}
        , upper_{std::move(upper)} {}

    static inline GeneralRange checked(Compare comparator, Cut<T> lower, Cut<T> upper) {
        if (lower.has_endpoint() && upper.has_endpoint()) {
            const auto c{compare_with(comparator, lower.endpoint(), upper.endpoint())};
            if (c > 0) {
                throw std::invalid_argument("lower endpoint is greater than upper endpoint");
            }
            if (c == 0 && lower.kind() == CutKind::ABOVE_VALUE && upper.kind() == CutKind::BELOW_VALUE) {
                throw std::invalid_argument("range with equal endpoints must have a closed bound");
            }
        }
        return GeneralRange{std::move(comparator), std::move(lower), std::move(upper)};
    }

public:
    static inline GeneralRange all(Compare comparator = Compare{}) {
        return GeneralRange{std::move(comparator), Cut<T>::below_all(), Cut<T>::above_all()};
    }

    static inline GeneralRange down_to(Compare comparator, T endpoint, BoundType type) {
        return GeneralRange{std::move(comparator), Cut<T>::lower_bound(std::move(endpoint), type), Cut<T>::above_all()};
    }

    static inline GeneralRange up_to(Compare comparator, T endpoint, BoundType type) {
        return GeneralRange{std::move(comparator), Cut<T>::below_all(), Cut<T>::upper_bound(std::move(endpoint), type)};
    }

    /**
     * @throws std::invalid_argument if lower > upper, or if they are equal and both bounds are open
     */
    static inline GeneralRange range(Compare comparator, T lower, BoundType lower_type, T upper, BoundType upper_type) {
        return checked(std::move(comparator),
                       Cut<T>::lower_bound(std::move(lower), lower_type),
                       Cut<T>::upper_bound(std::move(upper), upper_type));
    }

    inline const Compare& comparator() const noexcept { return comparator_; }
    inline const Cut<T>& lower_cut() const noexcept { return lower_; }
    inline const Cut<T>& upper_cut() const noexcept { return upper_; }

    inline bool has_lower_bound() const noexcept { return lower_.has_endpoint(); }
    inline bool has_upper_bound() const noexcept { return upper_.has_endpoint(); }
    inline const T& lower_endpoint() const { return lower_.endpoint(); }
    inline const T& upper_endpoint() const { return upper_.endpoint(); }

    inline BoundType lower_bound_type() const noexcept {
        return lower_.kind() == CutKind::BELOW_VALUE ? BoundType::CLOSED : BoundType::OPEN;
    }

    inline BoundType upper_bound_type() const noexcept {
        return upper_.kind() == CutKind::ABOVE_VALUE ? BoundType::CLOSED : BoundType::OPEN;
    }

    inline bool too_low(const T& t) const { return !lower_.is_less_than(t, comparator_); }
    inline bool too_high(const T& t) const { return upper_.is_less_than(t, comparator_); }
    inline bool contains(const T& t) const { return !too_low(t) && !too_high(t); }

    inline bool is_empty() const {
        return Cut<T>::compare(lower_, upper_, comparator_) >= 0;
    }

    /**
     * @brief The tightest range contained in both this range and other.
     * @throws std::invalid_argument if the ranges use different comparators
     */
    inline GeneralRange intersect(const GeneralRange& other) const {
        if (!comparators_equal(comparator_, other.comparator_)) {
            throw std::invalid_argument("cannot intersect ranges with different comparators");
        }
        const auto& lower{Cut<T>::compare(lower_, other.lower_, comparator_) >= 0 ? lower_ : other.lower_};
        const auto& upper{Cut<T>::compare(upper_, other.upper_, comparator_) <= 0 ? upper_ : other.upper_};
        if (Cut<T>::compare(lower, upper, comparator_) > 0) {
            // lower > upper is only possible when both cuts carry an endpoint
            const T& end{upper.endpoint()};
            return GeneralRange{comparator_, Cut<T>::above_value(end), Cut<T>::above_value(end)};
        }
        return GeneralRange{comparator_, lower, upper};
    }

    inline GeneralRange<T, ReverseCompare<Compare>> reverse() const {
        return GeneralRange<T, ReverseCompare<Compare>>::from_cuts(
            ReverseCompare<Compare>{comparator_}, upper_.reverse(), lower_.reverse());
    }

    /**
     * @brief Builds a range directly from two cuts, validating their order.
     */
    static inline GeneralRange from_cuts(Compare comparator, Cut<T> lower, Cut<T> upper) {
        if (Cut<T>::compare(lower, upper, comparator) > 0) {
            throw std::invalid_argument("lower cut is above upper cut");
        }
        return GeneralRange{std::move(comparator), std::move(lower), std::move(upper)};
    }
};

#endif // GENERALRANGE_HPP
