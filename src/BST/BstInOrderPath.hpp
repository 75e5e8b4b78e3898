#ifndef BSTINORDERPATH_HPP
#define BSTINORDERPATH_HPP

#include <cassert>
#include <cstddef>
#include <utility>  // std::move
#include <vector>

#include "BstCommon.hpp"
#include "BstNode.hpp"

/**
 * @brief A path from the root of a tree to some node (the tip), supporting
 * in-order stepping in both directions.
 *
 * Nodes have no parent links, so the path records every node from the root
 * down together with the side taken at each step. Holding a path keeps the
 * tree version it was taken from alive.
 */
template<BstNodeType N>
class BstInOrderPath {
    std::vector<BstNodePtr<N>> nodes_;
    std::vector<BstSide> sides_;  // sides_[i] leads from nodes_[i] to nodes_[i + 1]

    inline void descend(BstSide side) {
        nodes_.push_back(nodes_.back()->child(side));
        sides_.push_back(side);
    }

    inline void ascend() {
        nodes_.pop_back();
        sides_.pop_back();
    }

public:
    inline explicit BstInOrderPath(BstNodePtr<N> root) {
        assert(root != nullptr);
        nodes_.push_back(std::move(root));
    }

    inline const BstNodePtr<N>& tip() const noexcept { return nodes_.back(); }
    inline std::size_t length() const noexcept { return nodes_.size(); }

    /**
     * @brief Returns this path extended to the tip's child on the given side.
     */
    inline BstInOrderPath extension(BstSide side) const {
        assert(tip()->has_child(side));
        auto result{*this};
        result.descend(side);
        return result;
    }

    /**
     * @brief Whether the tip has an in-order neighbour in direction `side`.
     */
    inline bool has_next(BstSide side) const {
        if (tip()->has_child(side)) {
            return true;
        }
        const auto back{other_side(side)};
        for (auto it{sides_.rbegin()}; it != sides_.rend(); ++it) {
            if (*it == back) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Moves the tip to its in-order neighbour in direction `side`.
     *
     * Time complexity: O(height) worst case, O(1) amortized over a full traversal
     */
    inline void advance(BstSide side) {
        assert(has_next(side));
        const auto back{other_side(side)};
        if (tip()->has_child(side)) {
            descend(side);
            while (tip()->has_child(back)) {
                descend(back);
            }
            return;
        }
        while (sides_.back() != back) {
            ascend();
        }
        ascend();
    }

    inline BstInOrderPath next(BstSide side) const {
        auto result{*this};
        result.advance(side);
        return result;
    }

    inline bool operator==(const BstInOrderPath& other) const {
        return tip() == other.tip();
    }
};

/**
 * @brief Creates in-order paths for range traversal.
 */
template<BstNodeType N>
struct BstInOrderPathFactory {
    using path_type = BstInOrderPath<N>;

    inline path_type initial_path(BstNodePtr<N> root) const {
        return path_type{std::move(root)};
    }

    inline path_type extension(const path_type& path, BstSide side) const {
        return path.extension(side);
    }
};

#endif // BSTINORDERPATH_HPP
