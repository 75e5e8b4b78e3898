#ifndef HASHCOMMON_HPP
#define HASHCOMMON_HPP

#include <algorithm>  // std::max
#include <bit>        // std::bit_floor, std::bit_width, std::rotl
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>  // std::invalid_argument

// Longest probe run tolerated per log2 of the table size before a table is
// considered flooded.
inline constexpr std::size_t MAX_RUN_MULTIPLIER = 13;
inline constexpr double DESIRED_LOAD_FACTOR = 0.7;
inline constexpr std::size_t MAX_TABLE_SIZE = std::size_t{1} << 30;
// Above this many elements a table cannot stay under the load factor and is capped at MAX_TABLE_SIZE.
inline constexpr std::size_t CUTOFF = static_cast<std::size_t>(MAX_TABLE_SIZE * DESIRED_LOAD_FACTOR);

/**
 * @brief Spreads the bits of a hash so that hashes differing only in their
 * upper bits land in different slots of a power-of-two table.
 */
constexpr inline std::uint32_t smear(std::size_t hash) noexcept {
    const auto wide{static_cast<std::uint64_t>(hash)};
    const auto folded{static_cast<std::uint32_t>(wide ^ (wide >> 32))};
    return 0x1b873593u * std::rotl(folded * 0xcc9e2d51u, 15);
}

/**
 * @brief Smallest power-of-two table that holds `set_size` elements under the
 * desired load factor.
 * @throws std::invalid_argument if no table of at most MAX_TABLE_SIZE slots can hold them
 */
constexpr inline std::size_t choose_table_size(std::size_t set_size) {
    set_size = std::max<std::size_t>(set_size, 2);
    if (set_size < CUTOFF) {
        auto table_size{std::bit_floor(set_size - 1) << 1};
        while (static_cast<double>(table_size) * DESIRED_LOAD_FACTOR < static_cast<double>(set_size)) {
            table_size <<= 1;
        }
        return table_size;
    }
    if (set_size < MAX_TABLE_SIZE) {
        return MAX_TABLE_SIZE;
    }
    throw std::invalid_argument("collection too large");
}

/**
 * @brief log2 of a power-of-two table size.
 */
constexpr inline std::size_t table_log2(std::size_t table_size) noexcept {
    return static_cast<std::size_t>(std::bit_width(table_size)) - 1;
}

constexpr inline std::size_t max_run_before_fallback(std::size_t table_size) noexcept {
    return MAX_RUN_MULTIPLIER * table_log2(table_size);
}

/**
 * @brief Whether a table holds a run of at least max_run_before_fallback
 * consecutive occupied slots (0 marks an empty slot), wrapping around its end.
 *
 * Instead of testing every slot it jumps ahead by a whole run length and scans
 * backwards, so a sparse table is mostly skipped.
 *
 * Time complexity: O(table size)
 */
inline bool hash_flooding_detected(std::span<const std::uint32_t> table) {
    const auto length{table.size()};
    const auto max_run{max_run_before_fallback(length)};
    const auto mask{length - 1};

    // every slot in [known_run_start, known_run_end) is occupied; known_run_end may pass the end and wrap
    std::size_t known_run_start{0};
    std::size_t known_run_end{0};

    while (known_run_start < length) {
        if (known_run_start == known_run_end && table[known_run_start] == 0) {
            if (table[(known_run_start + max_run - 1) & mask] == 0) {
                // at most max_run - 1 occupied slots fit in between; skip them all
                known_run_start += max_run;
            } else {
                ++known_run_start;
            }
            known_run_end = known_run_start;
            continue;
        }
        bool found_gap{false};
        for (auto j{known_run_start + max_run - 1}; j >= known_run_end; --j) {
            if (table[j & mask] == 0) {
                known_run_end = known_run_start + max_run;
                known_run_start = j + 1;
                found_gap = true;
                break;
            }
            if (j == 0) {
                break;
            }
        }
        if (!found_gap) {
            return true;
        }
    }
    return false;
}

#endif // HASHCOMMON_HPP
