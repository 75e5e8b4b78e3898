/**
 * @file bstset.h
 * @brief C API for bstset - a persistent weight-balanced sorted multiset
 *
 * Public C interface for the bstset library (libbstset).
 * A sorted multiset of int64_t keys with O(log n) point updates, O(log n)
 * range counts, and range views that share storage with their parent.
 */

#ifndef BSTSET_H
#define BSTSET_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque handle to a multiset or to a range view of one
 */
typedef struct BstSet* bstset_t;
typedef const struct BstSet* const_bstset_t;

/**
 * @brief Outcome of an operation that can fail
 */
typedef enum {
    BSTSET_OK = 0,
    /* negative count, key outside the view, or count overflow */
    BSTSET_INVALID_ARGUMENT = 1,
    /* another thread changed the multiset during the call; nothing was changed, retry if desired */
    BSTSET_CONCURRENT_MODIFICATION = 2,
    BSTSET_OUT_OF_MEMORY = 3,
} bstset_status_t;

/**
 * @brief Whether a range endpoint is included
 */
typedef enum {
    BSTSET_OPEN = 0,
    BSTSET_CLOSED = 1,
} bstset_bound_t;

/**
 * @brief An element with its number of occurrences
 */
typedef struct {
    bool has_value;
    int64_t element;
    int count;
} bstset_entry_t;

/**
 * @brief Create a new empty multiset
 *
 * @return bstset_t Handle to the created multiset, or NULL on failure.
 *
 * Note: Every handle returned by this library must be released with bstset_destroy().
 */
bstset_t bstset_create(void);

/**
 * @brief Destroy a handle
 *
 * Destroying a view leaves the multiset it came from intact, and vice versa.
 *
 * @param handle The multiset or view to destroy
 */
void bstset_destroy(bstset_t handle);

/**
 * @brief Add occurrences of an element
 *
 * @param handle The multiset
 * @param x The element
 * @param occurrences Number of occurrences to add (>= 0)
 * @param previous If not NULL, receives the count before the call
 * @return BSTSET_OK, or the reason nothing was changed
 */
bstset_status_t bstset_add(bstset_t handle, int64_t x, int occurrences, int *previous);

/**
 * @brief Remove up to `occurrences` occurrences of an element
 *
 * Removing an element outside a view's range is a no-op.
 *
 * @param handle The multiset
 * @param x The element
 * @param occurrences Number of occurrences to remove (>= 0)
 * @param previous If not NULL, receives the count before the call
 */
bstset_status_t bstset_remove(bstset_t handle, int64_t x, int occurrences, int *previous);

/**
 * @brief Number of occurrences of an element; 0 if absent or outside the view
 */
int bstset_count(const_bstset_t handle, int64_t x);

/**
 * @brief Set the number of occurrences of an element
 *
 * @param previous If not NULL, receives the count before the call
 */
bstset_status_t bstset_set_count(bstset_t handle, int64_t x, int count, int *previous);

/**
 * @brief Set the count of an element to new_count only if it is currently old_count
 *
 * @param changed If not NULL, receives whether the count was old_count
 */
bstset_status_t bstset_set_count_if(bstset_t handle, int64_t x, int old_count, int new_count, bool *changed);

/**
 * @brief Total number of occurrences in the multiset or view
 */
uint64_t bstset_size(const_bstset_t handle);

/**
 * @brief Number of distinct elements in the multiset or view
 */
size_t bstset_distinct(const_bstset_t handle);

/**
 * @brief Check if the multiset or view is empty
 */
bool bstset_is_empty(const_bstset_t handle);

/**
 * @brief Remove every element of the view from the underlying multiset
 */
bstset_status_t bstset_clear(bstset_t handle);

/**
 * @brief Count occurrences of elements in the inclusive range [start, end]
 *
 * @return The total count, or 0 if start > end
 */
uint64_t bstset_count_range(const_bstset_t handle, int64_t start, int64_t end);

/**
 * @brief Create a view restricted to a range
 *
 * The view shares storage with `handle`: changes through either are visible in both.
 *
 * @return Handle to the view, or NULL if the range is invalid or on allocation failure
 */
bstset_t bstset_sub(const_bstset_t handle, int64_t lower, bstset_bound_t lower_type, int64_t upper,
                    bstset_bound_t upper_type);

/**
 * @brief Create a view of the elements below `upper`
 */
bstset_t bstset_head(const_bstset_t handle, int64_t upper, bstset_bound_t type);

/**
 * @brief Create a view of the elements above `lower`
 */
bstset_t bstset_tail(const_bstset_t handle, int64_t lower, bstset_bound_t type);

/**
 * @brief Get the smallest entry
 *
 * @return Entry with has_value == false if empty or out of memory
 */
bstset_entry_t bstset_first(const_bstset_t handle);

/**
 * @brief Get the largest entry
 *
 * @return Entry with has_value == false if empty or out of memory
 */
bstset_entry_t bstset_last(const_bstset_t handle);

/**
 * @brief Convert the distinct entries to an ascending array (caller must free)
 *
 * @param handle The multiset
 * @param out_len Output parameter for array length
 * @return Pointer to allocated array, or NULL if empty or on error. Caller must free.
 */
bstset_entry_t* bstset_to_array(const_bstset_t handle, size_t *out_len);

/**
 * @brief Get the amount of currently allocated bytes
 *
 * Shared by a multiset and all of its views.
 *
 * @param handle The multiset
 * @return Number of bytes held by tree nodes
 */
size_t bstset_allocated_memory(const_bstset_t handle);

#ifdef __cplusplus
}
#endif

#endif /* BSTSET_H */
