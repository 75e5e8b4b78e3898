/**
 * @file tracking_allocator.hpp
 * @brief An allocator that tracks memory usage across threads
 *
 * This allocator wraps around std::malloc and maintains a running count
 * of allocated and deallocated bytes in a shared atomic counter. Nodes of one
 * multiset are allocated and freed by whichever thread happens to build or
 * drop a tree version, so the counter is updated with relaxed atomics.
 */

#ifndef TRACKING_ALLOCATOR_HPP
#define TRACKING_ALLOCATOR_HPP

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <memory>
#include <new>

/**
 * @brief A tracking allocator that monitors memory usage
 *
 * Holds a reference to an external std::atomic<std::size_t> that counts the
 * bytes currently allocated. The counter must outlive every allocation made
 * through the allocator and all of its rebound copies.
 *
 * @tparam T The type of objects to allocate
 */
template<typename T>
class tracking_allocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using counter_type = std::atomic<std::size_t>;

    template<typename U>
    struct rebind {
        using other = tracking_allocator<U>;
    };

private:
    counter_type& bytes_allocated_;

public:
    /**
     * @brief Constructs a tracking allocator
     * @param bytes_allocated Reference to the counter that tracks allocated bytes
     */
    explicit tracking_allocator(counter_type& bytes_allocated) noexcept
        : bytes_allocated_(bytes_allocated) {}

    tracking_allocator(const tracking_allocator& other) noexcept = default;

    /**
     * @brief Converting copy constructor, used by std::allocate_shared to rebind
     */
    template<typename U>
    tracking_allocator(const tracking_allocator<U>& other) noexcept
        : bytes_allocated_(other.get_counter()) {}

    // The counter is a reference and stays bound to the same object.
    tracking_allocator& operator=(const tracking_allocator&) = delete;

    /**
     * @brief Allocates memory for n objects of type T
     * @param n Number of objects to allocate space for
     * @throws std::bad_alloc if the request overflows or malloc fails
     */
    [[nodiscard]] T* allocate(size_type n) {
        if (n > max_size()) {
            throw std::bad_alloc{};
        }

        const size_type bytes = n * sizeof(T);
        void* ptr = std::malloc(bytes == 0 ? 1 : bytes);

        if (!ptr) {
            throw std::bad_alloc{};
        }

        bytes_allocated_.fetch_add(bytes, std::memory_order_relaxed);

        return static_cast<T*>(ptr);
    }

    /**
     * @brief Deallocates memory
     * @param ptr Pointer to the memory to deallocate
     * @param n Number of objects that were allocated
     */
    void deallocate(T* ptr, size_type n) noexcept {
        if (ptr == nullptr) return;

        bytes_allocated_.fetch_sub(n * sizeof(T), std::memory_order_relaxed);

        std::free(ptr);
    }

    size_type max_size() const noexcept {
        return std::numeric_limits<size_type>::max() / sizeof(T);
    }

    /**
     * @brief Gets a reference to the byte counter (for rebind)
     */
    counter_type& get_counter() const noexcept {
        return bytes_allocated_;
    }

    template<typename U>
    bool operator==(const tracking_allocator<U>& other) const noexcept {
        return &bytes_allocated_ == &other.get_counter();
    }
};

#endif // TRACKING_ALLOCATOR_HPP
