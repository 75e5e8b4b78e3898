/**
 * @file bstset.cpp
 * @brief C API implementation for bstset
 */

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "bstset.h"
#include "BST/TreeMultiset.hpp"

using Int64Multiset = TreeMultiset<std::int64_t>;

struct BstSet : Int64Multiset {
    using Int64Multiset::Int64Multiset;

    explicit BstSet(Int64Multiset view) : Int64Multiset{std::move(view)} {}
};

namespace {

BoundType to_bound_type(bstset_bound_t type) {
    return type == BSTSET_CLOSED ? BoundType::CLOSED : BoundType::OPEN;
}

bstset_entry_t to_c_entry(const std::optional<Int64Multiset::Entry>& entry) {
    if (entry.has_value()) {
        return {true, entry->element, entry->count};
    } else {
        return {false, 0, 0};
    }
}

template<typename F>
bstset_status_t translate_errors(F&& f) {
    try {
        f();
        return BSTSET_OK;
    } catch (const ConcurrentModificationError&) {
        return BSTSET_CONCURRENT_MODIFICATION;
    } catch (const std::invalid_argument&) {
        return BSTSET_INVALID_ARGUMENT;
    } catch (const std::bad_alloc&) {
        return BSTSET_OUT_OF_MEMORY;
    }
}

// Iterator paths allocate, so a failed read reports "no entry".
template<typename F>
bstset_entry_t read_entry(F&& f) {
    try {
        return to_c_entry(f());
    } catch (const std::bad_alloc&) {
        return {false, 0, 0};
    }
}

template<typename F>
bstset_t make_view(F&& f) {
    bstset_t p = static_cast<bstset_t>(malloc(sizeof(BstSet)));
    if (p == nullptr) {
        return nullptr;
    }
    try {
        std::construct_at(p, f());
        return p;
    } catch (const std::exception&) {
        free(p);
        return nullptr;
    }
}

} // namespace

bstset_t bstset_create() {
    return make_view([] { return Int64Multiset{}; });
}

void bstset_destroy(bstset_t handle) {
    if (handle != nullptr) {
        std::destroy_at(handle);
        free(handle);
    }
}

bstset_status_t bstset_add(bstset_t handle, int64_t x, int occurrences, int *previous) {
    assert(handle != nullptr);
    return translate_errors([&] {
        const int before = handle->add(x, occurrences);
        if (previous != nullptr) {
            *previous = before;
        }
    });
}

bstset_status_t bstset_remove(bstset_t handle, int64_t x, int occurrences, int *previous) {
    assert(handle != nullptr);
    return translate_errors([&] {
        const int before = handle->remove(x, occurrences);
        if (previous != nullptr) {
            *previous = before;
        }
    });
}

int bstset_count(const_bstset_t handle, int64_t x) {
    assert(handle != nullptr);
    return handle->count(x);
}

bstset_status_t bstset_set_count(bstset_t handle, int64_t x, int count, int *previous) {
    assert(handle != nullptr);
    return translate_errors([&] {
        const int before = handle->set_count(x, count);
        if (previous != nullptr) {
            *previous = before;
        }
    });
}

bstset_status_t bstset_set_count_if(bstset_t handle, int64_t x, int old_count, int new_count, bool *changed) {
    assert(handle != nullptr);
    return translate_errors([&] {
        const bool done = handle->set_count(x, old_count, new_count);
        if (changed != nullptr) {
            *changed = done;
        }
    });
}

uint64_t bstset_size(const_bstset_t handle) {
    assert(handle != nullptr);
    return handle->size();
}

size_t bstset_distinct(const_bstset_t handle) {
    assert(handle != nullptr);
    return handle->distinct_elements();
}

bool bstset_is_empty(const_bstset_t handle) {
    assert(handle != nullptr);
    return handle->empty();
}

bstset_status_t bstset_clear(bstset_t handle) {
    assert(handle != nullptr);
    return translate_errors([&] { handle->clear(); });
}

uint64_t bstset_count_range(const_bstset_t handle, int64_t start, int64_t end) {
    assert(handle != nullptr);
    if (start > end) {
        return 0;
    }
    return handle->sub_multiset(start, BoundType::CLOSED, end, BoundType::CLOSED).size();
}

bstset_t bstset_sub(const_bstset_t handle, int64_t lower, bstset_bound_t lower_type, int64_t upper,
                    bstset_bound_t upper_type) {
    assert(handle != nullptr);
    return make_view([&] {
        return handle->sub_multiset(lower, to_bound_type(lower_type), upper, to_bound_type(upper_type));
    });
}

bstset_t bstset_head(const_bstset_t handle, int64_t upper, bstset_bound_t type) {
    assert(handle != nullptr);
    return make_view([&] { return handle->head_multiset(upper, to_bound_type(type)); });
}

bstset_t bstset_tail(const_bstset_t handle, int64_t lower, bstset_bound_t type) {
    assert(handle != nullptr);
    return make_view([&] { return handle->tail_multiset(lower, to_bound_type(type)); });
}

bstset_entry_t bstset_first(const_bstset_t handle) {
    assert(handle != nullptr);
    return read_entry([&] { return handle->first_entry(); });
}

bstset_entry_t bstset_last(const_bstset_t handle) {
    assert(handle != nullptr);
    return read_entry([&] { return handle->last_entry(); });
}

bstset_entry_t* bstset_to_array(const_bstset_t handle, size_t *out_len) {
    assert(handle != nullptr);
    assert(out_len != nullptr);
    // one snapshot for both the length and the contents
    std::vector<Int64Multiset::Entry> entries{};
    try {
        for (const auto& entry : *handle) {
            entries.push_back(entry);
        }
    } catch (const std::bad_alloc&) {
        *out_len = 0;
        return nullptr;
    }
    *out_len = 0;
    if (entries.empty()) {
        return nullptr;
    }
    bstset_entry_t* array = static_cast<bstset_entry_t*>(malloc(entries.size() * sizeof(bstset_entry_t)));
    if (array == nullptr) {
        return nullptr;
    }
    for (std::size_t i = 0; i < entries.size(); ++i) {
        array[i] = bstset_entry_t{true, entries[i].element, entries[i].count};
    }
    *out_len = entries.size();
    return array;
}

size_t bstset_allocated_memory(const_bstset_t handle) {
    assert(handle != nullptr);
    return handle->get_allocated_bytes();
}
