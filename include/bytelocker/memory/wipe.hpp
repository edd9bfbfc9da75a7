#pragma once

// Secure memory wiping that cannot be optimized away

#include <cstddef>
#include <cstdint>

#include <sodium.h>

namespace bytelocker::memory {

    // Zero `size` bytes at `secret`; the store is never elided
    inline void wipe(void *secret, size_t size) noexcept {
        if (secret == nullptr || size == 0) {
            return;
        }
        sodium_memzero(secret, size);
    }

    template <typename T, size_t N> inline void wipe(T (&arr)[N]) noexcept { wipe(arr, sizeof(arr)); }

    // Zero a contiguous container in place, keeping its length
    template <typename Container> inline void wipe_container(Container &c) noexcept {
        if (!c.empty()) {
            wipe(c.data(), c.size() * sizeof(typename Container::value_type));
        }
    }

} // namespace bytelocker::memory
