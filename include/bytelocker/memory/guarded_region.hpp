#pragma once

#include <cstddef>
#include <cstdint>

namespace bytelocker::memory {

    // Byte every fresh payload reads as until written (libsodium's garbage value)
    inline constexpr uint8_t SENTINEL_BYTE = 0xdb;

    // Size of the canary stored directly in front of the payload
    inline constexpr size_t CANARY_BYTES = 16;

    // Page-guarded allocation for secret bytes.
    //
    // Layout: [guard page][canary][payload][guard page]. The payload ends exactly at the trailing
    // guard page, so reading one byte past it faults. The region is mlock'ed and excluded from
    // core dumps where the platform allows it.
    //
    // A fresh region is read-write. Callers switch protection with the protect_* members; the
    // canary can only be checked while the region is readable.
    class GuardedRegion {
      public:
        GuardedRegion() noexcept = default;
        ~GuardedRegion();

        GuardedRegion(const GuardedRegion &) = delete;
        GuardedRegion &operator=(const GuardedRegion &) = delete;

        GuardedRegion(GuardedRegion &&other) noexcept;
        GuardedRegion &operator=(GuardedRegion &&other) noexcept;

        // Throws InvalidLength for zero and std::bad_alloc when the mapping fails
        static GuardedRegion allocate(size_t length);

        static size_t page_size() noexcept;

        uint8_t *data() noexcept { return payload(); }
        const uint8_t *data() const noexcept { return payload(); }
        [[nodiscard]] size_t size() const noexcept { return size_; }
        [[nodiscard]] bool empty() const noexcept { return base_ == nullptr; }

        // Any failure of the underlying mprotect terminates the process
        void protect_noaccess() noexcept;
        void protect_readonly() noexcept;
        void protect_readwrite() noexcept;

        // Terminates the process on mismatch
        void verify_canary() const noexcept;

        // Check canary, zero the payload and unmap. Safe to call twice.
        void release() noexcept;

      private:
        GuardedRegion(uint8_t *base, size_t size) noexcept : base_(base), size_(size) {}

        uint8_t *payload() const noexcept { return base_ == nullptr ? nullptr : base_ + CANARY_BYTES; }

        uint8_t *base_ = nullptr;
        size_t size_ = 0;
    };

} // namespace bytelocker::memory
