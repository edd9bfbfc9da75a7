#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bytelocker/config.hpp"
#include "bytelocker/memory/guarded_region.hpp"

namespace bytelocker {

    // Secret bytes kept in a page-guarded region.
    //
    // The payload is fixed at construction. While locked the data pages are PROT_NONE and every
    // read throws AccessDenied; while unlocked they are read-only. length(), empty() and
    // as_bool() never touch the payload and work in either state.
    //
    // Not thread-safe: lock()/unlock() and reads on one instance must be serialized by the caller.
    class GuardedBuffer {
      public:
        GuardedBuffer() noexcept = default;

        explicit GuardedBuffer(std::span<const uint8_t> bytes, LockPolicy policy = LockPolicy::process_default());
        explicit GuardedBuffer(std::string_view bytes, LockPolicy policy = LockPolicy::process_default());

        ~GuardedBuffer() = default;

        GuardedBuffer(const GuardedBuffer &) = delete;
        GuardedBuffer &operator=(const GuardedBuffer &) = delete;

        GuardedBuffer(GuardedBuffer &&other) noexcept;
        GuardedBuffer &operator=(GuardedBuffer &&other) noexcept;

        // Copies `source`, then overwrites the caller's buffer with zeros. `source` keeps its size.
        static GuardedBuffer copy_and_wipe(std::span<uint8_t> source,
                                           LockPolicy policy = LockPolicy::process_default());
        static GuardedBuffer copy_and_wipe(std::string &source, LockPolicy policy = LockPolicy::process_default());

        // Allocate `length` bytes and let `fill` write them exactly once, before the lock state is
        // applied. `fill` receives a std::span<uint8_t> over the guarded payload.
        template <typename Fill>
        static GuardedBuffer build(size_t length, Fill &&fill, LockPolicy policy = LockPolicy::process_default()) {
            GuardedBuffer out;
            if (length > 0) {
                out.region_ = memory::GuardedRegion::allocate(length);
                out.length_ = length;
            }
            std::forward<Fill>(fill)(std::span<uint8_t>(out.region_.data(), out.length_));
            out.apply(policy.start_locked());
            return out;
        }

        void lock();
        void unlock();
        [[nodiscard]] bool is_locked() const noexcept { return locked_; }

        [[nodiscard]] size_t length() const noexcept { return length_; }
        [[nodiscard]] bool empty() const noexcept { return length_ == 0; }
        [[nodiscard]] bool as_bool() const noexcept { return length_ > 0; }
        explicit operator bool() const noexcept { return as_bool(); }

        // Unprotected copies of the payload. The caller owns whatever leaves the region.
        std::vector<uint8_t> to_bytes() const;
        std::string to_string() const;
        std::string to_hex() const;

        // Borrowed view of the protected payload; invalid once the buffer is locked or destroyed
        std::span<const uint8_t> view() const;

        // Different lengths compare unequal without touching the bytes. Equal lengths are compared
        // in constant time, so only the length leaks through timing.
        bool equals(const GuardedBuffer &other) const;
        bool equals(std::span<const uint8_t> other) const;
        bool equals(std::string_view other) const;
        bool not_equals(const GuardedBuffer &other) const { return !equals(other); }
        bool not_equals(std::span<const uint8_t> other) const { return !equals(other); }
        bool not_equals(std::string_view other) const { return !equals(other); }

        GuardedBuffer concat(const GuardedBuffer &other, LockPolicy policy = LockPolicy::process_default()) const;
        GuardedBuffer concat(std::span<const uint8_t> other, LockPolicy policy = LockPolicy::process_default()) const;
        GuardedBuffer concat(std::string_view other, LockPolicy policy = LockPolicy::process_default()) const;

        // `count` copies back to back; zero gives an empty buffer
        GuardedBuffer repeat(size_t count, LockPolicy policy = LockPolicy::process_default()) const;

        GuardedBuffer clone(LockPolicy policy = LockPolicy::process_default()) const;

        // Strict constant-time comparison, see utils::memcmp for the length rules
        bool memcmp(const GuardedBuffer &other, std::optional<size_t> length = std::nullopt) const;
        bool memcmp(std::span<const uint8_t> other, std::optional<size_t> length = std::nullopt) const;

        // Constant-time little-endian numeric comparison: -1, 0 or 1
        int compare(const GuardedBuffer &other) const;
        int compare(std::span<const uint8_t> other) const;

        bool is_zero() const;

      private:
        // Throws AccessDenied when locked, otherwise checks the canary and returns the payload
        std::span<const uint8_t> readable() const;

        void apply(bool locked);

        memory::GuardedRegion region_;
        size_t length_ = 0;
        bool locked_ = false;
    };

    // Plain bytes followed by a guarded buffer
    GuardedBuffer concat(std::span<const uint8_t> prefix, const GuardedBuffer &buffer,
                         LockPolicy policy = LockPolicy::process_default());
    GuardedBuffer concat(std::string_view prefix, const GuardedBuffer &buffer,
                         LockPolicy policy = LockPolicy::process_default());

} // namespace bytelocker
