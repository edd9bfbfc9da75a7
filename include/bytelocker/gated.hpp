#pragma once

#include <concepts>
#include <cstddef>
#include <string>

#include "bytelocker/guarded_buffer.hpp"

namespace bytelocker {

    // Anything that keeps bytes behind a lock/unlock gate
    template <typename T>
    concept GatedByteContainer = requires(T &mut, const T &c) {
        mut.lock();
        mut.unlock();
        { c.is_locked() } -> std::convertible_to<bool>;
        { c.length() } -> std::convertible_to<size_t>;
        { c.as_bool() } -> std::convertible_to<bool>;
        { c.to_hex() } -> std::convertible_to<std::string>;
        { c.equals(c) } -> std::convertible_to<bool>;
        c.to_bytes();
    };

    static_assert(GatedByteContainer<GuardedBuffer>);

    // Unlocks a container for the lifetime of the scope and puts back the previous state on exit,
    // including exit by exception.
    template <GatedByteContainer T> class UnlockScope {
      public:
        explicit UnlockScope(T &target) : target_(target), was_locked_(target.is_locked()) { target_.unlock(); }

        ~UnlockScope() {
            if (was_locked_) {
                target_.lock();
            }
        }

        UnlockScope(const UnlockScope &) = delete;
        UnlockScope &operator=(const UnlockScope &) = delete;

      private:
        T &target_;
        bool was_locked_;
    };

} // namespace bytelocker
