#pragma once

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace bytelocker::utils {

    inline void ensure_sodium_init() {
        static std::once_flag sodium_flag;
        static int status = -1;
        std::call_once(sodium_flag, []() { status = sodium_init(); });

        if (status < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    // Report an integrity failure and terminate. Never returns.
    [[noreturn]] void fatal(const char *reason) noexcept;

} // namespace bytelocker::utils
