#pragma once

#include <cstddef>
#include <cstdint>

#include "bytelocker/config.hpp"
#include "bytelocker/guarded_buffer.hpp"

namespace bytelocker::crypto::random {

    // `size` CSPRNG bytes written straight into guarded memory. Zero throws InvalidLength.
    GuardedBuffer bytes(size_t size, LockPolicy policy = LockPolicy::process_default());

    // Uniform value in [0, upper_bound); 0 when upper_bound < 2
    uint32_t uniform(uint32_t upper_bound);

} // namespace bytelocker::crypto::random
