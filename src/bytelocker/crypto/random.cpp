#include "bytelocker/crypto/random.hpp"

#include <sodium.h>

#include "bytelocker/errors.hpp"
#include "bytelocker/utils/sodium_utils.hpp"

namespace bytelocker::crypto::random {

    GuardedBuffer bytes(size_t size, LockPolicy policy) {
        if (size == 0) {
            throw InvalidLength("random bytes: length must be at least 1");
        }
        utils::ensure_sodium_init();
        return GuardedBuffer::build(
            size, [](std::span<uint8_t> out) { randombytes_buf(out.data(), out.size()); }, policy);
    }

    uint32_t uniform(uint32_t upper_bound) {
        utils::ensure_sodium_init();
        return randombytes_uniform(upper_bound);
    }

} // namespace bytelocker::crypto::random
