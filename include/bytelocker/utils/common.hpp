#pragma once

// Helpers over plain, unguarded byte buffers

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bytelocker::utils {

    // Lowercase hex
    std::string to_hex(std::span<const uint8_t> data);

    // Accepts upper and lower case. Odd length or a non-hex character yields an empty vector.
    std::vector<uint8_t> from_hex(std::string_view hex);

    // Constant-time equality of the first `length` bytes. Without a length both buffers must be
    // the same size; throws LengthMismatch otherwise, or when `length` exceeds either buffer.
    bool memcmp(std::span<const uint8_t> a, std::span<const uint8_t> b, std::optional<size_t> length = std::nullopt);

    // Constant-time comparison of two little-endian numbers of equal size: -1, 0 or 1
    int compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

    bool is_zero(std::span<const uint8_t> data);

    // Little-endian increment in place, wrapping on overflow
    void increment(std::vector<uint8_t> &number);

    // a += b mod 2^(8 * size), both little-endian and of equal size
    void add(std::vector<uint8_t> &a, const std::vector<uint8_t> &b);

    // Zero the buffer in place, keeping its length
    void memzero(std::vector<uint8_t> &data);
    void memzero(std::string &data);

} // namespace bytelocker::utils
