#include "bytelocker/utils/common.hpp"

#include <sodium.h>

#include "bytelocker/errors.hpp"
#include "bytelocker/memory/wipe.hpp"

namespace bytelocker::utils {

    namespace {

        void require_same_size(size_t a, size_t b, const char *what) {
            if (a != b) {
                throw LengthMismatch(std::string(what) + ": buffers differ in length (" + std::to_string(a) +
                                     " != " + std::to_string(b) + ")");
            }
        }

    } // namespace

    std::string to_hex(std::span<const uint8_t> data) {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.pop_back();
        return hex;
    }

    std::vector<uint8_t> from_hex(std::string_view hex) {
        if (hex.size() % 2 != 0) {
            return {};
        }

        std::vector<uint8_t> bytes(hex.size() / 2);
        size_t bin_len = 0;
        const char *end = nullptr;
        if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(), nullptr, &bin_len, &end) != 0) {
            return {};
        }
        if (end != hex.data() + hex.size() || bin_len != bytes.size()) {
            return {};
        }
        return bytes;
    }

    bool memcmp(std::span<const uint8_t> a, std::span<const uint8_t> b, std::optional<size_t> length) {
        size_t n = 0;
        if (length) {
            if (*length > a.size() || *length > b.size()) {
                throw LengthMismatch("memcmp: length " + std::to_string(*length) + " exceeds buffer size");
            }
            n = *length;
        } else {
            require_same_size(a.size(), b.size(), "memcmp");
            n = a.size();
        }
        if (n == 0) {
            return true;
        }
        return sodium_memcmp(a.data(), b.data(), n) == 0;
    }

    int compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
        require_same_size(a.size(), b.size(), "compare");
        if (a.empty()) {
            return 0;
        }
        return sodium_compare(a.data(), b.data(), a.size());
    }

    bool is_zero(std::span<const uint8_t> data) {
        if (data.empty()) {
            return true;
        }
        return sodium_is_zero(data.data(), data.size()) == 1;
    }

    void increment(std::vector<uint8_t> &number) {
        if (!number.empty()) {
            sodium_increment(number.data(), number.size());
        }
    }

    void add(std::vector<uint8_t> &a, const std::vector<uint8_t> &b) {
        require_same_size(a.size(), b.size(), "add");
        if (!a.empty()) {
            sodium_add(a.data(), b.data(), a.size());
        }
    }

    void memzero(std::vector<uint8_t> &data) { memory::wipe_container(data); }

    void memzero(std::string &data) { memory::wipe_container(data); }

} // namespace bytelocker::utils
