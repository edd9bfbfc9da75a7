#pragma once

// XSalsa20-Poly1305 secret-key authenticated encryption over guarded keys and plaintext

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <sodium.h>

#include "bytelocker/config.hpp"
#include "bytelocker/guarded_buffer.hpp"

namespace bytelocker::crypto::secretbox {

    inline constexpr size_t KEYBYTES = crypto_secretbox_KEYBYTES;
    inline constexpr size_t NONCEBYTES = crypto_secretbox_NONCEBYTES;
    inline constexpr size_t MACBYTES = crypto_secretbox_MACBYTES;

    struct SealResult {
        bool success;
        std::vector<uint8_t> ciphertext; // MAC || ciphertext
        std::string error_message;
    };

    struct OpenResult {
        bool success;
        std::optional<GuardedBuffer> plaintext;
        std::string error_message;
    };

    GuardedBuffer keygen(LockPolicy policy = LockPolicy::process_default());

    std::vector<uint8_t> nonce();

    // The key must be unlocked; a locked key throws AccessDenied
    SealResult seal(std::span<const uint8_t> message, std::span<const uint8_t> nonce, const GuardedBuffer &key);
    SealResult seal(const GuardedBuffer &message, std::span<const uint8_t> nonce, const GuardedBuffer &key);

    // Decrypts directly into guarded memory
    OpenResult open(std::span<const uint8_t> ciphertext, std::span<const uint8_t> nonce, const GuardedBuffer &key,
                    LockPolicy policy = LockPolicy::process_default());

} // namespace bytelocker::crypto::secretbox
