#include "bytelocker/crypto/secretbox.hpp"

#include <utility>

#include "bytelocker/utils/sodium_utils.hpp"

namespace bytelocker::crypto::secretbox {

    GuardedBuffer keygen(LockPolicy policy) {
        utils::ensure_sodium_init();
        return GuardedBuffer::build(
            KEYBYTES, [](std::span<uint8_t> out) { crypto_secretbox_keygen(out.data()); }, policy);
    }

    std::vector<uint8_t> nonce() {
        utils::ensure_sodium_init();
        std::vector<uint8_t> n(NONCEBYTES);
        randombytes_buf(n.data(), n.size());
        return n;
    }

    SealResult seal(std::span<const uint8_t> message, std::span<const uint8_t> nonce, const GuardedBuffer &key) {
        auto key_bytes = key.view();
        if (key_bytes.size() != KEYBYTES) {
            return {false, {}, "Invalid key size"};
        }
        if (nonce.size() != NONCEBYTES) {
            return {false, {}, "Invalid nonce size"};
        }

        utils::ensure_sodium_init();
        std::vector<uint8_t> ciphertext(message.size() + MACBYTES);
        if (crypto_secretbox_easy(ciphertext.data(), message.data(), message.size(), nonce.data(), key_bytes.data()) !=
            0) {
            return {false, {}, "SecretBox encryption failed"};
        }
        return {true, std::move(ciphertext), ""};
    }

    SealResult seal(const GuardedBuffer &message, std::span<const uint8_t> nonce, const GuardedBuffer &key) {
        return seal(message.view(), nonce, key);
    }

    OpenResult open(std::span<const uint8_t> ciphertext, std::span<const uint8_t> nonce, const GuardedBuffer &key,
                    LockPolicy policy) {
        auto key_bytes = key.view();
        if (key_bytes.size() != KEYBYTES) {
            return {false, std::nullopt, "Invalid key size"};
        }
        if (nonce.size() != NONCEBYTES) {
            return {false, std::nullopt, "Invalid nonce size"};
        }
        if (ciphertext.size() < MACBYTES) {
            return {false, std::nullopt, "Ciphertext too short"};
        }

        utils::ensure_sodium_init();
        bool authentic = false;
        auto plaintext = GuardedBuffer::build(
            ciphertext.size() - MACBYTES,
            [&](std::span<uint8_t> out) {
                authentic = crypto_secretbox_open_easy(out.data(), ciphertext.data(), ciphertext.size(),
                                                       nonce.data(), key_bytes.data()) == 0;
            },
            policy);
        if (!authentic) {
            return {false, std::nullopt, "SecretBox decryption failed"};
        }
        return {true, std::move(plaintext), ""};
    }

} // namespace bytelocker::crypto::secretbox
