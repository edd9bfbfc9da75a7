#include <iostream>
#include <string>
#include <vector>

#include "bytelocker/bytelocker.hpp"

using bytelocker::GuardedBuffer;
using bytelocker::LockPolicy;

void demo_lock_unlock() {
    std::cout << "\n=== Lock / unlock ===" << std::endl;

    std::string password = "correct horse battery staple";
    auto secret = GuardedBuffer::copy_and_wipe(password, LockPolicy::locked());
    bool wiped = password == std::string(password.size(), '\0');
    std::cout << "Source after copy: " << (wiped ? "wiped" : "NOT wiped") << std::endl;
    std::cout << "Length while locked: " << secret.length() << std::endl;

    try {
        std::cout << secret.to_string() << std::endl;
    } catch (const bytelocker::AccessDenied &e) {
        std::cout << "Read while locked: " << e.what() << std::endl;
    }

    {
        bytelocker::UnlockScope scope(secret);
        std::cout << "Hex while unlocked: " << secret.to_hex() << std::endl;
    }
    std::cout << "Locked again: " << (secret.is_locked() ? "yes" : "no") << std::endl;
}

void demo_value_semantics() {
    std::cout << "\n=== Value semantics ===" << std::endl;

    GuardedBuffer foo("foo", LockPolicy::unlocked());
    GuardedBuffer bar("bar", LockPolicy::unlocked());

    auto joined = foo.concat(bar, LockPolicy::unlocked());
    auto repeated = GuardedBuffer("ab", LockPolicy::unlocked()).repeat(3, LockPolicy::unlocked());

    std::cout << "foo + bar = " << joined.to_string() << " (" << joined.length() << " bytes)" << std::endl;
    std::cout << "ab x 3    = " << repeated.to_string() << std::endl;
    std::cout << "foo == bar: " << (foo.equals(bar) ? "true" : "false") << std::endl;
}

void demo_secretbox() {
    std::cout << "\n=== SecretBox with a guarded key ===" << std::endl;

    auto key = bytelocker::crypto::secretbox::keygen(LockPolicy::unlocked());
    auto nonce = bytelocker::crypto::secretbox::nonce();
    GuardedBuffer message("Hello, bytelocker!", LockPolicy::unlocked());

    auto sealed = bytelocker::crypto::secretbox::seal(message, nonce, key);
    if (!sealed.success) {
        std::cerr << "Encryption failed: " << sealed.error_message << std::endl;
        return;
    }
    key.lock();
    std::cout << "Ciphertext: " << bytelocker::utils::to_hex(sealed.ciphertext) << std::endl;

    key.unlock();
    auto opened = bytelocker::crypto::secretbox::open(sealed.ciphertext, nonce, key, LockPolicy::unlocked());
    key.lock();
    if (!opened.success) {
        std::cerr << "Decryption failed: " << opened.error_message << std::endl;
        return;
    }
    std::cout << "Plaintext:  " << opened.plaintext->to_string() << std::endl;
}

int main() {
    bytelocker::configure({.default_locked = true});

    demo_lock_unlock();
    demo_value_semantics();
    demo_secretbox();

    return 0;
}
