#include "bytelocker/bytelocker.hpp"
#include <doctest/doctest.h>
#include <sodium.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "fault_helpers.hpp"

using bytelocker::AccessDenied;
using bytelocker::GuardedBuffer;
using bytelocker::LockPolicy;

namespace {

    struct ConfigReset {
        ConfigReset() { bytelocker::configure(bytelocker::Config{}); }
        ~ConfigReset() { bytelocker::configure(bytelocker::Config{}); }
    };

} // namespace

TEST_SUITE("Access Control Gate") {

    TEST_CASE("initial state follows the process default") {
        ConfigReset reset;

        GuardedBuffer unlocked("secret");
        CHECK_FALSE(unlocked.is_locked());

        bytelocker::configure({.default_locked = true});
        GuardedBuffer locked("secret");
        CHECK(locked.is_locked());
    }

    TEST_CASE("explicit policy overrides the process default") {
        ConfigReset reset;

        bytelocker::configure({.default_locked = true});
        GuardedBuffer a("secret", LockPolicy::unlocked());
        CHECK_FALSE(a.is_locked());

        bytelocker::configure({.default_locked = false});
        GuardedBuffer b("secret", LockPolicy::locked());
        CHECK(b.is_locked());
    }

    TEST_CASE("changing the default does not touch existing buffers") {
        ConfigReset reset;

        GuardedBuffer before("secret");
        bytelocker::configure({.default_locked = true});
        CHECK_FALSE(before.is_locked());
        CHECK(before.to_string() == "secret");

        GuardedBuffer after("secret");
        CHECK(after.is_locked());
    }

    TEST_CASE("policy is resolved when it is created") {
        ConfigReset reset;

        auto policy = LockPolicy::process_default();
        bytelocker::configure({.default_locked = true});
        GuardedBuffer buf("secret", policy);
        CHECK_FALSE(buf.is_locked());
    }

    TEST_CASE("lock and unlock are idempotent") {
        GuardedBuffer buf("secret", LockPolicy::unlocked());

        buf.lock();
        buf.lock();
        CHECK(buf.is_locked());

        buf.unlock();
        buf.unlock();
        CHECK_FALSE(buf.is_locked());
        CHECK(buf.to_string() == "secret");
    }

    TEST_CASE("every read of a locked buffer is denied") {
        GuardedBuffer buf("secret", LockPolicy::locked());
        GuardedBuffer other("secret", LockPolicy::unlocked());

        CHECK_THROWS_AS(buf.to_bytes(), AccessDenied);
        CHECK_THROWS_AS(buf.to_string(), AccessDenied);
        CHECK_THROWS_AS(buf.to_hex(), AccessDenied);
        CHECK_THROWS_AS(buf.view(), AccessDenied);
        CHECK_THROWS_AS(buf.equals(other), AccessDenied);
        CHECK_THROWS_AS(buf.equals("secret"), AccessDenied);
        CHECK_THROWS_AS(buf.not_equals(other), AccessDenied);
        CHECK_THROWS_AS(buf.concat(other), AccessDenied);
        CHECK_THROWS_AS(buf.concat("tail"), AccessDenied);
        CHECK_THROWS_AS(buf.repeat(2), AccessDenied);
        CHECK_THROWS_AS(buf.repeat(0), AccessDenied);
        CHECK_THROWS_AS(buf.clone(), AccessDenied);
        CHECK_THROWS_AS(buf.memcmp(other), AccessDenied);
        CHECK_THROWS_AS(buf.compare(other), AccessDenied);
        CHECK_THROWS_AS(buf.is_zero(), AccessDenied);
        CHECK_THROWS_AS(bytelocker::concat("head", buf), AccessDenied);

        CHECK(buf.is_locked());
        buf.unlock();
        CHECK(buf.to_string() == "secret");
    }

    TEST_CASE("a locked right-hand operand is denied too") {
        GuardedBuffer left("left", LockPolicy::unlocked());
        GuardedBuffer right("right", LockPolicy::locked());

        CHECK_THROWS_AS(left.equals(right), AccessDenied);
        CHECK_THROWS_AS(left.concat(right), AccessDenied);
        CHECK_THROWS_AS(left.memcmp(right), AccessDenied);
        CHECK_THROWS_AS(left.compare(right), AccessDenied);

        CHECK_FALSE(left.is_locked());
        CHECK(right.is_locked());
    }

    TEST_CASE("denied equality is reported even for different lengths") {
        GuardedBuffer a("short", LockPolicy::locked());
        GuardedBuffer b("much longer", LockPolicy::unlocked());
        CHECK_THROWS_AS(a.equals(b), AccessDenied);
        CHECK_THROWS_AS(b.equals(a), AccessDenied);
    }

    TEST_CASE("access denied message asks for an unlock") {
        GuardedBuffer buf("secret", LockPolicy::locked());
        try {
            (void)buf.to_string();
            FAIL("expected AccessDenied");
        } catch (const AccessDenied &e) {
            CHECK(std::string(e.what()) == "Unlock the buffer before accessing the data");
        }
    }

    TEST_CASE("metadata is available while locked") {
        for (size_t size : {0, 1, 3, 64, 5000}) {
            std::vector<uint8_t> data(size, 0x00);
            GuardedBuffer buf(data, LockPolicy::locked());
            CHECK(buf.length() == size);
            CHECK(buf.as_bool() == (size > 0));
            CHECK(buf.empty() == (size == 0));
            CHECK(static_cast<bool>(buf) == (size > 0));
            buf.unlock();
            CHECK(buf.length() == size);
        }
    }

    TEST_CASE("unlock, read, lock, unlock, read yields the same value") {
        GuardedBuffer buf("round trip", LockPolicy::unlocked());
        auto first = buf.to_bytes();
        buf.lock();
        buf.unlock();
        CHECK(buf.to_bytes() == first);
    }

    TEST_CASE("zero length buffers obey the gate") {
        GuardedBuffer empty("", LockPolicy::locked());
        CHECK(empty.length() == 0);
        CHECK_FALSE(empty.as_bool());
        CHECK_THROWS_AS(empty.to_string(), AccessDenied);

        empty.unlock();
        CHECK(empty.to_string().empty());
        CHECK(empty.to_hex().empty());
    }

    TEST_CASE("locked payload faults when touched directly") {
        auto result = fault_test::run_in_child([] {
            GuardedBuffer buf("secret", LockPolicy::unlocked());
            auto view = buf.view();
            buf.lock();
            volatile const uint8_t *p = view.data();
            volatile uint8_t leaked = p[0];
            (void)leaked;
        });
        CHECK(result.signaled);
    }

    TEST_CASE("unlocked payload is read-only") {
        auto result = fault_test::run_in_child([] {
            GuardedBuffer buf("secret", LockPolicy::unlocked());
            auto view = buf.view();
            volatile uint8_t *p = const_cast<uint8_t *>(view.data());
            p[0] = 'S';
        });
        CHECK(result.signaled);
    }

    TEST_CASE("reading past the end of a buffer faults") {
        auto result = fault_test::run_in_child([] {
            GuardedBuffer buf("abc", LockPolicy::unlocked());
            auto view = buf.view();
            volatile const uint8_t *p = view.data();
            volatile uint8_t leaked = p[view.size()];
            (void)leaked;
        });
        CHECK(result.signaled);
    }

    TEST_CASE("destroying a buffer with a corrupted canary aborts") {
        auto result = fault_test::run_in_child([] {
            GuardedBuffer buf("abc", LockPolicy::unlocked());
            auto *payload = const_cast<uint8_t *>(buf.view().data());
            sodium_mprotect_readwrite(payload - bytelocker::memory::CANARY_BYTES);
            payload[-1] ^= 0x80;
        });
        CHECK(result.signaled);
        CHECK_FALSE(result.exited);
    }

    TEST_CASE("reading a buffer with a corrupted canary aborts") {
        auto result = fault_test::run_in_child([] {
            GuardedBuffer buf("abc", LockPolicy::unlocked());
            auto *payload = const_cast<uint8_t *>(buf.view().data());
            sodium_mprotect_readwrite(payload - bytelocker::memory::CANARY_BYTES);
            *(payload - bytelocker::memory::CANARY_BYTES / 2) ^= 0x01;
            (void)buf.to_string();
        });
        CHECK(result.signaled);
    }
}

TEST_SUITE("Unlock Scope") {

    TEST_CASE("scope unlocks and relocks") {
        GuardedBuffer buf("scoped", LockPolicy::locked());
        {
            bytelocker::UnlockScope scope(buf);
            CHECK_FALSE(buf.is_locked());
            CHECK(buf.to_string() == "scoped");
        }
        CHECK(buf.is_locked());
    }

    TEST_CASE("scope leaves an unlocked buffer unlocked") {
        GuardedBuffer buf("scoped", LockPolicy::unlocked());
        { bytelocker::UnlockScope scope(buf); }
        CHECK_FALSE(buf.is_locked());
    }

    TEST_CASE("scope relocks when an exception leaves it") {
        GuardedBuffer buf("scoped", LockPolicy::locked());
        CHECK_THROWS_AS(
            [&] {
                bytelocker::UnlockScope scope(buf);
                throw std::runtime_error("boom");
            }(),
            std::runtime_error);
        CHECK(buf.is_locked());
    }
}
