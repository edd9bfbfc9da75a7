#include "bytelocker/memory/guarded_region.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <mutex>
#include <new>
#include <utility>

#include <sodium.h>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "bytelocker/errors.hpp"
#include "bytelocker/utils/sodium_utils.hpp"

namespace bytelocker::memory {

    namespace {

        // One random canary per process, drawn on first allocation
        const std::array<uint8_t, CANARY_BYTES> &process_canary() {
            static std::once_flag canary_flag;
            static std::array<uint8_t, CANARY_BYTES> canary{};
            std::call_once(canary_flag, []() { randombytes_buf(canary.data(), canary.size()); });
            return canary;
        }

    } // namespace

    GuardedRegion::~GuardedRegion() { release(); }

    GuardedRegion::GuardedRegion(GuardedRegion &&other) noexcept
        : base_(std::exchange(other.base_, nullptr)), size_(std::exchange(other.size_, 0)) {}

    GuardedRegion &GuardedRegion::operator=(GuardedRegion &&other) noexcept {
        if (this != &other) {
            release();
            base_ = std::exchange(other.base_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    GuardedRegion GuardedRegion::allocate(size_t length) {
        if (length == 0) {
            throw InvalidLength("Guarded allocation requires at least one byte");
        }
        if (length > SIZE_MAX - CANARY_BYTES) {
            throw std::bad_alloc();
        }

        utils::ensure_sodium_init();
        const auto &canary = process_canary();

        // sodium_malloc right-aligns the block against the trailing guard page and fills it with
        // the garbage value, so the payload starts out as SENTINEL_BYTE.
        auto *base = static_cast<uint8_t *>(sodium_malloc(CANARY_BYTES + length));
        if (base == nullptr) {
            throw std::bad_alloc();
        }
        std::copy(canary.begin(), canary.end(), base);
        return GuardedRegion(base, length);
    }

    size_t GuardedRegion::page_size() noexcept {
#if defined(_WIN32)
        SYSTEM_INFO info;
        GetSystemInfo(&info);
        return static_cast<size_t>(info.dwPageSize);
#else
        long size = sysconf(_SC_PAGESIZE);
        return size > 0 ? static_cast<size_t>(size) : 4096;
#endif
    }

    void GuardedRegion::protect_noaccess() noexcept {
        if (base_ != nullptr && sodium_mprotect_noaccess(base_) != 0) {
            utils::fatal("mprotect(PROT_NONE) failed on guarded region");
        }
    }

    void GuardedRegion::protect_readonly() noexcept {
        if (base_ != nullptr && sodium_mprotect_readonly(base_) != 0) {
            utils::fatal("mprotect(PROT_READ) failed on guarded region");
        }
    }

    void GuardedRegion::protect_readwrite() noexcept {
        if (base_ != nullptr && sodium_mprotect_readwrite(base_) != 0) {
            utils::fatal("mprotect(PROT_READ|PROT_WRITE) failed on guarded region");
        }
    }

    void GuardedRegion::verify_canary() const noexcept {
        if (base_ == nullptr) {
            return;
        }
        const auto &canary = process_canary();
        if (sodium_memcmp(base_, canary.data(), canary.size()) != 0) {
            utils::fatal("canary mismatch, guarded memory was corrupted");
        }
    }

    void GuardedRegion::release() noexcept {
        if (base_ == nullptr) {
            return;
        }
        protect_readwrite();
        verify_canary();
        sodium_memzero(payload(), size_);
        // sodium_free re-checks its own canary, then munlocks (which zeroes again) and unmaps
        sodium_free(base_);
        base_ = nullptr;
        size_ = 0;
    }

} // namespace bytelocker::memory
