#include "bytelocker/guarded_buffer.hpp"

#include <algorithm>
#include <limits>

#include "bytelocker/errors.hpp"
#include "bytelocker/memory/wipe.hpp"
#include "bytelocker/utils/common.hpp"

namespace bytelocker {

    namespace {

        std::span<const uint8_t> text_bytes(std::string_view text) {
            return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
        }

        GuardedBuffer join(std::span<const uint8_t> head, std::span<const uint8_t> tail, LockPolicy policy) {
            return GuardedBuffer::build(
                head.size() + tail.size(),
                [&](std::span<uint8_t> out) {
                    std::copy(head.begin(), head.end(), out.begin());
                    std::copy(tail.begin(), tail.end(), out.begin() + static_cast<std::ptrdiff_t>(head.size()));
                },
                policy);
        }

    } // namespace

    GuardedBuffer::GuardedBuffer(std::span<const uint8_t> bytes, LockPolicy policy)
        : GuardedBuffer(build(
              bytes.size(), [&](std::span<uint8_t> out) { std::copy(bytes.begin(), bytes.end(), out.begin()); },
              policy)) {}

    GuardedBuffer::GuardedBuffer(std::string_view bytes, LockPolicy policy)
        : GuardedBuffer(text_bytes(bytes), policy) {}

    GuardedBuffer::GuardedBuffer(GuardedBuffer &&other) noexcept
        : region_(std::move(other.region_)), length_(std::exchange(other.length_, 0)),
          locked_(std::exchange(other.locked_, false)) {}

    GuardedBuffer &GuardedBuffer::operator=(GuardedBuffer &&other) noexcept {
        if (this != &other) {
            region_ = std::move(other.region_);
            length_ = std::exchange(other.length_, 0);
            locked_ = std::exchange(other.locked_, false);
        }
        return *this;
    }

    GuardedBuffer GuardedBuffer::copy_and_wipe(std::span<uint8_t> source, LockPolicy policy) {
        GuardedBuffer out(std::span<const uint8_t>(source.data(), source.size()), policy);
        memory::wipe(source.data(), source.size());
        return out;
    }

    GuardedBuffer GuardedBuffer::copy_and_wipe(std::string &source, LockPolicy policy) {
        GuardedBuffer out(std::string_view(source), policy);
        memory::wipe_container(source);
        return out;
    }

    void GuardedBuffer::lock() {
        locked_ = true;
        region_.protect_noaccess();
    }

    void GuardedBuffer::unlock() {
        locked_ = false;
        region_.protect_readonly();
    }

    void GuardedBuffer::apply(bool locked) {
        if (locked) {
            lock();
        } else {
            unlock();
        }
    }

    std::span<const uint8_t> GuardedBuffer::readable() const {
        if (locked_) {
            throw AccessDenied();
        }
        region_.verify_canary();
        return {region_.data(), length_};
    }

    std::vector<uint8_t> GuardedBuffer::to_bytes() const {
        auto bytes = readable();
        return {bytes.begin(), bytes.end()};
    }

    std::string GuardedBuffer::to_string() const {
        auto bytes = readable();
        return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }

    std::string GuardedBuffer::to_hex() const { return utils::to_hex(readable()); }

    std::span<const uint8_t> GuardedBuffer::view() const { return readable(); }

    bool GuardedBuffer::equals(const GuardedBuffer &other) const { return equals(other.readable()); }

    bool GuardedBuffer::equals(std::span<const uint8_t> other) const {
        auto mine = readable();
        if (mine.size() != other.size()) {
            return false;
        }
        return utils::memcmp(mine, other);
    }

    bool GuardedBuffer::equals(std::string_view other) const { return equals(text_bytes(other)); }

    GuardedBuffer GuardedBuffer::concat(const GuardedBuffer &other, LockPolicy policy) const {
        auto mine = readable();
        return join(mine, other.readable(), policy);
    }

    GuardedBuffer GuardedBuffer::concat(std::span<const uint8_t> other, LockPolicy policy) const {
        return join(readable(), other, policy);
    }

    GuardedBuffer GuardedBuffer::concat(std::string_view other, LockPolicy policy) const {
        return concat(text_bytes(other), policy);
    }

    GuardedBuffer GuardedBuffer::repeat(size_t count, LockPolicy policy) const {
        auto mine = readable();
        if (mine.empty() || count == 0) {
            return build(0, [](std::span<uint8_t>) {}, policy);
        }
        if (mine.size() > std::numeric_limits<size_t>::max() / count) {
            throw InvalidLength("repeat: resulting length overflows");
        }
        return build(
            mine.size() * count,
            [&](std::span<uint8_t> out) {
                auto pos = out.begin();
                for (size_t i = 0; i < count; ++i) {
                    pos = std::copy(mine.begin(), mine.end(), pos);
                }
            },
            policy);
    }

    GuardedBuffer GuardedBuffer::clone(LockPolicy policy) const { return GuardedBuffer(readable(), policy); }

    bool GuardedBuffer::memcmp(const GuardedBuffer &other, std::optional<size_t> length) const {
        auto mine = readable();
        return utils::memcmp(mine, other.readable(), length);
    }

    bool GuardedBuffer::memcmp(std::span<const uint8_t> other, std::optional<size_t> length) const {
        return utils::memcmp(readable(), other, length);
    }

    int GuardedBuffer::compare(const GuardedBuffer &other) const {
        auto mine = readable();
        return utils::compare(mine, other.readable());
    }

    int GuardedBuffer::compare(std::span<const uint8_t> other) const { return utils::compare(readable(), other); }

    bool GuardedBuffer::is_zero() const { return utils::is_zero(readable()); }

    GuardedBuffer concat(std::span<const uint8_t> prefix, const GuardedBuffer &buffer, LockPolicy policy) {
        return join(prefix, buffer.view(), policy);
    }

    GuardedBuffer concat(std::string_view prefix, const GuardedBuffer &buffer, LockPolicy policy) {
        return concat(text_bytes(prefix), buffer, policy);
    }

} // namespace bytelocker
