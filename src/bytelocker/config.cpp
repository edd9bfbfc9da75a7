#include "bytelocker/config.hpp"

#include <atomic>

namespace bytelocker {

    namespace {

        std::atomic<bool> &default_locked_flag() {
            static std::atomic<bool> flag{false};
            return flag;
        }

    } // namespace

    void configure(const Config &config) { default_locked_flag().store(config.default_locked); }

    Config config() {
        Config current;
        current.default_locked = default_locked_flag().load();
        return current;
    }

} // namespace bytelocker
