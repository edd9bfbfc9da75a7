#include "bytelocker/utils/sodium_utils.hpp"

#include <iostream>

namespace bytelocker::utils {

    void fatal(const char *reason) noexcept {
        std::cerr << "bytelocker: " << reason << std::endl;
        sodium_misuse();
    }

} // namespace bytelocker::utils
