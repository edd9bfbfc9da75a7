#pragma once

#include <stdexcept>
#include <string>

namespace bytelocker {

    // Read attempted while the buffer is locked
    class AccessDenied : public std::runtime_error {
      public:
        AccessDenied() : std::runtime_error("Unlock the buffer before accessing the data") {}
    };

    class InvalidLength : public std::invalid_argument {
      public:
        explicit InvalidLength(const std::string &what) : std::invalid_argument(what) {}
    };

    class LengthMismatch : public std::invalid_argument {
      public:
        explicit LengthMismatch(const std::string &what) : std::invalid_argument(what) {}
    };

} // namespace bytelocker
