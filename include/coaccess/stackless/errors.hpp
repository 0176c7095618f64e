#pragma once

#include <stdexcept>
#include <string>

#include "coaccess/utils/duration.h"

namespace coaccess {

enum class AccessMode { read, write };

constexpr const char* to_string(AccessMode mode) noexcept {
    return mode == AccessMode::read ? "read" : "write";
}

// Thrown into a coroutine whose access request was not granted in time. The
// guarded operation has not been started.
class AccessTimeoutError : public std::runtime_error {
   public:
    AccessTimeoutError(AccessMode mode, Duration timeout)
        : std::runtime_error(std::string("Could not acquire ") + to_string(mode) +
                             " access within " + to_string(timeout)),
          mode_(mode),
          timeout_(timeout) {}

    AccessMode mode() const noexcept { return mode_; }
    Duration timeout() const noexcept { return timeout_; }

   private:
    AccessMode mode_;
    Duration timeout_;
};

}  // namespace coaccess
