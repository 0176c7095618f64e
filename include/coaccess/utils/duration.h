#pragma once

#include <chrono>
#include <string>

namespace coaccess {

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::nanoseconds;

// Prints a duration in the largest unit that represents it exactly, e.g. "50ms", "2s", "1500us".
inline std::string to_string(Duration duration) {
    using namespace std::chrono;

    auto count = duration.count();
    if (count != 0) {
        if (duration % hours{1} == Duration::zero()) {
            return std::to_string(duration_cast<hours>(duration).count()) + "h";
        }
        if (duration % minutes{1} == Duration::zero()) {
            return std::to_string(duration_cast<minutes>(duration).count()) + "min";
        }
        if (duration % seconds{1} == Duration::zero()) {
            return std::to_string(duration_cast<seconds>(duration).count()) + "s";
        }
        if (duration % milliseconds{1} == Duration::zero()) {
            return std::to_string(duration_cast<milliseconds>(duration).count()) + "ms";
        }
        if (duration % microseconds{1} == Duration::zero()) {
            return std::to_string(duration_cast<microseconds>(duration).count()) + "us";
        }
    }
    return std::to_string(count) + "ns";
}

}  // namespace coaccess
