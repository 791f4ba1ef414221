#pragma once

#include "polygraph/common.hpp"
#include <chrono>
#include <string>
#include <thread>

namespace polygraph {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (seconds since epoch)
uint64_t timestamp_seconds();

// Get current Unix timestamp (milliseconds since epoch)
uint64_t timestamp_milliseconds();

// Convert TimePoint to string (ISO 8601 format)
std::string to_string(const TimePoint& tp);

// Convert a Unix timestamp in milliseconds to ISO 8601
std::string millis_to_string(uint64_t timestamp_ms);

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() { start_ = std::chrono::steady_clock::now(); }

    double elapsed_seconds() const {
        auto duration = std::chrono::steady_clock::now() - start_;
        return std::chrono::duration<double>(duration).count();
    }

    uint64_t elapsed_milliseconds() const {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Sleep utilities
inline void sleep_milliseconds(uint32_t milliseconds) {
    std::this_thread::sleep_for(Milliseconds(milliseconds));
}

} // namespace time
} // namespace polygraph
