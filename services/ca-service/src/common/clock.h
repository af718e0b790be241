#pragma once

/**
 * @file clock.h
 * @brief Injectable wall clock and operation timer
 *
 * Services take a Clock at construction instead of calling
 * system_clock::now() directly, so tests can move time forward.
 */

#include <cga/utils/time_utils.h>

#include <chrono>
#include <cstdint>
#include <functional>

namespace common {

using Clock = std::function<cga::utils::TimePoint()>;

/**
 * @brief Real wall clock at millisecond precision
 */
inline Clock systemClock() {
    return [] { return cga::utils::truncateToMillis(std::chrono::system_clock::now()); };
}

/**
 * @brief Elapsed time of one operation (steady clock)
 */
class OperationTimer {
public:
    OperationTimer() : startTime_(std::chrono::steady_clock::now()) {}

    int64_t getDurationMs() const {
        auto endTime = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime_).count();
    }

private:
    std::chrono::steady_clock::time_point startTime_;
};

} // namespace common
