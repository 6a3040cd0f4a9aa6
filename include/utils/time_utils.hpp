/**
 * @file time_utils.hpp
 * @brief Wall clock timestamps for exported metrics and status documents
 *
 * Internal timeout arithmetic uses SteadyClock; everything that leaves the
 * process (metric points, status JSON, recorder files) is stamped with
 * wall clock nanoseconds since the Unix epoch.
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <chrono>
#include <string>

namespace tradeguard {

/**
 * @brief Current wall clock time in nanoseconds since epoch
 */
inline uint64_t get_timestamp_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        SystemClock::now().time_since_epoch()
    ).count());
}

inline uint64_t get_timestamp_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        SystemClock::now().time_since_epoch()
    ).count());
}

/**
 * @brief Convert a wall clock time point to nanoseconds since epoch
 */
inline uint64_t to_timestamp_ns(SystemClock::time_point time) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        time.time_since_epoch()
    ).count());
}

/**
 * @brief Format nanoseconds since epoch as ISO 8601 UTC
 *
 * @param nanos Nanoseconds since epoch
 * @return std::string e.g. "2024-01-15T10:30:45.123456789Z"
 */
std::string nanos_to_iso8601(uint64_t nanos);

/**
 * @brief Format a wall clock time point as ISO 8601 UTC
 */
inline std::string time_point_to_iso8601(SystemClock::time_point time) {
    return nanos_to_iso8601(to_timestamp_ns(time));
}

} // namespace tradeguard
