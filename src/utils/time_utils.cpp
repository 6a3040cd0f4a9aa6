#include "utils/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tradeguard {

std::string nanos_to_iso8601(uint64_t nanos) {
    uint64_t seconds = nanos / 1000000000ULL;
    uint64_t nano_remainder = nanos % 1000000000ULL;

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(9) << nano_remainder << 'Z';

    return ss.str();
}

} // namespace tradeguard
