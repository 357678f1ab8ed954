#include "speechtext/timestamp.h"
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace speechtext {

std::string format_timestamp(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;  // Also catches NaN
    }

    // Quantize to whole microseconds first so 3723.456 does not become .455
    const std::int64_t total_us = std::llround(seconds * 1000000.0);
    const std::int64_t total_ms = total_us / 1000;

    const std::int64_t ms = total_ms % 1000;
    const std::int64_t total_secs = total_ms / 1000;
    const std::int64_t hours = total_secs / 3600;
    const std::int64_t minutes = (total_secs % 3600) / 60;
    const std::int64_t secs = total_secs % 60;

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << hours << ":"
       << std::setw(2) << minutes << ":"
       << std::setw(2) << secs << "."
       << std::setw(3) << ms;
    return ss.str();
}

} // namespace speechtext
