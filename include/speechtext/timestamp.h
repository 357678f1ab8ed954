#pragma once

#include "export.h"
#include <string>

namespace speechtext {

/**
 * @brief Format seconds as HH:MM:SS.mmm
 *
 * Hours are not wrapped at 24. Milliseconds are truncated, not rounded.
 * Negative input is clamped to zero.
 *
 * @param seconds Time in seconds
 * @return Zero-padded timestamp, e.g. "01:02:03.456"
 */
SPEECHTEXT_API std::string format_timestamp(double seconds);

} // namespace speechtext
