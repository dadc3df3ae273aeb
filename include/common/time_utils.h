#pragma once
/**
 * @file time_utils.h
 * @brief Conversion between stored reading times (ISO-8601 text) and Timestamp.
 *
 * Accepted text forms: "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS", with an
 * optional fraction of up to 6 digits. Times are treated as UTC wall-clock values;
 * no time zone conversion is applied in either direction.
 */

#include "rfpos_types.h"

#include <string>

namespace rfpos {

// Throws DataError on malformed text.
Timestamp ParseTimestamp(const std::string& text);

// Inverse of ParseTimestamp; the fraction is written only when non-zero.
std::string FormatTimestamp(Timestamp ts);

constexpr Timestamp kMicrosPerSecond = 1000000;

} // namespace rfpos
