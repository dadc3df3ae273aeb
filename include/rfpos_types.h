#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rfpos {

using TagId = std::string;
using AntennaId = std::string;

/**
 * @brief Reading time in microseconds since the Unix epoch (UTC, no zone conversion).
 */
using Timestamp = std::int64_t;

/**
 * @brief Numeric value that may be missing. Gaps are never encoded as NaN or zero.
 */
using OptDouble = std::optional<double>;

} // namespace rfpos
