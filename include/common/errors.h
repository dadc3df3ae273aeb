#pragma once
/**
 * @file errors.h
 * @brief Exception taxonomy for the positioning pipeline.
 *
 * All errors derive from std::runtime_error so callers that only care about
 * "something failed" can keep catching std::exception at the top level.
 */

#include <stdexcept>
#include <string>

namespace rfpos {

// Invalid parameters or an unusable training setup (empty reference set,
// feature count out of bounds, non-positive window sizes, ...). Not retried.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// A row selected for fitting or prediction has an unset value inside the
// configured feature prefix (gap policy "fail").
class DataGapError : public std::runtime_error {
public:
  explicit DataGapError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed input records (empty tag id, unknown antenna, tag role violations).
class DataError : public std::runtime_error {
public:
  explicit DataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Failure reported by a reading store backend.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace rfpos
