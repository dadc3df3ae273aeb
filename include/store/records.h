#pragma once
/**
 * @file records.h
 * @brief Durable entities owned by the reading store: antennas, tags, readings.
 */

#include "rfpos_types.h"

#include <cstdint>
#include <string>

namespace store {

enum class TagRole {
  REFERENCE,
  TARGET
};

// Stored text form: "ref" / "tar".
const char* TagRoleToText(TagRole role);

// Accepts "ref"/"reference" and "tar"/"target". Throws rfpos::DataError otherwise.
TagRole TagRoleFromText(const std::string& s);

struct Antenna {
  rfpos::AntennaId antenna_id;
  double x = 0.0;
  double y = 0.0;
};

struct Tag {
  rfpos::TagId tag_id;
  TagRole role = TagRole::TARGET;
  rfpos::OptDouble true_x;
  rfpos::OptDouble true_y;
  rfpos::OptDouble pred_x;
  rfpos::OptDouble pred_y;
  bool is_read = false;

  bool HasTruePosition() const { return true_x.has_value() && true_y.has_value(); }
  bool HasPredictedPosition() const { return pred_x.has_value() && pred_y.has_value(); }
};

/**
 * @brief Enforce the tag invariants before a write.
 *
 * A reference tag must carry both true coordinates and no predicted coordinates.
 * Coordinates must come in (x, y) pairs.
 *
 * @throws rfpos::DataError on violation.
 */
void ValidateTag(const Tag& tag);

struct Reading {
  rfpos::TagId tag_id;
  rfpos::AntennaId antenna_id;
  int read_count = 0;
  double rssi = 0.0;
  rfpos::Timestamp timestamp = 0;
  std::int64_t record_id = 0;  // assigned by the store; 0 before insert
};

} // namespace store
